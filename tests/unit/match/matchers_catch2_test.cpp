// Tests for the filename relationship predicates (expansion and extension change).

#include <catch2/catch_test_macros.hpp>

#include <iterator>
#include <random>
#include <string>
#include <string_view>

#include <snipren/common/utf8_utils.h>
#include <snipren/match/matchers.h>

using snipren::common::decodeUtf8;
using namespace snipren::match;

// =============================================================================
// splitExtension
// =============================================================================

TEST_CASE("splitExtension splits at the last dot", "[match][split][catch2]") {
    auto s = splitExtension(U"file.tar.gz");
    CHECK((s.base == U"file.tar"));
    CHECK((s.extension == U".gz"));

    s = splitExtension(U"route_report.csv");
    CHECK((s.base == U"route_report"));
    CHECK((s.extension == U".csv"));
}

TEST_CASE("splitExtension without a dot has no extension", "[match][split][catch2]") {
    auto s = splitExtension(U"README");
    CHECK((s.base == U"README"));
    CHECK(s.extension.empty());
}

TEST_CASE("splitExtension treats a dotfile as all extension", "[match][split][catch2]") {
    auto s = splitExtension(U".gitignore");
    CHECK(s.base.empty());
    CHECK((s.extension == U".gitignore"));

    s = splitExtension(U".env.local");
    CHECK((s.base == U".env"));
    CHECK((s.extension == U".local"));
}

// =============================================================================
// isExpansion
// =============================================================================

TEST_CASE("isExpansion accepts insertions before the extension", "[match][expansion][catch2]") {
    CHECK(isExpansion("route_report.csv", "route_report_before.csv"));
    CHECK(isExpansion("data.json", "data_backup.json"));
    CHECK(isExpansion("file.txt", "file_v2.txt"));
    CHECK(isExpansion("route-report.csv", "route-report-2023-01.csv"));
    CHECK(isExpansion("config-dev.yml", "config-dev-local.yml"));
    CHECK(isExpansion("route.report.csv", "route.report.v2.csv"));
    CHECK(isExpansion("app.config.json", "app.config.prod.json"));
}

TEST_CASE("isExpansion needs no separator at the insertion point", "[match][expansion][catch2]") {
    CHECK(isExpansion("route.csv", "router.csv"));
    CHECK(isExpansion("test.txt", "testing.txt"));
    CHECK(isExpansion("file.md", "filename.md"));
    CHECK(isExpansion("a.txt", "ab.txt"));
    CHECK(isExpansion("f.txt", "f_with_very_long_suffix_added.txt"));
}

TEST_CASE("isExpansion accepts appending at the end", "[match][expansion][catch2]") {
    CHECK(isExpansion("README", "README.md"));
    CHECK(isExpansion("Makefile", "Makefile_backup"));
    CHECK(isExpansion("Makefile", "Makefile~"));
    CHECK(isExpansion("route_report.csv", "route_report.csv.bak"));
    CHECK(isExpansion("file.tar.gz", "file.tar.gz.backup.tar.gz"));
}

TEST_CASE("isExpansion accepts insertion inside the extension", "[match][expansion][catch2]") {
    CHECK(isExpansion("config.yml", "config.yaml"));
}

TEST_CASE("isExpansion rejects insertion at the very start", "[match][expansion][catch2]") {
    CHECK_FALSE(isExpansion("data.json", "metadata.json"));
    CHECK_FALSE(isExpansion("report.csv", "old_report.csv"));
    CHECK_FALSE(isExpansion("env", ".env"));
}

TEST_CASE("isExpansion rejects equal or shorter names", "[match][expansion][catch2]") {
    CHECK_FALSE(isExpansion("file.txt", "file.txt"));
    CHECK_FALSE(isExpansion("data.json", "data.yaml"));
    CHECK_FALSE(isExpansion("route_report_v2.csv", "route.csv"));
    CHECK_FALSE(isExpansion("test.old.csv", "test.csv"));
    CHECK_FALSE(isExpansion("LICENSE.txt", "LICENSE"));
    CHECK_FALSE(isExpansion("LICENSE", "NOTICE"));
}

TEST_CASE("isExpansion rejects names that also change characters", "[match][expansion][catch2]") {
    CHECK_FALSE(isExpansion("route_report.csv", "route-report_before.csv"));
    CHECK_FALSE(isExpansion("test_file.txt", "test-file_new.txt"));
    CHECK_FALSE(isExpansion("route.csv", "route_v2.txt"));
    CHECK_FALSE(isExpansion("abcd", "axxcd"));
}

TEST_CASE("isExpansion counts scalar values, not bytes", "[match][expansion][utf8][catch2]") {
    CHECK(isExpansion("café.txt", "café_v2.txt"));
    CHECK(isExpansion("日本.txt", "日本語.txt"));
    CHECK_FALSE(isExpansion("日本.txt", "語日本.txt"));

    // Same first byte (E6), different scalars: no shared leading character
    CHECK_FALSE(isExpansion("本.txt", "日本.txt"));

    const auto oldName = decodeUtf8("日本.txt");
    const auto newName = decodeUtf8("日本語.txt");
    auto s = squeeze(oldName, newName);
    CHECK(s.prefix == 2);
    CHECK(s.oldSuffixStart == 2);
    CHECK(s.newSuffixStart == 3);
}

TEST_CASE("squeeze never crosses the forward cursor", "[match][expansion][catch2]") {
    auto s = squeeze(U"aa", U"aaa");
    CHECK(s.prefix == 2);
    CHECK(s.oldSuffixStart == 2);
    CHECK(s.newSuffixStart == 3);

    s = squeeze(U"abcd", U"axxcd");
    CHECK(s.prefix == 1);
    CHECK(s.oldSuffixStart == 2);
    CHECK(s.newSuffixStart == 3);
}

// =============================================================================
// isExtensionChange
// =============================================================================

TEST_CASE("isExtensionChange accepts same base with a different extension",
          "[match][extension][catch2]") {
    CHECK(isExtensionChange("data.json", "data.yaml"));
    CHECK(isExtensionChange("route_report.csv", "route_report.txt"));
    CHECK(isExtensionChange("file.md", "file.txt"));
    CHECK(isExtensionChange("file.tar.gz", "file.tar.bz2"));
    CHECK(isExtensionChange("config.yml", "config.yaml"));
    CHECK(isExtensionChange(".env.local", ".env.prod"));
}

TEST_CASE("isExtensionChange rejects identical names", "[match][extension][catch2]") {
    CHECK_FALSE(isExtensionChange("data.json", "data.json"));
}

TEST_CASE("isExtensionChange rejects names without an extension", "[match][extension][catch2]") {
    CHECK_FALSE(isExtensionChange("README", "README.md"));
    CHECK_FALSE(isExtensionChange("README.md", "README"));
    CHECK_FALSE(isExtensionChange("Makefile", "Makefile~"));
}

TEST_CASE("isExtensionChange relates dotfiles through their empty base",
          "[match][extension][catch2]") {
    CHECK(isExtensionChange(".env", ".gitignore"));
    CHECK(isExtensionChange(".env", ".envrc"));
    CHECK(isIntentMatch(".env", ".gitignore"));
    CHECK_FALSE(isExtensionChange(".env", "env.local"));
}

TEST_CASE("isExtensionChange rejects different bases", "[match][extension][catch2]") {
    CHECK_FALSE(isExtensionChange("data.json", "meta.yaml"));
    CHECK_FALSE(isExtensionChange("file.tar.gz", "file.zip"));
    CHECK_FALSE(isExtensionChange("Data.json", "data.yaml"));
}

TEST_CASE("Removing an extension is neither an expansion nor an extension change",
          "[match][asymmetry][catch2]") {
    // Backup suffixes on extensionless names expand...
    CHECK(isExpansion("Makefile", "Makefile~"));
    // ...but dropping an extension never matches as old -> new
    CHECK_FALSE(isExpansion("LICENSE.txt", "LICENSE"));
    CHECK_FALSE(isExtensionChange("LICENSE.txt", "LICENSE"));
    CHECK_FALSE(isExtensionChange("LICENSE", "LICENSE.txt"));
}

// =============================================================================
// Combinators
// =============================================================================

TEST_CASE("bidirectional tries both argument orders", "[match][combinator][catch2]") {
    auto shorterFirst = [](std::u32string_view a, std::u32string_view b) {
        return a.size() < b.size();
    };
    auto both = bidirectional(shorterFirst);
    CHECK(both(U"a", U"ab"));
    CHECK(both(U"ab", U"a"));
    CHECK_FALSE(both(U"ab", U"cd"));
}

TEST_CASE("anyOf is a logical OR of its predicates", "[match][combinator][catch2]") {
    auto never = [](std::u32string_view, std::u32string_view) { return false; };
    auto equal = [](std::u32string_view a, std::u32string_view b) { return a == b; };
    CHECK(anyOf(never, equal)(U"x", U"x"));
    CHECK_FALSE(anyOf(never, equal)(U"x", U"y"));
    CHECK_FALSE(anyOf(never)(U"x", U"x"));
}

TEST_CASE("isIntentMatch accepts either direction", "[match][intent][catch2]") {
    // entry is the original, target the evolved name
    CHECK(isIntentMatch("route_report.csv", "route_report_before.csv"));
    // entry is the evolved name, target the original
    CHECK(isIntentMatch("route_report_before.csv", "route_report.csv"));
    CHECK(isIntentMatch("data.json", "data.yaml"));
    CHECK(isIntentMatch("data.yaml", "data.json"));
    CHECK(isIntentMatch("README", "README.md"));
}

TEST_CASE("isIntentMatch excludes unrelated dotfiles", "[match][intent][catch2]") {
    CHECK(isIntentMatch("bombas_debug.log", "bombas_debug_main.log"));
    CHECK_FALSE(isIntentMatch(".dockerignore", "bombas_debug_main.log"));
    CHECK_FALSE(isIntentMatch(".gitignore", "bombas_debug_main.log"));
    CHECK_FALSE(isIntentMatch(".env", "bombas_debug_main.log"));
}

// =============================================================================
// Properties over generated names
// =============================================================================

namespace {

std::u32string randomName(std::mt19937& rng, size_t maxLen) {
    static constexpr char32_t kAlphabet[] = {U'a', U'b', U'.', U'_', U'é'};
    std::uniform_int_distribution<size_t> len(1, maxLen);
    std::uniform_int_distribution<size_t> pick(0, std::size(kAlphabet) - 1);
    std::u32string out;
    const size_t n = len(rng);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(kAlphabet[pick(rng)]);
    }
    return out;
}

} // namespace

TEST_CASE("Matcher properties hold for generated names", "[match][property][catch2]") {
    std::mt19937 rng(20240611);
    for (int iter = 0; iter < 5000; ++iter) {
        const auto a = randomName(rng, 8);
        const auto b = randomName(rng, 10);

        if (isExpansion(a, b)) {
            INFO("expansion pair");
            REQUIRE(b.size() > a.size());
            const auto s = squeeze(a, b);
            CHECK(s.prefix == s.oldSuffixStart);
            CHECK(s.prefix > 0);
            // old is exactly new's prefix plus new's suffix
            CHECK((a == b.substr(0, s.prefix) + b.substr(s.newSuffixStart)));
        }

        if (isExtensionChange(a, b)) {
            const auto sa = splitExtension(a);
            const auto sb = splitExtension(b);
            CHECK((sa.base == sb.base));
            CHECK((sa.extension != sb.extension));
        }

        const bool aHasExt = !splitExtension(a).extension.empty();
        const bool bHasExt = !splitExtension(b).extension.empty();
        if (!aHasExt || !bHasExt) {
            CHECK_FALSE(isExtensionChange(a, b));
        }
    }
}

TEST_CASE("Prepending a different leading character never expands",
          "[match][property][catch2]") {
    std::mt19937 rng(7);
    for (int iter = 0; iter < 2000; ++iter) {
        const auto oldName = randomName(rng, 8);
        auto prefix = randomName(rng, 4);
        if (prefix.front() == oldName.front()) {
            prefix.front() = (oldName.front() == U'x') ? U'y' : U'x';
        }
        CHECK_FALSE(isExpansion(oldName, prefix + oldName));
    }
}
