#include <snipren/common/utf8_utils.h>
#include <snipren/match/matchers.h>

namespace snipren::match {

namespace {

// The two u32 predicates, spelled out so the overload set resolves to NamePredicate.
bool expansion(std::u32string_view oldName, std::u32string_view newName) {
    return isExpansion(oldName, newName);
}

bool extensionChange(std::u32string_view oldName, std::u32string_view newName) {
    return isExtensionChange(oldName, newName);
}

} // namespace

bool isExpansion(std::string_view oldName, std::string_view newName) {
    return isExpansion(std::u32string_view{common::decodeUtf8(oldName)},
                       std::u32string_view{common::decodeUtf8(newName)});
}

bool isExtensionChange(std::string_view oldName, std::string_view newName) {
    return isExtensionChange(std::u32string_view{common::decodeUtf8(oldName)},
                             std::u32string_view{common::decodeUtf8(newName)});
}

bool isIntentMatch(std::u32string_view entry, std::u32string_view target) {
    static const auto matches = anyOf(bidirectional(&expansion), bidirectional(&extensionChange));
    return matches(entry, target);
}

bool isIntentMatch(std::string_view entry, std::string_view target) {
    const auto e = common::decodeUtf8(entry);
    const auto t = common::decodeUtf8(target);
    return isIntentMatch(std::u32string_view{e}, std::u32string_view{t});
}

} // namespace snipren::match
