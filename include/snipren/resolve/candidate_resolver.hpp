#pragma once

#include <algorithm>
#include <concepts>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <snipren/common/utf8_utils.h>
#include <snipren/core/types.h>
#include <snipren/match/matchers.h>

namespace snipren::resolve {

struct Options {
    bool force = false;  // Rename even if the target already exists
    bool dryRun = false; // Resolve the candidate but leave the filesystem untouched
};

// One directory listing entry as seen by the resolver
struct DirEntry {
    std::string name;
    bool regular = false;
};

// The target split into its canonical containing directory and bare filename
struct ResolvedTarget {
    std::filesystem::path directory;
    std::string name;

    std::filesystem::path path() const { return directory / name; }
};

// Names of the entries that relate to the target, sorted
using CandidateSet = std::vector<std::string>;

// The single rename the resolver hands to the backend
struct RenameIntent {
    std::filesystem::path source;
    std::filesystem::path destination;
    std::string sourceName;
    std::string targetName;
};

// Backend policy concept: directory enumeration and mutation
template <class B>
concept DirectoryBackend = requires(B b, const std::filesystem::path& p) {
    { b.canonicalDirectory(p) } -> std::same_as<Result<std::filesystem::path>>;
    { b.exists(p) } -> std::same_as<bool>;
    { b.listEntries(p) } -> std::same_as<Result<std::vector<DirEntry>>>;
    { b.rename(p, p) } -> std::same_as<Result<void>>;
};

// Real filesystem backend; every std::filesystem call uses the error_code overloads
struct FilesystemBackend {
    inline Result<std::filesystem::path> canonicalDirectory(const std::filesystem::path& dir) {
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::path canon = fs::canonical(dir, ec);
        if (ec) {
            return Error{ErrorCode::DirectoryUnreadable,
                         "Failed to resolve directory '" + dir.string() + "': " + ec.message()};
        }
        if (!fs::is_directory(canon, ec)) {
            return Error{ErrorCode::DirectoryUnreadable, "Not a directory: " + canon.string()};
        }
        return canon;
    }

    // Anything present counts, including a dangling symlink
    inline bool exists(const std::filesystem::path& p) {
        std::error_code ec;
        auto st = std::filesystem::symlink_status(p, ec);
        return !ec && std::filesystem::exists(st);
    }

    inline Result<std::vector<DirEntry>> listEntries(const std::filesystem::path& dir) {
        namespace fs = std::filesystem;
        std::vector<DirEntry> out;
        std::error_code ec;
        for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator();
             it.increment(ec)) {
            std::error_code statEc;
            auto st = it->status(statEc);
            // A dangling symlink reports not_found; it is simply not a regular file
            if (statEc && st.type() != fs::file_type::not_found) {
                return Error{ErrorCode::DirectoryUnreadable, "Failed to read entry '" +
                                                                 it->path().string() +
                                                                 "': " + statEc.message()};
            }
            out.push_back(DirEntry{it->path().filename().string(), fs::is_regular_file(st)});
        }
        if (ec) {
            return Error{ErrorCode::DirectoryUnreadable,
                         "Failed to read directory '" + dir.string() + "': " + ec.message()};
        }
        return out;
    }

    inline Result<void> rename(const std::filesystem::path& from,
                               const std::filesystem::path& to) {
        std::error_code ec;
        std::filesystem::rename(from, to, ec);
        if (ec) {
            return Error{ErrorCode::RenameFailed, "Failed to rename: " + ec.message()};
        }
        return Result<void>();
    }
};

/**
 * Finds the one existing file the user means to rename into a target name.
 *
 * The target may carry a directory part, resolved against the working
 * directory given at construction. Entries of that directory are candidates
 * when match::isIntentMatch() holds in either direction. Zero candidates is
 * NoMatch, two or more is Ambiguous; only a single candidate is renamed.
 */
template <DirectoryBackend B> class CandidateResolver {
public:
    CandidateResolver(B backend, std::filesystem::path workingDirectory, Options opt = {})
        : backend_(std::move(backend)), workingDirectory_(std::move(workingDirectory)), opt_(opt) {}

    inline Result<ResolvedTarget> resolveTarget(std::string_view target) {
        namespace fs = std::filesystem;
        if (target.empty()) {
            return Error{ErrorCode::InvalidPath, "Target name is empty"};
        }

        fs::path p{std::string{target}};
        fs::path name = p.filename();
        if (name.empty() || name == "." || name == "..") {
            return Error{ErrorCode::InvalidPath,
                         "No filename in target '" + common::sanitizeUtf8(target) + "'"};
        }

        fs::path dir = p.parent_path();
        fs::path base = dir.empty() ? workingDirectory_ : workingDirectory_ / dir;
        auto canon = backend_.canonicalDirectory(base);
        if (!canon) {
            return canon.error();
        }
        spdlog::debug("Resolved target directory: {}", canon.value().string());
        return ResolvedTarget{canon.value(), name.string()};
    }

    inline Result<CandidateSet> findCandidates(const ResolvedTarget& target) {
        auto entries = backend_.listEntries(target.directory);
        if (!entries) {
            return entries.error();
        }

        const std::u32string targetScalars = common::decodeUtf8(target.name);
        CandidateSet out;
        for (const auto& e : entries.value()) {
            if (!e.regular) {
                spdlog::debug("Skipping non-regular entry '{}'", common::sanitizeUtf8(e.name));
                continue;
            }
            if (e.name == target.name) {
                continue;
            }
            const std::u32string scalars = common::decodeUtf8(e.name);
            if (match::isIntentMatch(scalars, targetScalars)) {
                spdlog::debug("Candidate '{}' for '{}'", common::sanitizeUtf8(e.name),
                              common::sanitizeUtf8(target.name));
                out.push_back(e.name);
            }
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    // Resolve without touching the filesystem
    inline Result<RenameIntent> plan(std::string_view target) {
        auto resolved = resolveTarget(target);
        if (!resolved) {
            return resolved.error();
        }
        const auto& rt = resolved.value();
        const auto display = common::sanitizeUtf8(rt.name);

        // Checked before the scan so an existing target never costs a directory read
        auto destination = rt.path();
        if (!opt_.force && backend_.exists(destination)) {
            return Error{ErrorCode::TargetExists,
                         "Target '" + display + "' already exists. Use --force to overwrite."};
        }

        auto candidates = findCandidates(rt);
        if (!candidates) {
            return candidates.error();
        }
        const auto& names = candidates.value();

        if (names.empty()) {
            return Error{ErrorCode::NoMatch, "No matching files found for '" + display + "'"};
        }
        if (names.size() > 1) {
            std::string msg = "Multiple candidates found for '" + display + "':\n";
            for (const auto& n : names) {
                msg += "  " + common::sanitizeUtf8(n) + "\n";
            }
            msg += "\nCannot proceed - ambiguous match.";
            return Error{ErrorCode::Ambiguous, std::move(msg)};
        }

        return RenameIntent{rt.directory / names.front(), std::move(destination), names.front(),
                            rt.name};
    }

    // plan() followed by exactly one backend rename (none in dry-run mode)
    inline Result<RenameIntent> rename(std::string_view target) {
        auto intent = plan(target);
        if (!intent) {
            return intent;
        }
        const auto& ri = intent.value();
        if (opt_.dryRun) {
            spdlog::info("Dry run: {} -> {}", ri.source.string(), ri.destination.string());
            return intent;
        }

        auto moved = backend_.rename(ri.source, ri.destination);
        if (!moved) {
            spdlog::error("Rename {} -> {} failed: {}", ri.source.string(), ri.destination.string(),
                          moved.error().message);
            return moved.error();
        }
        spdlog::debug("Renamed {} -> {}", ri.source.string(), ri.destination.string());
        return intent;
    }

    const B& backend() const { return backend_; }
    const Options& options() const { return opt_; }

private:
    B backend_;
    std::filesystem::path workingDirectory_;
    Options opt_;
};

// "<source> → <destination>" line shown after a successful rename
inline std::string formatConfirmation(const RenameIntent& intent) {
    return common::sanitizeUtf8(intent.sourceName) + " → " +
           common::sanitizeUtf8(intent.targetName);
}

} // namespace snipren::resolve
