#pragma once
#include <string>
#include <string_view>
#include <snipren/core/types.h>

namespace snipren::cli {

/**
 * Actionable hint attached to a refusal printed by rn.
 */
struct ErrorHint {
    std::string hint;    // Short actionable suggestion
    std::string command; // Suggested command to run (if any)
};

/**
 * Get an actionable hint for a given error.
 *
 * @param code The ErrorCode enum value
 * @param message The error message (used for pattern matching)
 * @param target The target name the user asked for (for suggested commands)
 * @return An ErrorHint with actionable suggestions
 */
namespace detail {

// OS-level causes reported inside rename and directory-read failures.
inline bool describeSystemCause(std::string_view message, ErrorHint& hint) {
    if (message.find("Permission denied") != std::string_view::npos ||
        message.find("permission") != std::string_view::npos) {
        hint.hint = "Check file/directory permissions";
        return true;
    }
    if (message.find("cross-device") != std::string_view::npos ||
        message.find("Invalid cross-device link") != std::string_view::npos) {
        hint.hint = "Source and target must be on the same filesystem";
        return true;
    }
    return false;
}

} // namespace detail

inline ErrorHint getErrorHint(ErrorCode code, std::string_view message,
                              std::string_view target = "") {
    ErrorHint hint;

    switch (code) {
        case ErrorCode::TargetExists:
            hint.hint = "Pass --force to overwrite the existing file";
            if (!target.empty()) {
                hint.command = "rn " + std::string(target) + " --force";
            }
            break;

        case ErrorCode::NoMatch:
            hint.hint = "No file in the directory is an expansion, reduction or extension change "
                        "of the target; check the spelling";
            break;

        case ErrorCode::Ambiguous:
            hint.hint = "Rename one of the competing files first or use a more specific target";
            break;

        case ErrorCode::InvalidPath:
            hint.hint = "The target must end in a file name";
            break;

        case ErrorCode::DirectoryUnreadable:
            if (!detail::describeSystemCause(message, hint)) {
                hint.hint = "Verify the directory exists and is readable";
            }
            break;

        case ErrorCode::RenameFailed:
            detail::describeSystemCause(message, hint);
            break;

        default:
            // No specific hint available
            break;
    }

    return hint;
}

/**
 * Format an error message with an actionable hint.
 */
inline std::string formatErrorWithHint(ErrorCode code, std::string_view message,
                                       std::string_view target = "") {
    auto hint = getErrorHint(code, message, target);

    std::string result(message);

    if (!hint.hint.empty()) {
        result += "\n  Hint: " + hint.hint;
        if (!hint.command.empty()) {
            result += "\n  Try: " + hint.command;
        }
    }

    return result;
}

} // namespace snipren::cli
