#pragma once

#include <cstddef>
#include <string_view>

namespace snipren::match {

/**
 * A filename split at its last separator dot.
 *  - extension: from the last dot (inclusive) to the end, empty if there is none
 *  - base:      everything before it
 *
 * A dotfile is all extension: ".env" has an empty base and extension ".env".
 */
struct NameSplit {
    std::u32string_view base;
    std::u32string_view extension;
};

[[nodiscard]] inline constexpr NameSplit splitExtension(std::u32string_view name) noexcept {
    const size_t dot = name.rfind(U'.');
    if (dot == std::u32string_view::npos) {
        return {name, {}};
    }
    return {name.substr(0, dot), name.substr(dot)};
}

/**
 * Cursor positions left by the two-pointer ("vice") scan of squeeze().
 *  - prefix:         length of the common prefix (forward cursor in both names)
 *  - oldSuffixStart: backward cursor in the old name
 *  - newSuffixStart: backward cursor in the new name
 */
struct SqueezeResult {
    size_t prefix = 0;
    size_t oldSuffixStart = 0;
    size_t newSuffixStart = 0;
};

/**
 * Advance a forward cursor pair while characters agree, then a backward cursor
 * pair from the ends while they agree, never crossing the forward cursors.
 */
[[nodiscard]] inline constexpr SqueezeResult squeeze(std::u32string_view oldName,
                                                     std::u32string_view newName) noexcept {
    size_t i = 0;
    while (i < oldName.size() && i < newName.size() && oldName[i] == newName[i]) {
        ++i;
    }

    size_t jOld = oldName.size();
    size_t jNew = newName.size();
    while (jOld > i && jNew > i && oldName[jOld - 1] == newName[jNew - 1]) {
        --jOld;
        --jNew;
    }

    return {i, jOld, jNew};
}

/**
 * True if newName is oldName with characters inserted anywhere except at the
 * very start: every character of oldName is consumed by the common prefix or
 * the common suffix, and the prefix is non-empty.
 *
 *   route_report.csv -> route_report_before.csv   match
 *   README           -> README.md                 match
 *   data.json        -> metadata.json             no match (insertion at start)
 */
[[nodiscard]] inline constexpr bool isExpansion(std::u32string_view oldName,
                                                std::u32string_view newName) noexcept {
    if (newName.size() <= oldName.size()) {
        return false;
    }
    const auto s = squeeze(oldName, newName);
    return s.prefix == s.oldSuffixStart && s.prefix > 0;
}

/**
 * True if both names carry an extension, their bases are identical and their
 * extensions differ. Only the last dot counts, so "file.tar.gz" and
 * "file.tar.bz2" share the base "file.tar".
 */
[[nodiscard]] inline constexpr bool isExtensionChange(std::u32string_view oldName,
                                                      std::u32string_view newName) noexcept {
    if (oldName == newName) {
        return false;
    }
    const auto oldSplit = splitExtension(oldName);
    const auto newSplit = splitExtension(newName);
    if (oldSplit.extension.empty() || newSplit.extension.empty()) {
        return false;
    }
    if (oldSplit.base != newSplit.base) {
        return false;
    }
    return oldSplit.extension != newSplit.extension;
}

// UTF-8 entry points; names are decoded to scalar values before matching.
[[nodiscard]] bool isExpansion(std::string_view oldName, std::string_view newName);
[[nodiscard]] bool isExtensionChange(std::string_view oldName, std::string_view newName);

using NamePredicate = bool (*)(std::u32string_view, std::u32string_view);

// Apply a predicate in both argument orders.
[[nodiscard]] inline constexpr auto bidirectional(NamePredicate pred) noexcept {
    return [pred](std::u32string_view a, std::u32string_view b) { return pred(a, b) || pred(b, a); };
}

template <class... Preds> [[nodiscard]] inline constexpr auto anyOf(Preds... preds) noexcept {
    return [=](std::u32string_view a, std::u32string_view b) { return (preds(a, b) || ...); };
}

/**
 * Candidate test used by the resolver: the entry is an expansion or an
 * extension change of the target, or the other way round.
 */
[[nodiscard]] bool isIntentMatch(std::u32string_view entry, std::u32string_view target);
[[nodiscard]] bool isIntentMatch(std::string_view entry, std::string_view target);

} // namespace snipren::match
