#pragma once

#include <string>
#include <string_view>

namespace snipren::common {

// First code point of the escape block for bytes that are not part of a valid sequence.
inline constexpr char32_t kByteEscapeBase = 0xDC00;

namespace detail {

inline constexpr bool isContinuation(unsigned char c) noexcept {
    return (c & 0xC0) == 0x80;
}

} // namespace detail

/**
 * Decode UTF-8 into Unicode scalar values.
 *
 * Bytes that do not start a well-formed sequence (stray continuation bytes,
 * truncated or overlong sequences, encoded surrogates, values past U+10FFFF)
 * are mapped one by one to U+DC80..U+DCFF. The mapping is lossless, so two
 * byte strings decode to equal sequences only if the bytes are equal.
 */
inline std::u32string decodeUtf8(std::string_view input) {
    using detail::isContinuation;

    std::u32string out;
    out.reserve(input.size());

    const unsigned char* data = reinterpret_cast<const unsigned char*>(input.data());
    const size_t n = input.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = data[i];
        if (c < 0x80) {
            out.push_back(static_cast<char32_t>(c));
            ++i;
            continue;
        }

        size_t len = 0;
        char32_t cp = 0;
        char32_t minValue = 0;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
            cp = c & 0x1F;
            minValue = 0x80;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            cp = c & 0x0F;
            minValue = 0x800;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            cp = c & 0x07;
            minValue = 0x10000;
        }

        bool valid = len != 0 && i + len <= n;
        for (size_t k = 1; valid && k < len; ++k) {
            if (!isContinuation(data[i + k])) {
                valid = false;
            } else {
                cp = (cp << 6) | (data[i + k] & 0x3F);
            }
        }
        if (valid && (cp < minValue || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) {
            valid = false;
        }

        if (valid) {
            out.push_back(cp);
            i += len;
        } else {
            out.push_back(kByteEscapeBase + c);
            ++i;
        }
    }

    return out;
}

// Replace invalid UTF-8 byte sequences with '?' so names can be echoed to a terminal.
inline std::string sanitizeUtf8(std::string_view input) {
    std::string out;
    out.reserve(input.size());

    const unsigned char* data = reinterpret_cast<const unsigned char*>(input.data());
    size_t i = 0;
    const size_t n = input.size();
    while (i < n) {
        unsigned char c = data[i];
        if (c < 0x80) { // ASCII
            out.push_back(static_cast<char>(c));
            ++i;
        } else if (c >= 0xC2 && c <= 0xDF && i + 1 < n) { // 2-byte sequence
            unsigned char c1 = data[i + 1];
            if ((c1 & 0xC0) == 0x80) {
                out.append(input.substr(i, 2));
                i += 2;
            } else {
                out.push_back('?');
                ++i;
            }
        } else if (c >= 0xE0 && c <= 0xEF && i + 2 < n) { // 3-byte sequence
            unsigned char c1 = data[i + 1];
            unsigned char c2 = data[i + 2];
            if ((c1 & 0xC0) == 0x80 && (c2 & 0xC0) == 0x80) {
                out.append(input.substr(i, 3));
                i += 3;
            } else {
                out.push_back('?');
                ++i;
            }
        } else if (c >= 0xF0 && c <= 0xF4 && i + 3 < n) { // 4-byte sequence
            unsigned char c1 = data[i + 1];
            unsigned char c2 = data[i + 2];
            unsigned char c3 = data[i + 3];
            if ((c1 & 0xC0) == 0x80 && (c2 & 0xC0) == 0x80 && (c3 & 0xC0) == 0x80) {
                out.append(input.substr(i, 4));
                i += 4;
            } else {
                out.push_back('?');
                ++i;
            }
        } else {
            out.push_back('?');
            ++i;
        }
    }

    return out;
}

} // namespace snipren::common
