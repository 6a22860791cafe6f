#pragma once

/// @file detail/utf8.hpp
/// @brief UTF-8 helpers shared by the reader and the writer.
///
/// The reader turns \uXXXX escapes into UTF-8 with append(). The writer
/// checks every non-ASCII run with valid_length() and replaces malformed
/// bytes with U+FFFD, so the encoded text is always valid UTF-8.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ordmap::detail::utf8 {

/// U+FFFD REPLACEMENT CHARACTER, encoded.
inline constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

/// @brief Append the UTF-8 form of a scalar value (cp <= 0x10FFFF, not a surrogate).
inline void append(std::string& out, uint32_t cp) {
    auto byte = [](uint32_t v) { return static_cast<char>(v); };
    if (cp <= 0x7F) {
        out += byte(cp);
    } else if (cp <= 0x7FF) {
        out += byte(0xC0 | (cp >> 6));
        out += byte(0x80 | (cp & 0x3F));
    } else if (cp <= 0xFFFF) {
        out += byte(0xE0 | (cp >> 12));
        out += byte(0x80 | ((cp >> 6) & 0x3F));
        out += byte(0x80 | (cp & 0x3F));
    } else {
        out += byte(0xF0 | (cp >> 18));
        out += byte(0x80 | ((cp >> 12) & 0x3F));
        out += byte(0x80 | ((cp >> 6) & 0x3F));
        out += byte(0x80 | (cp & 0x3F));
    }
}

/// @brief Length of the well-formed sequence starting at p, or 0.
///
/// Follows the byte ranges of RFC 3629 section 4, so overlong forms,
/// UTF-16 surrogates and values past U+10FFFF are all rejected.
inline size_t valid_length(const char* p, const char* end) noexcept {
    const auto b0 = static_cast<unsigned char>(p[0]);
    auto at = [p](size_t i) { return static_cast<unsigned char>(p[i]); };
    auto tail = [](unsigned char b) { return b >= 0x80 && b <= 0xBF; };
    const auto avail = static_cast<size_t>(end - p);

    if (b0 <= 0x7F) return 1;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        return (avail >= 2 && tail(at(1))) ? 2 : 0;
    }
    if (b0 >= 0xE0 && b0 <= 0xEF) {
        if (avail < 3) return 0;
        const unsigned char lo = b0 == 0xE0 ? 0xA0 : 0x80;
        const unsigned char hi = b0 == 0xED ? 0x9F : 0xBF;
        return (at(1) >= lo && at(1) <= hi && tail(at(2))) ? 3 : 0;
    }
    if (b0 >= 0xF0 && b0 <= 0xF4) {
        if (avail < 4) return 0;
        const unsigned char lo = b0 == 0xF0 ? 0x90 : 0x80;
        const unsigned char hi = b0 == 0xF4 ? 0x8F : 0xBF;
        return (at(1) >= lo && at(1) <= hi && tail(at(2)) && tail(at(3))) ? 4 : 0;
    }
    return 0;
}

} // namespace ordmap::detail::utf8
