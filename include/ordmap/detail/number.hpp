#pragma once

/// @file detail/number.hpp
/// @brief Number <-> text conversion used by the reader and the writer.
///
/// Integers are formatted with a two-digit pair table. Doubles use the
/// shortest round-trip form from std::to_chars and always carry a '.' or
/// an exponent so they read back as floats.

#include "../config.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <system_error>

namespace ordmap::detail {

/// Two-digit pair table "00".."99".
inline constexpr char kDigitPairs[201] =
    "00010203040506070809"
    "10111213141516171819"
    "20212223242526272829"
    "30313233343536373839"
    "40414243444546474849"
    "50515253545556575859"
    "60616263646566676869"
    "70717273747576777879"
    "80818283848586878889"
    "90919293949596979899";

/// @brief uint64_t to decimal ASCII.
/// @param buf Output buffer (>= 20 bytes).
/// @return Pointer past the last written character.
inline char* write_u64(char* buf, uint64_t val) noexcept {
    char tmp[20];
    char* p = tmp + sizeof(tmp);
    while (val >= 100) {
        const auto idx = static_cast<unsigned>((val % 100) * 2);
        val /= 100;
        p -= 2;
        std::memcpy(p, kDigitPairs + idx, 2);
    }
    if (val >= 10) {
        p -= 2;
        std::memcpy(p, kDigitPairs + val * 2, 2);
    } else {
        *--p = static_cast<char>('0' + val);
    }
    const auto len = static_cast<size_t>(tmp + sizeof(tmp) - p);
    std::memcpy(buf, p, len);
    return buf + len;
}

/// @brief int64_t to decimal ASCII.
/// @param buf Output buffer (>= 21 bytes).
inline char* write_i64(char* buf, int64_t val) noexcept {
    if (val < 0) {
        *buf++ = '-';
        // ~val + 1 avoids UB on INT64_MIN
        return write_u64(buf, static_cast<uint64_t>(~val) + 1u);
    }
    return write_u64(buf, static_cast<uint64_t>(val));
}

/// @brief Finite double to its shortest round-trip decimal form.
/// @param buf Output buffer (>= 32 bytes).
/// @return Number of characters written.
inline size_t write_double(char* buf, double val) noexcept {
    char* const start = buf;
    if (val == 0.0) {
        // No negative zero on the wire.
        std::memcpy(buf, "0.0", 3);
        return 3;
    }
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    auto [ptr, ec] = std::to_chars(buf, buf + 30, val);
    if (ORDMAP_UNLIKELY(ec != std::errc{})) return 0;
    buf = ptr;
#else
    const int n = std::snprintf(buf, 30, "%.17g", val);
    if (ORDMAP_UNLIKELY(n <= 0)) return 0;
    buf += n;
#endif
    if (std::memchr(start, '.', static_cast<size_t>(buf - start)) == nullptr &&
        std::memchr(start, 'e', static_cast<size_t>(buf - start)) == nullptr) {
        *buf++ = '.';
        *buf++ = '0';
    }
    return static_cast<size_t>(buf - start);
}

/// @brief Decimal order of magnitude of a well-formed JSON number:
/// the exponent e with 10^(e-1) <= |x| < 10^e. Only its sign matters here.
inline long decimal_order(const char* first, const char* last) noexcept {
    const char* p = first;
    if (p < last && *p == '-') ++p;
    long order = 0;
    bool seen_nonzero = false;
    for (; p < last && *p >= '0' && *p <= '9'; ++p) {
        if (*p != '0') seen_nonzero = true;
        if (seen_nonzero) ++order;
    }
    if (p < last && *p == '.') {
        for (++p; p < last && *p >= '0' && *p <= '9'; ++p) {
            if (seen_nonzero) continue;
            if (*p != '0') seen_nonzero = true;
            else --order;
        }
    }
    if (p < last && (*p == 'e' || *p == 'E')) {
        ++p;
        bool neg = false;
        if (p < last && (*p == '+' || *p == '-')) neg = (*p++ == '-');
        long exp = 0;
        for (; p < last && *p >= '0' && *p <= '9'; ++p) {
            if (exp < 100000) exp = exp * 10 + (*p - '0');
        }
        order += neg ? -exp : exp;
    }
    return order;
}

/// @brief Full-precision text to double.
///
/// Values too small for a double read as a signed zero. Empty optional if
/// the span is not a number or its magnitude exceeds the double range.
inline std::optional<double> read_double(const char* first, const char* last) {
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    double val = 0.0;
    auto [p, ec] = std::from_chars(first, last, val);
    if (p != last) return std::nullopt;
    if (ec == std::errc{}) return val;
    if (ec == std::errc::result_out_of_range && decimal_order(first, last) <= 0) {
        return *first == '-' ? -0.0 : 0.0;
    }
    return std::nullopt;
#else
    std::string text(first, last);
    char* end_ptr = nullptr;
    const double val = std::strtod(text.c_str(), &end_ptr);
    if (end_ptr != text.c_str() + text.size()) return std::nullopt;
    if (val == HUGE_VAL || val == -HUGE_VAL) return std::nullopt;
    return val;
#endif
}

} // namespace ordmap::detail
