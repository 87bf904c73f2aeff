#pragma once

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "capabilities.hpp"

namespace ScalarFusion::fp_to_str_detail {

__extension__ typedef __int128 int128_t;
__extension__ typedef unsigned __int128 uint128_t;

inline bool parse_number_to_double(std::string_view text, double& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

// Lays out `len` significant digits in `buf` whose decimal point sits
// `point` digits from the left. Decimal notation is used while
// kMinExp < point <= kMaxExp, scientific `d.ddde-x` otherwise.
// Returns pointer past last char, or nullptr if [first, last) is too small.
inline char* format_buffer(char* first, char* last, const char* digits, int len, int point) {
    constexpr int kMinExp = -5;
    constexpr int kMaxExp = 16;

    char tmp[NUMBER_BUF_SIZE + 32];
    char* p = tmp;
    if (point >= len && point <= kMaxExp) {
        // 1234e7 -> 12340000000.0
        std::memcpy(p, digits, static_cast<std::size_t>(len));
        p += len;
        std::memset(p, '0', static_cast<std::size_t>(point - len));
        p += point - len;
        *p++ = '.';
        *p++ = '0';
    } else if (0 < point && point <= kMaxExp) {
        // 1234e-2 -> 12.34
        std::memcpy(p, digits, static_cast<std::size_t>(point));
        p += point;
        *p++ = '.';
        std::memcpy(p, digits + point, static_cast<std::size_t>(len - point));
        p += len - point;
    } else if (kMinExp < point && point <= 0) {
        // 1234e-6 -> 0.001234
        *p++ = '0';
        *p++ = '.';
        std::memset(p, '0', static_cast<std::size_t>(-point));
        p += -point;
        std::memcpy(p, digits, static_cast<std::size_t>(len));
        p += len;
    } else {
        // 1e30, 1.234e-30
        *p++ = digits[0];
        if (len > 1) {
            *p++ = '.';
            std::memcpy(p, digits + 1, static_cast<std::size_t>(len - 1));
            p += len - 1;
        }
        *p++ = 'e';
        auto [eptr, ec] = std::to_chars(p, tmp + sizeof(tmp), point - 1);
        if (ec != std::errc()) {
            return nullptr;
        }
        p = eptr;
    }

    const std::size_t n = static_cast<std::size_t>(p - tmp);
    if (static_cast<std::size_t>(last - first) < n) {
        return nullptr;
    }
    std::memcpy(first, tmp, n);
    return first + n;
}

// Shortest text that reads back to the same double. Integral values keep a
// trailing ".0": 1.0 -> "1.0", 1e6 -> "1000000.0", 0.0001 -> "0.0001",
// 1e20 -> "1e20", 1.5e-7 -> "1.5e-7".
// Returns pointer past last char, or nullptr if the value is not finite or
// the buffer is too small.
inline char* format_double_to_chars(char* first, char* last, double value) {
    if (!std::isfinite(value)) {
        return nullptr;
    }
    if (first == last) {
        return nullptr;
    }
    if (std::signbit(value)) {
        *first++ = '-';
        value = -value;
    }
    if (value == 0) {
        return format_buffer(first, last, "0", 1, 1);
    }

    // Shortest round-trip digits as d.ddde[+-]xx
    char sci[32];
    auto [ptr, ec] = std::to_chars(sci, sci + sizeof(sci), value, std::chars_format::scientific);
    if (ec != std::errc()) {
        return nullptr;
    }

    char digits[24];
    int len = 0;
    const char* in = sci;
    for (; in < ptr && *in != 'e'; ++in) {
        if (*in != '.') {
            digits[len++] = *in;
        }
    }
    int exponent = 0;
    if (in < ptr) {
        ++in;
        if (*in == '+') {
            ++in;
        }
        if (std::from_chars(in, ptr, exponent).ec != std::errc()) {
            return nullptr;
        }
    }
    return format_buffer(first, last, digits, len, exponent + 1);
}

template<class IntT>
inline std::string integer_to_string(IntT value) {
    if constexpr (std::is_same_v<IntT, int128_t> || std::is_same_v<IntT, uint128_t>) {
        char buf[48];
        char* end = buf + sizeof(buf);
        char* p = end;
        bool negative = false;
        uint128_t mag;
        if constexpr (std::is_same_v<IntT, int128_t>) {
            negative = value < 0;
            mag = negative ? uint128_t(0) - uint128_t(value) : uint128_t(value);
        } else {
            mag = value;
        }
        do {
            *--p = char('0' + int(mag % 10));
            mag /= 10;
        } while (mag != 0);
        if (negative) {
            *--p = '-';
        }
        return std::string(p, end);
    } else {
        char buf[NUMBER_BUF_SIZE];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
        return std::string(buf, ec == std::errc() ? ptr : buf);
    }
}

// Parses an optional '-' followed by decimal digits into a 128-bit integer.
template<class IntT>
inline bool parse_wide_integer(std::string_view text, IntT& out) {
    std::size_t i = 0;
    bool negative = false;
    if (i < text.size() && text[i] == '-') {
        negative = true;
        ++i;
    }
    if (i == text.size()) return false;
    uint128_t limit;
    if constexpr (std::is_same_v<IntT, int128_t>) {
        limit = negative ? (uint128_t(1) << 127) : (uint128_t(1) << 127) - 1;
    } else {
        if (negative) return false;
        limit = ~uint128_t(0);
    }
    uint128_t mag = 0;
    for (; i < text.size(); ++i) {
        const char c = text[i];
        if (c < '0' || c > '9') return false;
        const unsigned digit = unsigned(c - '0');
        if (mag > (limit - digit) / 10) return false;
        mag = mag * 10 + digit;
    }
    if constexpr (std::is_same_v<IntT, int128_t>) {
        out = negative ? int128_t(uint128_t(0) - mag) : int128_t(mag);
    } else {
        out = mag;
    }
    return true;
}

} // namespace ScalarFusion::fp_to_str_detail
