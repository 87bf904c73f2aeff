#pragma once

#include <charconv>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "capabilities.hpp"
#include "errors.hpp"
#include "fp_to_str.hpp"

namespace ScalarFusion {

using fp_to_str_detail::int128_t;
using fp_to_str_detail::uint128_t;

namespace number_detail {

struct NumeralShape {
    bool valid = false;
    bool negative = false;
    bool integral = false;
};

// -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
constexpr NumeralShape classify_numeral(std::string_view s) {
    NumeralShape shape;
    std::size_t i = 0;
    const std::size_t n = s.size();
    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };

    if (i < n && s[i] == '-') {
        shape.negative = true;
        ++i;
    }
    if (i == n || !is_digit(s[i])) return shape;
    if (s[i] == '0') {
        ++i;
    } else {
        while (i < n && is_digit(s[i])) ++i;
    }
    shape.integral = true;
    if (i < n && s[i] == '.') {
        ++i;
        if (i == n || !is_digit(s[i])) return shape;
        while (i < n && is_digit(s[i])) ++i;
        shape.integral = false;
    }
    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
        if (i == n || !is_digit(s[i])) return shape;
        while (i < n && is_digit(s[i])) ++i;
        shape.integral = false;
    }
    shape.valid = (i == n);
    return shape;
}

enum class Narrowing {
    ok,
    out_of_range,
    fractional,
    invalid
};

template<class T>
constexpr bool is_wide_v = std::is_same_v<T, int128_t> || std::is_same_v<T, uint128_t>;

template<class T>
constexpr Narrowing narrow_integer(std::uint64_t v, T& out) {
    if constexpr (std::is_floating_point_v<T> || is_wide_v<T>) {
        out = static_cast<T>(v);
    } else {
        if (v > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
            return Narrowing::out_of_range;
        }
        out = static_cast<T>(v);
    }
    return Narrowing::ok;
}

template<class T>
constexpr Narrowing narrow_integer(std::int64_t v, T& out) {
    if (v >= 0) {
        return narrow_integer(static_cast<std::uint64_t>(v), out);
    }
    if constexpr (std::is_floating_point_v<T> || std::is_same_v<T, int128_t>) {
        out = static_cast<T>(v);
    } else if constexpr (std::is_unsigned_v<T> || std::is_same_v<T, uint128_t>) {
        return Narrowing::out_of_range;
    } else {
        if (v < static_cast<std::int64_t>(std::numeric_limits<T>::min())) {
            return Narrowing::out_of_range;
        }
        out = static_cast<T>(v);
    }
    return Narrowing::ok;
}

template<class T>
constexpr Narrowing narrow_double(double d, T& out) {
    if constexpr (std::is_floating_point_v<T>) {
        out = static_cast<T>(d);
        return Narrowing::ok;
    } else {
        return Narrowing::fractional;
    }
}

// Numeral text into any numeric target; integers that do not fit 64 bits
// are reachable only by 128-bit targets.
template<class T>
inline Narrowing narrow_text(std::string_view text, T& out) {
    const NumeralShape shape = classify_numeral(text);
    if (!shape.valid) {
        return Narrowing::invalid;
    }
    if constexpr (std::is_floating_point_v<T>) {
        double d = 0;
        if (!fp_to_str_detail::parse_number_to_double(text, d)) {
            return Narrowing::out_of_range;
        }
        out = static_cast<T>(d);
        return Narrowing::ok;
    } else {
        if (!shape.integral) {
            return Narrowing::fractional;
        }
        if constexpr (is_wide_v<T>) {
            return fp_to_str_detail::parse_wide_integer(text, out) ? Narrowing::ok : Narrowing::out_of_range;
        } else {
            const char* b = text.data();
            const char* e = text.data() + text.size();
            if (shape.negative) {
                std::int64_t s = 0;
                if (auto [p, ec] = std::from_chars(b, e, s); ec != std::errc() || p != e) {
                    return Narrowing::out_of_range;
                }
                return narrow_integer(s, out);
            }
            std::uint64_t u = 0;
            if (auto [p, ec] = std::from_chars(b, e, u); ec != std::errc() || p != e) {
                return Narrowing::out_of_range;
            }
            return narrow_integer(u, out);
        }
    }
}

constexpr ErrorInfo narrowing_error(Narrowing r) {
    switch (r) {
    case Narrowing::ok:           return ErrorInfo{};
    case Narrowing::out_of_range: return make_error(ValueError::NUMBER_OUT_OF_RANGE, "a number in range of the target type");
    case Narrowing::fractional:   return invalid_type(Unexpected::Float, "an integer");
    case Narrowing::invalid:      return make_error(ValueError::INVALID_NUMBER, "a valid number");
    }
    return make_error(ValueError::INVALID_STATE);
}

} // namespace number_detail

// A JSON number: a non-negative integer, a negative integer, a finite double
// or, with arbitrary precision enabled, exact decimal text that does not fit
// the other three.
class Number {
public:
    enum class Repr { PosInt, NegInt, Float, Text };

    Number() : n_(std::uint64_t{0}) {}

    template<std::integral I>
        requires (!std::same_as<I, bool>)
    Number(I v) {
        if constexpr (std::is_signed_v<I>) {
            if (v < 0) {
                n_ = static_cast<std::int64_t>(v);
                return;
            }
        }
        n_ = static_cast<std::uint64_t>(v);
    }

    static std::optional<Number> from_f64(double v) {
        if (!std::isfinite(v)) {
            return std::nullopt;
        }
        Number r;
        r.n_ = v;
        return r;
    }

    static std::optional<Number> from_i128(int128_t v) {
        if (v >= 0 && uint128_t(v) <= std::numeric_limits<std::uint64_t>::max()) {
            return Number(static_cast<std::uint64_t>(v));
        }
        if (v < 0 && v >= int128_t(std::numeric_limits<std::int64_t>::min())) {
            return Number(static_cast<std::int64_t>(v));
        }
        if constexpr (arbitrary_precision_enabled()) {
            return from_text(fp_to_str_detail::integer_to_string(v));
        } else {
            return std::nullopt;
        }
    }

    static std::optional<Number> from_u128(uint128_t v) {
        if (v <= std::numeric_limits<std::uint64_t>::max()) {
            return Number(static_cast<std::uint64_t>(v));
        }
        if constexpr (arbitrary_precision_enabled()) {
            return from_text(fp_to_str_detail::integer_to_string(v));
        } else {
            return std::nullopt;
        }
    }

    // Accepts the JSON number grammar only. Integers that fit 64 bits are
    // stored as integers. Under arbitrary precision everything else is kept
    // as text unless it is the exact shortest form of a double; otherwise it
    // is converted to a double.
    static std::optional<Number> from_string(std::string_view text) {
        const number_detail::NumeralShape shape = number_detail::classify_numeral(text);
        if (!shape.valid) {
            return std::nullopt;
        }
        const char* b = text.data();
        const char* e = text.data() + text.size();
        if (shape.integral) {
            if (!shape.negative) {
                std::uint64_t u = 0;
                if (auto [p, ec] = std::from_chars(b, e, u); ec == std::errc() && p == e) {
                    return Number(u);
                }
            } else {
                std::int64_t s = 0;
                if (auto [p, ec] = std::from_chars(b, e, s); ec == std::errc() && p == e && s < 0) {
                    return Number(s);
                }
            }
        }
        double d = 0;
        const bool parsed = fp_to_str_detail::parse_number_to_double(text, d) && std::isfinite(d);
        if constexpr (arbitrary_precision_enabled()) {
            // A float is kept only when its shortest form is the text itself.
            if (parsed && !shape.integral) {
                char buf[NUMBER_BUF_SIZE];
                char* end = fp_to_str_detail::format_double_to_chars(buf, buf + sizeof(buf), d);
                if (end && std::string_view(buf, static_cast<std::size_t>(end - buf)) == text) {
                    return from_f64(d);
                }
            }
            return from_text(std::string(text));
        } else {
            if (!parsed) {
                return std::nullopt;
            }
            return from_f64(d);
        }
    }

    Repr repr() const {
        return static_cast<Repr>(n_.index());
    }

    bool is_u64() const { return n_.index() == 0; }
    bool is_i64() const {
        if (const auto* u = std::get_if<std::uint64_t>(&n_)) {
            return *u <= std::uint64_t(std::numeric_limits<std::int64_t>::max());
        }
        return n_.index() == 1;
    }
    bool is_f64() const { return n_.index() == 2; }
    bool is_text() const { return n_.index() == 3; }

    std::optional<std::uint64_t> as_u64() const {
        if (const auto* u = std::get_if<std::uint64_t>(&n_)) return *u;
        return std::nullopt;
    }

    std::optional<std::int64_t> as_i64() const {
        if (is_i64()) {
            if (const auto* s = std::get_if<std::int64_t>(&n_)) return *s;
            return static_cast<std::int64_t>(std::get<std::uint64_t>(n_));
        }
        return std::nullopt;
    }

    std::optional<double> as_f64() const {
        switch (repr()) {
        case Repr::PosInt: return static_cast<double>(std::get<std::uint64_t>(n_));
        case Repr::NegInt: return static_cast<double>(std::get<std::int64_t>(n_));
        case Repr::Float:  return std::get<double>(n_);
        case Repr::Text: {
            double d = 0;
            if (fp_to_str_detail::parse_number_to_double(std::get<std::string>(n_), d) && std::isfinite(d)) {
                return d;
            }
            return std::nullopt;
        }
        }
        return std::nullopt;
    }

    // Integer value of a PosInt, NegInt or integral Text number.
    std::optional<int128_t> as_i128() const {
        switch (repr()) {
        case Repr::PosInt: return int128_t(std::get<std::uint64_t>(n_));
        case Repr::NegInt: return int128_t(std::get<std::int64_t>(n_));
        case Repr::Float:  return std::nullopt;
        case Repr::Text: {
            int128_t v = 0;
            if (fp_to_str_detail::parse_wide_integer(std::get<std::string>(n_), v)) return v;
            return std::nullopt;
        }
        }
        return std::nullopt;
    }

    std::optional<uint128_t> as_u128() const {
        switch (repr()) {
        case Repr::PosInt: return uint128_t(std::get<std::uint64_t>(n_));
        case Repr::NegInt: return std::nullopt;
        case Repr::Float:  return std::nullopt;
        case Repr::Text: {
            uint128_t v = 0;
            if (fp_to_str_detail::parse_wide_integer(std::get<std::string>(n_), v)) return v;
            return std::nullopt;
        }
        }
        return std::nullopt;
    }

    // Exact decimal text; empty unless is_text().
    std::string_view text() const {
        if (const auto* t = std::get_if<std::string>(&n_)) return *t;
        return {};
    }

    std::string to_string() const {
        switch (repr()) {
        case Repr::PosInt: return fp_to_str_detail::integer_to_string(std::get<std::uint64_t>(n_));
        case Repr::NegInt: return fp_to_str_detail::integer_to_string(std::get<std::int64_t>(n_));
        case Repr::Float: {
            char buf[NUMBER_BUF_SIZE];
            char* end = fp_to_str_detail::format_double_to_chars(buf, buf + sizeof(buf), std::get<double>(n_));
            return end ? std::string(buf, end) : std::string{};
        }
        case Repr::Text: return std::get<std::string>(n_);
        }
        return {};
    }

    friend bool operator==(const Number&, const Number&) = default;

    std::size_t hash() const {
        switch (repr()) {
        case Repr::PosInt: return std::hash<std::uint64_t>{}(std::get<std::uint64_t>(n_));
        case Repr::NegInt: return std::hash<std::int64_t>{}(std::get<std::int64_t>(n_));
        case Repr::Float: {
            const double d = std::get<double>(n_);
            // 0.0 and -0.0 compare equal
            return std::hash<double>{}(d == 0.0 ? 0.0 : d);
        }
        case Repr::Text: return std::hash<std::string>{}(std::get<std::string>(n_));
        }
        return 0;
    }

private:
    static Number from_text(std::string text) {
        Number r;
        r.n_ = std::move(text);
        return r;
    }

    std::variant<std::uint64_t, std::int64_t, double, std::string> n_;
};

} // namespace ScalarFusion

template<>
struct std::hash<ScalarFusion::Number> {
    std::size_t operator()(const ScalarFusion::Number& n) const noexcept {
        return n.hash();
    }
};
