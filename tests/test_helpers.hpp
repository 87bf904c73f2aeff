#pragma once

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <pfr.hpp>

#include <ScalarFusion/scalarfusion.hpp>

namespace TestHelpers {

// ============================================================================
// Reporting
// ============================================================================

/// Prints the failed check and aborts the test program
inline void Check(bool ok, std::string_view what) {
    if (!ok) {
        std::cerr << "FAILED: " << what << std::endl;
        std::abort();
    }
}

inline void Section(std::string_view name) {
    std::cout << "== " << name << std::endl;
}

// ============================================================================
// Struct Comparison Helpers (Using PFR)
// ============================================================================

template<class T>
struct is_annotated : std::false_type {};

template<class U, class... Opts>
struct is_annotated<ScalarFusion::Annotated<U, Opts...>> : std::true_type {};

template<class T>
constexpr bool is_annotated_v = is_annotated<std::remove_cvref_t<T>>::value;

/// Field-by-field comparison for aggregates, element-wise for ranges
template<typename T>
constexpr bool DeepEqual(const T& a, const T& b) {
    if constexpr (is_annotated_v<T>) {
        return DeepEqual(a.get(), b.get());
    } else if constexpr (std::is_arithmetic_v<T> || std::is_enum_v<T>) {
        return a == b;
    } else if constexpr (requires { a == b; }) {
        return a == b;
    } else if constexpr (requires { a.has_value(); a.value(); }) {
        if (a.has_value() != b.has_value()) return false;
        if (!a.has_value()) return true;
        return DeepEqual(a.value(), b.value());
    } else if constexpr (pfr::is_implicitly_reflectable_v<T, T>) {
        constexpr std::size_t fields_count = pfr::tuple_size_v<T>;
        return [&]<std::size_t... I>(std::index_sequence<I...>) {
            return (... && DeepEqual(pfr::get<I>(a), pfr::get<I>(b)));
        }(std::make_index_sequence<fields_count>{});
    } else if constexpr (requires { a.begin(); a.end(); a.size(); }) {
        if (a.size() != b.size()) return false;
        auto it_a = a.begin();
        auto it_b = b.begin();
        while (it_a != a.end()) {
            if (!DeepEqual(*it_a, *it_b)) return false;
            ++it_a;
            ++it_b;
        }
        return true;
    } else {
        static_assert(!sizeof(T), "DeepEqual: unsupported type");
    }
}

// ============================================================================
// Value bridge helpers
// ============================================================================

/// ToValue succeeds and produces `expected`
template<typename T, bool P>
bool TestToValue(const T& obj, const ScalarFusion::BasicValue<P>& expected) {
    ScalarFusion::BasicValue<P> out;
    if (!ScalarFusion::ToValue(obj, out)) {
        return false;
    }
    return out == expected;
}

/// ToValue fails with `code`
template<bool P, typename T>
bool TestToValueError(const T& obj, ScalarFusion::ValueError code) {
    ScalarFusion::BasicValue<P> out;
    auto res = ScalarFusion::ToValue(obj, out);
    return !res && res.error() == code;
}

/// ToValue fails with exactly `info`
template<bool P, typename T>
bool TestToValueError(const T& obj, const ScalarFusion::ErrorInfo& info) {
    ScalarFusion::BasicValue<P> out;
    auto res = ScalarFusion::ToValue(obj, out);
    return !res && res.info() == info;
}

/// FromValue (borrowed) succeeds and yields `expected`
template<typename T, bool P>
bool TestFromValue(const ScalarFusion::BasicValue<P>& value, const T& expected) {
    T obj{};
    if (!ScalarFusion::FromValue(obj, value)) {
        return false;
    }
    return DeepEqual(obj, expected);
}

/// FromValue (owned) succeeds and yields `expected`
template<typename T, bool P>
bool TestFromOwnedValue(ScalarFusion::BasicValue<P> value, const T& expected) {
    T obj{};
    if (!ScalarFusion::FromValue(obj, std::move(value))) {
        return false;
    }
    return DeepEqual(obj, expected);
}

template<typename T, bool P>
bool TestFromValueError(const ScalarFusion::BasicValue<P>& value, ScalarFusion::ValueError code) {
    T obj{};
    auto res = ScalarFusion::FromValue(obj, value);
    return !res && res.error() == code;
}

template<typename T, bool P>
bool TestFromValueError(const ScalarFusion::BasicValue<P>& value, const ScalarFusion::ErrorInfo& info) {
    T obj{};
    auto res = ScalarFusion::FromValue(obj, value);
    return !res && res.info() == info;
}

/// obj -> value -> obj gives back an equal object
template<bool P, typename T>
bool TestIdentity(const T& obj) {
    ScalarFusion::BasicValue<P> v;
    if (!ScalarFusion::ToValue(obj, v)) {
        return false;
    }
    T back{};
    if (!ScalarFusion::FromValue(back, v)) {
        return false;
    }
    return DeepEqual(obj, back);
}

// ============================================================================
// Wire text helpers
// ============================================================================

template<typename T>
bool TestParse(std::string_view text, const T& expected) {
    T obj{};
    if (!ScalarFusion::Parse(obj, text)) {
        return false;
    }
    return DeepEqual(obj, expected);
}

template<typename T>
bool TestParseError(std::string_view text, ScalarFusion::ValueError code) {
    T obj{};
    auto res = ScalarFusion::Parse(obj, text);
    return !res && res.error() == code;
}

template<typename T>
bool TestSerialize(const T& obj, std::string_view expected_text) {
    std::string out;
    if (!ScalarFusion::Serialize(obj, out)) {
        return false;
    }
    return out == expected_text;
}

/// Parse then serialize reproduces the text byte for byte
template<typename T>
bool TestRoundTrip(std::string_view text) {
    T obj{};
    if (!ScalarFusion::Parse(obj, text)) {
        return false;
    }
    std::string out;
    if (!ScalarFusion::Serialize(obj, out)) {
        return false;
    }
    return out == text;
}

} // namespace TestHelpers
