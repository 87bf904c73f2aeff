#pragma once

#include <array>
#include <string_view>

#include "capabilities.hpp"

namespace ScalarFusion {

namespace reserved_names {

inline constexpr std::string_view NUMBER_TOKEN    = "$scalarfusion::private::Number";
inline constexpr std::string_view RAW_VALUE_TOKEN = "$scalarfusion::private::RawValue";

enum class Kind {
    Ordinary,
    ReservedNumber,
    ReservedRawValue
};

struct Entry {
    std::string_view token;
    Kind             kind;
    bool             enabled;
};

// Every reserved token, keyed by the capability that activates it.
inline constexpr std::array<Entry, 2> table{{
    {NUMBER_TOKEN,    Kind::ReservedNumber,   arbitrary_precision_enabled()},
    {RAW_VALUE_TOKEN, Kind::ReservedRawValue, raw_value_enabled()},
}};

constexpr Kind classify(std::string_view name) {
    for (const Entry& e : table) {
        if (e.enabled && e.token == name) {
            return e.kind;
        }
    }
    return Kind::Ordinary;
}

} // namespace reserved_names

// Result of classifying the first key of an object. For Ordinary keys `key`
// is the key text unchanged.
struct KeyClass {
    reserved_names::Kind kind = reserved_names::Kind::Ordinary;
    std::string_view     key{};

    constexpr bool is_ordinary() const {
        return kind == reserved_names::Kind::Ordinary;
    }
};

constexpr KeyClass classify_key(std::string_view key) {
    return KeyClass{reserved_names::classify(key), key};
}

// Struct names share the token table: a struct carrying a reserved name is
// an escape hatch, not an object.
constexpr reserved_names::Kind classify_struct_name(std::string_view name) {
    return reserved_names::classify(name);
}

} // namespace ScalarFusion
