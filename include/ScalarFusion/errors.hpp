#pragma once

#include <string_view>

namespace ScalarFusion {

enum class ValueError {
    NO_ERROR,

    INVALID_TYPE,
    INVALID_VALUE,
    INVALID_LENGTH,
    UNKNOWN_VARIANT,
    UNKNOWN_FIELD,
    DUPLICATE_KEY,

    NUMBER_OUT_OF_RANGE,
    INVALID_NUMBER,
    KEY_MUST_BE_A_STRING,
    FLOAT_KEY_MUST_BE_FINITE,
    EXPECTED_SOME_VALUE,

    SYNTAX_ERROR,
    ALLOCATION_FAILED,
    INVALID_STATE
};

constexpr std::string_view error_to_string(ValueError e) {
    switch(e) {
    case ValueError::NO_ERROR: return "NO_ERROR"; break;
    case ValueError::INVALID_TYPE: return "INVALID_TYPE"; break;
    case ValueError::INVALID_VALUE: return "INVALID_VALUE"; break;
    case ValueError::INVALID_LENGTH: return "INVALID_LENGTH"; break;
    case ValueError::UNKNOWN_VARIANT: return "UNKNOWN_VARIANT"; break;
    case ValueError::UNKNOWN_FIELD: return "UNKNOWN_FIELD"; break;
    case ValueError::DUPLICATE_KEY: return "DUPLICATE_KEY"; break;
    case ValueError::NUMBER_OUT_OF_RANGE: return "NUMBER_OUT_OF_RANGE"; break;
    case ValueError::INVALID_NUMBER: return "INVALID_NUMBER"; break;
    case ValueError::KEY_MUST_BE_A_STRING: return "KEY_MUST_BE_A_STRING"; break;
    case ValueError::FLOAT_KEY_MUST_BE_FINITE: return "FLOAT_KEY_MUST_BE_FINITE"; break;
    case ValueError::EXPECTED_SOME_VALUE: return "EXPECTED_SOME_VALUE"; break;
    case ValueError::SYNTAX_ERROR: return "SYNTAX_ERROR"; break;
    case ValueError::ALLOCATION_FAILED: return "ALLOCATION_FAILED"; break;
    case ValueError::INVALID_STATE: return "INVALID_STATE"; break;
    }
    return "N/A";
}

// The shape that was actually observed when a request could not be served.
enum class Unexpected {
    Other,
    Unit,
    Bool,
    Unsigned,
    Signed,
    Float,
    Char,
    Str,
    Bytes,
    Option,
    Seq,
    Object,
    UnitVariant,
    NewtypeVariant,
    TupleVariant,
    StructVariant
};

constexpr std::string_view unexpected_to_string(Unexpected u) {
    switch(u) {
    case Unexpected::Other: return "other"; break;
    case Unexpected::Unit: return "unit value"; break;
    case Unexpected::Bool: return "boolean"; break;
    case Unexpected::Unsigned: return "integer"; break;
    case Unexpected::Signed: return "integer"; break;
    case Unexpected::Float: return "floating point"; break;
    case Unexpected::Char: return "char"; break;
    case Unexpected::Str: return "string"; break;
    case Unexpected::Bytes: return "byte array"; break;
    case Unexpected::Option: return "Option value"; break;
    case Unexpected::Seq: return "sequence"; break;
    case Unexpected::Object: return "Object"; break;
    case Unexpected::UnitVariant: return "unit variant"; break;
    case Unexpected::NewtypeVariant: return "newtype variant"; break;
    case Unexpected::TupleVariant: return "tuple variant"; break;
    case Unexpected::StructVariant: return "struct variant"; break;
    }
    return "N/A";
}

// error_type of every reader and writer. `expected` always points at a
// string literal.
struct ErrorInfo {
    ValueError       code = ValueError::NO_ERROR;
    Unexpected       unexpected = Unexpected::Other;
    std::string_view expected{};

    friend constexpr bool operator==(const ErrorInfo&, const ErrorInfo&) = default;
};

constexpr ErrorInfo invalid_type(Unexpected unexpected, std::string_view expected) {
    return ErrorInfo{ValueError::INVALID_TYPE, unexpected, expected};
}

constexpr ErrorInfo make_error(ValueError code, std::string_view expected = {}) {
    return ErrorInfo{code, Unexpected::Other, expected};
}

} // namespace ScalarFusion
