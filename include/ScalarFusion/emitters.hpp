#pragma once

#include <optional>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "key_classifier.hpp"
#include "number.hpp"
#include "text.hpp"

namespace ScalarFusion {

// Sinks behind the reserved struct names. Each accepts exactly one string
// and turns it into a value node.

template<class ValueT>
struct NumberEmitter {
    static constexpr ErrorInfo rejection{ValueError::INVALID_NUMBER, Unexpected::Other, "a number string"};

    static ErrorInfo emit(std::string_view text, ValueT & out) {
        std::optional<Number> n = Number::from_string(text);
        if (!n) {
            return ErrorInfo{ValueError::INVALID_NUMBER, Unexpected::Str, "a number string"};
        }
        out = ValueT(std::move(*n));
        return ErrorInfo{};
    }
};

// Re-reads the text as wire format into the same value shape.
template<class ValueT>
struct RawValueEmitter {
    static constexpr ErrorInfo rejection{ValueError::EXPECTED_SOME_VALUE, Unexpected::Other, "raw value text"};

    static ErrorInfo emit(std::string_view text, ValueT & out) {
        ValueT parsed;
        auto res = Parse(parsed, text);
        if (!res) {
            return res.info();
        }
        out = std::move(parsed);
        return ErrorInfo{};
    }
};

template<class ValueT>
constexpr ErrorInfo emitter_rejection(reserved_names::Kind kind, Unexpected observed) {
    ErrorInfo e = kind == reserved_names::Kind::ReservedNumber
                      ? NumberEmitter<ValueT>::rejection
                      : RawValueEmitter<ValueT>::rejection;
    e.unexpected = observed;
    return e;
}

template<class ValueT>
ErrorInfo emit_reserved(reserved_names::Kind kind, std::string_view text, ValueT & out) {
    switch (kind) {
    case reserved_names::Kind::ReservedNumber:
        return NumberEmitter<ValueT>::emit(text, out);
    case reserved_names::Kind::ReservedRawValue:
        return RawValueEmitter<ValueT>::emit(text, out);
    case reserved_names::Kind::Ordinary:
        break;
    }
    return make_error(ValueError::INVALID_STATE);
}

} // namespace ScalarFusion
