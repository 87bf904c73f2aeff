#pragma once

#include <format>
#include <string>
#include <type_traits>

#include "errors.hpp"

namespace ScalarFusion {

// Human-readable rendering of any result object exposing info() and pos().
template <class Result>
std::string ErrorToString(const Result & res) {
    const ErrorInfo e = res.info();
    switch (e.code) {
    case ValueError::NO_ERROR:
        return "no error";
    case ValueError::INVALID_TYPE:
        return std::format("invalid type: {}, expected {}", unexpected_to_string(e.unexpected), e.expected);
    case ValueError::SYNTAX_ERROR:
        if constexpr (std::is_integral_v<decltype(res.pos())>) {
            return std::format("syntax error at offset {}", res.pos());
        } else {
            return "syntax error";
        }
    default:
        break;
    }
    if (e.expected.empty()) {
        return std::string(error_to_string(e.code));
    }
    return std::format("{}, expected {}", error_to_string(e.code), e.expected);
}

} // namespace ScalarFusion
