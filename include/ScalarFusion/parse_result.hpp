#pragma once

#include "errors.hpp"

namespace ScalarFusion {

template <class InpIter>
class ParseResult {
    ErrorInfo m_error{};
    InpIter m_pos{};

public:
    using iterator_type = InpIter;
    constexpr ParseResult(ErrorInfo err, InpIter pos):
        m_error(err), m_pos(pos)
    {}
    constexpr operator bool() const {
        return m_error.code == ValueError::NO_ERROR;
    }
    constexpr InpIter pos() const {
        return m_pos;
    }
    constexpr ValueError error() const {
        return m_error.code;
    }
    constexpr ErrorInfo info() const {
        return m_error;
    }
};

} // namespace ScalarFusion
