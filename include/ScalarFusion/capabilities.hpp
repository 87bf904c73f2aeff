#pragma once

#include <cstddef>

#ifndef SCALARFUSION_ARBITRARY_PRECISION
#define SCALARFUSION_ARBITRARY_PRECISION 1
#endif

#ifndef SCALARFUSION_RAW_VALUE
#define SCALARFUSION_RAW_VALUE 1
#endif

#ifndef SCALARFUSION_MAX_NESTING_DEPTH
#define SCALARFUSION_MAX_NESTING_DEPTH 128
#endif

#ifndef SCALARFUSION_NUMBER_BUF_SIZE
#define SCALARFUSION_NUMBER_BUF_SIZE 64
#endif

namespace ScalarFusion {

// Numbers outside the 64-bit integer and double domains are kept as exact
// decimal text.
constexpr bool arbitrary_precision_enabled() {
#if SCALARFUSION_ARBITRARY_PRECISION
    return true;
#else
    return false;
#endif
}

// Pre-encoded wire text can be embedded into and captured from values.
constexpr bool raw_value_enabled() {
#if SCALARFUSION_RAW_VALUE
    return true;
#else
    return false;
#endif
}

constexpr std::size_t NUMBER_BUF_SIZE = SCALARFUSION_NUMBER_BUF_SIZE;

// Values nested deeper than this fail to parse instead of exhausting the
// stack.
constexpr std::size_t MAX_NESTING_DEPTH = SCALARFUSION_MAX_NESTING_DEPTH;

} // namespace ScalarFusion
