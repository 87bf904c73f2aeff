#include <ScalarFusion/number.hpp>
#include <cstdint>

using namespace ScalarFusion;
using number_detail::classify_numeral;
using number_detail::Narrowing;

// ===== Numeral grammar =====
static_assert(classify_numeral("0").valid);
static_assert(classify_numeral("0").integral);
static_assert(classify_numeral("-12").negative);
static_assert(classify_numeral("123456789012345678901234567890").integral);
static_assert(classify_numeral("1.5").valid);
static_assert(!classify_numeral("1.5").integral);
static_assert(!classify_numeral("1e3").integral);
static_assert(classify_numeral("-0.25E-7").valid);

static_assert(!classify_numeral("").valid);
static_assert(!classify_numeral("-").valid);
static_assert(!classify_numeral("01").valid);
static_assert(!classify_numeral("1.").valid);
static_assert(!classify_numeral(".5").valid);
static_assert(!classify_numeral("+1").valid);
static_assert(!classify_numeral("1e").valid);
static_assert(!classify_numeral("NaN").valid);
static_assert(!classify_numeral(" 1").valid);

// ===== Integer narrowing =====
constexpr Narrowing narrowU8(std::uint64_t v) {
    std::uint8_t out = 0;
    return number_detail::narrow_integer(v, out);
}
constexpr Narrowing narrowI8(std::int64_t v) {
    std::int8_t out = 0;
    return number_detail::narrow_integer(v, out);
}
constexpr Narrowing narrowU32(std::int64_t v) {
    std::uint32_t out = 0;
    return number_detail::narrow_integer(v, out);
}

static_assert(narrowU8(255) == Narrowing::ok);
static_assert(narrowU8(256) == Narrowing::out_of_range);
static_assert(narrowI8(-128) == Narrowing::ok);
static_assert(narrowI8(-129) == Narrowing::out_of_range);
static_assert(narrowI8(127) == Narrowing::ok);
static_assert(narrowI8(128) == Narrowing::out_of_range);
static_assert(narrowU32(-1) == Narrowing::out_of_range);

constexpr bool narrowsWide() {
    int128_t wide = 0;
    uint128_t uwide = 0;
    return number_detail::narrow_integer(std::int64_t{-5}, wide) == Narrowing::ok && wide == -5
        && number_detail::narrow_integer(std::int64_t{-5}, uwide) == Narrowing::out_of_range;
}
static_assert(narrowsWide());

constexpr Narrowing narrowDoubleToInt(double d) {
    int out = 0;
    return number_detail::narrow_double(d, out);
}
static_assert(narrowDoubleToInt(1.0) == Narrowing::fractional);
