// Built with SCALARFUSION_ARBITRARY_PRECISION=0 and SCALARFUSION_RAW_VALUE=0.

#include <cmath>
#include <iostream>
#include <map>
#include <string>

#include "../test_helpers.hpp"

using namespace ScalarFusion;
using namespace TestHelpers;

static_assert(!arbitrary_precision_enabled());
static_assert(!raw_value_enabled());
static_assert(classify_key(reserved_names::NUMBER_TOKEN).is_ordinary());
static_assert(classify_struct_name(reserved_names::RAW_VALUE_TOKEN) == reserved_names::Kind::Ordinary);

namespace {

void wide_integers() {
    Section("wide integers");

    const int128_t big = int128_t(1) << 100;
    Check(TestToValueError<false>(big, ValueError::NUMBER_OUT_OF_RANGE), "i128 beyond 64 bits");
    Check(TestToValueError<true>(uint128_t(1) << 64, ValueError::NUMBER_OUT_OF_RANGE), "u128 beyond 64 bits");
    Check(TestToValue(int128_t{-7}, ScalarValue(-7)), "i128 that fits");

    int128_t back = 0;
    Check(static_cast<bool>(FromValue(back, ScalarValue(std::uint64_t{1} << 63))), "u64 into i128");
    Check(back == (int128_t(1) << 63), "u64 into i128 value");
}

void numbers() {
    Section("numbers");

    Check(!Number::from_string("1e400"), "out of double range");
    Check(!Number::from_string("01"), "not a numeral");

    auto big = Number::from_string("123456789012345678901234567890");
    Check(big && big->is_f64(), "big integers fall back to doubles");

    auto neg_zero = Number::from_string("-0");
    Check(neg_zero && neg_zero->is_f64() && std::signbit(*neg_zero->as_f64()), "negative zero is a float");

    auto exact = Number::from_string("1.10");
    Check(exact && exact->is_f64() && *exact->as_f64() == 1.1, "decimals become doubles");

    Number n;
    Check(static_cast<bool>(Parse(n, "2.50")) && n.is_f64(), "parsed decimals become doubles");
    std::string out;
    Check(static_cast<bool>(Serialize(n, out)) && out == "2.5", "doubles written shortest");
}

void reserved_tokens_are_ordinary() {
    Section("reserved tokens");

    const std::string text = std::string(R"({")") + std::string(reserved_names::NUMBER_TOKEN) + R"(":"1"})";
    ScalarValue v;
    auto res = Parse(v, text);
    Check(!res && res.info() == invalid_type(Unexpected::Object, "non map"), "reserved-looking object is an object");

    const std::string raw = std::string(R"({")") + std::string(reserved_names::RAW_VALUE_TOKEN) + R"(":"[1]"})";
    ScalarValueOrArray arr;
    res = Parse(arr, raw);
    Check(!res && res.info() == invalid_type(Unexpected::Object, "non map"), "raw-looking object is an object");

    std::map<std::string, int> m;
    Check(static_cast<bool>(Parse(m, text.substr(0, text.size() - 4) + "1}")), "reserved-looking key in a map");
    Check(m.size() == 1 && m.begin()->first == reserved_names::NUMBER_TOKEN, "key kept as is");

    std::string key;
    Check(static_cast<bool>(SerializeKey(std::string(reserved_names::RAW_VALUE_TOKEN), key)), "reserved-looking map key");
}

} // namespace

int main() {
    wide_integers();
    numbers();
    reserved_tokens_are_ordinary();
    std::cout << "all capability-off tests passed" << std::endl;
    return 0;
}
