#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "../test_helpers.hpp"
#include "../test_model.hpp"

using namespace ScalarFusion;
using namespace TestHelpers;
using namespace scalar_fusion_test_models;

namespace {

struct Envelope {
    int      id;
    RawValue payload;
};

SmallStr small(std::string_view s) {
    SmallStr out{};
    for (std::size_t i = 0; i < s.size() && i + 1 < out.size(); ++i) {
        out[i] = s[i];
    }
    return out;
}

void structs() {
    Section("structs");

    Sensor s{small("gauge"), 10, std::nullopt, true};
    Check(TestSerialize(s, R"({"name":"gauge","hz":10,"offset":null,"active":true})"), "struct with a renamed field");

    Sensor expected{small("a"), 5, 0.25, false};
    Check(TestParse(R"({"active":false,"hz":5,"offset":0.25,"name":"a"})", expected), "fields in any order");

    Sensor partial{small("p"), 1, std::nullopt, false};
    Check(TestParse(R"({"name":"p","hz":1})", partial), "absent fields keep their defaults");

    Check(TestParseError<Sensor>(R"({"name":"a","rate":1})", ValueError::UNKNOWN_FIELD), "C++ field name is not the key");
    Check(TestParseError<Sensor>(R"({"hz":1,"hz":2})", ValueError::DUPLICATE_KEY), "duplicate field");
    Check(TestParseError<Sensor>(R"(["a",1,null,true])", ValueError::INVALID_TYPE), "struct from array");

    Check(TestParse(R"({"id":4,"extra":[1,{"x":2}]})", TolerantT{Tolerant{4}}), "excess fields skipped");
    Check(TestParseError<Tolerant>(R"({"id":4,"extra":1})", ValueError::UNKNOWN_FIELD), "excess fields rejected");

    Check(TestSerialize(PointArr{Point{1, 2}}, "[1,2]"), "tuple struct");
    Check(TestParseError<PointArr>("[1]", ValueError::INVALID_LENGTH), "short tuple struct");
    Check(TestSerialize(MetersT{Meters{2.5}}, "2.5"), "newtype struct");
    Check(TestSerialize(Unit{}, "null"), "empty struct is unit");
}

void enums() {
    Section("enums");

    Check(TestSerialize(Color::Green, R"("Green")"), "unit enum");
    Check(TestParse(R"({"Blue":null})", Color::Blue), "unit enum in map form");
    Check(TestParseError<Color>(R"("Purple")", ValueError::UNKNOWN_VARIANT), "unknown enum name");

    Check(TestSerialize(Shape{VariantCase<"Empty">{}}, R"("Empty")"), "unit variant");
    Check(TestSerialize(Shape{VariantCase<"Circle", double>{1.5}}, R"({"Circle":1.5})"), "newtype variant");
    Check(TestSerialize(Shape{VariantCase<"Pair", std::tuple<int, int>>{{3, 4}}}, R"({"Pair":[3,4]})"), "tuple variant");
    Check(TestSerialize(Shape{VariantCase<"Line", Segment>{{1, 2}}}, R"({"Line":{"from":1,"to":2}})"), "struct variant");

    Check(TestParse(R"({"Empty":null})", Shape{VariantCase<"Empty">{}}), "unit variant in map form");
    Check(TestRoundTrip<Shape>(R"({"Line":{"from":-1,"to":7}})"), "struct variant round trip");
    Check(TestParseError<Shape>(R"({"Circle":1,"Empty":null})", ValueError::INVALID_LENGTH), "two variant keys");
    Check(TestParseError<Shape>(R"("Circle")", ValueError::INVALID_TYPE), "payload variant without payload");
}

void containers() {
    Section("containers");

    Check(TestSerialize(Counts{{"a", 1}, {"b", 2}}, R"({"a":1,"b":2})"), "string-keyed map");
    Check(TestRoundTrip<Counts>(R"({"x":-1})"), "map round trip");
    Check(TestSerialize(std::map<int, bool>{{-3, true}}, R"({"-3":true})"), "integer keys become strings");
    Check(TestParse(R"({"-3":true})", std::map<int, bool>{{-3, true}}), "integer keys parsed from strings");
    Check(TestSerialize(std::map<double, int>{{1.0, 1}}, R"({"1.0":1})"), "float keys keep a fraction");

    Check(TestSerialize(std::vector<std::byte>{std::byte{1}, std::byte{255}}, "[1,255]"), "bytes as numbers");
    Check(TestSerialize(std::vector<std::optional<int>>{1, std::nullopt}, "[1,null]"), "options in a sequence");
    Check(TestSerialize(std::numeric_limits<double>::infinity(), "null"), "non-finite floats");
    Check(TestSerialize(std::vector<double>{1e6, 1e15, 1e16, 0.0001, 1e-7, -0.0},
                        "[1000000.0,1000000000000000.0,1e16,0.0001,1e-7,-0.0]"), "float layout");
    Check(TestParseError<std::array<int, 2>>("[1,2,3]", ValueError::INVALID_LENGTH), "fixed sequence overflow");
}

void numbers() {
    Section("numbers");

    Check(TestSerialize(std::uint64_t{18446744073709551615ull}, "18446744073709551615"), "u64 max");
    Check(TestParseError<std::int8_t>("200", ValueError::NUMBER_OUT_OF_RANGE), "narrowing");
    Check(TestParseError<int>("1.5", ValueError::INVALID_TYPE), "fraction into integer");

    const int128_t i128max = static_cast<int128_t>(~uint128_t(0) >> 1);
    Check(TestSerialize(i128max, "170141183460469231731687303715884105727"), "i128 as digits");

    if constexpr (arbitrary_precision_enabled()) {
        Check(TestParse("170141183460469231731687303715884105727", i128max), "i128 from digits");
        Check(TestRoundTrip<Number>("1.10"), "exact decimal");
        Check(TestRoundTrip<Number>("1e400"), "huge exponent");
        Check(TestRoundTrip<ScalarValueOrArray>("[123456789012345678901234567890,1.5,-7]"), "wide numbers in a value");

        Number n;
        Check(static_cast<bool>(Parse(n, "0.1")) && n.is_f64(), "shortest floats stay floats");
        Check(static_cast<bool>(Parse(n, "-0")) && n.is_text(), "negative zero keeps its text");
    }
}

void escape_hatches() {
    Section("escape hatches");

    if constexpr (raw_value_enabled()) {
        Envelope e{};
        Check(static_cast<bool>(Parse(e, R"({"id":1,"payload":{"k":[1,2]}})")), "raw field parses");
        Check(e.id == 1 && e.payload.get() == R"({"k":[1,2]})", "raw field keeps its text");

        std::string out;
        Check(static_cast<bool>(Serialize(e, out)) && out == R"({"id":1,"payload":{"k":[1,2]}})", "raw field written as is");

        Envelope bad{2, RawValue("{oops")};
        auto res = Serialize(bad, out);
        Check(!res && res.error() == ValueError::INVALID_VALUE, "malformed raw text refused");
    }

    using Arr = ScalarValueOrArray::Array;
    const std::string number_key = std::string(reserved_names::NUMBER_TOKEN);
    const std::string raw_key    = std::string(reserved_names::RAW_VALUE_TOKEN);
    auto entry = [](const std::string& key, std::string_view payload) {
        return "{\"" + key + "\":" + std::string(payload) + "}";
    };

    if constexpr (raw_value_enabled()) {
        Check(TestParse(entry(raw_key, R"("[1,2,3]")"), ScalarValueOrArray(Arr{1, 2, 3})), "raw entry becomes its value");
        Check(TestParse(entry(raw_key, R"("\"s\"")"), ScalarValue("s")), "raw entry with a string");
        Check(TestParseError<ScalarValue>(entry(raw_key, R"("[1]")"), ValueError::INVALID_TYPE), "raw entry keeps the shape rules");
        Check(TestParseError<ScalarValueOrArray>(entry(raw_key, "[1]"), ValueError::EXPECTED_SOME_VALUE), "raw entry needs text");
        Check(TestParseError<ScalarValueOrArray>(entry(raw_key, R"("[1,")"), ValueError::SYNTAX_ERROR), "raw entry with bad text");
    }
    if constexpr (arbitrary_precision_enabled()) {
        ScalarValue num;
        Check(static_cast<bool>(Parse(num, entry(number_key, R"("123456789012345678901234567890")"))), "number entry");
        Check(num.as_number() && num.as_number()->text() == "123456789012345678901234567890", "number entry keeps its digits");
        Check(TestParse(entry(number_key, R"("2.5")"), ScalarValue(2.5)), "number entry with a float");
        Check(TestParseError<ScalarValue>(entry(number_key, "1"), ValueError::INVALID_NUMBER), "number entry needs text");
        Check(TestParseError<ScalarValue>(entry(number_key, R"("1.2.3")"), ValueError::INVALID_NUMBER), "number entry needs a numeral");
        Check(TestParseError<ScalarValue>(R"({")" + number_key + R"(":"1","x":2})", ValueError::INVALID_LENGTH),
              "escape entry must be alone");
    }

    ScalarValue v;
    auto empty = Parse(v, "{}");
    Check(!empty && empty.info() == invalid_type(Unexpected::Other, "must provide non-array | non-object"), "empty object");
    auto ordinary = Parse(v, R"({"a":1})");
    Check(!ordinary && ordinary.info() == invalid_type(Unexpected::Object, "non map"), "objects are not values");
    Check(static_cast<bool>(Parse(v, R"("s")")) && v == "s", "string value");
    Check(TestSerialize(ScalarValueOrArray(ScalarValueOrArray::Array{nullptr, true, "x"}), R"([null,true,"x"])"),
          "value array");
}

std::string nested_arrays(std::size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
}

void nesting() {
    Section("nesting");

    const ErrorInfo too_deep{ValueError::INVALID_LENGTH, Unexpected::Other, "nesting depth within limit"};

    ScalarValueOrArray v;
    Check(static_cast<bool>(Parse(v, nested_arrays(MAX_NESTING_DEPTH))), "arrays nested up to the limit");
    auto res = Parse(v, nested_arrays(MAX_NESTING_DEPTH + 1));
    Check(!res && res.info() == too_deep, "one level past the limit");
    res = Parse(v, nested_arrays(200000));
    Check(!res && res.info() == too_deep, "very deep input fails cleanly");

    std::vector<std::vector<std::vector<int>>> typed;
    Check(TestParse("[[[1]]]", std::vector<std::vector<std::vector<int>>>{{{1}}}), "typed nesting");
    Check(static_cast<bool>(Parse(typed, "[[[]]]")), "typed empty nesting");

    if constexpr (raw_value_enabled()) {
        const std::string raw_key = std::string(reserved_names::RAW_VALUE_TOKEN);
        res = Parse(v, "{\"" + raw_key + "\":\"" + nested_arrays(200000) + "\"}");
        Check(!res && res.info() == too_deep, "deep embedded raw text");

        ScalarValueOrArray out;
        auto built = ToValue(RawValue(nested_arrays(200000)), out);
        Check(!built && built.info() == too_deep, "deep raw value into a value tree");
    }
}

void diagnostics() {
    Section("diagnostics");

    int i = 0;
    auto syntax = Parse(i, "[1,");
    Check(!syntax && syntax.error() == ValueError::SYNTAX_ERROR, "syntax error");
    Check(ErrorToString(syntax).starts_with("syntax error at offset "), "syntax error message");

    auto wrong = Parse(i, R"("x")");
    Check(ErrorToString(wrong) == "invalid type: string, expected an integer", "invalid type message");
    Check(wrong.pos() == 0, "semantic errors carry no offset");

    auto ok = Parse(i, "12");
    Check(ok && ok.pos() == 2 && i == 12, "success consumes the text");
    Check(ErrorToString(ok) == "no error", "no error message");

    Color c{};
    Check(ErrorToString(Parse(c, R"("Teal")")) == "UNKNOWN_VARIANT, expected a declared variant", "coded message");

    std::cout << ErrorToString(Parse(c, "1")) << std::endl;
}

} // namespace

int main() {
    structs();
    enums();
    containers();
    numbers();
    escape_hatches();
    nesting();
    diagnostics();
    std::cout << "all text tests passed" << std::endl;
    return 0;
}
