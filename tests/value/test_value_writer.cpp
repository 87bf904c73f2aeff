#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

#include "../test_helpers.hpp"
#include "../test_model.hpp"
#include "suites.hpp"

using namespace ScalarFusion;
using namespace TestHelpers;
using namespace scalar_fusion_test_models;

namespace {

void scalars() {
    Check(TestToValue(true, ScalarValue(true)), "bool");
    Check(TestToValue(42, ScalarValue(42)), "int");
    Check(TestToValue(std::int16_t{-7}, ScalarValue(-7)), "negative int16");
    Check(TestToValue(std::uint64_t{18446744073709551615ull}, ScalarValue(std::uint64_t{18446744073709551615ull})), "u64 max");
    Check(TestToValue(1.5, ScalarValue(1.5)), "double");
    Check(TestToValue(0.25f, ScalarValue(0.25)), "float");
    Check(TestToValue(std::numeric_limits<double>::quiet_NaN(), ScalarValue()), "NaN becomes Null");
    Check(TestToValue(-std::numeric_limits<float>::infinity(), ScalarValue()), "infinity becomes Null");
    Check(TestToValue(std::string("hi"), ScalarValue("hi")), "string");
    Check(TestToValue('x', ScalarValue("x")), "char becomes a one byte string");

    SmallStr name{};
    name[0] = 'a';
    name[1] = 'b';
    Check(TestToValue(name, ScalarValue("ab")), "fixed string stops at NUL");
}

void units_and_options() {
    Check(TestToValue(std::monostate{}, ScalarValue()), "unit");
    Check(TestToValue(Unit{}, ScalarValue()), "unit struct");
    Check(TestToValue(std::optional<int>{}, ScalarValue()), "none");
    Check(TestToValue(std::optional<int>{5}, ScalarValue(5)), "some is transparent");
    Check(TestToValue(std::optional<std::optional<bool>>{std::optional<bool>{}}, ScalarValue()), "nested none");
}

void enums() {
    Check(TestToValue(Color::Green, ScalarValue("Green")), "unit enum");
    Check(TestToValue(Shape{VariantCase<"Empty">{}}, ScalarValue("Empty")), "unit variant");
    Check(TestToValueError<false>(static_cast<Color>(9), ValueError::INVALID_VALUE), "undeclared enumerator");

    Check(TestToValueError<false>(Shape{VariantCase<"Circle", double>{2.0}},
                                  invalid_type(Unexpected::NewtypeVariant, "a scalar value")),
          "newtype variant is rejected");
    Check(TestToValueError<true>(Shape{VariantCase<"Pair", std::tuple<int, int>>{{1, 2}}},
                                 invalid_type(Unexpected::TupleVariant, "a scalar value or an array")),
          "tuple variant is rejected");
    Check(TestToValueError<true>(Shape{VariantCase<"Line", Segment>{{0, 1}}},
                                 invalid_type(Unexpected::StructVariant, "a scalar value or an array")),
          "struct variant is rejected");
}

void compounds() {
    using Arr = ScalarValueOrArray::Array;

    Check(TestToValue(std::vector<int>{1, 2, 3}, ScalarValueOrArray(Arr{1, 2, 3})), "sequence");
    Check(TestToValue(std::vector<std::vector<int>>{{1}, {}}, ScalarValueOrArray(Arr{ScalarValueOrArray(Arr{1}), ScalarValueOrArray(Arr{})})),
          "nested sequences");
    Check(TestToValue(std::tuple<int, std::string>{1, "a"}, ScalarValueOrArray(Arr{1, "a"})), "tuple");
    Check(TestToValue(PointArr{Point{3, 4}}, ScalarValueOrArray(Arr{3, 4})), "tuple struct");
    Check(TestToValue(MetersT{Meters{2.5}}, ScalarValue(2.5)), "newtype struct is transparent");
    Check(TestToValue(std::vector<std::byte>{std::byte{1}, std::byte{255}}, ScalarValueOrArray(Arr{1, 255})), "bytes");

    Check(TestToValueError<false>(std::vector<int>{1}, invalid_type(Unexpected::Seq, "a scalar value")),
          "scalar shape refuses sequences");
    Check(TestToValueError<false>(std::vector<std::byte>{}, invalid_type(Unexpected::Bytes, "a scalar value")),
          "scalar shape refuses bytes");
    Check(TestToValueError<false>(Point{1, 2}, invalid_type(Unexpected::Object, "a scalar value")),
          "struct is an object");
    Check(TestToValueError<true>(Point{1, 2}, invalid_type(Unexpected::Object, "a scalar value or an array")),
          "struct is an object in the array shape too");
    Check(TestToValueError<true>(Counts{{"a", 1}}, invalid_type(Unexpected::Object, "a scalar value or an array")),
          "map is an object");
    Check(TestToValueError<true>(std::vector<Point>{{1, 2}}, ValueError::INVALID_TYPE),
          "object nested in an array");
}

void first_failure_wins() {
    ScalarValueOrArray out(7);
    auto res = ToValue(std::vector<Point>{{1, 2}}, out);
    Check(!res, "conversion fails");
    Check(out == 7, "output untouched on failure");
    Check(ErrorToString(res) == "invalid type: Object, expected a scalar value or an array", "diagnostic text");

    ValueWriter<ScalarValue>::MapFrame fr;
    ScalarValue v;
    ValueWriter<ScalarValue> w(v);
    Check(w.write_map_begin(1, fr), "map opens");
    Check(w.write_string("k", 1), "its key is taken");
    Check(!w.move_to_value(fr), "map refused at its first value");
    Check(!w.write_bool(true), "later calls fail too");
    Check(w.getError() == invalid_type(Unexpected::Object, "a scalar value"), "first error is kept");

    ValueWriter<ScalarValue>::MapFrame empty_fr;
    ScalarValue e;
    ValueWriter<ScalarValue> empty(e);
    Check(empty.write_map_begin(0, empty_fr), "empty map opens");
    Check(!empty.write_map_end(empty_fr), "empty map refused at its end");
    Check(empty.getError() == invalid_type(Unexpected::Object, "a scalar value"), "empty map error");
}

void wide_integers() {
    Check(TestToValue(uint128_t{5}, ScalarValue(5)), "small u128 is a plain integer");
    Check(TestToValue(int128_t{-5}, ScalarValue(-5)), "small i128 is a plain integer");

    ScalarValue out;
    const int128_t big = int128_t(1) << 100;
    if constexpr (arbitrary_precision_enabled()) {
        Check(static_cast<bool>(ToValue(big, out)), "big i128 converts");
        Check(out.as_number()->is_text(), "big i128 is kept as text");
        Check(out.as_number()->text() == "1267650600228229401496703205376", "big i128 digits");
    } else {
        Check(TestToValueError<false>(big, ValueError::NUMBER_OUT_OF_RANGE), "big i128 out of range");
    }
}

void escape_hatches() {
    if constexpr (arbitrary_precision_enabled()) {
        const Number n = *Number::from_string("123456789012345678901234567890");
        ScalarValue out;
        Check(static_cast<bool>(ToValue(n, out)), "text number converts");
        Check(out.as_number()->text() == "123456789012345678901234567890", "text number is preserved");
        Check(TestToValue(*Number::from_string("2.5"), ScalarValue(2.5)), "float number keeps its width");
    }
    Check(TestToValue(Number(std::int64_t{-3}), ScalarValue(-3)), "negative number keeps its width");

    if constexpr (raw_value_enabled()) {
        using Arr = ScalarValueOrArray::Array;
        Check(TestToValue(RawValue("[1, \"two\", null]"), ScalarValueOrArray(Arr{1, "two", nullptr})), "raw array");
        Check(TestToValue(RawValue("true"), ScalarValue(true)), "raw scalar");
        Check(TestToValueError<false>(RawValue("[1]"), invalid_type(Unexpected::Seq, "a scalar value")),
              "raw array refused by the scalar shape");
        Check(TestToValueError<false>(RawValue("{\"a\": 1}"), invalid_type(Unexpected::Object, "non map")),
              "raw object refused");
        Check(TestToValueError<false>(RawValue("[1,"), ValueError::SYNTAX_ERROR), "raw syntax error");
        Check(TestToValue(std::vector<RawValue>{RawValue("1"), RawValue("\"s\"")}, ScalarValueOrArray(Arr{1, "s"})),
              "raw values inside a sequence");
    }
}

// Drives the writer by hand the way a custom serializer would.
void reserved_structs() {
    if constexpr (arbitrary_precision_enabled()) {
        const auto token = reserved_names::NUMBER_TOKEN;
        {
            ScalarValue v;
            ValueWriter<ScalarValue> w(v);
            ValueWriter<ScalarValue>::MapFrame fr;
            Check(w.write_struct_begin(token, 1, fr), "reserved struct opens");
            Check(w.write_string(token.data(), token.size()), "token key");
            Check(w.move_to_value(fr), "to value");
            Check(!w.write_bool(true), "non-string payload refused");
            Check(w.getError() == ErrorInfo{ValueError::INVALID_NUMBER, Unexpected::Bool, "a number string"},
                  "number emitter rejection");
        }
        {
            ScalarValue v;
            ValueWriter<ScalarValue> w(v);
            ValueWriter<ScalarValue>::MapFrame fr;
            Check(w.write_struct_begin(token, 1, fr), "reserved struct opens");
            const std::string_view other = "value";
            Check(!w.write_string(other.data(), other.size()), "other key refused");
            Check(w.getError().code == ValueError::INVALID_NUMBER, "other key gives the emitter code");
        }
        {
            ScalarValue v;
            ValueWriter<ScalarValue> w(v);
            ValueWriter<ScalarValue>::MapFrame fr;
            Check(w.write_struct_begin(token, 1, fr), "reserved struct opens");
            Check(!w.write_map_end(fr), "ending without the field fails");
            Check(w.getError().code == ValueError::INVALID_STATE, "missing field is a state error");
        }
        {
            ScalarValue v;
            ValueWriter<ScalarValue> w(v);
            ValueWriter<ScalarValue>::MapFrame fr;
            const std::string_view bad = "1.2.3";
            Check(w.write_struct_begin(token, 1, fr), "reserved struct opens");
            Check(w.write_string(token.data(), token.size()), "token key");
            Check(w.move_to_value(fr), "to value");
            Check(!w.write_string(bad.data(), bad.size()), "malformed number");
            Check(w.getError() == ErrorInfo{ValueError::INVALID_NUMBER, Unexpected::Str, "a number string"},
                  "malformed number code");
        }
    }
    if constexpr (raw_value_enabled()) {
        const auto token = reserved_names::RAW_VALUE_TOKEN;
        ScalarValue v;
        ValueWriter<ScalarValue> w(v);
        ValueWriter<ScalarValue>::MapFrame fr;
        Check(w.write_struct_begin(token, 1, fr), "raw struct opens");
        Check(w.write_string(token.data(), token.size()), "token key");
        Check(w.move_to_value(fr), "to value");
        Check(!w.template write_number<int>(1), "non-string raw payload refused");
        Check(w.getError() == ErrorInfo{ValueError::EXPECTED_SOME_VALUE, Unexpected::Unsigned, "raw value text"},
              "raw emitter rejection");
    }
}

} // namespace

void value_writer_tests() {
    Section("value builder");
    scalars();
    units_and_options();
    enums();
    compounds();
    first_failure_wins();
    wide_integers();
    escape_hatches();
    reserved_structs();
}
