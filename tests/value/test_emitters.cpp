#include <string>

#include "../test_helpers.hpp"
#include "suites.hpp"

using namespace ScalarFusion;
using namespace TestHelpers;

namespace {

ScalarValue EmitNumber(std::string_view text, ErrorInfo & err) {
    ScalarValue out;
    err = NumberEmitter<ScalarValue>::emit(text, out);
    return out;
}

void number_emitter() {
    ErrorInfo err;

    Check(EmitNumber("12", err).is_u64() && err.code == ValueError::NO_ERROR, "integer text");
    Check(EmitNumber("-12", err) == -12, "negative integer text");
    Check(EmitNumber("1.5", err).is_f64(), "shortest float text becomes a float");
    Check(EmitNumber("1e20", err) == 1e20, "normalized exponent becomes a float");

    EmitNumber("1.x", err);
    Check(err == ErrorInfo{ValueError::INVALID_NUMBER, Unexpected::Str, "a number string"}, "malformed text");
    EmitNumber("", err);
    Check(err.code == ValueError::INVALID_NUMBER, "empty text");
    EmitNumber(" 1", err);
    Check(err.code == ValueError::INVALID_NUMBER, "surrounding blanks are not numbers");

    if constexpr (arbitrary_precision_enabled()) {
        const ScalarValue big = EmitNumber("18446744073709551616", err);
        Check(big.as_number()->is_text(), "u64 max + 1 stays exact");
        Check(EmitNumber("1.10", err).as_number()->text() == "1.10", "non-shortest float text stays exact");
        Check(EmitNumber("1e400", err).as_number()->text() == "1e400", "overflowing float stays exact");
        Check(EmitNumber("-0", err).as_number()->text() == "-0", "negative zero stays exact");
    } else {
        Check(EmitNumber("-0", err).is_f64(), "negative zero is a float");
        EmitNumber("1e400", err);
        Check(err.code == ValueError::INVALID_NUMBER, "overflowing float is rejected");
    }
}

void raw_value_emitter() {
    using Arr = ScalarValueOrArray::Array;

    ScalarValueOrArray out;
    Check(RawValueEmitter<ScalarValueOrArray>::emit("[1, [2], \"x\"]", out) == ErrorInfo{}, "raw array");
    Check(out == ScalarValueOrArray(Arr{1, ScalarValueOrArray(Arr{2}), "x"}), "raw array content");

    ScalarValue scalar;
    Check(RawValueEmitter<ScalarValue>::emit("  \"s\"  ", scalar) == ErrorInfo{}, "surrounding blanks are fine");
    Check(scalar == "s", "raw string content");

    Check(RawValueEmitter<ScalarValue>::emit("[]", scalar) == invalid_type(Unexpected::Seq, "a scalar value"),
          "raw array into the scalar shape");
    Check(RawValueEmitter<ScalarValue>::emit("nul", scalar).code == ValueError::SYNTAX_ERROR, "raw syntax error");
    Check(scalar == "s", "output untouched on failure");
}

void dispatch() {
    ScalarValue out;
    Check(emit_reserved(reserved_names::Kind::Ordinary, "1", out).code == ValueError::INVALID_STATE,
          "ordinary names have no emitter");
    Check(emitter_rejection<ScalarValue>(reserved_names::Kind::ReservedNumber, Unexpected::Seq)
              == ErrorInfo{ValueError::INVALID_NUMBER, Unexpected::Seq, "a number string"},
          "number rejection");
    Check(emitter_rejection<ScalarValue>(reserved_names::Kind::ReservedRawValue, Unexpected::Bool)
              == ErrorInfo{ValueError::EXPECTED_SOME_VALUE, Unexpected::Bool, "raw value text"},
          "raw value rejection");
}

} // namespace

void emitter_tests() {
    Section("emitters");
    number_emitter();
    raw_value_emitter();
    dispatch();
}
