#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include "errors.hpp"
#include "fp_to_str.hpp"
#include "number.hpp"
#include "writer_concept.hpp"

namespace ScalarFusion {

// Renders one map key into `out`. Only strings, chars, bools, numbers and
// unit variants make keys; everything else is rejected.
class MapKeyWriter {
public:
    using iterator_type = std::size_t;
    using error_type = ErrorInfo;

    struct ArrayFrame {};
    struct MapFrame {};

    explicit MapKeyWriter(std::string & out)
        : out_(out)
    {}

    iterator_type& current() noexcept {
        return written_;
    }

    error_type getError() const noexcept {
        return error_;
    }

    bool write_array_begin(std::size_t const&, ArrayFrame&) {
        return reject(Unexpected::Seq);
    }
    bool write_map_begin(std::size_t const&, MapFrame&) {
        return reject(Unexpected::Object);
    }
    bool write_struct_begin(std::string_view, std::size_t const&, MapFrame&) {
        return reject(Unexpected::Object);
    }
    bool write_variant_begin(writer::VariantKind kind, std::size_t const&, std::string_view, MapFrame&) {
        switch (kind) {
        case writer::VariantKind::Newtype: return reject(Unexpected::NewtypeVariant);
        case writer::VariantKind::Tuple:   return reject(Unexpected::TupleVariant);
        case writer::VariantKind::Struct:  return reject(Unexpected::StructVariant);
        }
        return reject(Unexpected::Other);
    }
    bool write_variant_end(MapFrame&) {
        return reject(Unexpected::Other);
    }

    bool advance_after_value(ArrayFrame&) { return reject(Unexpected::Seq); }
    bool advance_after_value(MapFrame&) { return reject(Unexpected::Object); }
    bool move_to_value(MapFrame&) { return reject(Unexpected::Object); }
    bool write_array_end(ArrayFrame&) { return reject(Unexpected::Seq); }
    bool write_map_end(MapFrame&) { return reject(Unexpected::Object); }

    bool write_null() {
        return reject(Unexpected::Unit);
    }
    bool write_some() {
        return reject(Unexpected::Option);
    }

    bool write_bool(bool const& b) {
        return emit(b ? std::string_view("true") : std::string_view("false"));
    }

    template<class NumberT>
    bool write_number(NumberT const& value) {
        if constexpr (std::is_floating_point_v<NumberT>) {
            if (!std::isfinite(value)) {
                return fail(make_error(ValueError::FLOAT_KEY_MUST_BE_FINITE));
            }
            char buf[NUMBER_BUF_SIZE];
            char* end = fp_to_str_detail::format_double_to_chars(buf, buf + sizeof(buf), static_cast<double>(value));
            if (!end) {
                return fail(make_error(ValueError::INVALID_STATE));
            }
            return emit(std::string_view(buf, static_cast<std::size_t>(end - buf)));
        } else {
            return emit(fp_to_str_detail::integer_to_string(value));
        }
    }

    bool write_string(char const* data, std::size_t size, bool /*null_terminated*/ = false) {
        return emit(std::string_view(data, size));
    }

    bool write_bytes(const std::uint8_t*, std::size_t) {
        return reject(Unexpected::Bytes);
    }

    bool write_unit_variant(std::size_t const&, std::string_view name) {
        return emit(name);
    }

    bool finish() {
        if (error_.code != ValueError::NO_ERROR) return false;
        if (written_ == 0) {
            return fail(make_error(ValueError::KEY_MUST_BE_A_STRING));
        }
        return true;
    }

private:
    std::string & out_;
    std::size_t written_ = 0;
    ErrorInfo error_{};

    bool fail(ErrorInfo e) {
        if (error_.code == ValueError::NO_ERROR) {
            error_ = e;
        }
        return false;
    }

    bool reject(Unexpected observed) {
        return fail(ErrorInfo{ValueError::KEY_MUST_BE_A_STRING, observed, "a string key"});
    }

    bool emit(std::string_view key) {
        if (error_.code != ValueError::NO_ERROR) return false;
        if (written_ != 0) {
            return fail(make_error(ValueError::INVALID_STATE));
        }
        out_.assign(key.data(), key.size());
        written_ = 1;
        return true;
    }
};

static_assert(writer::WriterLike<MapKeyWriter>);

} // namespace ScalarFusion
