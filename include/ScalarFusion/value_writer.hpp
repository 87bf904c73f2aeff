#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "emitters.hpp"
#include "errors.hpp"
#include "key_classifier.hpp"
#include "number.hpp"
#include "value.hpp"
#include "writer_concept.hpp"

namespace ScalarFusion {

// Builds exactly one ValueT from the serialization events of a typed object.
// Objects have no place in either value shape; arrays only in the array
// shape. Reserved struct names route their one field to an emitter.
// A map is opened and its first key encoded before it is refused, so key
// encoding errors win over the shape error.
template<class ValueT>
class ValueWriter {
    enum class ScopeKind { Root, Array, Map, Emitter };

public:
    using iterator_type = std::size_t; // nodes produced so far
    using error_type = ErrorInfo;

    struct ArrayFrame {
        typename ValueT::Array items;

        void*     parent_frame = nullptr;
        ScopeKind parent_kind  = ScopeKind::Root;
    };

    struct MapFrame {
        reserved_names::Kind reserved = reserved_names::Kind::Ordinary;
        bool        expecting_key = true;
        bool        received      = false;
        std::string pending_key;

        void*     parent_frame = nullptr;
        ScopeKind parent_kind  = ScopeKind::Root;
    };

    explicit ValueWriter(ValueT & out)
        : out_(out)
    {}

    iterator_type& current() noexcept {
        return produced_;
    }

    error_type getError() const noexcept {
        return error_;
    }

    // ---- containers ----

    bool write_array_begin(std::size_t const& size, ArrayFrame& frame) {
        if constexpr (!ValueT::permits_array) {
            (void)size;
            (void)frame;
            return fail(invalid_type(Unexpected::Seq, expected_shape()));
        } else {
            if (!check_value_position(Unexpected::Seq)) return false;
            frame.items.clear();
            frame.items.reserve(size);
            frame.parent_frame = scope_frame_;
            frame.parent_kind  = scope_kind_;
            scope_kind_  = ScopeKind::Array;
            scope_frame_ = &frame;
            return true;
        }
    }

    bool write_array_end(ArrayFrame& frame) {
        if (!ensure_ok()) return false;
        if (scope_kind_ != ScopeKind::Array || scope_frame_ != &frame) {
            return fail_state();
        }
        scope_kind_  = frame.parent_kind;
        scope_frame_ = frame.parent_frame;
        if constexpr (ValueT::permits_array) {
            return attach(ValueT(std::move(frame.items)));
        } else {
            return fail_state();
        }
    }

    bool write_map_begin(std::size_t const&, MapFrame& frame) {
        if (!check_value_position(Unexpected::Object)) return false;
        frame.reserved      = reserved_names::Kind::Ordinary;
        frame.expecting_key = true;
        frame.received      = false;
        frame.pending_key.clear();
        frame.parent_frame  = scope_frame_;
        frame.parent_kind   = scope_kind_;
        scope_kind_  = ScopeKind::Map;
        scope_frame_ = &frame;
        return true;
    }

    bool write_struct_begin(std::string_view name, std::size_t const&, MapFrame& frame) {
        const reserved_names::Kind kind = classify_struct_name(name);
        if (kind == reserved_names::Kind::Ordinary) {
            return fail(invalid_type(Unexpected::Object, expected_shape()));
        }
        if (!check_value_position(Unexpected::Object)) return false;
        frame.reserved      = kind;
        frame.expecting_key = true;
        frame.received      = false;
        frame.pending_key.clear();
        frame.parent_frame  = scope_frame_;
        frame.parent_kind   = scope_kind_;
        scope_kind_  = ScopeKind::Emitter;
        scope_frame_ = &frame;
        return true;
    }

    bool write_variant_begin(writer::VariantKind kind, std::size_t const&, std::string_view, MapFrame&) {
        switch (kind) {
        case writer::VariantKind::Newtype:
            return fail(invalid_type(Unexpected::NewtypeVariant, expected_shape()));
        case writer::VariantKind::Tuple:
            return fail(invalid_type(Unexpected::TupleVariant, expected_shape()));
        case writer::VariantKind::Struct:
            return fail(invalid_type(Unexpected::StructVariant, expected_shape()));
        }
        return fail_state();
    }

    bool write_variant_end(MapFrame&) {
        return fail_state();
    }

    bool advance_after_value(ArrayFrame&) {
        return ensure_ok();
    }

    bool advance_after_value(MapFrame&) {
        return ensure_ok();
    }

    bool move_to_value(MapFrame& frame) {
        if (!ensure_ok()) return false;
        if (scope_kind_ == ScopeKind::Map && scope_frame_ == &frame) {
            return fail(invalid_type(Unexpected::Object, expected_shape()));
        }
        if (scope_kind_ != ScopeKind::Emitter || scope_frame_ != &frame || frame.expecting_key) {
            return fail_state();
        }
        return true;
    }

    // An escape-hatch struct must have produced its value before it ends.
    bool write_map_end(MapFrame& frame) {
        if (!ensure_ok()) return false;
        if (scope_kind_ == ScopeKind::Map && scope_frame_ == &frame) {
            return fail(invalid_type(Unexpected::Object, expected_shape())); // empty map
        }
        if (scope_kind_ != ScopeKind::Emitter || scope_frame_ != &frame) {
            return fail_state();
        }
        if (!frame.received || !frame.expecting_key) {
            return fail_state();
        }
        scope_kind_  = frame.parent_kind;
        scope_frame_ = frame.parent_frame;
        return true;
    }

    // ---- primitives ----

    bool write_null() {
        if (!check_value_position(Unexpected::Unit)) return false;
        return attach(ValueT());
    }

    bool write_some() {
        return ensure_ok();
    }

    bool write_bool(bool const& b) {
        if (!check_value_position(Unexpected::Bool)) return false;
        return attach(ValueT(b));
    }

    template<class NumberT>
    bool write_number(NumberT const& value) {
        if constexpr (std::is_floating_point_v<NumberT>) {
            if (!check_value_position(Unexpected::Float)) return false;
            // NaN and infinities become Null
            return attach(ValueT(static_cast<double>(value)));
        } else if constexpr (number_detail::is_wide_v<NumberT>) {
            if (!check_value_position(observed_integer(value))) return false;
            std::optional<Number> n;
            if constexpr (std::is_same_v<NumberT, int128_t>) {
                n = Number::from_i128(value);
            } else {
                n = Number::from_u128(value);
            }
            if (!n) {
                return fail(make_error(ValueError::NUMBER_OUT_OF_RANGE, "a 64-bit integer"));
            }
            return attach(ValueT(std::move(*n)));
        } else {
            if (!check_value_position(observed_integer(value))) return false;
            return attach(ValueT(Number(value)));
        }
    }

    bool write_string(char const* data, std::size_t size, bool /*null_terminated*/ = false) {
        if (!ensure_ok()) return false;
        const std::string_view text(data, size);

        if (scope_kind_ == ScopeKind::Map) {
            MapFrame* frame = static_cast<MapFrame*>(scope_frame_);
            if (!frame->expecting_key) {
                return fail_state();
            }
            frame->pending_key.assign(text.data(), text.size());
            frame->expecting_key = false;
            return true;
        }
        if (scope_kind_ == ScopeKind::Emitter) {
            MapFrame* frame = static_cast<MapFrame*>(scope_frame_);
            if (frame->expecting_key) {
                if (frame->received || classify_struct_name(text) != frame->reserved) {
                    return fail(emitter_rejection<ValueT>(frame->reserved, Unexpected::Str));
                }
                frame->pending_key.assign(text.data(), text.size());
                frame->expecting_key = false;
                return true;
            }
            ValueT emitted;
            if (ErrorInfo err = emit_reserved(frame->reserved, text, emitted); err.code != ValueError::NO_ERROR) {
                return fail(err);
            }
            frame->expecting_key = true;
            frame->received = true;
            return attach_to(frame->parent_kind, frame->parent_frame, std::move(emitted));
        }
        return attach(ValueT(std::string(text)));
    }

    bool write_bytes(const std::uint8_t* data, std::size_t size) {
        if constexpr (!ValueT::permits_array) {
            (void)data;
            (void)size;
            return fail(invalid_type(Unexpected::Bytes, expected_shape()));
        } else {
            if (!check_value_position(Unexpected::Bytes)) return false;
            typename ValueT::Array items;
            items.reserve(size);
            for (std::size_t i = 0; i < size; ++i) {
                items.emplace_back(Number(data[i]));
            }
            return attach(ValueT(std::move(items)));
        }
    }

    bool write_unit_variant(std::size_t const&, std::string_view name) {
        if (!check_value_position(Unexpected::UnitVariant)) return false;
        return attach(ValueT(std::string(name)));
    }

    bool finish() {
        if (!ensure_ok()) return false;
        if (scope_kind_ != ScopeKind::Root || !root_written_) {
            return fail_state();
        }
        return true;
    }

private:
    ValueT &    out_;
    std::size_t produced_ = 0;
    bool        root_written_ = false;
    ErrorInfo   error_{};

    ScopeKind scope_kind_  = ScopeKind::Root;
    void*     scope_frame_ = nullptr;

    static constexpr std::string_view expected_shape() {
        if constexpr (ValueT::permits_array) {
            return "a scalar value or an array";
        } else {
            return "a scalar value";
        }
    }

    template<class IntT>
    static constexpr Unexpected observed_integer(IntT value) {
        if constexpr (std::is_same_v<IntT, int128_t> || std::is_signed_v<IntT>) {
            if (value < 0) return Unexpected::Signed;
        }
        return Unexpected::Unsigned;
    }

    bool ensure_ok() const noexcept {
        return error_.code == ValueError::NO_ERROR;
    }

    bool fail(ErrorInfo e) {
        if (error_.code == ValueError::NO_ERROR) {
            error_ = e;
        }
        return false;
    }

    bool fail_state() {
        return fail(make_error(ValueError::INVALID_STATE));
    }

    // Inside an escape-hatch struct only the key and one string are allowed.
    bool check_value_position(Unexpected observed) {
        if (!ensure_ok()) return false;
        if (scope_kind_ == ScopeKind::Map) {
            return fail(invalid_type(Unexpected::Object, expected_shape()));
        }
        if (scope_kind_ == ScopeKind::Emitter) {
            return fail(emitter_rejection<ValueT>(static_cast<MapFrame*>(scope_frame_)->reserved, observed));
        }
        return true;
    }

    bool attach(ValueT&& v) {
        return attach_to(scope_kind_, scope_frame_, std::move(v));
    }

    bool attach_to(ScopeKind kind, void* scope_frame, ValueT&& v) {
        switch (kind) {
        case ScopeKind::Root:
            if (root_written_) {
                return fail_state(); // multiple roots
            }
            out_ = std::move(v);
            root_written_ = true;
            break;
        case ScopeKind::Array:
            static_cast<ArrayFrame*>(scope_frame)->items.push_back(std::move(v));
            break;
        case ScopeKind::Map:
        case ScopeKind::Emitter:
            return fail_state();
        }
        produced_++;
        return true;
    }
};

} // namespace ScalarFusion
