#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "capabilities.hpp"
#include "errors.hpp"
#include "number.hpp"
#include "reader_concept.hpp"
#include "text.hpp"
#include "value.hpp"

namespace ScalarFusion {

// Walks a value tree as a source of deserialization events.
// ValueReader<const V> borrows the tree and hands out views into it;
// ValueReader<V> takes the tree over and moves strings out of it.
template<class ValueT>
class ValueReader {
    using Base = std::remove_const_t<ValueT>;
    static constexpr bool owning = !std::is_const_v<ValueT>;

public:
    using error_type = ErrorInfo;
    using iterator_type = const Base*;

    struct ArrayFrame {
        ValueT*     arr   = nullptr;
        std::size_t index = 0;
        std::size_t size  = 0;
    };

    // Values hold no maps; the frame only exists for the protocol.
    struct MapFrame {};

    explicit ValueReader(const Base& root) requires (!owning)
        : current_(&root)
    {}

    explicit ValueReader(Base&& root) requires owning
        : owned_(std::move(root))
        , current_(&owned_)
    {}

    ValueReader(const ValueReader&) = delete;
    ValueReader& operator=(const ValueReader&) = delete;

    iterator_type current() const noexcept {
        return current_;
    }

    error_type getError() const noexcept { return err_; }

    Unexpected unexpected() const noexcept {
        if (!current_) return Unexpected::Other;
        switch (current_->type()) {
        case ValueType::Null:   return Unexpected::Unit;
        case ValueType::Bool:   return Unexpected::Bool;
        case ValueType::String: return Unexpected::Str;
        case ValueType::Array:  return Unexpected::Seq;
        case ValueType::Number: {
            const Number& n = *current_->as_number();
            switch (n.repr()) {
            case Number::Repr::PosInt: return Unexpected::Unsigned;
            case Number::Repr::NegInt: return Unexpected::Signed;
            case Number::Repr::Float:  return Unexpected::Float;
            case Number::Repr::Text: {
                const number_detail::NumeralShape shape = number_detail::classify_numeral(n.text());
                if (!shape.integral) return Unexpected::Float;
                return shape.negative ? Unexpected::Signed : Unexpected::Unsigned;
            }
            }
            return Unexpected::Other;
        }
        }
        return Unexpected::Other;
    }

    reader::TryParseStatus peek_kind(reader::ValueKind& kind) {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        switch (current_->type()) {
        case ValueType::Null:   kind = reader::ValueKind::Null; break;
        case ValueType::Bool:   kind = reader::ValueKind::Bool; break;
        case ValueType::String: kind = reader::ValueKind::String; break;
        case ValueType::Array:  kind = reader::ValueKind::Array; break;
        case ValueType::Number:
            switch (current_->as_number()->repr()) {
            case Number::Repr::PosInt: kind = reader::ValueKind::Unsigned; break;
            case Number::Repr::NegInt: kind = reader::ValueKind::Signed; break;
            case Number::Repr::Float:  kind = reader::ValueKind::Float; break;
            case Number::Repr::Text:   kind = reader::ValueKind::NumberText; break;
            }
            break;
        }
        return reader::TryParseStatus::ok;
    }

    // ---- Scalars ----

    reader::TryParseStatus start_value_and_try_read_null() {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        return current_->is_null() ? reader::TryParseStatus::ok : reader::TryParseStatus::no_match;
    }

    reader::TryParseStatus read_bool(bool& b) {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        std::optional<bool> v = current_->as_bool();
        if (!v) {
            return reader::TryParseStatus::no_match;
        }
        b = *v;
        return reader::TryParseStatus::ok;
    }

    template<class NumberT>
    reader::TryParseStatus read_number(NumberT& storage) {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        const Number* n = current_->as_number();
        if (!n) {
            return reader::TryParseStatus::no_match;
        }
        number_detail::Narrowing r = number_detail::Narrowing::invalid;
        switch (n->repr()) {
        case Number::Repr::PosInt: r = number_detail::narrow_integer(*n->as_u64(), storage); break;
        case Number::Repr::NegInt: r = number_detail::narrow_integer(*n->as_i64(), storage); break;
        case Number::Repr::Float:  r = number_detail::narrow_double(*n->as_f64(), storage); break;
        case Number::Repr::Text:   r = number_detail::narrow_text(n->text(), storage); break;
        }
        if (r != number_detail::Narrowing::ok) {
            return fail_status(number_detail::narrowing_error(r));
        }
        return reader::TryParseStatus::ok;
    }

    reader::TryParseStatus read_number_text(std::string& out) {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        const Number* n = current_->as_number();
        if (!n || !n->is_text()) {
            return reader::TryParseStatus::no_match;
        }
        out.assign(n->text());
        return reader::TryParseStatus::ok;
    }

    // ---- Strings ----

    reader::StringChunkResult read_string_chunk(char* out, std::size_t capacity) {
        reader::StringChunkResult res{reader::StringChunkStatus::error, 0, false};

        if (capacity == 0) {
            fail(make_error(ValueError::INVALID_STATE, "a non-empty buffer"));
            return res;
        }
        if (!str_active_) {
            std::optional<std::string_view> s = current_ ? current_->as_str() : std::nullopt;
            if (!s) {
                res.status = reader::StringChunkStatus::no_match;
                return res;
            }
            str_ = *s;
            str_offset_ = 0;
            str_active_ = true;
        }

        const std::size_t remaining = str_.size() - str_offset_;
        const std::size_t n = remaining < capacity ? remaining : capacity;
        std::memcpy(out, str_.data() + str_offset_, n);
        str_offset_ += n;

        res.status        = reader::StringChunkStatus::ok;
        res.bytes_written = n;
        res.done          = str_offset_ >= str_.size();
        if (res.done) {
            reset_string_state();
        }
        return res;
    }

    reader::TryParseStatus read_borrowed_string(std::string_view& out) requires (!owning) {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        std::optional<std::string_view> s = current_->as_str();
        if (!s) {
            return reader::TryParseStatus::no_match;
        }
        out = *s;
        return reader::TryParseStatus::ok;
    }

    reader::TryParseStatus take_string(std::string& out) requires owning {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        std::string* s = std::get_if<std::string>(&current_->storage());
        if (!s) {
            return reader::TryParseStatus::no_match;
        }
        out = std::move(*s);
        return reader::TryParseStatus::ok;
    }

    // A string gives its bytes; an array must hold numbers in 0..255.
    reader::TryParseStatus read_bytes(std::vector<std::byte>& out) {
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
        }
        out.clear();
        if (std::optional<std::string_view> s = current_->as_str()) {
            out.resize(s->size());
            std::memcpy(out.data(), s->data(), s->size());
            return reader::TryParseStatus::ok;
        }
        if constexpr (!Base::permits_array) {
            return reader::TryParseStatus::no_match;
        } else {
            ValueT* arr = current_;
            auto* items = items_of(arr);
            if (!items) {
                return reader::TryParseStatus::no_match;
            }
            out.reserve(items->size());
            for (auto& item : *items) {
                current_ = &item;
                std::uint8_t byte = 0;
                reader::TryParseStatus st = read_number(byte);
                if (st == reader::TryParseStatus::no_match) {
                    const Unexpected observed = unexpected();
                    current_ = arr;
                    fail(invalid_type(observed, "a byte"));
                    return reader::TryParseStatus::error;
                } else if (st == reader::TryParseStatus::error) {
                    current_ = arr;
                    return st;
                }
                out.push_back(std::byte{byte});
            }
            current_ = arr;
            return reader::TryParseStatus::ok;
        }
    }

    reader::TryParseStatus read_raw_value(std::string& out) {
        if constexpr (!raw_value_enabled()) {
            return reader::TryParseStatus::no_match;
        } else {
            if (!current_) {
                return fail_status(make_error(ValueError::INVALID_STATE, "a value"));
            }
            auto res = Serialize(*static_cast<const Base*>(current_), out);
            if (!res) {
                return fail_status(res.info());
            }
            return reader::TryParseStatus::ok;
        }
    }

    // ---- Arrays ----

    reader::IterationStatus read_array_begin(ArrayFrame& frame) {
        reset_string_state();
        reader::IterationStatus ret;
        if (!current_) {
            fail(make_error(ValueError::INVALID_STATE, "a sequence"));
            ret.status = reader::TryParseStatus::error;
            return ret;
        }
        if constexpr (!Base::permits_array) {
            (void)frame;
            ret.status = reader::TryParseStatus::no_match;
            return ret;
        } else {
            auto* items = items_of(current_);
            if (!items) {
                ret.status = reader::TryParseStatus::no_match;
                return ret;
            }
            frame.arr   = current_;
            frame.index = 0;
            frame.size  = items->size();
            if (frame.size > 0) {
                current_ = &(*items)[0];
                ret.has_value = true;
            }
            ret.status = reader::TryParseStatus::ok;
            return ret;
        }
    }

    reader::IterationStatus advance_after_value(ArrayFrame& frame) {
        reset_string_state();
        reader::IterationStatus ret;
        if (!frame.arr) {
            fail(make_error(ValueError::INVALID_STATE, "a sequence"));
            ret.status = reader::TryParseStatus::error;
            return ret;
        }
        if constexpr (Base::permits_array) {
            ++frame.index;
            if (frame.index < frame.size) {
                current_ = &(*items_of(frame.arr))[frame.index];
                ret.has_value = true;
            } else {
                current_ = frame.arr;
            }
        }
        ret.status = reader::TryParseStatus::ok;
        return ret;
    }

    // ---- Maps: never present ----

    reader::IterationStatus read_map_begin(MapFrame&) {
        reader::IterationStatus ret;
        if (!current_) {
            fail(make_error(ValueError::INVALID_STATE, "a map"));
            return ret;
        }
        ret.status = reader::TryParseStatus::no_match;
        return ret;
    }

    reader::IterationStatus advance_after_value(MapFrame&) {
        fail(make_error(ValueError::INVALID_STATE, "a map"));
        return reader::IterationStatus{};
    }

    bool move_to_value(MapFrame&) {
        fail(make_error(ValueError::INVALID_STATE, "a map"));
        return false;
    }

    // Only unit variants can be represented: the tag is a string node.
    reader::TryParseStatus read_enum_begin(MapFrame&, bool& has_payload) {
        has_payload = false;
        if (!current_) {
            return fail_status(make_error(ValueError::INVALID_STATE, "an enum"));
        }
        return current_->is_string() ? reader::TryParseStatus::ok : reader::TryParseStatus::no_match;
    }

    bool skip_value() {
        return true;
    }

    bool finish() {
        return true;
    }

private:
    [[no_unique_address]] std::conditional_t<owning, Base, std::monostate> owned_{};
    ValueT*   current_ = nullptr;
    ErrorInfo err_{};

    std::string_view str_{};
    std::size_t      str_offset_ = 0;
    bool             str_active_ = false;

    void reset_string_state() noexcept {
        str_ = {};
        str_offset_ = 0;
        str_active_ = false;
    }

    void fail(ErrorInfo e) noexcept {
        if (err_.code == ValueError::NO_ERROR) err_ = e;
    }

    reader::TryParseStatus fail_status(ErrorInfo e) noexcept {
        fail(e);
        return reader::TryParseStatus::error;
    }

    static auto* items_of(ValueT* node) requires Base::permits_array {
        if constexpr (owning) {
            return node->as_array_mut();
        } else {
            return node->as_array();
        }
    }
};

static_assert(reader::BorrowingReader<ValueReader<const ScalarValue>>);
static_assert(reader::BorrowingReader<ValueReader<const ScalarValueOrArray>>);
static_assert(reader::OwningReader<ValueReader<ScalarValue>>);
static_assert(reader::OwningReader<ValueReader<ScalarValueOrArray>>);

} // namespace ScalarFusion
