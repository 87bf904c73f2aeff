#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "number.hpp"

namespace ScalarFusion {

enum class ValueType {
    Null,
    Bool,
    Number,
    String,
    Array
};

// A JSON-like value that never holds an object. With PermitsArray == false it
// holds a single scalar: Null, Bool, Number or String. With PermitsArray ==
// true it may also be an Array of values of the same shape.
template<bool PermitsArray>
class BasicValue {
public:
    static constexpr bool permits_array = PermitsArray;

    using Array = std::vector<BasicValue>;

    using Storage = std::conditional_t<PermitsArray,
        std::variant<std::monostate, bool, Number, std::string, Array>,
        std::variant<std::monostate, bool, Number, std::string>>;

    BasicValue() = default;
    BasicValue(std::nullptr_t) {}
    BasicValue(bool b) : data_(b) {}

    template<std::integral I>
        requires (!std::same_as<I, bool> && !std::same_as<I, char>)
    BasicValue(I v) : data_(Number(v)) {}

    // NaN and infinities become Null
    BasicValue(double d) {
        if (auto n = Number::from_f64(d)) {
            data_ = std::move(*n);
        }
    }
    BasicValue(float f) : BasicValue(static_cast<double>(f)) {}

    BasicValue(Number n) : data_(std::move(n)) {}
    BasicValue(std::string s) : data_(std::move(s)) {}
    BasicValue(std::string_view s) : data_(std::string(s)) {}
    BasicValue(const char* s) : data_(std::string(s)) {}
    BasicValue(char c) : data_(std::string(1, c)) {}

    BasicValue(Array a) requires PermitsArray : data_(std::move(a)) {}

    template<class T>
        requires PermitsArray && std::constructible_from<BasicValue, const T&>
    BasicValue(const std::vector<T>& items) : data_(Array(items.begin(), items.end())) {}

    template<class T>
        requires std::constructible_from<BasicValue, const T&>
    BasicValue(const std::optional<T>& o) {
        if (o) {
            *this = BasicValue(*o);
        }
    }

    ValueType type() const {
        return static_cast<ValueType>(data_.index());
    }

    bool is_null() const   { return type() == ValueType::Null; }
    bool is_bool() const   { return type() == ValueType::Bool; }
    bool is_number() const { return type() == ValueType::Number; }
    bool is_string() const { return type() == ValueType::String; }
    bool is_array() const  { return type() == ValueType::Array; }

    bool is_i64() const {
        const Number* n = as_number();
        return n && n->is_i64();
    }
    bool is_u64() const {
        const Number* n = as_number();
        return n && n->is_u64();
    }
    bool is_f64() const {
        const Number* n = as_number();
        return n && n->is_f64();
    }

    std::optional<bool> as_bool() const {
        if (const bool* b = std::get_if<bool>(&data_)) return *b;
        return std::nullopt;
    }

    const Number* as_number() const {
        return std::get_if<Number>(&data_);
    }

    std::optional<std::string_view> as_str() const {
        if (const std::string* s = std::get_if<std::string>(&data_)) return std::string_view(*s);
        return std::nullopt;
    }

    const Array* as_array() const requires PermitsArray {
        return std::get_if<Array>(&data_);
    }

    Array* as_array_mut() requires PermitsArray {
        return std::get_if<Array>(&data_);
    }

    std::optional<std::int64_t> as_i64() const {
        const Number* n = as_number();
        return n ? n->as_i64() : std::nullopt;
    }

    std::optional<std::uint64_t> as_u64() const {
        const Number* n = as_number();
        return n ? n->as_u64() : std::nullopt;
    }

    std::optional<double> as_f64() const {
        const Number* n = as_number();
        return n ? n->as_f64() : std::nullopt;
    }

    // Moves the value out, leaving Null behind.
    BasicValue take() {
        BasicValue out;
        std::swap(out.data_, data_);
        return out;
    }

    const Storage& storage() const { return data_; }
    Storage& storage() { return data_; }

    friend bool operator==(const BasicValue& a, const BasicValue& b) {
        return a.data_ == b.data_;
    }

    friend bool operator==(const BasicValue& v, bool b) {
        return v.as_bool() == b;
    }

    template<std::integral I>
        requires (!std::same_as<I, bool> && !std::same_as<I, char>)
    friend bool operator==(const BasicValue& v, I i) {
        if constexpr (std::is_signed_v<I>) {
            return v.as_i64() == static_cast<std::int64_t>(i);
        } else {
            return v.as_u64() == static_cast<std::uint64_t>(i);
        }
    }

    friend bool operator==(const BasicValue& v, double d) {
        return v.as_f64() == d;
    }

    friend bool operator==(const BasicValue& v, float f) {
        return v.as_f64() == static_cast<double>(f);
    }

    friend bool operator==(const BasicValue& v, std::string_view s) {
        return v.as_str() == s;
    }

    friend bool operator==(const BasicValue& v, const char* s) {
        return v.as_str() == std::string_view(s);
    }

    friend bool operator==(const BasicValue& v, const std::string& s) {
        return v.as_str() == std::string_view(s);
    }

    std::size_t hash() const {
        const std::size_t seed = data_.index();
        std::size_t h = 0;
        switch (type()) {
        case ValueType::Null:   h = 0; break;
        case ValueType::Bool:   h = std::hash<bool>{}(std::get<bool>(data_)); break;
        case ValueType::Number: h = std::get<Number>(data_).hash(); break;
        case ValueType::String: h = std::hash<std::string>{}(std::get<std::string>(data_)); break;
        case ValueType::Array:
            if constexpr (PermitsArray) {
                for (const BasicValue& item : std::get<Array>(data_)) {
                    h = h * 31 + item.hash();
                }
            }
            break;
        }
        return h ^ (seed + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }

private:
    Storage data_;
};

using ScalarValue        = BasicValue<false>;
using ValueNoObjOrArr    = BasicValue<false>;
using ScalarValueOrArray = BasicValue<true>;
using ValueNoObj         = BasicValue<true>;

} // namespace ScalarFusion

template<bool P>
struct std::hash<ScalarFusion::BasicValue<P>> {
    std::size_t operator()(const ScalarFusion::BasicValue<P>& v) const noexcept {
        return v.hash();
    }
};
