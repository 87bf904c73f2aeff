#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "const_string.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "number.hpp"
#include "raw_value.hpp"

namespace ScalarFusion {

template<bool PermitsArray>
class BasicValue;

// One alternative of a tagged enum: std::variant<VariantCase<"A">, VariantCase<"B", int>>.
// A void payload is a unit variant, a tuple payload a tuple variant, an
// aggregate payload a struct variant and anything else a newtype variant.
template<ConstString Name, class Payload = void>
struct VariantCase {
    using variant_case_marker = void;
    static constexpr std::string_view name = Name.toStringView();
    using payload_type = Payload;
    Payload value{};

    friend bool operator==(const VariantCase&, const VariantCase&) = default;
};

template<ConstString Name>
struct VariantCase<Name, void> {
    using variant_case_marker = void;
    static constexpr std::string_view name = Name.toStringView();
    using payload_type = void;

    friend bool operator==(const VariantCase&, const VariantCase&) = default;
};

// Specialize for a C++ enum to give it unit-variant names. Enumerators must be
// 0..N-1 in the order of the names:
//   template<> struct ScalarFusion::EnumMeta<Color> { using Variants = EnumVariants<"Red", "Green">; };
template<class E>
struct EnumMeta;

template<ConstString... Names>
struct EnumVariants {
    static constexpr std::size_t count = sizeof...(Names);
    static constexpr std::array<std::string_view, sizeof...(Names)> names{Names.toStringView()...};
};

// Deserialization target that accepts and discards any value.
struct IgnoredAny {};

enum class stream_read_result : std::uint8_t {
    value,  // one value produced; keep going
    end,    // normal end-of-stream
    error   // unrecoverable error; abort
};

enum class stream_write_result : std::uint8_t {
    slot_allocated,
    overflow,
    error,
    value_processed,
};

namespace static_schema {

template <typename T>
concept DynamicContainerTypeConcept = requires (T  v) {
    typename T::value_type;
    v.push_back(std::declval<typename T::value_type>());
    v.clear();
};

namespace input_checks {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;

template<class T>
struct is_directly_forbidden {
    using D = std::remove_cvref_t<T>;
    static constexpr bool value =
        std::is_void_v<D> ||
        std::is_pointer_v<D> ||
        std::is_member_pointer_v<D> ||
        std::is_function_v<D> ||
        std::is_reference_v<T>;
};

template<class T>
constexpr bool is_directly_forbidden_v = is_directly_forbidden<T>::value;

} // namespace input_checks

using input_checks::is_specialization_of;
using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;


template<class C>
struct array_read_cursor{};

template<class C>
concept ArrayReadable = requires(C& c) {
    typename array_read_cursor<C>::element_type;
    { array_read_cursor<C>{c}.read_more() } -> std::same_as<stream_read_result>;
    { array_read_cursor<C>{c}.size() } -> std::same_as<std::size_t>;
    array_read_cursor<C>{c}.get();
};

template<class C>
    requires std::ranges::sized_range<const C>
struct array_read_cursor<C> {
    using element_type = std::ranges::range_value_t<C>;
    const C& c;
    decltype(std::ranges::begin(c)) it = std::ranges::begin(c);
    bool first = true;

    constexpr const element_type& get() const {
        return *it;
    }
    constexpr std::size_t size() const {
        return static_cast<std::size_t>(std::ranges::size(c));
    }
    constexpr stream_read_result read_more() {
        if(first) {
            first = false;
        } else {
            ++it;
        }
        if(it != std::ranges::end(c)) return stream_read_result::value;
        else return stream_read_result::end;
    }
};

template<class C>
struct array_write_cursor;

template<class C>
concept ArrayWritable = requires(C& c) {
    typename array_write_cursor<C>::element_type;
    { array_write_cursor<C>{c}.allocate_slot() } -> std::same_as<stream_write_result>;
    { array_write_cursor<C>{c}.get_slot() } -> std::same_as<typename array_write_cursor<C>::element_type&>;
    { array_write_cursor<C>{c}.finalize() } -> std::same_as<stream_write_result>;
    array_write_cursor<C>{c}.reset();
};

template<class C>
    requires requires(C& c) {
        { c.emplace_back() } -> std::same_as<typename C::value_type & >;
        c.clear();
    }
struct array_write_cursor<C> {
    using element_type = typename C::value_type;
    C& c;

    constexpr stream_write_result allocate_slot() {
        return stream_write_result::slot_allocated;
    }
    constexpr element_type & get_slot() {
        return c.emplace_back();
    }
    constexpr stream_write_result finalize() {
        return stream_write_result::value_processed;
    }
    constexpr void reset(){
        c.clear();
    }
};

// fixed-size std::array: exactly N elements
template<class T, std::size_t N>
struct array_write_cursor<std::array<T, N>> {
    using element_type = T;
    std::array<T, N>& c;
    std::size_t index = 0;

    constexpr stream_write_result allocate_slot() {
        if(index < N)
            return stream_write_result::slot_allocated;
        else {
            return stream_write_result::overflow;
        }
    }
    constexpr element_type & get_slot() {
        return c[index++];
    }
    constexpr stream_write_result finalize() {
        return index == N ? stream_write_result::value_processed : stream_write_result::error;
    }
    constexpr void reset(){
        index = 0;
    }
};

template<class C>
struct map_write_cursor;

template<class C>
concept MapWritable = requires(C& c) {
    typename map_write_cursor<C>::key_type;
    typename map_write_cursor<C>::mapped_type;
    { map_write_cursor<C>{c}.key_ref() } -> std::same_as<typename map_write_cursor<C>::key_type&>;
    { map_write_cursor<C>{c}.value_ref() } -> std::same_as<typename map_write_cursor<C>::mapped_type&>;
    { map_write_cursor<C>{c}.finalize_pair() } -> std::same_as<stream_write_result>;
    map_write_cursor<C>{c}.reset();
};

template<class C>
struct map_read_cursor;

template<class C>
concept MapReadable = requires(C& c) {
    typename map_read_cursor<C>::key_type;
    typename map_read_cursor<C>::mapped_type;
    { map_read_cursor<C>{c}.read_more() } -> std::same_as<stream_read_result>;
    { map_read_cursor<C>{c}.get_key() } -> std::same_as<const typename map_read_cursor<C>::key_type&>;
    { map_read_cursor<C>{c}.get_value() } -> std::same_as<const typename map_read_cursor<C>::mapped_type&>;
};

template<class M>
    requires requires(M& m) {
        typename M::key_type;
        typename M::mapped_type;
        { m.try_emplace(std::declval<typename M::key_type>(), std::declval<typename M::mapped_type>()) };
        m.clear();
    }
struct map_write_cursor<M> {
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    M& m;
    key_type current_key{};
    mapped_type current_value{};

    constexpr key_type& key_ref() {
        return current_key;
    }

    constexpr mapped_type& value_ref() {
        return current_value;
    }

    // overflow on duplicate key
    constexpr stream_write_result finalize_pair() {
        auto [it, inserted] = m.try_emplace(
            std::move(current_key),
            std::move(current_value)
        );
        current_key = key_type{};
        current_value = mapped_type{};
        return inserted ? stream_write_result::value_processed
                        : stream_write_result::overflow;
    }

    constexpr void reset() {
        m.clear();
    }
};

template<class M>
    requires requires(const M& m) {
        typename M::key_type;
        typename M::mapped_type;
        { m.begin() } -> std::same_as<typename M::const_iterator>;
        { m.end() } -> std::same_as<typename M::const_iterator>;
    }
struct map_read_cursor<M> {
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    const M& m;
    typename M::const_iterator it = m.begin();
    bool first = true;

    constexpr std::size_t size() const {
        return m.size();
    }

    constexpr stream_read_result read_more() {
        if (first) {
            first = false;
        } else {
            ++it;
        }
        return (it != m.end()) ? stream_read_result::value
                               : stream_read_result::end;
    }

    constexpr const key_type& get_key() const {
        return it->first;
    }

    constexpr const mapped_type& get_value() const {
        return it->second;
    }
};


template<class T>
struct static_string_traits {
    static constexpr bool is_static = false;
};

template<std::size_t N>
struct static_string_traits<std::array<char, N>> {
    static constexpr bool is_static = true;
    static constexpr std::size_t capacity = N;

    static constexpr char* data(std::array<char, N>& s)  { return s.data(); }
    static constexpr const char* data(const std::array<char, N>& s)  { return s.data(); }

    // reserve 1 byte for the null terminator
    static constexpr std::size_t max_size(const std::array<char, N>&) {
        return N ? N - 1 : 0;
    }
};


namespace detail {

template<class T>
struct always_false : std::false_type {};

template<class T>
struct is_basic_value : std::false_type {};

template<bool P>
struct is_basic_value<BasicValue<P>> : std::true_type {};

template<class T>
concept IsVariantCase = requires { typename T::variant_case_marker; };

template<class T>
struct is_tagged_variant : std::false_type {};

template<class... Cases>
struct is_tagged_variant<std::variant<Cases...>>
    : std::bool_constant<(sizeof...(Cases) > 0) && (IsVariantCase<Cases> && ...)> {};

template<class T>
concept WideInteger = std::same_as<T, int128_t> || std::same_as<T, uint128_t>;

template<class T>
concept HasEnumMeta = std::is_enum_v<T> && requires { typename EnumMeta<T>::Variants; };

template<class T>
concept MapLike = requires {
    typename T::key_type;
    typename T::mapped_type;
};

} // namespace detail

enum class Category {
    unsupported,
    boolean,
    number,
    wide_integer,
    character,
    string,
    bytes,
    unit,
    option,
    unit_enum,
    tagged_enum,
    tuple,
    map,
    sequence,
    structure,
    escape_number,
    escape_raw,
    value,
    ignored
};

// Every type maps to at most one data-model category; the checks are
// ordered so that the more specific ones win.
template<class T>
consteval Category category_of() {
    using D = std::remove_cv_t<T>;
    if constexpr (detail::is_basic_value<D>::value) {
        return Category::value;
    } else if constexpr (std::same_as<D, Number>) {
        return Category::escape_number;
    } else if constexpr (std::same_as<D, RawValue>) {
        return Category::escape_raw;
    } else if constexpr (std::same_as<D, IgnoredAny>) {
        return Category::ignored;
    } else if constexpr (std::same_as<D, bool>) {
        return Category::boolean;
    } else if constexpr (std::same_as<D, char>) {
        return Category::character;
    } else if constexpr (detail::WideInteger<D>) {
        return Category::wide_integer;
    } else if constexpr (std::is_arithmetic_v<D>) {
        return Category::number;
    } else if constexpr (std::same_as<D, std::monostate> || std::same_as<D, std::nullptr_t>) {
        return Category::unit;
    } else if constexpr (std::same_as<D, std::string> || std::same_as<D, std::string_view>
                         || static_string_traits<D>::is_static) {
        return Category::string;
    } else if constexpr (std::ranges::contiguous_range<D>
                         && std::same_as<std::ranges::range_value_t<D>, std::byte>) {
        return Category::bytes;
    } else if constexpr (is_specialization_of<D, std::optional>::value
                         || is_specialization_of<D, std::unique_ptr>::value) {
        return Category::option;
    } else if constexpr (detail::HasEnumMeta<D>) {
        return Category::unit_enum;
    } else if constexpr (detail::is_tagged_variant<D>::value) {
        return Category::tagged_enum;
    } else if constexpr (is_specialization_of<D, std::tuple>::value
                         || is_specialization_of<D, std::pair>::value) {
        return Category::tuple;
    } else if constexpr (detail::MapLike<D>) {
        return Category::map;
    } else if constexpr (std::ranges::range<D>) {
        return Category::sequence;
    } else if constexpr (std::is_class_v<D> && std::is_aggregate_v<D> && !detail::IsVariantCase<D>) {
        if constexpr (introspection::structureElementsCount<D> == 0) {
            return Category::unit;
        } else {
            return Category::structure;
        }
    } else {
        return Category::unsupported;
    }
}

template<class C>
inline constexpr Category category_v = category_of<AnnotatedValue<C>>();

template<class C> concept ValueBool         = category_v<C> == Category::boolean;
template<class C> concept ValueNumber       = category_v<C> == Category::number;
template<class C> concept ValueWideInteger  = category_v<C> == Category::wide_integer;
template<class C> concept ValueChar         = category_v<C> == Category::character;
template<class C> concept ValueString       = category_v<C> == Category::string;
template<class C> concept ValueBytes        = category_v<C> == Category::bytes;
template<class C> concept ValueUnit         = category_v<C> == Category::unit;
template<class C> concept ValueNullable     = category_v<C> == Category::option;
template<class C> concept ValueUnitEnum     = category_v<C> == Category::unit_enum;
template<class C> concept ValueTaggedEnum   = category_v<C> == Category::tagged_enum;
template<class C> concept ValueTuple        = category_v<C> == Category::tuple;
template<class C> concept ValueMap          = category_v<C> == Category::map;
template<class C> concept ValueSequence     = category_v<C> == Category::sequence;
template<class C> concept ValueStruct       = category_v<C> == Category::structure;
template<class C> concept ValueEscapeNumber = category_v<C> == Category::escape_number;
template<class C> concept ValueEscapeRaw    = category_v<C> == Category::escape_raw;
template<class C> concept SelfDescribingValue = category_v<C> == Category::value;
template<class C> concept ValueIgnored      = category_v<C> == Category::ignored;

template<class C>
concept SerializableValue = !input_checks::is_directly_forbidden_v<C>
    && category_v<C> != Category::unsupported
    && category_v<C> != Category::ignored;

template<class C>
concept ParsableValue = !input_checks::is_directly_forbidden_v<C>
    && category_v<C> != Category::unsupported;


/* ######## Option access ######## */

template<class T>
struct option_traits;

template<class T>
struct option_traits<std::optional<T>> {
    using value_type = T;
};

template<class T>
struct option_traits<std::unique_ptr<T>> {
    using value_type = T;
};

template<class T>
constexpr bool isNull(const std::optional<T>& o) {
    return !o.has_value();
}

template<class T>
constexpr bool isNull(const std::unique_ptr<T>& p) {
    return p == nullptr;
}

template<class T>
constexpr void setNull(std::optional<T>& o) {
    o.reset();
}

template<class T>
constexpr void setNull(std::unique_ptr<T>& p) {
    p.reset();
}

// Must be used only after checking for null with isNull
template<class T>
constexpr const T& getRef(const std::optional<T>& o) {
    return *o;
}

template<class T>
constexpr const T& getRef(const std::unique_ptr<T>& p) {
    return *p;
}

template<class T>
constexpr T& emplaceRef(std::optional<T>& o) {
    if(!o) {
        return o.emplace();
    }
    return *o;
}

template<class T>
constexpr T& emplaceRef(std::unique_ptr<T>& p) {
    if(p == nullptr) {
        p = std::make_unique<T>();
    }
    return *p;
}


/* ######## Tagged enum / struct helpers ######## */

enum class VariantShape { Unit, Newtype, Tuple, Struct };

template<class Case>
consteval VariantShape variant_shape() {
    using P = typename Case::payload_type;
    if constexpr (std::is_void_v<P>) {
        return VariantShape::Unit;
    } else if constexpr (category_v<P> == Category::tuple) {
        return VariantShape::Tuple;
    } else if constexpr (category_v<P> == Category::structure) {
        return VariantShape::Struct;
    } else {
        return VariantShape::Newtype;
    }
}

template<class V>
struct tagged_enum_traits;

template<class... Cases>
struct tagged_enum_traits<std::variant<Cases...>> {
    static constexpr std::size_t count = sizeof...(Cases);
    static constexpr std::array<std::string_view, sizeof...(Cases)> names{Cases::name...};
};

template<class T>
struct FieldsHelper {
    static constexpr std::size_t fieldsCount = introspection::structureElementsCount<T>;

    template<std::size_t I>
    static constexpr std::string_view fieldName() {
        using Opts = options::detail::aggregate_field_opts_getter<T, I>;
        if constexpr (Opts::template has_option<options::detail::key_tag>) {
            using KeyOpt = typename Opts::template get_option<options::detail::key_tag>;
            return KeyOpt::desc.toStringView();
        } else {
            return introspection::structureElementNameByIndex<I, T>;
        }
    }

    static constexpr std::array<std::string_view, fieldsCount> fieldNames =
        []<std::size_t... I>(std::index_sequence<I...>) {
            return std::array<std::string_view, fieldsCount>{fieldName<I>()...};
        }(std::make_index_sequence<fieldsCount>{});

    static constexpr std::size_t indexOf(std::string_view name) {
        for(std::size_t i = 0; i < fieldsCount; i++) {
            if(fieldNames[i] == name) {
                return i;
            }
        }
        return fieldsCount;
    }
};

} // namespace static_schema

} // namespace ScalarFusion
