#pragma once
#include <cstddef>
#include <string_view>
#include <type_traits>
#include <optional>
#include <memory>
#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace ScalarFusion {

namespace options {

namespace detail {
struct key_tag{};
struct as_array_tag{};
struct transparent_tag{};
struct allow_excess_fields_tag{};
}

// Overrides the key used for a struct field.
template<ConstString Desc>
struct key {
    static_assert(Desc.check(), "[[[ ScalarFusion ]]] key contains control characters");
    using tag = detail::key_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "key";
    }
};

// Tuple struct: fields are written and read positionally, as a sequence.
struct as_array {
    using tag = detail::as_array_tag;
    static constexpr std::string_view to_string() {
        return "as_array";
    }
};

// Newtype struct: a single-field struct stands for its only field.
struct transparent {
    using tag = detail::transparent_tag;
    static constexpr std::string_view to_string() {
        return "transparent";
    }
};

// Unknown keys are skipped instead of failing the struct.
struct allow_excess_fields {
    using tag = detail::allow_excess_fields_tag;
    static constexpr std::string_view to_string() {
        return "allow_excess_fields";
    }
};

namespace detail {

template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};

template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

struct no_options {
    template<class Tag>
    static constexpr bool has_option = false;

    template<class Tag>
    using get_option = void;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    template<class Tag>
    using get_option = option_type<Tag>;
};

template<class Field>
struct annotation_meta {
    using value_t  = Field;
    using options  = no_options;
    using OptionsP = OptionsPack<>;
    static constexpr decltype(auto) getRef(Field & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const Field & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<std::optional<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ ScalarFusion ]]] Use Annotated<std::optional<T>, ...> instead of std::optional<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<std::unique_ptr<Annotated<T, Opts...>>> {
    static_assert(!sizeof(T), "[[[ ScalarFusion ]]] Use Annotated<std::unique_ptr<T>, ...> instead of std::unique_ptr<Annotated<T, ...>>");
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using OptionsP = OptionsPack<Opts...>;
    using value_t  = T;
    using options  = field_options<OptionsPack<Opts...>>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }
};

// Entry point with decay
template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};

template<class AggregateT, std::size_t Index>
struct aggregate_field_opts {
    using Field   = introspection::structureElementTypeByIndex<Index, AggregateT>;
    using options = typename annotation_meta_getter<Field>::options;
};

template<class AggregateT, std::size_t Index>
using aggregate_field_opts_getter = typename aggregate_field_opts<std::remove_cvref_t<AggregateT>, Index>::options;

} // namespace detail

} // namespace options

} // namespace ScalarFusion
