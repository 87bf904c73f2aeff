#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "fp_to_str.hpp"

namespace ScalarFusion {

namespace writer {

// Payload-carrying enum variants; unit variants have write_unit_variant.
enum class VariantKind {
    Newtype,
    Tuple,
    Struct
};

/// WriterLike is the sink side of the conversion protocol: the serialization
/// engine walks a typed object and issues one call per data-model event.
/// Every call returns false once the writer has failed; getError() then
/// reports the first failure.
template<typename R>
concept WriterLike = requires(R writer,
                               R& mutable_writer,
                               const bool& bool_ref,
                               const int& int_ref,
                               const double& double_ref,
                               const fp_to_str_detail::int128_t& wide_ref,
                               const char* char_ptr,
                               const std::uint8_t* bytes_ptr,
                               std::size_t size,
                               const std::size_t & sizeRef,
                               std::string_view name,
                               VariantKind kind,
                               typename R::ArrayFrame & arrFrameRef,
                               typename R::MapFrame & mapFrameRef
                              ) {

    // ========== Type Requirements ==========
    typename R::iterator_type;
    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::error_type;

    // ========== Position / error ==========
    { writer.current() } -> std::same_as<typename R::iterator_type &>;
    { writer.getError() } -> std::same_as<typename R::error_type>;

    // ========== Compound shapes ==========
    // sequences, tuples, tuple structs
    { mutable_writer.write_array_begin(sizeRef, arrFrameRef) } -> std::same_as<bool>;
    // maps
    { mutable_writer.write_map_begin(sizeRef, mapFrameRef) } -> std::same_as<bool>;
    // named structs; reserved names select the escape hatches
    { mutable_writer.write_struct_begin(name, sizeRef, mapFrameRef) } -> std::same_as<bool>;
    // newtype / tuple / struct variants: (kind, variant index, variant name)
    { mutable_writer.write_variant_begin(kind, sizeRef, name, mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_variant_end(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.advance_after_value(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.advance_after_value(mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.write_array_end(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_end(mapFrameRef) } -> std::same_as<bool>;

    // ========== Primitives ==========
    // unit, none and unit structs
    { mutable_writer.write_null() } -> std::same_as<bool>;
    // announces the payload of a present option
    { mutable_writer.write_some() } -> std::same_as<bool>;
    { mutable_writer.write_bool(bool_ref) } -> std::same_as<bool>;
    { mutable_writer.template write_number<int>(int_ref) } -> std::same_as<bool>;
    { mutable_writer.template write_number<double>(double_ref) } -> std::same_as<bool>;
    { mutable_writer.template write_number<fp_to_str_detail::int128_t>(wide_ref) } -> std::same_as<bool>;
    // strings and chars; also map keys while a map expects one
    { mutable_writer.write_string(char_ptr, size, false) } -> std::same_as<bool>;
    { mutable_writer.write_bytes(bytes_ptr, size) } -> std::same_as<bool>;
    // (variant index, variant name)
    { mutable_writer.write_unit_variant(sizeRef, name) } -> std::same_as<bool>;

    // ========== Utility Operations ==========
    { mutable_writer.finish() } -> std::same_as<bool>;
};

template<typename R>
constexpr bool is_writer_like_v = WriterLike<R>;

} // namespace writer

} // namespace ScalarFusion
