#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "errors.hpp"
#include "fp_to_str.hpp"

namespace ScalarFusion {

namespace reader {
enum class TryParseStatus {
    no_match,   // not our case, position unchanged
    ok,         // parsed and consumed
    error       // malformed, reader already has error
};

enum class StringChunkStatus {
    ok,       // wrote some bytes (maybe zero), no error
    no_match, // not at a string
    error
};

struct StringChunkResult {
    StringChunkStatus status;
    std::size_t       bytes_written; // how many bytes we put into `out`
    bool              done;          // true if the whole string was consumed
};

struct IterationStatus {
    TryParseStatus status = TryParseStatus::error;
    bool has_value = false;
};

// What the current node is, for self-describing ("any") requests.
enum class ValueKind {
    Null,
    Bool,
    Unsigned,
    Signed,
    Float,
    NumberText,
    String,
    Array,
    Object
};

/// ReaderLike is the source side of the conversion protocol: the
/// deserialization engine asks for exactly the shape the target type expects
/// and gets no_match when the current node is of another shape.
template<typename R>
concept ReaderLike = requires(R reader,
                               R& mutable_reader,
                               bool& bool_ref,
                               int& int_ref,
                               double& double_ref,
                               fp_to_str_detail::int128_t& wide_ref,
                               char* char_ptr,
                               std::size_t size,
                               std::string& string_ref,
                               std::vector<std::byte>& bytes_ref,
                               ValueKind& kind_ref,
                               typename R::ArrayFrame & arrFrameRef,
                               typename R::MapFrame & mapFrameRef
                              ) {

    // ========== Type Requirements ==========
    typename R::iterator_type;
    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::error_type;

    // ========== Position / error ==========
    { reader.current() } -> std::same_as<typename R::iterator_type>;
    { reader.getError() } -> std::same_as<typename R::error_type>;
    // observed shape of the current node, for invalid-type reports
    { reader.unexpected() } -> std::same_as<Unexpected>;

    // ========== Self-describing ==========
    { mutable_reader.peek_kind(kind_ref) } -> std::same_as<TryParseStatus>;

    // ========== Containers ==========
    { mutable_reader.read_array_begin(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.read_map_begin(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.move_to_value(mapFrameRef) } -> std::same_as<bool>;
    // enum tags: a string (unit variant) or a single-entry map (variant with
    // payload); on ok the tag string is current
    { mutable_reader.read_enum_begin(mapFrameRef, bool_ref) } -> std::same_as<TryParseStatus>;

    // ========== Primitive Value Parsing ==========
    { mutable_reader.start_value_and_try_read_null() } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_bool(bool_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<int>(int_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<double>(double_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<fp_to_str_detail::int128_t>(wide_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_number_text(string_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_string_chunk(char_ptr, size) } -> std::same_as<StringChunkResult>;
    { mutable_reader.read_bytes(bytes_ref) } -> std::same_as<TryParseStatus>;
    // current node re-rendered as wire text
    { mutable_reader.read_raw_value(string_ref) } -> std::same_as<TryParseStatus>;

    // ========== Utility Operations ==========
    { mutable_reader.skip_value() } -> std::same_as<bool>;
    { mutable_reader.finish() } -> std::same_as<bool>;
};

// Readers over borrowed storage hand out views into it.
template<typename R>
concept BorrowingReader = ReaderLike<R> && requires(R& r, std::string_view& sv) {
    { r.read_borrowed_string(sv) } -> std::same_as<TryParseStatus>;
};

// Readers over owned storage move strings out instead of copying.
template<typename R>
concept OwningReader = ReaderLike<R> && requires(R& r, std::string& s) {
    { r.take_string(s) } -> std::same_as<TryParseStatus>;
};

template<typename R>
constexpr bool is_reader_like_v = ReaderLike<R>;

} // namespace reader

} // namespace ScalarFusion
