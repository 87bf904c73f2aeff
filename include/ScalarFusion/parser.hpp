#pragma once

#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "capabilities.hpp"
#include "errors.hpp"
#include "key_classifier.hpp"
#include "options.hpp"
#include "parse_result.hpp"
#include "reader_concept.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"
#include "value.hpp"
#include "yyjson.hpp"

namespace ScalarFusion {

namespace parser_details {

template <class InpIter>
class DeserializationContext {
    ErrorInfo error{};
    InpIter m_pos{};
    std::size_t m_depth = 0;

public:
    constexpr DeserializationContext() = default;

    // Nested parses (embedded wire text) continue the outer depth.
    constexpr explicit DeserializationContext(std::size_t depth)
        : m_depth(depth)
    {}

    constexpr bool enterNested() {
        if(m_depth >= MAX_NESTING_DEPTH) {
            return false;
        }
        m_depth ++;
        return true;
    }

    constexpr void leaveNested() {
        m_depth --;
    }

    constexpr std::size_t depth() const {
        return m_depth;
    }

    constexpr bool withError(ErrorInfo err, const reader::ReaderLike auto & reader) {
        error = err;
        if(err.code == ValueError::NO_ERROR) {
            error.code = ValueError::INVALID_STATE;
        }
        m_pos = reader.current();
        return false;
    }

    constexpr bool withReaderError(const reader::ReaderLike auto & reader) {
        return withError(reader.getError(), reader);
    }

    constexpr ErrorInfo currentError() const {
        return error;
    }

    constexpr ParseResult<InpIter> result() const {
        return ParseResult<InpIter>(error, m_pos);
    }
};

// What a target type asks for, used in invalid-type reports.
template<class T>
consteval std::string_view expected_description() {
    using static_schema::Category;
    constexpr Category c = static_schema::category_v<T>;
    if constexpr (c == Category::boolean) {
        return "a boolean";
    } else if constexpr (c == Category::number) {
        if constexpr (std::is_floating_point_v<T>) {
            return "a floating point number";
        } else {
            return "an integer";
        }
    } else if constexpr (c == Category::wide_integer) {
        return "a 128-bit integer";
    } else if constexpr (c == Category::character) {
        return "a character";
    } else if constexpr (c == Category::string) {
        return "a string";
    } else if constexpr (c == Category::bytes) {
        return "a byte array";
    } else if constexpr (c == Category::unit) {
        return "unit";
    } else if constexpr (c == Category::unit_enum || c == Category::tagged_enum) {
        return "string or map";
    } else if constexpr (c == Category::tuple) {
        return "a tuple";
    } else if constexpr (c == Category::map) {
        return "a map";
    } else if constexpr (c == Category::sequence) {
        return "a sequence";
    } else if constexpr (c == Category::structure) {
        return "a struct";
    } else if constexpr (c == Category::escape_number) {
        return "a number";
    } else if constexpr (c == Category::escape_raw) {
        return "any valid value";
    } else {
        return "a value";
    }
}

template <class FieldOptions, class Field, reader::ReaderLike Reader, class CTX>
constexpr bool ParseValue(Field & field, Reader & reader, CTX &ctx);


constexpr std::size_t STRING_CHUNK_SIZE = 64;

// Reads the current string node into `out`, using the cheapest access the
// reader offers.
template<class Reader>
constexpr reader::TryParseStatus read_string_into(Reader & reader, std::string & out) {
    out.clear();
    if constexpr (reader::OwningReader<Reader>) {
        return reader.take_string(out);
    } else if constexpr (reader::BorrowingReader<Reader>) {
        std::string_view sv;
        reader::TryParseStatus st = reader.read_borrowed_string(sv);
        if(st == reader::TryParseStatus::ok) {
            out.assign(sv.data(), sv.size());
        }
        return st;
    } else {
        char buf[STRING_CHUNK_SIZE];
        for(bool first = true; ; first = false) {
            reader::StringChunkResult r = reader.read_string_chunk(buf, STRING_CHUNK_SIZE);
            switch(r.status) {
            case reader::StringChunkStatus::no_match:
                return first ? reader::TryParseStatus::no_match : reader::TryParseStatus::error;
            case reader::StringChunkStatus::error:
                return reader::TryParseStatus::error;
            case reader::StringChunkStatus::ok:
                break;
            }
            out.append(buf, r.bytes_written);
            if(r.done) {
                return reader::TryParseStatus::ok;
            }
        }
    }
}

template <class ObjT, reader::ReaderLike Reader, class CTX>
constexpr bool ReadStringOrFail(std::string & out, Reader & reader, CTX &ctx) {
    reader::TryParseStatus st = read_string_into(reader, out);
    if(st == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
    } else if(st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueBool<ObjT>
constexpr bool ParseNonNullValue(ObjT & obj, Reader & reader, CTX &ctx) {
    if (reader::TryParseStatus st = reader.read_bool(obj); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires (static_schema::ValueNumber<ObjT> || static_schema::ValueWideInteger<ObjT>)
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    if (reader::TryParseStatus st = reader.template read_number<ObjT>(obj);
                st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueChar<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    std::string s;
    if(!ReadStringOrFail<ObjT>(s, reader, ctx)) {
        return false;
    }
    if(s.size() != 1) {
        return ctx.withError(ErrorInfo{ValueError::INVALID_VALUE, Unexpected::Str, expected_description<ObjT>()}, reader);
    }
    obj = s[0];
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueString<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    if constexpr (std::is_same_v<ObjT, std::string_view>) {
        static_assert(reader::BorrowingReader<Reader>,
                      "[[[ ScalarFusion ]]] std::string_view can only be read from a borrowing reader");
        reader::TryParseStatus st = reader.read_borrowed_string(obj);
        if(st == reader::TryParseStatus::no_match) {
            return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
        } else if(st == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        }
        return true;
    } else if constexpr (static_schema::static_string_traits<ObjT>::is_static) {
        using Tr = static_schema::static_string_traits<ObjT>;
        std::string s;
        if(!ReadStringOrFail<ObjT>(s, reader, ctx)) {
            return false;
        }
        if(s.size() > Tr::max_size(obj)) {
            return ctx.withError(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Str, "a string that fits the buffer"}, reader);
        }
        char* b = Tr::data(obj);
        std::memcpy(b, s.data(), s.size());
        b[s.size()] = 0;
        return true;
    } else {
        return ReadStringOrFail<ObjT>(obj, reader, ctx);
    }
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueBytes<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    std::vector<std::byte> bytes;
    reader::TryParseStatus st = reader.read_bytes(bytes);
    if(st == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
    } else if(st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    if constexpr (std::is_same_v<ObjT, std::vector<std::byte>>) {
        obj = std::move(bytes);
    } else if constexpr (static_schema::DynamicContainerTypeConcept<ObjT>) {
        obj.assign(bytes.begin(), bytes.end());
    } else {
        if(bytes.size() != std::ranges::size(obj)) {
            return ctx.withError(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Bytes, "a byte array of matching length"}, reader);
        }
        std::memcpy(std::ranges::data(obj), bytes.data(), bytes.size());
    }
    return true;
}

// Reached only for non-null input.
template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueUnit<ObjT>
constexpr bool ParseNonNullValue(ObjT&, Reader & reader, CTX &ctx) {
    return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
}


/* ######## Enums ######## */

// Reads the enum tag. On success `has_payload` tells whether a payload
// entry follows in `fr`.
template <class ObjT, reader::ReaderLike Reader, class CTX>
constexpr bool ReadEnumTag(typename Reader::MapFrame & fr, bool & has_payload, std::string & tag, Reader & reader, CTX &ctx) {
    has_payload = false;
    reader::TryParseStatus st = reader.read_enum_begin(fr, has_payload);
    if(st == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
    } else if(st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    return ReadStringOrFail<ObjT>(tag, reader, ctx);
}

template <reader::ReaderLike Reader, class CTX>
constexpr bool FinishEnumPayload(typename Reader::MapFrame & fr, Reader & reader, CTX &ctx) {
    reader::IterationStatus iterStatus = reader.advance_after_value(fr);
    if(iterStatus.status != reader::TryParseStatus::ok) {
        return ctx.withReaderError(reader);
    }
    if(iterStatus.has_value) {
        return ctx.withError(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Object, "map with a single key"}, reader);
    }
    return true;
}

// {"Unit": null} is accepted for unit variants.
template <reader::ReaderLike Reader, class CTX>
constexpr bool ParseUnitPayload(typename Reader::MapFrame & fr, Reader & reader, CTX &ctx) {
    if(!reader.move_to_value(fr)) {
        return ctx.withReaderError(reader);
    }
    reader::TryParseStatus st = reader.start_value_and_try_read_null();
    if(st == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), "unit variant"), reader);
    } else if(st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    return FinishEnumPayload(fr, reader, ctx);
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueUnitEnum<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    using Variants = typename EnumMeta<ObjT>::Variants;

    typename Reader::MapFrame fr;
    bool has_payload = false;
    std::string tag;
    if(!ReadEnumTag<ObjT>(fr, has_payload, tag, reader, ctx)) {
        return false;
    }

    std::size_t index = Variants::count;
    for(std::size_t i = 0; i < Variants::count; i++) {
        if(Variants::names[i] == tag) {
            index = i;
            break;
        }
    }
    if(index == Variants::count) {
        return ctx.withError(ErrorInfo{ValueError::UNKNOWN_VARIANT, Unexpected::Str, "a declared variant"}, reader);
    }
    if(has_payload && !ParseUnitPayload(fr, reader, ctx)) {
        return false;
    }
    obj = static_cast<ObjT>(index);
    return true;
}

template <static_schema::VariantShape Shape>
consteval std::string_view variant_shape_description() {
    if constexpr (Shape == static_schema::VariantShape::Tuple) {
        return "tuple variant";
    } else if constexpr (Shape == static_schema::VariantShape::Struct) {
        return "struct variant";
    } else {
        return "newtype variant";
    }
}

template <std::size_t I, class ObjT, reader::ReaderLike Reader, class CTX>
constexpr bool ParseVariantCase(ObjT& obj, typename Reader::MapFrame & fr, bool has_payload, Reader & reader, CTX &ctx) {
    using Case = std::variant_alternative_t<I, ObjT>;
    constexpr static_schema::VariantShape shape = static_schema::variant_shape<Case>();

    Case & c = obj.template emplace<I>();
    if constexpr (shape == static_schema::VariantShape::Unit) {
        (void)c;
        if(has_payload) {
            return ParseUnitPayload(fr, reader, ctx);
        }
        return true;
    } else {
        if(!has_payload) {
            return ctx.withError(invalid_type(Unexpected::UnitVariant, variant_shape_description<shape>()), reader);
        }
        if(!reader.move_to_value(fr)) {
            return ctx.withReaderError(reader);
        }
        using Meta = options::detail::annotation_meta_getter<typename Case::payload_type>;
        if(!ParseValue<typename Meta::options>(Meta::getRef(c.value), reader, ctx)) {
            return false;
        }
        return FinishEnumPayload(fr, reader, ctx);
    }
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueTaggedEnum<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    using Traits = static_schema::tagged_enum_traits<ObjT>;

    typename Reader::MapFrame fr;
    bool has_payload = false;
    std::string tag;
    if(!ReadEnumTag<ObjT>(fr, has_payload, tag, reader, ctx)) {
        return false;
    }

    std::size_t index = Traits::count;
    for(std::size_t i = 0; i < Traits::count; i++) {
        if(Traits::names[i] == tag) {
            index = i;
            break;
        }
    }
    if(index == Traits::count) {
        return ctx.withError(ErrorInfo{ValueError::UNKNOWN_VARIANT, Unexpected::Str, "a declared variant"}, reader);
    }

    bool ok = false;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        ((index == I ? (ok = ParseVariantCase<I>(obj, fr, has_payload, reader, ctx), 0) : 0), ...);
    }(std::make_index_sequence<Traits::count>{});
    return ok;
}


/* ######## Sequences, tuples, maps ######## */

template <class ObjT, reader::ReaderLike Reader, class CTX>
constexpr bool BeginArray(typename Reader::ArrayFrame & fr, reader::IterationStatus & iterStatus, Reader & reader, CTX &ctx) {
    iterStatus = reader.read_array_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueSequence<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    static_assert(static_schema::ArrayWritable<ObjT>,
                  "[[[ ScalarFusion ]]] sequence type cannot be filled element by element");

    typename Reader::ArrayFrame fr;
    reader::IterationStatus iterStatus;
    if(!BeginArray<ObjT>(fr, iterStatus, reader, ctx)) {
        return false;
    }

    using FH = static_schema::array_write_cursor<ObjT>;
    FH cursor{obj};
    cursor.reset();

    while(iterStatus.has_value) {
        stream_write_result alloc_r = cursor.allocate_slot();
        if(alloc_r != stream_write_result::slot_allocated) {
            if(alloc_r == stream_write_result::overflow) {
                return ctx.withError(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Seq, "a sequence of matching length"}, reader);
            } else {
                return ctx.withError(make_error(ValueError::ALLOCATION_FAILED), reader);
            }
        }

        typename FH::element_type & newItem = cursor.get_slot();
        using Meta = options::detail::annotation_meta_getter<typename FH::element_type>;
        if(!ParseValue<typename Meta::options>(Meta::getRef(newItem), reader, ctx)) {
            return false;
        }

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    if(cursor.finalize() != stream_write_result::value_processed) {
        return ctx.withError(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Seq, "a sequence of matching length"}, reader);
    }
    return true;
}

template <std::size_t I, class ObjT, reader::ReaderLike Reader, class CTX>
constexpr bool ParseTupleElement(ObjT& obj, typename Reader::ArrayFrame & fr, reader::IterationStatus & iterStatus, Reader & reader, CTX &ctx) {
    if(!iterStatus.has_value) {
        return ctx.withError(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Seq, expected_description<ObjT>()}, reader);
    }
    using Meta = options::detail::annotation_meta_getter<std::tuple_element_t<I, ObjT>>;
    if(!ParseValue<typename Meta::options>(Meta::getRef(std::get<I>(obj)), reader, ctx)) {
        return false;
    }
    iterStatus = reader.advance_after_value(fr);
    if (iterStatus.status != reader::TryParseStatus::ok) {
        return ctx.withReaderError(reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueTuple<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    typename Reader::ArrayFrame fr;
    reader::IterationStatus iterStatus;
    if(!BeginArray<ObjT>(fr, iterStatus, reader, ctx)) {
        return false;
    }
    bool ok = [&]<std::size_t... I>(std::index_sequence<I...>) {
        return (ParseTupleElement<I>(obj, fr, iterStatus, reader, ctx) && ...);
    }(std::make_index_sequence<std::tuple_size_v<ObjT>>{});
    if(!ok) {
        return false;
    }
    if(iterStatus.has_value) {
        return ctx.withError(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Seq, expected_description<ObjT>()}, reader);
    }
    return true;
}

// Map keys travel as strings; non-string key types are read back from their
// key text.
template <class KeyT>
constexpr ErrorInfo ConvertMapKey(std::string & text, KeyT & out) {
    using static_schema::Category;
    constexpr Category c = static_schema::category_v<KeyT>;
    if constexpr (c == Category::string && std::is_same_v<KeyT, std::string>) {
        out = std::move(text);
    } else if constexpr (c == Category::character) {
        if(text.size() != 1) {
            return ErrorInfo{ValueError::INVALID_VALUE, Unexpected::Str, "a character"};
        }
        out = text[0];
    } else if constexpr (c == Category::boolean) {
        if(text == "true") {
            out = true;
        } else if(text == "false") {
            out = false;
        } else {
            return invalid_type(Unexpected::Str, "a boolean key");
        }
    } else if constexpr (c == Category::wide_integer) {
        if(!fp_to_str_detail::parse_wide_integer(text, out)) {
            return invalid_type(Unexpected::Str, "an integer key");
        }
    } else if constexpr (c == Category::number && std::is_floating_point_v<KeyT>) {
        double d = 0;
        if(!fp_to_str_detail::parse_number_to_double(text, d)) {
            return invalid_type(Unexpected::Str, "a floating point key");
        }
        out = static_cast<KeyT>(d);
    } else if constexpr (c == Category::number) {
        const char* b = text.data();
        const char* e = text.data() + text.size();
        auto [p, ec] = std::from_chars(b, e, out);
        if(ec == std::errc::result_out_of_range) {
            return make_error(ValueError::NUMBER_OUT_OF_RANGE, "an integer key");
        }
        if(ec != std::errc() || p != e) {
            return invalid_type(Unexpected::Str, "an integer key");
        }
    } else {
        static_assert(static_schema::detail::always_false<KeyT>::value,
                      "[[[ ScalarFusion ]]] unsupported map key type");
    }
    return ErrorInfo{};
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueMap<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    static_assert(static_schema::MapWritable<ObjT>,
                  "[[[ ScalarFusion ]]] map type cannot be filled entry by entry");

    typename Reader::MapFrame fr;
    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    using FH = static_schema::map_write_cursor<ObjT>;
    FH cursor{obj};
    cursor.reset();

    std::string keyText;
    while(iterStatus.has_value) {
        if(!ReadStringOrFail<std::string>(keyText, reader, ctx)) {
            return false;
        }
        if(ErrorInfo keyErr = ConvertMapKey(keyText, cursor.key_ref()); keyErr.code != ValueError::NO_ERROR) {
            return ctx.withError(keyErr, reader);
        }
        if (!reader.move_to_value(fr)) {
            return ctx.withReaderError(reader);
        }

        using Meta = options::detail::annotation_meta_getter<typename FH::mapped_type>;
        if(!ParseValue<typename Meta::options>(Meta::getRef(cursor.value_ref()), reader, ctx)) {
            return false;
        }

        stream_write_result finalize_r = cursor.finalize_pair();
        if(finalize_r != stream_write_result::value_processed) {
            if(finalize_r == stream_write_result::overflow) {
                return ctx.withError(make_error(ValueError::DUPLICATE_KEY, "unique map keys"), reader);
            } else {
                return ctx.withError(make_error(ValueError::ALLOCATION_FAILED), reader);
            }
        }

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    return true;
}


/* ######## Structs ######## */

template<class StructT, std::size_t StructIndex>
using StructFieldMeta = options::detail::annotation_meta_getter<
    introspection::structureElementTypeByIndex<StructIndex, StructT>
>;

template <class ObjT, reader::ReaderLike Reader, class CTX, std::size_t... StructIndex>
constexpr bool ParseStructField(ObjT& structObj, Reader & reader, CTX &ctx, std::index_sequence<StructIndex...>, std::size_t requiredIndex) {
    bool ok = false;
    (
        (requiredIndex == StructIndex
             ? (
                ok = ParseValue< options::detail::aggregate_field_opts_getter<ObjT, StructIndex>>(
                       StructFieldMeta<ObjT, StructIndex>::getRef(
                           introspection::getStructElementByIndex<StructIndex>(structObj)
                           ),
                       reader, ctx
                       )
                , 0)
             : 0),
        ...
        );
    return ok;
}

// Absent fields keep the values they were constructed with.
template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueStruct<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    typename Reader::MapFrame fr;
    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    using FH = static_schema::FieldsHelper<ObjT>;
    std::array<bool, FH::fieldsCount> parsedFields{};

    std::string key;
    while(iterStatus.has_value) {
        if(!ReadStringOrFail<std::string>(key, reader, ctx)) {
            return false;
        }
        if (!reader.move_to_value(fr)) {
            return ctx.withReaderError(reader);
        }

        const std::size_t structIndex = FH::indexOf(key);
        if(structIndex == FH::fieldsCount) {
            if constexpr (Opts::template has_option<options::detail::allow_excess_fields_tag>) {
                if(!reader.skip_value()) {
                    return ctx.withReaderError(reader);
                }
            } else {
                return ctx.withError(ErrorInfo{ValueError::UNKNOWN_FIELD, Unexpected::Str, "a declared field"}, reader);
            }
        } else {
            if(parsedFields[structIndex]) {
                return ctx.withError(make_error(ValueError::DUPLICATE_KEY, "unique struct fields"), reader);
            }
            if(!ParseStructField(obj, reader, ctx, std::make_index_sequence<FH::fieldsCount>{}, structIndex)) {
                return false;
            }
            parsedFields[structIndex] = true;
        }

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    return true;
}

// tuple struct
template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueStruct<ObjT>
             && Opts::template has_option<options::detail::as_array_tag>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    typename Reader::ArrayFrame fr;
    reader::IterationStatus iterStatus;
    if(!BeginArray<ObjT>(fr, iterStatus, reader, ctx)) {
        return false;
    }

    constexpr std::size_t totalFieldsCount = introspection::structureElementsCount<ObjT>;
    std::size_t requiredIndex = 0;

    while(iterStatus.has_value) {
        if(requiredIndex >= totalFieldsCount) {
            return ctx.withError(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Seq, "a tuple struct of matching length"}, reader);
        }
        if(!ParseStructField(obj, reader, ctx, std::make_index_sequence<totalFieldsCount>{}, requiredIndex)) {
            return false;
        }
        requiredIndex ++;

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }
    if(requiredIndex != totalFieldsCount) {
        return ctx.withError(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Seq, "a tuple struct of matching length"}, reader);
    }
    return true;
}

// newtype struct
template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueStruct<ObjT>
             && Opts::template has_option<options::detail::transparent_tag>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    static_assert(introspection::structureElementsCount<ObjT> == 1,
                  "[[[ ScalarFusion ]]] transparent requires a struct with exactly one field");
    return ParseValue<options::detail::aggregate_field_opts_getter<ObjT, 0>>(
        StructFieldMeta<ObjT, 0>::getRef(introspection::getStructElementByIndex<0>(obj)), reader, ctx);
}


/* ######## Escape hatches and self-describing values ######## */

// An object standing for an escape hatch: exactly one entry whose key is a
// reserved token and whose value is a string. Ordinary objects fail with
// `ordinaryExpected`.
template <reader::ReaderLike Reader, class CTX>
constexpr bool ReadReservedEntry(reserved_names::Kind & kind, std::string & payload, std::string_view ordinaryExpected, Reader & reader, CTX &ctx) {
    typename Reader::MapFrame fr;
    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), ordinaryExpected), reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    if(!iterStatus.has_value) {
        return ctx.withError(invalid_type(Unexpected::Other, "must provide non-array | non-object"), reader);
    }

    std::string key;
    if(!ReadStringOrFail<std::string>(key, reader, ctx)) {
        return false;
    }
    const KeyClass cls = classify_key(key);
    if(cls.is_ordinary()) {
        return ctx.withError(invalid_type(Unexpected::Object, ordinaryExpected), reader);
    }
    kind = cls.kind;

    if(!reader.move_to_value(fr)) {
        return ctx.withReaderError(reader);
    }
    reader::TryParseStatus st = read_string_into(reader, payload);
    if(st == reader::TryParseStatus::no_match) {
        if(kind == reserved_names::Kind::ReservedNumber) {
            return ctx.withError(ErrorInfo{ValueError::INVALID_NUMBER, reader.unexpected(), "a number string"}, reader);
        }
        return ctx.withError(ErrorInfo{ValueError::EXPECTED_SOME_VALUE, reader.unexpected(), "raw value text"}, reader);
    } else if(st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    iterStatus = reader.advance_after_value(fr);
    if(iterStatus.status != reader::TryParseStatus::ok) {
        return ctx.withReaderError(reader);
    }
    if(iterStatus.has_value) {
        return ctx.withError(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Object, "a single reserved entry"}, reader);
    }
    return true;
}

template <reader::ReaderLike Reader, class CTX>
constexpr bool NumberFromText(Number & out, std::string_view text, Reader & reader, CTX &ctx) {
    std::optional<Number> n = Number::from_string(text);
    if(!n) {
        return ctx.withError(ErrorInfo{ValueError::INVALID_NUMBER, Unexpected::Str, "a number string"}, reader);
    }
    out = std::move(*n);
    return true;
}

// Re-parses embedded wire text into `obj`; errors of the inner parse become
// the errors of the outer one.
template <class ObjT, reader::ReaderLike Reader, class CTX>
constexpr bool ParseEmbeddedText(ObjT & obj, std::string_view text, Reader & reader, CTX &ctx) {
    YyjsonDocument doc = YyjsonDocument::read(text);
    if(!doc) {
        return ctx.withError(make_error(ValueError::SYNTAX_ERROR, "valid wire text"), reader);
    }
    YyjsonReader inner(doc.root());
    DeserializationContext<typename YyjsonReader::iterator_type> innerCtx(ctx.depth());
    using Meta = options::detail::annotation_meta_getter<ObjT>;
    if(!ParseValue<typename Meta::options>(Meta::getRef(obj), inner, innerCtx)) {
        return ctx.withError(innerCtx.currentError(), reader);
    }
    if(!inner.finish()) {
        return ctx.withError(inner.getError(), reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueEscapeNumber<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    reader::ValueKind kind{};
    if(reader.peek_kind(kind) != reader::TryParseStatus::ok) {
        return ctx.withReaderError(reader);
    }

    reader::TryParseStatus st = reader::TryParseStatus::no_match;
    switch(kind) {
    case reader::ValueKind::Unsigned: {
        std::uint64_t u = 0;
        st = reader.template read_number<std::uint64_t>(u);
        obj = Number(u);
        break;
    }
    case reader::ValueKind::Signed: {
        std::int64_t s = 0;
        st = reader.template read_number<std::int64_t>(s);
        obj = Number(s);
        break;
    }
    case reader::ValueKind::Float: {
        double d = 0;
        st = reader.template read_number<double>(d);
        if(st == reader::TryParseStatus::ok) {
            std::optional<Number> n = Number::from_f64(d);
            if(!n) {
                return ctx.withError(ErrorInfo{ValueError::INVALID_NUMBER, Unexpected::Float, "a finite number"}, reader);
            }
            obj = std::move(*n);
        }
        break;
    }
    case reader::ValueKind::NumberText: {
        std::string text;
        st = reader.read_number_text(text);
        if(st == reader::TryParseStatus::ok) {
            return NumberFromText(obj, text, reader, ctx);
        }
        break;
    }
    case reader::ValueKind::Object: {
        reserved_names::Kind reservedKind{};
        std::string payload;
        if(!ReadReservedEntry(reservedKind, payload, expected_description<ObjT>(), reader, ctx)) {
            return false;
        }
        if(reservedKind != reserved_names::Kind::ReservedNumber) {
            return ctx.withError(invalid_type(Unexpected::Object, expected_description<ObjT>()), reader);
        }
        return NumberFromText(obj, payload, reader, ctx);
    }
    default:
        break;
    }

    if(st == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
    } else if(st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueEscapeRaw<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    static_assert(raw_value_enabled(), "[[[ ScalarFusion ]]] RawValue requires SCALARFUSION_RAW_VALUE");
    reader::TryParseStatus st = reader.read_raw_value(obj.storage());
    if(st == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), expected_description<ObjT>()), reader);
    } else if(st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    return true;
}

template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::ValueIgnored<ObjT>
constexpr bool ParseNonNullValue(ObjT&, Reader & reader, CTX &ctx) {
    if(!reader.skip_value()) {
        return ctx.withReaderError(reader);
    }
    return true;
}

// The "any" request: the value takes whatever shape the reader reports.
template <class Opts, class ObjT, reader::ReaderLike Reader, class CTX>
    requires static_schema::SelfDescribingValue<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Reader & reader, CTX &ctx) {
    reader::ValueKind kind{};
    if(reader.peek_kind(kind) != reader::TryParseStatus::ok) {
        return ctx.withReaderError(reader);
    }

    reader::TryParseStatus st = reader::TryParseStatus::no_match;
    switch(kind) {
    case reader::ValueKind::Null:
        st = reader.start_value_and_try_read_null();
        obj = ObjT(nullptr);
        break;
    case reader::ValueKind::Bool: {
        bool b = false;
        st = reader.read_bool(b);
        obj = ObjT(b);
        break;
    }
    case reader::ValueKind::Unsigned: {
        std::uint64_t u = 0;
        st = reader.template read_number<std::uint64_t>(u);
        obj = ObjT(u);
        break;
    }
    case reader::ValueKind::Signed: {
        std::int64_t s = 0;
        st = reader.template read_number<std::int64_t>(s);
        obj = ObjT(s);
        break;
    }
    case reader::ValueKind::Float: {
        double d = 0;
        st = reader.template read_number<double>(d);
        obj = ObjT(d);
        break;
    }
    case reader::ValueKind::NumberText: {
        std::string text;
        st = reader.read_number_text(text);
        if(st == reader::TryParseStatus::ok) {
            Number n;
            if(!NumberFromText(n, text, reader, ctx)) {
                return false;
            }
            obj = ObjT(std::move(n));
        }
        break;
    }
    case reader::ValueKind::String: {
        std::string s;
        st = read_string_into(reader, s);
        obj = ObjT(std::move(s));
        break;
    }
    case reader::ValueKind::Array:
        if constexpr (ObjT::permits_array) {
            typename Reader::ArrayFrame fr;
            reader::IterationStatus iterStatus;
            if(!BeginArray<ObjT>(fr, iterStatus, reader, ctx)) {
                return false;
            }
            typename ObjT::Array items;
            while(iterStatus.has_value) {
                if(!ParseValue<options::detail::no_options>(items.emplace_back(), reader, ctx)) {
                    return false;
                }
                iterStatus = reader.advance_after_value(fr);
                if (iterStatus.status != reader::TryParseStatus::ok) {
                    return ctx.withReaderError(reader);
                }
            }
            obj = ObjT(std::move(items));
            return true;
        } else {
            return ctx.withError(invalid_type(Unexpected::Seq, "a scalar value"), reader);
        }
    case reader::ValueKind::Object: {
        reserved_names::Kind reservedKind{};
        std::string payload;
        if(!ReadReservedEntry(reservedKind, payload, "non map", reader, ctx)) {
            return false;
        }
        if(reservedKind == reserved_names::Kind::ReservedNumber) {
            Number n;
            if(!NumberFromText(n, payload, reader, ctx)) {
                return false;
            }
            obj = ObjT(std::move(n));
            return true;
        }
        return ParseEmbeddedText(obj, payload, reader, ctx);
    }
    }

    if(st == reader::TryParseStatus::no_match) {
        return ctx.withError(invalid_type(reader.unexpected(), "any valid value"), reader);
    } else if(st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    return true;
}

template <class FieldOptions, class Field, reader::ReaderLike Reader, class CTX>
constexpr bool ParseValueAtDepth(Field & field, Reader & reader, CTX &ctx) {
    // These see null themselves.
    if constexpr (static_schema::SelfDescribingValue<Field>
                  || static_schema::ValueEscapeRaw<Field>
                  || static_schema::ValueIgnored<Field>) {
        return ParseNonNullValue<FieldOptions>(field, reader, ctx);
    } else {
        if(reader::TryParseStatus r = reader.start_value_and_try_read_null(); r == reader::TryParseStatus::ok) {
            if constexpr(static_schema::ValueNullable<Field>) {
                static_schema::setNull(field);
                return true;
            } else if constexpr(static_schema::ValueUnit<Field>) {
                return true;
            } else {
                return ctx.withError(invalid_type(Unexpected::Unit, expected_description<Field>()), reader);
            }
        } else if(r == reader::TryParseStatus::error) {
            return ctx.withReaderError(reader);
        } else {
            if constexpr(static_schema::ValueNullable<Field>) {
                return ParseValueAtDepth<FieldOptions>(static_schema::emplaceRef(field), reader, ctx);
            } else {
                return ParseNonNullValue<FieldOptions>(field, reader, ctx);
            }
        }
    }
}

template <class FieldOptions, class Field, reader::ReaderLike Reader, class CTX>
constexpr bool ParseValue(Field & field, Reader & reader, CTX &ctx) {
    static_assert(static_schema::ParsableValue<Field>,
                  "[[[ ScalarFusion ]]] type is not a supported parsable value model type");

    if(!ctx.enterNested()) {
        return ctx.withError(ErrorInfo{ValueError::INVALID_LENGTH, Unexpected::Other, "nesting depth within limit"}, reader);
    }
    const bool ok = ParseValueAtDepth<FieldOptions>(field, reader, ctx);
    ctx.leaveNested();
    return ok;
}

} // namespace parser_details


template <static_schema::ParsableValue InputObjectT, reader::ReaderLike Reader>
constexpr auto ParseWithReader(InputObjectT & obj, Reader & reader) {
    parser_details::DeserializationContext<typename Reader::iterator_type> ctx;

    using Meta = options::detail::annotation_meta_getter<InputObjectT>;

    if(parser_details::ParseValue<typename Meta::options>(Meta::getRef(obj), reader, ctx)) {
        if(!reader.finish()) {
            ctx.withReaderError(reader);
        }
    }
    return ctx.result();
}

} // namespace ScalarFusion
