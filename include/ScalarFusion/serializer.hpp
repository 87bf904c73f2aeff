#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

#include "errors.hpp"
#include "key_classifier.hpp"
#include "map_key_writer.hpp"
#include "options.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"
#include "value.hpp"
#include "writer_concept.hpp"

namespace ScalarFusion {

template <class Pos>
class SerializeResult {
    ErrorInfo m_error{};
    Pos m_pos{};
public:
    constexpr SerializeResult(ErrorInfo err, Pos pos):
        m_error(err), m_pos(pos)
    {}
    constexpr operator bool() const {
        return m_error.code == ValueError::NO_ERROR;
    }
    constexpr Pos pos() const {
        return m_pos;
    }
    constexpr ValueError error() const {
        return m_error.code;
    }
    constexpr ErrorInfo info() const {
        return m_error;
    }
};


namespace serializer_details {

template <class Pos>
class SerializationContext {
    ErrorInfo error{};
    Pos m_pos{};

public:
    template<class Writer>
    constexpr bool withWriterError(Writer & writer) {
        error = writer.getError();
        if(error.code == ValueError::NO_ERROR) {
            error.code = ValueError::INVALID_STATE;
        }
        m_pos = writer.current();
        return false;
    }

    template<class Writer>
    constexpr bool withError(ErrorInfo err, Writer & writer) {
        error = err;
        m_pos = writer.current();
        return false;
    }

    constexpr ErrorInfo currentError() const {
        return error;
    }

    constexpr SerializeResult<Pos> result() const {
        return SerializeResult<Pos>(error, m_pos);
    }
};

template <class FieldOptions, class Field, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const Field & obj, Writer & writer, CTX &ctx);

template <class Key>
constexpr bool SerializeMapKey(const Key & key, std::string & out, ErrorInfo & err);


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueBool<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    if(!writer.write_bool(obj)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires (static_schema::ValueNumber<ObjT> || static_schema::ValueWideInteger<ObjT>)
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    if(!writer.template write_number<ObjT>(obj)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueChar<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    if(!writer.write_string(&obj, 1, false)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueString<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    if constexpr(static_schema::static_string_traits<ObjT>::is_static) {
        using Tr = static_schema::static_string_traits<ObjT>;
        const char* data = Tr::data(obj);
        std::size_t len = 0;
        while(len < Tr::max_size(obj) && data[len] != '\0') {
            len ++;
        }
        if(!writer.write_string(data, len, false)) {
            return ctx.withWriterError(writer);
        }
    } else {
        if(!writer.write_string(obj.data(), obj.size(), false)) {
            return ctx.withWriterError(writer);
        }
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueBytes<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    const auto* data = reinterpret_cast<const std::uint8_t*>(std::ranges::data(obj));
    if(!writer.write_bytes(data, static_cast<std::size_t>(std::ranges::size(obj)))) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueUnit<ObjT>
constexpr bool SerializeNonNullValue(const ObjT&, Writer & writer, CTX &ctx) {
    if(!writer.write_null()) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueUnitEnum<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    using Variants = typename EnumMeta<ObjT>::Variants;
    const std::size_t index = static_cast<std::size_t>(obj);
    if(index >= Variants::count) {
        return ctx.withError(make_error(ValueError::INVALID_VALUE, "a declared enum variant"), writer);
    }
    if(!writer.write_unit_variant(index, Variants::names[index])) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <std::size_t I, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeVariantCase(const ObjT& obj, Writer & writer, CTX &ctx) {
    using Case = std::variant_alternative_t<I, ObjT>;
    constexpr static_schema::VariantShape shape = static_schema::variant_shape<Case>();
    const std::size_t index = I;

    if constexpr (shape == static_schema::VariantShape::Unit) {
        if(!writer.write_unit_variant(index, Case::name)) {
            return ctx.withWriterError(writer);
        }
        return true;
    } else {
        constexpr writer::VariantKind kind =
            shape == static_schema::VariantShape::Tuple  ? writer::VariantKind::Tuple :
            shape == static_schema::VariantShape::Struct ? writer::VariantKind::Struct :
                                                           writer::VariantKind::Newtype;
        typename Writer::MapFrame fr;
        if(!writer.write_variant_begin(kind, index, Case::name, fr)) {
            return ctx.withWriterError(writer);
        }
        using Meta = options::detail::annotation_meta_getter<typename Case::payload_type>;
        if(!SerializeValue<typename Meta::options>(Meta::getRef(std::get<I>(obj).value), writer, ctx)) {
            return false;
        }
        if(!writer.write_variant_end(fr)) {
            return ctx.withWriterError(writer);
        }
        return true;
    }
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueTaggedEnum<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    bool ok = false;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        ((obj.index() == I ? (ok = SerializeVariantCase<I>(obj, writer, ctx), 0) : 0), ...);
    }(std::make_index_sequence<std::variant_size_v<ObjT>>{});
    return ok;
}

template <std::size_t I, class Frame, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeTupleElement(Frame & fr, const ObjT& obj, Writer & writer, CTX &ctx) {
    if constexpr (I > 0) {
        if(!writer.advance_after_value(fr)) {
            return ctx.withWriterError(writer);
        }
    }
    using Meta = options::detail::annotation_meta_getter<std::tuple_element_t<I, ObjT>>;
    return SerializeValue<typename Meta::options>(Meta::getRef(std::get<I>(obj)), writer, ctx);
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueTuple<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    constexpr std::size_t N = std::tuple_size_v<ObjT>;
    typename Writer::ArrayFrame fr;
    if(!writer.write_array_begin(N, fr)) {
        return ctx.withWriterError(writer);
    }
    bool ok = [&]<std::size_t... I>(std::index_sequence<I...>) {
        return (SerializeTupleElement<I>(fr, obj, writer, ctx) && ...);
    }(std::make_index_sequence<N>{});
    if(!ok) {
        return false;
    }
    if(!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueSequence<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    using FH = static_schema::array_read_cursor<ObjT>;
    FH cursor{obj};

    typename Writer::ArrayFrame fr;
    if(!writer.write_array_begin(cursor.size(), fr)) {
        return ctx.withWriterError(writer);
    }

    stream_read_result res = cursor.read_more();
    while(res != stream_read_result::end) {
        if(res == stream_read_result::error) {
            return ctx.withError(make_error(ValueError::INVALID_STATE, "a readable sequence"), writer);
        }

        using Meta = options::detail::annotation_meta_getter<typename FH::element_type>;
        if(!SerializeValue<typename Meta::options>(Meta::getRef(cursor.get()), writer, ctx)) {
            return false;
        }
        res = cursor.read_more();
        if(res == stream_read_result::value) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
    }
    if(!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueMap<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    using FH = static_schema::map_read_cursor<ObjT>;
    FH cursor{obj};

    typename Writer::MapFrame fr;
    if(!writer.write_map_begin(cursor.size(), fr)) {
        return ctx.withWriterError(writer);
    }

    std::string keyText;
    stream_read_result res = cursor.read_more();
    while(res != stream_read_result::end) {
        if(res == stream_read_result::error) {
            return ctx.withError(make_error(ValueError::INVALID_STATE, "a readable map"), writer);
        }

        ErrorInfo keyError{};
        if(!SerializeMapKey(cursor.get_key(), keyText, keyError)) {
            return ctx.withError(keyError, writer);
        }
        if(!writer.write_string(keyText.data(), keyText.size(), false)) {
            return ctx.withWriterError(writer);
        }
        if(!writer.move_to_value(fr)) {
            return ctx.withWriterError(writer);
        }

        using Meta = options::detail::annotation_meta_getter<typename FH::mapped_type>;
        if(!SerializeValue<typename Meta::options>(Meta::getRef(cursor.get_value()), writer, ctx)) {
            return false;
        }
        res = cursor.read_more();
        if(res == stream_read_result::value) {
            if(!writer.advance_after_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }
    }

    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


template <bool AsArray, std::size_t StructIndex, class Frame, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeOneStructField(Frame & fr, const ObjT& structObj, Writer & writer, CTX &ctx) {
    using Field     = introspection::structureElementTypeByIndex<StructIndex, ObjT>;
    using Meta      = options::detail::annotation_meta_getter<Field>;
    using FieldOpts = options::detail::aggregate_field_opts_getter<ObjT, StructIndex>;

    if constexpr (StructIndex > 0) {
        if(!writer.advance_after_value(fr)) {
            return ctx.withWriterError(writer);
        }
    }
    if constexpr(!AsArray) {
        constexpr std::string_view key = static_schema::FieldsHelper<ObjT>::template fieldName<StructIndex>();
        if(!writer.write_string(key.data(), key.size(), false)) {
            return ctx.withWriterError(writer);
        }
        if(!writer.move_to_value(fr)) {
            return ctx.withWriterError(writer);
        }
    }
    return SerializeValue<FieldOpts>(Meta::getRef(
                                         introspection::getStructElementByIndex<StructIndex>(structObj)
                                         ), writer, ctx);
}

template <bool AsArray, class Frame, class ObjT, writer::WriterLike Writer, class CTX, std::size_t... StructIndex>
constexpr bool SerializeStructFields(Frame &fr, const ObjT& structObj, Writer & writer, CTX &ctx, std::index_sequence<StructIndex...>) {
    return (
        SerializeOneStructField<AsArray, StructIndex>(fr, structObj, writer, ctx)
        && ...
        );
}

// Struct names are not recoverable from C++ types; ordinary structs are
// reported with an empty name.
template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueStruct<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    constexpr std::size_t count = introspection::structureElementsCount<ObjT>;
    typename Writer::MapFrame fr;
    if(!writer.write_struct_begin(std::string_view{}, count, fr)) {
        return ctx.withWriterError(writer);
    }
    if(!SerializeStructFields<false>(fr, obj, writer, ctx, std::make_index_sequence<count>{})) {
        return false;
    }
    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

// tuple struct
template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueStruct<ObjT>
        && Opts::template has_option<options::detail::as_array_tag>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    constexpr std::size_t count = introspection::structureElementsCount<ObjT>;
    typename Writer::ArrayFrame fr;
    if(!writer.write_array_begin(count, fr)) {
        return ctx.withWriterError(writer);
    }
    if(!SerializeStructFields<true>(fr, obj, writer, ctx, std::make_index_sequence<count>{})) {
        return false;
    }
    if(!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

// newtype struct: the wrapper is invisible
template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueStruct<ObjT>
        && Opts::template has_option<options::detail::transparent_tag>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    static_assert(introspection::structureElementsCount<ObjT> == 1,
                  "[[[ ScalarFusion ]]] transparent requires a struct with exactly one field");
    using Field = introspection::structureElementTypeByIndex<0, ObjT>;
    using Meta  = options::detail::annotation_meta_getter<Field>;
    return SerializeValue<options::detail::aggregate_field_opts_getter<ObjT, 0>>(
        Meta::getRef(introspection::getStructElementByIndex<0>(obj)), writer, ctx);
}

// The reserved-name struct protocol shared by the escape hatches: one field,
// keyed by the struct name, holding text.
template <class Writer, class CTX>
constexpr bool SerializeReservedStruct(std::string_view token, std::string_view text, Writer & writer, CTX &ctx) {
    typename Writer::MapFrame fr;
    if(!writer.write_struct_begin(token, 1, fr)) {
        return ctx.withWriterError(writer);
    }
    if(!writer.write_string(token.data(), token.size(), false)) {
        return ctx.withWriterError(writer);
    }
    if(!writer.move_to_value(fr)) {
        return ctx.withWriterError(writer);
    }
    if(!writer.write_string(text.data(), text.size(), false)) {
        return ctx.withWriterError(writer);
    }
    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;
}

// Numbers keep their native width; text numbers go through the reserved
// Number struct.
template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueEscapeNumber<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    bool ok = true;
    switch(obj.repr()) {
    case Number::Repr::PosInt:
        ok = writer.template write_number<std::uint64_t>(*obj.as_u64());
        break;
    case Number::Repr::NegInt:
        ok = writer.template write_number<std::int64_t>(*obj.as_i64());
        break;
    case Number::Repr::Float:
        ok = writer.template write_number<double>(*obj.as_f64());
        break;
    case Number::Repr::Text:
        return SerializeReservedStruct(reserved_names::NUMBER_TOKEN, obj.text(), writer, ctx);
    }
    if(!ok) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ValueEscapeRaw<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    static_assert(raw_value_enabled(), "[[[ ScalarFusion ]]] RawValue requires SCALARFUSION_RAW_VALUE");
    return SerializeReservedStruct(reserved_names::RAW_VALUE_TOKEN, obj.get(), writer, ctx);
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::SelfDescribingValue<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    switch(obj.type()) {
    case ValueType::Null:
        if(!writer.write_null()) {
            return ctx.withWriterError(writer);
        }
        return true;
    case ValueType::Bool:
        if(!writer.write_bool(*obj.as_bool())) {
            return ctx.withWriterError(writer);
        }
        return true;
    case ValueType::Number:
        return SerializeNonNullValue<options::detail::no_options>(*obj.as_number(), writer, ctx);
    case ValueType::String: {
        const std::string_view s = *obj.as_str();
        if(!writer.write_string(s.data(), s.size(), false)) {
            return ctx.withWriterError(writer);
        }
        return true;
    }
    case ValueType::Array:
        if constexpr (ObjT::permits_array) {
            const auto& items = *obj.as_array();
            typename Writer::ArrayFrame fr;
            if(!writer.write_array_begin(items.size(), fr)) {
                return ctx.withWriterError(writer);
            }
            for(std::size_t i = 0; i < items.size(); i++) {
                if(i > 0 && !writer.advance_after_value(fr)) {
                    return ctx.withWriterError(writer);
                }
                if(!SerializeNonNullValue<options::detail::no_options>(items[i], writer, ctx)) {
                    return false;
                }
            }
            if(!writer.write_array_end(fr)) {
                return ctx.withWriterError(writer);
            }
        }
        return true;
    }
    return true;
}

template <class FieldOptions, class Field, writer::WriterLike Writer, class CTX>
constexpr bool SerializeValue(const Field & obj, Writer & writer, CTX &ctx) {
    static_assert(static_schema::SerializableValue<Field>,
                  "[[[ ScalarFusion ]]] type is not a supported serializable value model type");

    if constexpr(static_schema::ValueNullable<Field>) {
        if(static_schema::isNull(obj)) {
            if(!writer.write_null()) {
                return ctx.withWriterError(writer);
            }
            return true;
        }
        if(!writer.write_some()) {
            return ctx.withWriterError(writer);
        }
        return SerializeValue<FieldOptions>(static_schema::getRef(obj), writer, ctx);
    } else {
        return SerializeNonNullValue<FieldOptions>(obj, writer, ctx);
    }
}

template <class Key>
constexpr bool SerializeMapKey(const Key & key, std::string & out, ErrorInfo & err) {
    MapKeyWriter keyWriter(out);
    SerializationContext<typename MapKeyWriter::iterator_type> keyCtx;
    using Meta = options::detail::annotation_meta_getter<Key>;
    if(!SerializeValue<typename Meta::options>(Meta::getRef(key), keyWriter, keyCtx) || !keyWriter.finish()) {
        err = keyCtx.currentError();
        if(err.code == ValueError::NO_ERROR) {
            err = keyWriter.getError();
        }
        return false;
    }
    return true;
}

} // namespace serializer_details


template <static_schema::SerializableValue InputObjectT, writer::WriterLike Writer>
constexpr auto SerializeWithWriter(const InputObjectT & obj, Writer & writer) {
    serializer_details::SerializationContext<typename Writer::iterator_type> ctx;
    using Meta = options::detail::annotation_meta_getter<InputObjectT>;

    if(serializer_details::SerializeValue<typename Meta::options>(Meta::getRef(obj), writer, ctx)) {
        if(!writer.finish()) {
            ctx.withWriterError(writer);
        }
    }
    return ctx.result();
}

// Encodes a value as a map key; only string-like and primitive values qualify.
template <static_schema::SerializableValue KeyT>
constexpr SerializeResult<std::size_t> SerializeKey(const KeyT & key, std::string & out) {
    out.clear();
    MapKeyWriter writer(out);
    return SerializeWithWriter(key, writer);
}

} // namespace ScalarFusion
