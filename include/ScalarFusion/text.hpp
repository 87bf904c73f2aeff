#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "parse_result.hpp"
#include "parser.hpp"
#include "serializer.hpp"
#include "static_schema.hpp"
#include "yyjson.hpp"

namespace ScalarFusion {

// Wire text through yyjson. Positions are byte offsets into the text: the
// output size after serialization, the syntax error offset after a failed
// read.

template <static_schema::SerializableValue InputObjectT>
SerializeResult<std::size_t> Serialize(const InputObjectT & obj, std::string & out) {
    YyjsonMutDocument doc;
    YyjsonWriter writer(doc.get());
    auto res = SerializeWithWriter(obj, writer);
    if (!res) {
        return SerializeResult<std::size_t>(res.info(), 0);
    }
    if (!doc.write(out)) {
        return SerializeResult<std::size_t>(make_error(ValueError::ALLOCATION_FAILED), 0);
    }
    return SerializeResult<std::size_t>(res.info(), out.size());
}

template <static_schema::ParsableValue InputObjectT>
ParseResult<std::size_t> Parse(InputObjectT & obj, std::string_view text) {
    YyjsonDocument doc = YyjsonDocument::read(text);
    if (!doc) {
        return ParseResult<std::size_t>(make_error(ValueError::SYNTAX_ERROR, "valid wire text"), doc.error_position());
    }
    YyjsonReader reader(doc.root());
    auto res = ParseWithReader(obj, reader);
    return ParseResult<std::size_t>(res.info(), res ? text.size() : 0);
}

} // namespace ScalarFusion
