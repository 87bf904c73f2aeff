#pragma once

#include <cstddef>
#include <utility>

#include "parse_result.hpp"
#include "parser.hpp"
#include "serializer.hpp"
#include "static_schema.hpp"
#include "value.hpp"
#include "value_reader.hpp"
#include "value_writer.hpp"

namespace ScalarFusion {

// Typed object -> value tree. The position is the number of nodes built.
template <static_schema::SerializableValue InputObjectT, bool PermitsArray>
SerializeResult<std::size_t> ToValue(const InputObjectT & obj, BasicValue<PermitsArray> & out) {
    BasicValue<PermitsArray> built;
    ValueWriter<BasicValue<PermitsArray>> writer(built);
    auto res = SerializeWithWriter(obj, writer);
    if (res) {
        out = std::move(built);
    }
    return res;
}

// Value tree -> typed object, reading the tree in place.
template <static_schema::ParsableValue InputObjectT, bool PermitsArray>
auto FromValue(InputObjectT & obj, const BasicValue<PermitsArray> & value) {
    ValueReader<const BasicValue<PermitsArray>> reader(value);
    return ParseWithReader(obj, reader);
}

// Value tree -> typed object, consuming the tree.
template <static_schema::ParsableValue InputObjectT, bool PermitsArray>
auto FromValue(InputObjectT & obj, BasicValue<PermitsArray> && value) {
    ValueReader<BasicValue<PermitsArray>> reader(std::move(value));
    return ParseWithReader(obj, reader);
}

} // namespace ScalarFusion
