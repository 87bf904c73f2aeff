#include <ScalarFusion/static_schema.hpp>
#include <ScalarFusion/value.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <variant>
#include <vector>

#include "../../test_model.hpp"

using namespace ScalarFusion;
using namespace scalar_fusion_test_models;

// ===== Primitives =====
static_assert(static_schema::ValueBool<bool>);
static_assert(static_schema::ValueNumber<int>);
static_assert(static_schema::ValueNumber<std::int8_t>);
static_assert(static_schema::ValueNumber<std::uint64_t>);
static_assert(static_schema::ValueNumber<float>);
static_assert(static_schema::ValueNumber<double>);
static_assert(static_schema::ValueWideInteger<int128_t>);
static_assert(static_schema::ValueWideInteger<uint128_t>);
static_assert(static_schema::ValueChar<char>);
static_assert(!static_schema::ValueNumber<char>);
static_assert(!static_schema::ValueNumber<bool>);

// ===== Strings and bytes =====
static_assert(static_schema::ValueString<std::string>);
static_assert(static_schema::ValueString<std::string_view>);
static_assert(static_schema::ValueString<SmallStr>);
static_assert(static_schema::ValueBytes<std::vector<std::byte>>);
static_assert(static_schema::ValueBytes<std::array<std::byte, 4>>);
static_assert(!static_schema::ValueSequence<std::string>);

// ===== Unit and options =====
static_assert(static_schema::ValueUnit<std::monostate>);
static_assert(static_schema::ValueUnit<std::nullptr_t>);
static_assert(static_schema::ValueUnit<Unit>);
static_assert(static_schema::ValueNullable<std::optional<int>>);
static_assert(static_schema::ValueNullable<std::unique_ptr<std::string>>);
static_assert(static_schema::ValueNullable<Annotated<std::optional<int>>>);

// ===== Enums =====
static_assert(static_schema::ValueUnitEnum<Color>);
static_assert(static_schema::ValueTaggedEnum<Shape>);
static_assert(!static_schema::ValueTaggedEnum<std::variant<int, bool>>);
static_assert(static_schema::variant_shape<VariantCase<"Empty">>() == static_schema::VariantShape::Unit);
static_assert(static_schema::variant_shape<VariantCase<"Circle", double>>() == static_schema::VariantShape::Newtype);
static_assert(static_schema::variant_shape<VariantCase<"Pair", std::tuple<int, int>>>() == static_schema::VariantShape::Tuple);
static_assert(static_schema::variant_shape<VariantCase<"Line", Segment>>() == static_schema::VariantShape::Struct);
static_assert(static_schema::tagged_enum_traits<Shape>::names[3] == "Line");

// ===== Compounds =====
static_assert(static_schema::ValueTuple<std::tuple<int, std::string>>);
static_assert(static_schema::ValueTuple<std::pair<int, int>>);
static_assert(static_schema::ValueSequence<std::vector<int>>);
static_assert(static_schema::ValueSequence<std::array<int, 3>>);
static_assert(static_schema::ValueMap<Counts>);
static_assert(static_schema::ValueStruct<Point>);
static_assert(static_schema::ValueStruct<PointArr>);
static_assert(static_schema::ValueStruct<Sensor>);

// ===== Escape hatches and values =====
static_assert(static_schema::ValueEscapeNumber<Number>);
static_assert(static_schema::ValueEscapeRaw<RawValue>);
static_assert(static_schema::ValueIgnored<IgnoredAny>);
static_assert(static_schema::SelfDescribingValue<ScalarValue>);
static_assert(static_schema::SelfDescribingValue<ScalarValueOrArray>);

// ===== Serializable / parsable =====
static_assert(static_schema::SerializableValue<Sensor>);
static_assert(static_schema::ParsableValue<Sensor>);
static_assert(static_schema::ParsableValue<IgnoredAny>);
static_assert(!static_schema::SerializableValue<IgnoredAny>);
static_assert(!static_schema::SerializableValue<int*>);
static_assert(!static_schema::ParsableValue<int*>);

// ===== Field names =====
static_assert(static_schema::FieldsHelper<Sensor>::fieldNames[1] == "hz");
static_assert(static_schema::FieldsHelper<Sensor>::indexOf("offset") == 2);
static_assert(static_schema::FieldsHelper<Sensor>::indexOf("rate") == 4);
