#include <ScalarFusion/capabilities.hpp>
#include <ScalarFusion/key_classifier.hpp>

using namespace ScalarFusion;

using reserved_names::Kind;

// ===== Reserved tokens =====
static_assert(reserved_names::NUMBER_TOKEN == "$scalarfusion::private::Number");
static_assert(reserved_names::RAW_VALUE_TOKEN == "$scalarfusion::private::RawValue");

static_assert(classify_key(reserved_names::NUMBER_TOKEN).kind ==
              (arbitrary_precision_enabled() ? Kind::ReservedNumber : Kind::Ordinary));
static_assert(classify_key(reserved_names::RAW_VALUE_TOKEN).kind ==
              (raw_value_enabled() ? Kind::ReservedRawValue : Kind::Ordinary));

// ===== Ordinary keys pass through unchanged =====
static_assert(classify_key("name").is_ordinary());
static_assert(classify_key("name").key == "name");
static_assert(classify_key("").is_ordinary());
static_assert(classify_key("$scalarfusion::private::number").is_ordinary());
static_assert(classify_key("$scalarfusion::private::Number ").is_ordinary());
static_assert(classify_key("$scalarfusion::private::").is_ordinary());

// ===== Struct names share the table =====
static_assert(classify_struct_name("Point") == Kind::Ordinary);
static_assert(classify_struct_name("") == Kind::Ordinary);
static_assert(classify_struct_name(reserved_names::NUMBER_TOKEN) == classify_key(reserved_names::NUMBER_TOKEN).kind);
