#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace ScalarFusion {

// Already-encoded wire text carried through conversion untouched.
// Serializes as the reserved raw-value struct; deserializes by capturing the
// current node as text.
class RawValue {
public:
    RawValue() : text_("null") {}
    explicit RawValue(std::string text) : text_(std::move(text)) {}

    std::string_view get() const { return text_; }
    std::string& storage() { return text_; }

    friend bool operator==(const RawValue&, const RawValue&) = default;

private:
    std::string text_;
};

} // namespace ScalarFusion
