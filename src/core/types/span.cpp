// core/types/span.cpp
#include "core/types/span.h"
#include <charconv>
#include <cmath>

namespace agenttrace {

const AttributeValue* Span::attribute(std::string_view key) const {
    for (auto it = attributes.rbegin(); it != attributes.rend(); ++it) {
        if (it->key == key) return &it->value;
    }
    return nullptr;
}

std::map<std::string, AttributeValue> Span::attribute_map() const {
    std::map<std::string, AttributeValue> out;
    for (const auto& attr : attributes) {
        out[attr.key] = attr.value; // last-wins
    }
    return out;
}

bool is_root_parent_id(std::string_view parent_span_id) {
    return parent_span_id.empty() || parent_span_id == kRootParentSentinel;
}

bool is_error_status(const SpanStatus& status) {
    const auto& code = status.code;
    return !(code.empty() || code == "Unset" || code == "Ok");
}

std::string attribute_to_string(const AttributeValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* b = std::get_if<bool>(&value)) return *b ? "true" : "false";

    double d = std::get<double>(value);
    if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 1e15) {
        return std::to_string(static_cast<long long>(d));
    }
    char buf[64];
    auto result = std::to_chars(buf, buf + sizeof(buf), d);
    return std::string(buf, result.ptr);
}

std::optional<double> attribute_as_number(const AttributeValue& value) {
    if (const auto* d = std::get_if<double>(&value)) return *d;
    return std::nullopt;
}

std::optional<std::string> attribute_as_string(const AttributeValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    return std::nullopt;
}

nlohmann::json attribute_to_json(const AttributeValue& value) {
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    if (const auto* b = std::get_if<bool>(&value)) return *b;
    double d = std::get<double>(value);
    if (std::isfinite(d) && d == std::trunc(d) && std::fabs(d) < 1e15) {
        return static_cast<int64_t>(d);
    }
    return d;
}

} // namespace agenttrace
