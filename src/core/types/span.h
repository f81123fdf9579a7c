#ifndef AGENTTRACE_CORE_TYPES_SPAN_H
#define AGENTTRACE_CORE_TYPES_SPAN_H

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace agenttrace {

// 属性值：字符串 / 数字 / 布尔
using AttributeValue = std::variant<std::string, double, bool>;

struct Attribute {
    std::string key;
    AttributeValue value;
};

struct SpanStatus {
    std::string code;        // "", "Unset", "Ok", "Error", ...
    std::string description;
};

// Parent id used by exporters for "no parent".
inline constexpr std::string_view kRootParentSentinel = "0000000000000000";

// One record of the trace log. Immutable once parsed.
struct Span {
    std::string name;
    std::string start_time; // raw RFC3339, may be empty or unparseable
    std::string end_time;
    std::string trace_id;
    std::string span_id;
    std::string parent_span_id;
    std::vector<Attribute> attributes; // file order, duplicates kept
    SpanStatus status;

    // Last occurrence of `key`, or nullptr.
    const AttributeValue* attribute(std::string_view key) const;

    // Flattened view; duplicate keys resolve last-wins.
    std::map<std::string, AttributeValue> attribute_map() const;
};

bool is_root_parent_id(std::string_view parent_span_id);

// Code is non-empty and not one of "", "Unset", "Ok".
bool is_error_status(const SpanStatus& status);

// Integral numbers print without a fraction ("120"), others in shortest form.
std::string attribute_to_string(const AttributeValue& value);

std::optional<double> attribute_as_number(const AttributeValue& value);
std::optional<std::string> attribute_as_string(const AttributeValue& value);
nlohmann::json attribute_to_json(const AttributeValue& value);

} // namespace agenttrace

#endif // AGENTTRACE_CORE_TYPES_SPAN_H
