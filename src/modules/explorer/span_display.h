// modules/explorer/span_display.h
#ifndef AGENTTRACE_MODULES_EXPLORER_SPAN_DISPLAY_H
#define AGENTTRACE_MODULES_EXPLORER_SPAN_DISPLAY_H

#include "core/types/span_node.h" // 引入 SpanForest
#include "modules/explorer/styled_text.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace agenttrace {

enum class DetailTab : uint8_t {
    OVERVIEW,
    PROMPT,
    RESPONSE,
    ATTRIBUTES,
    TIMING
};

inline constexpr int kDetailTabCount = 5;

const char* to_string(DetailTab tab);

// Display label: step name for workflow steps, the mode for workflow roots,
// "provider [model]" for LLM spans, otherwise the raw span name.
std::string friendly_name(const Span& span);

// "workflow" | "agent" | "llm" | "tool" | "other", by name substring.
std::string span_kind(const Span& span);
Style span_kind_style(const Span& span);

bool is_workflow_step_span(const Span& span);

// Drops one leading "agk.", "llm." and "workflow." prefix, in that order.
std::string short_attribute_key(std::string_view key);

// "OK" for unset/ok codes, otherwise the code itself.
std::string status_text(const SpanStatus& status);

// Case-insensitive match against name, friendly name, attribute keys and
// values, status code and description. An empty query matches nothing.
bool span_matches_query(const Span& span, std::string_view query);

// Content of one detail tab for `index`.
StyledLines detail_tab_lines(const SpanForest& forest, NodeIndex index, DetailTab tab, std::size_t width);

// Full-screen detail page: overview, prompt/response content and the
// attributes grouped by namespace.
StyledLines detail_page_lines(const SpanForest& forest, NodeIndex index, std::size_t width);

// Full-screen detail view: the detail page on the overview tab, the tab
// content otherwise.
StyledLines detail_view_lines(const SpanForest& forest, NodeIndex index, DetailTab tab, std::size_t width);

// Side panel: identity, status, timing, resources, error and attributes.
StyledLines metadata_lines(const SpanForest& forest, NodeIndex index, double cost_per_token);

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_EXPLORER_SPAN_DISPLAY_H
