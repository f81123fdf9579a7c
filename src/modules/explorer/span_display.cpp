// modules/explorer/span_display.cpp
#include "modules/explorer/span_display.h"
#include "common/utils/string_utils.h"
#include <algorithm>
#include <cstdio>
#include <map>
#include <string>
#include <vector>

namespace agenttrace {

namespace {

constexpr std::size_t kMinWrapWidth = 20;
constexpr std::size_t kContentPreviewLimit = 500;

std::string value_of(const Span& span, std::string_view key) {
    const AttributeValue* value = span.attribute(key);
    return value ? attribute_to_string(*value) : std::string();
}

bool has_attribute(const Span& span, std::string_view key) {
    return span.attribute(key) != nullptr;
}

StyledLine field(std::string_view label, std::size_t label_width, std::string value, Style value_style = Style::NORMAL) {
    StyledLine line;
    line.add(pad_right(label, label_width), Style::ATTR_KEY);
    line.add(" ");
    line.add(std::move(value), value_style);
    return line;
}

void add_text(StyledLines& out, std::string_view text, std::size_t width, Style style = Style::NORMAL) {
    for (auto& row : wrap_text(text, std::max(width, kMinWrapWidth))) {
        out.emplace_back(std::move(row), style);
    }
}

void add_section(StyledLines& out, std::string title) {
    out.emplace_back(std::move(title), Style::SECTION);
}

Style status_style(const SpanStatus& status) {
    return is_error_status(status) ? Style::ERROR : Style::SUCCESS;
}

std::string ms(int64_t value) {
    return std::to_string(value) + "ms";
}

// The node's own parent id, or "-" when it is a root.
std::string parent_id_text(const SpanForest& forest, const SpanNode& node) {
    if (!node.parent) return "-";
    return forest.nodes[*node.parent].span.span_id;
}

std::string short_id(const std::string& id) {
    if (id.size() <= 8) return id;
    return id.substr(0, 8) + "...";
}

StyledLines overview_tab(const SpanForest& forest, const SpanNode& node) {
    const Span& span = node.span;
    StyledLines out;
    add_section(out, "Overview");
    out.emplace_back();
    out.push_back(field("Name:", 12, friendly_name(span)));
    out.push_back(field("Type:", 12, span_kind(span), span_kind_style(span)));
    out.push_back(field("Duration:", 12, ms(node.duration_ms), Style::DURATION));
    out.push_back(field("Status:", 12, status_text(span.status), status_style(span.status)));
    if (!span.status.description.empty()) {
        out.push_back(field("Message:", 12, span.status.description));
    }
    out.push_back(field("Span ID:", 12, span.span_id, Style::MUTED));
    out.push_back(field("Parent ID:", 12, parent_id_text(forest, node), Style::MUTED));

    if (has_attribute(span, "llm.usage.total_tokens")) {
        out.emplace_back();
        add_section(out, "Resource Usage");
        out.push_back(field("Tokens:", 12, value_of(span, "llm.usage.total_tokens")));
        if (has_attribute(span, "llm.usage.prompt_tokens")) {
            out.push_back(field("  Prompt:", 12, value_of(span, "llm.usage.prompt_tokens")));
        }
        if (has_attribute(span, "llm.usage.completion_tokens")) {
            out.push_back(field("  Response:", 12, value_of(span, "llm.usage.completion_tokens")));
        }
    }
    if (has_attribute(span, "agk.llm.model")) {
        out.push_back(field("Model:", 12, value_of(span, "agk.llm.model")));
    }
    return out;
}

struct TextSource {
    const char* key;
    const char* title;
};

StyledLines text_tab(const Span& span, const std::vector<TextSource>& sources, const char* empty_message,
                     std::size_t width) {
    StyledLines out;
    for (const auto& source : sources) {
        if (!has_attribute(span, source.key)) continue;
        add_section(out, source.title);
        out.emplace_back();
        add_text(out, value_of(span, source.key), width);
        out.emplace_back();
    }
    if (out.empty()) out.emplace_back(empty_message, Style::MUTED);
    return out;
}

StyledLines prompt_tab(const Span& span, std::size_t width) {
    return text_tab(span,
                    {{"agk.prompt.system", "System Prompt"},
                     {"agk.prompt.user", "User Prompt"},
                     {"llm.request.messages", "Messages"}},
                    "No prompt data available for this span", width);
}

StyledLines response_tab(const Span& span, std::size_t width) {
    return text_tab(span,
                    {{"agk.llm.response", "Response Text"},
                     {"agk.tool.result", "Tool Result"},
                     {"llm.response.finish_reason", "Finish Reason"}},
                    "No response data available for this span", width);
}

StyledLines attributes_tab(const Span& span) {
    StyledLines out;
    add_section(out, "All Attributes");
    out.emplace_back();
    auto attrs = span.attribute_map();
    if (attrs.empty()) {
        out.emplace_back("No attributes available", Style::MUTED);
        return out;
    }
    for (const auto& [key, value] : attrs) {
        StyledLine line;
        line.add(pad_right(short_attribute_key(key) + ":", 30), Style::ATTR_KEY);
        line.add(" ");
        line.add(attribute_to_string(value), Style::ATTR_VALUE);
        out.push_back(std::move(line));
    }
    return out;
}

StyledLines timing_tab(const SpanForest& forest, const SpanNode& node) {
    StyledLines out;
    add_section(out, "Timing Details");
    out.emplace_back();
    out.push_back(field("Duration:", 15, ms(node.duration_ms), Style::DURATION));
    out.push_back(field("Start Time:", 15, node.span.start_time));
    out.push_back(field("End Time:", 15, node.span.end_time));

    if (!node.children.empty()) {
        out.emplace_back();
        add_section(out, "Child Spans");
        out.emplace_back();
        int64_t child_total = 0;
        for (NodeIndex child_index : node.children) {
            const SpanNode& child = forest.nodes[child_index];
            child_total += child.duration_ms;
            double pct = node.duration_ms > 0
                             ? static_cast<double>(child.duration_ms) * 100.0 / static_cast<double>(node.duration_ms)
                             : 0.0;
            char figures[32];
            std::snprintf(figures, sizeof(figures), " %6lldms %6.1f%% ",
                          static_cast<long long>(child.duration_ms), pct);
            auto bar_width = static_cast<std::size_t>(std::clamp(pct / 2.0, 0.0, 50.0));
            StyledLine line;
            line.add(pad_right(friendly_name(child.span), 30));
            line.add(figures);
            line.add(repeat("█", bar_width), Style::DURATION);
            out.push_back(std::move(line));
        }
        out.emplace_back();
        out.push_back(field("Total Child Time:", 30, ms(child_total)));
        if (node.duration_ms - child_total > 0) {
            out.push_back(field("Self Time:", 30, ms(node.duration_ms - child_total)));
        }
    }

    if (has_attribute(node.span, "llm.time_to_first_token")) {
        out.emplace_back();
        add_section(out, "Performance Metrics");
        out.emplace_back();
        out.push_back(field("Time to First Token:", 25, value_of(node.span, "llm.time_to_first_token")));
    }
    return out;
}

void attribute_group(StyledLines& out, const char* title, const std::map<std::string, AttributeValue>& group) {
    if (group.empty()) return;
    add_section(out, title);
    for (const auto& [key, value] : group) {
        auto dot = key.rfind('.');
        std::string label = dot == std::string::npos ? key : key.substr(dot + 1);
        StyledLine line;
        line.add("  " + pad_right(label, 20), Style::ATTR_KEY);
        line.add(attribute_to_string(value), Style::ATTR_VALUE);
        out.push_back(std::move(line));
    }
}

} // namespace

const char* to_string(DetailTab tab) {
    switch (tab) {
        case DetailTab::OVERVIEW: return "Overview";
        case DetailTab::PROMPT: return "Prompt";
        case DetailTab::RESPONSE: return "Response";
        case DetailTab::ATTRIBUTES: return "Attributes";
        case DetailTab::TIMING: return "Timing";
    }
    return "Overview";
}

std::string friendly_name(const Span& span) {
    std::string name = to_lower(span.name);

    if (name.find("workflow.step") != std::string::npos) {
        if (const auto* step = span.attribute("agk.workflow.step_name")) {
            return "🔹 " + attribute_to_string(*step);
        }
    }
    if (name.find("agk.workflow.sequential") != std::string::npos) return "📋 Sequential Workflow";
    if (name.find("agk.workflow.parallel") != std::string::npos) return "⚡ Parallel Workflow";
    if (name.find("agk.workflow.dag") != std::string::npos) return "🔀 DAG Workflow";
    if (name.find("agk.workflow.loop") != std::string::npos) return "🔄 Loop Workflow";

    const AttributeValue* model = span.attribute("agk.llm.model");
    if (name.find("llm") != std::string::npos && model) {
        std::string provider = "llm";
        if (const auto* p = span.attribute("agk.llm.provider")) provider = attribute_to_string(*p);
        return "🤖 " + provider + " [" + attribute_to_string(*model) + "]";
    }
    if (name.find("agk.agent.run") != std::string::npos) {
        if (model) return "🤖 Agent [" + attribute_to_string(*model) + "]";
        return "🤖 Agent";
    }
    return span.name;
}

std::string span_kind(const Span& span) {
    std::string name = to_lower(span.name);
    if (name.find("workflow") != std::string::npos) return "workflow";
    if (name.find("agent") != std::string::npos) return "agent";
    if (name.find("llm") != std::string::npos) return "llm";
    if (name.find("tool") != std::string::npos || name.find("mcp") != std::string::npos) return "tool";
    return "other";
}

Style span_kind_style(const Span& span) {
    std::string kind = span_kind(span);
    if (kind == "workflow") return Style::SPAN_WORKFLOW;
    if (kind == "agent") return Style::SPAN_AGENT;
    if (kind == "llm") return Style::SPAN_LLM;
    if (kind == "tool") return Style::SPAN_TOOL;
    return Style::NORMAL;
}

bool is_workflow_step_span(const Span& span) {
    return contains_ci(span.name, "workflow.step");
}

std::string short_attribute_key(std::string_view key) {
    for (std::string_view prefix : {"agk.", "llm.", "workflow."}) {
        if (key.starts_with(prefix)) key.remove_prefix(prefix.size());
    }
    return std::string(key);
}

std::string status_text(const SpanStatus& status) {
    return is_error_status(status) ? status.code : "OK";
}

bool span_matches_query(const Span& span, std::string_view query) {
    if (query.empty()) return false;
    if (contains_ci(span.name, query) || contains_ci(friendly_name(span), query)) return true;
    // Overwritten duplicate keys no longer count.
    for (const auto& [key, value] : span.attribute_map()) {
        if (contains_ci(key, query) || contains_ci(attribute_to_string(value), query)) return true;
    }
    return contains_ci(span.status.code, query) || contains_ci(span.status.description, query);
}

StyledLines detail_tab_lines(const SpanForest& forest, NodeIndex index, DetailTab tab, std::size_t width) {
    if (index >= forest.size()) return {};
    const SpanNode& node = forest.nodes[index];
    switch (tab) {
        case DetailTab::OVERVIEW: return overview_tab(forest, node);
        case DetailTab::PROMPT: return prompt_tab(node.span, width);
        case DetailTab::RESPONSE: return response_tab(node.span, width);
        case DetailTab::ATTRIBUTES: return attributes_tab(node.span);
        case DetailTab::TIMING: return timing_tab(forest, node);
    }
    return {};
}

StyledLines detail_page_lines(const SpanForest& forest, NodeIndex index, std::size_t width) {
    if (index >= forest.size()) return {};
    const SpanNode& node = forest.nodes[index];
    const Span& span = node.span;
    StyledLines out;

    add_section(out, "Overview");
    out.push_back(field("Duration:", 15, ms(node.duration_ms), Style::DURATION));
    out.push_back(field("Status:", 15, status_text(span.status), status_style(span.status)));
    out.push_back(field("Span ID:", 15, span.span_id, Style::MUTED));
    out.push_back(field("Parent ID:", 15, parent_id_text(forest, node), Style::MUTED));

    static const TextSource kContent[] = {
        {"agk.prompt.user", "📝 User Prompt"},
        {"agk.prompt.system", "🖥️ System Prompt"},
        {"agk.llm.response", "🤖 LLM Response"},
        {"agk.tool.arguments", "📥 Tool Arguments"},
        {"agk.tool.result", "📤 Tool Result"},
    };
    bool content_header = false;
    for (const auto& source : kContent) {
        if (!has_attribute(span, source.key)) continue;
        if (!content_header) {
            out.emplace_back();
            add_section(out, "Content (Detailed Trace)");
            content_header = true;
        }
        std::string text = value_of(span, source.key);
        out.emplace_back();
        out.emplace_back(source.title, Style::ATTR_KEY);
        out.emplace_back(repeat("─", 40), Style::MUTED);
        if (display_width(text) > kContentPreviewLimit) {
            add_text(out, truncate_utf8(text, kContentPreviewLimit), width);
            out.emplace_back("[truncated]", Style::MUTED);
        } else {
            add_text(out, text, width);
        }
    }
    out.emplace_back();

    auto attrs = span.attribute_map();
    if (attrs.empty()) {
        add_section(out, "Attributes");
        out.emplace_back("  No attributes available", Style::MUTED);
        return out;
    }
    std::map<std::string, AttributeValue> llm, workflow, http, other;
    for (auto& [key, value] : attrs) {
        if (key.starts_with("agk.llm.") || key.starts_with("llm.")) {
            llm.emplace(key, value);
        } else if (key.starts_with("agk.workflow.") || key.starts_with("workflow.")) {
            workflow.emplace(key, value);
        } else if (key.starts_with("http.")) {
            http.emplace(key, value);
        } else {
            other.emplace(key, value);
        }
    }
    attribute_group(out, "LLM Configuration", llm);
    attribute_group(out, "Workflow Context", workflow);
    attribute_group(out, "HTTP Details", http);
    attribute_group(out, "Metadata", other);
    return out;
}

StyledLines detail_view_lines(const SpanForest& forest, NodeIndex index, DetailTab tab, std::size_t width) {
    if (tab == DetailTab::OVERVIEW) return detail_page_lines(forest, index, width);
    return detail_tab_lines(forest, index, tab, width);
}

StyledLines metadata_lines(const SpanForest& forest, NodeIndex index, double cost_per_token) {
    if (index >= forest.size()) return {};
    const SpanNode& node = forest.nodes[index];
    const Span& span = node.span;
    StyledLines out;

    add_section(out, "Identity");
    out.push_back(field("Type:", 12, span_kind(span), span_kind_style(span)));
    out.push_back(field("Span ID:", 12, short_id(span.span_id), Style::MUTED));
    if (node.parent) {
        out.push_back(field("Parent:", 12, short_id(forest.nodes[*node.parent].span.span_id), Style::MUTED));
    }
    out.emplace_back();

    add_section(out, "Status");
    out.push_back(field("Status:", 12, status_text(span.status), status_style(span.status)));
    out.emplace_back();

    add_section(out, "Timing");
    out.push_back(field("Duration:", 12, ms(node.duration_ms), Style::DURATION));
    out.push_back(field("Start:", 12, span.start_time, Style::MUTED));
    out.emplace_back();

    if (const auto* tokens = span.attribute("llm.usage.total_tokens")) {
        add_section(out, "Resources");
        out.push_back(field("Tokens:", 12, attribute_to_string(*tokens)));
        if (auto count = attribute_as_number(*tokens); count && *count > 0) {
            char cost[32];
            std::snprintf(cost, sizeof(cost), "$%.6f", *count * cost_per_token);
            out.push_back(field("Est. Cost:", 12, cost, Style::WARNING));
        }
        out.emplace_back();
    }

    if (is_error_status(span.status)) {
        add_section(out, "Error");
        out.emplace_back(span.status.description.empty() ? span.status.code : span.status.description, Style::ERROR);
        out.emplace_back();
    }

    add_section(out, "All Attributes");
    for (const auto& [key, value] : span.attribute_map()) {
        StyledLine line;
        line.add(pad_right(short_attribute_key(key) + ":", 20), Style::ATTR_KEY);
        line.add(" ");
        line.add(attribute_to_string(value), Style::ATTR_VALUE);
        out.push_back(std::move(line));
    }
    return out;
}

} // namespace agenttrace
