// modules/diagram/mermaid_generator.cpp
#include "modules/diagram/mermaid_generator.h"
#include "common/utils/number_utils.h"
#include "common/utils/string_utils.h"
#include "common/utils/template_renderer.h"
#include "core/types/span.h"
#include <algorithm>
#include <charconv>
#include <deque>
#include <map>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace agenttrace {

namespace {

const char* event_icon(EventType type) {
    switch (type) {
        case EventType::THOUGHT: return "💭";
        case EventType::TOOL_CALL: return "🔧";
        case EventType::OBSERVATION: return "👁";
        case EventType::LLM_CALL: return "🤖";
        case EventType::DECISION: return "⚡";
    }
    return "○";
}

struct NodeStyle {
    const char* open;
    const char* close;
    const char* fill;
    const char* stroke;
};

NodeStyle node_style(EventType type) {
    switch (type) {
        case EventType::THOUGHT: return {"([\"", "\"])", "#e1f5fe", "#01579b"};     // stadium
        case EventType::TOOL_CALL: return {"[[\"", "\"]]", "#e8f5e9", "#1b5e20"};   // subroutine
        case EventType::OBSERVATION: return {"[/\"", "\"/]", "#fff3e0", "#e65100"}; // parallelogram
        case EventType::LLM_CALL: return {"{\"", "\"}", "#f3e5f5", "#4a148c"};      // rhombus
        case EventType::DECISION: return {"{{\"", "\"}}", "#fce4ec", "#880e4f"};    // hexagon
    }
    return {"[\"", "\"]", "#ffffff", "#333333"};
}

std::string metadata_string(const TraceEvent& event, const char* key) {
    auto it = event.metadata.find(key);
    if (it == event.metadata.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

// Mermaid labels are double-quoted; quotes are written as entity codes.
std::string escape_label(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"') {
            out += "#quot;";
        } else if (c == '\n' || c == '\r') {
            out += ' ';
        } else {
            out += c;
        }
    }
    return out;
}

bool earlier(const TraceEvent& a, const TraceEvent& b) {
    if (a.timestamp.has_value() != b.timestamp.has_value()) return !a.timestamp.has_value();
    return a.timestamp.has_value() && *a.timestamp < *b.timestamp;
}

// Parent/child index over the events of one TraceObject.
struct EventGraph {
    std::unordered_map<std::string, std::size_t> index_by_span;
    std::unordered_map<std::string, std::vector<std::size_t>> children_by_span;
    std::vector<std::size_t> parents; // event indices with children, ascending

    explicit EventGraph(const TraceObject& obj) {
        for (std::size_t i = 0; i < obj.events.size(); ++i) {
            const auto& event = obj.events[i];
            index_by_span.emplace(event.span_id, i); // first occurrence wins
            if (!is_root_parent_id(event.parent_id)) {
                children_by_span[event.parent_id].push_back(i);
            }
        }
        for (const auto& [span_id, children] : children_by_span) {
            auto it = index_by_span.find(span_id);
            if (it != index_by_span.end()) parents.push_back(it->second);
        }
        std::sort(parents.begin(), parents.end());
    }

    const std::vector<std::size_t>& children_of(std::size_t index, const TraceObject& obj) const {
        static const std::vector<std::size_t> kNone;
        auto it = children_by_span.find(obj.events[index].span_id);
        return it == children_by_span.end() ? kNone : it->second;
    }
};

class EdgeBuilder {
public:
    void add(std::size_t from, std::size_t to) {
        if (from == to) return;
        if (seen_.insert({from, to}).second) edges_.emplace_back(from, to);
    }

    void chain(std::size_t head, const std::vector<std::size_t>& rest) {
        std::size_t prev = head;
        for (auto idx : rest) {
            add(prev, idx);
            prev = idx;
        }
    }

    std::vector<MermaidEdge> take() { return std::move(edges_); }

private:
    std::set<MermaidEdge> seen_;
    std::vector<MermaidEdge> edges_;
};

// Non-step descendants of `step`, breadth-first; nested step and sequential
// events are neither collected nor descended into.
std::vector<std::size_t> collect_step_descendants(std::size_t step, const TraceObject& obj, const EventGraph& graph) {
    std::vector<std::size_t> result;
    std::unordered_set<std::size_t> visited{step};
    std::deque<std::size_t> queue{step};
    while (!queue.empty()) {
        std::size_t current = queue.front();
        queue.pop_front();
        for (auto child : graph.children_of(current, obj)) {
            if (!visited.insert(child).second) continue;
            const auto& event = obj.events[child];
            if (is_workflow_step(event) || is_workflow_sequential(event)) continue;
            result.push_back(child);
            queue.push_back(child);
        }
    }
    return result;
}

std::vector<std::size_t> ordered_steps(const std::vector<std::size_t>& children, const TraceObject& obj) {
    std::vector<std::size_t> steps;
    for (auto child : children) {
        if (is_workflow_step(obj.events[child])) steps.push_back(child);
    }
    std::stable_sort(steps.begin(), steps.end(), [&obj](std::size_t a, std::size_t b) {
        auto ia = step_index(obj.events[a]);
        auto ib = step_index(obj.events[b]);
        if (ia && ib) return *ia < *ib;
        if (ia.has_value() != ib.has_value()) return ia.has_value();
        return earlier(obj.events[a], obj.events[b]);
    });
    return steps;
}

const char* kDocumentTemplate = R"(# Agent Trace: {{ run_id }}

- Events: {{ total_events }}
- Duration: {{ duration_ms }}ms
{% if exists("command") %}- Command: {{ command }}
{% endif %}
## Execution Flow

{{ diagram }})";

} // namespace

bool is_workflow_sequential(const TraceEvent& event) {
    return contains_ci(event.span_name, "workflow.sequential");
}

bool is_workflow_step(const TraceEvent& event) {
    if (contains_ci(event.span_name, "workflow.step")) return true;
    return !metadata_string(event, "agk.workflow.step_name").empty();
}

std::optional<int> step_index(const TraceEvent& event) {
    auto it = event.metadata.find("agk.workflow.step_index");
    if (it == event.metadata.end()) return std::nullopt;
    if (it->is_number()) return checked_number_cast<int>(it->get<double>());
    if (it->is_string()) {
        const auto& s = it->get_ref<const std::string&>();
        int value = 0;
        auto result = std::from_chars(s.data(), s.data() + s.size(), value);
        if (result.ec == std::errc() && result.ptr == s.data() + s.size()) return value;
    }
    return std::nullopt;
}

MermaidGenerator::MermaidGenerator(MermaidOptions options) : options_(options) {}

std::string MermaidGenerator::node_label(const TraceEvent& event) const {
    std::string desc = event.span_name;
    if (auto step_name = metadata_string(event, "agk.workflow.step_name"); !step_name.empty()) {
        desc = "step:" + step_name;
    }
    if (auto agent_name = metadata_string(event, "agk.agent.name"); !agent_name.empty()) {
        desc += " @" + agent_name;
    }
    desc = truncate_utf8(desc, options_.max_label_length);

    std::string label = std::string(event_icon(event.type)) + " " + desc;
    if (event.duration_ms > 0) {
        label += "<br/>" + std::to_string(event.duration_ms) + "ms";
    }
    return label;
}

std::vector<MermaidEdge> MermaidGenerator::edges(const TraceObject& obj) const {
    EventGraph graph(obj);
    EdgeBuilder builder;

    // Steps of sequential workflows and every node of a step chain; these
    // are reached through a chain and get no fan-out edge.
    std::unordered_set<std::size_t> linearized;

    for (auto parent : graph.parents) {
        if (!is_workflow_sequential(obj.events[parent])) continue;
        auto steps = ordered_steps(graph.children_of(parent, obj), obj);
        builder.chain(parent, steps);

        for (auto step : steps) {
            linearized.insert(step);
            auto descendants = collect_step_descendants(step, obj, graph);
            std::stable_sort(descendants.begin(), descendants.end(), [&obj](std::size_t a, std::size_t b) {
                return earlier(obj.events[a], obj.events[b]);
            });
            builder.chain(step, descendants);
            linearized.insert(descendants.begin(), descendants.end());
        }
    }

    // Every other resolved pair fans out, including a nested sequential
    // workflow under a step, which no chain reaches.
    for (auto parent : graph.parents) {
        for (auto child : graph.children_of(parent, obj)) {
            if (linearized.count(child) > 0) continue;
            builder.add(parent, child);
        }
    }
    return builder.take();
}

std::string MermaidGenerator::generate(const TraceObject& obj) const {
    std::ostringstream out;
    out << "```mermaid\n";
    if (!obj.events.empty()) {
        out << "%%{init: {\"flowchart\": {\"htmlLabels\": true}}}%%\n";
    }
    out << "flowchart TD\n";

    for (std::size_t i = 0; i < obj.events.size(); ++i) {
        const auto& event = obj.events[i];
        auto style = node_style(event.type);
        out << "    n" << i << style.open << escape_label(node_label(event)) << style.close << "\n";
    }
    for (std::size_t i = 0; i < obj.events.size(); ++i) {
        auto style = node_style(obj.events[i].type);
        out << "    style n" << i << " fill:" << style.fill << ",stroke:" << style.stroke << ",stroke-width:1px\n";
    }
    for (const auto& [from, to] : edges(obj)) {
        out << "    n" << from << " --> n" << to << "\n";
    }
    out << "```\n";
    return out.str();
}

std::string generate_mermaid(const TraceObject& obj) {
    return MermaidGenerator{}.generate(obj);
}

std::string render_mermaid_document(const TraceObject& obj, const std::string& run_id, const MermaidOptions& options) {
    nlohmann::json data;
    data["run_id"] = run_id;
    data["total_events"] = obj.summary.total_events;
    data["duration_ms"] = obj.summary.total_duration_ms;
    if (!obj.command.empty()) data["command"] = obj.command;
    data["diagram"] = MermaidGenerator(options).generate(obj);
    return InjaTemplateRenderer::render(kDocumentTemplate, data);
}

} // namespace agenttrace
