// modules/audit/trace_collector.cpp
#include "modules/audit/trace_collector.h"
#include "modules/audit/event_classifier.h"
#include "modules/parser/span_parser.h"
#include "common/utils/number_utils.h"
#include "common/utils/time_utils.h"
#include <algorithm>
#include <chrono>
#include <filesystem>

namespace agenttrace {

TraceCollector::TraceCollector(std::string run_id, std::vector<Span> spans)
    : run_id_(std::move(run_id)), spans_(std::move(spans)) {}

TraceCollector TraceCollector::from_run_path(const std::string& run_path, const std::string& trace_file) {
    namespace fs = std::filesystem;
    fs::path dir(run_path);
    std::string run_id = dir.filename().string();
    if (run_id.empty()) run_id = dir.parent_path().filename().string(); // trailing slash
    auto spans = SpanParser{}.parse_from_file((dir / trace_file).string());
    return TraceCollector(std::move(run_id), std::move(spans));
}

TraceObject TraceCollector::collect(double cost_per_token) const {
    TraceObject obj;
    obj.run_id = run_id_;
    obj.events.reserve(spans_.size());
    for (auto type : kAllEventTypes) obj.summary.type_counts[type] = 0;

    for (const auto& span : spans_) {
        TraceEvent event = span_to_event(span);
        obj.summary.type_counts[event.type]++;
        if (event.content && !event.content->empty()) {
            obj.summary.has_detailed_data = true;
        }
        if (event.timestamp) {
            if (!obj.start_time || *event.timestamp < *obj.start_time) obj.start_time = event.timestamp;
            if (!obj.end_time || *event.timestamp > *obj.end_time) obj.end_time = event.timestamp;
        }
        obj.summary.tokens_used = saturating_add(obj.summary.tokens_used, extract_token_count(span));
        obj.events.push_back(std::move(event));
    }

    // Events without a timestamp go first; equal timestamps keep log order.
    std::stable_sort(obj.events.begin(), obj.events.end(), [](const TraceEvent& a, const TraceEvent& b) {
        if (a.timestamp.has_value() != b.timestamp.has_value()) return !a.timestamp.has_value();
        return a.timestamp.has_value() && *a.timestamp < *b.timestamp;
    });

    obj.summary.total_events = static_cast<int>(obj.events.size());
    if (obj.start_time && obj.end_time) {
        obj.summary.total_duration_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(*obj.end_time - *obj.start_time).count();
    }
    obj.summary.estimated_cost = static_cast<double>(obj.summary.tokens_used) * cost_per_token;
    return obj;
}

std::vector<EventType> reasoning_path(const TraceObject& obj) {
    std::vector<EventType> path;
    path.reserve(obj.events.size());
    for (const auto& event : obj.events) path.push_back(event.type);
    return path;
}

ReasoningAnalysis analyze_reasoning(const TraceObject& obj) {
    ReasoningAnalysis analysis;
    analysis.path = reasoning_path(obj);
    for (const auto& event : obj.events) {
        if (event.type == EventType::DECISION) analysis.decision_points.push_back(event);
    }
    return analysis;
}

nlohmann::json to_json(const TraceEvent& event) {
    nlohmann::json j;
    j["timestamp"] = event.timestamp ? nlohmann::json(format_rfc3339(*event.timestamp)) : nlohmann::json(nullptr);
    j["type"] = to_string(event.type);
    j["span_id"] = event.span_id;
    j["span_name"] = event.span_name;
    if (event.content && !event.content->empty()) j["content"] = *event.content;
    if (!event.metadata.empty()) j["metadata"] = event.metadata;
    if (event.duration_ms != 0) j["duration_ms"] = event.duration_ms;
    if (!event.parent_id.empty()) j["parent_id"] = event.parent_id;
    return j;
}

nlohmann::json to_json(const TraceObject& obj) {
    nlohmann::json j;
    j["run_id"] = obj.run_id;
    if (!obj.command.empty()) j["command"] = obj.command;
    j["start_time"] = obj.start_time ? nlohmann::json(format_rfc3339(*obj.start_time)) : nlohmann::json(nullptr);
    j["end_time"] = obj.end_time ? nlohmann::json(format_rfc3339(*obj.end_time)) : nlohmann::json(nullptr);

    j["events"] = nlohmann::json::array();
    for (const auto& event : obj.events) j["events"].push_back(to_json(event));
    if (!obj.final_output.empty()) j["final_output"] = obj.final_output;

    const auto& s = obj.summary;
    nlohmann::json summary;
    summary["total_events"] = s.total_events;
    summary["thought_count"] = s.count(EventType::THOUGHT);
    summary["tool_call_count"] = s.count(EventType::TOOL_CALL);
    summary["llm_call_count"] = s.count(EventType::LLM_CALL);
    nlohmann::json counts = nlohmann::json::object();
    for (auto type : kAllEventTypes) counts[to_string(type)] = s.count(type);
    summary["type_counts"] = counts;
    summary["total_duration_ms"] = s.total_duration_ms;
    summary["tokens_used"] = s.tokens_used;
    summary["estimated_cost"] = s.estimated_cost;
    summary["has_detailed_data"] = s.has_detailed_data;
    j["summary"] = summary;
    return j;
}

nlohmann::json to_json(const ReasoningAnalysis& analysis) {
    nlohmann::json j;
    j["path"] = nlohmann::json::array();
    for (auto type : analysis.path) j["path"].push_back(to_string(type));
    if (!analysis.decision_points.empty()) {
        j["decision_points"] = nlohmann::json::array();
        for (const auto& event : analysis.decision_points) j["decision_points"].push_back(to_json(event));
    }
    return j;
}

} // namespace agenttrace
