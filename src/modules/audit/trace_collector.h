// modules/audit/trace_collector.h
#ifndef AGENTTRACE_MODULES_AUDIT_TRACE_COLLECTOR_H
#define AGENTTRACE_MODULES_AUDIT_TRACE_COLLECTOR_H

#include "core/types/span.h"        // 引入 Span
#include "core/types/trace_event.h" // 引入 TraceObject
#include "modules/metrics/metrics_calculator.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agenttrace {

struct ReasoningAnalysis {
    std::vector<EventType> path;
    std::vector<TraceEvent> decision_points;
};

// Assembles a TraceObject from the spans of one run.
class TraceCollector {
public:
    TraceCollector(std::string run_id, std::vector<Span> spans);

    // Reads <run_path>/<trace_file>; run id = last path component.
    // Throws std::runtime_error if the trace file cannot be opened.
    static TraceCollector from_run_path(const std::string& run_path, const std::string& trace_file = "trace.jsonl");

    TraceObject collect(double cost_per_token = kDefaultCostPerToken) const;

    const std::string& run_id() const { return run_id_; }
    const std::vector<Span>& spans() const { return spans_; }

private:
    std::string run_id_;
    std::vector<Span> spans_;
};

// Event types in timeline order.
std::vector<EventType> reasoning_path(const TraceObject& obj);

ReasoningAnalysis analyze_reasoning(const TraceObject& obj);

nlohmann::json to_json(const TraceEvent& event);
nlohmann::json to_json(const TraceObject& obj);
nlohmann::json to_json(const ReasoningAnalysis& analysis);

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_AUDIT_TRACE_COLLECTOR_H
