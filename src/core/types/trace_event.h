#ifndef AGENTTRACE_CORE_TYPES_TRACE_EVENT_H
#define AGENTTRACE_CORE_TYPES_TRACE_EVENT_H

#include "common/utils/time_utils.h"
#include <nlohmann/json.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agenttrace {

// 事件类型
enum class EventType : uint8_t {
    THOUGHT,
    TOOL_CALL,
    OBSERVATION,
    LLM_CALL,
    DECISION
};

inline constexpr std::array<EventType, 5> kAllEventTypes = {
    EventType::THOUGHT, EventType::TOOL_CALL, EventType::OBSERVATION,
    EventType::LLM_CALL, EventType::DECISION};

// "thought", "tool_call", "observation", "llm_call", "decision"
const char* to_string(EventType type);

// A classified view of one span.
struct TraceEvent {
    std::optional<TimePoint> timestamp;
    EventType type = EventType::THOUGHT;
    std::string span_id;
    std::string span_name;
    std::optional<std::string> content;
    nlohmann::json metadata = nlohmann::json::object();
    int64_t duration_ms = 0;
    std::string parent_id;
};

struct TraceSummary {
    int total_events = 0;
    std::map<EventType, int> type_counts;
    int64_t total_duration_ms = 0;
    int64_t tokens_used = 0;
    double estimated_cost = 0.0;
    bool has_detailed_data = false;

    int count(EventType type) const {
        auto it = type_counts.find(type);
        return it == type_counts.end() ? 0 : it->second;
    }
};

struct TraceObject {
    std::string run_id;
    std::string command;
    std::optional<TimePoint> start_time;
    std::optional<TimePoint> end_time;
    std::vector<TraceEvent> events; // ordered by timestamp
    std::string final_output;
    TraceSummary summary;
};

} // namespace agenttrace

#endif // AGENTTRACE_CORE_TYPES_TRACE_EVENT_H
