// modules/audit/event_classifier.cpp
#include "modules/audit/event_classifier.h"
#include "common/utils/string_utils.h"
#include "common/utils/time_utils.h"
#include "modules/tree/span_tree.h"

namespace agenttrace {

EventType classify_span(std::string_view span_name) {
    std::string name = to_lower(span_name);
    if (name.find("tool") != std::string::npos) return EventType::TOOL_CALL;
    if (name.find("llm") != std::string::npos) return EventType::LLM_CALL;
    if (name.find("agent") != std::string::npos) return EventType::THOUGHT;
    if (name.find("workflow") != std::string::npos) return EventType::DECISION;
    return EventType::THOUGHT;
}

TraceEvent span_to_event(const Span& span) {
    TraceEvent event;
    event.span_id = span.span_id;
    event.span_name = span.name;
    event.parent_id = span.parent_span_id;
    event.timestamp = parse_rfc3339(span.start_time);
    event.duration_ms = compute_duration_ms(span);
    event.type = classify_span(span.name);

    for (const auto& attr : span.attributes) {
        event.metadata[attr.key] = attribute_to_json(attr.value);

        auto text = attribute_as_string(attr.value);
        if (!text) continue;

        if (attr.key == "agk.prompt.user" || attr.key == "agk.llm.response") {
            event.content = *text;
        } else if (attr.key == "agk.tool.arguments") {
            if (event.type == EventType::TOOL_CALL) event.content = *text;
        } else if (attr.key == "agk.tool.result") {
            if (event.type == EventType::OBSERVATION) event.content = *text;
        }
    }
    return event;
}

} // namespace agenttrace
