// core/types/trace_event.cpp
#include "core/types/trace_event.h"

namespace agenttrace {

const char* to_string(EventType type) {
    switch (type) {
        case EventType::THOUGHT: return "thought";
        case EventType::TOOL_CALL: return "tool_call";
        case EventType::OBSERVATION: return "observation";
        case EventType::LLM_CALL: return "llm_call";
        case EventType::DECISION: return "decision";
    }
    return "thought";
}

} // namespace agenttrace
