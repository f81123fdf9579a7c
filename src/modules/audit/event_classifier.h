// modules/audit/event_classifier.h
#ifndef AGENTTRACE_MODULES_AUDIT_EVENT_CLASSIFIER_H
#define AGENTTRACE_MODULES_AUDIT_EVENT_CLASSIFIER_H

#include "core/types/span.h"        // 引入 Span
#include "core/types/trace_event.h" // 引入 TraceEvent
#include <string_view>

namespace agenttrace {

// Case-insensitive substring rules, first match wins:
//   "tool" -> TOOL_CALL, "llm" -> LLM_CALL, "agent" -> THOUGHT,
//   "workflow" -> DECISION, otherwise THOUGHT.
EventType classify_span(std::string_view span_name);

// Classifies the span and extracts its content and metadata.
// Content keys:
//   agk.prompt.user, agk.llm.response  -> always
//   agk.tool.arguments                 -> TOOL_CALL only
//   agk.tool.result                    -> OBSERVATION only
// Only string values qualify; a later qualifying attribute replaces an earlier one.
TraceEvent span_to_event(const Span& span);

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_AUDIT_EVENT_CLASSIFIER_H
