// tests/test_event_classifier.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "modules/audit/event_classifier.h"
#include "modules/audit/trace_collector.h"
#include "modules/parser/span_parser.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace agenttrace;
using Catch::Matchers::WithinRel;

namespace {

const char* kRunTrace = R"({"Name":"workflow.sequential","SpanContext":{"TraceID":"t","SpanID":"w"},"StartTime":"2026-01-19T09:00:00Z","EndTime":"2026-01-19T09:00:10Z"}
{"Name":"agent.tool.invoke","SpanContext":{"TraceID":"t","SpanID":"tool"},"Parent":{"SpanID":"w"},"StartTime":"2026-01-19T09:00:03Z","EndTime":"2026-01-19T09:00:04Z","Attributes":[{"Key":"agk.tool.arguments","Value":{"Type":"STRING","Value":"{\"q\":\"weather\"}"}}]}
{"Name":"llm.generate","SpanContext":{"TraceID":"t","SpanID":"llm"},"Parent":{"SpanID":"w"},"StartTime":"2026-01-19T09:00:01Z","EndTime":"2026-01-19T09:00:02Z","Attributes":[{"Key":"agk.prompt.user","Value":{"Type":"STRING","Value":"What is the weather?"}},{"Key":"llm.usage.total_tokens","Value":{"Type":"INT64","Value":120}}]}
{"Name":"agent.run","SpanContext":{"TraceID":"t","SpanID":"agent"},"Parent":{"SpanID":"w"},"StartTime":"2026-01-19T09:00:05Z","EndTime":"2026-01-19T09:00:06Z","Attributes":[{"Key":"agk.stream.tokens","Value":{"Type":"INT64","Value":30}}]}
{"Name":"mystery","SpanContext":{"TraceID":"t","SpanID":"m"}})";

} // namespace

// Test 1: Classification rules apply in order, case-insensitively
TEST_CASE("Classify Span Names", "[audit][classifier]") {
    REQUIRE(classify_span("agent.tool.invoke") == EventType::TOOL_CALL);
    REQUIRE(classify_span("MCP.Tool.Call") == EventType::TOOL_CALL);
    REQUIRE(classify_span("llm.generate") == EventType::LLM_CALL);
    REQUIRE(classify_span("agent.llm.chat") == EventType::LLM_CALL);
    REQUIRE(classify_span("agent.run") == EventType::THOUGHT);
    REQUIRE(classify_span("workflow.step") == EventType::DECISION);
    REQUIRE(classify_span("agent.workflow") == EventType::THOUGHT);
    REQUIRE(classify_span("something.else") == EventType::THOUGHT);
    REQUIRE(classify_span("") == EventType::THOUGHT);
}

// Test 2: Event type names used in the JSON report
TEST_CASE("Event Type Names", "[audit][classifier]") {
    REQUIRE(std::string(to_string(EventType::THOUGHT)) == "thought");
    REQUIRE(std::string(to_string(EventType::TOOL_CALL)) == "tool_call");
    REQUIRE(std::string(to_string(EventType::OBSERVATION)) == "observation");
    REQUIRE(std::string(to_string(EventType::LLM_CALL)) == "llm_call");
    REQUIRE(std::string(to_string(EventType::DECISION)) == "decision");
}

// Test 3: Content comes from prompt, response and tool arguments of tool calls
TEST_CASE("Extract Event Content", "[audit][classifier]") {
    Span tool;
    tool.name = "agent.tool.invoke";
    tool.attributes.push_back({"agk.tool.arguments", std::string("{\"q\":1}")});
    tool.attributes.push_back({"agk.tool.result", std::string("sunny")});
    auto tool_event = span_to_event(tool);
    REQUIRE(tool_event.type == EventType::TOOL_CALL);
    REQUIRE(tool_event.content == std::string("{\"q\":1}"));
    REQUIRE(tool_event.metadata["agk.tool.result"] == "sunny");

    Span llm;
    llm.name = "llm.generate";
    llm.attributes.push_back({"agk.tool.arguments", std::string("ignored")});
    llm.attributes.push_back({"agk.prompt.user", std::string("hi")});
    llm.attributes.push_back({"agk.llm.response", std::string("hello")});
    auto llm_event = span_to_event(llm);
    REQUIRE(llm_event.type == EventType::LLM_CALL);
    REQUIRE(llm_event.content == std::string("hello"));

    Span numeric;
    numeric.name = "llm.generate";
    numeric.attributes.push_back({"agk.prompt.user", 42.0});
    auto numeric_event = span_to_event(numeric);
    REQUIRE_FALSE(numeric_event.content.has_value());
    REQUIRE(numeric_event.metadata["agk.prompt.user"] == 42);
}

// Test 4: Events keep span identity, parent and duration
TEST_CASE("Event Identity", "[audit][classifier]") {
    Span span;
    span.name = "llm.generate";
    span.span_id = "s1";
    span.parent_span_id = "p1";
    span.start_time = "2026-01-19T09:00:00Z";
    span.end_time = "2026-01-19T09:00:01.250Z";

    auto event = span_to_event(span);
    REQUIRE(event.span_id == "s1");
    REQUIRE(event.span_name == "llm.generate");
    REQUIRE(event.parent_id == "p1");
    REQUIRE(event.timestamp.has_value());
    REQUIRE(event.duration_ms == 1250);
}

// Test 5: The collector orders events and summarizes the run
TEST_CASE("Collect Trace Object", "[audit][collector]") {
    TraceCollector collector("run-1-chat", parse_spans(kRunTrace));
    auto obj = collector.collect(0.001);

    REQUIRE(obj.run_id == "run-1-chat");
    REQUIRE(obj.events.size() == 5);
    // The event without a timestamp comes first, the rest by start time
    REQUIRE(obj.events[0].span_id == "m");
    REQUIRE(obj.events[1].span_id == "w");
    REQUIRE(obj.events[2].span_id == "llm");
    REQUIRE(obj.events[3].span_id == "tool");
    REQUIRE(obj.events[4].span_id == "agent");

    const auto& summary = obj.summary;
    REQUIRE(summary.total_events == 5);
    REQUIRE(summary.type_counts.size() == 5);
    REQUIRE(summary.count(EventType::TOOL_CALL) == 1);
    REQUIRE(summary.count(EventType::LLM_CALL) == 1);
    REQUIRE(summary.count(EventType::DECISION) == 1);
    REQUIRE(summary.count(EventType::THOUGHT) == 2);
    REQUIRE(summary.count(EventType::OBSERVATION) == 0);
    REQUIRE(summary.tokens_used == 150);
    REQUIRE_THAT(summary.estimated_cost, WithinRel(0.15, 1e-9));
    REQUIRE(summary.has_detailed_data);
    // Earliest to latest start time
    REQUIRE(summary.total_duration_ms == 5000);
}

// Test 6: Reasoning path follows the timeline and lists decision points
TEST_CASE("Reasoning Path", "[audit][collector]") {
    auto obj = TraceCollector("run-1", parse_spans(kRunTrace)).collect();

    auto path = reasoning_path(obj);
    REQUIRE(path == std::vector<EventType>{EventType::THOUGHT, EventType::DECISION, EventType::LLM_CALL,
                                           EventType::TOOL_CALL, EventType::THOUGHT});

    auto analysis = analyze_reasoning(obj);
    REQUIRE(analysis.decision_points.size() == 1);
    REQUIRE(analysis.decision_points[0].span_id == "w");

    auto j = to_json(analysis);
    REQUIRE(j["path"].size() == 5);
    REQUIRE(j["path"][2] == "llm_call");
    REQUIRE(j["decision_points"].size() == 1);
}

// Test 7: JSON report layout
TEST_CASE("Trace Object JSON", "[audit][json]") {
    auto obj = TraceCollector("run-1", parse_spans(kRunTrace)).collect();
    obj.command = "chat";
    auto j = to_json(obj);

    REQUIRE(j["run_id"] == "run-1");
    REQUIRE(j["command"] == "chat");
    REQUIRE(j["start_time"] == "2026-01-19T09:00:00.000Z");
    REQUIRE(j["end_time"] == "2026-01-19T09:00:05.000Z");
    REQUIRE(j["events"].size() == 5);
    REQUIRE(j["events"][0]["timestamp"].is_null());
    REQUIRE(j["events"][2]["content"] == "What is the weather?");
    REQUIRE(j["summary"]["total_events"] == 5);
    REQUIRE(j["summary"]["llm_call_count"] == 1);
    REQUIRE(j["summary"]["tool_call_count"] == 1);
    REQUIRE(j["summary"]["thought_count"] == 2);
    REQUIRE(j["summary"]["type_counts"]["observation"] == 0);
    REQUIRE(j["summary"]["tokens_used"] == 150);

    auto empty = to_json(TraceCollector("run-empty", {}).collect());
    REQUIRE(empty["start_time"].is_null());
    REQUIRE(empty["end_time"].is_null());
    REQUIRE(empty["events"].empty());
    REQUIRE(empty["summary"]["total_duration_ms"] == 0);
    REQUIRE(empty["summary"]["has_detailed_data"] == false);
}

// Test 8: Collecting from a run directory uses its name as the run id
TEST_CASE("Collect From Run Path", "[audit][collector]") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "agenttrace_collector_test" / "run-20260119-chat";
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "trace.jsonl");
        out << kRunTrace << "\n";
    }

    auto collector = TraceCollector::from_run_path(dir.string());
    REQUIRE(collector.run_id() == "run-20260119-chat");
    REQUIRE(collector.spans().size() == 5);

    REQUIRE_THROWS_AS(TraceCollector::from_run_path((dir / "missing").string()), std::runtime_error);
    fs::remove_all(dir.parent_path());
}
