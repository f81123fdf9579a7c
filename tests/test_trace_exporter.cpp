// tests/test_trace_exporter.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/export/trace_exporter.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace agenttrace;

namespace {

std::vector<nlohmann::json> sample_spans() {
    return {
        nlohmann::json::parse(R"({"Name":"agent.run","SpanContext":{"TraceID":"trace-1","SpanID":"a"},"StartTime":"2026-01-19T09:00:00Z","EndTime":"2026-01-19T09:00:02Z","Attributes":[{"Key":"agk.agent.name","Value":{"Type":"STRING","Value":"planner"}}]})"),
        nlohmann::json::parse(R"({"Name":"llm.generate","SpanContext":{"TraceID":"trace-1","SpanID":"b"},"Parent":{"SpanID":"a"}})"),
    };
}

} // namespace

// Test 1: Format names, including the otlp alias
TEST_CASE("Parse Export Format", "[export]") {
    REQUIRE(parse_export_format("json") == ExportFormat::JSON);
    REQUIRE(parse_export_format("Jaeger") == ExportFormat::JAEGER);
    REQUIRE(parse_export_format("otel") == ExportFormat::OTEL);
    REQUIRE(parse_export_format("otlp") == ExportFormat::OTEL);
    REQUIRE_THROWS_AS(parse_export_format("zipkin"), std::invalid_argument);
    REQUIRE(std::string(to_string(ExportFormat::JAEGER)) == "jaeger");
}

// Test 2: JSON export is the raw span array
TEST_CASE("Export JSON", "[export]") {
    auto out = TraceExporter().export_trace(sample_spans(), ExportFormat::JSON);
    REQUIRE(out.is_array());
    REQUIRE(out.size() == 2);
    REQUIRE(out[0]["Name"] == "agent.run");
    REQUIRE(out[1]["Parent"]["SpanID"] == "a");
}

// Test 3: Jaeger export maps ids, names, times and tags
TEST_CASE("Export Jaeger", "[export]") {
    auto out = TraceExporter().export_trace(sample_spans(), ExportFormat::JAEGER);
    REQUIRE(out["traceID"] == "trace-1");
    REQUIRE(out["spans"].size() == 2);

    const auto& first = out["spans"][0];
    REQUIRE(first["traceID"] == "trace-1");
    REQUIRE(first["spanID"] == "a");
    REQUIRE(first["operationName"] == "agent.run");
    REQUIRE(first["startTime"] == "2026-01-19T09:00:00Z");
    REQUIRE(first["tags"].size() == 1);
    REQUIRE(first["tags"][0]["key"] == "agk.agent.name");
    REQUIRE(first["tags"][0]["value"]["Value"] == "planner");

    REQUIRE_FALSE(out["spans"][1].contains("tags"));

    auto empty = TraceExporter().export_trace({}, ExportFormat::JAEGER);
    REQUIRE(empty["traceID"] == "");
    REQUIRE(empty["spans"].empty());
}

// Test 4: OTel export wraps the spans in a resource envelope
TEST_CASE("Export OTel", "[export]") {
    auto out = TraceExporter("my-agent", "2.0.0").export_trace(sample_spans(), ExportFormat::OTEL);
    REQUIRE(out["resourceSpans"].size() == 1);

    const auto& resource = out["resourceSpans"][0];
    const auto& attrs = resource["resource"]["attributes"];
    REQUIRE(attrs[0]["key"] == "service.name");
    REQUIRE(attrs[0]["value"]["stringValue"] == "my-agent");
    REQUIRE(attrs[1]["value"]["stringValue"] == "2.0.0");

    const auto& scope = resource["scopeSpans"][0];
    REQUIRE(scope["scope"]["name"] == "my-agent");
    REQUIRE(scope["spans"].size() == 2);
    REQUIRE(scope["spans"][1]["Name"] == "llm.generate");
}

// Test 5: Raw spans are read from disk, skipping malformed lines
TEST_CASE("Read Raw Spans", "[export][file]") {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "agenttrace_export_test.jsonl";
    {
        std::ofstream out(path);
        out << R"({"Name":"a"})" << "\n";
        out << "not json\n";
        out << "[1,2]\n";
        out << "\n";
        out << R"({"Name":"b","Custom":{"kept":true}})" << "\n";
    }

    auto spans = TraceExporter::read_raw_spans(path.string());
    REQUIRE(spans.size() == 2);
    REQUIRE(spans[1]["Custom"]["kept"] == true);

    fs::remove(path);
    REQUIRE_THROWS_AS(TraceExporter::read_raw_spans(path.string()), std::runtime_error);
}
