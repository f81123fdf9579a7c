// tests/test_span_parser.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/parser/span_parser.h"
#include "core/types/span.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <variant>

using namespace agenttrace;

// Test 1: A complete record maps every field
TEST_CASE("Parse Full Span Record", "[parser][span]") {
    std::string line = R"({"Name":"llm.generate","SpanContext":{"TraceID":"t1","SpanID":"s2"},"Parent":{"TraceID":"t1","SpanID":"s1"},"StartTime":"2026-01-19T09:36:38.000Z","EndTime":"2026-01-19T09:36:39.500Z","Attributes":[{"Key":"agk.llm.model","Value":{"Type":"STRING","Value":"gpt-4o"}},{"Key":"llm.usage.total_tokens","Value":{"Type":"INT64","Value":120}},{"Key":"agk.stream","Value":{"Type":"BOOL","Value":true}}],"Status":{"Code":"Error","Description":"rate limited"}})";

    auto span = parse_span_line(line);
    REQUIRE(span.has_value());
    REQUIRE(span->name == "llm.generate");
    REQUIRE(span->trace_id == "t1");
    REQUIRE(span->span_id == "s2");
    REQUIRE(span->parent_span_id == "s1");
    REQUIRE(span->start_time == "2026-01-19T09:36:38.000Z");
    REQUIRE(span->end_time == "2026-01-19T09:36:39.500Z");
    REQUIRE(span->attributes.size() == 3);
    REQUIRE(span->status.code == "Error");
    REQUIRE(span->status.description == "rate limited");
    REQUIRE(is_error_status(span->status));

    const auto* model = span->attribute("agk.llm.model");
    REQUIRE(model != nullptr);
    REQUIRE(std::get<std::string>(*model) == "gpt-4o");

    const auto* tokens = span->attribute("llm.usage.total_tokens");
    REQUIRE(tokens != nullptr);
    REQUIRE(attribute_as_number(*tokens) == 120.0);
    REQUIRE(attribute_to_string(*tokens) == "120");

    const auto* stream = span->attribute("agk.stream");
    REQUIRE(stream != nullptr);
    REQUIRE(std::get<bool>(*stream));
}

// Test 2: Blank, malformed and non-object lines are skipped
TEST_CASE("Skip Unusable Lines", "[parser][span]") {
    REQUIRE_FALSE(parse_span_line("").has_value());
    REQUIRE_FALSE(parse_span_line("   \t  ").has_value());
    REQUIRE_FALSE(parse_span_line("{not json").has_value());
    REQUIRE_FALSE(parse_span_line("[1,2,3]").has_value());
    REQUIRE_FALSE(parse_span_line("\"just a string\"").has_value());

    // Surrounding whitespace and a CRLF ending are tolerated
    auto span = parse_span_line("  {\"Name\":\"agent.run\"}\r");
    REQUIRE(span.has_value());
    REQUIRE(span->name == "agent.run");
    REQUIRE(span->span_id.empty());
}

// Test 3: A wrongly typed field rejects the whole record
TEST_CASE("Reject Wrongly Typed Fields", "[parser][span]") {
    REQUIRE_FALSE(parse_span_line(R"({"Name":42})").has_value());
    REQUIRE_FALSE(parse_span_line(R"({"Name":"x","SpanContext":"s1"})").has_value());
    REQUIRE_FALSE(parse_span_line(R"({"Name":"x","SpanContext":{"SpanID":7}})").has_value());
    REQUIRE_FALSE(parse_span_line(R"({"Name":"x","Attributes":{"Key":"a"}})").has_value());
    REQUIRE_FALSE(parse_span_line(R"({"Name":"x","Status":"Error"})").has_value());

    // null is treated as absent
    auto span = parse_span_line(R"({"Name":"x","Parent":null,"Attributes":null,"Status":null})");
    REQUIRE(span.has_value());
    REQUIRE(span->parent_span_id.empty());
    REQUIRE(span->attributes.empty());
    REQUIRE(span->status.code.empty());
}

// Test 4: Attribute entries without a key or a value are dropped individually
TEST_CASE("Attribute Entry Rules", "[parser][attributes]") {
    std::string line = R"({"Name":"tool.call","Attributes":[
        {"Key":"ok","Value":{"Type":"STRING","Value":"yes"}},
        {"Key":5,"Value":{"Value":"bad key"}},
        {"Value":{"Value":"no key"}},
        {"Key":"null_value","Value":{"Type":"STRING","Value":null}},
        {"Key":"no_inner","Value":{"Type":"STRING"}},
        {"Key":"list","Value":{"Type":"STRINGSLICE","Value":["a","b"]}},
        "not an object"
    ]})";

    auto span = parse_span_line(line);
    REQUIRE(span.has_value());
    REQUIRE(span->attributes.size() == 2);
    REQUIRE(span->attributes[0].key == "ok");
    REQUIRE(span->attributes[1].key == "list");
    REQUIRE(std::get<std::string>(span->attributes[1].value) == R"(["a","b"])");
}

// Test 5: Duplicate attribute keys are all kept, lookups resolve last-wins
TEST_CASE("Duplicate Attribute Keys", "[parser][attributes]") {
    std::string line = R"({"Name":"x","Attributes":[{"Key":"k","Value":{"Value":"first"}},{"Key":"k","Value":{"Value":"second"}}]})";

    auto span = parse_span_line(line);
    REQUIRE(span.has_value());
    REQUIRE(span->attributes.size() == 2);
    REQUIRE(std::get<std::string>(*span->attribute("k")) == "second");

    auto flat = span->attribute_map();
    REQUIRE(flat.size() == 1);
    REQUIRE(std::get<std::string>(flat.at("k")) == "second");
}

// Test 6: Multi-line content keeps the good records in order
TEST_CASE("Parse Trace Content", "[parser][file]") {
    std::string content = R"({"Name":"a","SpanContext":{"SpanID":"1"}}
garbage
{"Name":"b","SpanContext":{"SpanID":"2"}}

{"Name":"c","SpanContext":{"SpanID":"3"}})";

    auto spans = parse_spans(content);
    REQUIRE(spans.size() == 3);
    REQUIRE(spans[0].name == "a");
    REQUIRE(spans[1].name == "b");
    REQUIRE(spans[2].name == "c");

    auto from_lines = parse_span_lines({"{\"Name\":\"x\"}", "oops", "{\"Name\":\"y\"}"});
    REQUIRE(from_lines.size() == 2);
}

// Test 7: File parsing reads from disk and reports missing files
TEST_CASE("Parse Trace File", "[parser][file]") {
    namespace fs = std::filesystem;
    fs::path path = fs::temp_directory_path() / "agenttrace_parser_test.jsonl";
    {
        std::ofstream out(path);
        out << R"({"Name":"workflow.run","SpanContext":{"SpanID":"w"}})" << "\n";
        out << R"({"Name":"agent.run","SpanContext":{"SpanID":"a"},"Parent":{"SpanID":"w"}})" << "\n";
    }

    SpanParser parser;
    auto spans = parser.parse_from_file(path.string());
    REQUIRE(spans.size() == 2);
    REQUIRE(spans[1].parent_span_id == "w");

    fs::remove(path);
    REQUIRE_THROWS_AS(parser.parse_from_file(path.string()), std::runtime_error);
}

// Test 8: Root parent detection and error status codes
TEST_CASE("Root Parent And Status Helpers", "[parser][span]") {
    REQUIRE(is_root_parent_id(""));
    REQUIRE(is_root_parent_id("0000000000000000"));
    REQUIRE_FALSE(is_root_parent_id("abc"));

    REQUIRE_FALSE(is_error_status(SpanStatus{"", ""}));
    REQUIRE_FALSE(is_error_status(SpanStatus{"Unset", ""}));
    REQUIRE_FALSE(is_error_status(SpanStatus{"Ok", ""}));
    REQUIRE(is_error_status(SpanStatus{"Error", "boom"}));
}
