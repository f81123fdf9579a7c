// tests/test_run_store.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "modules/run/run_store.h"
#include "modules/parser/span_parser.h"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace agenttrace;
using Catch::Matchers::WithinRel;
namespace fs = std::filesystem;

namespace {

const char* kTrace = R"({"Name":"agent.run","SpanContext":{"SpanID":"a"},"StartTime":"2026-01-19T09:00:00Z","EndTime":"2026-01-19T09:00:04Z"}
{"Name":"llm.generate","SpanContext":{"SpanID":"l1"},"Parent":{"SpanID":"a"},"StartTime":"2026-01-19T09:00:01Z","EndTime":"2026-01-19T09:00:02Z","Attributes":[{"Key":"llm.usage.total_tokens","Value":{"Type":"INT64","Value":100}}]}
{"Name":"llm.generate","SpanContext":{"SpanID":"l2"},"Parent":{"SpanID":"a"},"StartTime":"2026-01-19T09:00:02Z","EndTime":"2026-01-19T09:00:06Z","Attributes":[{"Key":"agk.stream.tokens","Value":{"Type":"INT64","Value":50}}]}
{"Name":"tool.call","SpanContext":{"SpanID":"t"},"Parent":{"SpanID":"a"}}
)";

// Scratch runs directory, removed on scope exit.
struct TempRunsDir {
    fs::path root;

    explicit TempRunsDir(const std::string& name) : root(fs::temp_directory_path() / name) {
        fs::remove_all(root);
        fs::create_directories(root);
    }
    ~TempRunsDir() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void add_run(const std::string& run_id, const std::string& trace, const std::string& manifest = "") const {
        fs::create_directories(root / run_id);
        std::ofstream(root / run_id / "trace.jsonl") << trace;
        if (!manifest.empty()) std::ofstream(root / run_id / "manifest.json") << manifest;
    }
};

} // namespace

// Test 1: The command is the id suffix after the timestamp
TEST_CASE("Command From Run Id", "[run][manifest]") {
    REQUIRE(command_from_run_id("run-20260119-chat") == "chat");
    REQUIRE(command_from_run_id("run-20260119-multi-step-plan") == "multi-step-plan");
    REQUIRE(command_from_run_id("run-20260119") == "agent");
    REQUIRE(command_from_run_id("custom") == "agent");
}

// Test 2: A manifest derived from spans counts spans, LLM calls and tokens
TEST_CASE("Synthesize Manifest", "[run][manifest]") {
    auto spans = parse_spans(kTrace);
    REQUIRE(spans.size() == 4);

    auto run = synthesize_manifest("run-20260119-chat", spans, 0.01);
    REQUIRE(run.run_id == "run-20260119-chat");
    REQUIRE(run.command == "chat");
    REQUIRE(run.status == "completed");
    REQUIRE(run.synthesized);
    REQUIRE(run.span_count == 4);
    REQUIRE(run.llm_calls == 2);
    REQUIRE(run.total_tokens == 150);
    REQUIRE_THAT(run.estimated_cost, WithinRel(1.5, 1e-9));
    REQUIRE(run.start_time == "2026-01-19T09:00:00.000Z");
    REQUIRE(run.end_time == "2026-01-19T09:00:06.000Z");
    REQUIRE_THAT(run.duration_seconds, WithinRel(6.0, 1e-9));

    auto empty = synthesize_manifest("run-1", {});
    REQUIRE(empty.span_count == 0);
    REQUIRE(empty.start_time.empty());
    REQUIRE(empty.duration_seconds == 0.0);
}

// Test 3: Manifest JSON accepts both key spellings
TEST_CASE("Parse Manifest JSON", "[run][manifest]") {
    auto snake = parse_manifest_json(nlohmann::json::parse(
        R"({"run_id":"run-1","command":"chat","status":"completed","duration_seconds":2.5,"span_count":4,"llm_calls":2,"total_tokens":150,"estimated_cost":0.0003})"));
    REQUIRE(snake.has_value());
    REQUIRE(snake->run_id == "run-1");
    REQUIRE(snake->span_count == 4);
    REQUIRE(snake->total_tokens == 150);
    REQUIRE_FALSE(snake->synthesized);

    auto pascal = parse_manifest_json(nlohmann::json::parse(R"({"RunID":"run-2","Command":"plan","LLMCalls":3,"Duration":1.25})"));
    REQUIRE(pascal.has_value());
    REQUIRE(pascal->run_id == "run-2");
    REQUIRE(pascal->command == "plan");
    REQUIRE(pascal->llm_calls == 3);
    REQUIRE_THAT(pascal->duration_seconds, WithinRel(1.25, 1e-9));

    REQUIRE_FALSE(parse_manifest_json(nlohmann::json::array()).has_value());

    auto oversized = parse_manifest_json(nlohmann::json::parse(R"({"RunID":"run-3","TotalTokens":1e20,"SpanCount":1e12,"LLMCalls":2})"));
    REQUIRE(oversized.has_value());
    REQUIRE(oversized->total_tokens == 0);
    REQUIRE(oversized->span_count == 0);
    REQUIRE(oversized->llm_calls == 2);

    auto j = manifest_to_json(*snake);
    REQUIRE(j["run_id"] == "run-1");
    REQUIRE(j["llm_calls"] == 2);
}

// Test 4: Listing returns every run directory, newest id first
TEST_CASE("List Runs", "[run][store]") {
    TempRunsDir dir("agenttrace_store_list");
    dir.add_run("run-20260101-a", kTrace);
    dir.add_run("run-20260301-c", kTrace);
    dir.add_run("run-20260201-b", kTrace);
    std::ofstream(dir.root / "stray.txt") << "not a run";

    RunStore store(dir.root.string());
    REQUIRE(store.list_run_ids() == std::vector<std::string>{"run-20260301-c", "run-20260201-b", "run-20260101-a"});
    REQUIRE(store.has_run("run-20260201-b"));
    REQUIRE_FALSE(store.has_run("run-missing"));
    REQUIRE_FALSE(store.has_run(""));
    REQUIRE(store.latest_run_id().has_value());

    RunStore missing((dir.root / "nope").string());
    REQUIRE(missing.list_run_ids().empty());
    REQUIRE_FALSE(missing.latest_run_id().has_value());
}

// Test 5: A stored manifest is used when present, derived otherwise
TEST_CASE("Manifest Fallback", "[run][store]") {
    TempRunsDir dir("agenttrace_store_manifest");
    dir.add_run("run-1-stored", kTrace, R"({"command":"stored","status":"failed","span_count":99})");
    dir.add_run("run-2-broken", kTrace, "{ this is not json");
    dir.add_run("run-3-none", kTrace);

    RunStore store(dir.root.string());

    auto stored = store.read_manifest("run-1-stored");
    REQUIRE_FALSE(stored.synthesized);
    REQUIRE(stored.run_id == "run-1-stored");
    REQUIRE(stored.status == "failed");
    REQUIRE(stored.span_count == 99);

    auto broken = store.read_manifest("run-2-broken");
    REQUIRE(broken.synthesized);
    REQUIRE(broken.span_count == 4);
    REQUIRE(broken.llm_calls == 2);

    auto none = store.load_run("run-3-none");
    REQUIRE(none.manifest.synthesized);
    REQUIRE(none.manifest.command == "none");
    REQUIRE(none.spans.size() == 4);
    REQUIRE(none.trace_path == store.trace_path("run-3-none"));
}

// Test 6: Unreadable runs fail alone and are skipped when loading everything
TEST_CASE("Load All Runs", "[run][store]") {
    TempRunsDir dir("agenttrace_store_all");
    dir.add_run("run-1-a", kTrace);
    dir.add_run("run-2-b", kTrace);
    fs::create_directories(dir.root / "run-3-empty");

    RunStore store(dir.root.string());
    REQUIRE_THROWS_AS(store.load_run("run-3-empty"), std::runtime_error);
    REQUIRE_THROWS_AS(store.load_run("run-unknown"), std::runtime_error);

    auto runs = store.load_all_runs();
    REQUIRE(runs.size() == 2);
    REQUIRE(runs[0].manifest.run_id == "run-2-b");
    REQUIRE(runs[1].manifest.run_id == "run-1-a");
}

// Test 7: A loaded run remembers where its trace file was read up to
TEST_CASE("Load Run Trace Offset", "[run][store][tail]") {
    TempRunsDir dir("agenttrace_store_offset");
    dir.add_run("run-1-done", kTrace);
    dir.add_run("run-2-writing", std::string(kTrace) + R"({"Name":"tool.ca)");

    RunStore store(dir.root.string());
    auto done = store.load_run("run-1-done");
    REQUIRE(done.trace_offset.has_value());
    REQUIRE(*done.trace_offset == fs::file_size(store.trace_path("run-1-done")));

    auto writing = store.load_run("run-2-writing");
    REQUIRE(writing.spans.size() == 4);
    REQUIRE(writing.trace_offset == std::optional<uint64_t>(std::string(kTrace).size()));
}
