// tests/test_metrics.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "modules/metrics/metrics_calculator.h"
#include "modules/tree/span_tree.h"
#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <vector>

using namespace agenttrace;
using Catch::Matchers::WithinRel;

namespace {

Span timed_span(const std::string& id, const std::string& parent, const std::string& name, int duration_ms) {
    Span span;
    span.name = name;
    span.span_id = id;
    span.parent_span_id = parent;
    span.start_time = "2026-01-19T09:00:00Z";
    // 09:00:00 + duration_ms
    int seconds = duration_ms / 1000;
    int millis = duration_ms % 1000;
    char end[40];
    std::snprintf(end, sizeof(end), "2026-01-19T09:%02d:%02d.%03dZ", seconds / 60, seconds % 60, millis);
    span.end_time = end;
    return span;
}

} // namespace

// Test 1: Tokens are summed across both token keys and every span
TEST_CASE("Token Totals", "[metrics]") {
    Span a = timed_span("a", "", "llm.generate", 10);
    a.attributes.push_back({"llm.usage.total_tokens", 120.0});
    Span b = timed_span("b", "a", "agent.stream", 10);
    b.attributes.push_back({"agk.stream.tokens", 30.0});
    b.attributes.push_back({"llm.usage.total_tokens", std::string("not a number")});

    REQUIRE(extract_token_count(a) == 120);
    REQUIRE(extract_token_count(b) == 30);

    auto forest = build_span_forest({a, b});
    auto metrics = compute_metrics(forest, 0.001);
    REQUIRE(metrics.total_tokens == 150);
    REQUIRE_THAT(metrics.estimated_cost, WithinRel(0.15, 1e-9));
}

// Test 2: Error spans are counted regardless of expansion
TEST_CASE("Error Count", "[metrics]") {
    Span root = timed_span("r", "", "workflow.run", 100);
    Span failed = timed_span("f", "r", "tool.call", 10);
    failed.status.code = "Error";
    Span fine = timed_span("ok", "r", "tool.call", 10);
    fine.status.code = "Ok";

    auto forest = build_span_forest({root, failed, fine});
    forest.nodes[0].expanded = false;
    REQUIRE(compute_metrics(forest).error_count == 1);
}

// Test 3: Only leaves and llm spans are bottleneck candidates
TEST_CASE("Bottleneck Eligibility", "[metrics][bottleneck]") {
    Span parent = timed_span("p", "", "workflow.run", 9000);
    Span llm_parent = timed_span("l", "p", "LLM.chat", 5000);
    Span leaf = timed_span("t", "l", "tool.search", 200);

    auto forest = build_span_forest({parent, llm_parent, leaf});
    REQUIRE_FALSE(is_bottleneck_candidate(forest.nodes[0]));
    REQUIRE(is_bottleneck_candidate(forest.nodes[1]));
    REQUIRE(is_bottleneck_candidate(forest.nodes[2]));

    auto metrics = compute_metrics(forest);
    REQUIRE(metrics.slowest == NodeIndex{1});
    REQUIRE(metrics.top3 == std::vector<NodeIndex>{1, 2});
}

// Test 4: Top three are sorted by duration and capped at three
TEST_CASE("Top Three Bottlenecks", "[metrics][bottleneck]") {
    std::vector<Span> spans = {
        timed_span("a", "", "tool.a", 100),
        timed_span("b", "", "tool.b", 400),
        timed_span("c", "", "tool.c", 250),
        timed_span("d", "", "tool.d", 50),
        timed_span("e", "", "tool.e", 300),
    };

    auto forest = build_span_forest(spans);
    auto metrics = compute_metrics(forest);
    REQUIRE(metrics.top3 == std::vector<NodeIndex>{1, 4, 2});
    REQUIRE(metrics.slowest == NodeIndex{1});
    for (std::size_t i = 1; i < metrics.top3.size(); ++i) {
        REQUIRE(forest.nodes[metrics.top3[i - 1]].duration_ms >= forest.nodes[metrics.top3[i]].duration_ms);
    }
}

// Test 5: Ties keep the earlier span first and do not replace the slowest
TEST_CASE("Bottleneck Ties", "[metrics][bottleneck]") {
    std::vector<Span> spans = {
        timed_span("a", "", "tool.a", 300),
        timed_span("b", "", "tool.b", 300),
    };

    auto metrics = compute_metrics(build_span_forest(spans));
    REQUIRE(metrics.slowest == NodeIndex{0});
    REQUIRE(metrics.top3 == std::vector<NodeIndex>{0, 1});
}

// Test 6: An empty forest has no bottleneck and no cost
TEST_CASE("Empty Metrics", "[metrics]") {
    auto metrics = compute_metrics(SpanForest{});
    REQUIRE(metrics.total_tokens == 0);
    REQUIRE(metrics.error_count == 0);
    REQUIRE_FALSE(metrics.slowest.has_value());
    REQUIRE(metrics.top3.empty());
    REQUIRE(metrics.estimated_cost == 0.0);
}

// Test 7: Token counts outside the integer range are ignored
TEST_CASE("Oversized Token Values", "[metrics]") {
    Span huge = timed_span("h", "", "llm.generate", 10);
    huge.attributes.push_back({"llm.usage.total_tokens", 1e30});
    huge.attributes.push_back({"agk.stream.tokens", 25.0});
    REQUIRE(extract_token_count(huge) == 25);

    Span negative = timed_span("n", "", "llm.generate", 10);
    negative.attributes.push_back({"llm.usage.total_tokens", -1e30});
    REQUIRE(extract_token_count(negative) == 0);

    Span big_a = timed_span("a", "", "llm.generate", 10);
    big_a.attributes.push_back({"llm.usage.total_tokens", 9e18});
    Span big_b = timed_span("b", "", "llm.generate", 10);
    big_b.attributes.push_back({"llm.usage.total_tokens", 9e18});
    auto metrics = compute_metrics(build_span_forest({big_a, big_b}));
    REQUIRE(metrics.total_tokens == std::numeric_limits<int64_t>::max());
}
