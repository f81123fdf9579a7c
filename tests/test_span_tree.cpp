// tests/test_span_tree.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/tree/span_tree.h"
#include <string>
#include <vector>

using namespace agenttrace;

namespace {

Span make_span(const std::string& id, const std::string& parent, const std::string& start,
               const std::string& end = "", const std::string& name = "step") {
    Span span;
    span.name = name;
    span.span_id = id;
    span.parent_span_id = parent;
    span.start_time = start;
    span.end_time = end;
    return span;
}

std::vector<std::string> ids_of(const SpanForest& forest, const std::vector<NodeIndex>& order) {
    std::vector<std::string> ids;
    for (auto i : order) ids.push_back(forest.nodes[i].span.span_id);
    return ids;
}

} // namespace

// Test 1: Roots sit at depth 0 and children one level below their parent
TEST_CASE("Build Forest Depths", "[tree]") {
    std::vector<Span> spans = {
        make_span("root", "", "2026-01-19T09:00:00Z", "2026-01-19T09:00:05Z"),
        make_span("child", "root", "2026-01-19T09:00:01Z", "2026-01-19T09:00:02Z"),
        make_span("grandchild", "child", "2026-01-19T09:00:01.5Z", "2026-01-19T09:00:01.75Z"),
    };

    auto forest = build_span_forest(spans);
    REQUIRE(forest.size() == 3);
    REQUIRE(forest.roots.size() == 1);
    REQUIRE(forest.nodes[0].depth == 0);
    REQUIRE(forest.nodes[1].depth == 1);
    REQUIRE(forest.nodes[2].depth == 2);
    REQUIRE(forest.nodes[1].parent == NodeIndex{0});
    REQUIRE(forest.nodes[0].duration_ms == 5000);
    REQUIRE(forest.nodes[2].duration_ms == 250);
}

// Test 2: Unresolved, sentinel and self parents all produce roots
TEST_CASE("Roots From Missing Parents", "[tree]") {
    std::vector<Span> spans = {
        make_span("a", "missing", "2026-01-19T09:00:00Z"),
        make_span("b", "0000000000000000", "2026-01-19T09:00:01Z"),
        make_span("c", "c", "2026-01-19T09:00:02Z"),
    };

    auto forest = build_span_forest(spans);
    REQUIRE(forest.roots.size() == 3);
    for (const auto& node : forest.nodes) {
        REQUIRE(node.depth == 0);
        REQUIRE_FALSE(node.parent.has_value());
    }
}

// Test 3: Children and roots are ordered by start time, bad times first
TEST_CASE("Children Sorted By Start Time", "[tree]") {
    std::vector<Span> spans = {
        make_span("p", "", "2026-01-19T09:00:00Z"),
        make_span("late", "p", "2026-01-19T09:00:03Z"),
        make_span("early", "p", "2026-01-19T09:00:01Z"),
        make_span("broken", "p", "not-a-time"),
    };

    auto forest = build_span_forest(spans);
    REQUIRE(ids_of(forest, forest.nodes[0].children) == std::vector<std::string>{"broken", "early", "late"});
    REQUIRE(ids_of(forest, flatten_all(forest)) == std::vector<std::string>{"p", "broken", "early", "late"});
}

// Test 4: The first span with a given id owns it; duplicates still become nodes
TEST_CASE("Duplicate Span Ids", "[tree]") {
    std::vector<Span> spans = {
        make_span("dup", "", "2026-01-19T09:00:00Z", "", "first"),
        make_span("dup", "", "2026-01-19T09:00:01Z", "", "second"),
        make_span("kid", "dup", "2026-01-19T09:00:02Z"),
    };

    auto forest = build_span_forest(spans);
    REQUIRE(forest.size() == 3);
    REQUIRE(forest.nodes[2].parent == NodeIndex{0});
    REQUIRE(forest.nodes[1].children.empty());
    REQUIRE(find_by_span_id(forest, "dup") == NodeIndex{0});
    REQUIRE(flatten_all(forest).size() == 3);
}

// Test 5: A parent cycle is cut so that every node is still reachable
TEST_CASE("Break Parent Cycles", "[tree]") {
    std::vector<Span> spans = {
        make_span("x", "z", "2026-01-19T09:00:00Z"),
        make_span("y", "x", "2026-01-19T09:00:01Z"),
        make_span("z", "y", "2026-01-19T09:00:02Z"),
    };

    auto forest = build_span_forest(spans);
    REQUIRE(forest.roots == std::vector<NodeIndex>{0});
    REQUIRE(forest.nodes[1].depth == 1);
    REQUIRE(forest.nodes[2].depth == 2);
    REQUIRE(flatten_all(forest).size() == 3);
}

// Test 6: Collapsing hides a subtree, expanding restores the same sequence
TEST_CASE("Collapse And Expand", "[tree][flatten]") {
    std::vector<Span> spans = {
        make_span("r", "", "2026-01-19T09:00:00Z"),
        make_span("a", "r", "2026-01-19T09:00:01Z"),
        make_span("a1", "a", "2026-01-19T09:00:02Z"),
        make_span("a2", "a", "2026-01-19T09:00:03Z"),
        make_span("b", "r", "2026-01-19T09:00:04Z"),
    };

    auto forest = build_span_forest(spans);
    auto before = flatten_visible(forest);
    REQUIRE(before.size() == 5);

    toggle_expanded(forest, 1);
    auto collapsed = flatten_visible(forest);
    REQUIRE(ids_of(forest, collapsed) == std::vector<std::string>{"r", "a", "b"});
    REQUIRE(flatten_all(forest).size() == 5);

    toggle_expanded(forest, 1);
    REQUIRE(flatten_visible(forest) == before);
}

// Test 7: Expanding ancestors reveals a deeply hidden node
TEST_CASE("Expand Ancestors", "[tree][flatten]") {
    std::vector<Span> spans = {
        make_span("r", "", "2026-01-19T09:00:00Z"),
        make_span("a", "r", "2026-01-19T09:00:01Z"),
        make_span("leaf", "a", "2026-01-19T09:00:02Z"),
    };

    auto forest = build_span_forest(spans);
    forest.nodes[0].expanded = false;
    forest.nodes[1].expanded = false;
    REQUIRE(flatten_visible(forest).size() == 1);

    expand_ancestors(forest, 2);
    REQUIRE(flatten_visible(forest).size() == 3);
}

// Test 8: Unparseable timestamps give a zero duration
TEST_CASE("Zero Duration For Bad Timestamps", "[tree]") {
    REQUIRE(compute_duration_ms(make_span("a", "", "", "2026-01-19T09:00:00Z")) == 0);
    REQUIRE(compute_duration_ms(make_span("a", "", "2026-01-19T09:00:00Z", "later")) == 0);
    REQUIRE(compute_duration_ms(make_span("a", "", "2026-01-19T09:00:00Z", "2026-01-19T09:00:00.042Z")) == 42);
}

// Test 9: collect_spans returns the input order, not the tree order
TEST_CASE("Collect Spans In Input Order", "[tree]") {
    std::vector<Span> spans = {
        make_span("late", "", "2026-01-19T09:00:05Z"),
        make_span("early", "", "2026-01-19T09:00:01Z"),
    };

    auto forest = build_span_forest(spans);
    REQUIRE(ids_of(forest, forest.roots) == std::vector<std::string>{"early", "late"});

    auto collected = collect_spans(forest);
    REQUIRE(collected.size() == 2);
    REQUIRE(collected[0].span_id == "late");
    REQUIRE(collected[1].span_id == "early");
}

// Test 10: An empty input builds an empty forest
TEST_CASE("Empty Forest", "[tree]") {
    auto forest = build_span_forest({});
    REQUIRE(forest.empty());
    REQUIRE(forest.roots.empty());
    REQUIRE(flatten_visible(forest).empty());
}
