// modules/tree/span_tree.h
#ifndef AGENTTRACE_MODULES_TREE_SPAN_TREE_H
#define AGENTTRACE_MODULES_TREE_SPAN_TREE_H

#include "core/types/span_node.h" // 引入 SpanForest
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace agenttrace {

// Builds the parent/child forest from a flat span list.
//  - spans are indexed by span_id; on duplicate ids the first occurrence
//    owns the id, later duplicates still become nodes of their own
//  - empty, zero-sentinel, self-referencing or unresolved parents make a root
//  - children and roots are stably sorted by parsed start time, with
//    unparseable start times ordered first
//  - a parent cycle is broken by promoting the first node of the cycle
//    (in input order) to a root
// Never throws.
SpanForest build_span_forest(const std::vector<Span>& spans);

// end - start in whole milliseconds, 0 if either side does not parse.
int64_t compute_duration_ms(const Span& span);

// Pre-order, skipping the children of collapsed nodes.
std::vector<NodeIndex> flatten_visible(const SpanForest& forest);

// Pre-order over the whole forest regardless of expansion.
std::vector<NodeIndex> flatten_all(const SpanForest& forest);

// First node (input order) carrying `span_id`.
std::optional<NodeIndex> find_by_span_id(const SpanForest& forest, std::string_view span_id);

// Expands every collapsed ancestor of `index`.
void expand_ancestors(SpanForest& forest, NodeIndex index);

void toggle_expanded(SpanForest& forest, NodeIndex index);

// Spans in input order.
std::vector<Span> collect_spans(const SpanForest& forest);

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_TREE_SPAN_TREE_H
