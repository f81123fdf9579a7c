#ifndef AGENTTRACE_CORE_TYPES_SPAN_NODE_H
#define AGENTTRACE_CORE_TYPES_SPAN_NODE_H

#include "span.h" // 引入 Span
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace agenttrace {

// Index into SpanForest::nodes
using NodeIndex = std::size_t;

struct SpanNode {
    Span span;
    std::vector<NodeIndex> children;  // ordered by start time
    std::optional<NodeIndex> parent;  // lookup only
    int depth = 0;
    bool expanded = true;             // UI state
    int64_t duration_ms = 0;
};

// Arena of nodes. `nodes` keeps the input order of the spans; the tree
// shape lives entirely in `roots` and SpanNode::children.
struct SpanForest {
    std::vector<SpanNode> nodes;
    std::vector<NodeIndex> roots;

    bool empty() const { return nodes.empty(); }
    std::size_t size() const { return nodes.size(); }
};

} // namespace agenttrace

#endif // AGENTTRACE_CORE_TYPES_SPAN_NODE_H
