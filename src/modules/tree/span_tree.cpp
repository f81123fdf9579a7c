// modules/tree/span_tree.cpp
#include "modules/tree/span_tree.h"
#include "common/utils/time_utils.h"
#include <algorithm>
#include <string>
#include <unordered_map>

namespace agenttrace {

namespace {

// Unparseable start times sort before every parseable one.
struct StartKey {
    bool valid = false;
    TimePoint time{};

    bool operator<(const StartKey& other) const {
        if (valid != other.valid) return !valid;
        return valid && time < other.time;
    }
};

void sort_by_start(std::vector<NodeIndex>& indices, const std::vector<StartKey>& keys) {
    std::stable_sort(indices.begin(), indices.end(),
                     [&keys](NodeIndex a, NodeIndex b) { return keys[a] < keys[b]; });
}

template <typename Visit>
void walk_preorder(const SpanForest& forest, bool respect_expansion, Visit&& visit) {
    std::vector<NodeIndex> stack(forest.roots.rbegin(), forest.roots.rend());
    while (!stack.empty()) {
        NodeIndex current = stack.back();
        stack.pop_back();
        visit(current);
        const auto& node = forest.nodes[current];
        if (respect_expansion && !node.expanded) continue;
        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
}

} // namespace

int64_t compute_duration_ms(const Span& span) {
    return duration_ms_between(span.start_time, span.end_time);
}

SpanForest build_span_forest(const std::vector<Span>& spans) {
    SpanForest forest;
    forest.nodes.reserve(spans.size());

    std::unordered_map<std::string, NodeIndex> by_id;
    std::vector<StartKey> keys;
    keys.reserve(spans.size());

    for (NodeIndex i = 0; i < spans.size(); ++i) {
        SpanNode node;
        node.span = spans[i];
        node.duration_ms = compute_duration_ms(node.span);
        forest.nodes.push_back(std::move(node));

        StartKey key;
        if (auto tp = parse_rfc3339(spans[i].start_time)) {
            key.valid = true;
            key.time = *tp;
        }
        keys.push_back(key);

        if (!spans[i].span_id.empty()) {
            by_id.emplace(spans[i].span_id, i); // first occurrence wins
        }
    }

    // Resolve parents.
    for (NodeIndex i = 0; i < forest.nodes.size(); ++i) {
        const auto& span = forest.nodes[i].span;
        if (is_root_parent_id(span.parent_span_id)) continue;
        auto it = by_id.find(span.parent_span_id);
        if (it == by_id.end() || it->second == i) continue;
        forest.nodes[i].parent = it->second;
    }

    // Break parent cycles: follow each chain; a chain that returns to a node
    // already on the current path is cut at the first node of the cycle.
    std::vector<uint8_t> state(forest.nodes.size(), 0); // 0 new, 1 on path, 2 done
    for (NodeIndex start = 0; start < forest.nodes.size(); ++start) {
        if (state[start] != 0) continue;
        std::vector<NodeIndex> path;
        NodeIndex current = start;
        while (true) {
            if (state[current] == 2) break;
            if (state[current] == 1) {
                auto cycle_begin = std::find(path.begin(), path.end(), current);
                NodeIndex demote = *std::min_element(cycle_begin, path.end());
                forest.nodes[demote].parent.reset();
                break;
            }
            state[current] = 1;
            path.push_back(current);
            if (!forest.nodes[current].parent) break;
            current = *forest.nodes[current].parent;
        }
        for (auto idx : path) state[idx] = 2;
    }

    for (NodeIndex i = 0; i < forest.nodes.size(); ++i) {
        if (auto parent = forest.nodes[i].parent) {
            forest.nodes[*parent].children.push_back(i);
        } else {
            forest.roots.push_back(i);
        }
    }

    // Single top-down pass: sort children and assign depth.
    sort_by_start(forest.roots, keys);
    std::vector<NodeIndex> stack(forest.roots.begin(), forest.roots.end());
    for (auto root : forest.roots) forest.nodes[root].depth = 0;
    while (!stack.empty()) {
        NodeIndex current = stack.back();
        stack.pop_back();
        auto& node = forest.nodes[current];
        sort_by_start(node.children, keys);
        for (auto child : node.children) {
            forest.nodes[child].depth = node.depth + 1;
            stack.push_back(child);
        }
    }
    return forest;
}

std::vector<NodeIndex> flatten_visible(const SpanForest& forest) {
    std::vector<NodeIndex> out;
    out.reserve(forest.nodes.size());
    walk_preorder(forest, true, [&out](NodeIndex i) { out.push_back(i); });
    return out;
}

std::vector<NodeIndex> flatten_all(const SpanForest& forest) {
    std::vector<NodeIndex> out;
    out.reserve(forest.nodes.size());
    walk_preorder(forest, false, [&out](NodeIndex i) { out.push_back(i); });
    return out;
}

std::optional<NodeIndex> find_by_span_id(const SpanForest& forest, std::string_view span_id) {
    for (NodeIndex i = 0; i < forest.nodes.size(); ++i) {
        if (forest.nodes[i].span.span_id == span_id) return i;
    }
    return std::nullopt;
}

void expand_ancestors(SpanForest& forest, NodeIndex index) {
    if (index >= forest.nodes.size()) return;
    auto parent = forest.nodes[index].parent;
    while (parent) {
        forest.nodes[*parent].expanded = true;
        parent = forest.nodes[*parent].parent;
    }
}

void toggle_expanded(SpanForest& forest, NodeIndex index) {
    if (index >= forest.nodes.size()) return;
    forest.nodes[index].expanded = !forest.nodes[index].expanded;
}

std::vector<Span> collect_spans(const SpanForest& forest) {
    std::vector<Span> spans;
    spans.reserve(forest.nodes.size());
    for (const auto& node : forest.nodes) spans.push_back(node.span);
    return spans;
}

} // namespace agenttrace
