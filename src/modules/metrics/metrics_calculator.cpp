// modules/metrics/metrics_calculator.cpp
#include "modules/metrics/metrics_calculator.h"
#include "common/utils/number_utils.h"
#include "common/utils/string_utils.h"
#include <array>
#include <string_view>

namespace agenttrace {

namespace {

// Both spellings appear in logs written by older runtimes.
constexpr std::array<std::string_view, 2> kTokenKeys = {"agk.stream.tokens", "llm.usage.total_tokens"};

} // namespace

int64_t extract_token_count(const Span& span) {
    int64_t total = 0;
    for (auto key : kTokenKeys) {
        const auto* value = span.attribute(key);
        if (!value) continue;
        auto number = attribute_as_number(*value);
        if (!number) continue;
        // Out-of-range counts are ignored like non-numeric ones.
        if (auto count = checked_number_cast<int64_t>(*number)) total = saturating_add(total, *count);
    }
    return total;
}

bool is_bottleneck_candidate(const SpanNode& node) {
    return node.children.empty() || contains_ci(node.span.name, "llm");
}

MetricsCalculator::MetricsCalculator(double cost_per_token) : cost_per_token_(cost_per_token) {}

void MetricsCalculator::insert_bottleneck(const SpanForest& forest, std::vector<NodeIndex>& top, NodeIndex index) const {
    int64_t duration = forest.nodes[index].duration_ms;
    // Insert before the first strictly shorter entry, so ties keep the earlier node first.
    auto pos = top.begin();
    while (pos != top.end() && forest.nodes[*pos].duration_ms >= duration) ++pos;
    if (static_cast<std::size_t>(pos - top.begin()) >= kBottleneckSlots) return;
    top.insert(pos, index);
    if (top.size() > kBottleneckSlots) top.pop_back();
}

MetricsSnapshot MetricsCalculator::compute(const SpanForest& forest) const {
    MetricsSnapshot snapshot;
    for (NodeIndex i = 0; i < forest.nodes.size(); ++i) {
        const auto& node = forest.nodes[i];
        snapshot.total_tokens = saturating_add(snapshot.total_tokens, extract_token_count(node.span));
        if (is_error_status(node.span.status)) ++snapshot.error_count;

        if (!is_bottleneck_candidate(node)) continue;
        if (!snapshot.slowest || node.duration_ms > forest.nodes[*snapshot.slowest].duration_ms) {
            snapshot.slowest = i;
        }
        insert_bottleneck(forest, snapshot.top3, i);
    }
    snapshot.estimated_cost = static_cast<double>(snapshot.total_tokens) * cost_per_token_;
    return snapshot;
}

MetricsSnapshot compute_metrics(const SpanForest& forest, double cost_per_token) {
    return MetricsCalculator(cost_per_token).compute(forest);
}

} // namespace agenttrace
