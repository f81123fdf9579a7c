// modules/metrics/metrics_calculator.h
#ifndef AGENTTRACE_MODULES_METRICS_METRICS_CALCULATOR_H
#define AGENTTRACE_MODULES_METRICS_METRICS_CALCULATOR_H

#include "core/types/span_node.h" // 引入 SpanForest
#include <cstdint>
#include <optional>
#include <vector>

namespace agenttrace {

inline constexpr double kDefaultCostPerToken = 0.000002;
inline constexpr std::size_t kBottleneckSlots = 3;

struct MetricsSnapshot {
    int64_t total_tokens = 0;
    int error_count = 0;
    std::optional<NodeIndex> slowest;
    std::vector<NodeIndex> top3; // descending by duration_ms
    double estimated_cost = 0.0;
};

// Sum of numeric "llm.usage.total_tokens" and "agk.stream.tokens" values.
int64_t extract_token_count(const Span& span);

// Leaf, or name contains "llm" (case-insensitive).
bool is_bottleneck_candidate(const SpanNode& node);

// Accumulates metrics over the full node set, independent of expansion.
class MetricsCalculator {
public:
    explicit MetricsCalculator(double cost_per_token = kDefaultCostPerToken);

    MetricsSnapshot compute(const SpanForest& forest) const;

private:
    double cost_per_token_;

    void insert_bottleneck(const SpanForest& forest, std::vector<NodeIndex>& top, NodeIndex index) const;
};

MetricsSnapshot compute_metrics(const SpanForest& forest, double cost_per_token = kDefaultCostPerToken);

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_METRICS_METRICS_CALCULATOR_H
