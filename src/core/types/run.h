#ifndef AGENTTRACE_CORE_TYPES_RUN_H
#define AGENTTRACE_CORE_TYPES_RUN_H

#include "span.h" // 引入 Span
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agenttrace {

// Summary of one run, read from manifest.json or derived from its spans.
struct TraceRun {
    std::string run_id;
    std::string command;
    std::string status;
    std::string start_time; // RFC3339
    std::string end_time;
    double duration_seconds = 0.0;
    int span_count = 0;
    int llm_calls = 0;
    int64_t total_tokens = 0;
    double estimated_cost = 0.0;
    bool synthesized = false; // true when no usable manifest was found
};

struct RunData {
    TraceRun manifest;
    std::vector<Span> spans;
    std::string trace_path;
    // Bytes of the trace file behind `spans`; live tailing resumes here.
    std::optional<uint64_t> trace_offset;
};

} // namespace agenttrace

#endif // AGENTTRACE_CORE_TYPES_RUN_H
