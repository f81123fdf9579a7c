// modules/tail/live_tail.h
#ifndef AGENTTRACE_MODULES_TAIL_LIVE_TAIL_H
#define AGENTTRACE_MODULES_TAIL_LIVE_TAIL_H

#include "core/types/span.h" // 引入 Span
#include <cstdint>
#include <string>
#include <vector>

namespace agenttrace {

struct TailResult {
    std::vector<Span> spans;
    uint64_t new_offset = 0;
};

// Reads the complete records appended to `path` after `last_offset`.
// The returned offset points just past the last newline consumed, so a
// record still being written is picked up by the next poll. A file that
// has not grown, or cannot be stat'ed or opened, yields no spans and
// leaves the offset unchanged. The file is re-opened on every call.
TailResult poll_trace_file(const std::string& path, uint64_t last_offset);

// Follows one trace file. Starts after the last finished record, so only
// spans written after construction are reported; a record still being
// written at construction time is reported once its line is complete.
class LiveTailMonitor {
public:
    explicit LiveTailMonitor(std::string path);
    LiveTailMonitor(std::string path, uint64_t start_offset);

    std::vector<Span> poll();

    const std::string& path() const { return path_; }
    uint64_t offset() const { return offset_; }

private:
    std::string path_;
    uint64_t offset_ = 0;
};

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_TAIL_LIVE_TAIL_H
