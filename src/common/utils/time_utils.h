#ifndef AGENTTRACE_COMMON_UTILS_TIME_UTILS_H
#define AGENTTRACE_COMMON_UTILS_TIME_UTILS_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace agenttrace {

using TimePoint = std::chrono::system_clock::time_point;

// Parses an RFC3339 timestamp ("2026-01-19T18:36:38.897+09:00", "...Z").
// Fractional seconds are optional (up to nanosecond precision).
std::optional<TimePoint> parse_rfc3339(std::string_view text);

// UTC, millisecond precision: "2026-01-19T09:36:38.897Z"
std::string format_rfc3339(TimePoint tp);

// Whole milliseconds between two RFC3339 strings (truncated toward zero),
// or 0 when either side is missing or does not parse.
int64_t duration_ms_between(std::string_view start, std::string_view end);

int64_t to_unix_millis(TimePoint tp);

} // namespace agenttrace

#endif // AGENTTRACE_COMMON_UTILS_TIME_UTILS_H
