#ifndef AGENTTRACE_COMMON_UTILS_STRING_UTILS_H
#define AGENTTRACE_COMMON_UTILS_STRING_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace agenttrace {

// ASCII lower-casing; bytes >= 0x80 are left untouched.
std::string to_lower(std::string_view s);

// Case-insensitive substring test. An empty needle always matches.
bool contains_ci(std::string_view haystack, std::string_view needle);

std::vector<std::string> split(std::string_view s, char delimiter);
std::string join(const std::vector<std::string>& parts, std::string_view separator);

// Number of terminal columns (counts UTF-8 code points, not bytes).
std::size_t display_width(std::string_view s);

// Cuts to at most `max_width` code points, replacing the tail with "..." when cut.
std::string truncate_utf8(std::string_view s, std::size_t max_width);

// Left-aligns and pads with spaces (or truncates) to exactly `width` columns.
std::string pad_right(std::string_view s, std::size_t width);

std::string repeat(std::string_view s, std::size_t count);

// 1234567 -> "1,234,567"
std::string format_number(int64_t value);

// Hard-wraps text at `width` columns, keeping existing newlines.
std::vector<std::string> wrap_text(std::string_view text, std::size_t width);

} // namespace agenttrace

#endif // AGENTTRACE_COMMON_UTILS_STRING_UTILS_H
