#ifndef AGENTTRACE_COMMON_UTILS_LOG_H
#define AGENTTRACE_COMMON_UTILS_LOG_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace agenttrace {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    OFF
};

// Process-wide threshold; messages below it are dropped. Default: WARNING.
void set_log_level(LogLevel level);
LogLevel get_log_level();

// "debug" | "info" | "warning" | "error" | "off" (case-insensitive)
std::optional<LogLevel> parse_log_level(std::string_view name);

// Writes "[LEVEL] message" to std::cerr.
void log_debug(std::string_view message);
void log_info(std::string_view message);
void log_warning(std::string_view message);
void log_error(std::string_view message);

} // namespace agenttrace

#endif // AGENTTRACE_COMMON_UTILS_LOG_H
