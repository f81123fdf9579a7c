// common/utils/log.cpp
#include "common/utils/log.h"
#include "common/utils/string_utils.h"
#include <iostream>

namespace agenttrace {

namespace {

LogLevel g_log_level = LogLevel::WARNING;

void write(LogLevel level, const char* tag, std::string_view message) {
    if (level < g_log_level) return;
    std::cerr << "[" << tag << "] " << message << std::endl;
}

} // namespace

void set_log_level(LogLevel level) {
    g_log_level = level;
}

LogLevel get_log_level() {
    return g_log_level;
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower = to_lower(name);
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "off" || lower == "none") return LogLevel::OFF;
    return std::nullopt;
}

void log_debug(std::string_view message) { write(LogLevel::DEBUG, "DEBUG", message); }
void log_info(std::string_view message) { write(LogLevel::INFO, "INFO", message); }
void log_warning(std::string_view message) { write(LogLevel::WARNING, "WARNING", message); }
void log_error(std::string_view message) { write(LogLevel::ERROR, "ERROR", message); }

} // namespace agenttrace
