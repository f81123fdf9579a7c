// modules/config/trace_config.h
#ifndef AGENTTRACE_MODULES_CONFIG_TRACE_CONFIG_H
#define AGENTTRACE_MODULES_CONFIG_TRACE_CONFIG_H

#include "common/utils/log.h" // 引入 LogLevel
#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace agenttrace {

inline constexpr const char* kDefaultConfigFile = "agenttrace.yaml";
inline constexpr const char* kRunsDirEnv = "AGENTTRACE_RUNS_DIR";

struct TraceConfig {
    std::string runs_dir = ".agk/runs";
    std::string trace_file = "trace.jsonl";
    std::string manifest_file = "manifest.json";
    int poll_interval_ms = 500;
    double cost_per_token = 0.000002;
    LogLevel log_level = LogLevel::WARNING;
    std::size_t max_label_length = 60;
};

// Overlays the keys present in `j` on the defaults. Wrongly typed or out of
// range values are reported as warnings and ignored.
TraceConfig trace_config_from_json(const nlohmann::json& j);

// Reads a YAML config file. A missing file yields the defaults; a file that
// fails to parse is reported as a warning and also yields the defaults.
// The AGENTTRACE_RUNS_DIR environment variable overrides runs_dir.
TraceConfig load_trace_config(const std::string& path = kDefaultConfigFile);

void apply_environment_overrides(TraceConfig& config);

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_CONFIG_TRACE_CONFIG_H
