// modules/config/trace_config.cpp
#include "modules/config/trace_config.h"
#include "common/utils/yaml_json.h"
#include <cstdlib>
#include <stdexcept>

namespace agenttrace {

namespace {

void read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    if (j[key].is_string() && !j[key].get<std::string>().empty()) {
        out = j[key].get<std::string>();
    } else {
        log_warning(std::string("Config key '") + key + "' must be a non-empty string, using default");
    }
}

} // namespace

TraceConfig trace_config_from_json(const nlohmann::json& j) {
    TraceConfig config;
    if (!j.is_object()) {
        if (!j.is_null()) log_warning("Config root must be a mapping, using defaults");
        return config;
    }

    read_string(j, "runs_dir", config.runs_dir);
    read_string(j, "trace_file", config.trace_file);
    read_string(j, "manifest_file", config.manifest_file);

    if (j.contains("poll_interval_ms") && !j["poll_interval_ms"].is_null()) {
        if (j["poll_interval_ms"].is_number_integer() && j["poll_interval_ms"].get<int>() > 0) {
            config.poll_interval_ms = j["poll_interval_ms"].get<int>();
        } else {
            log_warning("Config key 'poll_interval_ms' must be a positive integer, using default");
        }
    }
    if (j.contains("cost_per_token") && !j["cost_per_token"].is_null()) {
        if (j["cost_per_token"].is_number() && j["cost_per_token"].get<double>() >= 0.0) {
            config.cost_per_token = j["cost_per_token"].get<double>();
        } else {
            log_warning("Config key 'cost_per_token' must be a non-negative number, using default");
        }
    }
    if (j.contains("max_label_length") && !j["max_label_length"].is_null()) {
        if (j["max_label_length"].is_number_integer() && j["max_label_length"].get<int>() > 3) {
            config.max_label_length = j["max_label_length"].get<std::size_t>();
        } else {
            log_warning("Config key 'max_label_length' must be an integer greater than 3, using default");
        }
    }
    if (j.contains("log_level") && j["log_level"].is_string()) {
        if (auto level = parse_log_level(j["log_level"].get<std::string>())) {
            config.log_level = *level;
        } else {
            log_warning("Unknown log_level '" + j["log_level"].get<std::string>() + "', using default");
        }
    }
    return config;
}

void apply_environment_overrides(TraceConfig& config) {
    if (const char* dir = std::getenv(kRunsDirEnv); dir && *dir) {
        config.runs_dir = dir;
    }
}

TraceConfig load_trace_config(const std::string& path) {
    TraceConfig config;
    try {
        if (auto j = load_yaml_file_as_json(path)) {
            config = trace_config_from_json(*j);
        } else {
            log_debug("No config file at " + path + ", using defaults");
        }
    } catch (const std::runtime_error& e) {
        log_warning(std::string(e.what()) + ", using defaults");
    }
    apply_environment_overrides(config);
    return config;
}

} // namespace agenttrace
