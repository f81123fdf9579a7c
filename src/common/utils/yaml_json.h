#ifndef AGENTTRACE_COMMON_UTILS_YAML_JSON_H
#define AGENTTRACE_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>

namespace agenttrace {

// 将 YAML::Node 转换为 nlohmann::json
nlohmann::json yaml_to_json(const YAML::Node& node);

// Loads a YAML document from disk. Returns std::nullopt when the file does not exist;
// throws std::runtime_error when it exists but cannot be parsed.
std::optional<nlohmann::json> load_yaml_file_as_json(const std::string& file_path);

} // namespace agenttrace

#endif // AGENTTRACE_COMMON_UTILS_YAML_JSON_H
