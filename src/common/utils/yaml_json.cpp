// common/utils/yaml_json.cpp
#include "common/utils/yaml_json.h"
#include <yaml-cpp/yaml.h>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace agenttrace {

namespace {

bool is_yaml_null(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

std::optional<bool> as_yaml_bool(const std::string& s) {
    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    return std::nullopt;
}

// Integers first so that "500" stays an integer and is_number_integer() holds for it.
std::optional<nlohmann::json> as_yaml_number(const std::string& s) {
    const char* begin = s.c_str();
    char* end = nullptr;

    errno = 0;
    long long ll_val = std::strtoll(begin, &end, 10);
    if (end != begin && *end == '\0' && errno != ERANGE) {
        return nlohmann::json(ll_val);
    }

    errno = 0;
    double d_val = std::strtod(begin, &end);
    if (end != begin && *end == '\0' && errno != ERANGE) {
        return nlohmann::json(d_val);
    }
    return std::nullopt;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Scalar: {
            const std::string& s = node.Scalar();
            // Quoted scalars carry the "!" tag and are never reinterpreted.
            if (node.Tag() == "!") return s;
            if (is_yaml_null(s)) return nullptr;
            if (auto b = as_yaml_bool(s)) return *b;
            if (auto n = as_yaml_number(s)) return *n;
            return s;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

std::optional<nlohmann::json> load_yaml_file_as_json(const std::string& file_path) {
    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec)) {
        return std::nullopt;
    }
    try {
        return yaml_to_json(YAML::LoadFile(file_path));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file " + file_path + ": " + e.what());
    }
}

} // namespace agenttrace
