// modules/parser/span_parser.cpp
#include "modules/parser/span_parser.h"
#include "common/utils/log.h"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace agenttrace {

namespace {

// Missing or null leaves `out` empty; any other non-string type rejects the record.
bool read_string_field(const nlohmann::json& obj, const char* key, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return true;
    if (!it->is_string()) return false;
    out = it->get<std::string>();
    return true;
}

// {"TraceID": "...", "SpanID": "..."}
bool read_context_field(const nlohmann::json& obj, const char* key, std::string* trace_id, std::string& span_id) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return true;
    if (!it->is_object()) return false;
    std::string ignored;
    if (!read_string_field(*it, "TraceID", trace_id ? *trace_id : ignored)) return false;
    return read_string_field(*it, "SpanID", span_id);
}

std::string_view trim_line(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.remove_suffix(1);
    }
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t')) {
        line.remove_prefix(1);
    }
    return line;
}

} // namespace

std::optional<Attribute> SpanParser::parse_attribute(const nlohmann::json& entry) const {
    if (!entry.is_object()) return std::nullopt;
    auto key_it = entry.find("Key");
    if (key_it == entry.end() || !key_it->is_string()) return std::nullopt;

    auto value_it = entry.find("Value");
    if (value_it == entry.end() || !value_it->is_object()) return std::nullopt;
    auto inner = value_it->find("Value");
    if (inner == value_it->end() || inner->is_null()) return std::nullopt;

    Attribute attr;
    attr.key = key_it->get<std::string>();
    if (inner->is_string()) {
        attr.value = inner->get<std::string>();
    } else if (inner->is_boolean()) {
        attr.value = inner->get<bool>();
    } else if (inner->is_number()) {
        attr.value = inner->get<double>();
    } else {
        // arrays / objects are kept as their compact JSON text
        attr.value = inner->dump();
    }
    return attr;
}

std::optional<Span> SpanParser::span_from_json(const nlohmann::json& record) const {
    if (!record.is_object()) return std::nullopt;

    Span span;
    if (!read_string_field(record, "Name", span.name) ||
        !read_string_field(record, "StartTime", span.start_time) ||
        !read_string_field(record, "EndTime", span.end_time) ||
        !read_context_field(record, "SpanContext", &span.trace_id, span.span_id) ||
        !read_context_field(record, "Parent", nullptr, span.parent_span_id)) {
        return std::nullopt;
    }

    if (auto it = record.find("Attributes"); it != record.end() && !it->is_null()) {
        if (!it->is_array()) return std::nullopt;
        for (const auto& entry : *it) {
            if (auto attr = parse_attribute(entry)) {
                span.attributes.push_back(std::move(*attr));
            }
        }
    }

    if (auto it = record.find("Status"); it != record.end() && !it->is_null()) {
        if (!it->is_object()) return std::nullopt;
        if (!read_string_field(*it, "Code", span.status.code) ||
            !read_string_field(*it, "Description", span.status.description)) {
            return std::nullopt;
        }
    }
    return span;
}

std::optional<Span> SpanParser::parse_line(std::string_view line) const {
    line = trim_line(line);
    if (line.empty()) return std::nullopt;

    auto record = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (record.is_discarded()) {
        log_debug("Skipping malformed trace line: " + std::string(line.substr(0, 80)));
        return std::nullopt;
    }
    auto span = span_from_json(record);
    if (!span) {
        log_debug("Skipping trace line with unexpected field types");
    }
    return span;
}

std::vector<Span> SpanParser::parse_lines(const std::vector<std::string>& lines) const {
    std::vector<Span> spans;
    spans.reserve(lines.size());
    for (const auto& line : lines) {
        if (auto span = parse_line(line)) {
            spans.push_back(std::move(*span));
        }
    }
    return spans;
}

std::vector<Span> SpanParser::parse_from_string(std::string_view content) const {
    std::vector<Span> spans;
    std::size_t start = 0;
    while (start < content.size()) {
        auto end = content.find('\n', start);
        if (end == std::string_view::npos) end = content.size();
        if (auto span = parse_line(content.substr(start, end - start))) {
            spans.push_back(std::move(*span));
        }
        start = end + 1;
    }
    return spans;
}

std::vector<Span> SpanParser::parse_from_file(const std::string& file_path) const {
    uint64_t consumed = 0;
    return parse_from_file(file_path, consumed);
}

std::vector<Span> SpanParser::parse_from_file(const std::string& file_path, uint64_t& consumed) const {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open trace file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();
    consumed = consumed_length(content);
    return parse_from_string(content);
}

uint64_t SpanParser::consumed_length(std::string_view content) const {
    auto last_newline = content.rfind('\n');
    std::size_t tail_start = last_newline == std::string_view::npos ? 0 : last_newline + 1;
    if (tail_start == content.size()) return content.size();
    // A writer may still be in the middle of the last line.
    if (parse_line(content.substr(tail_start))) return content.size();
    return tail_start;
}

std::optional<Span> parse_span_line(std::string_view line) {
    return SpanParser{}.parse_line(line);
}

std::vector<Span> parse_spans(std::string_view content) {
    return SpanParser{}.parse_from_string(content);
}

std::vector<Span> parse_span_lines(const std::vector<std::string>& lines) {
    return SpanParser{}.parse_lines(lines);
}

} // namespace agenttrace
