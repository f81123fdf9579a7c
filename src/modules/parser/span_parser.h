// modules/parser/span_parser.h
#ifndef AGENTTRACE_MODULES_PARSER_SPAN_PARSER_H
#define AGENTTRACE_MODULES_PARSER_SPAN_PARSER_H

#include "core/types/span.h" // 引入 Span
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agenttrace {

// Reads newline-delimited JSON span records. Every line is independent:
// an empty, malformed or wrongly-typed line is skipped, never fatal.
class SpanParser {
public:
    std::optional<Span> parse_line(std::string_view line) const;
    std::vector<Span> parse_lines(const std::vector<std::string>& lines) const;
    std::vector<Span> parse_from_string(std::string_view content) const;

    // Throws std::runtime_error when the file cannot be opened.
    std::vector<Span> parse_from_file(const std::string& file_path) const;
    // Also reports how many bytes were consumed: up to the last newline, or
    // the whole content when an unterminated final line already parses.
    std::vector<Span> parse_from_file(const std::string& file_path, uint64_t& consumed) const;

    // Length of the prefix of `content` holding only finished records.
    uint64_t consumed_length(std::string_view content) const;

    std::optional<Span> span_from_json(const nlohmann::json& record) const;

private:
    std::optional<Attribute> parse_attribute(const nlohmann::json& entry) const;
};

// Free-function forms used throughout the engine.
std::optional<Span> parse_span_line(std::string_view line);
std::vector<Span> parse_spans(std::string_view content);
std::vector<Span> parse_span_lines(const std::vector<std::string>& lines);

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_PARSER_SPAN_PARSER_H
