// modules/export/trace_exporter.h
#ifndef AGENTTRACE_MODULES_EXPORT_TRACE_EXPORTER_H
#define AGENTTRACE_MODULES_EXPORT_TRACE_EXPORTER_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace agenttrace {

enum class ExportFormat : uint8_t {
    JSON,   // raw span objects as an array
    JAEGER, // {traceID, spans:[...]}
    OTEL    // resourceSpans / scopeSpans envelope
};

// "json" | "jaeger" | "otel" | "otlp"; throws std::invalid_argument otherwise.
ExportFormat parse_export_format(std::string_view name);
const char* to_string(ExportFormat format);

class TraceExporter {
public:
    explicit TraceExporter(std::string service_name = "agenttrace", std::string service_version = "1.0.0");

    nlohmann::json export_trace(const std::vector<nlohmann::json>& raw_spans, ExportFormat format) const;

    // Raw span objects of a trace file, malformed lines skipped.
    // Throws std::runtime_error if the file cannot be opened.
    static std::vector<nlohmann::json> read_raw_spans(const std::string& trace_path);

private:
    std::string service_name_;
    std::string service_version_;

    nlohmann::json to_jaeger(const std::vector<nlohmann::json>& raw_spans) const;
    nlohmann::json to_otel(const std::vector<nlohmann::json>& raw_spans) const;
    // Helper: TraceID of the first span, or ""
    static std::string first_trace_id(const std::vector<nlohmann::json>& raw_spans);
};

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_EXPORT_TRACE_EXPORTER_H
