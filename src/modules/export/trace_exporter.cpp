// modules/export/trace_exporter.cpp
#include "modules/export/trace_exporter.h"
#include "common/utils/string_utils.h"
#include <fstream>
#include <stdexcept>

namespace agenttrace {

namespace {

// Copies `key` from `src` to `dst` under `as` when present.
void copy_field(const nlohmann::json& src, const char* key, nlohmann::json& dst, const char* as) {
    auto it = src.find(key);
    if (it != src.end()) dst[as] = *it;
}

} // namespace

ExportFormat parse_export_format(std::string_view name) {
    std::string lower = to_lower(name);
    if (lower == "json") return ExportFormat::JSON;
    if (lower == "jaeger") return ExportFormat::JAEGER;
    if (lower == "otel" || lower == "otlp") return ExportFormat::OTEL;
    throw std::invalid_argument("unknown format: " + std::string(name) + " (supported: json, jaeger, otel)");
}

const char* to_string(ExportFormat format) {
    switch (format) {
        case ExportFormat::JSON: return "json";
        case ExportFormat::JAEGER: return "jaeger";
        case ExportFormat::OTEL: return "otel";
    }
    return "json";
}

TraceExporter::TraceExporter(std::string service_name, std::string service_version)
    : service_name_(std::move(service_name)), service_version_(std::move(service_version)) {}

nlohmann::json TraceExporter::export_trace(const std::vector<nlohmann::json>& raw_spans, ExportFormat format) const {
    switch (format) {
        case ExportFormat::JSON: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& span : raw_spans) arr.push_back(span);
            return arr;
        }
        case ExportFormat::JAEGER:
            return to_jaeger(raw_spans);
        case ExportFormat::OTEL:
            return to_otel(raw_spans);
    }
    throw std::invalid_argument("unsupported export format");
}

std::vector<nlohmann::json> TraceExporter::read_raw_spans(const std::string& trace_path) {
    std::ifstream file(trace_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open trace file: " + trace_path);
    }
    std::vector<nlohmann::json> spans;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) continue;
        spans.push_back(std::move(j));
    }
    return spans;
}

nlohmann::json TraceExporter::to_jaeger(const std::vector<nlohmann::json>& raw_spans) const {
    nlohmann::json spans = nlohmann::json::array();
    for (const auto& span : raw_spans) {
        nlohmann::json out = nlohmann::json::object();
        if (auto ctx = span.find("SpanContext"); ctx != span.end() && ctx->is_object()) {
            copy_field(*ctx, "TraceID", out, "traceID");
            copy_field(*ctx, "SpanID", out, "spanID");
        }
        copy_field(span, "Name", out, "operationName");
        copy_field(span, "StartTime", out, "startTime");
        copy_field(span, "EndTime", out, "endTime");

        if (auto attrs = span.find("Attributes"); attrs != span.end() && attrs->is_array()) {
            nlohmann::json tags = nlohmann::json::array();
            for (const auto& attr : *attrs) {
                if (!attr.is_object()) continue;
                tags.push_back({
                    {"key", attr.value("Key", nlohmann::json())},
                    {"value", attr.value("Value", nlohmann::json())},
                });
            }
            out["tags"] = tags;
        }
        spans.push_back(std::move(out));
    }
    return {{"traceID", first_trace_id(raw_spans)}, {"spans", spans}};
}

nlohmann::json TraceExporter::to_otel(const std::vector<nlohmann::json>& raw_spans) const {
    nlohmann::json resource_attrs = nlohmann::json::array({
        {{"key", "service.name"}, {"value", {{"stringValue", service_name_}}}},
        {{"key", "service.version"}, {"value", {{"stringValue", service_version_}}}},
    });
    nlohmann::json scope_span = {
        {"scope", {{"name", service_name_}}},
        {"spans", nlohmann::json(raw_spans)},
    };
    nlohmann::json resource_span = {
        {"resource", {{"attributes", resource_attrs}}},
        {"scopeSpans", nlohmann::json::array({scope_span})},
    };
    return {{"resourceSpans", nlohmann::json::array({resource_span})}};
}

std::string TraceExporter::first_trace_id(const std::vector<nlohmann::json>& raw_spans) {
    if (raw_spans.empty()) return {};
    auto ctx = raw_spans.front().find("SpanContext");
    if (ctx == raw_spans.front().end() || !ctx->is_object()) return {};
    auto id = ctx->find("TraceID");
    if (id == ctx->end() || !id->is_string()) return {};
    return id->get<std::string>();
}

} // namespace agenttrace
