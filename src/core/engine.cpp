// src/core/engine.cpp
#include "agenttrace/core/engine.h"
#include "common/utils/log.h"
#include "common/utils/string_utils.h"
#include "common/utils/template_renderer.h"
#include "common/utils/time_utils.h"
#include "modules/audit/trace_collector.h"
#include "modules/diagram/mermaid_generator.h"
#include "modules/explorer/terminal_app.h"
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace agenttrace {

namespace {

constexpr const char* kSummaryTemplate = R"(
Run Information
{{ rule }}
Run ID:              {{ run_id }}
Command:             {{ command }}
Status:              {{ status }}
Started:             {{ started }}
Completed:           {{ completed }}
Duration:            {{ fixed(duration_seconds, 2) }}s

Execution Stats
{{ rule }}
Spans:               {{ span_count }}
LLM Calls:           {{ llm_calls }}
Total Tokens:        {{ total_tokens }}
Estimated Cost:      ${{ fixed(estimated_cost, 4) }}
{% if synthesized %}Source:              derived from trace (no manifest)
{% endif %}
Files
{{ rule }}
Trace:               {{ trace_path }}
Manifest:            {{ manifest_path }}
)";

constexpr const char* kListTemplate = R"(
{{ pad("Run ID", 40) }} {{ pad("Command", 12) }} {{ pad("Status", 8) }} {{ pad("Duration", 10) }} {{ pad("LLM Calls", 10) }} Tokens
{{ rule }}
{% for run in runs %}{{ pad(run.run_id, 40) }} {{ pad(run.command, 12) }} {{ pad(run.status, 8) }} {{ pad(run.duration, 10) }} {{ pad(run.llm_calls, 10) }} {{ run.total_tokens }}
{% endfor %}
)";

constexpr const char* kNoRunsMessage = "No traces found. Run an instrumented agent to record traces.";

// "2026-01-19T09:36:38.897Z" -> "2026-01-19 09:36:38 UTC"
std::string display_time(const std::string& rfc3339) {
    auto tp = parse_rfc3339(rfc3339);
    if (!tp) return rfc3339.empty() ? "-" : rfc3339;
    std::string text = format_rfc3339(*tp).substr(0, 19);
    text[10] = ' ';
    return text + " UTC";
}

bool run_ok(const TraceRun& run) {
    return run.status == "completed" || run.status == "ok";
}

} // namespace

std::unique_ptr<TraceEngine> TraceEngine::from_config_file(const std::string& config_path) {
    TraceConfig config = load_trace_config(config_path);
    set_log_level(config.log_level);
    log_debug("Runs directory: " + config.runs_dir);
    return std::make_unique<TraceEngine>(std::move(config));
}

TraceEngine::TraceEngine(TraceConfig config)
    : config_(std::move(config)),
      store_(config_.runs_dir, config_.trace_file, config_.manifest_file, config_.cost_per_token) {}

std::optional<std::string> TraceEngine::resolve_run_id(const std::string& run_id) const {
    if (run_id.empty()) {
        auto latest = store_.latest_run_id();
        if (latest) log_debug("Using latest run " + *latest);
        return latest;
    }
    if (!store_.has_run(run_id)) {
        throw std::runtime_error("Trace not found: " + run_id);
    }
    return run_id;
}

RunData TraceEngine::load_run(const std::string& run_id) const {
    return store_.load_run(run_id);
}

std::vector<RunData> TraceEngine::load_all_runs() const {
    return store_.load_all_runs();
}

TraceObject TraceEngine::collect(const std::string& run_id) const {
    RunData run = store_.load_run(run_id);
    TraceCollector collector(run_id, std::move(run.spans));
    TraceObject obj = collector.collect(config_.cost_per_token);
    obj.command = run.manifest.command;
    return obj;
}

nlohmann::json TraceEngine::audit(const std::string& run_id, bool with_analysis) const {
    TraceObject obj = collect(run_id);
    nlohmann::json j = to_json(obj);
    if (with_analysis) {
        j["analysis"] = to_json(analyze_reasoning(obj));
    }
    return j;
}

std::string TraceEngine::mermaid(const std::string& run_id) const {
    MermaidOptions options;
    options.max_label_length = config_.max_label_length;
    return render_mermaid_document(collect(run_id), run_id, options);
}

nlohmann::json TraceEngine::export_run(const std::string& run_id, ExportFormat format) const {
    auto raw = TraceExporter::read_raw_spans(store_.trace_path(run_id));
    log_info("Exporting " + std::to_string(raw.size()) + " spans as " + to_string(format));
    return TraceExporter().export_trace(raw, format);
}

std::string TraceEngine::summary(const std::string& run_id) const {
    TraceRun run = store_.read_manifest(run_id);
    nlohmann::json data = {
        {"rule", repeat("─", 60)},
        {"run_id", run.run_id.empty() ? run_id : run.run_id},
        {"command", run.command},
        {"status", (run_ok(run) ? "✅ " : "❌ ") + run.status},
        {"started", display_time(run.start_time)},
        {"completed", display_time(run.end_time)},
        {"duration_seconds", run.duration_seconds},
        {"span_count", run.span_count},
        {"llm_calls", run.llm_calls},
        {"total_tokens", run.total_tokens},
        {"estimated_cost", run.estimated_cost},
        {"synthesized", run.synthesized},
        {"trace_path", store_.trace_path(run_id)},
        {"manifest_path", store_.manifest_path(run_id)},
    };
    return InjaTemplateRenderer::render(kSummaryTemplate, data);
}

std::string TraceEngine::list_table() const {
    auto ids = store_.list_run_ids();
    if (ids.empty()) return std::string(kNoRunsMessage) + "\n";

    nlohmann::json runs = nlohmann::json::array();
    for (const auto& id : ids) {
        try {
            TraceRun run = store_.read_manifest(id);
            char duration[32];
            std::snprintf(duration, sizeof(duration), "%.2fs", run.duration_seconds);
            runs.push_back({
                {"run_id", run.run_id.empty() ? id : run.run_id},
                {"command", run.command},
                {"status", run_ok(run) ? "OK" : "ERROR"},
                {"duration", std::string(duration)},
                {"llm_calls", run.llm_calls},
                {"total_tokens", run.total_tokens},
            });
        } catch (const std::runtime_error& e) {
            log_warning("Skipping run " + id + ": " + e.what());
        }
    }
    if (runs.empty()) return "No valid traces found.\n";
    return InjaTemplateRenderer::render(kListTemplate, {{"rule", repeat("-", 92)}, {"runs", runs}});
}

ExplorerOptions TraceEngine::explorer_options() const {
    ExplorerOptions options;
    options.cost_per_token = config_.cost_per_token;
    return options;
}

void TraceEngine::explore() const {
    auto runs = store_.load_all_runs();
    log_info("Loaded " + std::to_string(runs.size()) + " run(s) from " + config_.runs_dir);
    TraceExplorer explorer(std::move(runs), explorer_options());
    TerminalApp(explorer, std::chrono::milliseconds(config_.poll_interval_ms)).run();
}

void TraceEngine::show(const std::string& run_id, bool live) const {
    TraceExplorer explorer(store_.load_run(run_id), live, explorer_options());
    TerminalApp(explorer, std::chrono::milliseconds(config_.poll_interval_ms)).run();
}

} // namespace agenttrace
