#ifndef AGENTTRACE_CORE_ENGINE_H
#define AGENTTRACE_CORE_ENGINE_H

#include "core/types/run.h"
#include "core/types/trace_event.h"
#include "modules/config/trace_config.h"
#include "modules/explorer/trace_explorer.h"
#include "modules/export/trace_exporter.h"
#include "modules/run/run_store.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agenttrace {

// Entry point over a runs directory: loads runs and offers the audit,
// diagram, export, summary and explorer views of them.
class TraceEngine {
public:
    // Loads the YAML config (defaults when absent) and applies its log level.
    static std::unique_ptr<TraceEngine> from_config_file(const std::string& config_path = kDefaultConfigFile);

    explicit TraceEngine(TraceConfig config);

    // "" -> latest run, nullopt when there is none.
    // Throws std::runtime_error("Trace not found: <id>") for an unknown id.
    std::optional<std::string> resolve_run_id(const std::string& run_id) const;

    RunData load_run(const std::string& run_id) const;
    std::vector<RunData> load_all_runs() const;

    TraceObject collect(const std::string& run_id) const;
    // TraceObject JSON, plus the reasoning analysis under "analysis" when asked.
    nlohmann::json audit(const std::string& run_id, bool with_analysis = false) const;
    // Markdown report with the Mermaid flowchart.
    std::string mermaid(const std::string& run_id) const;
    nlohmann::json export_run(const std::string& run_id, ExportFormat format) const;
    std::string summary(const std::string& run_id) const;
    std::string list_table() const;

    // Interactive sessions; both block until the user quits.
    void explore() const;
    void show(const std::string& run_id, bool live = true) const;

    ExplorerOptions explorer_options() const;
    const TraceConfig& config() const { return config_; }
    const RunStore& store() const { return store_; }

private:
    TraceConfig config_;
    RunStore store_;
};

} // namespace agenttrace

#endif
