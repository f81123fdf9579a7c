// modules/run/run_store.h
#ifndef AGENTTRACE_MODULES_RUN_RUN_STORE_H
#define AGENTTRACE_MODULES_RUN_RUN_STORE_H

#include "core/types/run.h" // 引入 TraceRun, RunData
#include "modules/metrics/metrics_calculator.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace agenttrace {

// Runs live in <runs_dir>/<run-id>/ with a trace file and an optional manifest.
class RunStore {
public:
    RunStore(std::string runs_dir,
             std::string trace_file = "trace.jsonl",
             std::string manifest_file = "manifest.json",
             double cost_per_token = kDefaultCostPerToken);

    // Every run directory, newest id first. Empty if runs_dir does not exist.
    std::vector<std::string> list_run_ids() const;

    // Most recently modified "run-*" directory.
    std::optional<std::string> latest_run_id() const;

    bool has_run(const std::string& run_id) const;

    // Manifest from disk, or one derived from the trace when the manifest is
    // missing or unusable. Throws std::runtime_error if neither is readable.
    TraceRun read_manifest(const std::string& run_id) const;

    // Throws std::runtime_error when the run or its trace file cannot be read.
    RunData load_run(const std::string& run_id) const;

    // Unreadable runs are skipped with a warning. Sorted by run id, newest first.
    std::vector<RunData> load_all_runs() const;

    std::string run_path(const std::string& run_id) const;
    std::string trace_path(const std::string& run_id) const;
    std::string manifest_path(const std::string& run_id) const;

    const std::string& runs_dir() const { return runs_dir_; }

private:
    std::string runs_dir_;
    std::string trace_file_;
    std::string manifest_file_;
    double cost_per_token_;

    std::optional<TraceRun> read_manifest_file(const std::string& run_id) const;
};

// Summary derived from the spans alone: time range over start and end
// times, span and LLM-call counts, token total and cost estimate.
TraceRun synthesize_manifest(const std::string& run_id, const std::vector<Span>& spans,
                             double cost_per_token = kDefaultCostPerToken);

// Accepts snake_case ("run_id") or PascalCase ("RunID") keys.
// Returns nullopt unless `j` is an object.
std::optional<TraceRun> parse_manifest_json(const nlohmann::json& j);

nlohmann::json manifest_to_json(const TraceRun& run);

// "run-<timestamp>-<command>" -> "<command>" (which may itself contain '-'),
// "run-<timestamp>" -> "agent".
std::string command_from_run_id(const std::string& run_id);

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_RUN_RUN_STORE_H
