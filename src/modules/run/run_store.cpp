// modules/run/run_store.cpp
#include "modules/run/run_store.h"
#include "modules/audit/event_classifier.h"
#include "modules/parser/span_parser.h"
#include "common/utils/log.h"
#include "common/utils/number_utils.h"
#include "common/utils/string_utils.h"
#include "common/utils/time_utils.h"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>

namespace agenttrace {

namespace fs = std::filesystem;

namespace {

// First key present wins.
const nlohmann::json* find_field(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

template <typename T>
void read_number(const nlohmann::json& j, std::initializer_list<const char*> keys, T& out) {
    if (const auto* v = find_field(j, keys); v && v->is_number()) {
        if (auto number = checked_number_cast<T>(v->get<double>())) {
            out = *number;
        } else {
            log_warning(std::string("Ignoring out-of-range manifest value for ") + *keys.begin());
        }
    }
}

void read_text(const nlohmann::json& j, std::initializer_list<const char*> keys, std::string& out) {
    if (const auto* v = find_field(j, keys); v && v->is_string()) {
        out = v->get<std::string>();
    }
}

} // namespace

RunStore::RunStore(std::string runs_dir, std::string trace_file, std::string manifest_file, double cost_per_token)
    : runs_dir_(std::move(runs_dir)),
      trace_file_(std::move(trace_file)),
      manifest_file_(std::move(manifest_file)),
      cost_per_token_(cost_per_token) {}

std::string RunStore::run_path(const std::string& run_id) const {
    return (fs::path(runs_dir_) / run_id).string();
}

std::string RunStore::trace_path(const std::string& run_id) const {
    return (fs::path(runs_dir_) / run_id / trace_file_).string();
}

std::string RunStore::manifest_path(const std::string& run_id) const {
    return (fs::path(runs_dir_) / run_id / manifest_file_).string();
}

std::vector<std::string> RunStore::list_run_ids() const {
    std::vector<std::string> ids;
    std::error_code ec;
    if (!fs::is_directory(runs_dir_, ec)) return ids;

    for (fs::directory_iterator it(runs_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) ids.push_back(it->path().filename().string());
    }
    if (ec) log_warning("Failed to read runs directory " + runs_dir_ + ": " + ec.message());
    std::sort(ids.begin(), ids.end(), std::greater<>());
    return ids;
}

std::optional<std::string> RunStore::latest_run_id() const {
    std::optional<std::string> latest;
    fs::file_time_type latest_time{};
    std::error_code ec;
    if (!fs::is_directory(runs_dir_, ec)) return latest;

    for (fs::directory_iterator it(runs_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (!it->is_directory(ec) || !name.starts_with("run-")) continue;
        std::error_code time_ec;
        auto mtime = it->last_write_time(time_ec);
        if (time_ec) continue;
        if (!latest || mtime > latest_time) {
            latest = name;
            latest_time = mtime;
        }
    }
    return latest;
}

bool RunStore::has_run(const std::string& run_id) const {
    std::error_code ec;
    return !run_id.empty() && fs::is_directory(run_path(run_id), ec);
}

std::optional<TraceRun> RunStore::read_manifest_file(const std::string& run_id) const {
    std::ifstream file(manifest_path(run_id));
    if (!file.is_open()) return std::nullopt;

    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        log_warning("Ignoring unparseable manifest for run " + run_id);
        return std::nullopt;
    }
    auto manifest = parse_manifest_json(j);
    if (!manifest) {
        log_warning("Ignoring manifest for run " + run_id + ": not a JSON object");
        return std::nullopt;
    }
    if (manifest->run_id.empty()) manifest->run_id = run_id;
    return manifest;
}

TraceRun RunStore::read_manifest(const std::string& run_id) const {
    if (auto manifest = read_manifest_file(run_id)) return *manifest;
    auto spans = SpanParser{}.parse_from_file(trace_path(run_id));
    return synthesize_manifest(run_id, spans, cost_per_token_);
}

RunData RunStore::load_run(const std::string& run_id) const {
    if (!has_run(run_id)) {
        throw std::runtime_error("Trace not found: " + run_id);
    }
    RunData data;
    data.trace_path = trace_path(run_id);
    uint64_t consumed = 0;
    data.spans = SpanParser{}.parse_from_file(data.trace_path, consumed);
    data.trace_offset = consumed;
    if (auto manifest = read_manifest_file(run_id)) {
        data.manifest = *manifest;
    } else {
        data.manifest = synthesize_manifest(run_id, data.spans, cost_per_token_);
    }
    return data;
}

std::vector<RunData> RunStore::load_all_runs() const {
    std::vector<RunData> runs;
    for (const auto& run_id : list_run_ids()) {
        try {
            runs.push_back(load_run(run_id));
        } catch (const std::runtime_error& e) {
            log_warning("Skipping run " + run_id + ": " + e.what());
        }
    }
    std::sort(runs.begin(), runs.end(), [](const RunData& a, const RunData& b) {
        return a.manifest.run_id > b.manifest.run_id;
    });
    return runs;
}

TraceRun synthesize_manifest(const std::string& run_id, const std::vector<Span>& spans, double cost_per_token) {
    TraceRun run;
    run.run_id = run_id;
    run.command = command_from_run_id(run_id);
    run.status = "completed";
    run.synthesized = true;
    run.span_count = static_cast<int>(spans.size());

    std::optional<TimePoint> first;
    std::optional<TimePoint> last;
    for (const auto& span : spans) {
        if (classify_span(span.name) == EventType::LLM_CALL) ++run.llm_calls;
        run.total_tokens = saturating_add(run.total_tokens, extract_token_count(span));

        if (auto start = parse_rfc3339(span.start_time)) {
            if (!first || *start < *first) first = start;
            if (!last || *start > *last) last = start;
        }
        if (auto end = parse_rfc3339(span.end_time)) {
            if (!last || *end > *last) last = end;
        }
    }

    if (first) {
        run.start_time = format_rfc3339(*first);
        run.end_time = format_rfc3339(*last);
        run.duration_seconds = std::chrono::duration<double>(*last - *first).count();
    }
    run.estimated_cost = static_cast<double>(run.total_tokens) * cost_per_token;
    return run;
}

std::optional<TraceRun> parse_manifest_json(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    TraceRun run;
    read_text(j, {"run_id", "RunID"}, run.run_id);
    read_text(j, {"command", "Command"}, run.command);
    read_text(j, {"status", "Status"}, run.status);
    read_text(j, {"start_time", "StartTime"}, run.start_time);
    read_text(j, {"end_time", "EndTime"}, run.end_time);
    read_number(j, {"duration_seconds", "Duration"}, run.duration_seconds);
    read_number(j, {"span_count", "SpanCount"}, run.span_count);
    read_number(j, {"llm_calls", "LLMCalls"}, run.llm_calls);
    read_number(j, {"total_tokens", "TotalTokens"}, run.total_tokens);
    read_number(j, {"estimated_cost", "EstimatedCost"}, run.estimated_cost);
    return run;
}

nlohmann::json manifest_to_json(const TraceRun& run) {
    return {
        {"run_id", run.run_id},
        {"command", run.command},
        {"status", run.status},
        {"start_time", run.start_time},
        {"end_time", run.end_time},
        {"duration_seconds", run.duration_seconds},
        {"span_count", run.span_count},
        {"llm_calls", run.llm_calls},
        {"total_tokens", run.total_tokens},
        {"estimated_cost", run.estimated_cost},
    };
}

std::string command_from_run_id(const std::string& run_id) {
    auto parts = split(run_id, '-');
    if (parts.size() <= 2) return "agent";
    return join(std::vector<std::string>(parts.begin() + 2, parts.end()), "-");
}

} // namespace agenttrace
