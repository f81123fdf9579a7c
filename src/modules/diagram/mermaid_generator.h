// modules/diagram/mermaid_generator.h
#ifndef AGENTTRACE_MODULES_DIAGRAM_MERMAID_GENERATOR_H
#define AGENTTRACE_MODULES_DIAGRAM_MERMAID_GENERATOR_H

#include "core/types/trace_event.h" // 引入 TraceObject
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace agenttrace {

struct MermaidOptions {
    std::size_t max_label_length = 60;
};

// Event indices of a directed edge (from, to).
using MermaidEdge = std::pair<std::size_t, std::size_t>;

// Renders a TraceObject as a top-down Mermaid flowchart fenced in ```mermaid.
//
// Edges follow the event hierarchy (ParentID -> SpanID). Children of a
// "workflow.sequential" event that are workflow steps are chained in step
// order instead of fanned out, and the non-step descendants of each step are
// chained chronologically below it. Events with unresolved parents get no
// incoming edge. Pure; never throws on a well-formed TraceObject.
class MermaidGenerator {
public:
    explicit MermaidGenerator(MermaidOptions options = {});

    std::string generate(const TraceObject& obj) const;

    // Deduplicated edges in emission order.
    std::vector<MermaidEdge> edges(const TraceObject& obj) const;

    std::string node_label(const TraceEvent& event) const;

private:
    MermaidOptions options_;
};

bool is_workflow_sequential(const TraceEvent& event);
bool is_workflow_step(const TraceEvent& event);
std::optional<int> step_index(const TraceEvent& event);

std::string generate_mermaid(const TraceObject& obj);

// Markdown report: title, summary and the fenced flowchart.
std::string render_mermaid_document(const TraceObject& obj, const std::string& run_id,
                                    const MermaidOptions& options = {});

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_DIAGRAM_MERMAID_GENERATOR_H
