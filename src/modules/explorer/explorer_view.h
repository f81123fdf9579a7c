// modules/explorer/explorer_view.h
#ifndef AGENTTRACE_MODULES_EXPLORER_EXPLORER_VIEW_H
#define AGENTTRACE_MODULES_EXPLORER_EXPLORER_VIEW_H

#include "modules/explorer/styled_text.h"
#include "modules/explorer/trace_explorer.h"
#include <cstddef>

namespace agenttrace {

// Terminals narrower than this get the stacked single-column layout.
inline constexpr int kWideLayoutMinWidth = 100;

// Renders a TraceExplorer into styled text. Pure: the same state always
// yields the same lines, and nothing here touches the terminal.
class ExplorerView {
public:
    explicit ExplorerView(const TraceExplorer& model);

    // Exactly height() lines, each fitted to width() columns. The header
    // and the status bar stay visible when the body does not fit.
    StyledLines render() const;

    StyledLine span_line(NodeIndex index, bool selected) const;
    StyledLines run_summary() const;

private:
    const TraceExplorer& model_;
    std::size_t width_;

    StyledLines header() const;
    StyledLines status_bar() const;
    StyledLines run_list_view(std::size_t rows) const;
    StyledLines tree_view(std::size_t rows) const;
    StyledLines detail_view(std::size_t rows) const;

    StyledLines tree_panel(std::size_t rows) const;
    StyledLines detail_panel(std::size_t width, std::size_t rows) const;
    StyledLines metadata_panel(std::size_t rows) const;
    StyledLine tab_bar() const;
    StyledLine search_bar() const;
    StyledLine separator(std::size_t width) const;
};

StyledLines render_explorer(const TraceExplorer& model);

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_EXPLORER_EXPLORER_VIEW_H
