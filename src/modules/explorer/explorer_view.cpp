// modules/explorer/explorer_view.cpp
#include "modules/explorer/explorer_view.h"
#include "modules/explorer/span_display.h"
#include "common/utils/string_utils.h"
#include <algorithm>
#include <cstdio>
#include <string>

namespace agenttrace {

namespace {

constexpr const char* kTitle = "Agent Trace Explorer";
constexpr int64_t kBottleneckThresholdMs = 100;

// Appends `src[offset..]` to `out`, exactly `rows` lines.
void take(StyledLines& out, const StyledLines& src, std::size_t offset, std::size_t rows) {
    for (std::size_t i = 0; i < rows; ++i) {
        std::size_t at = offset + i;
        out.push_back(at < src.size() ? src[at] : StyledLine());
    }
}

std::size_t scroll_offset(int scroll, std::size_t content, std::size_t rows) {
    if (content <= rows) return 0;
    return std::min(static_cast<std::size_t>(std::max(scroll, 0)), content - rows);
}

bool run_ok(const TraceRun& run) {
    return run.status == "completed" || run.status == "ok";
}

std::string format_fixed(double value, int digits) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", digits, value);
    return buf;
}

std::string focus_label(const TraceExplorer& model) {
    switch (model.view_mode()) {
        case ViewMode::RUN_LIST: return "Run List";
        case ViewMode::DETAIL: return std::string("Detail:") + to_string(model.tab());
        case ViewMode::TREE: break;
    }
    switch (model.focus()) {
        case FocusArea::TREE: return "Tree";
        case FocusArea::DETAILS: return std::string("Details:") + to_string(model.tab());
        case FocusArea::METADATA: return "Metadata";
    }
    return "Tree";
}

void add_key(StyledLine& line, const char* key, const char* action) {
    line.add(" ");
    line.add(key, Style::HEADER);
    line.add(std::string(" ") + action, Style::MUTED);
}

} // namespace

ExplorerView::ExplorerView(const TraceExplorer& model)
    : model_(model), width_(static_cast<std::size_t>(std::max(model.width(), 1))) {}

StyledLines ExplorerView::render() const {
    auto height = static_cast<std::size_t>(std::max(model_.height(), 1));
    StyledLines top = header();
    StyledLines bottom = status_bar();
    std::size_t chrome = top.size() + bottom.size();
    std::size_t rows = height > chrome ? height - chrome : 0;

    StyledLines body;
    switch (model_.view_mode()) {
        case ViewMode::RUN_LIST: body = run_list_view(rows); break;
        case ViewMode::TREE: body = tree_view(rows); break;
        case ViewMode::DETAIL: body = detail_view(rows); break;
    }

    StyledLines out = std::move(top);
    take(out, body, 0, rows);
    out.insert(out.end(), bottom.begin(), bottom.end());
    if (out.size() > height) out.resize(height);
    for (auto& line : out) line = line.fitted(width_);
    return out;
}

StyledLine ExplorerView::separator(std::size_t width) const {
    return StyledLine(repeat("─", width), Style::BORDER);
}

StyledLines ExplorerView::header() const {
    StyledLine title;
    if (model_.live()) title.add("🔴 LIVE  ", Style::ERROR);
    title.add(kTitle, Style::TITLE);
    return {title, separator(width_)};
}

StyledLines ExplorerView::status_bar() const {
    StyledLine line;
    line.add(" " + focus_label(model_) + " ", Style::SELECTED);
    if (!model_.search_matches().empty() && !model_.search_mode()) {
        line.add(" 🔍 " + std::to_string(model_.search_matches().size()) + " matches", Style::SUCCESS);
    }
    line.add(" ");

    if (model_.search_mode()) {
        add_key(line, "[Type]", "Search");
        add_key(line, "[Enter]", "Confirm");
        add_key(line, "[Esc]", "Cancel");
    } else {
        switch (model_.view_mode()) {
            case ViewMode::RUN_LIST:
                add_key(line, "[↑↓]", "Navigate");
                add_key(line, "[Enter]", "Open");
                add_key(line, "[q]", "Quit");
                break;
            case ViewMode::TREE:
                add_key(line, "[Tab]", "Focus");
                add_key(line, "[←→]", "Tabs");
                add_key(line, "[↑↓]", "Nav");
                add_key(line, "[h/l]", "Fold");
                add_key(line, "[d]", "Detail");
                add_key(line, "[/]", "Search");
                if (!model_.search_matches().empty()) add_key(line, "[n/N]", "Match");
                add_key(line, "[e]", "Errors");
                if (model_.multi_run()) add_key(line, "[[/]]", "Run");
                add_key(line, "[q]", "Quit");
                break;
            case ViewMode::DETAIL:
                add_key(line, "[←→]", "Tabs");
                add_key(line, "[1-5]", "Jump");
                add_key(line, "[↑↓]", "Scroll");
                add_key(line, "[Esc]", "Back");
                add_key(line, "[q]", "Quit");
                break;
        }
    }
    return {separator(width_), line};
}

// --- Run list ---

StyledLines ExplorerView::run_list_view(std::size_t rows) const {
    StyledLines out;
    const auto& runs = model_.runs();
    if (runs.empty()) {
        out.emplace_back();
        out.emplace_back("No traces found. Run an instrumented agent to record traces.", Style::MUTED);
        return out;
    }

    std::size_t max_visible = std::max<std::size_t>(rows > 2 ? rows - 2 : 1, 1);
    std::size_t cursor = model_.run_cursor();
    std::size_t offset = cursor >= max_visible ? cursor - max_visible + 1 : 0;

    for (std::size_t i = offset; i < runs.size() && i < offset + max_visible; ++i) {
        const TraceRun& run = runs[i].manifest;
        char figures[64];
        std::snprintf(figures, sizeof(figures), "  %7.2fs  %3d LLM  ", run.duration_seconds, run.llm_calls);
        std::string text = pad_right(run.run_id, 28) + "  " + pad_right(run.command, 12) + figures;

        StyledLine line;
        bool selected = i == cursor;
        line.add(selected ? "→ " : "  ", Style::CURSOR);
        line.add(text, selected ? Style::SELECTED : Style::NORMAL);
        if (run_ok(run)) {
            line.add("[OK]", Style::SUCCESS);
        } else {
            line.add("[FAIL]", Style::ERROR);
        }
        out.push_back(std::move(line));
    }
    if (runs.size() > max_visible) {
        out.emplace_back();
        out.emplace_back("[" + std::to_string(cursor + 1) + "/" + std::to_string(runs.size()) + " runs]",
                         Style::MUTED);
    }
    return out;
}

// --- Tree view ---

StyledLines ExplorerView::run_summary() const {
    const TraceRun& run = model_.manifest();
    const MetricsSnapshot& metrics = model_.metrics();
    const SpanForest& forest = model_.forest();
    StyledLines out;

    out.emplace_back("Run: " + run.run_id, Style::HEADER);

    StyledLine stats;
    stats.add("Duration: ", Style::MUTED);
    stats.add(format_fixed(run.duration_seconds, 2) + "s", Style::DURATION);
    stats.add("  |  Spans: " + std::to_string(run.span_count), Style::MUTED);
    stats.add("  |  LLM: " + std::to_string(run.llm_calls), Style::MUTED);
    if (metrics.total_tokens > 0) {
        stats.add("  |  Tokens: ", Style::MUTED);
        stats.add(format_number(metrics.total_tokens), Style::DURATION);
        stats.add("  |  Cost: ", Style::MUTED);
        stats.add("$" + format_fixed(metrics.estimated_cost, 4), Style::WARNING);
    }
    stats.add("  |  Status: ", Style::MUTED);
    if (run_ok(run)) {
        stats.add("[OK]", Style::SUCCESS);
    } else {
        stats.add("[FAIL]", Style::ERROR);
    }
    if (metrics.error_count > 0) {
        stats.add("  |  ", Style::MUTED);
        stats.add("Errors: " + std::to_string(metrics.error_count), Style::ERROR);
    }
    out.push_back(std::move(stats));

    if (metrics.slowest && forest.nodes[*metrics.slowest].duration_ms > kBottleneckThresholdMs) {
        const SpanNode& node = forest.nodes[*metrics.slowest];
        std::string name = node.span.name;
        if (const auto* step = node.span.attribute("agk.workflow.step_name")) {
            name = attribute_to_string(*step);
        } else if (const auto* model = node.span.attribute("agk.llm.model")) {
            name += " [" + attribute_to_string(*model) + "]";
        }
        StyledLine line;
        line.add("Bottleneck: ");
        line.add(name, Style::MUTED);
        line.add(" (" + std::to_string(node.duration_ms) + "ms)", Style::DURATION);
        out.push_back(std::move(line));
    }

    if (metrics.top3.size() > 1) {
        StyledLine line;
        line.add("Slowest: ");
        for (std::size_t i = 0; i < metrics.top3.size(); ++i) {
            const SpanNode& node = forest.nodes[metrics.top3[i]];
            if (i > 0) line.add(" · ", Style::MUTED);
            line.add(friendly_name(node.span), span_kind_style(node.span));
            line.add(" (" + std::to_string(node.duration_ms) + "ms)", Style::DURATION);
        }
        out.push_back(std::move(line));
    }

    out.push_back(separator(width_));
    return out;
}

StyledLine ExplorerView::span_line(NodeIndex index, bool selected) const {
    const SpanNode& node = model_.forest().nodes[index];
    StyledLine line;
    line.add(selected ? "→ " : "  ", Style::CURSOR);
    line.add(repeat("  ", static_cast<std::size_t>(node.depth)));
    if (node.children.empty()) {
        line.add("  ");
    } else {
        line.add(node.expanded ? "▼ " : "▶ ");
    }
    line.add(friendly_name(node.span), selected ? Style::SELECTED : span_kind_style(node.span));

    if (is_workflow_step_span(node.span)) {
        if (const auto* model = node.span.attribute("agk.llm.model")) {
            line.add(" [" + attribute_to_string(*model) + "]", Style::MUTED);
        }
    }
    if (is_error_status(node.span.status)) line.add(" [ERR]", Style::ERROR);
    if (model_.is_search_match(index)) line.add(" 🔍");
    line.add(" (" + std::to_string(node.duration_ms) + "ms)", Style::DURATION);
    return line;
}

StyledLines ExplorerView::tree_view(std::size_t rows) const {
    StyledLines out;
    if (model_.multi_run()) {
        out.emplace_back("[Esc] Back to list  |  Run " + std::to_string(model_.selected_run() + 1) + "/" +
                             std::to_string(model_.runs().size()),
                         Style::MUTED);
    }
    StyledLines summary = run_summary();
    out.insert(out.end(), summary.begin(), summary.end());

    std::size_t used = out.size() + (model_.search_mode() ? 1 : 0);
    std::size_t avail = rows > used ? rows - used : 0;

    if (static_cast<int>(width_) < kWideLayoutMinWidth) {
        out.emplace_back("⚠ Terminal narrow - stacked layout", Style::WARNING);
        avail = avail > 0 ? avail - 1 : 0;
        std::size_t tree_rows = std::max<std::size_t>(avail * 40 / 100, 3);
        std::size_t rest = avail > tree_rows + 2 ? avail - tree_rows - 2 : 0;
        std::size_t detail_rows = rest * 60 / 100;
        std::size_t metadata_rows = rest - detail_rows;

        StyledLines tree = tree_panel(tree_rows);
        out.insert(out.end(), tree.begin(), tree.end());
        out.push_back(separator(width_));
        StyledLines detail = detail_panel(width_, detail_rows);
        out.insert(out.end(), detail.begin(), detail.end());
        out.push_back(separator(width_));
        StyledLines metadata = metadata_panel(metadata_rows);
        out.insert(out.end(), metadata.begin(), metadata.end());
    } else {
        std::size_t left_width = width_ * 66 / 100;
        std::size_t right_width = width_ > left_width + 3 ? width_ - left_width - 3 : 0;
        std::size_t tree_rows = std::max<std::size_t>(avail * 40 / 100, 3);
        std::size_t detail_rows = avail > tree_rows + 1 ? avail - tree_rows - 1 : 0;

        StyledLines left = tree_panel(tree_rows);
        left.push_back(separator(left_width));
        StyledLines detail = detail_panel(left_width, detail_rows);
        left.insert(left.end(), detail.begin(), detail.end());
        StyledLines right = metadata_panel(avail);

        Style divider = model_.focus() == FocusArea::METADATA ? Style::FOCUS_BORDER : Style::BORDER;
        for (std::size_t i = 0; i < avail; ++i) {
            StyledLine row = (i < left.size() ? left[i] : StyledLine()).fitted(left_width);
            row.add(" │ ", divider);
            row.append((i < right.size() ? right[i] : StyledLine()).fitted(right_width));
            out.push_back(std::move(row));
        }
    }

    if (model_.search_mode()) out.push_back(search_bar());
    return out;
}

StyledLines ExplorerView::tree_panel(std::size_t rows) const {
    StyledLines out;
    if (rows == 0) return out;
    bool focused = model_.focus() == FocusArea::TREE;
    out.emplace_back(focused ? "▶ Trace Tree" : "Trace Tree", focused ? Style::FOCUS_BORDER : Style::HEADER);

    const auto& visible = model_.visible();
    std::size_t body = rows - 1;
    if (visible.empty()) {
        if (body > 0) out.emplace_back("No spans in this trace yet", Style::MUTED);
        return out;
    }
    std::size_t cursor = model_.cursor();
    std::size_t offset = cursor >= body ? cursor - body + 1 : 0;
    for (std::size_t i = offset; i < visible.size() && i < offset + body; ++i) {
        out.push_back(span_line(visible[i], i == cursor));
    }
    return out;
}

StyledLine ExplorerView::tab_bar() const {
    StyledLine line;
    for (int i = 0; i < kDetailTabCount; ++i) {
        auto tab = static_cast<DetailTab>(i);
        std::string label = std::string(" ") + to_string(tab) + " ";
        line.add(label, tab == model_.tab() ? Style::SELECTED : Style::MUTED);
        if (i + 1 < kDetailTabCount) line.add("│", Style::MUTED);
    }
    return line;
}

StyledLines ExplorerView::detail_panel(std::size_t width, std::size_t rows) const {
    StyledLines out;
    if (rows == 0) return out;
    out.push_back(tab_bar());
    if (rows == 1) return out;
    bool focused = model_.focus() == FocusArea::DETAILS;
    out.emplace_back(repeat("─", std::min<std::size_t>(width, 60)), focused ? Style::FOCUS_BORDER : Style::BORDER);

    std::size_t body = rows - 2;
    auto sel = model_.selected();
    if (!sel) {
        if (body > 0) out.emplace_back("No span selected", Style::MUTED);
        return out;
    }
    StyledLines content = detail_tab_lines(model_.forest(), *sel, model_.tab(), width);
    take(out, content, scroll_offset(model_.panel_scroll(FocusArea::DETAILS), content.size(), body), body);
    return out;
}

StyledLines ExplorerView::metadata_panel(std::size_t rows) const {
    StyledLines out;
    if (rows == 0) return out;
    bool focused = model_.focus() == FocusArea::METADATA;
    StyledLine title;
    title.add(focused ? "▶ Metadata" : "Metadata", focused ? Style::FOCUS_BORDER : Style::HEADER);
    title.add(" [PgUp/PgDn] Scroll", Style::MUTED);
    out.push_back(std::move(title));

    auto sel = model_.selected();
    if (!sel) return out;
    std::size_t body = rows - 1;
    StyledLines content = metadata_lines(model_.forest(), *sel, model_.cost_per_token());
    take(out, content, scroll_offset(model_.panel_scroll(FocusArea::METADATA), content.size(), body), body);
    return out;
}

StyledLine ExplorerView::search_bar() const {
    StyledLine line;
    line.add("Search: ", Style::HEADER);
    line.add(model_.search_input() + "█");
    if (!model_.search_matches().empty()) {
        line.add(" (" + std::to_string(model_.search_matches().size()) + " matches)", Style::MUTED);
    }
    return line;
}

// --- Detail view ---

StyledLines ExplorerView::detail_view(std::size_t rows) const {
    StyledLines out;
    auto sel = model_.selected();
    if (!sel) {
        out.emplace_back("No span selected", Style::MUTED);
        return out;
    }
    out.emplace_back("📋 Span: " + model_.forest().nodes[*sel].span.name, Style::HEADER);
    out.push_back(separator(width_));
    out.push_back(tab_bar());
    out.push_back(separator(width_));
    out.emplace_back();

    std::size_t body = rows > out.size() ? rows - out.size() : 0;
    StyledLines content = detail_view_lines(model_.forest(), *sel, model_.tab(), width_);
    take(out, content, scroll_offset(model_.detail_scroll(), content.size(), body), body);
    return out;
}

StyledLines render_explorer(const TraceExplorer& model) {
    return ExplorerView(model).render();
}

} // namespace agenttrace
