// modules/explorer/trace_explorer.h
#ifndef AGENTTRACE_MODULES_EXPLORER_TRACE_EXPLORER_H
#define AGENTTRACE_MODULES_EXPLORER_TRACE_EXPLORER_H

#include "core/types/run.h"       // 引入 RunData
#include "core/types/span_node.h" // 引入 SpanForest
#include "modules/explorer/span_display.h"
#include "modules/metrics/metrics_calculator.h"
#include "modules/tail/live_tail.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agenttrace {

// --- Messages ---

enum class KeyCode : uint8_t {
    CHAR, // printable input, UTF-8 in KeyMsg::text
    UP,
    DOWN,
    LEFT,
    RIGHT,
    ENTER,
    ESCAPE,
    BACKSPACE,
    TAB,
    SHIFT_TAB,
    PAGE_UP,
    PAGE_DOWN,
    CTRL_C
};

struct KeyMsg {
    KeyCode code = KeyCode::CHAR;
    std::string text;

    static KeyMsg key(KeyCode code) { return KeyMsg{code, {}}; }
    static KeyMsg character(std::string text) { return KeyMsg{KeyCode::CHAR, std::move(text)}; }
    static KeyMsg character(char c) { return KeyMsg{KeyCode::CHAR, std::string(1, c)}; }
};

struct TickMsg {};

struct ResizeMsg {
    int width = 0;
    int height = 0;
};

using Message = std::variant<KeyMsg, TickMsg, ResizeMsg>;

enum class Command : uint8_t {
    NONE,
    QUIT,
    SCHEDULE_TICK // arm the next live-tail poll
};

enum class ViewMode : uint8_t {
    RUN_LIST,
    TREE,
    DETAIL
};

enum class FocusArea : uint8_t {
    TREE,
    DETAILS,
    METADATA
};

inline constexpr int kFocusAreaCount = 3;

struct ExplorerOptions {
    double cost_per_token = kDefaultCostPerToken;
    int width = 120;
    int height = 40;
};

// Interactive exploration state. Every input goes through update(); the
// view reads the state through the accessors and never mutates it.
class TraceExplorer {
public:
    // Explorer over several runs, opening on the run list.
    explicit TraceExplorer(std::vector<RunData> runs, ExplorerOptions options = {});

    // One run shown directly in the tree view. With `live` set, the run's
    // trace file is followed from its current end.
    TraceExplorer(RunData run, bool live, ExplorerOptions options = {});

    // SCHEDULE_TICK when following a live trace.
    Command init() const;

    Command update(const Message& msg);

    // Appends freshly tailed spans and rebuilds the tree, keeping the
    // selection, the collapsed nodes and the committed search.
    void ingest(std::vector<Span> spans);

    // --- State ---
    ViewMode view_mode() const { return view_mode_; }
    FocusArea focus() const { return focus_; }
    DetailTab tab() const { return tab_; }
    bool live() const { return tail_.has_value(); }
    bool multi_run() const { return multi_run_; }
    int width() const { return width_; }
    int height() const { return height_; }
    double cost_per_token() const { return cost_per_token_; }

    const std::vector<RunData>& runs() const { return runs_; }
    std::size_t run_cursor() const { return run_cursor_; }
    std::size_t selected_run() const { return selected_run_; }

    const TraceRun& manifest() const { return manifest_; }
    const SpanForest& forest() const { return forest_; }
    const MetricsSnapshot& metrics() const { return metrics_; }

    const std::vector<NodeIndex>& visible() const { return visible_; }
    std::size_t cursor() const { return cursor_; }
    std::optional<NodeIndex> selected() const;

    bool search_mode() const { return search_mode_; }
    const std::string& search_input() const { return search_input_; }
    const std::string& search_query() const { return search_query_; }
    const std::vector<NodeIndex>& search_matches() const { return search_matches_; }
    int search_index() const { return search_index_; }
    bool is_search_match(NodeIndex index) const;

    int panel_scroll(FocusArea area) const;
    int detail_scroll() const { return detail_scroll_; }

private:
    std::vector<RunData> runs_;
    bool multi_run_ = false;
    std::optional<LiveTailMonitor> tail_;
    double cost_per_token_ = kDefaultCostPerToken;

    ViewMode view_mode_ = ViewMode::TREE;
    FocusArea focus_ = FocusArea::TREE;
    DetailTab tab_ = DetailTab::OVERVIEW;
    int width_ = 120;
    int height_ = 40;

    std::size_t run_cursor_ = 0;
    std::size_t selected_run_ = 0;

    TraceRun manifest_;
    SpanForest forest_;
    MetricsSnapshot metrics_;
    std::vector<NodeIndex> visible_;
    std::size_t cursor_ = 0;

    bool search_mode_ = false;
    std::string search_input_;
    std::string search_query_;
    std::vector<NodeIndex> search_matches_;
    int search_index_ = -1;

    std::array<int, kFocusAreaCount> panel_scroll_{};
    int detail_scroll_ = 0;

    // --- Update handlers ---
    Command on_key(const KeyMsg& key);
    Command on_tick();
    Command update_run_list(const KeyMsg& key);
    Command update_tree(const KeyMsg& key);
    Command update_search_input(const KeyMsg& key);
    Command update_detail(const KeyMsg& key);

    // --- Helpers ---
    void load_run(std::size_t index);
    void set_forest(std::vector<Span> spans);
    void refresh_visible();
    void set_cursor(std::size_t cursor);
    void jump_to(NodeIndex index);

    void move_cursor(int delta);
    void select_node();
    void collapse_node();
    void toggle_node();
    void open_detail();
    void switch_run(int delta);

    void execute_search();
    void recompute_search_matches();
    void clear_search();
    void next_match(int direction);
    void next_error(int direction);

    void scroll_panel(int delta);
    int content_lines(FocusArea area) const;
    int detail_page_size() const;
};

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_EXPLORER_TRACE_EXPLORER_H
