// modules/explorer/trace_explorer.cpp
#include "modules/explorer/trace_explorer.h"
#include "modules/tree/span_tree.h"
#include "common/utils/log.h"
#include <algorithm>
#include <iterator>
#include <set>
#include <type_traits>

namespace agenttrace {

namespace {

template <typename E>
E cycle(E value, int count, int delta) {
    int next = (static_cast<int>(value) + delta % count + count) % count;
    return static_cast<E>(next);
}

void pop_utf8(std::string& text) {
    while (!text.empty() && (static_cast<unsigned char>(text.back()) & 0xC0) == 0x80) {
        text.pop_back();
    }
    if (!text.empty()) text.pop_back();
}

std::optional<std::size_t> position_of(const std::vector<NodeIndex>& order, NodeIndex index) {
    auto it = std::find(order.begin(), order.end(), index);
    if (it == order.end()) return std::nullopt;
    return static_cast<std::size_t>(std::distance(order.begin(), it));
}

// '1'..'5' -> tab
std::optional<DetailTab> tab_from_digit(const std::string& text) {
    if (text.size() != 1 || text[0] < '1' || text[0] > '5') return std::nullopt;
    return static_cast<DetailTab>(text[0] - '1');
}

} // namespace

TraceExplorer::TraceExplorer(std::vector<RunData> runs, ExplorerOptions options)
    : runs_(std::move(runs)),
      multi_run_(true),
      cost_per_token_(options.cost_per_token),
      view_mode_(ViewMode::RUN_LIST),
      width_(options.width),
      height_(options.height) {
    if (!runs_.empty()) load_run(0);
}

TraceExplorer::TraceExplorer(RunData run, bool live, ExplorerOptions options)
    : multi_run_(false),
      cost_per_token_(options.cost_per_token),
      view_mode_(ViewMode::TREE),
      width_(options.width),
      height_(options.height) {
    std::string path = run.trace_path;
    auto offset = run.trace_offset;
    runs_.push_back(std::move(run));
    load_run(0);
    if (live && !path.empty()) {
        if (offset) {
            tail_.emplace(path, *offset);
        } else {
            tail_.emplace(path);
        }
        log_debug("Following " + path + " from offset " + std::to_string(tail_->offset()));
    }
}

Command TraceExplorer::init() const {
    return live() ? Command::SCHEDULE_TICK : Command::NONE;
}

Command TraceExplorer::update(const Message& msg) {
    return std::visit(
        [this](const auto& m) -> Command {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, KeyMsg>) {
                return on_key(m);
            } else if constexpr (std::is_same_v<T, TickMsg>) {
                return on_tick();
            } else {
                width_ = std::max(m.width, 1);
                height_ = std::max(m.height, 1);
                return Command::NONE;
            }
        },
        msg);
}

Command TraceExplorer::on_key(const KeyMsg& key) {
    switch (view_mode_) {
        case ViewMode::RUN_LIST: return update_run_list(key);
        case ViewMode::TREE: return search_mode_ ? update_search_input(key) : update_tree(key);
        case ViewMode::DETAIL: return update_detail(key);
    }
    return Command::NONE;
}

Command TraceExplorer::on_tick() {
    if (!tail_) return Command::NONE;
    auto spans = tail_->poll();
    if (!spans.empty()) {
        log_debug("Live tail picked up " + std::to_string(spans.size()) + " span(s)");
        ingest(std::move(spans));
    }
    return Command::SCHEDULE_TICK;
}

void TraceExplorer::ingest(std::vector<Span> spans) {
    if (spans.empty()) return;

    std::string selected_id;
    if (auto sel = selected()) selected_id = forest_.nodes[*sel].span.span_id;
    std::set<std::string> collapsed;
    for (const auto& node : forest_.nodes) {
        if (!node.expanded && !node.span.span_id.empty()) collapsed.insert(node.span.span_id);
    }

    std::vector<Span> all = collect_spans(forest_);
    all.insert(all.end(), std::make_move_iterator(spans.begin()), std::make_move_iterator(spans.end()));
    manifest_.span_count = static_cast<int>(all.size());
    set_forest(std::move(all));

    for (auto& node : forest_.nodes) {
        if (collapsed.count(node.span.span_id)) node.expanded = false;
    }
    visible_ = flatten_visible(forest_);

    // The rebuilt forest has new indices; find the selection again by id.
    std::optional<std::size_t> pos;
    if (!selected_id.empty()) {
        if (auto index = find_by_span_id(forest_, selected_id)) pos = position_of(visible_, *index);
    }
    if (pos) {
        cursor_ = *pos;
    } else if (cursor_ >= visible_.size()) {
        cursor_ = visible_.empty() ? 0 : visible_.size() - 1;
    }
    recompute_search_matches();
}

std::optional<NodeIndex> TraceExplorer::selected() const {
    if (cursor_ >= visible_.size()) return std::nullopt;
    return visible_[cursor_];
}

bool TraceExplorer::is_search_match(NodeIndex index) const {
    return std::find(search_matches_.begin(), search_matches_.end(), index) != search_matches_.end();
}

int TraceExplorer::panel_scroll(FocusArea area) const {
    return panel_scroll_[static_cast<std::size_t>(area)];
}

// --- Run list ---

Command TraceExplorer::update_run_list(const KeyMsg& key) {
    const std::string& ch = key.text;
    bool is_char = key.code == KeyCode::CHAR;

    if (key.code == KeyCode::CTRL_C || (is_char && ch == "q")) return Command::QUIT;
    if (key.code == KeyCode::UP || (is_char && ch == "k")) {
        if (run_cursor_ > 0) --run_cursor_;
    } else if (key.code == KeyCode::DOWN || (is_char && ch == "j")) {
        if (run_cursor_ + 1 < runs_.size()) ++run_cursor_;
    } else if (key.code == KeyCode::ENTER || key.code == KeyCode::RIGHT || (is_char && ch == "l")) {
        if (run_cursor_ < runs_.size()) {
            load_run(run_cursor_);
            view_mode_ = ViewMode::TREE;
        }
    }
    return Command::NONE;
}

// --- Tree view ---

Command TraceExplorer::update_tree(const KeyMsg& key) {
    switch (key.code) {
        case KeyCode::CTRL_C: return Command::QUIT;
        case KeyCode::UP: move_cursor(-1); return Command::NONE;
        case KeyCode::DOWN: move_cursor(1); return Command::NONE;
        case KeyCode::LEFT:
        case KeyCode::RIGHT:
            tab_ = cycle(tab_, kDetailTabCount, key.code == KeyCode::RIGHT ? 1 : -1);
            panel_scroll_[static_cast<std::size_t>(FocusArea::DETAILS)] = 0;
            return Command::NONE;
        case KeyCode::ENTER: select_node(); return Command::NONE;
        case KeyCode::TAB: focus_ = cycle(focus_, kFocusAreaCount, 1); return Command::NONE;
        case KeyCode::SHIFT_TAB: focus_ = cycle(focus_, kFocusAreaCount, -1); return Command::NONE;
        case KeyCode::PAGE_UP: scroll_panel(-detail_page_size()); return Command::NONE;
        case KeyCode::PAGE_DOWN: scroll_panel(detail_page_size()); return Command::NONE;
        case KeyCode::ESCAPE:
        case KeyCode::BACKSPACE:
            if (!search_query_.empty()) {
                clear_search();
            } else if (multi_run_) {
                view_mode_ = ViewMode::RUN_LIST;
                run_cursor_ = selected_run_;
            } else {
                return Command::QUIT;
            }
            return Command::NONE;
        case KeyCode::CHAR: break;
    }

    const std::string& ch = key.text;
    if (auto tab = tab_from_digit(ch)) {
        tab_ = *tab;
        panel_scroll_[static_cast<std::size_t>(FocusArea::DETAILS)] = 0;
    } else if (ch == "q") {
        return Command::QUIT;
    } else if (ch == "k") {
        move_cursor(-1);
    } else if (ch == "j") {
        move_cursor(1);
    } else if (ch == "h") {
        collapse_node();
    } else if (ch == "l") {
        select_node();
    } else if (ch == " ") {
        toggle_node();
    } else if (ch == "d") {
        open_detail();
    } else if (ch == "/") {
        search_mode_ = true;
        search_input_.clear();
    } else if (ch == "n") {
        next_match(1);
    } else if (ch == "N") {
        next_match(-1);
    } else if (ch == "e") {
        next_error(1);
    } else if (ch == "E") {
        next_error(-1);
    } else if (ch == "[") {
        switch_run(-1);
    } else if (ch == "]") {
        switch_run(1);
    }
    return Command::NONE;
}

Command TraceExplorer::update_search_input(const KeyMsg& key) {
    switch (key.code) {
        case KeyCode::CTRL_C: return Command::QUIT;
        case KeyCode::ESCAPE:
            search_mode_ = false;
            search_input_.clear();
            break;
        case KeyCode::ENTER: execute_search(); break;
        case KeyCode::BACKSPACE: pop_utf8(search_input_); break;
        case KeyCode::CHAR: search_input_ += key.text; break;
        default: break;
    }
    return Command::NONE;
}

// --- Detail view ---

Command TraceExplorer::update_detail(const KeyMsg& key) {
    const std::string& ch = key.text;
    bool is_char = key.code == KeyCode::CHAR;

    int max_scroll = 0;
    if (auto sel = selected()) {
        int lines = static_cast<int>(detail_view_lines(forest_, *sel, tab_, static_cast<std::size_t>(width_)).size());
        max_scroll = std::max(0, lines - detail_page_size());
    }

    if (key.code == KeyCode::CTRL_C || (is_char && ch == "q")) return Command::QUIT;
    if (key.code == KeyCode::ESCAPE || key.code == KeyCode::BACKSPACE) {
        view_mode_ = ViewMode::TREE;
    } else if (key.code == KeyCode::LEFT || key.code == KeyCode::RIGHT) {
        tab_ = cycle(tab_, kDetailTabCount, key.code == KeyCode::RIGHT ? 1 : -1);
        detail_scroll_ = 0;
    } else if (auto tab = is_char ? tab_from_digit(ch) : std::optional<DetailTab>()) {
        tab_ = *tab;
        detail_scroll_ = 0;
    } else if (key.code == KeyCode::UP || (is_char && ch == "k")) {
        detail_scroll_ = std::max(0, detail_scroll_ - 1);
    } else if (key.code == KeyCode::DOWN || (is_char && ch == "j")) {
        detail_scroll_ = std::min(max_scroll, detail_scroll_ + 1);
    } else if (key.code == KeyCode::PAGE_UP) {
        detail_scroll_ = std::max(0, detail_scroll_ - detail_page_size());
    } else if (key.code == KeyCode::PAGE_DOWN) {
        detail_scroll_ = std::min(max_scroll, detail_scroll_ + detail_page_size());
    }
    return Command::NONE;
}

// --- Helpers ---

void TraceExplorer::load_run(std::size_t index) {
    if (index >= runs_.size()) return;
    run_cursor_ = index;
    selected_run_ = index;
    manifest_ = runs_[index].manifest;
    set_forest(runs_[index].spans);
    visible_ = flatten_visible(forest_);
    cursor_ = 0;
    focus_ = FocusArea::TREE;
    search_mode_ = false;
    search_input_.clear();
    clear_search();
    panel_scroll_.fill(0);
    detail_scroll_ = 0;
}

void TraceExplorer::set_forest(std::vector<Span> spans) {
    forest_ = build_span_forest(spans);
    metrics_ = MetricsCalculator(cost_per_token_).compute(forest_);
}

void TraceExplorer::refresh_visible() {
    visible_ = flatten_visible(forest_);
    if (cursor_ >= visible_.size()) cursor_ = visible_.empty() ? 0 : visible_.size() - 1;
}

void TraceExplorer::set_cursor(std::size_t cursor) {
    if (visible_.empty()) {
        cursor_ = 0;
        return;
    }
    cursor = std::min(cursor, visible_.size() - 1);
    if (cursor != cursor_) {
        panel_scroll_[static_cast<std::size_t>(FocusArea::DETAILS)] = 0;
        panel_scroll_[static_cast<std::size_t>(FocusArea::METADATA)] = 0;
        detail_scroll_ = 0;
    }
    cursor_ = cursor;
}

void TraceExplorer::jump_to(NodeIndex index) {
    expand_ancestors(forest_, index);
    refresh_visible();
    if (auto pos = position_of(visible_, index)) set_cursor(*pos);
    focus_ = FocusArea::TREE;
}

void TraceExplorer::move_cursor(int delta) {
    if (visible_.empty()) return;
    auto last = static_cast<long long>(visible_.size()) - 1;
    long long target = std::clamp(static_cast<long long>(cursor_) + delta, 0LL, last);
    set_cursor(static_cast<std::size_t>(target));
}

void TraceExplorer::select_node() {
    auto sel = selected();
    if (!sel) return;
    if (!forest_.nodes[*sel].children.empty()) {
        toggle_expanded(forest_, *sel);
        refresh_visible();
    } else {
        open_detail();
    }
}

// Collapses an expanded parent, otherwise moves to the parent.
void TraceExplorer::collapse_node() {
    auto sel = selected();
    if (!sel) return;
    SpanNode& node = forest_.nodes[*sel];
    if (!node.children.empty() && node.expanded) {
        node.expanded = false;
        refresh_visible();
    } else if (node.parent) {
        if (auto pos = position_of(visible_, *node.parent)) set_cursor(*pos);
    }
}

void TraceExplorer::toggle_node() {
    auto sel = selected();
    if (!sel || forest_.nodes[*sel].children.empty()) return;
    toggle_expanded(forest_, *sel);
    refresh_visible();
}

void TraceExplorer::open_detail() {
    if (!selected()) return;
    view_mode_ = ViewMode::DETAIL;
    detail_scroll_ = 0;
}

void TraceExplorer::switch_run(int delta) {
    if (!multi_run_ || runs_.empty()) return;
    long long target = static_cast<long long>(selected_run_) + delta;
    if (target < 0 || target >= static_cast<long long>(runs_.size())) return;
    load_run(static_cast<std::size_t>(target));
}

void TraceExplorer::execute_search() {
    search_query_ = search_input_;
    search_input_.clear();
    search_mode_ = false;
    search_index_ = -1;
    recompute_search_matches();
    if (!search_matches_.empty()) {
        search_index_ = 0;
        jump_to(search_matches_.front());
    }
}

// Matches in pre-order over the whole tree, collapsed subtrees included.
void TraceExplorer::recompute_search_matches() {
    search_matches_.clear();
    if (!search_query_.empty()) {
        for (NodeIndex index : flatten_all(forest_)) {
            if (span_matches_query(forest_.nodes[index].span, search_query_)) search_matches_.push_back(index);
        }
    }
    if (search_matches_.empty()) {
        search_index_ = -1;
    } else if (search_index_ >= static_cast<int>(search_matches_.size())) {
        search_index_ = static_cast<int>(search_matches_.size()) - 1;
    }
}

void TraceExplorer::clear_search() {
    search_query_.clear();
    search_matches_.clear();
    search_index_ = -1;
}

void TraceExplorer::next_match(int direction) {
    if (search_matches_.empty()) return;
    int n = static_cast<int>(search_matches_.size());
    if (search_index_ < 0) {
        search_index_ = direction > 0 ? 0 : n - 1;
    } else {
        search_index_ = ((search_index_ + direction) % n + n) % n;
    }
    jump_to(search_matches_[static_cast<std::size_t>(search_index_)]);
}

// Walks the full pre-order list from the selection, wrapping around.
void TraceExplorer::next_error(int direction) {
    if (metrics_.error_count == 0) return;
    auto order = flatten_all(forest_);
    if (order.empty()) return;
    long long n = static_cast<long long>(order.size());

    long long start = direction > 0 ? n - 1 : 0;
    if (auto sel = selected()) {
        if (auto pos = position_of(order, *sel)) start = static_cast<long long>(*pos);
    }
    for (long long step = 1; step <= n; ++step) {
        long long i = ((start + step * direction) % n + n) % n;
        NodeIndex index = order[static_cast<std::size_t>(i)];
        if (is_error_status(forest_.nodes[index].span.status)) {
            jump_to(index);
            return;
        }
    }
}

void TraceExplorer::scroll_panel(int delta) {
    if (focus_ == FocusArea::TREE) {
        move_cursor(delta);
        return;
    }
    int& scroll = panel_scroll_[static_cast<std::size_t>(focus_)];
    int max_scroll = std::max(0, content_lines(focus_) - 1);
    scroll = std::clamp(scroll + delta, 0, max_scroll);
}

int TraceExplorer::content_lines(FocusArea area) const {
    auto sel = selected();
    if (!sel) return 0;
    if (area == FocusArea::DETAILS) {
        return static_cast<int>(detail_tab_lines(forest_, *sel, tab_, static_cast<std::size_t>(width_)).size());
    }
    if (area == FocusArea::METADATA) {
        return static_cast<int>(metadata_lines(forest_, *sel, cost_per_token_).size());
    }
    return static_cast<int>(visible_.size());
}

int TraceExplorer::detail_page_size() const {
    return std::max(1, height_ - 8);
}

} // namespace agenttrace
