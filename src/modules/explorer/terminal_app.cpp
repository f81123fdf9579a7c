// modules/explorer/terminal_app.cpp
#include "modules/explorer/terminal_app.h"
#include "modules/explorer/explorer_view.h"
#include "common/utils/log.h"
#include <ftxui/component/component.hpp> // 引入 FTXUI
#include <ftxui/component/event.hpp>
#include <ftxui/component/loop.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>
#include <string>
#include <thread>

namespace agenttrace {

namespace {

// Pause between loop iterations while nothing is pending.
constexpr std::chrono::milliseconds kFrameInterval{16};

ftxui::Element styled(ftxui::Element e, Style style) {
    using ftxui::Color;
    switch (style) {
        case Style::NORMAL: return e;
        case Style::TITLE: return e | ftxui::bold | ftxui::color(Color::Magenta);
        case Style::HEADER: return e | ftxui::bold | ftxui::color(Color::Cyan);
        case Style::SECTION: return e | ftxui::bold | ftxui::color(Color::Yellow);
        case Style::MUTED: return e | ftxui::color(Color::GrayDark);
        case Style::SELECTED: return e | ftxui::color(Color::Black) | ftxui::bgcolor(Color::Cyan);
        case Style::CURSOR: return e | ftxui::bold | ftxui::color(Color::Cyan);
        case Style::SUCCESS: return e | ftxui::color(Color::Green);
        case Style::ERROR: return e | ftxui::bold | ftxui::color(Color::Red);
        case Style::WARNING: return e | ftxui::color(Color::Yellow);
        case Style::DURATION: return e | ftxui::color(Color::Blue);
        case Style::ATTR_KEY: return e | ftxui::color(Color::Cyan);
        case Style::ATTR_VALUE: return e | ftxui::color(Color::GrayLight);
        case Style::BORDER: return e | ftxui::color(Color::GrayDark);
        case Style::FOCUS_BORDER: return e | ftxui::bold | ftxui::color(Color::Cyan);
        case Style::SPAN_WORKFLOW: return e | ftxui::color(Color::Magenta);
        case Style::SPAN_AGENT: return e | ftxui::color(Color::Green);
        case Style::SPAN_LLM: return e | ftxui::bold | ftxui::color(Color::Blue);
        case Style::SPAN_TOOL: return e | ftxui::color(Color::Yellow);
    }
    return e;
}

ftxui::Element to_element(const StyledLines& lines) {
    ftxui::Elements rows;
    rows.reserve(lines.size());
    for (const auto& line : lines) {
        ftxui::Elements cells;
        for (const auto& seg : line.segments) {
            cells.push_back(styled(ftxui::text(seg.text), seg.style));
        }
        rows.push_back(ftxui::hbox(std::move(cells)));
    }
    return ftxui::vbox(std::move(rows));
}

std::optional<KeyMsg> translate_key(const ftxui::Event& e) {
    using ftxui::Event;
    if (e == Event::ArrowUp) return KeyMsg::key(KeyCode::UP);
    if (e == Event::ArrowDown) return KeyMsg::key(KeyCode::DOWN);
    if (e == Event::ArrowLeft) return KeyMsg::key(KeyCode::LEFT);
    if (e == Event::ArrowRight) return KeyMsg::key(KeyCode::RIGHT);
    if (e == Event::Return) return KeyMsg::key(KeyCode::ENTER);
    if (e == Event::Escape) return KeyMsg::key(KeyCode::ESCAPE);
    if (e == Event::Backspace) return KeyMsg::key(KeyCode::BACKSPACE);
    if (e == Event::Tab) return KeyMsg::key(KeyCode::TAB);
    if (e == Event::TabReverse) return KeyMsg::key(KeyCode::SHIFT_TAB);
    if (e == Event::PageUp) return KeyMsg::key(KeyCode::PAGE_UP);
    if (e == Event::PageDown) return KeyMsg::key(KeyCode::PAGE_DOWN);
    if (!e.is_character()) return std::nullopt;

    std::string ch = e.character();
    if (ch.empty()) return std::nullopt;
    if (ch == "\x03") return KeyMsg::key(KeyCode::CTRL_C);
    if (ch == "\x7f" || ch == "\b") return KeyMsg::key(KeyCode::BACKSPACE);
    if (static_cast<unsigned char>(ch[0]) < 32) return std::nullopt;
    return KeyMsg::character(std::move(ch));
}

// Log lines would tear the screen; keep only errors while it is ours.
class QuietLogs {
public:
    QuietLogs() : previous_(get_log_level()) {
        if (previous_ < LogLevel::ERROR) set_log_level(LogLevel::ERROR);
    }
    ~QuietLogs() { set_log_level(previous_); }

    QuietLogs(const QuietLogs&) = delete;
    QuietLogs& operator=(const QuietLogs&) = delete;

private:
    LogLevel previous_;
};

} // namespace

TerminalApp::TerminalApp(TraceExplorer& explorer, std::chrono::milliseconds poll_interval)
    : explorer_(explorer), poll_interval_(poll_interval) {}

void TerminalApp::run() {
    QuietLogs quiet;
    auto screen = ftxui::ScreenInteractive::Fullscreen();

    auto size = ftxui::Terminal::Size();
    apply(explorer_.update(ResizeMsg{size.dimx, size.dimy}));
    if (!apply(explorer_.init())) return;

    auto view = ftxui::Renderer([&] { return to_element(render_explorer(explorer_)); });
    auto app = ftxui::CatchEvent(view, [&](ftxui::Event e) {
        if (e == ftxui::Event::Custom) return false;
        auto key = translate_key(e);
        if (!key) return false;
        if (!apply(explorer_.update(*key))) screen.Exit();
        return true;
    });

    ftxui::Loop loop(&screen, app);
    while (!loop.HasQuitted()) {
        loop.RunOnce();

        auto now_size = ftxui::Terminal::Size();
        if (now_size.dimx != size.dimx || now_size.dimy != size.dimy) {
            size = now_size;
            if (!apply(explorer_.update(ResizeMsg{size.dimx, size.dimy}))) screen.Exit();
            screen.PostEvent(ftxui::Event::Custom);
        }

        if (tick_due()) {
            tick_deadline_.reset();
            if (!apply(explorer_.update(TickMsg{}))) screen.Exit();
            screen.PostEvent(ftxui::Event::Custom);
        }

        std::this_thread::sleep_for(kFrameInterval);
    }
}

bool TerminalApp::apply(Command command) {
    switch (command) {
        case Command::QUIT: return false;
        case Command::SCHEDULE_TICK:
            tick_deadline_ = std::chrono::steady_clock::now() + poll_interval_;
            return true;
        case Command::NONE: return true;
    }
    return true;
}

bool TerminalApp::tick_due() const {
    return tick_deadline_ && std::chrono::steady_clock::now() >= *tick_deadline_;
}

} // namespace agenttrace
