// modules/explorer/terminal_app.h
#ifndef AGENTTRACE_MODULES_EXPLORER_TERMINAL_APP_H
#define AGENTTRACE_MODULES_EXPLORER_TERMINAL_APP_H

#include "modules/explorer/trace_explorer.h"
#include <chrono>
#include <optional>

namespace agenttrace {

// Runs a TraceExplorer full screen with FTXUI. One cooperative loop drains
// pending input, then fires the live-tail tick once it is due; at most one
// tick is ever pending.
class TerminalApp {
public:
    TerminalApp(TraceExplorer& explorer, std::chrono::milliseconds poll_interval);

    // Blocks until the explorer asks to quit. The terminal is restored and the
    // log level put back on every exit path.
    void run();

private:
    TraceExplorer& explorer_;
    std::chrono::milliseconds poll_interval_;
    std::optional<std::chrono::steady_clock::time_point> tick_deadline_;

    // Applies a command; returns false on QUIT.
    bool apply(Command command);
    bool tick_due() const;
};

} // namespace agenttrace

#endif // AGENTTRACE_MODULES_EXPLORER_TERMINAL_APP_H
