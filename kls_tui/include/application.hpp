#pragma once

#include "config.hpp"
#include "terminal.hpp"
#include "refresh_scheduler.hpp"
#include "panels/cascade.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kls::tui {

class Application {
public:
    // One fetcher per configured panel, in cascade order
    Application(Config config, Terminal& terminal, std::vector<RowFetcher> fetchers);
    ~Application();

    // Initialize and run
    void init();
    void run();
    void shutdown();

    // Dispatch one input event. Returns false when the session should end.
    bool handle_input(const InputEvent& event);

    // Idle step: commit a finished background refresh, start the next one
    // once the refresh interval has passed
    void on_idle();

    // Getters
    size_t active_index() const { return active_index_; }
    Cascade& cascade() { return cascade_; }
    const Cascade& cascade() const { return cascade_; }
    RefreshScheduler& scheduler() { return scheduler_; }

    // Identifiers of the current selection, if every panel has one
    std::optional<Selection> current_selection() const;

    // Footer text: navigation keys followed by the configured bindings
    std::string status_hints() const;

private:
    Config config_;
    Terminal& terminal_;
    Cascade cascade_;
    size_t active_index_ = 0;

    // Held by background fetches and by external commands
    std::mutex guard_;
    RefreshScheduler scheduler_;

    std::chrono::steady_clock::time_point last_refresh_;
    std::string status_message_;
    bool running_ = false;

    // Layout
    bool layout();

    // Event handlers
    void activate(size_t index);
    void handle_vertical(Key key);
    void handle_horizontal(Key key);
    void handle_click(int x, int y);
    void handle_binding(const KeyBinding& binding);
    void handle_resize();
    void full_refresh();

    void redraw();
    void update_status(bool force);
};

} // namespace kls::tui
