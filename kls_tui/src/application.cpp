#include "application.hpp"
#include "kube_client.hpp"
#include "panels/filter_state_machine.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <format>
#include <numeric>
#include <stdexcept>

namespace kls::tui {

namespace {

// Smallest screen that still shows one row per panel plus the status line
constexpr int MIN_LINES = Panel::CHROME_ROWS + 2;
constexpr int MIN_PANEL_COLUMNS = 6;

// Farthest a click beside the panels moves the active panel
constexpr size_t CLICK_STEP_LIMIT = 2;

const std::string NAVIGATION_HINTS = "Tab: Next | /: Filter | ^R: Refresh | q: Quit";

} // namespace

Application::Application(Config config, Terminal& terminal, std::vector<RowFetcher> fetchers)
    : config_(std::move(config)), terminal_(terminal), scheduler_(guard_) {
    if (fetchers.size() != config_.panels.size()) {
        throw std::invalid_argument(std::format("{} panels configured but {} fetchers given",
                                                config_.panels.size(), fetchers.size()));
    }

    for (size_t i = 0; i < config_.panels.size(); ++i) {
        cascade_.add_panel(Panel(config_.panels[i].title, i), std::move(fetchers[i]));
    }
}

Application::~Application() {
    shutdown();
}

void Application::init() {
    LOG_INFO("Application", "Initializing kls...");

    if (cascade_.empty()) {
        throw std::runtime_error("no panels configured");
    }
    if (!layout()) {
        throw std::runtime_error(std::format("terminal too small ({}x{})",
                                             terminal_.columns(), terminal_.lines()));
    }

    active_index_ = 0;
    cascade_.refresh_all(active_index_);
    cascade_.draw_all(active_index_);
    update_status(true);

    last_refresh_ = std::chrono::steady_clock::now();
    LOG_INFO("Application", "Initialization complete");
}

void Application::run() {
    running_ = true;
    LOG_INFO("Application", "Entering main loop");

    while (running_) {
        // Blocks for at most the input timeout
        auto event = terminal_.poll_input();
        if (!event) {
            on_idle();
            continue;
        }
        if (!handle_input(*event)) {
            break;
        }
    }

    running_ = false;
    LOG_INFO("Application", "Main loop exited");
}

void Application::shutdown() {
    scheduler_.cancel();
    running_ = false;
}

// ==================================================================
// Layout
// ==================================================================

bool Application::layout() {
    const int height = terminal_.lines() - 1;
    const int columns = terminal_.columns();
    const int panel_count = static_cast<int>(cascade_.size());

    if (height < MIN_LINES - 1 || columns < MIN_PANEL_COLUMNS * panel_count) {
        LOG_WARN("Application", std::format("Terminal too small for layout ({}x{})", columns, terminal_.lines()));
        return false;
    }

    const int total_share = std::accumulate(config_.panels.begin(), config_.panels.end(), 0,
                                            [](int sum, const PanelSpec& spec) { return sum + spec.width; });

    std::vector<int> widths;
    int col = 0;
    for (size_t i = 0; i + 1 < cascade_.size(); ++i) {
        widths.push_back(std::max(MIN_PANEL_COLUMNS, columns * config_.panels[i].width / total_share));
        col += widths.back();
    }

    // The last panel takes whatever rounding left over
    widths.push_back(columns - col);
    if (widths.back() < MIN_PANEL_COLUMNS) {
        LOG_WARN("Application", std::format("No room left for {}", cascade_.rightmost().title()));
        return false;
    }

    col = 0;
    for (size_t i = 0; i < cascade_.size(); ++i) {
        cascade_.panel(i).attach(terminal_.create_canvas(col, widths[i], height), col, widths[i]);
        col += widths[i];
    }
    return true;
}

// ==================================================================
// Input dispatch
// ==================================================================

bool Application::handle_input(const InputEvent& event) {
    auto& active = cascade_.panel(active_index_);

    switch (FilterStateMachine::handle(active, event)) {
        case FilterOutcome::Exit:
            LOG_INFO("Application", "User quit");
            running_ = false;
            return false;
        case FilterOutcome::SelectionChanged:
            scheduler_.cancel();
            cascade_.propagate(active_index_, active_index_);
            update_status(false);
            return true;
        case FilterOutcome::Handled:
            return true;
        case FilterOutcome::Unhandled:
            break;
    }

    if (event.is_vertical_navigation()) {
        handle_vertical(event.key);
    } else if (event.is_horizontal_navigation()) {
        handle_horizontal(event.key);
    } else if (event.key == Key::Mouse) {
        handle_click(event.x, event.y);
    } else if (event.key == Key::Resize) {
        handle_resize();
    } else if (event.key == Key::Ctrl && event.ch == 'r') {
        full_refresh();
    } else if (auto id = event.binding_id(); !id.empty()) {
        if (const auto* binding = config_.key_bindings.find(id)) {
            handle_binding(*binding);
        }
    }

    update_status(false);
    return true;
}

void Application::activate(size_t index) {
    if (index == active_index_) return;

    cascade_.panel(active_index_).draw_header(false);
    active_index_ = index;
    cascade_.panel(active_index_).draw_header(true);
}

void Application::handle_vertical(Key key) {
    auto& panel = cascade_.panel(active_index_);
    if (panel.visible_count() <= 1) {
        return;
    }

    scheduler_.cancel();
    panel.move_selection(key);
    panel.draw(true);
    cascade_.propagate(active_index_, active_index_);
}

void Application::handle_horizontal(Key key) {
    const size_t count = cascade_.size();
    if (key == Key::Tab || key == Key::Right) {
        activate((active_index_ + 1) % count);
    } else {
        activate((active_index_ + count - 1) % count);
    }
}

void Application::handle_click(int x, int y) {
    std::optional<size_t> hit;
    for (size_t i = 0; i < cascade_.size(); ++i) {
        if (cascade_.panel(i).contains_column(x)) {
            hit = i;
            break;
        }
    }

    if (!hit) {
        // Beside every panel: step toward that side
        if (x < cascade_.panel(0).origin_col()) {
            activate(active_index_ - std::min(active_index_, CLICK_STEP_LIMIT));
        } else {
            activate(std::min(active_index_ + CLICK_STEP_LIMIT, cascade_.rightmost_index()));
        }
        return;
    }

    activate(*hit);

    auto& panel = cascade_.panel(active_index_);
    auto offset = panel.row_at(y);
    if (!offset || *offset == panel.selected_offset()) {
        return;
    }

    scheduler_.cancel();
    panel.select_visible(*offset);
    panel.draw(true);
    cascade_.propagate(active_index_, active_index_);
}

void Application::handle_binding(const KeyBinding& binding) {
    auto selection = current_selection();
    if (!selection) {
        LOG_DEBUG("Application", binding.key + ": no resource selected");
        return;
    }
    if (!binding.applies_to(selection->api_resource)) {
        LOG_DEBUG("Application", std::format("{}: not applicable to {}", binding.key, selection->api_resource));
        return;
    }

    if (binding.confirm) {
        bool accepted = terminal_.confirm(std::format("{} {}/{}?", binding.description,
                                                      selection->api_resource, selection->resource));
        if (!accepted) {
            LOG_INFO("Application", binding.description + " declined");
            redraw();
            return;
        }
    }

    const std::string command = KeyBindings::expand(binding.command, *selection);

    scheduler_.cancel();
    {
        std::lock_guard<std::mutex> exclusive(guard_);

        LOG_INFO("Application", "Running: " + command);
        int status = terminal_.run_external(command);
        if (status != 0) {
            LOG_INFO("Application", std::format("Command exited with status {}", status));
        }
        redraw();
    }

    // The selected resource may be gone now
    if (binding.confirm) {
        size_t rightmost = cascade_.rightmost_index();
        cascade_.refresh_panel(rightmost, rightmost == active_index_);
    }
    last_refresh_ = std::chrono::steady_clock::now();
}

void Application::handle_resize() {
    terminal_.update_size();

    std::vector<std::optional<std::string>> before;
    for (size_t i = 0; i < cascade_.size(); ++i) {
        before.push_back(cascade_.panel(i).selected_row());
    }

    // A shorter window can clamp a selection, so nothing fetched for the
    // old one may land afterwards
    scheduler_.cancel();
    if (!layout()) {
        return;
    }

    for (size_t i = 0; i < cascade_.size(); ++i) {
        if (cascade_.panel(i).selected_row() != before[i]) {
            LOG_DEBUG("Application", cascade_.panel(i).title() + ": selection moved by resize");
            cascade_.propagate(i, active_index_);
            break;
        }
    }
    redraw();
}

void Application::full_refresh() {
    LOG_INFO("Application", "Manual refresh triggered");

    scheduler_.cancel();
    cascade_.refresh_all(active_index_);
    last_refresh_ = std::chrono::steady_clock::now();
}

// ==================================================================
// Background refresh
// ==================================================================

void Application::on_idle() {
    const size_t rightmost = cascade_.rightmost_index();

    if (scheduler_.finished()) {
        if (auto rows = scheduler_.take_result()) {
            auto& panel = cascade_.rightmost();
            if (panel.replace_rows(std::move(*rows))) {
                panel.draw(rightmost == active_index_);
                LOG_DEBUG("Application", "Background refresh updated " + panel.title());
            }
        }
    }

    const auto now = std::chrono::steady_clock::now();
    const auto interval = std::chrono::milliseconds(config_.refresh_interval_ms);
    if (!scheduler_.in_flight() && now - last_refresh_ >= interval) {
        last_refresh_ = now;

        // Parameters are captured here; the worker never reads panel state
        if (auto upstream = cascade_.upstream_selection(rightmost)) {
            scheduler_.start([this, rightmost, upstream = std::move(*upstream)](std::stop_token stop) {
                return cascade_.fetch(rightmost, upstream, stop);
            });
        }
    }

    update_status(false);
}

// ==================================================================
// Helper methods
// ==================================================================

std::optional<Selection> Application::current_selection() const {
    if (cascade_.size() != PANEL_COUNT) {
        return std::nullopt;
    }

    auto context = cascade_.panel(CONTEXTS).selected_row();
    auto ns = cascade_.panel(NAMESPACES).selected_row();
    auto kind = cascade_.panel(API_RESOURCES).selected_row();
    auto resource = cascade_.panel(RESOURCES).selected_row();
    if (!context || !ns || !kind || !resource) {
        return std::nullopt;
    }

    return Selection{
        .context = *context,
        .ns = *ns,
        .api_resource = *kind,
        .resource = KubeClient::resource_name(*resource)
    };
}

std::string Application::status_hints() const {
    if (config_.key_bindings.empty()) {
        return NAVIGATION_HINTS;
    }
    return NAVIGATION_HINTS + " | " + config_.key_bindings.hints();
}

void Application::redraw() {
    cascade_.draw_all(active_index_);
    update_status(true);
}

void Application::update_status(bool force) {
    std::string message;
    if (auto entry = Logger::instance().last_at_least(LogLevel::WARN)) {
        message = entry->message;
    }

    if (!force && message == status_message_) {
        return;
    }
    status_message_ = message;
    terminal_.draw_status(status_hints(), status_message_);
}

} // namespace kls::tui
