#include "panels/filter_state_machine.hpp"
#include "utils/logger.hpp"
#include <cctype>

namespace kls::tui {

FilterOutcome FilterStateMachine::handle(Panel& panel, const InputEvent& event) {
    switch (panel.state()) {
        case FilterState::Normal:
            return on_normal(panel, event);
        case FilterState::EmptyFilter:
            return on_empty_filter(panel, event);
        case FilterState::FilledFilter:
            return on_filled_filter(panel, event);
    }
    return FilterOutcome::Unhandled;
}

FilterOutcome FilterStateMachine::on_normal(Panel& panel, const InputEvent& event) {
    if (event.key == Key::Char && event.ch == '/') {
        panel.set_state(FilterState::EmptyFilter);
        panel.set_filter("");
        panel.draw_footer();
        return FilterOutcome::Handled;
    }

    if (event.key == Key::Escape || (event.key == Key::Char && event.ch == 'q')) {
        LOG_INFO("Filter", "Quit requested from " + panel.title());
        return FilterOutcome::Exit;
    }

    return FilterOutcome::Unhandled;
}

FilterOutcome FilterStateMachine::on_empty_filter(Panel& panel, const InputEvent& event) {
    if (event.key == Key::Escape || event.key == Key::Backspace) {
        panel.set_state(FilterState::Normal);
        panel.draw_footer();
        return FilterOutcome::Handled;
    }

    if (event.is_filter_char()) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(event.ch)));
        return apply(panel, FilterState::FilledFilter, std::string(1, c));
    }

    return FilterOutcome::Unhandled;
}

FilterOutcome FilterStateMachine::on_filled_filter(Panel& panel, const InputEvent& event) {
    if (event.key == Key::Escape) {
        return apply(panel, FilterState::Normal, "");
    }

    if (event.key == Key::Backspace) {
        std::string text = panel.filter_text();
        text.pop_back();
        return apply(panel, text.empty() ? FilterState::EmptyFilter : FilterState::FilledFilter, text);
    }

    if (event.is_filter_char()) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(event.ch)));
        return apply(panel, FilterState::FilledFilter, panel.filter_text() + c);
    }

    return FilterOutcome::Unhandled;
}

FilterOutcome FilterStateMachine::apply(Panel& panel, FilterState next, const std::string& text) {
    const auto before = panel.selected_row();

    panel.set_state(next);
    const bool rows_changed = panel.set_filter(text);
    if (rows_changed) {
        panel.draw(true);
    } else {
        // Same rows: only the prompt changed
        panel.draw_footer();
    }

    return rows_changed || panel.selected_row() != before ? FilterOutcome::SelectionChanged
                                                          : FilterOutcome::Handled;
}

} // namespace kls::tui
