#pragma once

#include "input.hpp"
#include "panels/panel.hpp"

namespace kls::tui {

enum class FilterOutcome {
    Unhandled,          // not a filter key in this state
    Handled,            // consumed, selected row unchanged
    SelectionChanged,   // consumed, filtered rows changed; dependents need refreshing
    Exit                // cancel from Normal: end the session
};

/**
 * Per-panel filter editing.
 *
 *   Normal       --/-->        EmptyFilter
 *   Normal       --Esc,q-->    Exit
 *   EmptyFilter  --Esc,Bksp--> Normal
 *   EmptyFilter  --char-->     FilledFilter
 *   FilledFilter --Esc-->      Normal (text cleared)
 *   FilledFilter --Bksp-->     FilledFilter, or EmptyFilter once the text is empty
 *   FilledFilter --char-->     FilledFilter
 *
 * Everything else is left to the dispatcher. The machine operates on the
 * active panel, so it always redraws with the active title style.
 */
class FilterStateMachine {
public:
    static FilterOutcome handle(Panel& panel, const InputEvent& event);

private:
    static FilterOutcome on_normal(Panel& panel, const InputEvent& event);
    static FilterOutcome on_empty_filter(Panel& panel, const InputEvent& event);
    static FilterOutcome on_filled_filter(Panel& panel, const InputEvent& event);

    // Move to `next` with filter text `text`, recompute and redraw
    static FilterOutcome apply(Panel& panel, FilterState next, const std::string& text);
};

} // namespace kls::tui
