#pragma once

#include "panels/panel.hpp"
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace kls::tui {

// Produces a panel's rows from the selections of every panel to its left.
// nullopt means the fetch failed or was stopped.
using RowFetcher = std::function<std::optional<std::vector<std::string>>(
    const std::vector<std::string>& upstream, std::stop_token stop)>;

/**
 * The left-to-right chain of panels.
 *
 * Each panel depends on every panel to its left. When a selection changes,
 * dependents are refreshed one at a time, so a panel's fetch always sees
 * the resolved selection of its left neighbour.
 */
class Cascade {
public:
    Cascade() = default;

    // Append a panel; it becomes a dependent of every panel already present
    size_t add_panel(Panel panel, RowFetcher fetcher);

    size_t size() const { return panels_.size(); }
    bool empty() const { return panels_.empty(); }
    size_t rightmost_index() const { return panels_.size() - 1; }

    Panel& panel(size_t index) { return panels_.at(index); }
    const Panel& panel(size_t index) const { return panels_.at(index); }
    Panel& rightmost() { return panels_.back(); }

    // Selected rows of panels [0, index), or nullopt if any is absent
    std::optional<std::vector<std::string>> upstream_selection(size_t index) const;

    // Run the panel's fetcher. Failures and stops yield an empty list.
    std::vector<std::string> fetch(size_t index,
                                   const std::vector<std::string>& upstream,
                                   std::stop_token stop = {}) const;

    // Fetch and apply rows for one panel, redrawing if they changed.
    // Returns true when the panel's selected row changed.
    bool refresh_panel(size_t index, bool active);

    // Refresh every dependent of `index`, left to right
    void propagate(size_t index, size_t active_index);

    // Refresh all panels, left to right
    void refresh_all(size_t active_index);

    void draw_all(size_t active_index);

private:
    std::vector<Panel> panels_;
    std::vector<RowFetcher> fetchers_;
};

} // namespace kls::tui
