#include "panels/cascade.hpp"
#include "utils/logger.hpp"
#include <format>

namespace kls::tui {

size_t Cascade::add_panel(Panel panel, RowFetcher fetcher) {
    const size_t index = panels_.size();

    for (auto& existing : panels_) {
        auto dependents = existing.dependents();
        dependents.push_back(index);
        existing.set_dependents(std::move(dependents));
    }

    panels_.push_back(std::move(panel));
    fetchers_.push_back(std::move(fetcher));
    return index;
}

std::optional<std::vector<std::string>> Cascade::upstream_selection(size_t index) const {
    std::vector<std::string> selection;
    selection.reserve(index);

    for (size_t i = 0; i < index && i < panels_.size(); ++i) {
        auto row = panels_[i].selected_row();
        if (!row) {
            return std::nullopt;
        }
        selection.push_back(std::move(*row));
    }
    return selection;
}

std::vector<std::string> Cascade::fetch(size_t index,
                                        const std::vector<std::string>& upstream,
                                        std::stop_token stop) const {
    const auto& fetcher = fetchers_.at(index);
    if (!fetcher) {
        return {};
    }

    auto rows = fetcher(upstream, stop);
    if (!rows) {
        if (stop.stop_requested()) {
            LOG_DEBUG("Cascade", panels_[index].title() + ": fetch cancelled");
        } else {
            LOG_INFO("Cascade", panels_[index].title() + ": fetch failed, showing no rows");
        }
        return {};
    }
    return std::move(*rows);
}

bool Cascade::refresh_panel(size_t index, bool active) {
    auto& target = panels_.at(index);
    const auto before = target.selected_row();

    std::vector<std::string> rows;
    if (auto upstream = upstream_selection(index)) {
        rows = fetch(index, *upstream);
    }

    if (target.replace_rows(std::move(rows))) {
        target.draw(active);
        LOG_DEBUG("Cascade", std::format("{}: {} rows", target.title(), target.all_rows().size()));
    }

    return target.selected_row() != before;
}

void Cascade::propagate(size_t index, size_t active_index) {
    for (size_t dependent : panels_.at(index).dependents()) {
        refresh_panel(dependent, dependent == active_index);
    }
}

void Cascade::refresh_all(size_t active_index) {
    for (size_t i = 0; i < panels_.size(); ++i) {
        refresh_panel(i, i == active_index);
    }
}

void Cascade::draw_all(size_t active_index) {
    for (size_t i = 0; i < panels_.size(); ++i) {
        panels_[i].draw(i == active_index);
    }
}

} // namespace kls::tui
