#include "panels/panel.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <format>

namespace kls::tui {

namespace {

std::string to_lower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

Panel::Panel(const std::string& title, size_t ordinal)
    : title_(title), ordinal_(ordinal) {
}

void Panel::attach(std::unique_ptr<Canvas> canvas, int origin_col, int width) {
    canvas_ = std::move(canvas);
    origin_col_ = origin_col;
    width_ = width;
    window_height_ = canvas_ ? std::max(0, canvas_->height() - CHROME_ROWS) : 0;

    // Every row fits again: back to list order with a moving highlight
    if (filtered_rows_.size() <= static_cast<size_t>(window_height_)) {
        filtered_rows_.reset();
    }
    clamp_selection();

    LOG_DEBUG("Panel", std::format("{}: attached at column {} ({} cols, {} rows)",
              title_, origin_col_, width_, window_height_));
}

size_t Panel::visible_count() const {
    return std::min(static_cast<size_t>(window_height_), filtered_rows_.size());
}

std::vector<std::string> Panel::visible_rows() const {
    return filtered_rows_.view(visible_count());
}

std::optional<std::string> Panel::selected_row() const {
    if (selected_offset_ >= visible_count()) {
        return std::nullopt;
    }
    return filtered_rows_.at(selected_offset_);
}

std::vector<std::string> Panel::filter_rows(const std::vector<std::string>& rows,
                                            const std::string& filter) {
    if (filter.empty()) {
        return rows;
    }

    const std::string needle = to_lower(filter);
    std::vector<std::string> out;
    for (const auto& row : rows) {
        if (to_lower(row).find(needle) != std::string::npos) {
            out.push_back(row);
        }
    }
    return out;
}

bool Panel::replace_rows(std::vector<std::string> rows) {
    if (rows == all_rows_) {
        return false;
    }

    const size_t previous_visible = visible_count();

    all_rows_ = std::move(rows);
    filtered_rows_ = CircularWindow<std::string>(filter_rows(all_rows_, filter_text_));

    if (visible_count() != previous_visible) {
        selected_offset_ = 0;
    }
    clamp_selection();
    return true;
}

bool Panel::set_filter(const std::string& text) {
    filter_text_ = to_lower(text);

    auto matched = filter_rows(all_rows_, filter_text_);
    if (matched == filtered_rows_.elements()) {
        return false;
    }

    filtered_rows_ = CircularWindow<std::string>(std::move(matched));
    selected_offset_ = 0;
    return true;
}

bool Panel::move_selection(Key key) {
    const size_t visible = visible_count();
    if (visible <= 1) {
        return false;
    }

    // Larger sets scroll the window under a fixed highlight
    const bool rotating = filtered_rows_.size() > static_cast<size_t>(window_height_);
    const long page = static_cast<long>(visible);

    switch (key) {
        case Key::Down:
            if (rotating) {
                filtered_rows_.shift(1);
            } else {
                selected_offset_ = (selected_offset_ + 1) % visible;
            }
            return true;
        case Key::Up:
            if (rotating) {
                filtered_rows_.shift(-1);
            } else {
                selected_offset_ = (selected_offset_ + visible - 1) % visible;
            }
            return true;
        case Key::PageDown:
            filtered_rows_.shift(page);
            return true;
        case Key::PageUp:
            filtered_rows_.shift(-page);
            return true;
        case Key::Home:
            filtered_rows_.reset();
            selected_offset_ = 0;
            return true;
        case Key::End:
            filtered_rows_.reset();
            if (rotating) {
                filtered_rows_.shift(-page);
            }
            selected_offset_ = visible - 1;
            return true;
        default:
            return false;
    }
}

bool Panel::select_visible(size_t offset) {
    if (offset >= visible_count() || offset == selected_offset_) {
        return false;
    }
    selected_offset_ = offset;
    return true;
}

std::optional<size_t> Panel::row_at(int screen_y) const {
    int index = screen_y - FIRST_ROW;
    if (index < 0 || static_cast<size_t>(index) >= visible_count()) {
        return std::nullopt;
    }
    return static_cast<size_t>(index);
}

void Panel::clamp_selection() {
    const size_t visible = visible_count();
    if (visible == 0) {
        selected_offset_ = 0;
    } else if (selected_offset_ >= visible) {
        selected_offset_ = visible - 1;
    }
}

void Panel::draw(bool active) {
    if (!canvas_) return;

    canvas_->wipe();
    canvas_->draw_border();
    draw_header(active);
    draw_rows();
    draw_footer();
}

void Panel::draw_header(bool active) {
    if (!canvas_) return;

    canvas_->print(TITLE_ROW, 2, fit(title_), active ? TextStyle::Emphasis : TextStyle::Normal);
    canvas_->commit();
}

void Panel::draw_rows() {
    auto rows = visible_rows();
    for (size_t i = 0; i < rows.size(); ++i) {
        auto style = i == selected_offset_ ? TextStyle::Selected : TextStyle::Normal;
        canvas_->print(FIRST_ROW + static_cast<int>(i), 2, fit(rows[i]), style);
    }
}

void Panel::draw_footer() {
    if (!canvas_) return;

    const int row = canvas_->height() - 2;
    const bool filtering = state_ != FilterState::Normal;
    const std::string content = fit(filtering ? "/" + filter_text_ : "Press / for search");

    canvas_->print(row, 2, content, filtering ? TextStyle::Emphasis : TextStyle::Dim);
    canvas_->clear_to_eol(row, 2 + static_cast<int>(content.size()));
    canvas_->draw_border();
    canvas_->commit();
}

std::string Panel::fit(const std::string& text) const {
    const int room = width_ - 4;
    if (room <= 0) {
        return "";
    }
    if (text.size() <= static_cast<size_t>(room)) {
        return text;
    }
    return text.substr(0, static_cast<size_t>(room));
}

} // namespace kls::tui
