#pragma once

#include "input.hpp"
#include "terminal.hpp"
#include "utils/circular_window.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kls::tui {

enum class FilterState {
    Normal,
    EmptyFilter,
    FilledFilter
};

class Panel {
public:
    // Layout inside the panel's canvas
    static constexpr int TITLE_ROW = 1;
    static constexpr int FIRST_ROW = 3;
    static constexpr int CHROME_ROWS = 5;   // border, title, gap, footer, border

    Panel(const std::string& title, size_t ordinal);

    Panel(Panel&&) = default;
    Panel& operator=(Panel&&) = default;

    // Give the panel its screen area. Window height follows the canvas.
    void attach(std::unique_ptr<Canvas> canvas, int origin_col, int width);

    // Getters
    const std::string& title() const { return title_; }
    size_t ordinal() const { return ordinal_; }
    int origin_col() const { return origin_col_; }
    int width() const { return width_; }
    int window_height() const { return window_height_; }
    bool contains_column(int x) const { return x >= origin_col_ && x < origin_col_ + width_; }
    Canvas* canvas() const { return canvas_.get(); }

    const std::vector<std::string>& all_rows() const { return all_rows_; }
    const CircularWindow<std::string>& filtered_rows() const { return filtered_rows_; }
    const std::string& filter_text() const { return filter_text_; }
    size_t selected_offset() const { return selected_offset_; }

    FilterState state() const { return state_; }
    void set_state(FilterState state) { state_ = state; }

    const std::vector<size_t>& dependents() const { return dependents_; }
    void set_dependents(std::vector<size_t> dependents) { dependents_ = std::move(dependents); }

    // min(window height, filtered row count)
    size_t visible_count() const;
    std::vector<std::string> visible_rows() const;
    std::optional<std::string> selected_row() const;

    // Replace the row set wholesale. Returns false when the rows are
    // identical. The selection resets only when the visible count changes.
    bool replace_rows(std::vector<std::string> rows);

    // Set the (lower-cased) filter text. Returns true when the filtered row
    // set changed, in which case the window and selection restart at 0.
    bool set_filter(const std::string& text);

    // Vertical navigation. Returns false when nothing moved.
    bool move_selection(Key key);

    // Select a row of the visible window. Returns false when out of range
    // or already selected.
    bool select_visible(size_t offset);

    // Visible-row offset under a screen row, if any
    std::optional<size_t> row_at(int screen_y) const;

    // Rendering
    void draw(bool active);
    void draw_header(bool active);
    void draw_footer();

    // Case-insensitive substring selection preserving order
    static std::vector<std::string> filter_rows(const std::vector<std::string>& rows,
                                                const std::string& filter);

private:
    std::string title_;
    size_t ordinal_;

    std::vector<std::string> all_rows_;
    CircularWindow<std::string> filtered_rows_;
    std::string filter_text_;
    FilterState state_ = FilterState::Normal;
    size_t selected_offset_ = 0;
    std::vector<size_t> dependents_;

    std::unique_ptr<Canvas> canvas_;
    int origin_col_ = 0;
    int width_ = 0;
    int window_height_ = 0;

    void clamp_selection();
    void draw_rows();
    std::string fit(const std::string& text) const;
};

} // namespace kls::tui
