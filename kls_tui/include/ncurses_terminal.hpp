#pragma once

#include "terminal.hpp"
#include <ncurses.h>

namespace kls::tui {

class NcursesCanvas : public Canvas {
public:
    NcursesCanvas(int origin_col, int width, int height);
    ~NcursesCanvas() override;

    NcursesCanvas(const NcursesCanvas&) = delete;
    NcursesCanvas& operator=(const NcursesCanvas&) = delete;

    int height() const override { return height_; }
    int width() const override { return width_; }

    void wipe() override;
    void draw_border() override;
    void print(int row, int col, const std::string& text, TextStyle style) override;
    void clear_to_eol(int row, int col) override;
    void commit() override;

private:
    WINDOW* window_ = nullptr;
    int width_;
    int height_;
};

class NcursesTerminal : public Terminal {
public:
    explicit NcursesTerminal(int input_timeout_ms = 50);
    ~NcursesTerminal() override;

    // Initialization
    void init();
    void shutdown();

    int lines() const override { return lines_; }
    int columns() const override { return columns_; }

    std::unique_ptr<Canvas> create_canvas(int origin_col, int width, int height) override;
    std::optional<InputEvent> poll_input() override;
    void draw_status(const std::string& hints, const std::string& message) override;
    bool confirm(const std::string& question) override;
    int run_external(const std::string& command) override;
    void update_size() override;

    // Map one getch() result to an input event
    static InputEvent decode(int ch);

private:
    WINDOW* status_win_ = nullptr;
    int input_timeout_ms_;
    int lines_ = 0;
    int columns_ = 0;
    bool initialized_ = false;

    void create_status_window();
};

} // namespace kls::tui
