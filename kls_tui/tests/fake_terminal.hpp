#pragma once

#include "terminal.hpp"
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kls::tui::fakes {

// Records what a panel draws so tests can tell full redraws from
// footer-only ones
struct CanvasLog {
    int wipes = 0;
    int commits = 0;
    int footer_clears = 0;
    std::map<int, std::string> rows;
    std::map<int, TextStyle> styles;
};

class FakeCanvas : public Canvas {
public:
    FakeCanvas(int width, int height, std::shared_ptr<CanvasLog> log)
        : width_(width), height_(height), log_(std::move(log)) {}

    int height() const override { return height_; }
    int width() const override { return width_; }

    void wipe() override {
        ++log_->wipes;
        log_->rows.clear();
        log_->styles.clear();
    }
    void draw_border() override {}
    void print(int row, int, const std::string& text, TextStyle style) override {
        log_->rows[row] = text;
        log_->styles[row] = style;
    }
    void clear_to_eol(int row, int) override {
        if (row == height_ - 2) {
            ++log_->footer_clears;
        }
    }
    void commit() override { ++log_->commits; }

private:
    int width_;
    int height_;
    std::shared_ptr<CanvasLog> log_;
};

// Convenience for tests that drive a single panel
inline std::unique_ptr<Canvas> make_canvas(int window_height,
                                           std::shared_ptr<CanvasLog> log = std::make_shared<CanvasLog>(),
                                           int width = 40) {
    return std::make_unique<FakeCanvas>(width, window_height + 5, std::move(log));
}

class FakeTerminal : public Terminal {
public:
    FakeTerminal(int columns = 100, int lines = 20)
        : columns_(columns), lines_(lines) {}

    int lines() const override { return lines_; }
    int columns() const override { return columns_; }

    std::unique_ptr<Canvas> create_canvas(int origin_col, int width, int height) override {
        auto log = std::make_shared<CanvasLog>();
        canvases[origin_col] = log;
        return std::make_unique<FakeCanvas>(width, height, log);
    }

    std::optional<InputEvent> poll_input() override {
        if (events.empty()) {
            return std::nullopt;
        }
        auto event = events.front();
        events.pop_front();
        return event;
    }

    void draw_status(const std::string& hints, const std::string& message) override {
        last_hints = hints;
        last_message = message;
        ++status_draws;
    }

    bool confirm(const std::string& question) override {
        questions.push_back(question);
        return confirm_answer;
    }

    int run_external(const std::string& command) override {
        commands.push_back(command);
        return exit_status;
    }

    void update_size() override { ++size_updates; }

    void resize(int columns, int lines) {
        columns_ = columns;
        lines_ = lines;
    }

    // Scripted input and recorded output
    std::deque<InputEvent> events;
    std::map<int, std::shared_ptr<CanvasLog>> canvases;
    std::vector<std::string> commands;
    std::vector<std::string> questions;
    std::string last_hints;
    std::string last_message;
    bool confirm_answer = true;
    int exit_status = 0;
    int status_draws = 0;
    int size_updates = 0;

private:
    int columns_;
    int lines_;
};

} // namespace kls::tui::fakes
