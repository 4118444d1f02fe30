#pragma once

#include "input.hpp"
#include <memory>
#include <optional>
#include <string>

namespace kls::tui {

enum class TextStyle {
    Normal,
    Emphasis,   // active title, filter prompt
    Selected,   // highlighted row
    Dim         // inactive filter hint
};

// A rectangular sub-window owned by one panel
class Canvas {
public:
    virtual ~Canvas() = default;

    virtual int height() const = 0;
    virtual int width() const = 0;

    virtual void wipe() = 0;
    virtual void draw_border() = 0;
    virtual void print(int row, int col, const std::string& text, TextStyle style) = 0;
    virtual void clear_to_eol(int row, int col) = 0;

    // Push pending changes to the screen
    virtual void commit() = 0;
};

// Screen, input and foreground-process surface used by the application
class Terminal {
public:
    virtual ~Terminal() = default;

    virtual int lines() const = 0;
    virtual int columns() const = 0;

    virtual std::unique_ptr<Canvas> create_canvas(int origin_col, int width, int height) = 0;

    // One pending input event, or nullopt after the input timeout expires
    virtual std::optional<InputEvent> poll_input() = 0;

    // Bottom line: key hints on the left, last notable message on the right
    virtual void draw_status(const std::string& hints, const std::string& message) = 0;

    // Blocking yes/no overlay
    virtual bool confirm(const std::string& question) = 0;

    // Leave screen mode, run the command attached to the terminal, restore.
    // Returns the command's exit status.
    virtual int run_external(const std::string& command) = 0;

    // Pick up a new terminal size after a resize event
    virtual void update_size() = 0;
};

} // namespace kls::tui
