#pragma once

#include <string>

namespace kls::tui {

// Terminal-independent input classes
enum class Key {
    Char,
    Up,
    Down,
    PageUp,
    PageDown,
    Home,
    End,
    Tab,
    BackTab,
    Left,
    Right,
    Escape,
    Backspace,
    Enter,
    Delete,
    Function,   // F1..F12, number holds the index
    Ctrl,       // Ctrl+letter, ch holds the lower-case letter
    Mouse,      // left click at (x, y) screen coordinates
    Resize,
    Unknown
};

struct InputEvent {
    Key key = Key::Unknown;
    char ch = 0;
    int number = 0;
    int x = 0;
    int y = 0;

    static InputEvent character(char c) { return InputEvent{.key = Key::Char, .ch = c}; }
    static InputEvent special(Key k) { return InputEvent{.key = k}; }
    static InputEvent ctrl(char c) { return InputEvent{.key = Key::Ctrl, .ch = c}; }
    static InputEvent function(int n) { return InputEvent{.key = Key::Function, .number = n}; }
    static InputEvent click(int x, int y) { return InputEvent{.key = Key::Mouse, .x = x, .y = y}; }

    bool is_vertical_navigation() const;
    bool is_horizontal_navigation() const;

    // Alnum or hyphen: the characters a filter may contain
    bool is_filter_char() const;

    // Identifier used by key bindings ("F1", "^Y", "Delete"); empty for
    // keys that cannot be bound
    std::string binding_id() const;
};

} // namespace kls::tui
