#include "input.hpp"
#include <cctype>

namespace kls::tui {

bool InputEvent::is_vertical_navigation() const {
    switch (key) {
        case Key::Up:
        case Key::Down:
        case Key::PageUp:
        case Key::PageDown:
        case Key::Home:
        case Key::End:
            return true;
        default:
            return false;
    }
}

bool InputEvent::is_horizontal_navigation() const {
    switch (key) {
        case Key::Tab:
        case Key::BackTab:
        case Key::Left:
        case Key::Right:
            return true;
        default:
            return false;
    }
}

bool InputEvent::is_filter_char() const {
    if (key != Key::Char) {
        return false;
    }
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '-';
}

std::string InputEvent::binding_id() const {
    switch (key) {
        case Key::Function:
            return "F" + std::to_string(number);
        case Key::Ctrl:
            return std::string("^") + static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        case Key::Delete:
            return "Delete";
        default:
            return "";
    }
}

} // namespace kls::tui
