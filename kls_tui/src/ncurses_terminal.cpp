#include "utils/logger.hpp"
#include "utils/process_runner.hpp"
#include <algorithm>
#include <cstdio>
#include <format>
#include <stdexcept>

// curses defines move(), clear() and friends as macros; keep it last
#include "ncurses_terminal.hpp"
#include "utils/colors.hpp"

namespace kls::tui {

namespace {

constexpr mmask_t CLICK_MASK = BUTTON1_CLICKED | BUTTON1_PRESSED;

chtype style_attr(TextStyle style) {
    switch (style) {
        case TextStyle::Emphasis: return A_BOLD | COLOR_PAIR(colors::TITLE_ACTIVE);
        case TextStyle::Selected: return A_BOLD | COLOR_PAIR(colors::ROW_SELECTED);
        case TextStyle::Dim:      return A_DIM | COLOR_PAIR(colors::TEXT_DIM);
        case TextStyle::Normal:   return A_NORMAL;
    }
    return A_NORMAL;
}

} // namespace

// ==================================================================
// NcursesCanvas
// ==================================================================

NcursesCanvas::NcursesCanvas(int origin_col, int width, int height)
    : window_(newwin(height, width, 0, origin_col)), width_(width), height_(height) {
    if (!window_) {
        throw std::runtime_error(std::format("newwin failed ({}x{} at column {})",
                                             width, height, origin_col));
    }
}

NcursesCanvas::~NcursesCanvas() {
    if (window_) {
        delwin(window_);
    }
}

void NcursesCanvas::wipe() {
    werase(window_);
}

void NcursesCanvas::draw_border() {
    wattron(window_, COLOR_PAIR(colors::BORDER));
    box(window_, 0, 0);
    wattroff(window_, COLOR_PAIR(colors::BORDER));
}

void NcursesCanvas::print(int row, int col, const std::string& text, TextStyle style) {
    chtype attr = style_attr(style);
    wattron(window_, attr);
    mvwaddnstr(window_, row, col, text.c_str(), std::max(0, width_ - col - 1));
    wattroff(window_, attr);
}

void NcursesCanvas::clear_to_eol(int row, int col) {
    wmove(window_, row, col);
    wclrtoeol(window_);
}

void NcursesCanvas::commit() {
    wnoutrefresh(window_);
    doupdate();
}

// ==================================================================
// NcursesTerminal
// ==================================================================

NcursesTerminal::NcursesTerminal(int input_timeout_ms)
    : input_timeout_ms_(input_timeout_ms) {
}

NcursesTerminal::~NcursesTerminal() {
    shutdown();
}

void NcursesTerminal::init() {
    if (initialized_) return;

    // Initialize ncurses
    if (!initscr()) {
        throw std::runtime_error("failed to initialize the terminal");
    }
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    set_escdelay(25);
    timeout(input_timeout_ms_);

    mousemask(CLICK_MASK, nullptr);
    mouseinterval(0);

    colors::init_color_pairs();

    // stdscr must be clean before the first getch() or it paints over the panels
    refresh();

    getmaxyx(stdscr, lines_, columns_);
    create_status_window();

    initialized_ = true;
    LOG_INFO("NcursesTerminal", std::format("Initialized ({}x{})", columns_, lines_));
}

void NcursesTerminal::shutdown() {
    if (!initialized_) return;

    if (status_win_) {
        delwin(status_win_);
        status_win_ = nullptr;
    }
    mousemask(0, nullptr);
    endwin();

    // Some terminals keep reporting motion events after endwin()
    std::printf("\033[?1003l");
    std::fflush(stdout);

    initialized_ = false;
    LOG_INFO("NcursesTerminal", "Shut down");
}

void NcursesTerminal::create_status_window() {
    if (status_win_) {
        delwin(status_win_);
    }
    status_win_ = newwin(1, columns_, lines_ - 1, 0);
}

std::unique_ptr<Canvas> NcursesTerminal::create_canvas(int origin_col, int width, int height) {
    return std::make_unique<NcursesCanvas>(origin_col, width, height);
}

std::optional<InputEvent> NcursesTerminal::poll_input() {
    int ch = getch();
    if (ch == ERR) {
        return std::nullopt;
    }
    return decode(ch);
}

InputEvent NcursesTerminal::decode(int ch) {
    switch (ch) {
        case KEY_UP:        return InputEvent::special(Key::Up);
        case KEY_DOWN:      return InputEvent::special(Key::Down);
        case KEY_PPAGE:     return InputEvent::special(Key::PageUp);
        case KEY_NPAGE:     return InputEvent::special(Key::PageDown);
        case KEY_HOME:      return InputEvent::special(Key::Home);
        case KEY_END:       return InputEvent::special(Key::End);
        case KEY_LEFT:      return InputEvent::special(Key::Left);
        case KEY_RIGHT:     return InputEvent::special(Key::Right);
        case KEY_BTAB:      return InputEvent::special(Key::BackTab);
        case '\t':          return InputEvent::special(Key::Tab);
        case 27:            return InputEvent::special(Key::Escape);
        case KEY_BACKSPACE:
        case 127:
        case '\b':          return InputEvent::special(Key::Backspace);
        case KEY_ENTER:
        case '\n':
        case '\r':          return InputEvent::special(Key::Enter);
        case KEY_DC:        return InputEvent::special(Key::Delete);
        case KEY_RESIZE:    return InputEvent::special(Key::Resize);
        case KEY_MOUSE: {
            MEVENT event;
            if (getmouse(&event) == OK && (event.bstate & CLICK_MASK)) {
                return InputEvent::click(event.x, event.y);
            }
            return InputEvent::special(Key::Unknown);
        }
        default:
            break;
    }

    if (ch >= KEY_F(1) && ch <= KEY_F(12)) {
        return InputEvent::function(ch - KEY_F0);
    }
    if (ch >= 1 && ch <= 26) {
        return InputEvent::ctrl(static_cast<char>('a' + ch - 1));
    }
    if (ch >= 32 && ch < 127) {
        return InputEvent::character(static_cast<char>(ch));
    }
    return InputEvent::special(Key::Unknown);
}

void NcursesTerminal::draw_status(const std::string& hints, const std::string& message) {
    if (!status_win_) return;

    werase(status_win_);

    wattron(status_win_, COLOR_PAIR(colors::STATUS));
    mvwaddnstr(status_win_, 0, 1, hints.c_str(), std::max(0, columns_ - 2));
    wattroff(status_win_, COLOR_PAIR(colors::STATUS));

    // Message takes the right end when there is room left after the hints
    int room = columns_ - static_cast<int>(hints.size()) - 4;
    if (!message.empty() && room > 10) {
        std::string text = message.size() > static_cast<size_t>(room)
            ? message.substr(0, room - 3) + "..."
            : message;
        wattron(status_win_, COLOR_PAIR(colors::STATUS_MESSAGE) | A_BOLD);
        mvwaddstr(status_win_, 0, columns_ - static_cast<int>(text.size()) - 1, text.c_str());
        wattroff(status_win_, COLOR_PAIR(colors::STATUS_MESSAGE) | A_BOLD);
    }

    wnoutrefresh(status_win_);
    doupdate();
}

bool NcursesTerminal::confirm(const std::string& question) {
    const std::string choices = "[y] Yes    [n] No";
    int width = std::min(columns_, std::max(static_cast<int>(question.size()) + 6, 30));
    int height = 5;
    WINDOW* dialog = newwin(height, width, (lines_ - height) / 2, (columns_ - width) / 2);
    if (!dialog) {
        LOG_ERROR("NcursesTerminal", "Could not open confirmation dialog");
        return false;
    }

    keypad(dialog, TRUE);
    wtimeout(dialog, -1);

    wbkgd(dialog, COLOR_PAIR(colors::DIALOG));
    box(dialog, 0, 0);
    wattron(dialog, A_BOLD);
    mvwaddnstr(dialog, 1, 3, question.c_str(), width - 6);
    wattroff(dialog, A_BOLD);
    mvwaddstr(dialog, 3, std::max(1, (width - static_cast<int>(choices.size())) / 2), choices.c_str());
    wrefresh(dialog);

    bool answer = false;
    while (true) {
        int ch = wgetch(dialog);
        if (ch == 'y' || ch == 'Y') {
            answer = true;
            break;
        }
        if (ch == 'n' || ch == 'N' || ch == 27) {
            break;
        }
    }

    delwin(dialog);
    touchwin(stdscr);
    wnoutrefresh(stdscr);
    return answer;
}

int NcursesTerminal::run_external(const std::string& command) {
    def_prog_mode();
    endwin();

    int status = ProcessRunner::run_shell(command);

    reset_prog_mode();
    refresh();
    return status;
}

void NcursesTerminal::update_size() {
    getmaxyx(stdscr, lines_, columns_);
    create_status_window();
    clear();
    refresh();
    LOG_INFO("NcursesTerminal", std::format("Layout updated ({}x{})", columns_, lines_));
}

} // namespace kls::tui
