#include "rebootto/ncurses_terminal.hpp"
#include "rebootto/errors.hpp"

#include <algorithm>
#include <string>

// last: ncurses defines clear(), erase() and friends as macros
#include <ncurses.h>

namespace rebootto {

namespace {

constexpr int kEscape = 27;

struct Hint {
    const char* key;
    const char* label;
};

constexpr Hint kHints[] = {
    {"Up/Down", " Select "},
    {"Enter", " Reboot "},
    {"n", " Set next "},
    {"Esc/q", " Quit "},
};

int hints_width() {
    int w = 1;
    for (const auto& h : kHints) {
        w += static_cast<int>(std::char_traits<char>::length(h.key) +
                              std::char_traits<char>::length(h.label));
    }
    return w;
}

void draw_hints(int y, int width) {
    int x = std::max(1, (width - hints_width()) / 2);
    mvaddch(y, x++, ' ');
    for (const auto& h : kHints) {
        attron(A_REVERSE | A_BOLD);
        mvaddstr(y, x, h.key);
        attroff(A_REVERSE | A_BOLD);
        x += static_cast<int>(std::char_traits<char>::length(h.key));
        mvaddstr(y, x, h.label);
        x += static_cast<int>(std::char_traits<char>::length(h.label));
    }
}

KeyEvent translate(int ch) {
    KeyEvent ev;
    switch (ch) {
        case KEY_UP:    ev.code = KeyCode::Up; break;
        case KEY_DOWN:  ev.code = KeyCode::Down; break;
        case KEY_HOME:  ev.code = KeyCode::Home; break;
        case KEY_END:   ev.code = KeyCode::End; break;
        case KEY_ENTER:
        case '\n':
        case '\r':      ev.code = KeyCode::Enter; break;
        case kEscape:   ev.code = KeyCode::Esc; break;
        default:
            if (ch >= 1 && ch <= 26) {
                // raw() delivers Ctrl+<letter> as 1..26.
                ev.code = KeyCode::Char;
                ev.ch = static_cast<char>('a' + ch - 1);
                ev.ctrl = true;
            } else if (ch >= 32 && ch < 127) {
                ev.code = KeyCode::Char;
                ev.ch = static_cast<char>(ch);
            }
            break;
    }
    return ev;
}

} // namespace

NcursesTerminal::~NcursesTerminal() {
    if (screen_) {
        endwin();
        delscreen(screen_);
        screen_ = nullptr;
    }
}

void NcursesTerminal::enter() {
    if (screen_) return;

    screen_ = newterm(nullptr, stdout, stdin);
    if (!screen_) {
        throw TerminalError("cannot initialise terminal (is TERM set?)");
    }
    set_term(screen_);

    if (raw() == ERR || noecho() == ERR || keypad(stdscr, TRUE) == ERR) {
        leave();
        throw TerminalError("cannot switch terminal to raw mode");
    }
    set_escdelay(25);
    curs_set(0); // not every terminal can hide the cursor
    scroll_ = 0;
}

void NcursesTerminal::leave() {
    if (!screen_) return;

    int rc = endwin();
    delscreen(screen_);
    screen_ = nullptr;
    if (rc == ERR) {
        throw TerminalError("endwin failed");
    }
}

void NcursesTerminal::draw(const Frame& frame) {
    if (!screen_) throw TerminalError("terminal not initialised");

    int height = 0;
    int width = 0;
    getmaxyx(stdscr, height, width);

    erase();
    box(stdscr, 0, 0);

    if (width > 4) {
        const int tlen = static_cast<int>(frame.title.size());
        attron(A_BOLD);
        mvaddnstr(0, std::max(1, (width - tlen) / 2), frame.title.c_str(), width - 2);
        attroff(A_BOLD);
    }

    const int visible = std::max(0, height - 2);
    if (frame.selected && visible > 0) {
        const std::size_t sel = *frame.selected;
        if (sel < scroll_) scroll_ = sel;
        if (sel >= scroll_ + static_cast<std::size_t>(visible)) scroll_ = sel - visible + 1;
    }

    for (int row = 0; row < visible; ++row) {
        const std::size_t idx = scroll_ + static_cast<std::size_t>(row);
        if (idx >= frame.rows.size()) break;

        const bool sel = frame.selected && *frame.selected == idx;
        if (sel) attron(A_REVERSE);
        mvhline(row + 1, 1, ' ', width - 2);
        mvaddnstr(row + 1, 1, frame.rows[idx].c_str(), width - 2);
        if (sel) attroff(A_REVERSE);
    }

    if (height > 1 && width > hints_width() + 2) {
        draw_hints(height - 1, width);
    }

    if (refresh() == ERR) {
        throw TerminalError("failed to draw screen");
    }
}

std::optional<KeyEvent> NcursesTerminal::poll(std::chrono::milliseconds wait) {
    if (!screen_) throw TerminalError("terminal not initialised");

    wtimeout(stdscr, static_cast<int>(wait.count()));
    int ch = getch();
    if (ch == ERR || ch == KEY_RESIZE) return std::nullopt;
    return translate(ch);
}

} // namespace rebootto
