#include "rebootto/selection_controller.hpp"
#include "rebootto/log.hpp"

namespace rebootto {

SelectionController::SelectionController(const BootCatalog& catalog) : catalog_(catalog) {}

SelectionStatus SelectionController::handle(const KeyEvent& key) {
    if (key.kind != KeyKind::Press || status_ != SelectionStatus::Running) {
        return status_;
    }

    const std::size_t count = catalog_.entries.size();

    switch (key.code) {
        case KeyCode::Esc:
            status_ = SelectionStatus::Quit;
            break;

        case KeyCode::Char:
            // q and n work with or without Ctrl; c only with it.
            if (key.ch == 'q' || (key.ctrl && key.ch == 'c')) {
                status_ = SelectionStatus::Quit;
            } else if (key.ch == 'n') {
                choose(false);
            }
            break;

        case KeyCode::Down:
            if (count == 0) break;
            selected_ = (selected_ >= count - 1) ? 0 : selected_ + 1;
            break;

        case KeyCode::Up:
            if (count == 0) break;
            selected_ = (selected_ == 0) ? count - 1 : selected_ - 1;
            break;

        case KeyCode::Home:
            selected_ = 0;
            break;

        case KeyCode::End:
            if (count > 0) selected_ = count - 1;
            break;

        case KeyCode::Enter:
            choose(true);
            break;

        case KeyCode::Other:
            break;
    }

    return status_;
}

void SelectionController::choose(bool reboot) {
    if (selected_ < catalog_.entries.size()) {
        const BootEntry& entry = catalog_.entries[selected_];
        if (reboot) {
            action_ = RebootTo{entry};
        } else {
            action_ = SetNext{entry};
        }
    }
    status_ = SelectionStatus::Acted;
}

Frame SelectionController::frame(const std::string& title) const {
    Frame f;
    f.title = title;
    f.rows = catalog_.labels();
    if (selected_ < f.rows.size()) f.selected = selected_;
    return f;
}

ChosenAction SelectionController::run(ITerminal& terminal,
                                      std::chrono::milliseconds poll_interval,
                                      const std::string& title) {
    {
        TerminalGuard guard(terminal);

        while (status_ == SelectionStatus::Running) {
            terminal.draw(frame(title));

            if (auto key = terminal.poll(poll_interval)) {
                handle(*key);
            }
        }
    }

    Logger::verbose("Selection finished (%s)", status_ == SelectionStatus::Quit ? "quit" : "acted");
    return action_;
}

} // namespace rebootto
