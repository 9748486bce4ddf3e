#pragma once
#include "rebootto/terminal.hpp"
#include "rebootto/types.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace rebootto {

enum class SelectionStatus { Running, Quit, Acted };

/**
 * SelectionController
 *
 * Interactive boot entry picker.
 *
 * Keys (press events only):
 *   Up/Down   move, wrapping at both ends
 *   Home/End  first/last entry
 *   Enter     reboot into the selected entry
 *   n         set the selected entry as next boot only
 *   q/Esc/^C  quit without doing anything
 *
 * The catalog must outlive the controller.
 */
class SelectionController {
public:
    explicit SelectionController(const BootCatalog& catalog);

    SelectionStatus handle(const KeyEvent& key);

    // Takes over the terminal until the user quits or picks an entry. The
    // terminal is restored before returning, also when draw/poll throw.
    ChosenAction run(ITerminal& terminal,
                     std::chrono::milliseconds poll_interval,
                     const std::string& title);

    Frame frame(const std::string& title) const;

    std::size_t selected() const { return selected_; }
    SelectionStatus status() const { return status_; }
    const ChosenAction& action() const { return action_; }

private:
    void choose(bool reboot);

    const BootCatalog& catalog_;
    std::size_t selected_ = 0;
    SelectionStatus status_ = SelectionStatus::Running;
    ChosenAction action_ = NoAction{};
};

} // namespace rebootto
