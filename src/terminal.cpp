#include "rebootto/terminal.hpp"
#include "rebootto/log.hpp"

#include <exception>

namespace rebootto {

TerminalGuard::TerminalGuard(ITerminal& terminal) : terminal_(terminal) {
    terminal_.enter();
}

TerminalGuard::~TerminalGuard() {
    try {
        terminal_.leave();
    } catch (const std::exception& e) {
        Logger::error("Failed to restore terminal: %s", e.what());
    }
}

} // namespace rebootto
