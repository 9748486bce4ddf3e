#pragma once
#include "rebootto/types.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace rebootto {

struct Frame {
    std::string title;
    std::vector<std::string> rows;
    std::optional<std::size_t> selected;
};

/**
 * ITerminal
 *
 * What the selection loop needs from a terminal. Implementations throw
 * TerminalError on failure.
 */
class ITerminal {
public:
    virtual ~ITerminal() = default;

    // Switch to the alternate screen and raw mode.
    virtual void enter() = 0;
    // Back to the normal screen and canonical mode.
    virtual void leave() = 0;

    virtual void draw(const Frame& frame) = 0;

    // Waits at most `timeout` for a key; nullopt if none arrived.
    virtual std::optional<KeyEvent> poll(std::chrono::milliseconds timeout) = 0;
};

// Holds the terminal in alternate screen / raw mode for its lifetime.
class TerminalGuard {
public:
    explicit TerminalGuard(ITerminal& terminal);
    ~TerminalGuard();

    TerminalGuard(const TerminalGuard&) = delete;
    TerminalGuard& operator=(const TerminalGuard&) = delete;

private:
    ITerminal& terminal_;
};

} // namespace rebootto
