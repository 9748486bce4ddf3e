#pragma once
#include "rebootto/terminal.hpp"

struct screen;

namespace rebootto {

class NcursesTerminal final : public ITerminal {
public:
    NcursesTerminal() = default;
    ~NcursesTerminal() override;

    NcursesTerminal(const NcursesTerminal&) = delete;
    NcursesTerminal& operator=(const NcursesTerminal&) = delete;

    void enter() override;
    void leave() override;
    void draw(const Frame& frame) override;
    std::optional<KeyEvent> poll(std::chrono::milliseconds timeout) override;

private:
    screen* screen_ = nullptr;
    std::size_t scroll_ = 0;
};

} // namespace rebootto
