#pragma once
#include <stdexcept>
#include <string>

namespace rebootto {

// External command could not be started (not found, not executable, ...).
struct LaunchError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ConfigError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct TerminalError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace rebootto
