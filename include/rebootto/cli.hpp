#pragma once
#include "rebootto/boot_control.hpp"
#include "rebootto/terminal.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace rebootto {

#ifndef REBOOTTO_VERSION
#error "REBOOTTO_VERSION must be defined by the build"
#endif

inline constexpr const char* kVersion = REBOOTTO_VERSION;

struct CliOptions {
    bool list = false;
    std::optional<std::string> next;       // DEST
    std::optional<std::string> reboot_to;  // DEST
    std::optional<std::string> config_path;
    bool verbose = false;
    bool help = false;
    bool version = false;
};

struct CliParse {
    bool ok = true;
    std::string error;
    CliOptions options;
};

CliParse parse_args(int argc, char** argv);

void print_usage(std::ostream& out, const char* argv0);
void print_help(std::ostream& out, const char* argv0);

/**
 * Runs one invocation: --list, --reboot-to, --next (in that order of
 * precedence) or the interactive picker.
 * @return process exit code
 */
int run(const CliOptions& options, BootControl& boot, ITerminal& terminal, std::ostream& out);

} // namespace rebootto
