#include "rebootto/boot_control.hpp"
#include "rebootto/cli.hpp"
#include "rebootto/command_runner.hpp"
#include "rebootto/config.hpp"
#include "rebootto/errors.hpp"
#include "rebootto/log.hpp"
#include "rebootto/ncurses_terminal.hpp"

#include <cstdlib>
#include <iostream>

using namespace rebootto;

int main(int argc, char** argv) {
    CliParse parsed = parse_args(argc, argv);
    if (!parsed.ok) {
        Logger::error("%s", parsed.error.c_str());
        print_usage(std::cerr, argv[0]);
        return 2;
    }

    const CliOptions& opts = parsed.options;
    if (opts.help) {
        print_help(std::cout, argv[0]);
        return EXIT_SUCCESS;
    }
    if (opts.version) {
        std::cout << "reboot-to " << kVersion << "\n";
        return EXIT_SUCCESS;
    }

    Logger::verbose_enabled = opts.verbose;

    Config config;
    try {
        config = ConfigLoader{}.load(opts.config_path);
    } catch (const ConfigError& e) {
        Logger::error("Invalid configuration: %s", e.what());
        return EXIT_FAILURE;
    }

    ProcessRunner runner;
    BootControl boot(runner, config);
    NcursesTerminal terminal;

    return run(opts, boot, terminal, std::cout);
}
