#include "rebootto/cli.hpp"
#include "rebootto/action_dispatcher.hpp"
#include "rebootto/config.hpp"
#include "rebootto/entry_matcher.hpp"
#include "rebootto/errors.hpp"
#include "rebootto/log.hpp"
#include "rebootto/selection_controller.hpp"

#include <chrono>
#include <cstdlib>
#include <getopt.h>

namespace rebootto {

namespace {

// Runs a flag driven action. Only an unknown DEST is a failure here; command
// failures are reported by the dispatcher.
int resolve_and_dispatch(BootControl& boot, const BootCatalog& catalog,
                         const std::string& dest, bool reboot) {
    auto entry = lookup(catalog, dest);
    if (!entry) {
        Logger::error("Could not find UEFI boot entry from specifier \"%s\"", dest.c_str());
        return EXIT_FAILURE;
    }

    ActionDispatcher dispatcher(boot);
    if (reboot) {
        dispatcher.reboot_to(*entry);
    } else {
        dispatcher.set_next(*entry);
    }
    return EXIT_SUCCESS;
}

} // namespace

CliParse parse_args(int argc, char** argv) {
    CliParse res;

    static option long_opts[] = {
        {"list", no_argument, nullptr, 'l'},
        {"next", required_argument, nullptr, 'n'},
        {"reboot-to", required_argument, nullptr, 'r'},
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'V'},
        {nullptr, 0, nullptr, 0},
    };

    // Restart getopt, parse_args may be called more than once per process.
    optind = 0;
    opterr = 0;

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, ":ln:r:c:vhV", long_opts, &idx)) != -1) {
        switch (c) {
            case 'l': res.options.list = true; break;
            case 'n': res.options.next = optarg; break;
            case 'r': res.options.reboot_to = optarg; break;
            case 'c': res.options.config_path = optarg; break;
            case 'v': res.options.verbose = true; break;
            case 'h': res.options.help = true; break;
            case 'V': res.options.version = true; break;

            case ':':
                res.ok = false;
                res.error = std::string("missing argument for ") + argv[optind - 1];
                return res;

            default:
                res.ok = false;
                res.error = optopt ? std::string("unknown option -") + static_cast<char>(optopt)
                                   : std::string("unknown option ") + argv[optind - 1];
                return res;
        }
    }

    if (optind < argc) {
        res.ok = false;
        res.error = std::string("unexpected argument ") + argv[optind];
    }
    return res;
}

void print_usage(std::ostream& out, const char* argv0) {
    out << "Usage:\n"
        << "  " << argv0 << " [-l] [-n <DEST>] [-r <DEST>] [-c <file>] [-v]\n"
        << "\n"
        << "Options:\n"
        << "  -l, --list             Output a list of boot entries and their IDs\n"
        << "  -n, --next <DEST>      Set the entry specified by <DEST> as the next (one-time) boot target\n"
        << "  -r, --reboot-to <DEST> Reboot directly to the entry specified by <DEST>\n"
        << "  -c, --config <file>    Read settings from a JSON file (default " << kDefaultConfigPath << ")\n"
        << "  -v, --verbose          Print the commands being run\n"
        << "  -h, --help             Show this help\n"
        << "  -V, --version          Show the version\n";
}

void print_help(std::ostream& out, const char* argv0) {
    out << argv0 << " is a terminal UI wrapper around the efibootmgr and shutdown commands, intended\n"
        << "to provide a simple way to reboot into another UEFI boot entry (typically another\n"
        << "operating system).\n"
        << "\n"
        << "When executed without any arguments you will be able to select a UEFI boot entry in a\n"
        << "list.\n"
        << "\n"
        << "<DEST> is either a number or a text. Numbers are matched against the ID of boot entries\n"
        << "(see --list, or run efibootmgr without arguments). Text is matched against the name of\n"
        << "the boot entries, case-sensitive and from the start: an entry named \"ubuntu\" is matched\n"
        << "by \"ub\" but not by \"Ub\" nor by \"bun\".\n"
        << "\n"
        << "The \"shutdown\" and \"efibootmgr\" commands must be available in PATH, and the program\n"
        << "must run with permission to change UEFI variables.\n"
        << "\n";
    print_usage(out, argv0);
}

int run(const CliOptions& options, BootControl& boot, ITerminal& terminal, std::ostream& out) {
    BootCatalog catalog;
    try {
        catalog = boot.load_catalog();
    } catch (const LaunchError& e) {
        Logger::error("Error running the %s command: %s", boot.config().efibootmgr.c_str(), e.what());
        return EXIT_FAILURE;
    }

    if (options.list) {
        catalog.print_list(out);
        return EXIT_SUCCESS;
    }

    if (options.reboot_to) {
        return resolve_and_dispatch(boot, catalog, *options.reboot_to, true);
    }

    if (options.next) {
        return resolve_and_dispatch(boot, catalog, *options.next, false);
    }

    SelectionController controller(catalog);
    ChosenAction action;
    try {
        action = controller.run(terminal,
                                std::chrono::milliseconds(boot.config().poll_interval_ms),
                                boot.config().title);
    } catch (const TerminalError& e) {
        Logger::error("Error in TUI: %s", e.what());
        return EXIT_FAILURE;
    }

    ActionDispatcher(boot).dispatch(action);
    return EXIT_SUCCESS;
}

} // namespace rebootto
