#pragma once
#include "rebootto/command_runner.hpp"
#include "rebootto/entry_parser.hpp"
#include "rebootto/types.hpp"

#include <cstdint>
#include <string>

namespace rebootto {

/**
 * BootControl
 *
 * Firmware boot entry control on top of efibootmgr and a reboot command.
 * - load_catalog(): runs the listing command and parses its output.
 * - set_next(): "efibootmgr --bootnext NNNN".
 * - reboot_now(): the configured reboot command ("shutdown -r now").
 *
 * All three throw LaunchError when the command cannot be started and return
 * the exit status otherwise; deciding what a failure means is up to callers.
 */
class BootControl {
public:
    BootControl(ICommandRunner& runner, Config config);

    BootCatalog load_catalog();
    CommandResult set_next(const BootEntry& entry);
    CommandResult reboot_now();

    const Config& config() const { return config_; }

    // Boot ids are passed to efibootmgr as four zero padded digits.
    static std::string format_id(std::uint16_t id);

private:
    ICommandRunner& runner_;
    Config config_;
    EntryParser parser_;
};

} // namespace rebootto
