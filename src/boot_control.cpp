#include "rebootto/boot_control.hpp"
#include "rebootto/errors.hpp"
#include "rebootto/log.hpp"

#include <cstdio>
#include <utility>
#include <vector>

namespace rebootto {

BootControl::BootControl(ICommandRunner& runner, Config config)
    : runner_(runner), config_(std::move(config)) {}

std::string BootControl::format_id(std::uint16_t id) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "%04u", static_cast<unsigned>(id));
    return buf;
}

BootCatalog BootControl::load_catalog() {
    Logger::verbose("Listing boot entries using: %s", config_.efibootmgr.c_str());

    CommandResult res = runner_.run(config_.efibootmgr, {}, true);
    if (!res.ok()) {
        Logger::warn("%s exited with non-zero status: %d", config_.efibootmgr.c_str(), res.exit_code);
    }
    return parser_.parse(res.output);
}

CommandResult BootControl::set_next(const BootEntry& entry) {
    const std::string id = format_id(entry.id);
    Logger::verbose("Setting BootNext to %s (%s)", id.c_str(), entry.name.c_str());
    return runner_.run(config_.efibootmgr, {config_.bootnext_flag, id});
}

CommandResult BootControl::reboot_now() {
    if (config_.reboot_command.empty()) {
        throw LaunchError("no reboot command configured");
    }
    const auto& cmd = config_.reboot_command;
    std::vector<std::string> args(cmd.begin() + 1, cmd.end());
    return runner_.run(cmd.front(), args);
}

} // namespace rebootto
