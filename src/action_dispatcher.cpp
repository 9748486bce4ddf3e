#include "rebootto/action_dispatcher.hpp"
#include "rebootto/errors.hpp"
#include "rebootto/log.hpp"

#include <type_traits>

namespace rebootto {

ActionDispatcher::ActionDispatcher(BootControl& boot) : boot_(boot) {}

bool ActionDispatcher::dispatch(const ChosenAction& action) {
    return std::visit([this](const auto& a) -> bool {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, RebootTo>) {
            return reboot_to(a.entry);
        } else if constexpr (std::is_same_v<T, SetNext>) {
            return set_next(a.entry);
        } else {
            Logger::verbose("No boot entry chosen");
            return true;
        }
    }, action);
}

bool ActionDispatcher::set_next(const BootEntry& entry) {
    const std::string& tool = boot_.config().efibootmgr;

    CommandResult res;
    try {
        res = boot_.set_next(entry);
    } catch (const LaunchError& e) {
        Logger::verbose("%s", e.what());
        Logger::error("Could not set boot target using %s, aborting...", tool.c_str());
        return false;
    }

    if (!res.ok()) {
        Logger::error("%s exited with non-zero status: %d", tool.c_str(), res.exit_code);
        return false;
    }

    Logger::success("Next boot entry set to %s (%s)",
                    BootControl::format_id(entry.id).c_str(), entry.name.c_str());
    return true;
}

bool ActionDispatcher::reboot_to(const BootEntry& entry) {
    if (!set_next(entry)) {
        return false;
    }

    Logger::info("Rebooting into %s...", entry.name.c_str());

    bool rebooted = false;
    try {
        rebooted = boot_.reboot_now().ok();
    } catch (const LaunchError& e) {
        Logger::verbose("%s", e.what());
    }

    if (!rebooted) {
        Logger::error("Unable to reboot using %s command. BootNext has been set, either reboot "
                      "manually or clear it with \"%s --delete-bootnext\"",
                      boot_.config().reboot_command.empty()
                          ? "reboot"
                          : boot_.config().reboot_command.front().c_str(),
                      boot_.config().efibootmgr.c_str());
        return false;
    }
    return true;
}

} // namespace rebootto
