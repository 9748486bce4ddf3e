#pragma once
#include "rebootto/boot_control.hpp"
#include "rebootto/types.hpp"

namespace rebootto {

/**
 * ActionDispatcher
 *
 * Carries out a ChosenAction. Every command runs at most once; a failed
 * set-next step means the reboot is never attempted.
 */
class ActionDispatcher {
public:
    explicit ActionDispatcher(BootControl& boot);

    // Returns false if any step failed. Failures are reported, not thrown.
    bool dispatch(const ChosenAction& action);

    bool set_next(const BootEntry& entry);
    bool reboot_to(const BootEntry& entry);

private:
    BootControl& boot_;
};

} // namespace rebootto
