#pragma once
#include "rebootto/types.hpp"

#include <optional>
#include <string>

namespace rebootto {

inline constexpr const char* kDefaultConfigPath = "/etc/reboot-to.json";
inline constexpr const char* kConfigEnvVar = "REBOOT_TO_CONFIG";

/**
 * ConfigLoader
 *
 * Reads the optional JSON configuration, e.g.
 *
 *   {
 *     "efibootmgr": "/usr/sbin/efibootmgr",
 *     "bootnext_flag": "--bootnext",
 *     "reboot_command": ["systemctl", "reboot"],
 *     "poll_interval_ms": 16,
 *     "title": " Boot entries "
 *   }
 *
 * Missing keys keep their defaults, unknown keys are ignored.
 */
class ConfigLoader {
public:
    /**
     * Resolve and load the configuration: explicit path, then $REBOOT_TO_CONFIG,
     * then /etc/reboot-to.json if it exists, else defaults.
     * @throws ConfigError if a file that must exist is missing or invalid
     */
    Config load(const std::optional<std::string>& explicit_path) const;

    Config load_from_json(const std::string& json_path) const;
    Config parse(const std::string& json_text) const;

    // Overridable for tests.
    std::string default_path = kDefaultConfigPath;
};

} // namespace rebootto
