#include "rebootto/config.hpp"
#include "rebootto/errors.hpp"
#include "rebootto/log.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace rebootto {

Config ConfigLoader::load(const std::optional<std::string>& explicit_path) const {
    if (explicit_path) {
        return load_from_json(*explicit_path);
    }

    if (const char* env = std::getenv(kConfigEnvVar); env && *env) {
        return load_from_json(env);
    }

    std::error_code ec;
    if (fs::exists(default_path, ec)) {
        return load_from_json(default_path);
    }

    Logger::verbose("No configuration file, using defaults");
    return Config{};
}

Config ConfigLoader::load_from_json(const std::string& json_path) const {
    std::ifstream file(json_path);
    if (!file.is_open()) throw ConfigError("Config file not found: " + json_path);

    Logger::verbose("Loading configuration: %s", json_path.c_str());

    std::stringstream ss;
    ss << file.rdbuf();
    try {
        return parse(ss.str());
    } catch (const ConfigError& e) {
        throw ConfigError(json_path + ": " + e.what());
    }
}

Config ConfigLoader::parse(const std::string& json_text) const {
    Config c;

    try {
        nlohmann::json j = nlohmann::json::parse(json_text);
        if (!j.is_object()) throw ConfigError("top level value must be an object");

        c.efibootmgr = j.value("efibootmgr", c.efibootmgr);
        c.bootnext_flag = j.value("bootnext_flag", c.bootnext_flag);
        c.poll_interval_ms = j.value("poll_interval_ms", c.poll_interval_ms);
        c.title = j.value("title", c.title);
        if (j.contains("reboot_command")) {
            c.reboot_command = j["reboot_command"].get<std::vector<std::string>>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(e.what());
    }

    if (c.efibootmgr.empty()) throw ConfigError("'efibootmgr' must not be empty");
    if (c.reboot_command.empty() || c.reboot_command.front().empty()) {
        throw ConfigError("'reboot_command' must name a command");
    }
    if (c.poll_interval_ms <= 0) throw ConfigError("'poll_interval_ms' must be positive");

    return c;
}

} // namespace rebootto
