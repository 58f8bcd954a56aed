#include "config.hpp"

#include <fstream>

namespace Config {
namespace {
std::string required_string(const nlohmann::json& data, const char* key, const std::string& where) {
    if (!data.contains(key)) {
        throw ConfigError("Missing '" + std::string(key) + "' in " + where);
    }
    if (!data[key].is_string() || data[key].get<std::string>().empty()) {
        throw ConfigError("'" + std::string(key) + "' in " + where + " must be a non-empty string");
    }
    return data[key].get<std::string>();
}
}  // namespace

Settings settings_from_json(const nlohmann::json& data) {
    if (!data.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }
    if (!data.contains("irc") || !data["irc"].is_object()) {
        throw ConfigError("Missing 'irc' section");
    }
    const auto& irc = data["irc"];

    Settings settings;
    settings.irc.nick = required_string(irc, "nick", "irc");
    settings.irc.login = required_string(irc, "login", "irc");
    settings.irc.server = required_string(irc, "server", "irc");
    settings.irc.channel = required_string(irc, "channel", "irc");
    if (irc.contains("port")) {
        if (!irc["port"].is_number_integer() || irc["port"].get<int64_t>() < 1 || irc["port"].get<int64_t>() > 65535) {
            throw ConfigError("'port' in irc must be between 1 and 65535");
        }
        settings.irc.port = static_cast<uint16_t>(irc["port"].get<int64_t>());
    }
    settings.resource_file_path = required_string(data, "resource-file-path", "configuration");
    settings.transfer_file_path = required_string(data, "transfer-file-path", "configuration");
    return settings;
}

Settings load(const std::string& config_file) {
    std::ifstream file(config_file);
    if (!file.is_open()) {
        throw ConfigError("Couldn't open '" + config_file + "'");
    }
    nlohmann::json config;
    try {
        file >> config;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("JSON parse error in '" + config_file + "': " + e.what());
    }
    return settings_from_json(config);
}
}  // namespace Config
