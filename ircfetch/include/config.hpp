#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

struct ConnectionConfig {
    std::string nick;
    std::string login;
    std::string server;
    uint16_t port = 6667;
    std::string channel;
};

struct Settings {
    ConnectionConfig irc;
    fs::path resource_file_path;
    fs::path transfer_file_path;
};

namespace Config {
class ConfigError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

Settings settings_from_json(const nlohmann::json& data);

// Throws ConfigError when the file is missing, malformed or incomplete.
Settings load(const std::string& config_file);
}  // namespace Config
