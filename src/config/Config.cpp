#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <fmt/core.h>

namespace ais::config {

namespace {

Config fromRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw std::runtime_error("config root must be a mapping");

    if (auto node = root["client"]) YAML::convert<ClientConfig>::decode(node, cfg.client);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}

Config loadConfig(const std::filesystem::path& path) {
    try {
        return fromRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to load config {}: {}", path.string(), e.what()));
    }
}

Config loadConfigFromString(const std::string& yaml) {
    try {
        return fromRoot(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(fmt::format("Failed to parse config: {}", e.what()));
    }
}

void applyEnvOverrides(Config& cfg) {
    if (const char* endpoint = std::getenv(ENDPOINT_ENV_VAR); endpoint && *endpoint)
        cfg.client.endpoint = endpoint;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"client", c.client},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const ClientConfig& c) {
    j = {
        {"endpoint", c.endpoint},
        {"connect_timeout_ms", c.connect_timeout_ms},
        {"read_timeout_ms", c.read_timeout_ms},
        {"verify_tls", c.verify_tls},
        {"user_agent", c.user_agent}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"log_levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"aisobj", levelName(c.aisobj)},
        {"http", levelName(c.http)},
        {"cli", levelName(c.cli)}
    };
}

}
