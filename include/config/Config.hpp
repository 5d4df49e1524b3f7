#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace ais::config {

constexpr static const char* DEFAULT_ENDPOINT = "http://localhost:8080";
constexpr static const char* ENDPOINT_ENV_VAR = "AIS_ENDPOINT";

struct ClientConfig {
    std::string endpoint = DEFAULT_ENDPOINT;
    unsigned int connect_timeout_ms = 3000;
    unsigned int read_timeout_ms = 20000;      // abort when the transfer stalls this long
    bool verify_tls = true;
    std::string user_agent = "aisobj/1.0";
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum aisobj = spdlog::level::info;   // Top-level client events
    spdlog::level::level_enum http   = spdlog::level::warn;   // Transport failures and non-2xx responses
    spdlog::level::level_enum cli    = spdlog::level::info;   // Command progress and summaries
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    ClientConfig client;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

// AIS_ENDPOINT wins over whatever the file says
void applyEnvOverrides(Config& cfg);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const ClientConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

}
