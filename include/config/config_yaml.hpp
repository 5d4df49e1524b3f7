#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ais::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<ClientConfig> {
    static Node encode(const ClientConfig& rhs) {
        Node node;
        node["endpoint"] = rhs.endpoint;
        node["connect_timeout_ms"] = rhs.connect_timeout_ms;
        node["read_timeout_ms"] = rhs.read_timeout_ms;
        node["verify_tls"] = rhs.verify_tls;
        node["user_agent"] = rhs.user_agent;
        return node;
    }

    static bool decode(const Node& node, ClientConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.endpoint = node["endpoint"].as<std::string>(rhs.endpoint);
        rhs.connect_timeout_ms = node["connect_timeout_ms"].as<unsigned int>(rhs.connect_timeout_ms);
        rhs.read_timeout_ms = node["read_timeout_ms"].as<unsigned int>(rhs.read_timeout_ms);
        rhs.verify_tls = node["verify_tls"].as<bool>(rhs.verify_tls);
        rhs.user_agent = node["user_agent"].as<std::string>(rhs.user_agent);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["aisobj"] = to_std_string(spdlog::level::to_string_view(rhs.aisobj));
        node["http"]   = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["cli"]    = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.aisobj = levelOr(node["aisobj"], rhs.aisobj);
        rhs.http = levelOr(node["http"], rhs.http);
        rhs.cli = levelOr(node["cli"], rhs.cli);
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = levelOr(node["console_log_level"], rhs.console_log_level);
        rhs.file_log_level = levelOr(node["file_log_level"], rhs.file_log_level);
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        if (const auto levels = node["log_levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

}
