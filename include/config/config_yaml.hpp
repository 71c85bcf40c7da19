#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sessid::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static std::string level_name(const spdlog::level::level_enum lvl) {
    return to_std_string(spdlog::level::to_string_view(lvl));
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["sessid"] = level_name(rhs.sessid);
        node["crypto"] = level_name(rhs.crypto);
        node["cli"]    = level_name(rhs.cli);
        node["config"] = level_name(rhs.config);
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.sessid = parseLogLevel(node["sessid"].as<std::string>("info"));
        rhs.crypto = parseLogLevel(node["crypto"].as<std::string>("warn"));
        rhs.cli = parseLogLevel(node["cli"].as<std::string>("info"));
        rhs.config = parseLogLevel(node["config"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = level_name(rhs.console_log_level);
        node["file_log_level"]    = level_name(rhs.file_log_level);
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = parseLogLevel(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = parseLogLevel(node["file_log_level"].as<std::string>("warn"));
        if (const auto sub = node["subsystem_levels"]) rhs.subsystem_levels = sub.as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["levels"]) rhs.levels = levels.as<LogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<SessionIdsConfig> {
    static Node encode(const SessionIdsConfig& rhs) {
        Node node;
        node["log_issuance"] = rhs.log_issuance;
        return node;
    }

    static bool decode(const Node& node, SessionIdsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_issuance = node["log_issuance"].as<bool>(false);
        return true;
    }
};

}
