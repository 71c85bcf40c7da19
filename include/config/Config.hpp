#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace sessid::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum sessid = spdlog::level::info;   // Startup, shutdown, CLI runs
    spdlog::level::level_enum crypto = spdlog::level::warn;   // Entropy failures; issuance trace when enabled
    spdlog::level::level_enum cli    = spdlog::level::info;   // Argument errors
    spdlog::level::level_enum config = spdlog::level::warn;   // Bad values, fallbacks to defaults
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

struct SessionIdsConfig {
    // Log counter and time bucket of every issued id at debug on the crypto logger.
    // The token itself and its random payload are never logged.
    bool log_issuance = false;
};

struct Config {
    LoggingConfig logging;
    SessionIdsConfig session_ids;
};

Config loadConfig(const std::string& path);

// Effective configuration as YAML, in the layout loadConfig() reads.
std::string dumpConfig(const Config& cfg);

// spdlog::level::from_str() maps unknown names to `off`; this one throws std::invalid_argument.
spdlog::level::level_enum parseLogLevel(const std::string& name);

}
