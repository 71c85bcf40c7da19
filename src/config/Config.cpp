#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sessid::config {

Config loadConfig(const std::string& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path);

    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);
    if (auto node = root["session_ids"]) YAML::convert<SessionIdsConfig>::decode(node, cfg.session_ids);

    return cfg;
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["logging"] = cfg.logging;
    root["session_ids"] = cfg.session_ids;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    const auto lvl = spdlog::level::from_str(name);
    if (lvl == spdlog::level::off && name != "off")
        throw std::invalid_argument("Unknown log level: " + name);
    return lvl;
}

}
