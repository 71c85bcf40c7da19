#include "logging/LogRegistry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <vector>

namespace sessid::logging {

void LogRegistry::init(const std::filesystem::path& logDir) {
    if (initialized_.load()) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;

    const auto cnf = config::ConfigRegistry::isInitialized()
                         ? config::ConfigRegistry::get().logging
                         : config::LoggingConfig{};

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!log_dir_.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_log_path_ = log_dir_ / "sessid.log";
        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;

    makeLogger("sessid", sub_levels.sessid);
    makeLogger("crypto", sub_levels.crypto);
    makeLogger("cli", sub_levels.cli);
    makeLogger("config", sub_levels.config);

    initialized_.store(true);
    if (main_file_sink_) sessid()->debug("[LogRegistry] Initialized, writing to {}", main_log_path_.string());
    else sessid()->debug("[LogRegistry] Initialized, console only");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_.load()) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_.load(); }

}
