#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <unistd.h>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

// Same setup as gtest_main.cpp, but with a log_dir so the rotating file sink is built
int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    const auto logDir = std::filesystem::temp_directory_path() / ("sessid_logs_" + std::to_string(::getpid()));

    try {
        sessid::config::Config cfg;
        cfg.logging.log_dir = logDir;
        cfg.logging.levels.console_log_level = spdlog::level::err;
        cfg.logging.levels.file_log_level = spdlog::level::debug;
        cfg.logging.levels.subsystem_levels.sessid = spdlog::level::debug;
        cfg.logging.levels.subsystem_levels.crypto = spdlog::level::debug;
        cfg.session_ids.log_issuance = true;
        sessid::config::ConfigRegistry::init(cfg);
        sessid::logging::LogRegistry::init(cfg.logging.log_dir);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize sessid log file test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();

    spdlog::shutdown();
    std::error_code ec;
    std::filesystem::remove_all(logDir, ec);
    return rc;
}
