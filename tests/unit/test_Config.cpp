#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unistd.h>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;
using namespace sessid::config;

class ConfigTest : public ::testing::Test {
protected:
    fs::path path_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        path_ = fs::temp_directory_path() /
                (std::string("sessid_") + info->name() + "_" + std::to_string(::getpid()) + ".yaml");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write(const std::string& yaml) const {
        std::ofstream out(path_);
        out << yaml;
    }
};

TEST_F(ConfigTest, EmptyFile_KeepsDefaults) {
    write("");
    const auto cfg = loadConfig(path_.string());
    EXPECT_TRUE(cfg.logging.log_dir.empty());
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::info);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.crypto, spdlog::level::warn);
    EXPECT_FALSE(cfg.session_ids.log_issuance);
}

TEST_F(ConfigTest, FullFile_OverridesEverything) {
    write(R"(
logging:
  log_dir: /tmp/sessid-logs
  levels:
    console_log_level: debug
    file_log_level: err
    subsystem_levels:
      sessid: trace
      crypto: debug
      cli: critical
      config: off
session_ids:
  log_issuance: true
)");

    const auto cfg = loadConfig(path_.string());
    EXPECT_EQ(cfg.logging.log_dir, fs::path("/tmp/sessid-logs"));
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::err);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sessid, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.crypto, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.cli, spdlog::level::critical);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.config, spdlog::level::off);
    EXPECT_TRUE(cfg.session_ids.log_issuance);
}

TEST_F(ConfigTest, PartialSection_FillsMissingKeys) {
    write(R"(
logging:
  levels:
    console_log_level: warn
)");

    const auto cfg = loadConfig(path_.string());
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sessid, spdlog::level::info);
}

TEST_F(ConfigTest, UnknownLogLevel_Throws) {
    write(R"(
logging:
  levels:
    console_log_level: loud
)");
    EXPECT_THROW((void)loadConfig(path_.string()), std::invalid_argument);
}

TEST_F(ConfigTest, MissingFile_Throws) {
    EXPECT_THROW((void)loadConfig((path_ / "nope.yaml").string()), YAML::BadFile);
}

TEST_F(ConfigTest, Dump_ReadsBackThroughLoad) {
    Config cfg;
    cfg.logging.log_dir = "/srv/sessid";
    cfg.logging.levels.subsystem_levels.crypto = spdlog::level::debug;
    cfg.session_ids.log_issuance = true;

    write(dumpConfig(cfg));
    const auto loaded = loadConfig(path_.string());
    EXPECT_EQ(loaded.logging.log_dir, fs::path("/srv/sessid"));
    EXPECT_EQ(loaded.logging.levels.subsystem_levels.crypto, spdlog::level::debug);
    EXPECT_EQ(loaded.logging.levels.console_log_level, spdlog::level::info);
    EXPECT_TRUE(loaded.session_ids.log_issuance);
}

TEST(ParseLogLevelTest, KnownAndUnknownNames) {
    EXPECT_EQ(parseLogLevel("warn"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("warning"), spdlog::level::warn);
    EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
    EXPECT_THROW((void)parseLogLevel("verbose"), std::invalid_argument);
}

TEST(ConfigRegistryTest, InitializedByTestMain) {
    ASSERT_TRUE(ConfigRegistry::isInitialized());
    EXPECT_TRUE(ConfigRegistry::get().session_ids.log_issuance);

    // Later init() calls are ignored
    Config other;
    other.session_ids.log_issuance = false;
    ConfigRegistry::init(other);
    EXPECT_TRUE(ConfigRegistry::get().session_ids.log_issuance);
}
