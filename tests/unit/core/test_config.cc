/**
 * @file test_config.cc
 * @brief Unit tests for TOML settings loading
 */

#include <gtest/gtest.h>

#include <core/constant/transfer.h>
#include <core/util/config.h>

#include <filesystem>
#include <fstream>
#include <string_view>

namespace rangeserve::core::test {

class ConfigTest : public ::testing::Test {
protected:
    static Settings load(std::string_view text) { return LoadSettings(toml::parse(text)); }
};

TEST_F(ConfigTest, Defaults_MatchFixedBehaviour) {
    auto defaults = DefaultSettings();
    EXPECT_EQ(defaults.port, 7777);
    EXPECT_EQ(defaults.bind_address, "0.0.0.0");
    EXPECT_EQ(defaults.root_dir, std::filesystem::path("/"));
    EXPECT_GE(defaults.threads, 1u);
    EXPECT_EQ(defaults.copy_buffer_size, transfer::kDefaultCopyBufferSize);
    EXPECT_EQ(defaults.log_level, spdlog::level::info);
}

TEST_F(ConfigTest, EmptyDocument_KeepsDefaults) {
    auto settings = load("");
    EXPECT_EQ(settings.port, 7777);
    EXPECT_EQ(settings.root_dir, std::filesystem::path("/"));
}

TEST_F(ConfigTest, ServerTable_OverridesValues) {
    auto settings = load(R"(
        [server]
        port = 8088
        bind-address = "127.0.0.1"
        root-dir = "/srv/files"
        threads = 3
        copy-buffer-size = 65536
        read-timeout = 5
        write-timeout = 7
        log-dir = "/var/log/rangeserve"
        log-level = "debug"
    )");
    EXPECT_EQ(settings.port, 8088);
    EXPECT_EQ(settings.bind_address, "127.0.0.1");
    EXPECT_EQ(settings.root_dir, std::filesystem::path("/srv/files"));
    EXPECT_EQ(settings.threads, 3u);
    EXPECT_EQ(settings.copy_buffer_size, 65536u);
    EXPECT_EQ(settings.read_timeout, std::chrono::seconds(5));
    EXPECT_EQ(settings.write_timeout, std::chrono::seconds(7));
    EXPECT_EQ(settings.log_dir, std::filesystem::path("/var/log/rangeserve"));
    EXPECT_EQ(settings.log_level, spdlog::level::debug);
}

TEST_F(ConfigTest, InvalidValues_FallBackToDefaults) {
    auto settings = load(R"(
        [server]
        port = 70000
        threads = 0
        copy-buffer-size = -1
        root-dir = 12
        log-level = "chatty"
    )");
    EXPECT_EQ(settings.port, 7777);
    EXPECT_GE(settings.threads, 1u);
    EXPECT_EQ(settings.copy_buffer_size, transfer::kDefaultCopyBufferSize);
    EXPECT_EQ(settings.root_dir, std::filesystem::path("/"));
    EXPECT_EQ(settings.log_level, spdlog::level::info);
}

TEST_F(ConfigTest, ParseLogLevel_KnownAndUnknown) {
    EXPECT_EQ(ParseLogLevel("warning", spdlog::level::info), spdlog::level::warn);
    EXPECT_EQ(ParseLogLevel("off", spdlog::level::info), spdlog::level::off);
    EXPECT_EQ(ParseLogLevel("nope", spdlog::level::err), spdlog::level::err);
}

TEST_F(ConfigTest, InitConfig_ReadsFileAndToleratesMissingOne) {
    auto saved = settings;
    auto path = std::filesystem::temp_directory_path() / "rangeserve_config_test.toml";
    {
        std::ofstream out(path);
        out << "[server]\nport = 9099\n";
    }

    InitConfig(path);
    EXPECT_EQ(settings.port, 9099);

    InitConfig(path.parent_path() / "rangeserve_config_missing.toml");
    EXPECT_EQ(settings.port, 9099);

    std::filesystem::remove(path);
    settings = saved;
}

} // namespace rangeserve::core::test
