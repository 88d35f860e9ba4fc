#include "config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace gpudash::tui {
namespace {

namespace fs = std::filesystem;

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("gpudash_config_test_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream(path) << content;
        return path.string();
    }

    fs::path dir_;
};

TEST(ConfigTest, Defaults) {
    Config config;
    EXPECT_EQ(config.poll_interval_ms, 500);
    EXPECT_EQ(config.mock_device_count, 1);
    EXPECT_TRUE(config.replay_file.empty());
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_EQ(config.log_level, LogLevel::INFO);
}

TEST(ConfigTest, ApplyJsonOverridesKnownKeys) {
    Config config;
    config.apply_json(json::parse(R"({
        "poll_interval_ms": 250,
        "mock_device_count": 2,
        "replay_file": "frames.json",
        "log_file": "/tmp/gpudash.log",
        "log_level": "debug",
        "theme": "ignored"
    })"));

    EXPECT_EQ(config.poll_interval_ms, 250);
    EXPECT_EQ(config.mock_device_count, 2);
    EXPECT_EQ(config.replay_file, "frames.json");
    EXPECT_EQ(config.log_file, "/tmp/gpudash.log");
    EXPECT_EQ(config.log_level, LogLevel::DEBUG);
}

TEST(ConfigTest, ApplyJsonRejectsBadValues) {
    Config config;
    EXPECT_THROW(config.apply_json(json::parse(R"({"poll_interval_ms": 0})")), std::runtime_error);
    EXPECT_THROW(config.apply_json(json::parse(R"({"poll_interval_ms": "fast"})")), std::runtime_error);
    EXPECT_THROW(config.apply_json(json::parse(R"({"mock_device_count": -1})")), std::runtime_error);
    EXPECT_THROW(config.apply_json(json::parse(R"({"log_level": "LOUD"})")), std::runtime_error);
    EXPECT_THROW(config.apply_json(json::parse(R"([1, 2])")), std::runtime_error);
}

TEST_F(ConfigFileTest, LoadsFile) {
    auto path = write("config.json", R"({"poll_interval_ms": 1000})");
    auto config = Config::load_file(path);
    EXPECT_EQ(config.poll_interval_ms, 1000);
    EXPECT_EQ(config.mock_device_count, 1);
}

TEST_F(ConfigFileTest, LoadErrors) {
    EXPECT_THROW(Config::load_file((dir_ / "missing.json").string()), std::runtime_error);

    auto broken = write("broken.json", "{ not json");
    EXPECT_THROW(Config::load_file(broken), std::runtime_error);
}

TEST_F(ConfigFileTest, CommandLineOverridesFile) {
    auto path = write("config.json", R"({"poll_interval_ms": 1000, "log_file": "a.log"})");
    auto cmd = parse_command_line({"--config", path, "--interval", "200"});
    auto config = resolve_config(cmd);

    EXPECT_EQ(config.poll_interval_ms, 200);
    EXPECT_EQ(config.log_file, "a.log");
}

TEST(CommandLineTest, ParsesOptions) {
    auto cmd = parse_command_line({"--replay", "r.json", "--log-file", "g.log", "--interval", "750"});
    EXPECT_EQ(cmd.action, CommandAction::RUN);
    EXPECT_EQ(cmd.replay_file, std::optional<std::string>("r.json"));
    EXPECT_EQ(cmd.log_file, std::optional<std::string>("g.log"));
    EXPECT_EQ(cmd.poll_interval_ms, std::optional<int>(750));
    EXPECT_FALSE(cmd.config_path.has_value());

    EXPECT_EQ(parse_command_line({"--help"}).action, CommandAction::HELP);
    EXPECT_EQ(parse_command_line({}).action, CommandAction::RUN);
}

TEST(CommandLineTest, RejectsBadInput) {
    EXPECT_THROW(parse_command_line({"--bogus"}), std::invalid_argument);
    EXPECT_THROW(parse_command_line({"--config"}), std::invalid_argument);
    EXPECT_THROW(parse_command_line({"--interval", "abc"}), std::invalid_argument);
    EXPECT_THROW(parse_command_line({"--interval", "10ms"}), std::invalid_argument);
    EXPECT_THROW(parse_command_line({"--interval", "0"}), std::invalid_argument);
}

TEST(CommandLineTest, UsageMentionsOptions) {
    auto text = usage("gpudash");
    EXPECT_NE(text.find("--replay"), std::string::npos);
    EXPECT_NE(text.find("--interval"), std::string::npos);
}

} // namespace
} // namespace gpudash::tui
