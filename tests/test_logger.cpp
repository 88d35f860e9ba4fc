#include "utils/logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace gpudash::tui {
namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().clear();
        Logger::instance().set_min_level(LogLevel::DEBUG);
        Logger::instance().set_max_entries(1000);
    }

    void TearDown() override {
        Logger::instance().close_output_file();
        Logger::instance().clear();
        Logger::instance().set_min_level(LogLevel::DEBUG);
        Logger::instance().set_max_entries(1000);
    }
};

TEST_F(LoggerTest, RecordsEntriesInOrder) {
    LOG_INFO("test", "first");
    LOG_WARN("test", "second");

    auto logs = Logger::instance().get_recent_logs(10);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].message, "first");
    EXPECT_EQ(logs[0].level_str(), "INFO");
    EXPECT_EQ(logs[1].message, "second");
    EXPECT_EQ(logs[1].source, "test");
}

TEST_F(LoggerTest, MinLevelFilters) {
    Logger::instance().set_min_level(LogLevel::WARN);
    LOG_DEBUG("test", "dropped");
    LOG_INFO("test", "dropped");
    LOG_ERROR("test", "kept");

    auto logs = Logger::instance().get_recent_logs(10);
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].level, LogLevel::ERROR);
}

TEST_F(LoggerTest, RingIsBounded) {
    Logger::instance().set_max_entries(3);
    for (int i = 0; i < 10; ++i) {
        LOG_INFO("test", std::to_string(i));
    }

    auto logs = Logger::instance().get_recent_logs(100);
    ASSERT_EQ(logs.size(), 3u);
    EXPECT_EQ(logs.front().message, "7");
    EXPECT_EQ(logs.back().message, "9");
}

TEST_F(LoggerTest, FiltersProblems) {
    LOG_INFO("test", "fine");
    LOG_WARN("test", "odd");
    LOG_CRITICAL("test", "broken");

    auto problems = Logger::instance().get_logs_at_least(LogLevel::WARN);
    ASSERT_EQ(problems.size(), 2u);
    EXPECT_EQ(problems[0].message, "odd");
    EXPECT_EQ(problems[1].message, "broken");
}

TEST_F(LoggerTest, WritesToOutputFile) {
    auto path = std::filesystem::temp_directory_path() /
                ("gpudash_log_test_" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);

    ASSERT_TRUE(Logger::instance().set_output_file(path.string()));
    LOG_ERROR("sampler", "sensor gone");
    Logger::instance().close_output_file();

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("[ERROR] sampler: sensor gone"), std::string::npos);

    std::filesystem::remove(path);
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parse_log_level("debug"), std::optional<LogLevel>(LogLevel::DEBUG));
    EXPECT_EQ(parse_log_level("Warning"), std::optional<LogLevel>(LogLevel::WARN));
    EXPECT_EQ(parse_log_level("CRITICAL"), std::optional<LogLevel>(LogLevel::CRITICAL));
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

} // namespace
} // namespace gpudash::tui
