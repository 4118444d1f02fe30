#include "utils/logger.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace kls::tui;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger().clear_entries();
        logger().set_min_level(LogLevel::INFO);
    }

    void TearDown() override {
        logger().set_file("");
        logger().set_min_level(LogLevel::INFO);
        logger().clear_entries();
    }

    static Logger& logger() { return Logger::instance(); }
};

TEST_F(LoggerTest, EntriesBelowMinimumLevelAreDropped) {
    LOG_INFO("Test", "shown");
    LOG_DEBUG("Test", "hidden");

    auto entry = logger().last_at_least(LogLevel::DEBUG);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->message, "shown");
    EXPECT_EQ(entry->level_str(), "INFO");
}

TEST_F(LoggerTest, LastAtLeastFindsNewestNotableEntry) {
    EXPECT_FALSE(logger().last_at_least(LogLevel::WARN).has_value());

    LOG_WARN("Test", "first");
    LOG_ERROR("Test", "second");
    LOG_INFO("Test", "chatter");

    auto entry = logger().last_at_least(LogLevel::WARN);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->message, "second");
    EXPECT_FALSE(logger().last_at_least(LogLevel::CRITICAL).has_value());
}

TEST_F(LoggerTest, WarningSurvivesLongHistory) {
    LOG_WARN("Test", "old warning");
    for (int i = 0; i < 500; ++i) {
        LOG_INFO("Test", std::to_string(i));
    }
    EXPECT_EQ(logger().last_at_least(LogLevel::WARN)->message, "old warning");

    // Past the history cap the warning is gone
    for (int i = 0; i < 1000; ++i) {
        LOG_INFO("Test", std::to_string(i));
    }
    EXPECT_FALSE(logger().last_at_least(LogLevel::WARN).has_value());
    EXPECT_EQ(logger().last_at_least(LogLevel::INFO)->message, "999");
}

TEST_F(LoggerTest, FileSinkAppendsFormattedLines) {
    auto path = std::filesystem::temp_directory_path() /
                ("kls_logger_" + std::to_string(::getpid()) + ".log");
    std::filesystem::remove(path);

    ASSERT_TRUE(logger().set_file(path.string()));
    LOG_WARN("KubeClient", "get_pods: exit status 1");
    logger().set_file("");

    std::ifstream in(path);
    std::string line;
    ASSERT_TRUE(std::getline(in, line));
    EXPECT_NE(line.find("[WARN] KubeClient: get_pods: exit status 1"), std::string::npos);
    std::filesystem::remove(path);
}

TEST_F(LoggerTest, UnwritableFileIsReported) {
    EXPECT_FALSE(logger().set_file("/nonexistent-dir/kls.log"));
}

TEST_F(LoggerTest, ParseLevelIgnoresCase) {
    EXPECT_EQ(Logger::parse_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parse_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::parse_level("CRITICAL"), LogLevel::CRITICAL);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
}
