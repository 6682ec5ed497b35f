/**
 * @file LoggerTest.cpp
 * @brief Unit tests for the Logger singleton
 */

#include "util/Logger.hpp"

#include "fixtures/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

class LoggerTest : public ::testing::Test {
protected:
    TempDirectory dir;
    util::Logger& logger = util::Logger::instance();

    void TearDown() override {
        logger.set_observer({});
        logger.shutdown();
        logger.set_min_level(util::LogLevel::INFO);
    }

    std::string ReadLog() const {
        std::ifstream in(logger.get_log_file_path());
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }
};

// Test: level names parse case-insensitively
TEST_F(LoggerTest, ParseLogLevel_AcceptsKnownNames) {
    EXPECT_EQ(util::parse_log_level("debug"), util::LogLevel::DEBUG);
    EXPECT_EQ(util::parse_log_level("INFO"), util::LogLevel::INFO);
    EXPECT_EQ(util::parse_log_level("warn"), util::LogLevel::WARNING);
    EXPECT_EQ(util::parse_log_level("Warning"), util::LogLevel::WARNING);
    EXPECT_EQ(util::parse_log_level("error"), util::LogLevel::ERROR);
    EXPECT_FALSE(util::parse_log_level("verbose").has_value());
}

// Test: lines reach the log file with level and component tags
TEST_F(LoggerTest, Initialize_WritesTaggedLines) {
    ASSERT_TRUE(logger.initialize(dir.path(), "logger-test"));
    EXPECT_TRUE(logger.is_initialized());
    EXPECT_EQ(logger.get_log_file_path(), dir.path() / "logger-test.log");

    LOG_WARNING("LoggerTest", "disk sdb slow");
    logger.flush();

    auto content = ReadLog();
    EXPECT_NE(content.find("[WARN ] [LoggerTest] disk sdb slow"), std::string::npos);
}

// Test: lines below the minimum level are dropped
TEST_F(LoggerTest, MinLevel_FiltersLowerLevels) {
    ASSERT_TRUE(logger.initialize(dir.path(), "logger-test", util::LogLevel::WARNING));

    LOG_INFO("LoggerTest", "hidden line");
    LOG_ERROR("LoggerTest", "visible line");
    logger.flush();

    auto content = ReadLog();
    EXPECT_EQ(content.find("hidden line"), std::string::npos);
    EXPECT_NE(content.find("visible line"), std::string::npos);
}

// Test: the observer sees lines even before initialization
TEST_F(LoggerTest, Observer_ReceivesLinesWithoutFile) {
    std::vector<std::string> seen;
    logger.set_observer([&seen](util::LogLevel level, std::string_view component,
                                std::string_view message) {
        if (level == util::LogLevel::ERROR) {
            seen.push_back(std::string(component) + ":" + std::string(message));
        }
    });

    LOG_ERROR("Orchestrator", "session failed");

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "Orchestrator:session failed");
    EXPECT_TRUE(logger.get_log_file_path().empty());
}

// Test: exceeding the size limit rotates to numbered files
TEST_F(LoggerTest, Rotation_CreatesNumberedFiles) {
    ASSERT_TRUE(logger.initialize(dir.path(), "rotating", util::LogLevel::INFO,
                                  util::LogRotationPolicy{256, 2}));

    const std::string line(100, 'x');
    for (int i = 0; i < 20; ++i) {
        LOG_INFO("LoggerTest", line);
    }
    logger.flush();

    EXPECT_TRUE(std::filesystem::exists(dir.path() / "rotating.log"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "rotating.1.log"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "rotating.2.log"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "rotating.3.log"));
}
