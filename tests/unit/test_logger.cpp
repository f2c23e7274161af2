#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"

using namespace Sonar::Core;

TEST(LoggerTest, SetLevel) {
    Logger::set_level(LOG_NONE);
    EXPECT_EQ(Logger::level(), LOG_NONE);
    Logger::info("Test info message - hidden");
    Logger::set_level(LOG_DEFAULT);
}

TEST(LoggerTest, LevelFiltering) {
    Logger::set_level(LOG_ERROR);
    Logger::info("This should not be printed");
    Logger::error("This should be printed");
    Logger::set_level(LOG_DEFAULT);
}

TEST(LoggerTest, ParseLevelNames) {
    EXPECT_EQ(Logger::parse_level("none"), LOG_NONE);
    EXPECT_EQ(Logger::parse_level("error"), LOG_ERROR);
    EXPECT_EQ(Logger::parse_level("all"), LOG_ALL);
    EXPECT_EQ(Logger::parse_level("INFO"), Logger::parse_level("info"));

    int warn = Logger::parse_level("warn");
    EXPECT_TRUE(warn & LOG_WARN);
    EXPECT_TRUE(warn & LOG_ERROR);
    EXPECT_FALSE(warn & LOG_INFO);

    EXPECT_TRUE(Logger::parse_level("debug") & LOG_DEBUG);
    EXPECT_FALSE(Logger::parse_level("info") & LOG_DEBUG);
}

TEST(LoggerTest, ParseLevelRejectsUnknownName) {
    EXPECT_THROW(Logger::parse_level("verbose"), std::invalid_argument);
}

TEST(LoggerTest, StressTest) {
    Logger::set_level(LOG_ALL);
    std::vector<std::thread> threads;
    for (int i = 0; i < 20; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < 50; ++j) {
                Logger::debug("Logging from thread "
                              + std::to_string(
                                  std::hash<std::thread::id>{}(std::this_thread::get_id())));
            }
        });
    }
    for (auto& t : threads)
        t.join();
    Logger::set_level(LOG_DEFAULT);
}
