#include "common/Logger.h"
#include <gtest/gtest.h>

namespace MST {

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::setLevel(spdlog::level::warn);
    }
};

TEST_F(LoggerTest, LevelFiltersRecords) {
    Logger::setLevel(spdlog::level::warn);
    EXPECT_FALSE(Logger::isEnabled(spdlog::level::debug));
    EXPECT_TRUE(Logger::isEnabled(spdlog::level::err));

    Logger::setLevel(spdlog::level::trace);
    EXPECT_TRUE(Logger::isEnabled(spdlog::level::debug));
}

TEST_F(LoggerTest, MacrosAcceptBracesInArguments) {
    Logger::setLevel(spdlog::level::trace);
    EXPECT_NO_THROW(LOG_DEBUG("configuration {}", std::string("{A, B}")));
    EXPECT_NO_THROW(Logger::flush());
}

}  // namespace MST
