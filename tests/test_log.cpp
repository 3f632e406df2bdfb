/**
 * test_log.cpp
 */

#include <gtest/gtest.h>
#include "log.hpp"

TEST(Logger, ThresholdFiltersOutputButStillCounts) {
    std::ostringstream sink;
    Logger log(sink, LogLevel::Warning);

    log.debug("dev", "hidden");
    log.warning("dev", "shown");

    EXPECT_EQ(sink.str(), "[WARNING] dev: shown\n");
    EXPECT_EQ(log.count(LogLevel::Debug), 1u);
    EXPECT_EQ(log.count(LogLevel::Warning), 1u);
    EXPECT_EQ(log.count(LogLevel::Error), 0u);

    log.reset_counts();
    EXPECT_EQ(log.count(LogLevel::Warning), 0u);
}

TEST(Logger, ParsesLevelNames) {
    EXPECT_EQ(Logger::parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(Logger::parse_level("warn"), LogLevel::Warning);
    EXPECT_FALSE(Logger::parse_level("loud").has_value());
}
