// =============================================================================
// Unit tests for fleet_log.hpp
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include "fleet_log.hpp"

using namespace fleet::log;

TEST(FleetLogTest, ParseLevelNames) {
    EXPECT_EQ(parseLevel("trace"), Level::Trace);
    EXPECT_EQ(parseLevel("DEBUG"), Level::Debug);
    EXPECT_EQ(parseLevel("Info"), Level::Info);
    EXPECT_EQ(parseLevel("warning"), Level::Warn);
    EXPECT_EQ(parseLevel("error"), Level::Error);
    EXPECT_EQ(parseLevel("fatal"), Level::Fatal);
    EXPECT_EQ(parseLevel("loud", Level::Warn), Level::Warn);
}

TEST(FleetLogTest, FileReceivesLinesAboveMinimum) {
    const char* path = "__test_fleet_log.log";
    Level saved = logLevel();
    ASSERT_TRUE(openLogFile(path));
    setLogLevel(Level::Warn);

    FLOG_INFO("test", "hidden %d", 1);
    FLOG_WARN("test", "shown %d", 2);
    closeLogFile();
    setLogLevel(saved);

    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    const std::string text = ss.str();
    EXPECT_EQ(text.find("hidden 1"), std::string::npos);
    EXPECT_NE(text.find("[WARN ] [test]"), std::string::npos);
    EXPECT_NE(text.find("shown 2"), std::string::npos);
    f.close();
    std::remove(path);
}
