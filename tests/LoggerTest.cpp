/**
 * @file LoggerTest.cpp
 * @brief Tests for Logger level filtering, the in-process sink and the toggle notification.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "Logger.h"
#include "TestSupport.h"
#include "Universe.h"

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    saved = Logger::level();
    Logger::setSink([this](Logger::Level lvl, const std::string& msg) { lines.emplace_back(lvl, msg); });
  }
  void TearDown() override {
    Logger::setSink(nullptr);
    Logger::setLevel(saved);
  }

  Logger::Level saved{Logger::Level::Info};
  std::vector<std::pair<Logger::Level, std::string>> lines;
};

TEST_F(LoggerTest, LevelFiltersLowerSeverities) {
    Logger::setLevel(Logger::Level::Warn);
    Logger::debug("d");
    Logger::info("i");
    Logger::warn("w");
    Logger::error("e");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].first, Logger::Level::Warn);
    EXPECT_EQ(lines[0].second, "w");
    EXPECT_EQ(lines[1].first, Logger::Level::Error);

    Logger::setLevel(Logger::Level::None);
    Logger::error("dropped");
    EXPECT_EQ(lines.size(), 2u);
}

TEST_F(LoggerTest, ExceptionHelpersPrefixTheLocation) {
    Logger::setLevel(Logger::Level::Info);
    Logger::logException("loader", std::runtime_error("boom"));
    Logger::logUnknownException("loop");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].second, "loader: boom");
    EXPECT_EQ(lines[1].second, "loop: unknown exception");
    EXPECT_EQ(lines[1].first, Logger::Level::Error);
}

TEST_F(LoggerTest, ToggleEmitsDebugNotification) {
    Logger::setLevel(Logger::Level::Debug);
    Universe u = blankUniverse(4, 4);
    u.toggleCell(1, 2);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].first, Logger::Level::Debug);
    EXPECT_EQ(lines[0].second, "toggling state of (1, 2)");

    Logger::setLevel(Logger::Level::Info);
    u.toggleCell(1, 2);
    EXPECT_EQ(lines.size(), 1u);
    EXPECT_EQ(u.cell(1, 2), Cell::Dead);
}

TEST_F(LoggerTest, SinkMayLogFromInsideTheCallback) {
    Logger::setLevel(Logger::Level::Info);
    Logger::setSink([this](Logger::Level lvl, const std::string& msg) {
        lines.emplace_back(lvl, msg);
        if (msg.rfind("echo: ", 0) != 0) Logger::warn("echo: " + msg);
    });
    Logger::info("hello");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].second, "hello");
    EXPECT_EQ(lines[1].first, Logger::Level::Warn);
    EXPECT_EQ(lines[1].second, "echo: hello");
}

TEST_F(LoggerTest, SinkMayRemoveItself) {
    Logger::setLevel(Logger::Level::Info);
    int calls = 0;
    Logger::setSink([&calls](Logger::Level, const std::string&) {
        ++calls;
        Logger::setSink(nullptr);
    });
    Logger::info("first");
    Logger::info("second");
    EXPECT_EQ(calls, 1);
}

TEST_F(LoggerTest, ParseLevelAcceptsNamesCaseInsensitively) {
    Logger::Level lvl = Logger::Level::Info;
    EXPECT_TRUE(Logger::parseLevel("DEBUG", lvl));
    EXPECT_EQ(lvl, Logger::Level::Debug);
    EXPECT_TRUE(Logger::parseLevel("Warning", lvl));
    EXPECT_EQ(lvl, Logger::Level::Warn);
    EXPECT_TRUE(Logger::parseLevel("off", lvl));
    EXPECT_EQ(lvl, Logger::Level::None);
    EXPECT_FALSE(Logger::parseLevel("verbose", lvl));
    EXPECT_EQ(lvl, Logger::Level::None);
    EXPECT_STREQ(Logger::levelName(Logger::Level::Error), "ERROR");
}

TEST_F(LoggerTest, FileReceivesFormattedLines) {
    const std::string path = ::testing::TempDir() + "toruslife_logger_test.log";
    std::remove(path.c_str());
    Logger::setLevel(Logger::Level::Info);
    ASSERT_TRUE(Logger::init(path));
    Logger::info("hello file");
    Logger::shutdown();

    std::ifstream in(path);
    ASSERT_TRUE(in.is_open());
    std::stringstream ss;
    ss << in.rdbuf();
    const std::string text = ss.str();
    EXPECT_NE(text.find("===== session start"), std::string::npos);
    EXPECT_NE(text.find("[INFO] hello file"), std::string::npos);
    EXPECT_NE(text.find("===== session end"), std::string::npos);
    std::remove(path.c_str());
}
