#include <gtest/gtest.h>
#include "common/logger.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

class LoggerTest : public ::testing::Test {
protected:
  std::string path_ = "loganalytics_test.log";
  void SetUp() override { std::remove(path_.c_str()); }
  void TearDown() override {
    Logger::Shutdown();
    std::remove(path_.c_str());
  }
  std::string ReadLog() {
    std::ifstream in(path_);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }
};

TEST_F(LoggerTest, WritesEntriesAtOrAboveMinLevel) {
  Logger::Initialize(path_, LogLevel::INFO);
  Logger::Debug("hidden debug line");
  Logger::Info("Posted 3 messages.");
  Logger::Warning("retry scheduled");
  Logger::Shutdown();  // flushes the queue
  std::string contents = ReadLog();
  EXPECT_NE(contents.find("[INFO]"), std::string::npos);
  EXPECT_NE(contents.find("Posted 3 messages."), std::string::npos);
  EXPECT_NE(contents.find("[WARN] "), std::string::npos);
  EXPECT_EQ(contents.find("hidden debug line"), std::string::npos);
}

TEST_F(LoggerTest, LinesStartWithUtcTimestamp) {
  Logger::Initialize(path_, LogLevel::DEBUG);
  Logger::Error("boom");
  Logger::Shutdown();
  std::string contents = ReadLog();
  ASSERT_GE(contents.size(), 20u);
  EXPECT_EQ(contents[4], '-');
  EXPECT_EQ(contents[10], 'T');
  EXPECT_EQ(contents[19], 'Z');
}

TEST_F(LoggerTest, IsEnabledFollowsMinLevel) {
  Logger::Initialize(path_, LogLevel::WARNING);
  EXPECT_FALSE(Logger::IsEnabled(LogLevel::DEBUG));
  EXPECT_FALSE(Logger::IsEnabled(LogLevel::INFO));
  EXPECT_TRUE(Logger::IsEnabled(LogLevel::WARNING));
  EXPECT_TRUE(Logger::IsEnabled(LogLevel::CRITICAL));
  Logger::Initialize(path_, LogLevel::DEBUG);
  EXPECT_TRUE(Logger::IsEnabled(LogLevel::DEBUG));
}

TEST_F(LoggerTest, LoggingWithoutInitializeIsNoop) {
  EXPECT_FALSE(Logger::IsEnabled(LogLevel::CRITICAL));
  EXPECT_NO_THROW(Logger::Critical("dropped"));
}

TEST(LogLevelTest, ParsesNames) {
  LogLevel lvl = LogLevel::INFO;
  EXPECT_TRUE(Logger::ParseLevel("debug", lvl));
  EXPECT_EQ(lvl, LogLevel::DEBUG);
  EXPECT_TRUE(Logger::ParseLevel("WARNING", lvl));
  EXPECT_EQ(lvl, LogLevel::WARNING);
  EXPECT_FALSE(Logger::ParseLevel("loud", lvl));
}
