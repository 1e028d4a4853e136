// Tests for core/log.h -- level filtering and line format.

#include "core/log.h"

#include <gtest/gtest.h>

#include <string>

namespace midilight {
namespace {

class LogTest : public ::testing::Test {
 protected:
  void SetUp() override { saved_level_ = logLevel(); }
  void TearDown() override { setLogLevel(saved_level_); }

  LogLevel saved_level_ = LogLevel::Info;
};

TEST_F(LogTest, LevelFunctionsWriteTaggedLines) {
  setLogLevel(LogLevel::Debug);
  ::testing::internal::CaptureStderr();
  logDebug("note %d", 60);
  logInfo("channel %s", "0, 1");
  logWarn("pitch %d", -9000);
  logError("failed: %s", "boom");
  std::string output = ::testing::internal::GetCapturedStderr();

  EXPECT_EQ(output,
            "[DEBUG] note 60\n"
            "[INFO] channel 0, 1\n"
            "[WARNING] pitch -9000\n"
            "[ERROR] failed: boom\n");
}

TEST_F(LogTest, MessagesBelowLevelAreSuppressed) {
  setLogLevel(LogLevel::Warning);
  EXPECT_FALSE(isLogEnabled(LogLevel::Info));
  EXPECT_TRUE(isLogEnabled(LogLevel::Error));

  ::testing::internal::CaptureStderr();
  logDebug("hidden");
  logInfo("hidden");
  logWarn("shown");
  std::string output = ::testing::internal::GetCapturedStderr();

  EXPECT_EQ(output, "[WARNING] shown\n");
}

TEST_F(LogTest, LogMessageUsesGivenLevel) {
  setLogLevel(LogLevel::Info);
  ::testing::internal::CaptureStderr();
  logMessage(LogLevel::Debug, "hidden");
  logMessage(LogLevel::Info, "%u commands", 3u);
  std::string output = ::testing::internal::GetCapturedStderr();

  EXPECT_EQ(output, "[INFO] 3 commands\n");
}

}  // namespace
}  // namespace midilight
