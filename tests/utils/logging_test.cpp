#include "utils/logging.hpp"

#include <gtest/gtest.h>

namespace lrunbox::utils {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override { ConfigureLogging(LogConfig{}); }
};

TEST_F(LoggingTest, ParsesLevels) {
    EXPECT_EQ(ParseLogLevel("debug", LogLevel::kWarn), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("INFO", LogLevel::kWarn), LogLevel::kInfo);
    EXPECT_EQ(ParseLogLevel("Warning", LogLevel::kError), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error", LogLevel::kWarn), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("loud", LogLevel::kInfo), LogLevel::kInfo);
}

TEST_F(LoggingTest, ThresholdFiltersMessages) {
    ConfigureLogging(LogConfig{LogLevel::kError});
    EXPECT_FALSE(ShouldLog(LogLevel::kWarn));
    EXPECT_TRUE(ShouldLog(LogLevel::kError));

    ::testing::internal::CaptureStderr();
    Log(LogLevel::kWarn, "lrun", "hidden");
    LogLine(LogLevel::kError, "lrun") << "shown " << 42;
    const auto output = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(output, "[lrun] ERROR shown 42\n");
}

TEST_F(LoggingTest, InfoHasNoLevelPrefix) {
    ConfigureLogging(LogConfig{LogLevel::kDebug});
    ::testing::internal::CaptureStderr();
    Log(LogLevel::kInfo, "config", "loaded");
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "[config] loaded\n");
}

}  // namespace
}  // namespace lrunbox::utils
