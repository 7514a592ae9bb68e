// SPDX-License-Identifier: MIT

// tests/log_test.cpp
#include <gtest/gtest.h>

#include <string>

#include "src/log.hpp"

using namespace wme_pipe;

namespace {

class LogTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = GetLogLevel(); }
    void TearDown() override { SetLogLevel(saved_); }

private:
    LogLevel saved_ = LogLevel::Warn;
};

}  // namespace

TEST_F(LogTest, FormatsLevelAndMessage) {
    SetLogLevel(LogLevel::Info);
    ::testing::internal::CaptureStderr();
    WME_LOG_WARN("retrying {} in {}ms", "chunk 2", 250);
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(out, "[wme_pipe] WARN retrying chunk 2 in 250ms\n");
}

TEST_F(LogTest, BelowThresholdIsDropped) {
    SetLogLevel(LogLevel::Error);
    ::testing::internal::CaptureStderr();
    WME_LOG_INFO("quiet");
    WME_LOG_WARN("quiet too");
    WME_LOG_ERROR("loud");
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(out, "[wme_pipe] ERROR loud\n");
}

TEST_F(LogTest, OffSilencesEverything) {
    SetLogLevel(LogLevel::Off);
    ::testing::internal::CaptureStderr();
    WME_LOG_ERROR("nothing");
    EXPECT_TRUE(::testing::internal::GetCapturedStderr().empty());
}
