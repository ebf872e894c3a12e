// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include <gtest/gtest.h>

#include <string>

#include "core/logging.hpp"
#include "../test_utils/dicom_file_factory.hpp"

using namespace dicom_transfer::logging;
using namespace dicom_transfer::test_utils;

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        LoggerFactory::setGlobalLevel(LogLevel::Info);
    }
};

TEST_F(LoggingTest, ParseLogLevelNames) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(parseLogLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(parseLogLevel("info"), LogLevel::Info);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("warn"), LogLevel::Warning);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(parseLogLevel("critical"), LogLevel::Critical);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::Off);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST_F(LoggingTest, ToStringRoundTrips) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        EXPECT_EQ(parseLogLevel(toString(level)), level);
    }
}

TEST_F(LoggingTest, CreateReturnsSameNamedLogger) {
    auto first = LoggerFactory::create("LoggingTest");
    auto second = LoggerFactory::create("LoggingTest");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), "LoggingTest");
}

TEST_F(LoggingTest, ConsoleSinkWritesToStderr) {
    LoggerFactory::configure(LogConfig{});
    auto logger = LoggerFactory::create("LoggingConsoleTest");

    ::testing::internal::CaptureStdout();
    ::testing::internal::CaptureStderr();
    logger->warn("console sink check");
    logger->flush();
    auto out = ::testing::internal::GetCapturedStdout();
    auto err = ::testing::internal::GetCapturedStderr();

    EXPECT_NE(err.find("console sink check"), std::string::npos);
    EXPECT_EQ(out.find("console sink check"), std::string::npos);
}

TEST_F(LoggingTest, GlobalLevelAppliesToExistingLoggers) {
    auto logger = LoggerFactory::create("LoggingLevelTest");
    LoggerFactory::setGlobalLevel(LogLevel::Error);

    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Error);
    EXPECT_FALSE(logger->should_log(spdlog::level::info));
    EXPECT_TRUE(logger->should_log(spdlog::level::err));
}

TEST_F(LoggingTest, FileLoggingWritesToDirectory) {
    TempDirectory dir{"logging_test"};
    LogConfig config;
    config.level = LogLevel::Debug;
    config.enableFileLogging = true;
    config.logDirectory = dir.path();
    LoggerFactory::configure(config);

    auto logger = LoggerFactory::create("LoggingFileTest");
    logger->info("file sink check");
    logger->flush();

    EXPECT_FALSE(std::filesystem::is_empty(dir.path()));

    LoggerFactory::configure(LogConfig{});
}
