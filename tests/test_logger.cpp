/*
 * slotwise - Resumable Batch Inference Runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>

#include "slotwise/logger.hpp"

using namespace slotwise;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_ = Logger::level();
        const char* env = std::getenv("SLOTWISE_LOG_LEVEL");
        if (env) {
            savedEnv_ = env;
            hadEnv_ = true;
        }
    }
    void TearDown() override {
        if (hadEnv_) {
            ::setenv("SLOTWISE_LOG_LEVEL", savedEnv_.c_str(), 1);
        } else {
            ::unsetenv("SLOTWISE_LOG_LEVEL");
        }
        Logger::setLevel(previous_);
    }

private:
    LogLevel previous_ = LogLevel::INFO;
    std::string savedEnv_;
    bool hadEnv_ = false;
};

}

TEST_F(LoggerTest, LevelFiltersLessSevereMessages) {
    Logger::setLevel(LogLevel::WARN);
    EXPECT_TRUE(Logger::enabled(LogLevel::ERROR));
    EXPECT_TRUE(Logger::enabled(LogLevel::WARN));
    EXPECT_FALSE(Logger::enabled(LogLevel::INFO));
    EXPECT_FALSE(Logger::enabled(LogLevel::TRACE));
}

TEST_F(LoggerTest, ReadsLevelFromEnvironment) {
    ::setenv("SLOTWISE_LOG_LEVEL", "Debug", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::DEBUG);

    ::setenv("SLOTWISE_LOG_LEVEL", "warning", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::WARN);

    ::setenv("SLOTWISE_LOG_LEVEL", "verbose", 1);
    Logger::initFromEnv();
    EXPECT_EQ(Logger::level(), LogLevel::INFO);
}

TEST_F(LoggerTest, NamedThreadsLogWithoutThrowing) {
    Logger::setLevel(LogLevel::TRACE);
    setThreadName("LoggerTest");
    testing::internal::CaptureStderr();
    LOG_TRACE("trace line");
    const std::string output = testing::internal::GetCapturedStderr();
    clearThreadName();

    EXPECT_NE(output.find("[TRACE]"), std::string::npos);
    EXPECT_NE(output.find("[LoggerTest]"), std::string::npos);
    EXPECT_NE(output.find("trace line"), std::string::npos);
}

TEST_F(LoggerTest, DetachedThreadsMayLogWhileProcessExits) {
    EXPECT_EXIT(
        {
            std::thread([] {
                for (;;) {
                    setThreadName("Straggler");
                    LOG_DEBUG("still running");
                    clearThreadName();
                }
            }).detach();
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            std::exit(0);
        },
        ::testing::ExitedWithCode(0), "");
}
