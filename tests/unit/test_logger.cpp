// ============================================================================
// SIGNGATE - Logger Unit Tests
// ============================================================================

#include "signgate/utils/logger.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using namespace signgate::utils;

namespace {

LogConfig console_config(LogLevel level) {
    LogConfig config;
    config.level = level;
    config.log_file.clear();
    config.async = false;
    return config;
}

}  // namespace

// ============================================================================
// Level Parsing
// ============================================================================

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::Info);
}

TEST(LoggerTest, MasksIdentifiers) {
    EXPECT_EQ(mask_identifier("abcd-1234-efgh"), "abcd***");
    EXPECT_EQ(mask_identifier("ab"), "ab***");
    EXPECT_EQ(mask_identifier(""), "<unset>");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(LoggerTest, ConcurrentLoggingWhileReinitializing) {
    Logger::initialize(console_config(LogLevel::Off));

    std::atomic<bool> stop{false};
    std::atomic<int> written{0};
    std::vector<std::thread> writers;
    for (int t = 0; t < 8; ++t) {
        writers.emplace_back([&stop, &written, t] {
            while (!stop.load()) {
                LOG_INFO("writer {} message {}", t, written.fetch_add(1));
            }
        });
    }

    for (int i = 0; i < 20; ++i) {
        Logger::initialize(console_config(LogLevel::Off));
    }
    while (written.load() < 1000) {
        std::this_thread::yield();
    }
    stop = true;
    for (auto& writer : writers) {
        writer.join();
    }

    auto registered = spdlog::get("signgate");
    ASSERT_NE(registered, nullptr);
    EXPECT_EQ(registered->level(), spdlog::level::off);

    Logger::shutdown();
    EXPECT_EQ(spdlog::get("signgate"), nullptr);
}

TEST(LoggerTest, LogsBeforeInitializeFallBackToConsole) {
    Logger::shutdown();
    LOG_DEBUG("logged before initialize");
    EXPECT_NE(spdlog::get("signgate"), nullptr);
    Logger::instance().set_level(LogLevel::Warn);
    EXPECT_EQ(spdlog::get("signgate")->level(), spdlog::level::warn);
}
