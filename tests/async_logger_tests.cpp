#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "util/async_log.hpp"
#include "util/log.hpp"

namespace {
using util::AsyncLogger;
using util::LogChannel;
using util::LogLevel;

std::filesystem::path make_temp_log_path(const std::string& name) {
    return std::filesystem::temp_directory_path() / name;
}

AsyncLogger::Config base_config(const std::filesystem::path& path) {
    AsyncLogger::Config cfg{};
    cfg.capacity_pow2 = 1u << 10;
    cfg.flush_every = 1;
    cfg.file_path = path.string();
    cfg.consumer_sleep_ns = 1'000;
    return cfg;
}

bool wait_for_written(const AsyncLogger& logger, std::uint64_t n) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (logger.written() < n && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return logger.written() >= n;
}

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

TEST(AsyncLoggerTests, WritesFormattedAndLiteralRecords) {
    const auto path = make_temp_log_path("fuzzy_async_logger_basic.log");
    AsyncLogger logger;
    ASSERT_TRUE(logger.start(base_config(path)));

    EXPECT_TRUE(logger.try_logf(LogLevel::Warn, LogChannel::Match, "fan-out truncated for record %d", 17));
    EXPECT_TRUE(logger.try_log(LogLevel::Error, LogChannel::Ingest, "delta frame rejected", 20, 12, 3));
    ASSERT_TRUE(wait_for_written(logger, 2));
    logger.stop();

    const auto lines = read_lines(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("WARN"), std::string::npos);
    EXPECT_NE(lines[0].find(" match "), std::string::npos);
    EXPECT_NE(lines[0].find("record 17"), std::string::npos);
    EXPECT_EQ(lines[0].find('['), std::string::npos);
    EXPECT_NE(lines[1].find(" ingest "), std::string::npos);
    EXPECT_NE(lines[1].find("delta frame rejected [12 3]"), std::string::npos);
}

TEST(AsyncLoggerTests, MinLevelFiltersWithoutCountingDrops) {
    const auto path = make_temp_log_path("fuzzy_async_logger_level.log");
    AsyncLogger logger;
    auto cfg = base_config(path);
    cfg.min_level = LogLevel::Warn;
    ASSERT_TRUE(logger.start(cfg));

    EXPECT_FALSE(logger.try_logf(LogLevel::Debug, LogChannel::Match, "pair scored"));
    EXPECT_FALSE(logger.try_log(LogLevel::Info, LogChannel::Match, "noise", 5));
    EXPECT_TRUE(logger.try_log(LogLevel::Error, LogChannel::Match, "batch rejected", 14, 1, 1));
    ASSERT_TRUE(wait_for_written(logger, 1));
    logger.stop();

    EXPECT_EQ(logger.dropped(), 0u);
    EXPECT_EQ(logger.filtered(), 2u);
    EXPECT_EQ(read_lines(path).size(), 1u);
}

TEST(AsyncLoggerTests, DropsOnOverflow) {
    const auto path = make_temp_log_path("fuzzy_async_logger_drop.log");
    AsyncLogger logger;
    auto cfg = base_config(path);
    cfg.capacity_pow2 = 8;
    cfg.consumer_sleep_ns = 500'000;
    ASSERT_TRUE(logger.start(cfg));

    for (int i = 0; i < 200; ++i) {
        logger.try_logf(LogLevel::Info, LogChannel::Match, "malformed pair %d", i);
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (logger.dropped() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    logger.stop();
    EXPECT_GT(logger.dropped(), 0u);
}

TEST(AsyncLoggerTests, MultipleProducersAccountForEveryRecord) {
    const auto path = make_temp_log_path("fuzzy_async_logger_threads.log");
    AsyncLogger logger;
    auto cfg = base_config(path);
    cfg.capacity_pow2 = 1u << 12;
    cfg.consumer_sleep_ns = 0;
    ASSERT_TRUE(logger.start(cfg));

    constexpr int producers = 4;
    constexpr int per_thread = 250;
    std::atomic<int> sent{0};
    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&, p] {
            for (int i = 0; i < per_thread; ++i) {
                logger.try_logf(LogLevel::Debug, LogChannel::Ingest, "feed%d-%d", p, i);
                sent.fetch_add(1, std::memory_order_relaxed);
            }
        });
    }
    for (auto& t : threads) t.join();

    const auto expected = static_cast<std::uint64_t>(sent.load(std::memory_order_relaxed));
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (logger.written() + logger.dropped() < expected && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    logger.stop();
    EXPECT_EQ(logger.written() + logger.dropped(), expected);
}

TEST(AsyncLoggerTests, ReturnsFalseWhenNotStarted) {
    AsyncLogger logger;
    EXPECT_FALSE(logger.try_log(LogLevel::Info, LogChannel::Match, "msg", 3));
    EXPECT_EQ(logger.filtered(), 0u);
    EXPECT_EQ(logger.written(), 0u);
    EXPECT_EQ(logger.dropped(), 0u);
}

TEST(AsyncLoggerTests, RejectsCapacityThatIsNotAPowerOfTwo) {
    AsyncLogger logger;
    AsyncLogger::Config cfg{};
    cfg.capacity_pow2 = 100;
    EXPECT_FALSE(logger.start(cfg));
    EXPECT_FALSE(logger.running());
}

TEST(AsyncLoggerTests, ChannelNames) {
    EXPECT_STREQ(util::to_string(LogChannel::Engine), "engine");
    EXPECT_STREQ(util::to_string(LogChannel::Output), "output");
}

TEST(SyncLogTests, ParsesLevelNamesCaseInsensitively) {
    EXPECT_EQ(util::parse_log_level("warn"), LogLevel::Warn);
    EXPECT_EQ(util::parse_log_level("ERROR"), LogLevel::Error);
    EXPECT_EQ(util::parse_log_level("Trace"), LogLevel::Trace);
    EXPECT_FALSE(util::parse_log_level("verbose").has_value());
    EXPECT_FALSE(util::parse_log_level("").has_value());
}

TEST(SyncLogTests, ThresholdControlsEnabledLevels) {
    const LogLevel previous = util::log_level();
    util::set_log_level(LogLevel::Error);
    EXPECT_FALSE(util::SyncLogger::enabled(LogLevel::Warn));
    EXPECT_TRUE(util::SyncLogger::enabled(LogLevel::Fatal));
    util::set_log_level(previous);
}

} // namespace
