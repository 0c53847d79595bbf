#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

#include "util/log.hpp"

namespace util {

// Which part of the pipeline emitted a record.
enum class LogChannel : std::uint8_t { Engine, Match, Ingest, Output };

[[nodiscard]] constexpr const char* to_string(LogChannel c) noexcept {
    switch (c) {
    case LogChannel::Engine: return "engine";
    case LogChannel::Match: return "match";
    case LogChannel::Ingest: return "ingest";
    case LogChannel::Output: return "output";
    }
    return "unknown";
}

// Fixed-size entry copied through the queue. Two numeric arguments carry record ids,
// counts or enum values so the producer never formats.
struct LogEntry {
    std::uint64_t elapsed_ns{0};
    std::uint64_t arg0{0};
    std::uint64_t arg1{0};
    std::uint32_t thread_tag{0};
    LogLevel level{LogLevel::Info};
    LogChannel channel{LogChannel::Engine};
    bool has_args{false};
    std::uint8_t text_len{0};
    char text[160]{};
};

struct AsyncLogCounters {
    std::uint64_t written{0};
    std::uint64_t dropped{0};  // queue full
    std::uint64_t filtered{0}; // below min_level
};

// Multi-producer, single-consumer logger. Producers claim slots in a bounded sequence
// ring and never block; a full ring drops the entry. One background thread formats and
// writes to the sink.
class AsyncLogger {
public:
    struct Config {
        std::size_t capacity_pow2{1u << 12};
        LogLevel min_level{LogLevel::Debug};
        LogLevel flush_level{LogLevel::Warn}; // entries at or above force a flush
        std::size_t flush_every{256};
        std::string file_path{}; // stderr when empty
        std::uint64_t consumer_sleep_ns{50'000};
    };

    AsyncLogger() = default;
    ~AsyncLogger();

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    bool start(const Config& cfg) noexcept;
    void stop() noexcept;
    bool running() const noexcept { return !stop_.load(std::memory_order_acquire); }

    bool try_log(LogLevel lvl, LogChannel ch, const char* msg, std::size_t len) noexcept;
    bool try_log(LogLevel lvl, LogChannel ch, const char* msg, std::size_t len,
                 std::uint64_t arg0, std::uint64_t arg1) noexcept;
    bool try_logf(LogLevel lvl, LogChannel ch, const char* fmt, ...) noexcept;

    bool enabled(LogLevel lvl) const noexcept { return lvl >= min_level_.load(std::memory_order_relaxed); }
    void set_min_level(LogLevel lvl) noexcept { min_level_.store(lvl, std::memory_order_relaxed); }

    std::uint64_t dropped() const noexcept { return dropped_.load(std::memory_order_relaxed); }
    std::uint64_t written() const noexcept { return written_.load(std::memory_order_relaxed); }
    std::uint64_t filtered() const noexcept { return filtered_.load(std::memory_order_relaxed); }
    AsyncLogCounters counters() const noexcept { return {written(), dropped(), filtered()}; }

private:
    struct Cell {
        std::atomic<std::uint64_t> turn{0};
        LogEntry entry{};
    };

    bool admit(LogLevel lvl) noexcept;
    bool push(LogLevel lvl, LogChannel ch, const char* msg, std::size_t len, bool has_args,
              std::uint64_t arg0, std::uint64_t arg1) noexcept;
    bool pop(LogEntry& out) noexcept;
    void drain_loop() noexcept;
    void emit(const LogEntry& e) noexcept;
    void close_sink() noexcept;

    std::unique_ptr<Cell[]> cells_{};
    std::size_t mask_{0};
    std::atomic<std::uint64_t> enqueue_pos_{0};
    std::uint64_t dequeue_pos_{0};

    Config config_{};
    std::chrono::steady_clock::time_point epoch_{};
    std::atomic<LogLevel> min_level_{LogLevel::Debug};
    std::atomic<bool> stop_{true};
    std::thread drainer_{};

    std::FILE* sink_{stderr};
    bool owns_sink_{false};

    std::atomic<std::uint64_t> written_{0};
    std::atomic<std::uint64_t> dropped_{0};
    std::atomic<std::uint64_t> filtered_{0};
};

// Process-wide logger behind the LOG_HOT_* / LOG_WARM_FMT macros. Every macro is a no-op
// until it is started.
AsyncLogger& hot_logger() noexcept;
bool init_hot_logger(const AsyncLogger::Config& cfg) noexcept;
void shutdown_hot_logger() noexcept;

} // namespace util

#define LOG_CHANNEL_LITERAL(LVL, CH, MSG_LIT, ARG0, ARG1)                                                      \
    ::util::hot_logger().try_log((LVL), (CH), (MSG_LIT), sizeof(MSG_LIT) - 1,                                  \
                                 static_cast<std::uint64_t>(ARG0), static_cast<std::uint64_t>(ARG1))

// Per-event conditions inside the matcher: literal message plus two numeric arguments.
#define LOG_HOT_TRACE(MSG_LIT, ARG0, ARG1) LOG_CHANNEL_LITERAL(::util::LogLevel::Trace, ::util::LogChannel::Match, MSG_LIT, ARG0, ARG1)
#define LOG_HOT_DEBUG(MSG_LIT, ARG0, ARG1) LOG_CHANNEL_LITERAL(::util::LogLevel::Debug, ::util::LogChannel::Match, MSG_LIT, ARG0, ARG1)
#define LOG_HOT_INFO(MSG_LIT, ARG0, ARG1)  LOG_CHANNEL_LITERAL(::util::LogLevel::Info,  ::util::LogChannel::Match, MSG_LIT, ARG0, ARG1)
#define LOG_HOT_WARN(MSG_LIT, ARG0, ARG1)  LOG_CHANNEL_LITERAL(::util::LogLevel::Warn,  ::util::LogChannel::Match, MSG_LIT, ARG0, ARG1)
#define LOG_HOT_ERROR(MSG_LIT, ARG0, ARG1) LOG_CHANNEL_LITERAL(::util::LogLevel::Error, ::util::LogChannel::Match, MSG_LIT, ARG0, ARG1)

#define LOG_ENGINE_WARN(MSG_LIT, ARG0, ARG1)  LOG_CHANNEL_LITERAL(::util::LogLevel::Warn,  ::util::LogChannel::Engine, MSG_LIT, ARG0, ARG1)
#define LOG_ENGINE_ERROR(MSG_LIT, ARG0, ARG1) LOG_CHANNEL_LITERAL(::util::LogLevel::Error, ::util::LogChannel::Engine, MSG_LIT, ARG0, ARG1)
#define LOG_INGEST_WARN(MSG_LIT, ARG0, ARG1)  LOG_CHANNEL_LITERAL(::util::LogLevel::Warn,  ::util::LogChannel::Ingest, MSG_LIT, ARG0, ARG1)
#define LOG_OUTPUT_WARN(MSG_LIT, ARG0, ARG1)  LOG_CHANNEL_LITERAL(::util::LogLevel::Warn,  ::util::LogChannel::Output, MSG_LIT, ARG0, ARG1)

// Formats on the calling thread; warm paths only.
#define LOG_WARM_FMT(LVL, CH, FMT, ...) ::util::hot_logger().try_logf((LVL), (CH), (FMT) __VA_OPT__(, __VA_ARGS__))
