#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <optional>
#include <string_view>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline constexpr std::array<std::string_view, 6> kLevelNames{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};

inline const char* level_name(LogLevel lvl) noexcept {
    const auto idx = static_cast<std::size_t>(lvl);
    return idx < kLevelNames.size() ? kLevelNames[idx].data() : "UNKNOWN";
}

// Level names in any letter case: "warn", "WARN", "Warn".
inline std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
    for (std::size_t idx = 0; idx < kLevelNames.size(); ++idx) {
        const std::string_view name = kLevelNames[idx];
        if (s.size() != name.size()) continue;
        std::size_t i = 0;
        while (i < s.size() && (s[i] == name[i] || s[i] == name[i] - 'A' + 'a')) ++i;
        if (i == s.size()) return static_cast<LogLevel>(idx);
    }
    return std::nullopt;
}

// Synchronous logger for startup, configuration, shutdown summaries and tool output.
// Serialised by a mutex and written straight to stderr; per-event paths go through the
// async logger instead.
class SyncLogger {
public:
    static bool enabled(LogLevel lvl) noexcept { return lvl >= threshold().load(std::memory_order_relaxed); }

    static void set_threshold(LogLevel lvl) noexcept { threshold().store(lvl, std::memory_order_relaxed); }
    static LogLevel current_threshold() noexcept { return threshold().load(std::memory_order_relaxed); }

    static void log(LogLevel lvl, const char* fmt, ...) {
        if (!enabled(lvl)) return;
        va_list args;
        va_start(args, fmt);
        write(lvl, fmt, args);
        va_end(args);
    }

private:
    static std::atomic<LogLevel>& threshold() {
        static std::atomic<LogLevel> level{LogLevel::Info};
        return level;
    }

    static std::mutex& sink_mutex() {
        static std::mutex mtx;
        return mtx;
    }

    // HH:MM:SS.mmm LEVEL message
    static void write(LogLevel lvl, const char* fmt, va_list args) {
        const auto now = std::chrono::system_clock::now();
        const std::time_t secs = std::chrono::system_clock::to_time_t(now);
        const auto millis =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm local{};
        localtime_r(&secs, &local);

        std::lock_guard<std::mutex> lock(sink_mutex());
        std::fprintf(stderr, "%02d:%02d:%02d.%03d %-5s ", local.tm_hour, local.tm_min, local.tm_sec,
                     static_cast<int>(millis), level_name(lvl));
        std::vfprintf(stderr, fmt, args);
        std::fputc('\n', stderr);
    }
};

inline void set_log_level(LogLevel lvl) noexcept { SyncLogger::set_threshold(lvl); }

inline LogLevel log_level() noexcept { return SyncLogger::current_threshold(); }

} // namespace util

#define LOG_SLOW_TRACE(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_DEBUG(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_INFO(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_WARN(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_ERROR(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_SLOW_FATAL(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
