#include "util/async_log.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstring>
#include <functional>
#include <new>
#include <system_error>

namespace util {

AsyncLogger& hot_logger() noexcept {
    static AsyncLogger logger;
    return logger;
}

bool init_hot_logger(const AsyncLogger::Config& cfg) noexcept { return hot_logger().start(cfg); }

void shutdown_hot_logger() noexcept { hot_logger().stop(); }

AsyncLogger::~AsyncLogger() { stop(); }

bool AsyncLogger::start(const Config& cfg) noexcept {
    const std::size_t cap = cfg.capacity_pow2;
    if (cap < 2 || (cap & (cap - 1)) != 0) {
        return false;
    }
    if (running()) {
        return true;
    }

    std::unique_ptr<Cell[]> cells;
    try {
        cells.reset(new Cell[cap]);
    } catch (const std::bad_alloc&) {
        return false;
    }
    for (std::size_t i = 0; i < cap; ++i) {
        cells[i].turn.store(i, std::memory_order_relaxed);
    }

    std::FILE* sink = stderr;
    if (!cfg.file_path.empty()) {
        sink = std::fopen(cfg.file_path.c_str(), "a");
        if (sink == nullptr) {
            return false;
        }
    }

    cells_ = std::move(cells);
    mask_ = cap - 1;
    enqueue_pos_.store(0, std::memory_order_relaxed);
    dequeue_pos_ = 0;
    config_ = cfg;
    epoch_ = std::chrono::steady_clock::now();
    min_level_.store(cfg.min_level, std::memory_order_relaxed);
    sink_ = sink;
    owns_sink_ = sink != stderr;

    stop_.store(false, std::memory_order_release);
    try {
        drainer_ = std::thread([this] { drain_loop(); });
    } catch (const std::system_error&) {
        stop_.store(true, std::memory_order_release);
        close_sink();
        return false;
    }
    return true;
}

void AsyncLogger::stop() noexcept {
    if (stop_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (drainer_.joinable()) {
        drainer_.join();
    }
    close_sink();
}

void AsyncLogger::close_sink() noexcept {
    if (owns_sink_ && sink_ != nullptr) {
        std::fclose(sink_);
    }
    sink_ = stderr;
    owns_sink_ = false;
}

bool AsyncLogger::admit(LogLevel lvl) noexcept {
    if (!running() || !cells_) {
        return false;
    }
    if (!enabled(lvl)) {
        filtered_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

bool AsyncLogger::try_log(LogLevel lvl, LogChannel ch, const char* msg, std::size_t len) noexcept {
    return admit(lvl) && push(lvl, ch, msg, len, false, 0, 0);
}

bool AsyncLogger::try_log(LogLevel lvl, LogChannel ch, const char* msg, std::size_t len,
                          std::uint64_t arg0, std::uint64_t arg1) noexcept {
    return admit(lvl) && push(lvl, ch, msg, len, true, arg0, arg1);
}

bool AsyncLogger::try_logf(LogLevel lvl, LogChannel ch, const char* fmt, ...) noexcept {
    if (!admit(lvl)) {
        return false;
    }
    char buffer[sizeof(LogEntry::text)];
    va_list args;
    va_start(args, fmt);
    const int n = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    const std::size_t len = n < 0 ? 0u : std::min<std::size_t>(static_cast<std::size_t>(n), sizeof(buffer) - 1);
    return push(lvl, ch, buffer, len, false, 0, 0);
}

bool AsyncLogger::push(LogLevel lvl, LogChannel ch, const char* msg, std::size_t len, bool has_args,
                       std::uint64_t arg0, std::uint64_t arg1) noexcept {
    std::uint64_t pos = enqueue_pos_.load(std::memory_order_relaxed);
    Cell* cell = nullptr;
    for (;;) {
        cell = &cells_[pos & mask_];
        const std::uint64_t turn = cell->turn.load(std::memory_order_acquire);
        const auto lag = static_cast<std::int64_t>(turn - pos);
        if (lag == 0) {
            if (enqueue_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
                break;
            }
        } else if (lag < 0) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        } else {
            pos = enqueue_pos_.load(std::memory_order_relaxed);
        }
    }

    static thread_local const std::uint32_t tag =
        static_cast<std::uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));

    LogEntry& e = cell->entry;
    e.elapsed_ns = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - epoch_).count());
    e.level = lvl;
    e.channel = ch;
    e.thread_tag = tag;
    e.has_args = has_args;
    e.arg0 = arg0;
    e.arg1 = arg1;
    const std::size_t n = msg == nullptr ? 0 : std::min(len, sizeof(e.text));
    e.text_len = static_cast<std::uint8_t>(n);
    if (n > 0) {
        std::memcpy(e.text, msg, n);
    }

    cell->turn.store(pos + 1, std::memory_order_release);
    return true;
}

bool AsyncLogger::pop(LogEntry& out) noexcept {
    Cell& cell = cells_[dequeue_pos_ & mask_];
    if (cell.turn.load(std::memory_order_acquire) != dequeue_pos_ + 1) {
        return false;
    }
    out = cell.entry;
    cell.turn.store(dequeue_pos_ + mask_ + 1, std::memory_order_release);
    ++dequeue_pos_;
    return true;
}

// <seconds>.<micros> LEVEL channel tid message [arg0 arg1]
void AsyncLogger::emit(const LogEntry& e) noexcept {
    std::fprintf(sink_, "%llu.%06llu %-5s %-6s %08x ",
                 static_cast<unsigned long long>(e.elapsed_ns / 1'000'000'000ull),
                 static_cast<unsigned long long>((e.elapsed_ns / 1'000ull) % 1'000'000ull),
                 level_name(e.level), to_string(e.channel), static_cast<unsigned>(e.thread_tag));
    std::fwrite(e.text, 1, e.text_len, sink_);
    if (e.has_args) {
        std::fprintf(sink_, " [%llu %llu]", static_cast<unsigned long long>(e.arg0),
                     static_cast<unsigned long long>(e.arg1));
    }
    std::fputc('\n', sink_);
}

void AsyncLogger::drain_loop() noexcept {
    std::size_t unflushed = 0;
    std::uint32_t idle = 0;
    LogEntry e{};
    while (running() || dequeue_pos_ != enqueue_pos_.load(std::memory_order_acquire)) {
        if (pop(e)) {
            emit(e);
            written_.fetch_add(1, std::memory_order_relaxed);
            idle = 0;
            if (e.level >= config_.flush_level || (config_.flush_every > 0 && ++unflushed >= config_.flush_every)) {
                std::fflush(sink_);
                unflushed = 0;
            }
            continue;
        }
        if (unflushed > 0) {
            std::fflush(sink_);
            unflushed = 0;
        }
        if (++idle < 128 || config_.consumer_sleep_ns == 0) {
            std::this_thread::yield();
        } else {
            idle = 0;
            std::this_thread::sleep_for(std::chrono::nanoseconds(config_.consumer_sleep_ns));
        }
    }
    std::fflush(sink_);
}

} // namespace util
