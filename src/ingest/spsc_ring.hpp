#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>

namespace ingest {

// Single-producer/single-consumer queue between the feed threads, the matcher and the
// output publisher. Positions are monotonically increasing counters masked into the slot
// array, so all Capacity slots are usable. Each side keeps a private copy of the other
// side's position and only re-reads the shared atomic when the copy says full or empty.
//
// Slots are reused: a popped element leaves a moved-from value behind.
template <typename T, std::size_t Capacity>
class SpscRing {
    static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0, "Capacity must be a power of two");
    static_assert(std::is_default_constructible_v<T>, "ring elements must be default constructible");

public:
    using value_type = T;

    SpscRing() : slots_(std::make_unique<T[]>(Capacity)) {}

    SpscRing(const SpscRing&) = delete;
    SpscRing& operator=(const SpscRing&) = delete;

    // A failed push leaves v untouched, including when it is an rvalue.
    template <typename U>
    bool try_push(U&& v) noexcept(std::is_nothrow_assignable_v<T&, U&&>) {
        const std::uint64_t w = producer_.pos.load(std::memory_order_relaxed);
        if (w - producer_.cached_peer == Capacity) {
            producer_.cached_peer = consumer_.pos.load(std::memory_order_acquire);
            if (w - producer_.cached_peer == Capacity) {
                return false;
            }
        }
        slots_[w & kMask] = std::forward<U>(v);
        producer_.pos.store(w + 1, std::memory_order_release);
        return true;
    }

    bool try_pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
        const std::uint64_t r = consumer_.pos.load(std::memory_order_relaxed);
        if (r == consumer_.cached_peer) {
            consumer_.cached_peer = producer_.pos.load(std::memory_order_acquire);
            if (r == consumer_.cached_peer) {
                return false;
            }
        }
        out = std::move(slots_[r & kMask]);
        consumer_.pos.store(r + 1, std::memory_order_release);
        return true;
    }

    std::size_t size_approx() const noexcept {
        const std::uint64_t r = consumer_.pos.load(std::memory_order_acquire);
        const std::uint64_t w = producer_.pos.load(std::memory_order_acquire);
        return w > r ? static_cast<std::size_t>(w - r) : 0u;
    }

    bool empty_approx() const noexcept { return size_approx() == 0; }

    static constexpr std::size_t capacity() noexcept { return Capacity; }

private:
    static constexpr std::uint64_t kMask = Capacity - 1;

    struct alignas(64) Cursor {
        std::atomic<std::uint64_t> pos{0};
        std::uint64_t cached_peer{0};
    };

    Cursor producer_{};
    Cursor consumer_{};
    std::unique_ptr<T[]> slots_;
};

} // namespace ingest
