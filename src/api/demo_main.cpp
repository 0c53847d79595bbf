#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

#include "api/synthetic_feed.hpp"
#include "core/incremental_matcher.hpp"
#include "core/reconciler.hpp"
#include "core/result_materializer.hpp"
#include "ingest/delta_text_parser.hpp"
#include "util/async_log.hpp"

struct FeedThreadStats {
    std::size_t produced{0};
    std::size_t drops{0};
};

// Producer for one side. Every `retire_every` transfers the oldest live record is removed
// again, so the demo exercises retractions as well as matches.
void feed_thread(std::atomic<bool>& stop_flag,
                 core::DeltaRing& ring,
                 FeedThreadStats& stats,
                 core::Side side,
                 std::uint64_t seed) {
    constexpr core::RecordId retire_every = 8;
    api::SyntheticFeed feed(seed);
    core::RecordId id = 1;
    core::RecordId oldest = 1;
    while (!stop_flag.load(std::memory_order_acquire)) {
        auto transfer = feed.next(id);
        core::DeltaEvent ev = side == core::Side::Left ? std::move(transfer.left) : std::move(transfer.right);
        if (!ring.try_push(std::move(ev))) {
            ++stats.drops;
        } else {
            ++stats.produced;
        }
        if (id % retire_every == 0) {
            if (!ring.try_push(api::SyntheticFeed::remove(side, oldest++))) {
                ++stats.drops;
            } else {
                ++stats.produced;
            }
        }
        ++id;
        std::this_thread::sleep_for(std::chrono::microseconds(200));
    }
}

int main() {
    // main owns every ring and counter; producers and the reconciler are joined before exit.
    util::AsyncLogger::Config hot_cfg{};
    hot_cfg.capacity_pow2 = 1u << 14;
    hot_cfg.min_level = util::log_level();
    if (!util::init_hot_logger(hot_cfg)) {
        LOG_SLOW_ERROR("Failed to start async logger for demo");
    }

    std::atomic<bool> stop_flag{false};
    auto left_ring = std::make_unique<core::DeltaRing>();
    auto right_ring = std::make_unique<core::DeltaRing>();
    auto output_ring = std::make_unique<core::OutputRing>();

    FeedThreadStats left_stats;
    FeedThreadStats right_stats;
    core::ReconCounters counters;

    // Both producers share a seed so left and right ids describe the same transfer.
    constexpr std::uint64_t seed = 7;
    core::IncrementalMatcher matcher(core::transaction_recon_config());
    core::ResultMaterializer materializer;
    core::Reconciler recon(stop_flag, *left_ring, *right_ring, matcher, materializer, *output_ring, counters);

    std::thread left([&] { feed_thread(stop_flag, *left_ring, left_stats, core::Side::Left, seed); });
    std::thread right([&] { feed_thread(stop_flag, *right_ring, right_stats, core::Side::Right, seed); });
    std::thread recon_thread([&] { recon.run(); });

    std::size_t printed = 0;
    std::size_t consumed = 0;
    core::OutputEvent out{};
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (!output_ring->try_pop(out)) {
            std::this_thread::sleep_for(std::chrono::microseconds(100));
            continue;
        }
        ++consumed;
        if (printed < 20) {
            LOG_SLOW_INFO("%s", ingest::format_output_line(out).c_str());
            ++printed;
        }
    }
    stop_flag.store(true, std::memory_order_release);

    left.join();
    right.join();
    recon_thread.join();
    while (output_ring->try_pop(out)) {
        ++consumed;
    }

    const auto mc = matcher.counters();
    LOG_SLOW_INFO("Left produced=%zu drops=%zu", left_stats.produced, left_stats.drops);
    LOG_SLOW_INFO("Right produced=%zu drops=%zu", right_stats.produced, right_stats.drops);
    LOG_SLOW_INFO("Reconciler batches=%llu rejected=%llu outputs=%llu (upserts=%llu retracts=%llu) ring_drops=%llu "
                  "consumed=%zu",
                  static_cast<unsigned long long>(counters.batches),
                  static_cast<unsigned long long>(counters.rejected_batches),
                  static_cast<unsigned long long>(counters.output_events),
                  static_cast<unsigned long long>(counters.output_upserts),
                  static_cast<unsigned long long>(counters.output_retracts),
                  static_cast<unsigned long long>(counters.output_ring_drops), consumed);
    LOG_SLOW_INFO("Matcher matches=%zu pairs_scored=%llu fanout_truncations=%llu malformed_pairs=%llu",
                  matcher.matches().size(), static_cast<unsigned long long>(mc.pairs_scored),
                  static_cast<unsigned long long>(mc.fanout_truncations),
                  static_cast<unsigned long long>(mc.malformed_pairs));

    util::shutdown_hot_logger();
    return 0;
}
