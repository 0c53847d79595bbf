#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include <Aeron.h>

#include "core/incremental_matcher.hpp"
#include "core/reconciler.hpp"
#include "core/result_materializer.hpp"
#include "ingest/aeron_client_view.hpp"
#include "ingest/aeron_subscriber.hpp"
#include "ingest/output_publisher.hpp"
#include "persist/config_loader.hpp"
#include "util/async_log.hpp"

int main(int argc, char** argv) {
    if (argc < 7) {
        std::cerr << "Usage: " << argv[0]
                  << " <left_channel> <left_stream_id> <right_channel> <right_stream_id>"
                     " <output_channel> <output_stream_id> [config.json]"
                  << std::endl;
        return 1;
    }

    util::AsyncLogger::Config hot_cfg{};
    hot_cfg.capacity_pow2 = 1u << 15;
    hot_cfg.min_level = util::log_level();
    if (!util::init_hot_logger(hot_cfg)) {
        LOG_SLOW_ERROR("Failed to start async logger for fuzzy_recond");
    }

    const std::string left_channel = argv[1];
    const std::int32_t left_stream = static_cast<std::int32_t>(std::stoi(argv[2]));
    const std::string right_channel = argv[3];
    const std::int32_t right_stream = static_cast<std::int32_t>(std::stoi(argv[4]));
    const std::string output_channel = argv[5];
    const std::int32_t output_stream = static_cast<std::int32_t>(std::stoi(argv[6]));

    core::ReconConfig recon_cfg = core::transaction_recon_config();
    if (argc > 7) {
        std::string error;
        if (!persist::parse_recon_config(argv[7], recon_cfg, error)) {
            LOG_SLOW_ERROR("Invalid config %s: %s", argv[7], error.c_str());
            util::shutdown_hot_logger();
            return 1;
        }
    }

    std::unique_ptr<core::IncrementalMatcher> matcher;
    try {
        matcher = std::make_unique<core::IncrementalMatcher>(recon_cfg);
    } catch (const std::invalid_argument& ex) {
        LOG_SLOW_ERROR("Engine configuration rejected: %s", ex.what());
        util::shutdown_hot_logger();
        return 1;
    }

    auto left_ring = std::make_unique<core::DeltaRing>();
    auto right_ring = std::make_unique<core::DeltaRing>();
    auto output_ring = std::make_unique<core::OutputRing>();

    ingest::FeedStats left_stats;
    ingest::FeedStats right_stats;
    ingest::PublisherStats publisher_stats;
    core::ReconCounters counters;
    std::atomic<bool> stop_flag{false};
    core::ResultMaterializer materializer;

    aeron::Context context;
    auto client = aeron::Aeron::connect(context);
    auto client_view = ingest::make_aeron_client_view(client);

    core::Reconciler recon(stop_flag, *left_ring, *right_ring, *matcher, materializer, *output_ring, counters);

    ingest::AeronSubscriber left_sub(left_channel, left_stream, core::Side::Left, *left_ring, left_stats,
                                     client_view, stop_flag);
    ingest::AeronSubscriber right_sub(right_channel, right_stream, core::Side::Right, *right_ring, right_stats,
                                      client_view, stop_flag);
    ingest::OutputPublisher publisher(output_channel, output_stream, *output_ring, publisher_stats, client_view,
                                      stop_flag);

    LOG_SLOW_INFO("Starting fuzzy_recond left=%s stream=%d right=%s stream=%d output=%s stream=%d tau=%.3f",
                  left_channel.c_str(), left_stream, right_channel.c_str(), right_stream, output_channel.c_str(),
                  output_stream, recon_cfg.min_confidence);

    std::thread left_thread([&] { left_sub.run(); });
    std::thread right_thread([&] { right_sub.run(); });
    std::thread recon_thread([&] { recon.run(); });
    std::thread publisher_thread([&] { publisher.run(); });

    const char* duration_env = std::getenv("RECOND_RUN_MS");
    if (duration_env) {
        const auto duration_ms = std::chrono::milliseconds{std::strtoul(duration_env, nullptr, 10)};
        LOG_SLOW_INFO("fuzzy_recond running for %llu ms before shutdown.",
                      static_cast<unsigned long long>(duration_ms.count()));
        std::this_thread::sleep_for(duration_ms);
    } else {
        LOG_SLOW_INFO("fuzzy_recond running. Press Enter to exit.");
        std::cin.get();
    }
    stop_flag.store(true, std::memory_order_release);

    left_thread.join();
    right_thread.join();
    recon_thread.join();
    publisher_thread.join();

    const auto mc = matcher->counters();
    LOG_SLOW_INFO("Left produced=%zu drops=%zu decode_failures=%zu side_mismatch=%zu", left_stats.produced,
                  left_stats.drops, left_stats.decode_failures, left_stats.side_mismatch);
    LOG_SLOW_INFO("Right produced=%zu drops=%zu decode_failures=%zu side_mismatch=%zu", right_stats.produced,
                  right_stats.drops, right_stats.decode_failures, right_stats.side_mismatch);
    LOG_SLOW_INFO("Reconciler left=%llu right=%llu batches=%llu rejected=%llu faults=%llu outputs=%llu ring_drops=%llu",
                  static_cast<unsigned long long>(counters.left_events),
                  static_cast<unsigned long long>(counters.right_events),
                  static_cast<unsigned long long>(counters.batches),
                  static_cast<unsigned long long>(counters.rejected_batches),
                  static_cast<unsigned long long>(counters.batch_faults),
                  static_cast<unsigned long long>(counters.output_events),
                  static_cast<unsigned long long>(counters.output_ring_drops));
    LOG_SLOW_INFO("Matcher matches=%zu pairs_scored=%llu malformed_pairs=%llu fanout_truncations=%llu",
                  matcher->matches().size(), static_cast<unsigned long long>(mc.pairs_scored),
                  static_cast<unsigned long long>(mc.malformed_pairs),
                  static_cast<unsigned long long>(mc.fanout_truncations));
    LOG_SLOW_INFO("Publisher published=%zu back_pressured=%zu dropped=%zu", publisher_stats.published,
                  publisher_stats.back_pressured, publisher_stats.dropped);

    util::shutdown_hot_logger();

    return 0;
}
