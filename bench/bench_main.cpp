#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <vector>

#include "api/synthetic_feed.hpp"
#include "core/incremental_matcher.hpp"
#include "core/result_materializer.hpp"
#include "ingest/delta_codec.hpp"
#include "ingest/delta_text_parser.hpp"

namespace {

using Clock = std::chrono::steady_clock;

long long elapsed_ns(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count();
}

void bench_codec(const std::vector<core::DeltaEvent>& events) {
    std::vector<std::byte> frame;
    core::DeltaEvent decoded{};
    const auto start = Clock::now();
    for (const auto& ev : events) {
        frame.clear();
        ingest::encode_delta(ev, frame);
        ingest::decode_delta(frame, decoded);
        const std::string line = ingest::format_delta_line(ev);
        ingest::parse_delta_line(line, decoded);
    }
    const auto ns = elapsed_ns(start);
    std::cout << "Codec+text round trip " << events.size() << " events took " << ns << " ns ("
              << (ns / static_cast<long long>(events.size())) << " ns/event)\n";
}

void bench_matcher(const std::vector<core::DeltaEvent>& events, std::size_t batch_size, std::size_t threads) {
    core::ReconConfig cfg = core::transaction_recon_config();
    cfg.scoring_threads = threads;
    core::IncrementalMatcher matcher(cfg);
    core::ResultMaterializer materializer;
    std::vector<core::OutputEvent> out;

    std::size_t rejected = 0;
    std::vector<core::DeltaEvent> batch;
    const auto start = Clock::now();
    for (std::size_t i = 0; i < events.size(); i += batch_size) {
        batch.assign(events.begin() + static_cast<std::ptrdiff_t>(i),
                     events.begin() + static_cast<std::ptrdiff_t>(std::min(events.size(), i + batch_size)));
        const auto result = matcher.apply_batch(batch);
        if (!result.ok()) {
            ++rejected;
            continue;
        }
        out.clear();
        materializer.apply(result.diff, out);
    }
    const auto ns = elapsed_ns(start);
    const auto c = matcher.counters();
    std::cout << "Matcher batch=" << batch_size << " threads=" << threads << ": " << events.size() << " events in "
              << ns << " ns (" << (ns / static_cast<long long>(events.size())) << " ns/event), matches="
              << matcher.matches().size() << " pairs_scored=" << c.pairs_scored << " rejected=" << rejected << "\n";
}

} // namespace

int main(int argc, char** argv) {
    const std::size_t transfers = argc > 1 ? static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10)) : 20000;

    api::SyntheticFeed feed(42);
    std::vector<core::DeltaEvent> events;
    events.reserve(transfers * 2);
    for (core::RecordId id = 1; id <= transfers; ++id) {
        auto t = feed.next(id);
        events.push_back(std::move(t.left));
        events.push_back(std::move(t.right));
    }

    bench_codec(events);
    bench_matcher(events, 1, 1);
    bench_matcher(events, 256, 1);
    bench_matcher(events, 256, 4);
    return 0;
}
