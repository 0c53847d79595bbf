#include "core/reconciler.hpp"

#include <chrono>
#include <exception>
#include <thread>

#include "util/async_log.hpp"
#include "util/log.hpp"

namespace core {

Reconciler::Reconciler(std::atomic<bool>& stop_flag,
                       DeltaRing& left,
                       DeltaRing& right,
                       IncrementalMatcher& matcher,
                       ResultMaterializer& materializer,
                       OutputRing& output,
                       ReconCounters& counters) noexcept
    : stop_flag_(stop_flag),
      left_(left),
      right_(right),
      matcher_(matcher),
      materializer_(materializer),
      output_(output),
      counters_(counters),
      max_batch_events_(matcher.config().max_batch_events) {}

void Reconciler::publish(const std::vector<OutputEvent>& events) noexcept {
    for (const auto& ev : events) {
        if (!output_.try_push(ev)) {
            ++counters_.output_ring_drops;
            LOG_OUTPUT_WARN("output ring full, event dropped", ev.left_id, static_cast<std::uint64_t>(ev.op));
            continue;
        }
        ++counters_.output_events;
        if (ev.op == OutputOp::Upsert) {
            ++counters_.output_upserts;
        } else {
            ++counters_.output_retracts;
        }
    }
}

void Reconciler::process_batch(const std::vector<DeltaEvent>& batch) {
    ++counters_.batches;
    try {
        const BatchResult result = matcher_.apply_batch(batch);
        if (!result.ok()) {
            ++counters_.rejected_batches;
            LOG_ENGINE_ERROR("batch rejected", batch.size(), static_cast<std::uint64_t>(result.error));
            return;
        }
        out_scratch_.clear();
        materializer_.apply(result.diff, out_scratch_);
    } catch (const std::exception& ex) {
        ++counters_.batch_faults;
        LOG_SLOW_ERROR("batch of %zu events failed: %s", batch.size(), ex.what());
        return;
    }
    publish(out_scratch_);
}

std::size_t Reconciler::poll_once() {
    batch_.clear();
    DeltaEvent ev{};
    bool progressed = true;
    while (progressed && batch_.size() < max_batch_events_) {
        progressed = false;
        if (left_.try_pop(ev)) {
            ++counters_.left_events;
            batch_.push_back(std::move(ev));
            progressed = true;
        }
        if (batch_.size() < max_batch_events_ && right_.try_pop(ev)) {
            ++counters_.right_events;
            batch_.push_back(std::move(ev));
            progressed = true;
        }
    }
    if (batch_.empty()) {
        return 0;
    }
    process_batch(batch_);
    return batch_.size();
}

void Reconciler::run() {
    std::uint32_t backoff = 0;
    while (!stop_flag_.load(std::memory_order_acquire)) {
        if (poll_once() > 0) {
            backoff = 0;
            continue;
        }
        if (backoff < 16) {
            ++backoff;
            std::this_thread::yield();
        } else {
            std::this_thread::sleep_for(std::chrono::microseconds(50));
        }
    }
}

} // namespace core
