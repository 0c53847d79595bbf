#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/delta_event.hpp"
#include "core/incremental_matcher.hpp"
#include "core/result_materializer.hpp"
#include "ingest/spsc_ring.hpp"

namespace core {

template <std::size_t Capacity = (1u << 12)>
using DeltaRingT = ingest::SpscRing<DeltaEvent, Capacity>;

template <std::size_t Capacity = (1u << 14)>
using OutputRingT = ingest::SpscRing<OutputEvent, Capacity>;

using DeltaRing = DeltaRingT<>;
using OutputRing = OutputRingT<>;

struct ReconCounters {
    std::uint64_t left_events{0};
    std::uint64_t right_events{0};

    std::uint64_t batches{0};
    std::uint64_t rejected_batches{0};
    std::uint64_t batch_faults{0}; // apply_batch threw past its own rollback

    std::uint64_t output_events{0};
    std::uint64_t output_upserts{0};
    std::uint64_t output_retracts{0};
    std::uint64_t output_ring_drops{0};
};

// Single writer for the matcher. Drains the left and right delta rings alternately
// (each feed keeps its own order), applies what it collected as one batch and pushes
// the resulting output events immediately; it never waits for more input.
class Reconciler {
public:
    Reconciler(std::atomic<bool>& stop_flag,
               DeltaRing& left,
               DeltaRing& right,
               IncrementalMatcher& matcher,
               ResultMaterializer& materializer,
               OutputRing& output,
               ReconCounters& counters) noexcept;

    void run();

    // One drain + apply step. Returns the number of delta events consumed.
    std::size_t poll_once();

    void process_batch_for_test(const std::vector<DeltaEvent>& batch) { process_batch(batch); }

private:
    void process_batch(const std::vector<DeltaEvent>& batch);
    void publish(const std::vector<OutputEvent>& events) noexcept;

    std::atomic<bool>& stop_flag_;
    DeltaRing& left_;
    DeltaRing& right_;
    IncrementalMatcher& matcher_;
    ResultMaterializer& materializer_;
    OutputRing& output_;
    ReconCounters& counters_;
    std::size_t max_batch_events_;

    std::vector<DeltaEvent> batch_{};
    std::vector<OutputEvent> out_scratch_{};
};

} // namespace core
