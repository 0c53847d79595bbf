#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include "core/delta_event.hpp"
#include "core/reconciler.hpp"
#include "ingest/aeron_client_view.hpp"

namespace ingest {

struct FeedStats {
    std::size_t produced{0};
    std::size_t decode_failures{0};
    std::size_t side_mismatch{0}; // frame decoded but claimed the other side
    std::size_t drops{0};         // delta ring full
};

// One side's delta feed: polls an Aeron stream, decodes each fragment into a
// DeltaEvent and hands it to the matcher through the side's ring. A stream carries a
// single side; frames claiming the other side are counted and discarded.
class AeronSubscriber {
public:
    AeronSubscriber(std::string channel,
                    std::int32_t stream_id,
                    core::Side side,
                    core::DeltaRing& ring,
                    FeedStats& stats,
                    std::shared_ptr<AeronClientView> client,
                    std::atomic<bool>& stop_flag) noexcept;

    void run();

    void on_fragment(std::span<const std::byte> payload);

    core::Side side() const noexcept { return side_; }

private:
    static constexpr int kFragmentLimit = 10;

    std::string channel_;
    std::int32_t stream_id_;
    core::Side side_;
    core::DeltaRing& ring_;
    FeedStats& stats_;
    std::shared_ptr<AeronClientView> client_;
    std::atomic<bool>& stop_flag_;
    core::DeltaEvent decoded_{};
};

} // namespace ingest
