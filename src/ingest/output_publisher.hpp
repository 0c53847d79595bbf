#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "core/reconciler.hpp"
#include "ingest/aeron_client_view.hpp"

namespace ingest {

struct PublisherStats {
    std::size_t published{0};
    std::size_t back_pressured{0}; // offer attempts that had to be retried
    std::size_t dropped{0};        // gave up after max_offer_attempts
};

// Drains the reconciler's output ring and offers each event as a fixed-size output
// frame. Events are published in ring order; on shutdown the ring is drained first.
class OutputPublisher {
public:
    static constexpr int max_offer_attempts = 1024;

    OutputPublisher(std::string channel,
                    std::int32_t stream_id,
                    core::OutputRing& ring,
                    PublisherStats& stats,
                    std::shared_ptr<AeronClientView> client,
                    std::atomic<bool>& stop_flag) noexcept;

    void run();

    // Publishes everything currently queued. Returns the number of events taken.
    std::size_t drain_once(PublicationView& publication);

private:
    bool publish(PublicationView& publication, const core::OutputEvent& ev);

    std::string channel_;
    std::int32_t stream_id_;
    core::OutputRing& ring_;
    PublisherStats& stats_;
    std::shared_ptr<AeronClientView> client_;
    std::atomic<bool>& stop_flag_;
};

} // namespace ingest
