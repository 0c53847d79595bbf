#include "ingest/output_publisher.hpp"

#include <span>
#include <thread>
#include <utility>

#include "ingest/delta_codec.hpp"
#include "util/async_log.hpp"

namespace ingest {

OutputPublisher::OutputPublisher(std::string channel,
                                 std::int32_t stream_id,
                                 core::OutputRing& ring,
                                 PublisherStats& stats,
                                 std::shared_ptr<AeronClientView> client,
                                 std::atomic<bool>& stop_flag) noexcept
    : channel_(std::move(channel))
    , stream_id_(stream_id)
    , ring_(ring)
    , stats_(stats)
    , client_(std::move(client))
    , stop_flag_(stop_flag) {}

bool OutputPublisher::publish(PublicationView& publication, const core::OutputEvent& ev) {
    OutputFrame frame{};
    encode_output(ev, frame);
    for (int attempt = 0; attempt < max_offer_attempts; ++attempt) {
        if (publication.offer(std::span<const std::byte>(frame.data(), frame.size())) > 0) {
            ++stats_.published;
            return true;
        }
        ++stats_.back_pressured;
        std::this_thread::yield();
    }
    ++stats_.dropped;
    LOG_OUTPUT_WARN("output event dropped after back pressure", ev.left_id, static_cast<std::uint64_t>(ev.op));
    return false;
}

std::size_t OutputPublisher::drain_once(PublicationView& publication) {
    std::size_t taken = 0;
    core::OutputEvent ev{};
    while (ring_.try_pop(ev)) {
        ++taken;
        publish(publication, ev);
    }
    return taken;
}

void OutputPublisher::run() {
    const std::int64_t registration = client_->request_publication(channel_, stream_id_);
    const auto publication =
        await_registration([&] { return client_->publication_ready(registration); }, stop_flag_);
    if (!publication) {
        return;
    }

    IdleBackoff backoff;
    while (!stop_flag_.load(std::memory_order_acquire)) {
        if (drain_once(*publication) > 0) {
            backoff.reset();
        } else {
            backoff.idle();
        }
    }
    drain_once(*publication);
}

} // namespace ingest
