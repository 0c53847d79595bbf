#include "ingest/aeron_subscriber.hpp"

#include <utility>

#include "ingest/delta_codec.hpp"
#include "util/async_log.hpp"

namespace ingest {

AeronSubscriber::AeronSubscriber(std::string channel,
                                 std::int32_t stream_id,
                                 core::Side side,
                                 core::DeltaRing& ring,
                                 FeedStats& stats,
                                 std::shared_ptr<AeronClientView> client,
                                 std::atomic<bool>& stop_flag) noexcept
    : channel_(std::move(channel))
    , stream_id_(stream_id)
    , side_(side)
    , ring_(ring)
    , stats_(stats)
    , client_(std::move(client))
    , stop_flag_(stop_flag) {}

void AeronSubscriber::on_fragment(std::span<const std::byte> payload) {
    const DecodeResult res = decode_delta(payload, decoded_);
    if (res != DecodeResult::Ok) {
        ++stats_.decode_failures;
        LOG_INGEST_WARN("delta frame rejected", payload.size(), res);
        return;
    }
    if (decoded_.side != side_) {
        ++stats_.side_mismatch;
        LOG_INGEST_WARN("delta frame for wrong side", decoded_.id, decoded_.side);
        return;
    }
    // A full ring keeps the event in decoded_; it is overwritten by the next fragment.
    if (ring_.try_push(std::move(decoded_))) {
        ++stats_.produced;
    } else {
        ++stats_.drops;
    }
}

void AeronSubscriber::run() {
    const std::int64_t registration = client_->request_subscription(channel_, stream_id_);
    const auto subscription =
        await_registration([&] { return client_->subscription_ready(registration); }, stop_flag_);
    if (!subscription) {
        return;
    }

    const PayloadHandler handler = [this](std::span<const std::byte> payload) { on_fragment(payload); };
    IdleBackoff backoff;
    while (!stop_flag_.load(std::memory_order_acquire)) {
        if (subscription->poll(handler, kFragmentLimit) > 0) {
            backoff.reset();
        } else {
            backoff.idle();
        }
    }
}

} // namespace ingest
