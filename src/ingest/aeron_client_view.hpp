#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <thread>
#include <utility>

#include <Aeron.h>
#include <concurrent/AtomicBuffer.h>
#include <concurrent/logbuffer/Header.h>

namespace ingest {

// Called once per received fragment with the fragment's bytes.
using PayloadHandler = std::function<void(std::span<const std::byte>)>;

// Seams over the Aeron client. Feeds and the output publisher only ever see bytes, so
// tests drive them with stubs and never build Aeron buffers.
class SubscriptionView {
public:
    virtual ~SubscriptionView() = default;
    virtual int poll(const PayloadHandler& handler, int fragment_limit) = 0;
};

class PublicationView {
public:
    virtual ~PublicationView() = default;
    // > 0 on success (new stream position); back pressure and errors are <= 0.
    virtual std::int64_t offer(std::span<const std::byte> payload) = 0;
};

class AeronClientView {
public:
    virtual ~AeronClientView() = default;
    virtual std::int64_t request_subscription(const std::string& channel, std::int32_t stream_id) = 0;
    virtual std::shared_ptr<SubscriptionView> subscription_ready(std::int64_t registration_id) = 0;
    virtual std::int64_t request_publication(const std::string& channel, std::int32_t stream_id) = 0;
    virtual std::shared_ptr<PublicationView> publication_ready(std::int64_t registration_id) = 0;
};

// Spins a few rounds, then yields, while a poll loop finds nothing to do.
class IdleBackoff {
public:
    void idle() noexcept {
        if (++spins_ > kSpinLimit) {
            spins_ = 0;
            std::this_thread::yield();
        }
    }
    void reset() noexcept { spins_ = 0; }

private:
    static constexpr int kSpinLimit = 32;
    int spins_{0};
};

// Retries `ready()` until it yields a handle or `stop` is raised. Null means stopped.
template <typename Ready>
auto await_registration(Ready&& ready, const std::atomic<bool>& stop) -> decltype(ready()) {
    while (!stop.load(std::memory_order_acquire)) {
        if (auto handle = ready()) {
            return handle;
        }
        std::this_thread::yield();
    }
    return nullptr;
}

namespace detail {

class AeronSubscriptionView final : public SubscriptionView {
public:
    explicit AeronSubscriptionView(std::shared_ptr<aeron::Subscription> sub) : sub_(std::move(sub)) {}

    int poll(const PayloadHandler& handler, int fragment_limit) override {
        return sub_->poll(
            [&handler](const aeron::concurrent::AtomicBuffer& buffer, aeron::util::index_t offset,
                       aeron::util::index_t length, const aeron::concurrent::logbuffer::Header&) {
                const auto* first = reinterpret_cast<const std::byte*>(buffer.buffer() + offset);
                handler(std::span<const std::byte>(first, static_cast<std::size_t>(length)));
            },
            fragment_limit);
    }

private:
    std::shared_ptr<aeron::Subscription> sub_;
};

class AeronPublicationView final : public PublicationView {
public:
    explicit AeronPublicationView(std::shared_ptr<aeron::Publication> pub) : pub_(std::move(pub)) {}

    std::int64_t offer(std::span<const std::byte> payload) override {
        // AtomicBuffer takes a mutable pointer; offer only reads.
        auto* data = const_cast<std::uint8_t*>(reinterpret_cast<const std::uint8_t*>(payload.data()));
        aeron::concurrent::AtomicBuffer buffer(data, payload.size());
        return pub_->offer(buffer, 0, static_cast<aeron::util::index_t>(payload.size()));
    }

private:
    std::shared_ptr<aeron::Publication> pub_;
};

class AeronClient final : public AeronClientView {
public:
    explicit AeronClient(std::shared_ptr<aeron::Aeron> client) : client_(std::move(client)) {}

    std::int64_t request_subscription(const std::string& channel, std::int32_t stream_id) override {
        return client_->addSubscription(channel, stream_id);
    }

    std::shared_ptr<SubscriptionView> subscription_ready(std::int64_t registration_id) override {
        auto sub = client_->findSubscription(registration_id);
        return sub ? std::make_shared<AeronSubscriptionView>(std::move(sub)) : nullptr;
    }

    std::int64_t request_publication(const std::string& channel, std::int32_t stream_id) override {
        return client_->addPublication(channel, stream_id);
    }

    std::shared_ptr<PublicationView> publication_ready(std::int64_t registration_id) override {
        auto pub = client_->findPublication(registration_id);
        return pub ? std::make_shared<AeronPublicationView>(std::move(pub)) : nullptr;
    }

private:
    std::shared_ptr<aeron::Aeron> client_;
};

} // namespace detail

inline std::shared_ptr<AeronClientView> make_aeron_client_view(std::shared_ptr<aeron::Aeron> client) {
    return std::make_shared<detail::AeronClient>(std::move(client));
}

} // namespace ingest
