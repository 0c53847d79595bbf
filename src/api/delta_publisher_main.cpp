#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <Aeron.h>

#include "api/synthetic_feed.hpp"
#include "ingest/delta_codec.hpp"

namespace {

bool publish(aeron::Publication& pub, std::vector<std::byte>& frame) {
    aeron::concurrent::AtomicBuffer buffer(reinterpret_cast<std::uint8_t*>(frame.data()), frame.size());
    return pub.offer(buffer, 0, static_cast<aeron::util::index_t>(frame.size())) > 0;
}

void offer_until_sent(aeron::Publication& pub, const core::DeltaEvent& ev, std::size_t& sent) {
    std::vector<std::byte> frame;
    if (!ingest::encode_delta(ev, frame)) {
        std::cerr << "Skipping unencodable event id=" << ev.id << std::endl;
        return;
    }
    while (!publish(pub, frame)) {
        std::this_thread::yield();
    }
    ++sent;
}

} // namespace

// Publishes synthetic transfers: structured rows on the left stream, hand-written
// descriptions of the same transfers on the right stream. Every tenth transfer is
// removed again from both sides.
int main(int argc, char** argv) {
    if (argc < 7) {
        std::cerr << "Usage: " << argv[0]
                  << " <left_channel> <left_stream_id> <right_channel> <right_stream_id> <count> <sleep_ms> [seed]"
                  << std::endl;
        return 1;
    }

    const std::string left_channel = argv[1];
    const std::int32_t left_stream = static_cast<std::int32_t>(std::stoi(argv[2]));
    const std::string right_channel = argv[3];
    const std::int32_t right_stream = static_cast<std::int32_t>(std::stoi(argv[4]));
    const std::size_t count = static_cast<std::size_t>(std::stoul(argv[5]));
    const auto sleep_ms = std::chrono::milliseconds{std::stoul(argv[6])};
    const std::uint64_t seed = argc > 7 ? std::stoull(argv[7]) : 42;

    aeron::Context ctx;
    auto client = aeron::Aeron::connect(ctx);
    const auto left_id = client->addPublication(left_channel, left_stream);
    const auto right_id = client->addPublication(right_channel, right_stream);

    std::shared_ptr<aeron::Publication> left_pub;
    std::shared_ptr<aeron::Publication> right_pub;
    while (!left_pub || !right_pub) {
        if (!left_pub) left_pub = client->findPublication(left_id);
        if (!right_pub) right_pub = client->findPublication(right_id);
        std::this_thread::yield();
    }

    api::SyntheticFeed feed(seed);
    std::size_t sent = 0;
    for (core::RecordId id = 1; id <= count; ++id) {
        const auto transfer = feed.next(id);
        offer_until_sent(*left_pub, transfer.left, sent);
        offer_until_sent(*right_pub, transfer.right, sent);
        if (id % 10 == 0) {
            offer_until_sent(*left_pub, api::SyntheticFeed::remove(core::Side::Left, id), sent);
            offer_until_sent(*right_pub, api::SyntheticFeed::remove(core::Side::Right, id), sent);
        }
        std::this_thread::sleep_for(sleep_ms);
    }

    std::cout << "Published " << sent << " delta events to " << left_channel << " stream " << left_stream << " and "
              << right_channel << " stream " << right_stream << std::endl;
    return 0;
}
