#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>

#include "core/delta_event.hpp"

namespace api {

// Deterministic generator of bank-transfer pairs for the demo, load publisher and
// benchmark. The left record is the structured bank-feed row; the right record is a
// hand-written description of the same transfer with small amount and date noise.
class SyntheticFeed {
public:
    explicit SyntheticFeed(std::uint64_t seed = 42) : rng_(seed) {}

    struct Transfer {
        core::DeltaEvent left;
        core::DeltaEvent right;
    };

    // Both records carry `id`.
    Transfer next(core::RecordId id);

    static core::DeltaEvent remove(core::Side side, core::RecordId id);

private:
    std::uint64_t uniform(std::uint64_t lo, std::uint64_t hi);

    std::mt19937_64 rng_;
};

} // namespace api
