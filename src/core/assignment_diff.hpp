#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "core/field_value.hpp"

namespace core {

enum class DiffKind : std::uint8_t {
    PairAdded,
    PairRemoved,
    ConfidenceChanged,
    LeftUnmatched, // left record is active with no partner
    LeftRetired    // unmatched left record was removed
};

[[nodiscard]] constexpr const char* to_string(DiffKind k) noexcept {
    switch (k) {
        case DiffKind::PairAdded:         return "pair_added";
        case DiffKind::PairRemoved:       return "pair_removed";
        case DiffKind::ConfidenceChanged: return "confidence_changed";
        case DiffKind::LeftUnmatched:     return "left_unmatched";
        case DiffKind::LeftRetired:       return "left_retired";
    }
    return "unknown";
}

struct DiffEvent {
    DiffKind kind{DiffKind::PairAdded};
    RecordId left{0};
    std::optional<RecordId> right{};
    double confidence{0.0};          // new confidence; old one for PairRemoved
    double previous_confidence{0.0}; // ConfidenceChanged only

    bool operator==(const DiffEvent&) const = default;
};

// Observable state of one left id, before or after a batch.
struct LeftSlot {
    bool active{false};
    std::optional<RecordId> right{};
    double confidence{0.0};

    bool operator==(const LeftSlot&) const = default;
};

// Appends the events that turn `before` into `after` for one left id.
// Emits nothing when the slots are equal.
void append_slot_diff(RecordId left, const LeftSlot& before, const LeftSlot& after,
                      std::vector<DiffEvent>& out);

} // namespace core
