#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/field_value.hpp"

namespace core {

enum class DeltaOp : std::uint8_t { Insert = 0, Remove = 1 };

// Input unit delivered by ingestion collaborators. Identifiers are unique within a
// side and stable across time. Raw fields are normalized once by RecordNormalizer.
struct DeltaEvent {
    Side side{Side::Left};
    DeltaOp op{DeltaOp::Insert};
    RecordId id{0};
    std::vector<std::pair<std::string, std::string>> fields{};

    bool operator==(const DeltaEvent&) const = default;
};

enum class OutputOp : std::uint8_t { Upsert = 0, Retract = 1 };

// Output unit for the downstream sink. Left-join shape: an unmatched left record is
// an upsert with no right id and confidence 0.
struct OutputEvent {
    OutputOp op{OutputOp::Upsert};
    RecordId left_id{0};
    std::optional<RecordId> right_id{};
    double confidence{0.0};

    bool operator==(const OutputEvent&) const = default;
};

inline DeltaEvent make_insert(Side side, RecordId id,
                              std::vector<std::pair<std::string, std::string>> fields) {
    return DeltaEvent{side, DeltaOp::Insert, id, std::move(fields)};
}

inline DeltaEvent make_remove(Side side, RecordId id) {
    return DeltaEvent{side, DeltaOp::Remove, id, {}};
}

} // namespace core
