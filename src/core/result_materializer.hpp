#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "core/assignment_diff.hpp"
#include "core/delta_event.hpp"

namespace core {

struct OutputRow {
    RecordId left_id{0};
    std::optional<RecordId> right_id{};
    double confidence{0.0};

    bool operator==(const OutputRow&) const = default;
};

struct MaterializerCounters {
    std::uint64_t upserts{0};
    std::uint64_t retracts{0};
    std::uint64_t inconsistent_diffs{0}; // event did not fit the materialized row
};

// Projects assignment diffs into the left-join output stream. Every active left record
// has exactly one row; unmatched rows carry no right id and confidence 0. Each diff
// event yields exactly one output event; the full output is never recomputed.
class ResultMaterializer {
public:
    std::vector<OutputEvent> apply(const std::vector<DiffEvent>& diff);
    void apply(const std::vector<DiffEvent>& diff, std::vector<OutputEvent>& out);

    // Current rows ordered by left id.
    std::vector<OutputRow> snapshot() const;
    const OutputRow* row(RecordId left) const noexcept;
    std::size_t size() const noexcept { return rows_.size(); }

    const MaterializerCounters& counters() const noexcept { return counters_; }

private:
    std::map<RecordId, OutputRow> rows_;
    MaterializerCounters counters_{};
};

[[nodiscard]] OutputEvent to_output_event(const DiffEvent& ev) noexcept;

} // namespace core
