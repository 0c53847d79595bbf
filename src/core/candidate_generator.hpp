#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "core/blocking_index.hpp"
#include "core/field_value.hpp"

namespace core {

// Unscored candidate pair, always (left id, right id).
using CandidateKey = std::pair<RecordId, RecordId>;

struct CandidateDelta {
    std::vector<CandidateKey> added{}; // ordered by (pre-score desc, opposite id asc)
    std::size_t considered{0};         // distinct opposite records sharing a key
    bool truncated{false};             // fan-out cap applied
};

// Owns the blocking indexes of both sides. Inserting a record indexes it and returns the
// opposite-side records it now shares a key with; scoring is left to the caller so a
// whole batch can be scored in one pass. Removing a record purges its index entries;
// the caller drops its candidate edges.
class CandidateGenerator {
public:
    // Throws std::invalid_argument on an empty rule set, a zero cap or a non-positive
    // bucket width.
    CandidateGenerator(std::vector<BlockingKeyRule> rules, std::size_t max_candidates_per_record);

    CandidateDelta on_insert(const Record& rec);
    // Returns the keys the record was indexed under (empty if it was not indexed).
    std::vector<DerivedKey> on_remove(Side side, RecordId id);

    // Re-indexes a record without probing (rollback path).
    void restore(const Record& rec);

    const BlockingIndex& index(Side side) const noexcept {
        return side == Side::Left ? left_ : right_;
    }
    const std::vector<BlockingKeyRule>& rules() const noexcept { return rules_; }
    std::size_t max_candidates_per_record() const noexcept { return max_candidates_; }

private:
    BlockingIndex& index_mut(Side side) noexcept { return side == Side::Left ? left_ : right_; }

    std::vector<BlockingKeyRule> rules_;
    std::size_t max_candidates_;
    BlockingIndex left_{};
    BlockingIndex right_{};
};

} // namespace core
