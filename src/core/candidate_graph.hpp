#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

#include "core/field_value.hpp"

namespace core {

struct CandidateEdge {
    RecordId left{0};
    RecordId right{0};
    double confidence{0.0};

    bool operator==(const CandidateEdge&) const = default;
};

// Cache of scored candidate pairs with adjacency in both directions. Every scored,
// non-malformed pair is kept, including those below the confidence threshold, so a
// later threshold change needs no re-scoring. Derived state: always rebuildable from
// the active records and the scorer.
class CandidateGraph {
public:
    using Adjacency = std::map<RecordId, double>;

    // Returns false if the pair already exists (the stored confidence is unchanged).
    bool add(RecordId left, RecordId right, double confidence);
    // Returns the removed confidence, or nullopt when the pair was not present.
    std::optional<double> remove(RecordId left, RecordId right);

    // Edges touching `id` on `side`, ordered by opposite id.
    std::vector<CandidateEdge> edges_of(Side side, RecordId id) const;

    std::optional<double> confidence(RecordId left, RecordId right) const noexcept;
    const Adjacency* neighbours(Side side, RecordId id) const noexcept;

    std::size_t edge_count() const noexcept { return edges_; }

private:
    std::unordered_map<RecordId, Adjacency> left_adj_;
    std::unordered_map<RecordId, Adjacency> right_adj_;
    std::size_t edges_{0};
};

} // namespace core
