#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/field_value.hpp"

namespace core {

struct Match {
    RecordId left{0};
    RecordId right{0};
    double confidence{0.0};

    bool operator==(const Match&) const = default;
};

// Current one-to-one partial matching. Left slots are ordered so snapshots and
// diffs are deterministic; the right map is the reverse index.
class Assignment {
public:
    // Returns false (and changes nothing) if either endpoint is already matched.
    bool match(RecordId left, RecordId right, double confidence);
    std::optional<Match> unmatch_left(RecordId left);

    const Match* by_left(RecordId left) const noexcept;
    std::optional<RecordId> left_of(RecordId right) const noexcept;
    std::optional<RecordId> partner(Side side, RecordId id) const noexcept;

    std::vector<Match> matches() const;
    std::size_t size() const noexcept { return by_left_.size(); }
    bool empty() const noexcept { return by_left_.empty(); }

    // Cross-checks both maps. Returns a description of the first violation found.
    std::optional<std::string> validate() const;

private:
    std::map<RecordId, Match> by_left_;
    std::unordered_map<RecordId, RecordId> by_right_;
};

} // namespace core
