#pragma once

#include <cstddef>
#include <vector>

#include "core/field_value.hpp"
#include "core/similarity.hpp"

namespace core {

struct ScoringTask {
    const Record* left{nullptr};
    const Record* right{nullptr};
};

// Fork/join pair scoring against a read-only record snapshot. Each task writes only
// its own result slot, so the output is identical for any thread count.
class ScoringPool {
public:
    ScoringPool(std::size_t threads, std::size_t min_parallel_tasks) noexcept
        : threads_(threads == 0 ? 1 : threads), min_parallel_tasks_(min_parallel_tasks) {}

    // Resizes `out` to tasks.size(). Throws std::system_error if a worker cannot start;
    // workers already started are joined first.
    void score(const SimilarityScorer& scorer,
               const std::vector<ScoringTask>& tasks,
               std::vector<ScoreOutcome>& out) const;

    std::size_t threads() const noexcept { return threads_; }

private:
    std::size_t threads_;
    std::size_t min_parallel_tasks_;
};

} // namespace core
