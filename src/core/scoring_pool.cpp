#include "core/scoring_pool.hpp"

#include <algorithm>
#include <thread>

namespace core {
namespace {

void score_range(const SimilarityScorer& scorer,
                 const std::vector<ScoringTask>& tasks,
                 std::vector<ScoreOutcome>& out,
                 std::size_t begin,
                 std::size_t end) noexcept {
    for (std::size_t i = begin; i < end; ++i) {
        out[i] = scorer.score(*tasks[i].left, *tasks[i].right);
    }
}

struct JoinAll {
    std::vector<std::thread>& workers;
    ~JoinAll() {
        for (auto& t : workers) {
            if (t.joinable()) t.join();
        }
    }
};

} // namespace

void ScoringPool::score(const SimilarityScorer& scorer,
                        const std::vector<ScoringTask>& tasks,
                        std::vector<ScoreOutcome>& out) const {
    out.assign(tasks.size(), ScoreOutcome{});
    if (tasks.empty()) return;

    const std::size_t workers = std::min(threads_, tasks.size());
    if (workers <= 1 || tasks.size() < min_parallel_tasks_) {
        score_range(scorer, tasks, out, 0, tasks.size());
        return;
    }

    const std::size_t chunk = (tasks.size() + workers - 1) / workers;
    std::vector<std::thread> pool;
    pool.reserve(workers - 1);
    JoinAll joiner{pool};

    // The calling thread takes the first chunk.
    for (std::size_t w = 1; w < workers; ++w) {
        const std::size_t begin = w * chunk;
        const std::size_t end = std::min(tasks.size(), begin + chunk);
        if (begin >= end) break;
        pool.emplace_back([&scorer, &tasks, &out, begin, end] { score_range(scorer, tasks, out, begin, end); });
    }
    score_range(scorer, tasks, out, 0, std::min(chunk, tasks.size()));
}

} // namespace core
