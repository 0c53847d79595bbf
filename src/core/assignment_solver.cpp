#include "core/assignment_solver.hpp"

#include <algorithm>
#include <unordered_set>

namespace core {

LocalSolution GreedyAssignmentSolver::solve(const SolveInput& input) const {
    LocalSolution out;
    if (input.edges.empty()) {
        out.released = input.current.size();
        return out;
    }

    std::vector<CandidateEdge> order;
    order.reserve(input.edges.size());
    for (const auto& e : input.edges) {
        if (e.confidence >= input.min_confidence && e.confidence > 0.0) {
            order.push_back(e);
        }
    }
    std::sort(order.begin(), order.end(), [](const CandidateEdge& a, const CandidateEdge& b) {
        if (a.confidence != b.confidence) return a.confidence > b.confidence;
        if (a.left != b.left) return a.left < b.left;
        return a.right < b.right;
    });

    std::unordered_set<RecordId> used_left;
    std::unordered_set<RecordId> used_right;
    for (const auto& e : order) {
        if (used_left.contains(e.left) || used_right.contains(e.right)) continue;
        used_left.insert(e.left);
        used_right.insert(e.right);
        out.matches.push_back(Match{e.left, e.right, e.confidence});
    }
    std::sort(out.matches.begin(), out.matches.end(),
              [](const Match& a, const Match& b) { return a.left < b.left; });

    for (const auto& cur : input.current) {
        const auto it = std::lower_bound(out.matches.begin(), out.matches.end(), cur.left,
                                         [](const Match& m, RecordId left) { return m.left < left; });
        if (it != out.matches.end() && *it == cur) {
            ++out.retained;
        } else {
            ++out.released;
        }
    }
    return out;
}

} // namespace core
