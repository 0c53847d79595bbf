#pragma once

#include <cstddef>
#include <vector>

#include "core/assignment.hpp"
#include "core/candidate_graph.hpp"

namespace core {

// Subgraph handed to the solver: the affected region's records, the candidate edges
// among them and the matches they currently hold.
struct SolveInput {
    std::vector<RecordId> lefts{};
    std::vector<RecordId> rights{};
    std::vector<CandidateEdge> edges{};
    std::vector<Match> current{};
    double min_confidence{0.5};
};

struct LocalSolution {
    std::vector<Match> matches{};   // ordered by left id
    std::size_t retained{0};        // current matches kept unchanged
    std::size_t released{0};        // current matches dropped or re-partnered
};

class IAssignmentSolver {
public:
    virtual ~IAssignmentSolver() = default;
    virtual LocalSolution solve(const SolveInput& input) const = 0;
};

// Deterministic greedy matching: edges sorted by (confidence desc, left asc, right asc),
// a pair is accepted when both endpoints are still free and its confidence is at least
// the threshold (and strictly positive). The result carries at least half the weight of
// a maximum-weight matching of the same subgraph. Current matches are ignored for the
// decision, so the output is a pure function of the edge set.
class GreedyAssignmentSolver final : public IAssignmentSolver {
public:
    LocalSolution solve(const SolveInput& input) const override;
};

} // namespace core
