#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/blocking_index.hpp"
#include "core/record_normalizer.hpp"
#include "core/similarity.hpp"

namespace core {

// Configuration for the incremental fuzzy-match engine.
struct ReconConfig {
    // Minimum confidence for a pair to be accepted by the solver (tau).
    double min_confidence{0.5};

    // Fan-out cap: at most this many candidates per inserted record, ranked by the
    // number of blocking rules shared.
    std::size_t max_candidates_per_record{32};

    std::vector<BlockingKeyRule> blocking{};
    ScorerConfig scorer{};

    RecordSchema left_schema{};
    RecordSchema right_schema{};

    // Pair scoring fans out only when a batch has at least this many pairs.
    std::size_t scoring_threads{1};
    std::size_t parallel_scoring_min_pairs{256};

    // Reconciler worker: max delta events applied as one batch.
    std::size_t max_batch_events{256};

    // Check the whole assignment after every batch instead of the re-solved region only.
    bool validate_full_state{false};
};

// Empty rule sets; callers fill in blocking and scorer rules before use.
[[nodiscard]] inline ReconConfig default_recon_config() {
    return ReconConfig{};
}

// Bank-transfer reconciliation: a structured feed on the left (date, amount, recipient,
// account numbers) against hand-written transfer descriptions on the right.
[[nodiscard]] ReconConfig transaction_recon_config();

// Returns an empty string when the configuration is usable, otherwise the first problem.
[[nodiscard]] std::string validate_recon_config(const ReconConfig& cfg);

} // namespace core
