#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/assignment.hpp"
#include "core/assignment_diff.hpp"
#include "core/assignment_solver.hpp"
#include "core/candidate_generator.hpp"
#include "core/candidate_graph.hpp"
#include "core/delta_event.hpp"
#include "core/recon_config.hpp"
#include "core/record_normalizer.hpp"
#include "core/scoring_pool.hpp"
#include "core/similarity.hpp"
#include "core/state_journal.hpp"

namespace core {

enum class BatchStatus : std::uint8_t { Applied, Rejected };

enum class BatchError : std::uint8_t {
    None,
    StateCorruption, // invariant violated after the re-solve
    InternalFault    // exception escaped batch processing
};

[[nodiscard]] constexpr const char* to_string(BatchError e) noexcept {
    switch (e) {
        case BatchError::None:            return "none";
        case BatchError::StateCorruption: return "state_corruption";
        case BatchError::InternalFault:   return "internal_fault";
    }
    return "unknown";
}

struct BatchResult {
    BatchStatus status{BatchStatus::Applied};
    BatchError error{BatchError::None};
    std::string detail{};
    std::vector<DiffEvent> diff{}; // empty when rejected

    [[nodiscard]] bool ok() const noexcept { return status == BatchStatus::Applied; }
};

struct MatchCounters {
    std::uint64_t inserts{0};
    std::uint64_t removes{0};
    std::uint64_t duplicate_inserts{0};
    std::uint64_t unknown_removes{0};
    std::uint64_t replacements{0};
    std::uint64_t malformed_records{0};

    std::uint64_t pairs_scored{0};
    std::uint64_t malformed_pairs{0};
    std::uint64_t fanout_truncations{0};

    std::uint64_t regions_solved{0};
    std::uint64_t region_records{0};
    std::uint64_t matches_released{0};

    std::uint64_t batches_applied{0};
    std::uint64_t batches_rejected{0};
    std::uint64_t diff_events{0};
};

// Stateful core of the engine. Holds the active records of both sides, the blocking
// indexes, the candidate graph and the one-to-one assignment; all mutation goes
// through apply_batch / set_min_confidence, serialized by an internal mutex.
//
// A batch is atomic: every mutation is journaled, the re-solved region is validated
// and any violation or escaped exception rolls the batch back, leaving the previous
// state authoritative.
class IncrementalMatcher {
public:
    // Throws std::invalid_argument when the configuration is unusable.
    explicit IncrementalMatcher(ReconConfig cfg,
                                std::unique_ptr<IAssignmentSolver> solver = nullptr);

    IncrementalMatcher(const IncrementalMatcher&) = delete;
    IncrementalMatcher& operator=(const IncrementalMatcher&) = delete;

    BatchResult apply_batch(const std::vector<DeltaEvent>& events);
    BatchResult apply(const DeltaEvent& event) { return apply_batch(std::vector<DeltaEvent>{event}); }

    // Re-solves the whole candidate graph under the new threshold.
    // Throws std::invalid_argument if tau is outside [0, 1].
    BatchResult set_min_confidence(double tau);

    // Snapshot accessors; each takes the state lock.
    double min_confidence() const;
    std::vector<Match> matches() const;
    std::vector<RecordId> active_ids(Side side) const;
    std::optional<Record> find_record(Side side, RecordId id) const;
    std::optional<Match> match_of_left(RecordId left) const;
    std::size_t candidate_edge_count() const;
    MatchCounters counters() const;

    // Full invariant check. Returns a description of the first violation.
    std::optional<std::string> validate() const;

    const ReconConfig& config() const noexcept { return cfg_; }

private:
    using RecordMap = std::unordered_map<RecordId, Record>;

    struct BatchScratch {
        std::set<RecordId> seeds[2];
        std::set<CandidateKey> pending;
        std::map<RecordId, LeftSlot> before;
    };

    BatchResult run_locked(const std::vector<DeltaEvent>& events, bool full_resolve);

    void apply_event(const DeltaEvent& ev, BatchScratch& scratch);
    void insert_record(Record rec, BatchScratch& scratch);
    void remove_record(Side side, RecordId id, BatchScratch& scratch);
    void score_pending(BatchScratch& scratch);
    void resolve_region(BatchScratch& scratch, bool full_resolve);

    void set_match(RecordId left, RecordId right, double confidence, BatchScratch& scratch);
    void clear_match(RecordId left, BatchScratch& scratch);
    void touch_left(RecordId left, BatchScratch& scratch);
    LeftSlot slot_of(RecordId left) const;

    std::optional<std::string> validate_ids(const std::vector<RecordId>& lefts,
                                            const std::vector<RecordId>& rights) const;
    std::optional<std::string> validate_locked() const;
    void rollback();

    RecordMap& records(Side side) noexcept { return side == Side::Left ? left_records_ : right_records_; }
    const RecordMap& records(Side side) const noexcept {
        return side == Side::Left ? left_records_ : right_records_;
    }

    ReconConfig cfg_;
    double min_confidence_;
    RecordNormalizer normalizer_;
    SimilarityScorer scorer_;
    CandidateGenerator generator_;
    ScoringPool pool_;
    std::unique_ptr<IAssignmentSolver> solver_;

    mutable std::mutex mtx_;
    RecordMap left_records_;
    RecordMap right_records_;
    CandidateGraph graph_;
    Assignment assignment_;
    StateJournal journal_;
    MatchCounters counters_{};

    // Ids touched by the last region solve, validated before commit.
    std::vector<RecordId> region_lefts_;
    std::vector<RecordId> region_rights_;
};

} // namespace core
