#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "core/incremental_matcher.hpp"
#include "tests/harness/scenario_builder.hpp"
#include "tests/harness/scenario_runner.hpp"

namespace {

using core::OutputEvent;
using core::OutputOp;
using test::DeltaScenarioBuilder;
using test::ReconTestHarness;

const test::Fields perez{{"amount", "8946"}, {"recipient", "M. Perez"}, {"acc_suffix", "8280573"}};

void expect_event(const OutputEvent& ev, OutputOp op, core::RecordId left,
                  std::optional<core::RecordId> right, double confidence) {
    EXPECT_EQ(ev.op, op);
    EXPECT_EQ(ev.left_id, left);
    EXPECT_EQ(ev.right_id, right);
    EXPECT_NEAR(ev.confidence, confidence, 1e-9);
}

TEST(IncrementalMatcherTest, MatchingRightRecordPairsWithLeft) {
    ReconTestHarness h(test::transfer_test_config());

    const auto first = h.apply({core::make_insert(core::Side::Left, 0, perez)});
    ASSERT_EQ(first.size(), 1u);
    expect_event(first[0], OutputOp::Upsert, 0, std::nullopt, 0.0);

    const auto second = h.apply({core::make_insert(core::Side::Right, 1, perez)});
    ASSERT_EQ(second.size(), 1u);
    expect_event(second[0], OutputOp::Upsert, 0, 1, 1.0);

    EXPECT_EQ(h.matcher().match_of_left(0), (core::Match{0, 1, 1.0}));
    EXPECT_FALSE(h.matcher().validate().has_value());
}

TEST(IncrementalMatcherTest, LeftWithoutCounterpartIsUnmatchedRow) {
    const auto result = test::run_scenario(DeltaScenarioBuilder{}
                                               .right(1, perez)
                                               .end_batch()
                                               .left(5, {{"amount", "50"}, {"recipient", "C. Baxter"}}),
                                           test::transfer_test_config());
    ASSERT_EQ(result.outputs.size(), 1u);
    expect_event(result.outputs[0], OutputOp::Upsert, 5, std::nullopt, 0.0);
    EXPECT_TRUE(result.final_matches.empty());
    ASSERT_EQ(result.final_rows.size(), 1u);
    EXPECT_FALSE(result.final_rows[0].right_id.has_value());
}

TEST(IncrementalMatcherTest, StrongerCandidateWinsContestedRight) {
    ReconTestHarness h(test::amount_only_config());
    const auto out = h.apply(DeltaScenarioBuilder{}
                                 .left_amount(1, "1001")
                                 .left_amount(2, "1004")
                                 .right_amount(3, "1000")
                                 .build()
                                 .front());
    ASSERT_EQ(out.size(), 2u);
    expect_event(out[0], OutputOp::Upsert, 1, 3, 0.9);
    expect_event(out[1], OutputOp::Upsert, 2, std::nullopt, 0.0);

    // A better counterpart for L2 arrives; L1 keeps its partner.
    const auto later = h.apply({core::make_insert(core::Side::Right, 4, {{"amount", "1004"}})});
    ASSERT_EQ(later.size(), 1u);
    expect_event(later[0], OutputOp::Upsert, 2, 4, 1.0);
    EXPECT_EQ(h.matcher().match_of_left(1)->right, 3u);
}

TEST(IncrementalMatcherTest, RemovingMatchedRightUnmatchesLeft) {
    ReconTestHarness h(test::transfer_test_config());
    h.apply({core::make_insert(core::Side::Left, 0, perez)});
    h.apply({core::make_insert(core::Side::Right, 1, perez)});

    const auto out = h.apply({core::make_remove(core::Side::Right, 1)});
    ASSERT_EQ(out.size(), 2u);
    expect_event(out[0], OutputOp::Retract, 0, 1, 1.0);
    expect_event(out[1], OutputOp::Upsert, 0, std::nullopt, 0.0);
    EXPECT_TRUE(h.matcher().matches().empty());
    EXPECT_EQ(h.matcher().candidate_edge_count(), 0u);
}

TEST(IncrementalMatcherTest, RemovingUnmatchedLeftRetiresRow) {
    ReconTestHarness h(test::amount_only_config());
    h.apply({core::make_insert(core::Side::Left, 7, {{"amount", "10"}})});
    const auto out = h.apply({core::make_remove(core::Side::Left, 7)});
    ASSERT_EQ(out.size(), 1u);
    expect_event(out[0], OutputOp::Retract, 7, std::nullopt, 0.0);
    EXPECT_EQ(h.materializer().size(), 0u);
}

TEST(IncrementalMatcherTest, DuplicateInsertAndUnknownRemoveAreNoOps) {
    ReconTestHarness h(test::transfer_test_config());
    h.apply({core::make_insert(core::Side::Left, 0, perez), core::make_insert(core::Side::Right, 1, perez)});
    const auto edges = h.matcher().candidate_edge_count();

    EXPECT_TRUE(h.apply({core::make_insert(core::Side::Left, 0, perez)}).empty());
    EXPECT_TRUE(h.apply({core::make_remove(core::Side::Right, 42)}).empty());
    EXPECT_TRUE(h.last_result().ok());

    const auto c = h.matcher().counters();
    EXPECT_EQ(c.duplicate_inserts, 1u);
    EXPECT_EQ(c.unknown_removes, 1u);
    EXPECT_EQ(h.matcher().candidate_edge_count(), edges);
    EXPECT_EQ(h.matcher().matches().size(), 1u);
}

TEST(IncrementalMatcherTest, ReplacementIsRemoveThenInsert) {
    ReconTestHarness h(test::amount_only_config());
    h.apply({core::make_insert(core::Side::Left, 0, {{"amount", "1000"}}),
             core::make_insert(core::Side::Right, 1, {{"amount", "1000"}})});

    const auto out = h.apply({core::make_insert(core::Side::Left, 0, {{"amount", "1500"}})});
    ASSERT_EQ(out.size(), 2u);
    expect_event(out[0], OutputOp::Retract, 0, 1, 1.0);
    expect_event(out[1], OutputOp::Upsert, 0, std::nullopt, 0.0);
    EXPECT_EQ(h.matcher().counters().replacements, 1u);

    const auto rec = h.matcher().find_record(core::Side::Left, 0);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(*core::find_field(rec->fields, "amount"), core::FieldValue::make_number(1500 * core::micro_units));
}

TEST(IncrementalMatcherTest, InsertAndRemoveInOneBatchLeavesNoTrace) {
    ReconTestHarness h(test::amount_only_config());
    const auto out = h.apply({core::make_insert(core::Side::Left, 3, {{"amount", "1"}}),
                              core::make_remove(core::Side::Left, 3)});
    EXPECT_TRUE(out.empty());
    EXPECT_TRUE(h.matcher().active_ids(core::Side::Left).empty());
}

TEST(IncrementalMatcherTest, UnrelatedRegionsAreUntouched) {
    ReconTestHarness h(test::amount_only_config());
    h.apply({core::make_insert(core::Side::Left, 1, {{"amount", "100"}}),
             core::make_insert(core::Side::Right, 11, {{"amount", "100"}}),
             core::make_insert(core::Side::Left, 2, {{"amount", "5000"}})});
    const auto solved_before = h.matcher().counters().region_records;

    const auto out = h.apply({core::make_insert(core::Side::Right, 12, {{"amount", "5001"}})});
    ASSERT_EQ(out.size(), 1u);
    expect_event(out[0], OutputOp::Upsert, 2, 12, 0.9);
    // Only L2 and R12 took part in the solve.
    EXPECT_EQ(h.matcher().counters().region_records - solved_before, 2u);
    EXPECT_EQ(h.matcher().match_of_left(1)->right, 11u);
}

TEST(IncrementalMatcherTest, RemovalOnlyResolvesTheRemovedNeighbourhood) {
    ReconTestHarness h(test::amount_only_config());
    h.apply({core::make_insert(core::Side::Left, 1, {{"amount", "100"}}),
             core::make_insert(core::Side::Right, 11, {{"amount", "100"}}),
             core::make_insert(core::Side::Left, 2, {{"amount", "5000"}}),
             core::make_insert(core::Side::Right, 12, {{"amount", "5001"}}),
             core::make_insert(core::Side::Right, 20, {{"amount", "9000"}})});
    ASSERT_EQ(h.matcher().match_of_left(2), (core::Match{2, 12, 0.9}));
    const auto solved_before = h.matcher().counters().region_records;

    const auto out = h.apply({core::make_remove(core::Side::Right, 12)});
    ASSERT_EQ(out.size(), 2u);
    expect_event(out[0], OutputOp::Retract, 2, 12, 0.9);
    expect_event(out[1], OutputOp::Upsert, 2, std::nullopt, 0.0);
    // L2 is the freed partner; R12 is gone, so nothing else joins the solve.
    EXPECT_EQ(h.matcher().counters().region_records - solved_before, 1u);
    EXPECT_EQ(h.matcher().match_of_left(1), (core::Match{1, 11, 1.0}));

    // An unmatched record with no candidates frees nothing.
    const auto quiet = h.apply({core::make_remove(core::Side::Right, 20)});
    EXPECT_TRUE(quiet.empty());
    EXPECT_EQ(h.matcher().counters().region_records - solved_before, 1u);
    EXPECT_EQ(h.matcher().match_of_left(1), (core::Match{1, 11, 1.0}));
    EXPECT_TRUE(h.last_result().ok());
    EXPECT_FALSE(h.matcher().validate().has_value());
}

TEST(IncrementalMatcherTest, FanOutCapKeepsLowestIdsAndBatchSucceeds) {
    auto cfg = test::amount_only_config();
    cfg.max_candidates_per_record = 2;
    ReconTestHarness h(cfg);
    EXPECT_TRUE(h.apply({core::make_insert(core::Side::Right, 10, {{"amount", "1000"}}),
                         core::make_insert(core::Side::Right, 11, {{"amount", "1001"}}),
                         core::make_insert(core::Side::Right, 12, {{"amount", "1000"}})})
                    .empty());
    EXPECT_EQ(h.matcher().counters().fanout_truncations, 0u);

    const auto out = h.apply({core::make_insert(core::Side::Left, 1, {{"amount", "1000"}})});
    EXPECT_TRUE(h.last_result().ok());
    EXPECT_EQ(h.matcher().counters().fanout_truncations, 1u);
    // R12 scores as well as R10 but falls outside the cap.
    EXPECT_EQ(h.matcher().candidate_edge_count(), 2u);
    ASSERT_EQ(out.size(), 1u);
    expect_event(out[0], OutputOp::Upsert, 1, 10, 1.0);
}

TEST(IncrementalMatcherTest, MalformedPairsAreNeverMatched) {
    ReconTestHarness h(test::transfer_test_config());
    const auto out = h.apply({core::make_insert(core::Side::Left, 1, {{"recipient", "x"}, {"acc_suffix", "12345678"}}),
                              core::make_insert(core::Side::Right, 2, {{"amount", "10"}, {"acc_suffix", "12345678"}})});
    ASSERT_EQ(out.size(), 1u);
    expect_event(out[0], OutputOp::Upsert, 1, std::nullopt, 0.0);

    const auto c = h.matcher().counters();
    EXPECT_EQ(c.malformed_records, 1u);
    EXPECT_EQ(c.malformed_pairs, 1u);
    EXPECT_EQ(h.matcher().candidate_edge_count(), 0u);
}

TEST(IncrementalMatcherTest, ThresholdChangeReSolvesKeptEdges) {
    ReconTestHarness h(test::amount_only_config(0.95));
    const auto first = h.apply({core::make_insert(core::Side::Left, 1, {{"amount", "1001"}}),
                                core::make_insert(core::Side::Right, 2, {{"amount", "1000"}})});
    ASSERT_EQ(first.size(), 1u);
    expect_event(first[0], OutputOp::Upsert, 1, std::nullopt, 0.0);
    EXPECT_EQ(h.matcher().candidate_edge_count(), 1u);

    const auto lowered = h.set_min_confidence(0.85);
    ASSERT_EQ(lowered.size(), 1u);
    expect_event(lowered[0], OutputOp::Upsert, 1, 2, 0.9);

    const auto raised = h.set_min_confidence(0.95);
    ASSERT_EQ(raised.size(), 2u);
    expect_event(raised[0], OutputOp::Retract, 1, 2, 0.9);
    expect_event(raised[1], OutputOp::Upsert, 1, std::nullopt, 0.0);

    EXPECT_THROW(h.matcher().set_min_confidence(1.5), std::invalid_argument);
    EXPECT_THROW(h.matcher().set_min_confidence(-0.1), std::invalid_argument);
    EXPECT_DOUBLE_EQ(h.matcher().min_confidence(), 0.95);
}

TEST(IncrementalMatcherTest, RejectsUnusableConfiguration) {
    auto cfg = test::amount_only_config();
    cfg.blocking.clear();
    EXPECT_THROW(core::IncrementalMatcher{cfg}, std::invalid_argument);

    cfg = test::amount_only_config();
    cfg.min_confidence = 2.0;
    EXPECT_THROW(core::IncrementalMatcher{cfg}, std::invalid_argument);
}

enum class SolverMode { Greedy, OutOfRegion, BelowThreshold, Throw };

class ScriptedSolver final : public core::IAssignmentSolver {
public:
    explicit ScriptedSolver(const SolverMode& mode) : mode_(mode) {}

    core::LocalSolution solve(const core::SolveInput& input) const override {
        core::LocalSolution out = greedy_.solve(input);
        switch (mode_) {
            case SolverMode::Greedy:
                break;
            case SolverMode::OutOfRegion:
                out.matches.push_back(core::Match{999, 998, 1.0});
                break;
            case SolverMode::BelowThreshold:
                for (auto& m : out.matches) m.confidence = 0.01;
                break;
            case SolverMode::Throw:
                throw std::runtime_error("solver exploded");
        }
        return out;
    }

private:
    const SolverMode& mode_;
    core::GreedyAssignmentSolver greedy_{};
};

class RollbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        harness_ = std::make_unique<ReconTestHarness>(test::amount_only_config(),
                                                      std::make_unique<ScriptedSolver>(mode_));
        harness_->apply({core::make_insert(core::Side::Left, 0, {{"amount", "1000"}}),
                         core::make_insert(core::Side::Right, 1, {{"amount", "1000"}})});
        ASSERT_TRUE(harness_->last_result().ok());
        baseline_ = harness_->matcher().counters();
    }

    void expect_unchanged() {
        auto& m = harness_->matcher();
        EXPECT_EQ(m.matches(), (std::vector<core::Match>{{0, 1, 1.0}}));
        EXPECT_EQ(m.active_ids(core::Side::Left), (std::vector<core::RecordId>{0}));
        EXPECT_EQ(m.active_ids(core::Side::Right), (std::vector<core::RecordId>{1}));
        EXPECT_EQ(m.candidate_edge_count(), 1u);
        EXPECT_FALSE(m.validate().has_value());

        const auto c = m.counters();
        EXPECT_EQ(c.inserts, baseline_.inserts);
        EXPECT_EQ(c.pairs_scored, baseline_.pairs_scored);
        EXPECT_EQ(c.batches_applied, baseline_.batches_applied);
        EXPECT_EQ(c.batches_rejected, baseline_.batches_rejected + 1);
        ASSERT_NE(harness_->materializer().row(0), nullptr);
        EXPECT_EQ(harness_->materializer().row(0)->right_id, 1u);
    }

    test::Batch contested_batch() const {
        return {core::make_insert(core::Side::Left, 2, {{"amount", "1001"}}),
                core::make_insert(core::Side::Right, 3, {{"amount", "1002"}}),
                core::make_remove(core::Side::Right, 1)};
    }

    SolverMode mode_{SolverMode::Greedy};
    std::unique_ptr<ReconTestHarness> harness_;
    core::MatchCounters baseline_{};
};

TEST_F(RollbackTest, MatchOutsideRegionIsStateCorruption) {
    mode_ = SolverMode::OutOfRegion;
    EXPECT_TRUE(harness_->apply(contested_batch()).empty());
    EXPECT_EQ(harness_->last_result().error, core::BatchError::StateCorruption);
    EXPECT_TRUE(harness_->last_result().diff.empty());
    expect_unchanged();
}

TEST_F(RollbackTest, MatchBelowThresholdIsStateCorruption) {
    mode_ = SolverMode::BelowThreshold;
    harness_->apply(contested_batch());
    EXPECT_EQ(harness_->last_result().status, core::BatchStatus::Rejected);
    EXPECT_EQ(harness_->last_result().error, core::BatchError::StateCorruption);
    expect_unchanged();
}

TEST_F(RollbackTest, EscapedExceptionIsInternalFault) {
    mode_ = SolverMode::Throw;
    harness_->apply(contested_batch());
    EXPECT_EQ(harness_->last_result().error, core::BatchError::InternalFault);
    EXPECT_NE(harness_->last_result().detail.find("solver exploded"), std::string::npos);
    expect_unchanged();
}

TEST_F(RollbackTest, RejectedBatchCanBeRetried) {
    mode_ = SolverMode::Throw;
    harness_->apply(contested_batch());
    ASSERT_FALSE(harness_->last_result().ok());

    mode_ = SolverMode::Greedy;
    const auto out = harness_->apply(contested_batch());
    EXPECT_TRUE(harness_->last_result().ok());
    // R1 leaves; L0 and L2 compete for R3 (0.8 and 0.9).
    ASSERT_EQ(out.size(), 3u);
    expect_event(out[0], OutputOp::Retract, 0, 1, 1.0);
    expect_event(out[1], OutputOp::Upsert, 0, std::nullopt, 0.0);
    expect_event(out[2], OutputOp::Upsert, 2, 3, 0.9);
}

TEST_F(RollbackTest, RejectedThresholdChangeKeepsOldThreshold) {
    mode_ = SolverMode::Throw;
    harness_->set_min_confidence(0.2);
    EXPECT_FALSE(harness_->last_result().ok());
    EXPECT_DOUBLE_EQ(harness_->matcher().min_confidence(), 0.5);
}

} // namespace
