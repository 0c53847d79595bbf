#pragma once

#include <memory>
#include <vector>

#include "core/assignment.hpp"
#include "core/assignment_solver.hpp"
#include "core/delta_event.hpp"
#include "core/incremental_matcher.hpp"
#include "core/recon_config.hpp"
#include "core/result_materializer.hpp"
#include "tests/harness/scenario_builder.hpp"

namespace test {

struct ScenarioResult {
    std::vector<core::OutputEvent> outputs;            // every output event, in order
    std::vector<std::vector<core::OutputEvent>> per_batch;
    std::vector<core::BatchResult> batch_results;
    std::vector<core::Match> final_matches;
    std::vector<core::OutputRow> final_rows;
    core::MatchCounters counters;
};

// Owns a matcher and a materializer; every applied batch is materialized immediately.
class ReconTestHarness {
public:
    explicit ReconTestHarness(const core::ReconConfig& config,
                              std::unique_ptr<core::IAssignmentSolver> solver = nullptr)
        : matcher_(config, std::move(solver)) {}

    std::vector<core::OutputEvent> apply(const Batch& batch) {
        last_ = matcher_.apply_batch(batch);
        return materialize(last_);
    }

    std::vector<core::OutputEvent> set_min_confidence(double tau) {
        last_ = matcher_.set_min_confidence(tau);
        return materialize(last_);
    }

    const core::BatchResult& last_result() const { return last_; }
    core::IncrementalMatcher& matcher() { return matcher_; }
    core::ResultMaterializer& materializer() { return materializer_; }

private:
    std::vector<core::OutputEvent> materialize(const core::BatchResult& result) {
        if (!result.ok()) {
            return {};
        }
        return materializer_.apply(result.diff);
    }

    core::IncrementalMatcher matcher_;
    core::ResultMaterializer materializer_;
    core::BatchResult last_{};
};

inline ScenarioResult run_scenario(const std::vector<Batch>& batches, const core::ReconConfig& config) {
    ReconTestHarness harness(config);
    ScenarioResult result;
    for (const auto& batch : batches) {
        auto out = harness.apply(batch);
        result.outputs.insert(result.outputs.end(), out.begin(), out.end());
        result.per_batch.push_back(std::move(out));
        result.batch_results.push_back(harness.last_result());
    }
    result.final_matches = harness.matcher().matches();
    result.final_rows = harness.materializer().snapshot();
    result.counters = harness.matcher().counters();
    return result;
}

inline ScenarioResult run_scenario(const DeltaScenarioBuilder& scenario, const core::ReconConfig& config) {
    return run_scenario(scenario.build(), config);
}

inline core::OutputEvent upsert(core::RecordId left, std::optional<core::RecordId> right, double confidence) {
    return core::OutputEvent{core::OutputOp::Upsert, left, right, confidence};
}

inline core::OutputEvent retract(core::RecordId left, std::optional<core::RecordId> right, double confidence) {
    return core::OutputEvent{core::OutputOp::Retract, left, right, confidence};
}

} // namespace test
