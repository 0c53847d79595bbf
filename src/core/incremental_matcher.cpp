#include "core/incremental_matcher.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "util/async_log.hpp"
#include "util/log.hpp"

namespace core {
namespace {

// Raised inside a batch when applying the solver's result would break the one-to-one
// matching or locality; turned into a StateCorruption rejection.
class StateCorruptionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

inline std::size_t side_index(Side s) noexcept { return s == Side::Left ? 0 : 1; }

ReconConfig checked(ReconConfig cfg) {
    const std::string err = validate_recon_config(cfg);
    if (!err.empty()) {
        throw std::invalid_argument("ReconConfig: " + err);
    }
    return cfg;
}

std::string pair_text(RecordId left, RecordId right) {
    return "(" + std::to_string(left) + "," + std::to_string(right) + ")";
}

} // namespace

IncrementalMatcher::IncrementalMatcher(ReconConfig cfg, std::unique_ptr<IAssignmentSolver> solver)
    : cfg_(checked(std::move(cfg))),
      min_confidence_(cfg_.min_confidence),
      normalizer_(cfg_.left_schema, cfg_.right_schema),
      scorer_(cfg_.scorer),
      generator_(cfg_.blocking, cfg_.max_candidates_per_record),
      pool_(cfg_.scoring_threads, cfg_.parallel_scoring_min_pairs),
      solver_(solver ? std::move(solver) : std::make_unique<GreedyAssignmentSolver>()) {}

BatchResult IncrementalMatcher::apply_batch(const std::vector<DeltaEvent>& events) {
    std::lock_guard<std::mutex> lock(mtx_);
    return run_locked(events, false);
}

BatchResult IncrementalMatcher::set_min_confidence(double tau) {
    if (!(tau >= 0.0 && tau <= 1.0)) {
        throw std::invalid_argument("min_confidence must be in [0, 1]");
    }
    std::lock_guard<std::mutex> lock(mtx_);
    const double previous = min_confidence_;
    min_confidence_ = tau;
    BatchResult result = run_locked({}, true);
    if (!result.ok()) {
        min_confidence_ = previous;
    } else {
        LOG_SLOW_INFO("min_confidence %.4f -> %.4f, %zu diff events", previous, tau, result.diff.size());
    }
    return result;
}

BatchResult IncrementalMatcher::run_locked(const std::vector<DeltaEvent>& events, bool full_resolve) {
    const MatchCounters saved = counters_;
    BatchScratch scratch;
    BatchResult result;
    region_lefts_.clear();
    region_rights_.clear();
    journal_.begin();

    auto reject = [&](BatchError error, std::string detail) {
        rollback();
        counters_ = saved;
        ++counters_.batches_rejected;
        LOG_SLOW_ERROR("batch of %zu events rejected (%s): %s", events.size(), to_string(error), detail.c_str());
        return BatchResult{BatchStatus::Rejected, error, std::move(detail), {}};
    };

    try {
        for (const auto& ev : events) {
            apply_event(ev, scratch);
        }
        score_pending(scratch);
        resolve_region(scratch, full_resolve);

        std::optional<std::string> violation = validate_ids(region_lefts_, region_rights_);
        if (!violation && cfg_.validate_full_state) {
            violation = validate_locked();
        }
        if (violation) {
            return reject(BatchError::StateCorruption, std::move(*violation));
        }

        for (const auto& [left, before] : scratch.before) {
            append_slot_diff(left, before, slot_of(left), result.diff);
        }
    } catch (const StateCorruptionError& ex) {
        return reject(BatchError::StateCorruption, ex.what());
    } catch (const std::exception& ex) {
        return reject(BatchError::InternalFault, ex.what());
    }

    journal_.commit();
    ++counters_.batches_applied;
    counters_.diff_events += result.diff.size();
    return result;
}

void IncrementalMatcher::apply_event(const DeltaEvent& ev, BatchScratch& scratch) {
    RecordMap& recs = records(ev.side);

    if (ev.op == DeltaOp::Remove) {
        if (!recs.contains(ev.id)) {
            ++counters_.unknown_removes;
            return;
        }
        ++counters_.removes;
        remove_record(ev.side, ev.id, scratch);
        return;
    }

    Record rec = normalizer_.normalize(ev);
    const auto it = recs.find(ev.id);
    if (it != recs.end()) {
        if (it->second == rec) {
            ++counters_.duplicate_inserts;
            return;
        }
        ++counters_.replacements;
        remove_record(ev.side, ev.id, scratch);
    }

    if (rec.malformed) {
        ++counters_.malformed_records;
        LOG_HOT_WARN("malformed record indexed", static_cast<std::uint64_t>(side_index(ev.side)), ev.id);
    }
    ++counters_.inserts;
    insert_record(std::move(rec), scratch);
}

void IncrementalMatcher::insert_record(Record rec, BatchScratch& scratch) {
    const Side side = rec.side;
    const RecordId id = rec.id;
    if (side == Side::Left) {
        touch_left(id, scratch);
    }

    journal_.record_inserted(side, id);
    const auto [it, inserted] = records(side).emplace(id, std::move(rec));
    if (!inserted) {
        throw StateCorruptionError("record " + std::string(to_string(side)) + std::to_string(id) +
                                   " inserted while still active");
    }

    const CandidateDelta delta = generator_.on_insert(it->second);
    if (delta.truncated) {
        ++counters_.fanout_truncations;
        LOG_WARM_FMT(::util::LogLevel::Warn, ::util::LogChannel::Match, "fan-out cap on %s%llu: %zu candidates, kept %zu",
                     to_string(side), static_cast<unsigned long long>(id), delta.considered, delta.added.size());
    }
    scratch.pending.insert(delta.added.begin(), delta.added.end());
    scratch.seeds[side_index(side)].insert(id);
}

void IncrementalMatcher::remove_record(Side side, RecordId id, BatchScratch& scratch) {
    if (side == Side::Left) {
        touch_left(id, scratch);
    }

    if (const auto partner = assignment_.partner(side, id)) {
        const RecordId left = side == Side::Left ? id : *partner;
        clear_match(left, scratch);
        ++counters_.matches_released;
        // The freed partner re-enters the next solve.
        scratch.seeds[side_index(opposite(side))].insert(*partner);
    }

    for (const auto& edge : graph_.edges_of(side, id)) {
        journal_.edge_removed(edge.left, edge.right, edge.confidence);
        graph_.remove(edge.left, edge.right);
    }

    RecordMap& recs = records(side);
    const auto it = recs.find(id);
    if (it == recs.end()) {
        return;
    }
    journal_.record_erased(it->second);
    generator_.on_remove(side, id);
    recs.erase(it);

    scratch.seeds[side_index(side)].erase(id);
    std::erase_if(scratch.pending, [side, id](const CandidateKey& k) {
        return side == Side::Left ? k.first == id : k.second == id;
    });
}

void IncrementalMatcher::score_pending(BatchScratch& scratch) {
    if (scratch.pending.empty()) return;

    std::vector<ScoringTask> tasks;
    std::vector<CandidateKey> keys;
    tasks.reserve(scratch.pending.size());
    keys.reserve(scratch.pending.size());
    for (const auto& key : scratch.pending) {
        const auto l = left_records_.find(key.first);
        const auto r = right_records_.find(key.second);
        if (l == left_records_.end() || r == right_records_.end()) continue;
        if (graph_.confidence(key.first, key.second)) continue;
        tasks.push_back(ScoringTask{&l->second, &r->second});
        keys.push_back(key);
    }

    std::vector<ScoreOutcome> outcomes;
    pool_.score(scorer_, tasks, outcomes);
    counters_.pairs_scored += tasks.size();

    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (!outcomes[i].ok()) {
            ++counters_.malformed_pairs;
            LOG_HOT_DEBUG("malformed pair dropped", keys[i].first, keys[i].second);
            continue;
        }
        journal_.edge_added(keys[i].first, keys[i].second);
        graph_.add(keys[i].first, keys[i].second, outcomes[i].confidence);
    }
}

void IncrementalMatcher::resolve_region(BatchScratch& scratch, bool full_resolve) {
    std::set<RecordId> lefts;
    std::set<RecordId> rights;

    auto add_with_partner = [&](Side side, RecordId id) {
        auto& own = side == Side::Left ? lefts : rights;
        if (!own.insert(id).second) return;
        if (const auto p = assignment_.partner(side, id)) {
            (side == Side::Left ? rights : lefts).insert(*p);
        }
    };

    if (full_resolve) {
        for (const auto& [id, rec] : left_records_) lefts.insert(id);
        for (const auto& [id, rec] : right_records_) rights.insert(id);
    } else {
        for (const Side side : {Side::Left, Side::Right}) {
            for (const RecordId seed : scratch.seeds[side_index(side)]) {
                if (!records(side).contains(seed)) continue;
                add_with_partner(side, seed);
                const CandidateGraph::Adjacency* adj = graph_.neighbours(side, seed);
                if (!adj) continue;
                for (const auto& [other, conf] : *adj) {
                    if (conf >= min_confidence_) {
                        add_with_partner(opposite(side), other);
                    }
                }
            }
        }
    }

    region_lefts_.assign(lefts.begin(), lefts.end());
    region_rights_.assign(rights.begin(), rights.end());
    if (lefts.empty() && rights.empty()) {
        return;
    }

    SolveInput input;
    input.min_confidence = min_confidence_;
    input.lefts = region_lefts_;
    input.rights = region_rights_;
    for (const RecordId left : region_lefts_) {
        if (const CandidateGraph::Adjacency* adj = graph_.neighbours(Side::Left, left)) {
            for (const auto& [right, conf] : *adj) {
                if (rights.contains(right)) {
                    input.edges.push_back(CandidateEdge{left, right, conf});
                }
            }
        }
        if (const Match* m = assignment_.by_left(left)) {
            input.current.push_back(*m);
        }
    }

    LocalSolution solution = solver_->solve(input);
    ++counters_.regions_solved;
    counters_.region_records += lefts.size() + rights.size();

    for (const auto& m : solution.matches) {
        if (!lefts.contains(m.left) || !rights.contains(m.right)) {
            throw StateCorruptionError("solver matched " + pair_text(m.left, m.right) +
                                       " outside the affected region");
        }
    }

    auto in_solution = [&solution](const Match& m) {
        return std::find(solution.matches.begin(), solution.matches.end(), m) != solution.matches.end();
    };

    for (const auto& cur : input.current) {
        if (!in_solution(cur)) {
            clear_match(cur.left, scratch);
            ++counters_.matches_released;
        }
    }
    for (const auto& m : solution.matches) {
        const Match* existing = assignment_.by_left(m.left);
        if (existing && *existing == m) continue;
        set_match(m.left, m.right, m.confidence, scratch);
    }
}

void IncrementalMatcher::set_match(RecordId left, RecordId right, double confidence, BatchScratch& scratch) {
    if (assignment_.by_left(left) || assignment_.left_of(right)) {
        throw StateCorruptionError("pair " + pair_text(left, right) + " would match an endpoint twice");
    }
    touch_left(left, scratch);
    journal_.matched(left, right, confidence);
    assignment_.match(left, right, confidence);
}

void IncrementalMatcher::clear_match(RecordId left, BatchScratch& scratch) {
    const Match* m = assignment_.by_left(left);
    if (!m) return;
    touch_left(left, scratch);
    journal_.unmatched(m->left, m->right, m->confidence);
    assignment_.unmatch_left(left);
}

void IncrementalMatcher::touch_left(RecordId left, BatchScratch& scratch) {
    if (!scratch.before.contains(left)) {
        scratch.before.emplace(left, slot_of(left));
    }
}

LeftSlot IncrementalMatcher::slot_of(RecordId left) const {
    LeftSlot slot;
    slot.active = left_records_.contains(left);
    if (const Match* m = assignment_.by_left(left)) {
        slot.right = m->right;
        slot.confidence = m->confidence;
    }
    return slot;
}

std::optional<std::string> IncrementalMatcher::validate_ids(const std::vector<RecordId>& lefts,
                                                            const std::vector<RecordId>& rights) const {
    for (const RecordId left : lefts) {
        const Match* m = assignment_.by_left(left);
        if (!m) continue;
        const std::string pair = pair_text(left, m->right);
        if (!left_records_.contains(left)) {
            return "match " + pair + " holds an inactive left record";
        }
        if (!right_records_.contains(m->right)) {
            return "match " + pair + " holds an inactive right record";
        }
        const auto back = assignment_.left_of(m->right);
        if (!back || *back != left) {
            return "match " + pair + " is not one-to-one";
        }
        if (!(m->confidence > 0.0) || m->confidence > 1.0 || m->confidence < min_confidence_) {
            return "match " + pair + " confidence " + std::to_string(m->confidence) + " outside [tau, 1]";
        }
        const auto edge = graph_.confidence(left, m->right);
        if (!edge || *edge != m->confidence) {
            return "match " + pair + " is not a scored candidate pair";
        }
    }
    for (const RecordId right : rights) {
        const auto left = assignment_.left_of(right);
        if (!left) continue;
        const Match* m = assignment_.by_left(*left);
        if (!m || m->right != right) {
            return "right " + std::to_string(right) + " maps to left " + std::to_string(*left) +
                   " which does not map back";
        }
    }
    return std::nullopt;
}

std::optional<std::string> IncrementalMatcher::validate_locked() const {
    if (auto err = assignment_.validate()) {
        return err;
    }
    std::vector<RecordId> lefts;
    std::vector<RecordId> rights;
    for (const auto& m : assignment_.matches()) {
        lefts.push_back(m.left);
        rights.push_back(m.right);
    }
    return validate_ids(lefts, rights);
}

std::optional<std::string> IncrementalMatcher::validate() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return validate_locked();
}

void IncrementalMatcher::rollback() {
    std::vector<JournalEntry> entries = journal_.take();
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        JournalEntry& e = *it;
        switch (e.op) {
            case JournalOp::RecordInserted:
                generator_.on_remove(e.side, e.left);
                records(e.side).erase(e.left);
                break;
            case JournalOp::RecordErased:
                generator_.restore(e.record);
                records(e.side).insert_or_assign(e.left, std::move(e.record));
                break;
            case JournalOp::EdgeAdded:
                graph_.remove(e.left, e.right);
                break;
            case JournalOp::EdgeRemoved:
                graph_.add(e.left, e.right, e.confidence);
                break;
            case JournalOp::Matched:
                assignment_.unmatch_left(e.left);
                break;
            case JournalOp::Unmatched:
                assignment_.match(e.left, e.right, e.confidence);
                break;
        }
    }
    region_lefts_.clear();
    region_rights_.clear();
}

double IncrementalMatcher::min_confidence() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return min_confidence_;
}

std::vector<Match> IncrementalMatcher::matches() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return assignment_.matches();
}

std::vector<RecordId> IncrementalMatcher::active_ids(Side side) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<RecordId> ids;
    ids.reserve(records(side).size());
    for (const auto& [id, rec] : records(side)) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::optional<Record> IncrementalMatcher::find_record(Side side, RecordId id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = records(side).find(id);
    if (it == records(side).end()) return std::nullopt;
    return it->second;
}

std::optional<Match> IncrementalMatcher::match_of_left(RecordId left) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const Match* m = assignment_.by_left(left);
    if (!m) return std::nullopt;
    return *m;
}

std::size_t IncrementalMatcher::candidate_edge_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return graph_.edge_count();
}

MatchCounters IncrementalMatcher::counters() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return counters_;
}

} // namespace core
