#include "core/candidate_generator.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

namespace core {

CandidateGenerator::CandidateGenerator(std::vector<BlockingKeyRule> rules, std::size_t max_candidates_per_record)
    : rules_(std::move(rules)), max_candidates_(max_candidates_per_record) {
    if (rules_.empty()) {
        throw std::invalid_argument("CandidateGenerator requires at least one blocking rule");
    }
    if (max_candidates_ == 0) {
        throw std::invalid_argument("max_candidates_per_record must be > 0");
    }
    for (const auto& rule : rules_) {
        if (rule.left_field.empty() || rule.right_field.empty()) {
            throw std::invalid_argument("BlockingKeyRule field names must not be empty");
        }
        if (!(rule.width > 0.0)) {
            throw std::invalid_argument("BlockingKeyRule width must be > 0 for " + rule.left_field);
        }
    }
}

CandidateDelta CandidateGenerator::on_insert(const Record& rec) {
    index_mut(rec.side).add(rec.id, derive_index_keys(rules_, rec));

    const BlockingIndex& other_side = index(opposite(rec.side));
    const std::vector<DerivedKey> probes = derive_probe_keys(rules_, rec);

    // Pre-score: number of distinct rules shared with the opposite record.
    std::unordered_map<RecordId, std::uint32_t> shared_rules;
    std::unordered_set<RecordId> hit_this_rule;
    std::size_t i = 0;
    while (i < probes.size()) {
        const std::uint32_t rule = probes[i].rule;
        hit_this_rule.clear();
        for (; i < probes.size() && probes[i].rule == rule; ++i) {
            const std::vector<RecordId>* ids = other_side.lookup(probes[i].key);
            if (!ids) continue;
            hit_this_rule.insert(ids->begin(), ids->end());
        }
        for (const RecordId id : hit_this_rule) {
            ++shared_rules[id];
        }
    }

    std::vector<std::pair<RecordId, std::uint32_t>> ranked(shared_rules.begin(), shared_rules.end());
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    CandidateDelta delta;
    delta.considered = ranked.size();
    if (ranked.size() > max_candidates_) {
        ranked.resize(max_candidates_);
        delta.truncated = true;
    }
    delta.added.reserve(ranked.size());
    for (const auto& entry : ranked) {
        if (rec.side == Side::Left) {
            delta.added.emplace_back(rec.id, entry.first);
        } else {
            delta.added.emplace_back(entry.first, rec.id);
        }
    }
    return delta;
}

std::vector<DerivedKey> CandidateGenerator::on_remove(Side side, RecordId id) {
    return index_mut(side).remove(id);
}

void CandidateGenerator::restore(const Record& rec) {
    index_mut(rec.side).add(rec.id, derive_index_keys(rules_, rec));
}

} // namespace core
