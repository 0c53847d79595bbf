#include "core/candidate_graph.hpp"

namespace core {

bool CandidateGraph::add(RecordId left, RecordId right, double confidence) {
    auto& out = left_adj_[left];
    if (!out.emplace(right, confidence).second) {
        return false;
    }
    right_adj_[right].emplace(left, confidence);
    ++edges_;
    return true;
}

std::optional<double> CandidateGraph::remove(RecordId left, RecordId right) {
    auto lit = left_adj_.find(left);
    if (lit == left_adj_.end()) return std::nullopt;
    auto eit = lit->second.find(right);
    if (eit == lit->second.end()) return std::nullopt;

    const double conf = eit->second;
    lit->second.erase(eit);
    if (lit->second.empty()) left_adj_.erase(lit);

    auto rit = right_adj_.find(right);
    if (rit != right_adj_.end()) {
        rit->second.erase(left);
        if (rit->second.empty()) right_adj_.erase(rit);
    }
    --edges_;
    return conf;
}

std::vector<CandidateEdge> CandidateGraph::edges_of(Side side, RecordId id) const {
    std::vector<CandidateEdge> out;
    const Adjacency* adj = neighbours(side, id);
    if (!adj) return out;
    out.reserve(adj->size());
    for (const auto& [other, conf] : *adj) {
        if (side == Side::Left) {
            out.push_back(CandidateEdge{id, other, conf});
        } else {
            out.push_back(CandidateEdge{other, id, conf});
        }
    }
    return out;
}

std::optional<double> CandidateGraph::confidence(RecordId left, RecordId right) const noexcept {
    const auto lit = left_adj_.find(left);
    if (lit == left_adj_.end()) return std::nullopt;
    const auto eit = lit->second.find(right);
    if (eit == lit->second.end()) return std::nullopt;
    return eit->second;
}

const CandidateGraph::Adjacency* CandidateGraph::neighbours(Side side, RecordId id) const noexcept {
    const auto& map = side == Side::Left ? left_adj_ : right_adj_;
    const auto it = map.find(id);
    return it == map.end() ? nullptr : &it->second;
}

} // namespace core
