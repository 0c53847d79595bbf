#include "core/assignment.hpp"

namespace core {

bool Assignment::match(RecordId left, RecordId right, double confidence) {
    if (by_left_.contains(left) || by_right_.contains(right)) {
        return false;
    }
    by_left_.emplace(left, Match{left, right, confidence});
    by_right_.emplace(right, left);
    return true;
}

std::optional<Match> Assignment::unmatch_left(RecordId left) {
    auto it = by_left_.find(left);
    if (it == by_left_.end()) return std::nullopt;
    const Match m = it->second;
    by_left_.erase(it);
    by_right_.erase(m.right);
    return m;
}

const Match* Assignment::by_left(RecordId left) const noexcept {
    const auto it = by_left_.find(left);
    return it == by_left_.end() ? nullptr : &it->second;
}

std::optional<RecordId> Assignment::left_of(RecordId right) const noexcept {
    const auto it = by_right_.find(right);
    if (it == by_right_.end()) return std::nullopt;
    return it->second;
}

std::optional<RecordId> Assignment::partner(Side side, RecordId id) const noexcept {
    if (side == Side::Right) return left_of(id);
    const Match* m = by_left(id);
    if (!m) return std::nullopt;
    return m->right;
}

std::vector<Match> Assignment::matches() const {
    std::vector<Match> out;
    out.reserve(by_left_.size());
    for (const auto& [left, m] : by_left_) {
        out.push_back(m);
    }
    return out;
}

std::optional<std::string> Assignment::validate() const {
    if (by_left_.size() != by_right_.size()) {
        return "assignment maps disagree: " + std::to_string(by_left_.size()) + " left slots, " +
               std::to_string(by_right_.size()) + " right slots";
    }
    for (const auto& [left, m] : by_left_) {
        if (m.left != left) {
            return "left slot " + std::to_string(left) + " holds match for " + std::to_string(m.left);
        }
        const auto it = by_right_.find(m.right);
        if (it == by_right_.end() || it->second != left) {
            return "right " + std::to_string(m.right) + " is not matched back to left " + std::to_string(left);
        }
        if (!(m.confidence > 0.0) || m.confidence > 1.0) {
            return "match (" + std::to_string(left) + "," + std::to_string(m.right) +
                   ") has confidence outside (0, 1]";
        }
    }
    return std::nullopt;
}

} // namespace core
