#include "core/assignment_diff.hpp"

namespace core {

void append_slot_diff(RecordId left, const LeftSlot& before, const LeftSlot& after,
                      std::vector<DiffEvent>& out) {
    if (before == after) return;

    const bool was_matched = before.active && before.right.has_value();
    const bool is_matched = after.active && after.right.has_value();

    if (was_matched && is_matched && *before.right == *after.right) {
        out.push_back(DiffEvent{DiffKind::ConfidenceChanged, left, after.right, after.confidence,
                                before.confidence});
        return;
    }

    if (was_matched) {
        out.push_back(DiffEvent{DiffKind::PairRemoved, left, before.right, before.confidence, 0.0});
    }

    if (is_matched) {
        out.push_back(DiffEvent{DiffKind::PairAdded, left, after.right, after.confidence, 0.0});
    } else if (after.active) {
        out.push_back(DiffEvent{DiffKind::LeftUnmatched, left, std::nullopt, 0.0, 0.0});
    } else if (before.active && !was_matched) {
        out.push_back(DiffEvent{DiffKind::LeftRetired, left, std::nullopt, 0.0, 0.0});
    }
}

} // namespace core
