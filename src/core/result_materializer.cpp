#include "core/result_materializer.hpp"

#include "util/async_log.hpp"

namespace core {

OutputEvent to_output_event(const DiffEvent& ev) noexcept {
    switch (ev.kind) {
        case DiffKind::PairAdded:
        case DiffKind::ConfidenceChanged:
            return OutputEvent{OutputOp::Upsert, ev.left, ev.right, ev.confidence};
        case DiffKind::PairRemoved:
            return OutputEvent{OutputOp::Retract, ev.left, ev.right, ev.confidence};
        case DiffKind::LeftUnmatched:
            return OutputEvent{OutputOp::Upsert, ev.left, std::nullopt, 0.0};
        case DiffKind::LeftRetired:
            return OutputEvent{OutputOp::Retract, ev.left, std::nullopt, 0.0};
    }
    return OutputEvent{OutputOp::Retract, ev.left, std::nullopt, 0.0};
}

std::vector<OutputEvent> ResultMaterializer::apply(const std::vector<DiffEvent>& diff) {
    std::vector<OutputEvent> out;
    out.reserve(diff.size());
    apply(diff, out);
    return out;
}

void ResultMaterializer::apply(const std::vector<DiffEvent>& diff, std::vector<OutputEvent>& out) {
    for (const auto& ev : diff) {
        const auto it = rows_.find(ev.left);
        bool consistent = true;

        switch (ev.kind) {
            case DiffKind::PairAdded:
                rows_.insert_or_assign(ev.left, OutputRow{ev.left, ev.right, ev.confidence});
                break;
            case DiffKind::ConfidenceChanged:
                consistent = it != rows_.end() && it->second.right_id == ev.right;
                rows_.insert_or_assign(ev.left, OutputRow{ev.left, ev.right, ev.confidence});
                break;
            case DiffKind::PairRemoved:
                // A following LeftUnmatched or PairAdded for the same left re-creates the row.
                consistent = it != rows_.end() && it->second.right_id == ev.right;
                if (it != rows_.end()) rows_.erase(it);
                break;
            case DiffKind::LeftUnmatched:
                rows_.insert_or_assign(ev.left, OutputRow{ev.left, std::nullopt, 0.0});
                break;
            case DiffKind::LeftRetired:
                consistent = it != rows_.end() && !it->second.right_id;
                if (it != rows_.end()) rows_.erase(it);
                break;
        }

        if (!consistent) {
            ++counters_.inconsistent_diffs;
            LOG_HOT_WARN("diff does not fit materialized row", ev.left, static_cast<std::uint64_t>(ev.kind));
        }

        const OutputEvent oe = to_output_event(ev);
        if (oe.op == OutputOp::Upsert) {
            ++counters_.upserts;
        } else {
            ++counters_.retracts;
        }
        out.push_back(oe);
    }
}

std::vector<OutputRow> ResultMaterializer::snapshot() const {
    std::vector<OutputRow> out;
    out.reserve(rows_.size());
    for (const auto& [left, row] : rows_) {
        out.push_back(row);
    }
    return out;
}

const OutputRow* ResultMaterializer::row(RecordId left) const noexcept {
    const auto it = rows_.find(left);
    return it == rows_.end() ? nullptr : &it->second;
}

} // namespace core
