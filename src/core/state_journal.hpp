#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "core/field_value.hpp"

namespace core {

enum class JournalOp : std::uint8_t {
    RecordInserted, // undo: erase record and its index entries
    RecordErased,   // undo: restore record and re-derive its index entries
    EdgeAdded,      // undo: remove edge
    EdgeRemoved,    // undo: re-add edge with its confidence
    Matched,        // undo: unmatch left
    Unmatched       // undo: re-match with the old confidence
};

struct JournalEntry {
    JournalOp op{JournalOp::RecordInserted};
    Side side{Side::Left};
    RecordId left{0};     // record id for record entries
    RecordId right{0};
    double confidence{0.0};
    Record record{};      // RecordErased only
};

// Undo log for one batch. Entries are replayed in reverse by the owner on rollback;
// commit simply forgets them. Index keys are not journaled: they are a pure function
// of the record and the blocking rules.
class StateJournal {
public:
    void begin() noexcept { entries_.clear(); open_ = true; }
    void commit() noexcept { entries_.clear(); open_ = false; }

    bool open() const noexcept { return open_; }
    std::size_t size() const noexcept { return entries_.size(); }

    void record_inserted(Side side, RecordId id) {
        if (open_) entries_.push_back(JournalEntry{JournalOp::RecordInserted, side, id, 0, 0.0, {}});
    }
    void record_erased(Record rec) {
        if (!open_) return;
        const Side side = rec.side;
        const RecordId id = rec.id;
        entries_.push_back(JournalEntry{JournalOp::RecordErased, side, id, 0, 0.0, std::move(rec)});
    }
    void edge_added(RecordId left, RecordId right) {
        if (open_) entries_.push_back(JournalEntry{JournalOp::EdgeAdded, Side::Left, left, right, 0.0, {}});
    }
    void edge_removed(RecordId left, RecordId right, double confidence) {
        if (open_) entries_.push_back(JournalEntry{JournalOp::EdgeRemoved, Side::Left, left, right, confidence, {}});
    }
    void matched(RecordId left, RecordId right, double confidence) {
        if (open_) entries_.push_back(JournalEntry{JournalOp::Matched, Side::Left, left, right, confidence, {}});
    }
    void unmatched(RecordId left, RecordId right, double confidence) {
        if (open_) entries_.push_back(JournalEntry{JournalOp::Unmatched, Side::Left, left, right, confidence, {}});
    }

    // Hands the entries over for reverse replay and closes the journal.
    std::vector<JournalEntry> take() noexcept {
        open_ = false;
        return std::exchange(entries_, {});
    }

private:
    std::vector<JournalEntry> entries_;
    bool open_{false};
};

} // namespace core
