#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/field_value.hpp"

namespace core {

using BlockingKey = std::uint64_t;

enum class BlockingKind : std::uint8_t {
    Exact,         // whole normalized value
    NumericBucket, // floor(number / width currency units); probes neighbours
    DateBucket,    // floor(days / width); probes neighbours
    Suffix,        // last `width` characters of text/digits
    Prefix,        // first `width` characters of text/digits
    Token          // every whitespace token of a text value, tokens shorter than `width` ignored
};

struct BlockingKeyRule {
    std::string left_field;
    std::string right_field;
    BlockingKind kind{BlockingKind::Exact};
    double width{1.0};
};

// A derived key together with the rule that produced it. The rule index is folded
// into the hash as well, so keys from different rules never collide by construction
// of their inputs; hash collisions only ever add candidates.
struct DerivedKey {
    BlockingKey key{0};
    std::uint32_t rule{0};

    bool operator==(const DerivedKey&) const = default;
};

// Keys a record is stored under on its own side.
std::vector<DerivedKey> derive_index_keys(const std::vector<BlockingKeyRule>& rules, const Record& rec);

// Keys a record looks up on the opposite side: index keys plus neighbour buckets for
// bucket kinds, so |bucket(l) - bucket(r)| <= 1 is discovered from either direction.
std::vector<DerivedKey> derive_probe_keys(const std::vector<BlockingKeyRule>& rules, const Record& rec);

// Inverted index for one side: blocking key -> record ids, plus the reverse map so a
// removed record is purged from exactly the keys it was stored under.
// Single writer (the matcher); not thread-safe.
class BlockingIndex {
public:
    BlockingIndex() = default;

    // Replaces any previous entry for `id`.
    void add(RecordId id, std::vector<DerivedKey> keys);
    // Returns the keys the record was stored under (empty if unknown).
    std::vector<DerivedKey> remove(RecordId id);

    const std::vector<RecordId>* lookup(BlockingKey key) const noexcept;
    const std::vector<DerivedKey>* keys_of(RecordId id) const noexcept;

    bool contains(RecordId id) const noexcept { return by_record_.contains(id); }
    std::size_t record_count() const noexcept { return by_record_.size(); }
    std::size_t key_count() const noexcept { return by_key_.size(); }

private:
    std::unordered_map<BlockingKey, std::vector<RecordId>> by_key_;
    std::unordered_map<RecordId, std::vector<DerivedKey>> by_record_;
};

} // namespace core
