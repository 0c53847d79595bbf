#include "core/blocking_index.hpp"

#include <algorithm>
#include <cmath>
#include <string_view>

namespace core {
namespace {

constexpr std::uint64_t fnv_offset = 1469598103934665603ull;
constexpr std::uint64_t fnv_prime = 1099511628211ull;

inline std::uint64_t fnv1a(std::uint64_t h, std::string_view bytes) noexcept {
    for (const char c : bytes) {
        h ^= static_cast<unsigned char>(c);
        h *= fnv_prime;
    }
    return h;
}

inline std::uint64_t fnv1a_u64(std::uint64_t h, std::uint64_t v) noexcept {
    for (int i = 0; i < 8; ++i) {
        h ^= (v >> (i * 8)) & 0xFFu;
        h *= fnv_prime;
    }
    return h;
}

inline DerivedKey make_key(std::uint32_t rule, std::string_view text) noexcept {
    std::uint64_t h = fnv1a_u64(fnv_offset, rule);
    h = fnv1a(h, text);
    return DerivedKey{h, rule};
}

inline DerivedKey make_bucket_key(std::uint32_t rule, std::int64_t bucket) noexcept {
    std::uint64_t h = fnv1a_u64(fnv_offset, rule);
    h = fnv1a(h, "#");
    h = fnv1a_u64(h, static_cast<std::uint64_t>(bucket));
    return DerivedKey{h, rule};
}

inline bool has_text(const FieldValue& v) noexcept {
    return v.kind == FieldKind::Text || v.kind == FieldKind::Digits;
}

std::size_t width_chars(double width) noexcept {
    if (!(width >= 1.0)) return 1;
    return static_cast<std::size_t>(width);
}

// Bucket index for a numeric value, or false when the value kind does not fit the rule.
bool bucket_of(const BlockingKeyRule& rule, const FieldValue& v, std::int64_t& out) noexcept {
    double scaled = 0.0;
    if (rule.kind == BlockingKind::NumericBucket) {
        if (v.kind != FieldKind::Number) return false;
        scaled = static_cast<double>(v.integer) / static_cast<double>(micro_units);
    } else {
        if (v.kind != FieldKind::Date) return false;
        scaled = static_cast<double>(v.integer);
    }
    const double width = rule.width > 0.0 ? rule.width : 1.0;
    out = static_cast<std::int64_t>(std::floor(scaled / width));
    return true;
}

const FieldValue* rule_field(const BlockingKeyRule& rule, const Record& rec) noexcept {
    const std::string& name = rec.side == Side::Left ? rule.left_field : rule.right_field;
    const FieldValue* v = find_field(rec.fields, name);
    if (!v || v->kind == FieldKind::Invalid) return nullptr;
    return v;
}

void push_unique(std::vector<DerivedKey>& keys, DerivedKey k) {
    if (std::find(keys.begin(), keys.end(), k) == keys.end()) keys.push_back(k);
}

void derive_keys(const std::vector<BlockingKeyRule>& rules, const Record& rec,
                 bool probe, std::vector<DerivedKey>& out) {
    for (std::uint32_t i = 0; i < rules.size(); ++i) {
        const BlockingKeyRule& rule = rules[i];
        const FieldValue* v = rule_field(rule, rec);
        if (!v) continue;

        switch (rule.kind) {
            case BlockingKind::Exact:
                if (has_text(*v)) {
                    if (!v->text.empty()) push_unique(out, make_key(i, v->text));
                } else {
                    push_unique(out, make_bucket_key(i, v->integer));
                }
                break;

            case BlockingKind::NumericBucket:
            case BlockingKind::DateBucket: {
                std::int64_t b = 0;
                if (!bucket_of(rule, *v, b)) break;
                push_unique(out, make_bucket_key(i, b));
                if (probe) {
                    push_unique(out, make_bucket_key(i, b - 1));
                    push_unique(out, make_bucket_key(i, b + 1));
                }
                break;
            }

            case BlockingKind::Suffix:
            case BlockingKind::Prefix: {
                if (!has_text(*v)) break;
                const std::size_t n = width_chars(rule.width);
                if (v->text.size() < n) break;
                const std::string_view t = v->text;
                push_unique(out, make_key(i, rule.kind == BlockingKind::Suffix ? t.substr(t.size() - n)
                                                                              : t.substr(0, n)));
                break;
            }

            case BlockingKind::Token: {
                if (!has_text(*v)) break;
                const std::size_t min_len = width_chars(rule.width);
                std::string_view t = v->text;
                while (!t.empty()) {
                    const std::size_t sp = t.find(' ');
                    const std::string_view tok = t.substr(0, sp);
                    if (tok.size() >= min_len) push_unique(out, make_key(i, tok));
                    if (sp == std::string_view::npos) break;
                    t.remove_prefix(sp + 1);
                }
                break;
            }
        }
    }
}

} // namespace

std::vector<DerivedKey> derive_index_keys(const std::vector<BlockingKeyRule>& rules, const Record& rec) {
    std::vector<DerivedKey> keys;
    derive_keys(rules, rec, false, keys);
    return keys;
}

std::vector<DerivedKey> derive_probe_keys(const std::vector<BlockingKeyRule>& rules, const Record& rec) {
    std::vector<DerivedKey> keys;
    derive_keys(rules, rec, true, keys);
    return keys;
}

void BlockingIndex::add(RecordId id, std::vector<DerivedKey> keys) {
    remove(id);
    for (const auto& k : keys) {
        by_key_[k.key].push_back(id);
    }
    by_record_.emplace(id, std::move(keys));
}

std::vector<DerivedKey> BlockingIndex::remove(RecordId id) {
    auto it = by_record_.find(id);
    if (it == by_record_.end()) return {};

    std::vector<DerivedKey> keys = std::move(it->second);
    by_record_.erase(it);

    for (const auto& k : keys) {
        auto bucket = by_key_.find(k.key);
        if (bucket == by_key_.end()) continue;
        auto& ids = bucket->second;
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
        if (ids.empty()) by_key_.erase(bucket);
    }
    return keys;
}

const std::vector<RecordId>* BlockingIndex::lookup(BlockingKey key) const noexcept {
    const auto it = by_key_.find(key);
    return it == by_key_.end() ? nullptr : &it->second;
}

const std::vector<DerivedKey>* BlockingIndex::keys_of(RecordId id) const noexcept {
    const auto it = by_record_.find(id);
    return it == by_record_.end() ? nullptr : &it->second;
}

} // namespace core
