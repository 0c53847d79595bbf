#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/blocking_index.hpp"
#include "core/candidate_generator.hpp"

namespace {

using core::BlockingKind;
using core::BlockingKeyRule;
using core::FieldValue;
using core::Record;
using core::Side;

Record make_record(Side side, core::RecordId id, std::int64_t amount_units, std::string acc = {}) {
    Record r{};
    r.side = side;
    r.id = id;
    r.fields.emplace("amount", FieldValue::make_number(amount_units * core::micro_units));
    if (!acc.empty()) r.fields.emplace("acc", FieldValue::make_digits(std::move(acc)));
    return r;
}

bool shares_key(const std::vector<core::DerivedKey>& probe, const std::vector<core::DerivedKey>& index) {
    return std::any_of(probe.begin(), probe.end(), [&](const core::DerivedKey& k) {
        return std::find(index.begin(), index.end(), k) != index.end();
    });
}

TEST(BlockingIndexTest, NumericBucketsProbeNeighbours) {
    const std::vector<BlockingKeyRule> rules{{"amount", "amount", BlockingKind::NumericBucket, 100.0}};
    const auto l = make_record(Side::Left, 1, 1099);
    const auto r_near = make_record(Side::Right, 2, 1101);
    const auto r_far = make_record(Side::Right, 3, 1350);

    const auto l_index = core::derive_index_keys(rules, l);
    ASSERT_EQ(l_index.size(), 1u);
    EXPECT_EQ(core::derive_probe_keys(rules, l).size(), 3u);

    // Adjacent buckets meet from either direction.
    EXPECT_TRUE(shares_key(core::derive_probe_keys(rules, r_near), l_index));
    EXPECT_TRUE(shares_key(core::derive_probe_keys(rules, l), core::derive_index_keys(rules, r_near)));
    EXPECT_FALSE(shares_key(core::derive_probe_keys(rules, r_far), l_index));
}

TEST(BlockingIndexTest, SuffixPrefixAndTokenKeys) {
    const std::vector<BlockingKeyRule> rules{
        {"acc", "acc", BlockingKind::Suffix, 4.0},
        {"acc", "acc", BlockingKind::Prefix, 3.0},
        {"name", "name", BlockingKind::Token, 3.0},
    };
    Record l{};
    l.fields.emplace("acc", FieldValue::make_digits("30186000000000000008280573"));
    l.fields.emplace("name", FieldValue::make_text("m perez ltd"));
    Record r{};
    r.side = Side::Right;
    r.fields.emplace("acc", FieldValue::make_digits("8280573"));
    r.fields.emplace("name", FieldValue::make_text("perez"));

    const auto lk = core::derive_index_keys(rules, l);
    // suffix, prefix, tokens "perez" and "ltd"; "m" is too short
    EXPECT_EQ(lk.size(), 4u);
    EXPECT_TRUE(shares_key(core::derive_probe_keys(rules, r), lk));

    Record short_acc{};
    short_acc.fields.emplace("acc", FieldValue::make_digits("57"));
    EXPECT_TRUE(core::derive_index_keys(rules, short_acc).empty());
}

TEST(BlockingIndexTest, RuleIndexSeparatesEqualValues) {
    const std::vector<BlockingKeyRule> rules{
        {"a", "a", BlockingKind::Exact, 1.0},
        {"b", "b", BlockingKind::Exact, 1.0},
    };
    Record l{};
    l.fields.emplace("a", FieldValue::make_text("same"));
    Record r{};
    r.side = Side::Right;
    r.fields.emplace("b", FieldValue::make_text("same"));
    EXPECT_FALSE(shares_key(core::derive_probe_keys(rules, r), core::derive_index_keys(rules, l)));
}

TEST(BlockingIndexTest, InvalidAndMissingFieldsProduceNoKeys) {
    const std::vector<BlockingKeyRule> rules{{"amount", "amount", BlockingKind::NumericBucket, 10.0}};
    Record r{};
    r.fields.emplace("amount", FieldValue::make_invalid("ten"));
    EXPECT_TRUE(core::derive_index_keys(rules, r).empty());
    EXPECT_TRUE(core::derive_probe_keys(rules, Record{}).empty());
}

TEST(BlockingIndexTest, RemovePurgesEveryKey) {
    const std::vector<BlockingKeyRule> rules{
        {"amount", "amount", BlockingKind::NumericBucket, 100.0},
        {"acc", "acc", BlockingKind::Suffix, 4.0},
    };
    core::BlockingIndex index;
    const auto a = make_record(Side::Left, 1, 500, "11110573");
    const auto b = make_record(Side::Left, 2, 510, "22220573");
    index.add(a.id, core::derive_index_keys(rules, a));
    index.add(b.id, core::derive_index_keys(rules, b));
    EXPECT_EQ(index.record_count(), 2u);
    EXPECT_EQ(index.key_count(), 2u);

    const auto removed = index.remove(1);
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_FALSE(index.contains(1));
    for (const auto& k : removed) {
        const auto* ids = index.lookup(k.key);
        ASSERT_NE(ids, nullptr);
        EXPECT_EQ(*ids, std::vector<core::RecordId>{2});
    }

    index.remove(2);
    EXPECT_EQ(index.key_count(), 0u);
    EXPECT_TRUE(index.remove(2).empty());
}

TEST(CandidateGeneratorTest, RanksBySharedRulesThenId) {
    const std::vector<BlockingKeyRule> rules{
        {"amount", "amount", BlockingKind::NumericBucket, 100.0},
        {"acc", "acc", BlockingKind::Suffix, 4.0},
    };
    core::CandidateGenerator gen(rules, 2);

    EXPECT_TRUE(gen.on_insert(make_record(Side::Right, 30, 1005, "99990001")).added.empty());
    EXPECT_TRUE(gen.on_insert(make_record(Side::Right, 20, 1010, "55550573")).added.empty());
    EXPECT_TRUE(gen.on_insert(make_record(Side::Right, 10, 1020, "77770002")).added.empty());

    const auto delta = gen.on_insert(make_record(Side::Left, 1, 1000, "12340573"));
    EXPECT_EQ(delta.considered, 3u);
    EXPECT_TRUE(delta.truncated);
    ASSERT_EQ(delta.added.size(), 2u);
    // R20 shares both rules; R10 wins the tie on one rule against R30.
    EXPECT_EQ(delta.added[0], (core::CandidateKey{1, 20}));
    EXPECT_EQ(delta.added[1], (core::CandidateKey{1, 10}));
}

TEST(CandidateGeneratorTest, RightInsertYieldsLeftFirstPairs) {
    const std::vector<BlockingKeyRule> rules{{"amount", "amount", BlockingKind::NumericBucket, 100.0}};
    core::CandidateGenerator gen(rules, 8);
    gen.on_insert(make_record(Side::Left, 5, 300));
    const auto delta = gen.on_insert(make_record(Side::Right, 9, 310));
    ASSERT_EQ(delta.added.size(), 1u);
    EXPECT_EQ(delta.added[0], (core::CandidateKey{5, 9}));
    EXPECT_FALSE(delta.truncated);

    EXPECT_FALSE(gen.on_remove(Side::Left, 5).empty());
    EXPECT_TRUE(gen.on_insert(make_record(Side::Right, 11, 305)).added.empty());

    gen.restore(make_record(Side::Left, 5, 300));
    EXPECT_TRUE(gen.index(Side::Left).contains(5));
}

TEST(CandidateGeneratorTest, RejectsBadConfiguration) {
    EXPECT_THROW(core::CandidateGenerator({}, 4), std::invalid_argument);
    const std::vector<BlockingKeyRule> rules{{"amount", "amount", BlockingKind::NumericBucket, 0.0}};
    EXPECT_THROW(core::CandidateGenerator(rules, 4), std::invalid_argument);
    const std::vector<BlockingKeyRule> ok{{"amount", "amount", BlockingKind::NumericBucket, 10.0}};
    EXPECT_THROW(core::CandidateGenerator(ok, 0), std::invalid_argument);
}

} // namespace
