#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <stdexcept>

#include "core/record_normalizer.hpp"
#include "core/recon_config.hpp"

namespace {

using core::FieldKind;
using core::FieldValue;

TEST(RecordNormalizerTest, TextIsLowercasedAndPunctuationCollapsed) {
    EXPECT_EQ(core::normalize_text("  M. Perez "), "m perez");
    EXPECT_EQ(core::normalize_text("C.Barnard,  Ltd"), "c barnard ltd");
    EXPECT_EQ(core::normalize_text("..."), "");
}

TEST(RecordNormalizerTest, DigitsDropLettersAndLeadingZeros) {
    EXPECT_EQ(core::normalize_digits("HU30186000000000000008280573"), "30186000000000000008280573");
    EXPECT_EQ(core::normalize_digits("000002968016"), "2968016");
    EXPECT_EQ(core::normalize_digits("0000"), "0");
    EXPECT_EQ(core::normalize_digits("abc"), "");
}

TEST(RecordNormalizerTest, NumbersParseToMicroUnits) {
    EXPECT_EQ(core::parse_number_micros("8946"), 8'946'000'000);
    EXPECT_EQ(core::parse_number_micros("8946.5"), 8'946'500'000);
    EXPECT_EQ(core::parse_number_micros("5_000_048"), 5'000'048'000'000);
    EXPECT_EQ(core::parse_number_micros("1,234.25"), 1'234'250'000);
    EXPECT_EQ(core::parse_number_micros("-12"), -12'000'000);
    EXPECT_FALSE(core::parse_number_micros("12EUR").has_value());
    EXPECT_FALSE(core::parse_number_micros("").has_value());
    EXPECT_FALSE(core::parse_number_micros("1.2.3").has_value());
}

TEST(RecordNormalizerTest, NumbersBeyondInt64MicrosAreRejected) {
    // 9223372036854 whole units is the largest that fits; the fraction pushes it over.
    EXPECT_EQ(core::parse_number_micros("9223372036854"), 9'223'372'036'854'000'000);
    EXPECT_EQ(core::parse_number_micros("9223372036854.775807"), std::numeric_limits<std::int64_t>::max());
    EXPECT_FALSE(core::parse_number_micros("9223372036854.9").has_value());
    EXPECT_FALSE(core::parse_number_micros("9223372036854.775808").has_value());
    EXPECT_FALSE(core::parse_number_micros("99999999999999").has_value());
}

TEST(RecordNormalizerTest, OverflowingAmountMarksRecordMalformed) {
    const core::ReconConfig cfg = core::transaction_recon_config();
    const core::RecordNormalizer normalizer(cfg.left_schema, cfg.right_schema);

    const auto left = normalizer.normalize(
        core::make_insert(core::Side::Left, 1, {{"date", "2020-06-04"}, {"amount", "9223372036854.9"}}));
    EXPECT_TRUE(left.malformed);
    EXPECT_EQ(core::find_field(left.fields, "amount")->kind, FieldKind::Invalid);
}

TEST(RecordNormalizerTest, IsoDatesBecomeEpochDays) {
    EXPECT_EQ(core::parse_iso_date_days("1970-01-01"), 0);
    EXPECT_EQ(core::parse_iso_date_days("1970-01-02"), 1);
    EXPECT_EQ(core::parse_iso_date_days("2000-03-01"), 11017);
    EXPECT_EQ(core::parse_iso_date_days("2020-02-29"), 18321);
    EXPECT_FALSE(core::parse_iso_date_days("2019-02-29").has_value());
    EXPECT_FALSE(core::parse_iso_date_days("2020-13-01").has_value());
    EXPECT_FALSE(core::parse_iso_date_days("20200101").has_value());
}

TEST(RecordNormalizerTest, ExtractorsFindFieldsInFreeText) {
    const std::string desc =
        "EUR 8944 on 2020-06-06 by INTERNATIONAL transfer credited to 00000000008280573 (M. Perez), "
        "fee EUR 2, amount EUR 8946.";
    EXPECT_EQ(core::extract_first_date(desc), "2020-06-06");
    EXPECT_EQ(core::extract_longest_digit_run(desc), "00000000008280573");
    EXPECT_EQ(core::extract_number_after(desc, "amount"), "8946");
    EXPECT_EQ(core::extract_number_after("oryg. amount 5_000_048, fees 5", "AMOUNT"), "5000048");
    EXPECT_FALSE(core::extract_number_after("no figures here", "amount").has_value());
    EXPECT_FALSE(core::extract_first_date("on 2020-13-45").has_value());
}

TEST(RecordNormalizerTest, NormalizesDeclaredExtractedAndUndeclaredFields) {
    const core::ReconConfig cfg = core::transaction_recon_config();
    const core::RecordNormalizer normalizer(cfg.left_schema, cfg.right_schema);

    const auto right = normalizer.normalize(core::make_insert(
        core::Side::Right, 4,
        {{"description", "Received 7540 EUR on 2020-09-15. Invoice, recipient C. Baxter, 0000000005784046, "
                         "amount EUR 7541, fees EUR 1"}}));
    EXPECT_FALSE(right.malformed);
    ASSERT_NE(core::find_field(right.fields, "amount"), nullptr);
    EXPECT_EQ(*core::find_field(right.fields, "amount"), FieldValue::make_number(7'541'000'000));
    EXPECT_EQ(*core::find_field(right.fields, "date"), FieldValue::make_date(*core::parse_iso_date_days("2020-09-15")));
    EXPECT_EQ(*core::find_field(right.fields, "recipient_acc_no"), FieldValue::make_digits("5784046"));
    ASSERT_NE(core::find_field(right.fields, "description"), nullptr);
    EXPECT_EQ(core::find_field(right.fields, "description")->kind, FieldKind::Text);
}

TEST(RecordNormalizerTest, MissingRequiredOrInvalidValueMarksMalformed) {
    const core::ReconConfig cfg = core::transaction_recon_config();
    const core::RecordNormalizer normalizer(cfg.left_schema, cfg.right_schema);
    core::NormalizeStats stats;

    const auto missing = normalizer.normalize(
        core::make_insert(core::Side::Left, 1, {{"date", "2020-06-04"}, {"recipient", "M. Perez"}}), &stats);
    EXPECT_TRUE(missing.malformed);

    const auto invalid = normalizer.normalize(
        core::make_insert(core::Side::Left, 2, {{"date", "yesterday"}, {"amount", "8946"}}), &stats);
    EXPECT_TRUE(invalid.malformed);
    EXPECT_EQ(core::find_field(invalid.fields, "date")->kind, FieldKind::Invalid);
    EXPECT_EQ(core::find_field(invalid.fields, "date")->text, "yesterday");

    EXPECT_EQ(stats.normalized, 2u);
    EXPECT_EQ(stats.malformed, 2u);
    EXPECT_EQ(stats.missing_required, 1u);
    EXPECT_EQ(stats.invalid_values, 1u);
}

TEST(RecordNormalizerTest, DirectlySuppliedFieldWinsOverExtraction) {
    const core::ReconConfig cfg = core::transaction_recon_config();
    const core::RecordNormalizer normalizer(cfg.left_schema, cfg.right_schema);

    const auto rec = normalizer.normalize(core::make_insert(
        core::Side::Right, 9, {{"amount", "100"}, {"description", "amount EUR 250 on 2021-01-01"}}));
    EXPECT_EQ(*core::find_field(rec.fields, "amount"), FieldValue::make_number(100'000'000));
}

TEST(RecordNormalizerTest, RejectsUnusableSchema) {
    core::RecordSchema bad{};
    bad.fields = {{"", FieldKind::Text, false}};
    EXPECT_THROW(core::RecordNormalizer(bad, core::RecordSchema{}), std::invalid_argument);

    core::RecordSchema no_keyword{};
    no_keyword.extractions = {{"description", "amount", core::Extractor::NumberAfterKeyword, "", FieldKind::Number}};
    EXPECT_THROW(core::RecordNormalizer(core::RecordSchema{}, no_keyword), std::invalid_argument);
}

} // namespace
