#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/delta_event.hpp"
#include "core/field_value.hpp"

namespace core {

struct FieldSpec {
    std::string name;
    FieldKind kind{FieldKind::Text};
    bool required{false};
};

enum class Extractor : std::uint8_t {
    Copy,               // take the whole source value
    FirstDate,          // first YYYY-MM-DD token
    LongestDigitRun,    // longest run of digits ('_' between digits is skipped)
    NumberAfterKeyword  // first number following `keyword` (case-insensitive)
};

// Derives a typed field from a (usually free-text) source field. Rules run in order
// after declared fields; a declared target that was supplied directly is not overwritten.
struct ExtractionRule {
    std::string source;
    std::string target;
    Extractor extractor{Extractor::Copy};
    std::string keyword{};
    FieldKind kind{FieldKind::Text};
};

struct RecordSchema {
    std::vector<FieldSpec> fields{};
    std::vector<ExtractionRule> extractions{};
};

struct NormalizeStats {
    std::size_t normalized{0};
    std::size_t malformed{0};
    std::size_t invalid_values{0};
    std::size_t missing_required{0};
};

// Value-level normalizers. All are pure and noexcept apart from string allocation.
std::string normalize_text(std::string_view raw);
std::string normalize_digits(std::string_view raw);
std::optional<std::int64_t> parse_number_micros(std::string_view raw) noexcept;
std::optional<std::int64_t> parse_iso_date_days(std::string_view raw) noexcept;
FieldValue normalize_value(std::string_view raw, FieldKind kind);

std::optional<std::string> extract_first_date(std::string_view text);
std::optional<std::string> extract_longest_digit_run(std::string_view text);
std::optional<std::string> extract_number_after(std::string_view text, std::string_view keyword);

// Converts raw delta events into immutable Records: declared fields are parsed to
// their kind, extraction rules derive fields from free text, undeclared raw fields are
// kept as Text. Validation happens here once; the scorer trusts the result.
class RecordNormalizer {
public:
    RecordNormalizer(RecordSchema left, RecordSchema right);

    Record normalize(const DeltaEvent& ev, NormalizeStats* stats = nullptr) const;

    const RecordSchema& schema(Side side) const noexcept {
        return side == Side::Left ? left_ : right_;
    }

private:
    RecordSchema left_;
    RecordSchema right_;
};

} // namespace core
