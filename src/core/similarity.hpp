#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/field_value.hpp"

namespace core {

enum class Comparator : std::uint8_t {
    Exact,            // same kind and same normalized value
    NumericTolerance, // Number: 1 - |a-b| / tolerance, clipped at 0
    EditDistance,     // Text/Digits: 1 - levenshtein / max(len)
    DateTolerance,    // Date: 1 - |days| / tolerance, clipped at 0
    DigitSuffix       // Digits: shared trailing digits / max(shorter length, tolerance)
};

enum class Aggregation : std::uint8_t {
    WeightedAverage,     // sum(w * s) / sum(w)
    MinimumOverRequired  // min over required rules; weighted average when none is required
};

// One per-field comparison. `tolerance` is in value units: currency units for
// NumericTolerance, days for DateTolerance, minimum significant digits for DigitSuffix.
// A field missing on either side contributes (1 - missing_penalty) instead of failing.
struct FieldRule {
    std::string left_field;
    std::string right_field;
    Comparator comparator{Comparator::Exact};
    double weight{1.0};
    double tolerance{0.0};
    bool required{false};
    double missing_penalty{1.0};
};

struct ScorerConfig {
    std::vector<FieldRule> rules{};
    Aggregation aggregation{Aggregation::WeightedAverage};
};

enum class ScoreStatus : std::uint8_t { Ok, Malformed };

struct ScoreOutcome {
    ScoreStatus status{ScoreStatus::Ok};
    double confidence{0.0};

    [[nodiscard]] bool ok() const noexcept { return status == ScoreStatus::Ok; }
};

std::size_t levenshtein(std::string_view a, std::string_view b);
double edit_similarity(std::string_view a, std::string_view b);
std::size_t common_suffix_length(std::string_view a, std::string_view b) noexcept;

// Pure, deterministic pair scorer. Holds only its immutable configuration, so one
// instance may be shared by any number of scoring threads.
//
// Monotonic: for every comparator, strictly closer values never produce a lower
// field score, and both aggregations are non-decreasing in each field score.
class SimilarityScorer {
public:
    // Throws std::invalid_argument on an empty rule set, non-positive weights,
    // negative tolerances or penalties outside [0, 1].
    explicit SimilarityScorer(ScorerConfig cfg);

    ScoreOutcome score(const Record& left, const Record& right) const noexcept;

    const ScorerConfig& config() const noexcept { return cfg_; }

private:
    // Returns false when the value kinds cannot be compared with the rule's comparator.
    bool field_similarity(const FieldRule& rule,
                          const FieldValue& l,
                          const FieldValue& r,
                          double& out) const noexcept;

    ScorerConfig cfg_;
    double total_weight_{0.0};
};

} // namespace core
