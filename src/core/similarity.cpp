#include "core/similarity.hpp"

#include <algorithm>
#include <cmath>
#include <new>
#include <stdexcept>

namespace core {
namespace {

inline double clamp01(double v) noexcept {
    if (!(v > 0.0)) return 0.0; // also maps NaN to 0
    return v > 1.0 ? 1.0 : v;
}

inline double linear_decay(double diff, double tolerance) noexcept {
    if (diff == 0.0) return 1.0;
    if (tolerance <= 0.0) return 0.0;
    return clamp01(1.0 - diff / tolerance);
}

inline bool has_text(FieldKind k) noexcept {
    return k == FieldKind::Text || k == FieldKind::Digits;
}

} // namespace

std::size_t levenshtein(std::string_view a, std::string_view b) {
    if (a.size() < b.size()) std::swap(a, b);
    std::vector<std::size_t> row(b.size() + 1);
    for (std::size_t j = 0; j <= b.size(); ++j) row[j] = j;

    for (std::size_t i = 1; i <= a.size(); ++i) {
        std::size_t diag = row[0];
        row[0] = i;
        for (std::size_t j = 1; j <= b.size(); ++j) {
            const std::size_t up = row[j];
            const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            row[j] = std::min({row[j] + 1, row[j - 1] + 1, diag + cost});
            diag = up;
        }
    }
    return row[b.size()];
}

double edit_similarity(std::string_view a, std::string_view b) {
    const std::size_t longest = std::max(a.size(), b.size());
    if (longest == 0) return 1.0;
    const auto dist = static_cast<double>(levenshtein(a, b));
    return clamp01(1.0 - dist / static_cast<double>(longest));
}

std::size_t common_suffix_length(std::string_view a, std::string_view b) noexcept {
    std::size_t n = 0;
    while (n < a.size() && n < b.size() && a[a.size() - 1 - n] == b[b.size() - 1 - n]) {
        ++n;
    }
    return n;
}

SimilarityScorer::SimilarityScorer(ScorerConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.rules.empty()) {
        throw std::invalid_argument("SimilarityScorer requires at least one field rule");
    }
    for (const auto& rule : cfg_.rules) {
        if (rule.left_field.empty() || rule.right_field.empty()) {
            throw std::invalid_argument("FieldRule field names must not be empty");
        }
        if (!(rule.weight > 0.0) || !std::isfinite(rule.weight)) {
            throw std::invalid_argument("FieldRule weight must be > 0 for " + rule.left_field);
        }
        if (rule.tolerance < 0.0 || !std::isfinite(rule.tolerance)) {
            throw std::invalid_argument("FieldRule tolerance must be >= 0 for " + rule.left_field);
        }
        if (rule.missing_penalty < 0.0 || rule.missing_penalty > 1.0) {
            throw std::invalid_argument("FieldRule missing_penalty must be in [0, 1] for " + rule.left_field);
        }
        total_weight_ += rule.weight;
    }
}

bool SimilarityScorer::field_similarity(const FieldRule& rule,
                                        const FieldValue& l,
                                        const FieldValue& r,
                                        double& out) const noexcept {
    if (l.kind == FieldKind::Invalid || r.kind == FieldKind::Invalid) {
        return false;
    }

    switch (rule.comparator) {
        case Comparator::Exact:
            if (l.kind != r.kind) return false;
            out = l == r ? 1.0 : 0.0;
            return true;

        case Comparator::NumericTolerance: {
            if (l.kind != FieldKind::Number || r.kind != FieldKind::Number) return false;
            const double diff = std::fabs(static_cast<double>(l.integer) - static_cast<double>(r.integer));
            out = linear_decay(diff, rule.tolerance * static_cast<double>(micro_units));
            return true;
        }

        case Comparator::DateTolerance: {
            if (l.kind != FieldKind::Date || r.kind != FieldKind::Date) return false;
            const double diff = std::fabs(static_cast<double>(l.integer - r.integer));
            out = linear_decay(diff, rule.tolerance);
            return true;
        }

        case Comparator::EditDistance:
            if (!has_text(l.kind) || !has_text(r.kind)) return false;
            try {
                out = edit_similarity(l.text, r.text);
            } catch (const std::bad_alloc&) {
                return false;
            }
            return true;

        case Comparator::DigitSuffix: {
            if (l.kind != FieldKind::Digits || r.kind != FieldKind::Digits) return false;
            const std::size_t shorter = std::min(l.text.size(), r.text.size());
            const double denom = std::max(static_cast<double>(shorter), rule.tolerance);
            if (denom <= 0.0) return false;
            out = clamp01(static_cast<double>(common_suffix_length(l.text, r.text)) / denom);
            return true;
        }
    }
    return false;
}

ScoreOutcome SimilarityScorer::score(const Record& left, const Record& right) const noexcept {
    if (left.malformed || right.malformed) {
        return ScoreOutcome{ScoreStatus::Malformed, 0.0};
    }

    double weighted = 0.0;
    double min_required = 1.0;
    bool any_required = false;

    for (const auto& rule : cfg_.rules) {
        const FieldValue* l = find_field(left.fields, rule.left_field);
        const FieldValue* r = find_field(right.fields, rule.right_field);

        double s = 0.0;
        if (!l || !r) {
            s = clamp01(1.0 - rule.missing_penalty);
        } else if (!field_similarity(rule, *l, *r, s)) {
            return ScoreOutcome{ScoreStatus::Malformed, 0.0};
        }

        weighted += rule.weight * s;
        if (rule.required) {
            any_required = true;
            min_required = std::min(min_required, s);
        }
    }

    double confidence = weighted / total_weight_;
    if (cfg_.aggregation == Aggregation::MinimumOverRequired && any_required) {
        confidence = min_required;
    }
    return ScoreOutcome{ScoreStatus::Ok, clamp01(confidence)};
}

} // namespace core
