#include "core/recon_config.hpp"

#include <cmath>

namespace core {

ReconConfig transaction_recon_config() {
    ReconConfig cfg{};
    cfg.min_confidence = 0.5;
    cfg.max_candidates_per_record = 32;

    cfg.left_schema.fields = {
        {"date", FieldKind::Date, true},
        {"amount", FieldKind::Number, true},
        {"recipient", FieldKind::Text, false},
        {"sender", FieldKind::Text, false},
        {"recipient_acc_no", FieldKind::Digits, false},
        {"sender_acc_no", FieldKind::Digits, false},
    };

    cfg.right_schema.fields = {
        {"date", FieldKind::Date, false},
        {"amount", FieldKind::Number, false},
        {"recipient", FieldKind::Text, false},
        {"recipient_acc_no", FieldKind::Digits, false},
    };
    cfg.right_schema.extractions = {
        {"description", "date", Extractor::FirstDate, {}, FieldKind::Date},
        {"description", "amount", Extractor::NumberAfterKeyword, "amount", FieldKind::Number},
        {"description", "recipient_acc_no", Extractor::LongestDigitRun, {}, FieldKind::Digits},
    };

    cfg.blocking = {
        {"amount", "amount", BlockingKind::NumericBucket, 50.0},
        {"recipient_acc_no", "recipient_acc_no", BlockingKind::Suffix, 4.0},
        {"date", "date", BlockingKind::DateBucket, 7.0},
    };

    cfg.scorer.aggregation = Aggregation::WeightedAverage;
    cfg.scorer.rules = {
        {"amount", "amount", Comparator::NumericTolerance, 3.0, 10.0, true, 1.0},
        {"date", "date", Comparator::DateTolerance, 1.0, 3.0, false, 0.5},
        {"recipient_acc_no", "recipient_acc_no", Comparator::DigitSuffix, 3.0, 7.0, false, 0.5},
        {"recipient", "recipient", Comparator::EditDistance, 1.0, 0.0, false, 0.5},
    };
    return cfg;
}

std::string validate_recon_config(const ReconConfig& cfg) {
    if (!(cfg.min_confidence >= 0.0 && cfg.min_confidence <= 1.0)) {
        return "min_confidence must be in [0, 1]";
    }
    if (cfg.max_candidates_per_record == 0) {
        return "max_candidates_per_record must be > 0";
    }
    if (cfg.blocking.empty()) {
        return "at least one blocking rule is required";
    }
    for (const auto& rule : cfg.blocking) {
        if (rule.left_field.empty() || rule.right_field.empty()) {
            return "blocking rule field names must not be empty";
        }
        if (!(rule.width > 0.0) || !std::isfinite(rule.width)) {
            return "blocking rule width must be > 0 for " + rule.left_field;
        }
    }
    if (cfg.scorer.rules.empty()) {
        return "at least one scorer rule is required";
    }
    for (const auto& rule : cfg.scorer.rules) {
        if (rule.left_field.empty() || rule.right_field.empty()) {
            return "scorer rule field names must not be empty";
        }
        if (!(rule.weight > 0.0) || !std::isfinite(rule.weight)) {
            return "scorer rule weight must be > 0 for " + rule.left_field;
        }
        if (rule.tolerance < 0.0 || !std::isfinite(rule.tolerance)) {
            return "scorer rule tolerance must be >= 0 for " + rule.left_field;
        }
        if (rule.missing_penalty < 0.0 || rule.missing_penalty > 1.0) {
            return "scorer rule missing_penalty must be in [0, 1] for " + rule.left_field;
        }
    }
    if (cfg.scoring_threads == 0) {
        return "scoring_threads must be > 0";
    }
    if (cfg.max_batch_events == 0) {
        return "max_batch_events must be > 0";
    }
    return {};
}

} // namespace core
