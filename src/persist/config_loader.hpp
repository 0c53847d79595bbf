#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "core/recon_config.hpp"

namespace persist {

// JSON configuration file for the matcher. Top-level keys (all optional apart from
// "blocking" and "scorer", which validation requires to be non-empty):
//
//   "preset"                      "transaction" starts from core::transaction_recon_config();
//                                 must be the first key
//   "min_confidence"              number in [0, 1]
//   "max_candidates_per_record"   integer
//   "scoring_threads"             integer
//   "parallel_scoring_min_pairs"  integer
//   "max_batch_events"            integer
//   "validate_full_state"         true | false
//   "left_schema" / "right_schema"
//       { "fields": [{"name", "kind", "required"}],
//         "extractions": [{"source", "target", "extractor", "keyword", "kind"}] }
//   "blocking"  [{"left_field", "right_field", "kind", "width"}]
//   "scorer"    { "aggregation", "rules": [{"left_field", "right_field", "comparator",
//                 "weight", "tolerance", "required", "missing_penalty"}] }
//
// Enum values are snake_case ("numeric_tolerance", "first_date", "date_bucket", ...).
// Unknown keys and enum values are errors. Neither function throws; on failure `out` is
// left untouched and `error` describes the first problem.
bool parse_recon_config_text(std::string_view text, core::ReconConfig& out, std::string& error) noexcept;

bool parse_recon_config(const std::filesystem::path& path, core::ReconConfig& out, std::string& error) noexcept;

} // namespace persist
