#include "persist/config_loader.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <optional>

namespace persist {
namespace {

class JsonCursor {
public:
    explicit JsonCursor(std::string_view s) : src_(s) {}

    void skip_ws() const noexcept {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    std::optional<std::string> parse_string(std::string& err) noexcept {
        skip_ws();
        if (pos_ >= src_.size() || src_[pos_] != '"') {
            err = "Expected string";
            return std::nullopt;
        }
        ++pos_;
        std::string out;
        while (pos_ < src_.size()) {
            const char c = src_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= src_.size()) {
                err = "Invalid escape";
                return std::nullopt;
            }
            switch (src_[pos_++]) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                default:
                    err = "Unsupported escape sequence";
                    return std::nullopt;
            }
        }
        err = "Unterminated string";
        return std::nullopt;
    }

    std::optional<std::uint64_t> parse_uint64(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        std::uint64_t value = 0;
        const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
        if (start == pos_ || conv.ec != std::errc()) {
            err = "Expected unsigned integer";
            return std::nullopt;
        }
        return value;
    }

    std::optional<double> parse_double(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (!std::isdigit(static_cast<unsigned char>(c)) && c != '-' && c != '+' && c != '.' && c != 'e' &&
                c != 'E') {
                break;
            }
            ++pos_;
        }
        double value = 0.0;
        const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
        if (start == pos_ || conv.ec != std::errc() || conv.ptr != src_.data() + pos_) {
            err = "Expected number";
            return std::nullopt;
        }
        return value;
    }

    std::optional<bool> parse_bool(std::string& err) noexcept {
        skip_ws();
        if (src_.substr(pos_).starts_with("true")) {
            pos_ += 4;
            return true;
        }
        if (src_.substr(pos_).starts_with("false")) {
            pos_ += 5;
            return false;
        }
        err = "Expected true or false";
        return std::nullopt;
    }

    bool eof() const noexcept {
        skip_ws();
        return pos_ >= src_.size();
    }

private:
    mutable std::size_t pos_{0};
    std::string_view src_;
};

// Walks `{ "key": value, ... }`, handing each key to on_key, which must consume the value.
template <typename OnKey>
bool parse_object(JsonCursor& cur, std::string& error, OnKey&& on_key) noexcept {
    if (!cur.consume('{')) { error = "Expected object"; return false; }
    if (cur.consume('}')) return true;
    while (true) {
        auto key = cur.parse_string(error);
        if (!key) return false;
        if (!cur.consume(':')) { error = "Expected ':'"; return false; }
        if (!on_key(*key)) return false;
        if (cur.consume('}')) return true;
        if (!cur.consume(',')) { error = "Expected ','"; return false; }
    }
}

template <typename OnElement>
bool parse_array(JsonCursor& cur, std::string& error, OnElement&& on_element) noexcept {
    if (!cur.consume('[')) { error = "Expected array"; return false; }
    if (cur.consume(']')) return true;
    while (true) {
        if (!on_element()) return false;
        if (cur.consume(']')) return true;
        if (!cur.consume(',')) { error = "Expected ','"; return false; }
    }
}

bool read_string(JsonCursor& cur, std::string& out, std::string& error) noexcept {
    auto v = cur.parse_string(error);
    if (!v) return false;
    out = std::move(*v);
    return true;
}

bool read_double(JsonCursor& cur, double& out, std::string& error) noexcept {
    auto v = cur.parse_double(error);
    if (!v) return false;
    out = *v;
    return true;
}

bool read_size(JsonCursor& cur, std::size_t& out, std::string& error) noexcept {
    auto v = cur.parse_uint64(error);
    if (!v) return false;
    out = static_cast<std::size_t>(*v);
    return true;
}

bool read_bool(JsonCursor& cur, bool& out, std::string& error) noexcept {
    auto v = cur.parse_bool(error);
    if (!v) return false;
    out = *v;
    return true;
}

std::optional<core::FieldKind> field_kind_from_string(std::string_view s) noexcept {
    if (s == "text") return core::FieldKind::Text;
    if (s == "number") return core::FieldKind::Number;
    if (s == "date") return core::FieldKind::Date;
    if (s == "digits") return core::FieldKind::Digits;
    return std::nullopt;
}

std::optional<core::Extractor> extractor_from_string(std::string_view s) noexcept {
    if (s == "copy") return core::Extractor::Copy;
    if (s == "first_date") return core::Extractor::FirstDate;
    if (s == "longest_digit_run") return core::Extractor::LongestDigitRun;
    if (s == "number_after_keyword") return core::Extractor::NumberAfterKeyword;
    return std::nullopt;
}

std::optional<core::BlockingKind> blocking_kind_from_string(std::string_view s) noexcept {
    if (s == "exact") return core::BlockingKind::Exact;
    if (s == "numeric_bucket") return core::BlockingKind::NumericBucket;
    if (s == "date_bucket") return core::BlockingKind::DateBucket;
    if (s == "suffix") return core::BlockingKind::Suffix;
    if (s == "prefix") return core::BlockingKind::Prefix;
    if (s == "token") return core::BlockingKind::Token;
    return std::nullopt;
}

std::optional<core::Comparator> comparator_from_string(std::string_view s) noexcept {
    if (s == "exact") return core::Comparator::Exact;
    if (s == "numeric_tolerance") return core::Comparator::NumericTolerance;
    if (s == "edit_distance") return core::Comparator::EditDistance;
    if (s == "date_tolerance") return core::Comparator::DateTolerance;
    if (s == "digit_suffix") return core::Comparator::DigitSuffix;
    return std::nullopt;
}

std::optional<core::Aggregation> aggregation_from_string(std::string_view s) noexcept {
    if (s == "weighted_average") return core::Aggregation::WeightedAverage;
    if (s == "minimum_over_required") return core::Aggregation::MinimumOverRequired;
    return std::nullopt;
}

template <typename Enum, typename Lookup>
bool read_enum(JsonCursor& cur, Enum& out, Lookup lookup, const char* what, std::string& error) noexcept {
    std::string text;
    if (!read_string(cur, text, error)) return false;
    const auto value = lookup(text);
    if (!value) {
        error = std::string("Unknown ") + what + ": " + text;
        return false;
    }
    out = *value;
    return true;
}

bool parse_schema(JsonCursor& cur, core::RecordSchema& schema, std::string& error) noexcept {
    schema = core::RecordSchema{};
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "fields") {
            return parse_array(cur, error, [&] {
                core::FieldSpec spec{};
                const bool ok = parse_object(cur, error, [&](const std::string& k) {
                    if (k == "name") return read_string(cur, spec.name, error);
                    if (k == "kind") return read_enum(cur, spec.kind, field_kind_from_string, "field kind", error);
                    if (k == "required") return read_bool(cur, spec.required, error);
                    error = "Unknown schema field key: " + k;
                    return false;
                });
                if (!ok) return false;
                if (spec.name.empty()) { error = "Schema field missing name"; return false; }
                schema.fields.push_back(std::move(spec));
                return true;
            });
        }
        if (key == "extractions") {
            return parse_array(cur, error, [&] {
                core::ExtractionRule rule{};
                const bool ok = parse_object(cur, error, [&](const std::string& k) {
                    if (k == "source") return read_string(cur, rule.source, error);
                    if (k == "target") return read_string(cur, rule.target, error);
                    if (k == "extractor") {
                        return read_enum(cur, rule.extractor, extractor_from_string, "extractor", error);
                    }
                    if (k == "keyword") return read_string(cur, rule.keyword, error);
                    if (k == "kind") return read_enum(cur, rule.kind, field_kind_from_string, "field kind", error);
                    error = "Unknown extraction key: " + k;
                    return false;
                });
                if (!ok) return false;
                if (rule.source.empty() || rule.target.empty()) {
                    error = "Extraction needs source and target";
                    return false;
                }
                if (rule.extractor == core::Extractor::NumberAfterKeyword && rule.keyword.empty()) {
                    error = "number_after_keyword extraction needs a keyword";
                    return false;
                }
                schema.extractions.push_back(std::move(rule));
                return true;
            });
        }
        error = "Unknown schema key: " + key;
        return false;
    });
}

bool parse_blocking(JsonCursor& cur, std::vector<core::BlockingKeyRule>& rules, std::string& error) noexcept {
    rules.clear();
    return parse_array(cur, error, [&] {
        core::BlockingKeyRule rule{};
        const bool ok = parse_object(cur, error, [&](const std::string& k) {
            if (k == "left_field") return read_string(cur, rule.left_field, error);
            if (k == "right_field") return read_string(cur, rule.right_field, error);
            if (k == "kind") return read_enum(cur, rule.kind, blocking_kind_from_string, "blocking kind", error);
            if (k == "width") return read_double(cur, rule.width, error);
            error = "Unknown blocking key: " + k;
            return false;
        });
        if (!ok) return false;
        rules.push_back(std::move(rule));
        return true;
    });
}

bool parse_scorer(JsonCursor& cur, core::ScorerConfig& scorer, std::string& error) noexcept {
    scorer = core::ScorerConfig{};
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "aggregation") {
            return read_enum(cur, scorer.aggregation, aggregation_from_string, "aggregation", error);
        }
        if (key == "rules") {
            return parse_array(cur, error, [&] {
                core::FieldRule rule{};
                const bool ok = parse_object(cur, error, [&](const std::string& k) {
                    if (k == "left_field") return read_string(cur, rule.left_field, error);
                    if (k == "right_field") return read_string(cur, rule.right_field, error);
                    if (k == "comparator") {
                        return read_enum(cur, rule.comparator, comparator_from_string, "comparator", error);
                    }
                    if (k == "weight") return read_double(cur, rule.weight, error);
                    if (k == "tolerance") return read_double(cur, rule.tolerance, error);
                    if (k == "required") return read_bool(cur, rule.required, error);
                    if (k == "missing_penalty") return read_double(cur, rule.missing_penalty, error);
                    error = "Unknown scorer rule key: " + k;
                    return false;
                });
                if (!ok) return false;
                scorer.rules.push_back(std::move(rule));
                return true;
            });
        }
        error = "Unknown scorer key: " + key;
        return false;
    });
}

bool load_file(const std::filesystem::path& path, std::string& out, std::string& error) noexcept {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open file: " + path.string();
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto len = in.tellg();
    if (len < 0) {
        error = "Failed to size file: " + path.string();
        return false;
    }
    out.resize(static_cast<std::size_t>(len));
    in.seekg(0, std::ios::beg);
    if (!in.read(out.data(), static_cast<std::streamsize>(out.size()))) {
        error = "Failed to read file: " + path.string();
        return false;
    }
    return true;
}

} // namespace

bool parse_recon_config_text(std::string_view text, core::ReconConfig& out, std::string& error) noexcept {
    JsonCursor cur(text);
    core::ReconConfig cfg = core::default_recon_config();
    bool first_key = true;

    const bool ok = parse_object(cur, error, [&](const std::string& key) {
        const bool was_first = first_key;
        first_key = false;
        if (key == "preset") {
            std::string name;
            if (!read_string(cur, name, error)) return false;
            if (!was_first) { error = "\"preset\" must be the first key"; return false; }
            if (name != "transaction") { error = "Unknown preset: " + name; return false; }
            cfg = core::transaction_recon_config();
            return true;
        }
        if (key == "min_confidence") return read_double(cur, cfg.min_confidence, error);
        if (key == "max_candidates_per_record") return read_size(cur, cfg.max_candidates_per_record, error);
        if (key == "scoring_threads") return read_size(cur, cfg.scoring_threads, error);
        if (key == "parallel_scoring_min_pairs") return read_size(cur, cfg.parallel_scoring_min_pairs, error);
        if (key == "max_batch_events") return read_size(cur, cfg.max_batch_events, error);
        if (key == "validate_full_state") return read_bool(cur, cfg.validate_full_state, error);
        if (key == "left_schema") return parse_schema(cur, cfg.left_schema, error);
        if (key == "right_schema") return parse_schema(cur, cfg.right_schema, error);
        if (key == "blocking") return parse_blocking(cur, cfg.blocking, error);
        if (key == "scorer") return parse_scorer(cur, cfg.scorer, error);
        error = "Unknown field: " + key;
        return false;
    });
    if (!ok) {
        return false;
    }
    if (!cur.eof()) {
        error = "Trailing characters after configuration object";
        return false;
    }
    std::string problem = core::validate_recon_config(cfg);
    if (!problem.empty()) {
        error = std::move(problem);
        return false;
    }
    out = std::move(cfg);
    return true;
}

bool parse_recon_config(const std::filesystem::path& path, core::ReconConfig& out, std::string& error) noexcept {
    std::string contents;
    if (!load_file(path, contents, error)) {
        return false;
    }
    return parse_recon_config_text(contents, out, error);
}

} // namespace persist
