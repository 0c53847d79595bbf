#include "core/record_normalizer.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace core {
namespace {

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline char lower_ascii(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

bool is_blank(std::string_view s) noexcept { return trim(s).empty(); }

// Howard Hinnant's days_from_civil.
constexpr std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2 ? 1 : 0;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

constexpr bool is_leap(std::int64_t y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

constexpr unsigned days_in_month(std::int64_t y, unsigned m) noexcept {
    constexpr unsigned table[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29u : table[m - 1];
}

bool read_fixed_digits(std::string_view s, std::size_t pos, std::size_t n, unsigned& out) noexcept {
    if (pos + n > s.size()) return false;
    unsigned v = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const char c = s[pos + i];
        if (!is_digit(c)) return false;
        v = v * 10 + static_cast<unsigned>(c - '0');
    }
    out = v;
    return true;
}

bool looks_like_date_at(std::string_view s, std::size_t pos) noexcept {
    if (pos + 10 > s.size()) return false;
    if (pos > 0 && is_digit(s[pos - 1])) return false;
    if (pos + 10 < s.size() && is_digit(s[pos + 10])) return false;
    return s[pos + 4] == '-' && s[pos + 7] == '-';
}

bool ieq_at(std::string_view text, std::size_t pos, std::string_view keyword) noexcept {
    if (pos + keyword.size() > text.size()) return false;
    for (std::size_t i = 0; i < keyword.size(); ++i) {
        if (lower_ascii(text[pos + i]) != lower_ascii(keyword[i])) return false;
    }
    return true;
}

constexpr std::size_t max_keyword_gap = 12;

} // namespace

std::string normalize_text(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    bool pending_space = false;
    for (const char c : raw) {
        const auto uc = static_cast<unsigned char>(c);
        const bool keep = uc >= 0x80 || std::isalnum(uc);
        if (!keep) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(lower_ascii(c));
    }
    return out;
}

std::string normalize_digits(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (const char c : raw) {
        if (!is_digit(c)) continue;
        if (out.empty() && c == '0') continue;
        out.push_back(c);
    }
    if (out.empty()) {
        for (const char c : raw) {
            if (c == '0') return "0";
        }
    }
    return out;
}

std::optional<std::int64_t> parse_number_micros(std::string_view raw) noexcept {
    std::string_view s = trim(raw);
    if (s.empty()) return std::nullopt;

    bool negative = false;
    if (s.front() == '-' || s.front() == '+') {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }

    constexpr std::int64_t limit = std::numeric_limits<std::int64_t>::max() / micro_units;
    std::int64_t whole = 0;
    std::int64_t frac = 0;
    std::int64_t frac_scale = micro_units;
    bool seen_digit = false;
    bool in_fraction = false;

    for (const char c : s) {
        if (is_digit(c)) {
            seen_digit = true;
            const auto d = static_cast<std::int64_t>(c - '0');
            if (in_fraction) {
                if (frac_scale > 1) {
                    frac_scale /= 10;
                    frac += d * frac_scale;
                }
            } else {
                if (whole > (limit - d) / 10) return std::nullopt;
                whole = whole * 10 + d;
            }
        } else if (c == '.') {
            if (in_fraction) return std::nullopt;
            in_fraction = true;
        } else if (c == '_' || c == ',' || c == ' ' || c == '\'') {
            if (in_fraction) return std::nullopt;
        } else {
            return std::nullopt;
        }
    }
    if (!seen_digit) return std::nullopt;

    const std::int64_t whole_micros = whole * micro_units;
    if (frac > std::numeric_limits<std::int64_t>::max() - whole_micros) return std::nullopt;
    const std::int64_t micros = whole_micros + frac;
    return negative ? -micros : micros;
}

std::optional<std::int64_t> parse_iso_date_days(std::string_view raw) noexcept {
    const std::string_view s = trim(raw);
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    unsigned y = 0, m = 0, d = 0;
    if (!read_fixed_digits(s, 0, 4, y) || !read_fixed_digits(s, 5, 2, m) || !read_fixed_digits(s, 8, 2, d)) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) return std::nullopt;
    return days_from_civil(static_cast<std::int64_t>(y), m, d);
}

FieldValue normalize_value(std::string_view raw, FieldKind kind) {
    switch (kind) {
        case FieldKind::Text:
            return FieldValue::make_text(normalize_text(raw));
        case FieldKind::Number: {
            const auto v = parse_number_micros(raw);
            return v ? FieldValue::make_number(*v) : FieldValue::make_invalid(std::string(raw));
        }
        case FieldKind::Date: {
            const auto v = parse_iso_date_days(raw);
            return v ? FieldValue::make_date(*v) : FieldValue::make_invalid(std::string(raw));
        }
        case FieldKind::Digits: {
            std::string digits = normalize_digits(raw);
            return digits.empty() ? FieldValue::make_invalid(std::string(raw))
                                  : FieldValue::make_digits(std::move(digits));
        }
        case FieldKind::Invalid:
            break;
    }
    return FieldValue::make_invalid(std::string(raw));
}

std::optional<std::string> extract_first_date(std::string_view text) {
    for (std::size_t pos = 0; pos + 10 <= text.size(); ++pos) {
        if (!looks_like_date_at(text, pos)) continue;
        const auto candidate = text.substr(pos, 10);
        if (parse_iso_date_days(candidate)) {
            return std::string(candidate);
        }
    }
    return std::nullopt;
}

std::optional<std::string> extract_longest_digit_run(std::string_view text) {
    std::string best;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (is_digit(c)) {
            current.push_back(c);
            continue;
        }
        const bool joins_run = c == '_' && !current.empty() && i + 1 < text.size() && is_digit(text[i + 1]);
        if (joins_run) continue;
        if (current.size() > best.size()) best = current;
        current.clear();
    }
    if (current.size() > best.size()) best = current;
    if (best.empty()) return std::nullopt;
    return best;
}

std::optional<std::string> extract_number_after(std::string_view text, std::string_view keyword) {
    if (keyword.empty()) return std::nullopt;
    for (std::size_t pos = 0; pos + keyword.size() <= text.size(); ++pos) {
        if (!ieq_at(text, pos, keyword)) continue;

        std::size_t i = pos + keyword.size();
        const std::size_t gap_end = i + max_keyword_gap;
        while (i < text.size() && i < gap_end && !is_digit(text[i])) {
            const char c = text[i];
            if (c == ',' || c == ';' || c == '.' || c == '\n') break;
            ++i;
        }
        if (i >= text.size() || !is_digit(text[i])) continue;

        std::string number;
        while (i < text.size()) {
            const char c = text[i];
            const bool next_is_digit = i + 1 < text.size() && is_digit(text[i + 1]);
            if (is_digit(c)) {
                number.push_back(c);
            } else if ((c == '_' || c == ',') && next_is_digit) {
                // digit group separator
            } else if (c == '.' && next_is_digit) {
                number.push_back(c);
            } else {
                break;
            }
            ++i;
        }
        return number;
    }
    return std::nullopt;
}

RecordNormalizer::RecordNormalizer(RecordSchema left, RecordSchema right)
    : left_(std::move(left)), right_(std::move(right)) {
    for (const RecordSchema* schema : {&left_, &right_}) {
        for (const auto& spec : schema->fields) {
            if (spec.name.empty()) {
                throw std::invalid_argument("RecordSchema field name must not be empty");
            }
            if (spec.kind == FieldKind::Invalid) {
                throw std::invalid_argument("RecordSchema field '" + spec.name + "' has kind invalid");
            }
        }
        for (const auto& rule : schema->extractions) {
            if (rule.source.empty() || rule.target.empty()) {
                throw std::invalid_argument("ExtractionRule needs source and target");
            }
            if (rule.extractor == Extractor::NumberAfterKeyword && rule.keyword.empty()) {
                throw std::invalid_argument("ExtractionRule number_after needs a keyword");
            }
        }
    }
}

Record RecordNormalizer::normalize(const DeltaEvent& ev, NormalizeStats* stats) const {
    const RecordSchema& sc = schema(ev.side);

    Record rec{};
    rec.side = ev.side;
    rec.id = ev.id;

    auto raw_value = [&ev](std::string_view name) -> const std::string* {
        const std::string* found = nullptr;
        for (const auto& [k, v] : ev.fields) {
            if (k == name) found = &v; // last occurrence wins
        }
        return found;
    };

    auto is_declared = [&sc](std::string_view name) {
        for (const auto& spec : sc.fields) {
            if (spec.name == name) return true;
        }
        return false;
    };

    std::size_t invalid = 0;
    for (const auto& spec : sc.fields) {
        const std::string* raw = raw_value(spec.name);
        if (!raw || is_blank(*raw)) continue;
        FieldValue v = normalize_value(*raw, spec.kind);
        if (v.kind == FieldKind::Invalid) ++invalid;
        rec.fields.insert_or_assign(spec.name, std::move(v));
    }

    for (const auto& [name, raw] : ev.fields) {
        if (rec.fields.contains(name) || is_blank(raw) || is_declared(name)) continue;
        std::string text = normalize_text(raw);
        if (!text.empty()) {
            rec.fields.insert_or_assign(name, FieldValue::make_text(std::move(text)));
        }
    }

    for (const auto& rule : sc.extractions) {
        // A declared field supplied directly wins over anything extracted.
        if (is_declared(rule.target) && rec.fields.contains(rule.target)) continue;
        const std::string* raw = raw_value(rule.source);
        if (!raw) continue;

        std::optional<std::string> extracted;
        switch (rule.extractor) {
            case Extractor::Copy:               extracted = *raw; break;
            case Extractor::FirstDate:          extracted = extract_first_date(*raw); break;
            case Extractor::LongestDigitRun:    extracted = extract_longest_digit_run(*raw); break;
            case Extractor::NumberAfterKeyword: extracted = extract_number_after(*raw, rule.keyword); break;
        }
        if (!extracted || is_blank(*extracted)) continue;

        FieldValue v = normalize_value(*extracted, rule.kind);
        if (v.kind == FieldKind::Invalid) ++invalid;
        rec.fields.insert_or_assign(rule.target, std::move(v));
    }

    std::size_t missing = 0;
    for (const auto& spec : sc.fields) {
        if (spec.required && !rec.fields.contains(spec.name)) ++missing;
    }

    rec.malformed = invalid > 0 || missing > 0;
    if (stats) {
        ++stats->normalized;
        stats->invalid_values += invalid;
        stats->missing_required += missing;
        if (rec.malformed) ++stats->malformed;
    }
    return rec;
}

} // namespace core
