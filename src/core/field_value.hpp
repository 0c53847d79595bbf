#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace core {

using RecordId = std::uint64_t;

enum class Side : std::uint8_t { Left = 0, Right = 1 };

[[nodiscard]] constexpr Side opposite(Side s) noexcept {
    return s == Side::Left ? Side::Right : Side::Left;
}

[[nodiscard]] constexpr const char* to_string(Side s) noexcept {
    return s == Side::Left ? "L" : "R";
}

// Closed set of normalized value kinds. Every raw field is reduced to one of these
// at the ingestion boundary; scoring never re-parses raw text.
enum class FieldKind : std::uint8_t {
    Text,    // lower-cased, punctuation stripped, whitespace collapsed
    Number,  // signed micro-units (8946.5 -> 8'946'500'000)
    Date,    // days since 1970-01-01
    Digits,  // digits only, leading zeros stripped
    Invalid  // present but unparseable as the declared kind; raw text kept
};

[[nodiscard]] constexpr const char* to_string(FieldKind k) noexcept {
    switch (k) {
        case FieldKind::Text:    return "text";
        case FieldKind::Number:  return "number";
        case FieldKind::Date:    return "date";
        case FieldKind::Digits:  return "digits";
        case FieldKind::Invalid: return "invalid";
    }
    return "invalid";
}

struct FieldValue {
    FieldKind kind{FieldKind::Text};
    std::string text{};        // Text, Digits, Invalid (raw)
    std::int64_t integer{0};   // Number (micro-units), Date (epoch days)

    static FieldValue make_text(std::string s) { return FieldValue{FieldKind::Text, std::move(s), 0}; }
    static FieldValue make_digits(std::string s) { return FieldValue{FieldKind::Digits, std::move(s), 0}; }
    static FieldValue make_number(std::int64_t micros) { return FieldValue{FieldKind::Number, {}, micros}; }
    static FieldValue make_date(std::int64_t days) { return FieldValue{FieldKind::Date, {}, days}; }
    static FieldValue make_invalid(std::string raw) { return FieldValue{FieldKind::Invalid, std::move(raw), 0}; }

    [[nodiscard]] bool is_numeric() const noexcept {
        return kind == FieldKind::Number || kind == FieldKind::Date;
    }

    bool operator==(const FieldValue&) const = default;
};

// Ordered so that iteration (and anything derived from it) is deterministic.
using FieldBag = std::map<std::string, FieldValue, std::less<>>;

[[nodiscard]] inline const FieldValue* find_field(const FieldBag& bag, std::string_view name) noexcept {
    const auto it = bag.find(name);
    return it == bag.end() ? nullptr : &it->second;
}

// Immutable once created; updates are modeled as remove + insert.
struct Record {
    Side side{Side::Left};
    RecordId id{0};
    FieldBag fields{};
    bool malformed{false}; // missing required field or an Invalid value

    bool operator==(const Record&) const = default;
};

inline constexpr std::int64_t micro_units = 1'000'000;

} // namespace core
