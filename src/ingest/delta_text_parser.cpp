#include "ingest/delta_text_parser.hpp"

#include <charconv>
#include <cstdio>
#include <new>

namespace ingest {
namespace {

constexpr char sep = '|';

inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

inline bool parse_uint64(std::string_view s, std::uint64_t& out) noexcept {
    const auto res = std::from_chars(s.data(), s.data() + s.size(), out);
    return res.ec == std::errc{} && res.ptr == s.data() + s.size();
}

// Splits off the next '|' separated token.
inline std::string_view next_token(std::string_view& rest) noexcept {
    const std::size_t pos = rest.find(sep);
    const std::string_view tok = rest.substr(0, pos);
    rest = pos == std::string_view::npos ? std::string_view{} : rest.substr(pos + 1);
    return tok;
}

inline bool map_side(std::string_view s, core::Side& out) noexcept {
    if (s == "L" || s == "l") { out = core::Side::Left; return true; }
    if (s == "R" || s == "r") { out = core::Side::Right; return true; }
    return false;
}

inline bool map_op(std::string_view s, core::DeltaOp& out) noexcept {
    if (s == "+" || s == "insert") { out = core::DeltaOp::Insert; return true; }
    if (s == "-" || s == "remove") { out = core::DeltaOp::Remove; return true; }
    return false;
}

} // namespace

ParseResult parse_delta_line(std::string_view line, core::DeltaEvent& out) noexcept {
    std::string_view rest = trim(line);
    if (rest.empty() || rest.front() == '#') {
        return ParseResult::Skip;
    }

    core::DeltaEvent ev{};
    if (!map_side(trim(next_token(rest)), ev.side)) return ParseResult::Invalid;
    if (rest.empty()) return ParseResult::MissingField;
    if (!map_op(trim(next_token(rest)), ev.op)) return ParseResult::Invalid;

    const bool has_id = !rest.empty();
    const std::string_view id_tok = trim(next_token(rest));
    if (!has_id || id_tok.empty()) return ParseResult::MissingField;
    if (!parse_uint64(id_tok, ev.id)) return ParseResult::Invalid;

    try {
        while (!rest.empty()) {
            const std::string_view tok = next_token(rest);
            if (trim(tok).empty()) continue; // tolerate a trailing '|'
            const std::size_t eq = tok.find('=');
            if (eq == std::string_view::npos) return ParseResult::Invalid;
            const std::string_view name = trim(tok.substr(0, eq));
            if (name.empty()) return ParseResult::Invalid;
            ev.fields.emplace_back(std::string(name), std::string(tok.substr(eq + 1)));
        }
    } catch (const std::bad_alloc&) {
        return ParseResult::Invalid;
    }

    if (ev.op == core::DeltaOp::Remove && !ev.fields.empty()) {
        return ParseResult::Invalid;
    }
    out = std::move(ev);
    return ParseResult::Ok;
}

std::string format_delta_line(const core::DeltaEvent& ev) {
    std::string line = core::to_string(ev.side);
    line += ev.op == core::DeltaOp::Insert ? "|+|" : "|-|";
    line += std::to_string(ev.id);
    for (const auto& [name, value] : ev.fields) {
        line += sep;
        line += name;
        line += '=';
        line += value;
    }
    return line;
}

std::string format_output_line(const core::OutputEvent& ev) {
    char buf[96];
    const char* op = ev.op == core::OutputOp::Upsert ? "upsert" : "retract";
    int n = 0;
    if (ev.right_id) {
        n = std::snprintf(buf, sizeof(buf), "%s %llu %llu %.6f", op, static_cast<unsigned long long>(ev.left_id),
                          static_cast<unsigned long long>(*ev.right_id), ev.confidence);
    } else {
        n = std::snprintf(buf, sizeof(buf), "%s %llu - %.6f", op, static_cast<unsigned long long>(ev.left_id),
                          ev.confidence);
    }
    return std::string(buf, n > 0 ? static_cast<std::size_t>(n) : 0u);
}

} // namespace ingest
