#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/delta_event.hpp"

namespace ingest {

// Line-oriented delta script:
//   L|+|<id>|field=value|field=value...
//   R|-|<id>
// Side is L or R, op is '+'/"insert" or '-'/"remove". Values run to the next '|' and may
// contain '='. Blank lines and lines starting with '#' are skipped.
enum class ParseResult : std::uint8_t { Ok, Skip, MissingField, Invalid };

[[nodiscard]] constexpr const char* to_string(ParseResult r) noexcept {
    switch (r) {
        case ParseResult::Ok:           return "ok";
        case ParseResult::Skip:         return "skip";
        case ParseResult::MissingField: return "missing_field";
        case ParseResult::Invalid:      return "invalid";
    }
    return "unknown";
}

struct ParseStats {
    std::size_t parsed{0};
    std::size_t skipped{0};
    std::size_t failed{0};
};

ParseResult parse_delta_line(std::string_view line, core::DeltaEvent& out) noexcept;

// Inverse of parse_delta_line for events whose names and values contain no '|'.
std::string format_delta_line(const core::DeltaEvent& ev);

// "upsert <left> <right|-> <confidence>" / "retract ...", confidence with 6 decimals.
std::string format_output_line(const core::OutputEvent& ev);

} // namespace ingest
