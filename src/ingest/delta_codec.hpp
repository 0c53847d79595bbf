#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "core/delta_event.hpp"

namespace ingest {

// Binary frames exchanged over the transport, little-endian, no padding.
//
// Delta frame:
//   [u8 side][u8 op][u64 id][u16 field_count]
//   field_count x ([u16 name_len][name bytes][u16 value_len][value bytes])
//
// Output frame (fixed size):
//   [u8 op][u64 left_id][u8 has_right][u64 right_id][u64 confidence bits]

inline constexpr std::size_t delta_header_size = 1 + 1 + 8 + 2;
inline constexpr std::size_t output_frame_size = 1 + 8 + 1 + 8 + 8;
inline constexpr std::size_t max_delta_frame_size = 64 * 1024;

using OutputFrame = std::array<std::byte, output_frame_size>;

enum class DecodeResult : std::uint8_t { Ok, Truncated, BadEnum, BadValue, TrailingBytes, TooLarge };

[[nodiscard]] constexpr const char* to_string(DecodeResult r) noexcept {
    switch (r) {
        case DecodeResult::Ok:            return "ok";
        case DecodeResult::Truncated:     return "truncated";
        case DecodeResult::BadEnum:       return "bad_enum";
        case DecodeResult::BadValue:      return "bad_value";
        case DecodeResult::TrailingBytes: return "trailing_bytes";
        case DecodeResult::TooLarge:      return "too_large";
    }
    return "unknown";
}

// Appends the frame to `out`. Returns false (out unchanged) when a name or value is
// longer than 65535 bytes, there are more than 65535 fields, or the frame would exceed
// max_delta_frame_size.
bool encode_delta(const core::DeltaEvent& ev, std::vector<std::byte>& out);

DecodeResult decode_delta(std::span<const std::byte> frame, core::DeltaEvent& out) noexcept;

void encode_output(const core::OutputEvent& ev, OutputFrame& out) noexcept;

DecodeResult decode_output(std::span<const std::byte> frame, core::OutputEvent& out) noexcept;

} // namespace ingest
