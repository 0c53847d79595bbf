#include "ingest/delta_codec.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <new>

#include "persist/endianness.hpp"

namespace ingest {
namespace {

constexpr std::size_t max_u16 = std::numeric_limits<std::uint16_t>::max();

void put_string(std::vector<std::byte>& out, std::size_t& pos, const std::string& s) noexcept {
    persist::write_u16_le(static_cast<std::uint16_t>(s.size()), out.data() + pos);
    pos += 2;
    if (!s.empty()) {
        std::memcpy(out.data() + pos, s.data(), s.size());
        pos += s.size();
    }
}

bool take_string(std::span<const std::byte> frame, std::size_t& pos, std::string& out) {
    if (frame.size() - pos < 2) return false;
    const std::size_t len = persist::read_u16_le(frame.data() + pos);
    pos += 2;
    if (frame.size() - pos < len) return false;
    out.assign(reinterpret_cast<const char*>(frame.data() + pos), len);
    pos += len;
    return true;
}

} // namespace

bool encode_delta(const core::DeltaEvent& ev, std::vector<std::byte>& out) {
    if (ev.fields.size() > max_u16) return false;
    std::size_t size = delta_header_size;
    for (const auto& [name, value] : ev.fields) {
        if (name.size() > max_u16 || value.size() > max_u16) return false;
        size += 4 + name.size() + value.size();
    }
    if (size > max_delta_frame_size) return false;

    std::size_t pos = out.size();
    out.resize(out.size() + size);
    out[pos++] = static_cast<std::byte>(ev.side);
    out[pos++] = static_cast<std::byte>(ev.op);
    persist::write_u64_le(ev.id, out.data() + pos);
    pos += 8;
    persist::write_u16_le(static_cast<std::uint16_t>(ev.fields.size()), out.data() + pos);
    pos += 2;
    for (const auto& [name, value] : ev.fields) {
        put_string(out, pos, name);
        put_string(out, pos, value);
    }
    return true;
}

DecodeResult decode_delta(std::span<const std::byte> frame, core::DeltaEvent& out) noexcept {
    if (frame.size() > max_delta_frame_size) return DecodeResult::TooLarge;
    if (frame.size() < delta_header_size) return DecodeResult::Truncated;

    const auto side = static_cast<std::uint8_t>(frame[0]);
    const auto op = static_cast<std::uint8_t>(frame[1]);
    if (side > static_cast<std::uint8_t>(core::Side::Right) ||
        op > static_cast<std::uint8_t>(core::DeltaOp::Remove)) {
        return DecodeResult::BadEnum;
    }

    core::DeltaEvent ev{};
    ev.side = static_cast<core::Side>(side);
    ev.op = static_cast<core::DeltaOp>(op);
    ev.id = persist::read_u64_le(frame.data() + 2);
    const std::size_t count = persist::read_u16_le(frame.data() + 10);

    std::size_t pos = delta_header_size;
    try {
        ev.fields.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            std::string name;
            std::string value;
            if (!take_string(frame, pos, name) || !take_string(frame, pos, value)) {
                return DecodeResult::Truncated;
            }
            ev.fields.emplace_back(std::move(name), std::move(value));
        }
    } catch (const std::bad_alloc&) {
        return DecodeResult::TooLarge;
    }
    if (pos != frame.size()) return DecodeResult::TrailingBytes;

    out = std::move(ev);
    return DecodeResult::Ok;
}

void encode_output(const core::OutputEvent& ev, OutputFrame& out) noexcept {
    std::byte* p = out.data();
    p[0] = static_cast<std::byte>(ev.op);
    persist::write_u64_le(ev.left_id, p + 1);
    p[9] = static_cast<std::byte>(ev.right_id ? 1 : 0);
    persist::write_u64_le(ev.right_id.value_or(0), p + 10);
    persist::write_f64_le(ev.confidence, p + 18);
}

DecodeResult decode_output(std::span<const std::byte> frame, core::OutputEvent& out) noexcept {
    if (frame.size() < output_frame_size) return DecodeResult::Truncated;
    if (frame.size() > output_frame_size) return DecodeResult::TrailingBytes;

    const std::byte* p = frame.data();
    const auto op = static_cast<std::uint8_t>(p[0]);
    const auto has_right = static_cast<std::uint8_t>(p[9]);
    if (op > static_cast<std::uint8_t>(core::OutputOp::Retract) || has_right > 1) {
        return DecodeResult::BadEnum;
    }
    const double confidence = persist::read_f64_le(p + 18);
    if (!std::isfinite(confidence) || confidence < 0.0 || confidence > 1.0) {
        return DecodeResult::BadValue;
    }

    out.op = static_cast<core::OutputOp>(op);
    out.left_id = persist::read_u64_le(p + 1);
    out.right_id = has_right ? std::optional<core::RecordId>(persist::read_u64_le(p + 10)) : std::nullopt;
    out.confidence = confidence;
    return DecodeResult::Ok;
}

} // namespace ingest
