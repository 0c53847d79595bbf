#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>

namespace persist {

// Frames are little-endian on the wire regardless of host order. Values are assembled
// byte by byte, so pointers need no alignment.
template <std::unsigned_integral T>
inline void store_le(T v, std::byte* p) noexcept {
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        p[i] = static_cast<std::byte>(v & 0xFFu);
        v = static_cast<T>(v >> 8);
    }
}

template <std::unsigned_integral T>
inline T load_le(const std::byte* p) noexcept {
    T v = 0;
    for (std::size_t i = sizeof(T); i-- > 0;) {
        v = static_cast<T>((v << 8) | std::to_integer<T>(p[i]));
    }
    return v;
}

inline void write_u16_le(std::uint16_t v, std::byte* p) noexcept { store_le(v, p); }
inline void write_u64_le(std::uint64_t v, std::byte* p) noexcept { store_le(v, p); }
inline std::uint16_t read_u16_le(const std::byte* p) noexcept { return load_le<std::uint16_t>(p); }
inline std::uint64_t read_u64_le(const std::byte* p) noexcept { return load_le<std::uint64_t>(p); }

// Confidences travel as their IEEE-754 bit pattern.
inline void write_f64_le(double v, std::byte* p) noexcept { store_le(std::bit_cast<std::uint64_t>(v), p); }
inline double read_f64_le(const std::byte* p) noexcept { return std::bit_cast<double>(load_le<std::uint64_t>(p)); }

} // namespace persist
