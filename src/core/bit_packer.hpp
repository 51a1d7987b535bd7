#pragma once

#include "core/uint128.hpp"

#include <cstdint>

namespace chronoid {

/**
 * Variant families, decided by the top bits of octet 8.
 */
enum class Variant {
    ReservedNcs,        // 0xx
    Rfc4122,            // 10x
    ReservedMicrosoft,  // 110
    ReservedFuture,     // 111
};

[[nodiscard]] const char* to_string(Variant variant) noexcept;

namespace layout {

// Bit positions counted from the least significant bit of the 128-bit value.
inline constexpr unsigned VERSION_SHIFT = 76;
inline constexpr unsigned VARIANT_SHIFT = 62;

inline constexpr Uint128 VERSION_MASK = Uint128{0xF} << VERSION_SHIFT;
inline constexpr Uint128 VARIANT_MASK = Uint128{0x3} << VARIANT_SHIFT;
inline constexpr Uint128 RFC4122_VARIANT_BITS = Uint128{0x2} << VARIANT_SHIFT;

// Field widths.
inline constexpr unsigned TICKS_BITS = 60;
inline constexpr unsigned CLOCK_SEQ_BITS = 14;
inline constexpr unsigned NODE_BITS = 48;
inline constexpr unsigned UNIX_MS_BITS = 48;
inline constexpr unsigned COUNTER_BITS = 42;
inline constexpr unsigned COUNTER_HI_BITS = 12;
inline constexpr unsigned COUNTER_LO_BITS = 30;
inline constexpr unsigned TAIL_BITS = 32;
inline constexpr unsigned BLOCK_A_BITS = 48;
inline constexpr unsigned BLOCK_B_BITS = 12;
inline constexpr unsigned BLOCK_C_BITS = 62;

inline constexpr uint64_t MAX_COUNTER_V7 = low_mask(COUNTER_BITS);  // 0x3FF_FFFF_FFFF

/**
 * Stamp the version nibble (bits 76-79) and the "10" variant (bits 62-63)
 * over `payload`. All other bits are kept as supplied.
 */
[[nodiscard]] constexpr Uint128 pack(int version, Uint128 payload) noexcept {
    const auto cleared = payload & ~(VERSION_MASK | VARIANT_MASK);
    const auto nibble = Uint128{static_cast<uint64_t>(version) & 0xF} << VERSION_SHIFT;
    return cleared | nibble | RFC4122_VARIANT_BITS;
}

/**
 * Raw version nibble, regardless of variant.
 */
[[nodiscard]] constexpr int unpack_version(Uint128 value) noexcept {
    return static_cast<int>(value.bits(VERSION_SHIFT, 4));
}

[[nodiscard]] constexpr Variant unpack_variant(Uint128 value) noexcept {
    const auto top = value.bits(61, 3);
    if ((top & 0b100) == 0) return Variant::ReservedNcs;
    if ((top & 0b010) == 0) return Variant::Rfc4122;
    if ((top & 0b001) == 0) return Variant::ReservedMicrosoft;
    return Variant::ReservedFuture;
}

struct TimeFields {
    uint64_t ticks{0};      // 60-bit, 100ns since 1582-10-15
    uint16_t clock_seq{0};  // 14-bit
    uint64_t node{0};       // 48-bit
};

struct CounterFields {
    uint64_t unix_ms{0};    // 48-bit
    uint64_t counter{0};    // 42-bit
    uint32_t tail{0};       // 32 random bits after the counter
};

struct CustomBlocks {
    uint64_t a{0};  // 48-bit
    uint64_t b{0};  // 12-bit
    uint64_t c{0};  // 62-bit
};

// time_low | time_mid | ver | time_hi | var | clock_seq | node
[[nodiscard]] Uint128 pack_v1(const TimeFields& fields) noexcept;
[[nodiscard]] TimeFields unpack_v1(Uint128 value) noexcept;

// time_hi | time_mid | ver | time_low | var | clock_seq | node
[[nodiscard]] Uint128 pack_v6(const TimeFields& fields) noexcept;
[[nodiscard]] TimeFields unpack_v6(Uint128 value) noexcept;

// unix_ts_ms | ver | counter[41:30] | var | counter[29:0] | tail
[[nodiscard]] Uint128 pack_v7(const CounterFields& fields) noexcept;
[[nodiscard]] CounterFields unpack_v7(Uint128 value) noexcept;

// a | ver | b | var | c
[[nodiscard]] Uint128 pack_v8(const CustomBlocks& blocks) noexcept;
[[nodiscard]] CustomBlocks unpack_v8(Uint128 value) noexcept;

} // namespace layout
} // namespace chronoid
