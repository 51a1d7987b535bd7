#pragma once

#include <compare>
#include <cstdint>
#include <string>

namespace chronoid {

/**
 * Uint128 - portable 128-bit unsigned integer.
 *
 * Only the operations needed to assemble and take apart UUID layouts are
 * provided: bitwise logic, shifts and ordering. Ordering is plain unsigned
 * integer order, which is the same as big-endian byte order.
 */
struct Uint128 {
    uint64_t hi{0};
    uint64_t lo{0};

    constexpr Uint128() noexcept = default;
    constexpr Uint128(uint64_t high, uint64_t low) noexcept : hi(high), lo(low) {}

    // Implicit so that small literals can be used in masks.
    constexpr Uint128(uint64_t low) noexcept : lo(low) {}  // NOLINT

    [[nodiscard]] static constexpr Uint128 max() noexcept {
        return {~uint64_t{0}, ~uint64_t{0}};
    }

    [[nodiscard]] constexpr bool is_zero() const noexcept {
        return hi == 0 && lo == 0;
    }

    constexpr auto operator<=>(const Uint128&) const = default;
    constexpr bool operator==(const Uint128&) const = default;

    friend constexpr Uint128 operator|(Uint128 a, Uint128 b) noexcept {
        return {a.hi | b.hi, a.lo | b.lo};
    }

    friend constexpr Uint128 operator&(Uint128 a, Uint128 b) noexcept {
        return {a.hi & b.hi, a.lo & b.lo};
    }

    friend constexpr Uint128 operator^(Uint128 a, Uint128 b) noexcept {
        return {a.hi ^ b.hi, a.lo ^ b.lo};
    }

    friend constexpr Uint128 operator~(Uint128 a) noexcept {
        return {~a.hi, ~a.lo};
    }

    friend constexpr Uint128 operator<<(Uint128 a, unsigned n) noexcept {
        if (n == 0) return a;
        if (n >= 128) return {};
        if (n >= 64) return {a.lo << (n - 64), 0};
        return {(a.hi << n) | (a.lo >> (64 - n)), a.lo << n};
    }

    friend constexpr Uint128 operator>>(Uint128 a, unsigned n) noexcept {
        if (n == 0) return a;
        if (n >= 128) return {};
        if (n >= 64) return {0, a.hi >> (n - 64)};
        return {a.hi >> n, (a.lo >> n) | (a.hi << (64 - n))};
    }

    Uint128& operator|=(Uint128 other) noexcept { return *this = *this | other; }
    Uint128& operator&=(Uint128 other) noexcept { return *this = *this & other; }

    /**
     * Extract `width` bits (<= 64) starting at bit `shift` (LSB = 0).
     */
    [[nodiscard]] constexpr uint64_t bits(unsigned shift, unsigned width) const noexcept {
        const auto shifted = (*this >> shift).lo;
        return width >= 64 ? shifted : shifted & ((uint64_t{1} << width) - 1);
    }

    /**
     * 32 lowercase hex digits, zero padded.
     */
    [[nodiscard]] std::string to_hex() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out(32, '0');
        for (int i = 0; i < 16; ++i) {
            out[15 - i] = digits[(hi >> (i * 4)) & 0xF];
            out[31 - i] = digits[(lo >> (i * 4)) & 0xF];
        }
        return out;
    }
};

/**
 * Mask of the low `width` bits (width <= 64).
 */
[[nodiscard]] constexpr uint64_t low_mask(unsigned width) noexcept {
    return width >= 64 ? ~uint64_t{0} : (uint64_t{1} << width) - 1;
}

} // namespace chronoid
