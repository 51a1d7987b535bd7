#pragma once

#include "core/bit_packer.hpp"
#include "core/result.hpp"
#include "core/timestamp.hpp"
#include "core/uint128.hpp"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chronoid {

/**
 * The six RFC 4122 sub-fields, widest first in memory order.
 *
 * Members are deliberately wider than their field so that construction can
 * reject out-of-range input instead of silently truncating it.
 */
struct UuidFields {
    uint64_t time_low{0};              // 32 bits
    uint64_t time_mid{0};              // 16 bits
    uint64_t time_hi_version{0};       // 16 bits
    uint64_t clock_seq_hi_variant{0};  // 8 bits
    uint64_t clock_seq_low{0};         // 8 bits
    uint64_t node{0};                  // 48 bits

    bool operator==(const UuidFields&) const = default;
};

/**
 * Construction sources for Uuid::create. Exactly one of hex, bytes,
 * bytes_le, int_value or fields must be set; version is an optional
 * modifier applied afterwards.
 */
struct UuidArgs {
    std::optional<std::string> hex;
    std::optional<std::vector<uint8_t>> bytes;
    std::optional<std::vector<uint8_t>> bytes_le;
    std::optional<Uint128> int_value;
    std::optional<UuidFields> fields;
    std::optional<int> version;
};

/**
 * Uuid - an immutable 128-bit identifier (RFC 9562), versions 1 to 8.
 *
 * Stored as 16 big-endian bytes. Equality, ordering and hashing are those
 * of the unsigned 128-bit integer, so values of every version sort and
 * hash together.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    /**
     * Nil (all zeros).
     */
    constexpr Uuid() noexcept : bytes_{} {}

    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    explicit constexpr Uuid(Uint128 value) noexcept : bytes_{} {
        for (size_t i = 0; i < 8; ++i) {
            bytes_[i] = static_cast<uint8_t>(value.hi >> (56 - 8 * i));
            bytes_[8 + i] = static_cast<uint8_t>(value.lo >> (56 - 8 * i));
        }
    }

    /**
     * Build from exactly one source in `args`, then stamp `args.version`
     * if present. Usage error for zero or several sources, validation
     * error for any malformed source or a version outside 1..8.
     */
    [[nodiscard]] static Result<Uuid, Error> create(const UuidArgs& args);

    /**
     * Parse 32 hex digits. Dashes, surrounding braces and "urn:" / "uuid:"
     * prefixes are ignored; case does not matter.
     */
    [[nodiscard]] static Result<Uuid, Error> from_string(std::string_view text);

    // Exactly 16 bytes, big-endian.
    [[nodiscard]] static Result<Uuid, Error> from_bytes(std::span<const uint8_t> bytes);

    // Exactly 16 bytes, first three fields little-endian (Microsoft GUID order).
    [[nodiscard]] static Result<Uuid, Error> from_bytes_le(std::span<const uint8_t> bytes);

    [[nodiscard]] static constexpr Uuid from_int(Uint128 value) noexcept {
        return Uuid(value);
    }

    [[nodiscard]] static Result<Uuid, Error> from_fields(const UuidFields& fields);

    /**
     * Copy with the version nibble replaced and the RFC 4122 variant stamped.
     */
    [[nodiscard]] Result<Uuid, Error> with_version(int version) const;

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    [[nodiscard]] Bytes bytes_le() const noexcept;

    [[nodiscard]] constexpr Uint128 int_value() const noexcept {
        Uint128 value;
        for (size_t i = 0; i < 8; ++i) {
            value.hi = (value.hi << 8) | bytes_[i];
            value.lo = (value.lo << 8) | bytes_[8 + i];
        }
        return value;
    }

    [[nodiscard]] UuidFields fields() const noexcept;

    [[nodiscard]] uint32_t time_low() const noexcept;
    [[nodiscard]] uint16_t time_mid() const noexcept;
    [[nodiscard]] uint16_t time_hi_version() const noexcept;
    [[nodiscard]] uint8_t clock_seq_hi_variant() const noexcept;
    [[nodiscard]] uint8_t clock_seq_low() const noexcept;
    [[nodiscard]] uint16_t clock_seq() const noexcept;   // 14 bits
    [[nodiscard]] uint64_t node() const noexcept;        // 48 bits

    [[nodiscard]] Variant variant() const noexcept {
        return layout::unpack_variant(int_value());
    }

    /**
     * Version number, only meaningful for the RFC 4122 variant; empty for
     * every other variant (NIL and MAX included).
     */
    [[nodiscard]] std::optional<int> version() const noexcept;

    /**
     * Raw time field.
     *
     * v6: 60-bit 100ns ticks since 1582-10-15, undoing the v6 reordering.
     * v7: 48-bit milliseconds since the Unix epoch.
     * Anything else: the v1 layout reading. It is only a real time for
     * version 1; other versions get the same bits for compatibility.
     */
    [[nodiscard]] uint64_t time() const noexcept;

    /**
     * Decoded wall-clock time for versions 1, 6 and 7; empty otherwise.
     */
    [[nodiscard]] std::optional<Timestamp> timestamp() const noexcept;

    /**
     * xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase.
     */
    [[nodiscard]] std::string to_string() const;

    // 32 lowercase hex digits, no dashes.
    [[nodiscard]] std::string hex() const;

    // "urn:uuid:" + to_string()
    [[nodiscard]] std::string urn() const;

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0x00) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr bool is_max() const noexcept {
        for (auto b : bytes_) {
            if (b != 0xFF) return false;
        }
        return true;
    }

    constexpr auto operator<=>(const Uuid&) const = default;
    constexpr bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

/**
 * All-zero and all-one sentinels. Not version stamped.
 */
inline constexpr Uuid NIL{};
inline constexpr Uuid MAX{Uint128::max()};

std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

} // namespace chronoid

// Hash specializations for use in std containers
namespace std {
    template<>
    struct hash<chronoid::Uuid> {
        size_t operator()(const chronoid::Uuid& uuid) const noexcept {
            const auto value = uuid.int_value();
            size_t h = std::hash<uint64_t>{}(value.hi);
            h ^= std::hash<uint64_t>{}(value.lo) + 0x9e3779b9 + (h << 6) + (h >> 2);
            return h;
        }
    };
}
