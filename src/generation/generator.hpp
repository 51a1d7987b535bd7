#pragma once

#include "core/clock.hpp"
#include "core/uuid.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

namespace chronoid::generation {

/**
 * The registers a Generator serializes on. Empty optionals mean "nothing
 * issued yet". Exposed so tests can force edge cases such as a saturated
 * counter or a stored timestamp ahead of the clock.
 */
struct GeneratorState {
    std::optional<uint64_t> last_timestamp_v1;  // 60-bit ticks
    std::optional<uint64_t> last_timestamp_v6;  // 60-bit ticks
    std::optional<uint64_t> last_timestamp_v7;  // 48-bit unix ms
    uint64_t last_counter_v7{0};                // 42-bit

    bool operator==(const GeneratorState&) const = default;
};

/**
 * Generator - time-ordered (v1, v6, v7) and custom (v8) UUIDs.
 *
 * Each generate call reads the clock, compares with the stored registers
 * and updates them under one mutex, so values from one Generator are
 * strictly increasing per version whatever the clock does. There is no
 * coordination between Generator instances or between processes.
 *
 * The registers are as wide as their fields: 60-bit ticks for v1/v6 and
 * 48-bit milliseconds for v7 (years 5236 and 10889). Advancing past the
 * last representable value wraps the register to 0, logged as a warning;
 * only that one step breaks the ordering.
 *
 * Random fields come from libsodium.
 */
class Generator {
public:
    explicit Generator(std::shared_ptr<const ClockSource> clock = system_clock());

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    /**
     * Version 1: legacy field order. `node` (48 bits) and `clock_seq`
     * (14 bits) are masked; when absent they are random, the node with its
     * multicast bit set.
     */
    [[nodiscard]] Uuid generate_v1(std::optional<uint64_t> node = std::nullopt,
                                   std::optional<uint16_t> clock_seq = std::nullopt);

    /**
     * Version 6: the v1 timestamp reordered most-significant first.
     * Same `node` / `clock_seq` handling as generate_v1.
     */
    [[nodiscard]] Uuid generate_v6(std::optional<uint64_t> node = std::nullopt,
                                   std::optional<uint16_t> clock_seq = std::nullopt);

    /**
     * Version 7: 48-bit Unix milliseconds, 42-bit counter, 32 random bits.
     */
    [[nodiscard]] Uuid generate_v7();

    /**
     * Version 8: caller blocks a (48 bits), b (12 bits), c (62 bits).
     * Out-of-range blocks are truncated, missing blocks are random.
     */
    [[nodiscard]] Uuid generate_v8(std::optional<uint64_t> a = std::nullopt,
                                   std::optional<uint64_t> b = std::nullopt,
                                   std::optional<uint64_t> c = std::nullopt) const;

    [[nodiscard]] GeneratorState state() const;

    void restore(const GeneratorState& state);

    [[nodiscard]] const ClockSource& clock() const noexcept {
        return *clock_;
    }

private:
    // Caller holds mutex_. Sets `wrapped` when the 60-bit register rolls over.
    uint64_t next_ticks(std::optional<uint64_t>& last, bool& wrapped);

    std::shared_ptr<const ClockSource> clock_;
    mutable std::mutex mutex_;
    GeneratorState state_;
    bool v7_clock_behind_{false};
};

/**
 * Process-wide generator on the system clock, created on first use.
 */
[[nodiscard]] Generator& default_generator();

[[nodiscard]] Uuid generate_v1(std::optional<uint64_t> node = std::nullopt,
                               std::optional<uint16_t> clock_seq = std::nullopt);
[[nodiscard]] Uuid generate_v6(std::optional<uint64_t> node = std::nullopt,
                               std::optional<uint16_t> clock_seq = std::nullopt);
[[nodiscard]] Uuid generate_v7();
[[nodiscard]] Uuid generate_v8(std::optional<uint64_t> a = std::nullopt,
                               std::optional<uint64_t> b = std::nullopt,
                               std::optional<uint64_t> c = std::nullopt);

} // namespace chronoid::generation
