#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace chronoid {

/**
 * ClockSource - the wall clock the generators read.
 *
 * Implementations only report nanoseconds since the Unix epoch; the two
 * resolutions the UUID layouts need are derived from that single reading.
 */
class ClockSource {
public:
    virtual ~ClockSource() = default;

    /**
     * Current time as nanoseconds since 1970-01-01T00:00:00Z.
     */
    [[nodiscard]] virtual std::chrono::nanoseconds now() const = 0;

    /**
     * 100ns ticks since 1582-10-15T00:00:00Z, truncated to 60 bits (v1/v6).
     */
    [[nodiscard]] uint64_t gregorian_ticks() const;

    /**
     * Milliseconds since the Unix epoch, truncated to 48 bits (v7).
     * Readings before 1970 are reported as 0.
     */
    [[nodiscard]] uint64_t unix_millis() const;
};

/**
 * Reads std::chrono::system_clock.
 */
class SystemClock final : public ClockSource {
public:
    [[nodiscard]] std::chrono::nanoseconds now() const override;
};

/**
 * A clock that only moves when told to. Safe to drive from one thread
 * while generators read it from others.
 */
class ManualClock final : public ClockSource {
public:
    explicit ManualClock(std::chrono::nanoseconds start = std::chrono::nanoseconds{0}) noexcept
        : now_ns_(start.count()) {}

    [[nodiscard]] std::chrono::nanoseconds now() const override {
        return std::chrono::nanoseconds{now_ns_.load(std::memory_order_acquire)};
    }

    void set(std::chrono::nanoseconds value) noexcept {
        now_ns_.store(value.count(), std::memory_order_release);
    }

    // Negative durations move the clock backwards.
    void advance(std::chrono::nanoseconds delta) noexcept {
        now_ns_.fetch_add(delta.count(), std::memory_order_acq_rel);
    }

private:
    std::atomic<int64_t> now_ns_;
};

/**
 * Shared SystemClock instance used by the process-wide generator.
 */
[[nodiscard]] std::shared_ptr<const ClockSource> system_clock();

} // namespace chronoid
