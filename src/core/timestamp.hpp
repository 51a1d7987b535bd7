#pragma once

#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace chronoid {

// 100ns intervals between 1582-10-15T00:00:00Z and 1970-01-01T00:00:00Z.
inline constexpr uint64_t GREGORIAN_UNIX_OFFSET_TICKS = 0x01B2'1DD2'1381'4000;

/**
 * Timestamp - a point in time, stored as milliseconds since the Unix epoch.
 *
 * This is what the time-based UUID versions decode to for display and
 * comparison with wall-clock values.
 */
class Timestamp {
public:
    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    /**
     * Convert 100ns ticks since the Gregorian reform (v1/v6 time field).
     * Sub-millisecond precision is truncated.
     */
    [[nodiscard]] static constexpr Timestamp from_gregorian_ticks(uint64_t ticks) noexcept {
        const auto unix_ticks = static_cast<int64_t>(ticks) -
                                static_cast<int64_t>(GREGORIAN_UNIX_OFFSET_TICKS);
        // Floor division so pre-1970 values round toward the past.
        auto millis = unix_ticks / 10'000;
        if (unix_ticks % 10'000 < 0) --millis;
        return Timestamp(millis);
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    /**
     * Format as ISO 8601 string with millisecond precision, UTC.
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto secs = millis_ / 1000;
        auto ms = millis_ % 1000;
        if (ms < 0) {
            ms += 1000;
            --secs;
        }
        const auto time_t = static_cast<std::time_t>(secs);
        std::tm utc{};
#ifdef _WIN32
        gmtime_s(&utc, &time_t);
#else
        gmtime_r(&time_t, &utc);
#endif
        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

private:
    int64_t millis_;
};

} // namespace chronoid
