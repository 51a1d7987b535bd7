#include "core/clock.hpp"

#include "core/timestamp.hpp"
#include "core/uint128.hpp"

namespace chronoid {

uint64_t ClockSource::gregorian_ticks() const {
    const auto ns = now().count();
    // Floor division keeps readings just before 1970 ordered.
    auto unix_ticks = ns / 100;
    if (ns % 100 < 0) --unix_ticks;
    const auto ticks = static_cast<uint64_t>(unix_ticks + static_cast<int64_t>(GREGORIAN_UNIX_OFFSET_TICKS));
    return ticks & low_mask(60);
}

uint64_t ClockSource::unix_millis() const {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now()).count();
    if (ms < 0) return 0;
    return static_cast<uint64_t>(ms) & low_mask(48);
}

std::chrono::nanoseconds SystemClock::now() const {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch());
}

std::shared_ptr<const ClockSource> system_clock() {
    static const auto instance = std::make_shared<const SystemClock>();
    return instance;
}

} // namespace chronoid
