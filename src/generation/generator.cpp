#include "generation/generator.hpp"

#include "core/bit_packer.hpp"
#include "core/logging.hpp"
#include "crypto/entropy.hpp"

#include <QDebug>

#include <array>
#include <stdexcept>

namespace chronoid::generation {
namespace {

// Bit 40 of the 48-bit node is the multicast bit of the first octet; set it
// so a random node can never collide with a hardware address.
constexpr uint64_t MULTICAST_BIT = uint64_t{1} << 40;

struct TimeExtras {
    uint64_t node;
    uint16_t clock_seq;
};

TimeExtras draw_time_extras(std::optional<uint64_t> node, std::optional<uint16_t> clock_seq) {
    return TimeExtras{
        .node = node ? *node & low_mask(layout::NODE_BITS)
                     : crypto::random_bits(layout::NODE_BITS) | MULTICAST_BIT,
        .clock_seq = static_cast<uint16_t>(
            clock_seq ? *clock_seq & low_mask(layout::CLOCK_SEQ_BITS)
                      : crypto::random_bits(layout::CLOCK_SEQ_BITS)),
    };
}

struct CounterSeed {
    uint64_t counter;  // 42 bits, top bit clear
    uint32_t tail;
};

// 80 random bits: 41 for the counter (headroom bit left clear), 32 for the tail.
CounterSeed draw_counter_seed() {
    std::array<uint8_t, 10> buf{};
    crypto::fill_random(buf);
    uint64_t counter = 0;
    for (size_t i = 0; i < 6; ++i) {
        counter = (counter << 8) | buf[i];
    }
    uint32_t tail = 0;
    for (size_t i = 6; i < buf.size(); ++i) {
        tail = (tail << 8) | buf[i];
    }
    return CounterSeed{
        .counter = counter & (layout::MAX_COUNTER_V7 >> 1),
        .tail = tail,
    };
}

} // namespace

Generator::Generator(std::shared_ptr<const ClockSource> clock)
    : clock_(std::move(clock)) {
    if (!clock_) {
        throw std::invalid_argument("Generator requires a clock source");
    }
}

uint64_t Generator::next_ticks(std::optional<uint64_t>& last, bool& wrapped) {
    auto ticks = clock_->gregorian_ticks();
    wrapped = false;
    if (last && ticks <= *last) {
        // The register stays within the 60-bit field, so past the last
        // representable tick it wraps to 0.
        ticks = (*last + 1) & low_mask(layout::TICKS_BITS);
        wrapped = ticks == 0;
    }
    last = ticks;
    return ticks;
}

Uuid Generator::generate_v1(std::optional<uint64_t> node, std::optional<uint16_t> clock_seq) {
    const auto extras = draw_time_extras(node, clock_seq);
    uint64_t ticks = 0;
    bool wrapped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ticks = next_ticks(state_.last_timestamp_v1, wrapped);
    }
    if (wrapped) {
        qCWarning(chronoidGeneratorLog) << "v1 timestamp register exhausted; wrapped to 0";
    }
    if (generator_trace_enabled()) {
        qCInfo(chronoidGeneratorLog) << "v1 ticks=" << ticks << "clock_seq=" << extras.clock_seq;
    }
    return Uuid(layout::pack_v1({.ticks = ticks, .clock_seq = extras.clock_seq, .node = extras.node}));
}

Uuid Generator::generate_v6(std::optional<uint64_t> node, std::optional<uint16_t> clock_seq) {
    const auto extras = draw_time_extras(node, clock_seq);
    uint64_t ticks = 0;
    bool wrapped = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ticks = next_ticks(state_.last_timestamp_v6, wrapped);
    }
    if (wrapped) {
        qCWarning(chronoidGeneratorLog) << "v6 timestamp register exhausted; wrapped to 0";
    }
    if (generator_trace_enabled()) {
        qCInfo(chronoidGeneratorLog) << "v6 ticks=" << ticks << "clock_seq=" << extras.clock_seq;
    }
    return Uuid(layout::pack_v6({.ticks = ticks, .clock_seq = extras.clock_seq, .node = extras.node}));
}

Uuid Generator::generate_v7() {
    // Drawn up front so the critical section holds no I/O.
    const auto seed = draw_counter_seed();

    layout::CounterFields fields{};
    std::optional<uint64_t> behind_by;
    bool rolled_over = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now_ms = clock_->unix_millis();
        auto& last_ms = state_.last_timestamp_v7;
        auto& last_counter = state_.last_counter_v7;

        if (!last_ms || now_ms > *last_ms) {
            v7_clock_behind_ = false;
            fields = {.unix_ms = now_ms, .counter = seed.counter, .tail = seed.tail};
        } else {
            if (now_ms < *last_ms && !v7_clock_behind_) {
                v7_clock_behind_ = true;
                behind_by = *last_ms - now_ms;
            }
            // Same or earlier millisecond: keep the stored timestamp, bump the counter.
            fields = {.unix_ms = *last_ms, .counter = last_counter + 1, .tail = seed.tail};
            if (fields.counter > layout::MAX_COUNTER_V7) {
                rolled_over = true;
                // Wraps to 0 past the last representable millisecond.
                fields = {.unix_ms = (*last_ms + 1) & low_mask(layout::UNIX_MS_BITS),
                          .counter = seed.counter,
                          .tail = seed.tail};
            }
        }

        last_ms = fields.unix_ms;
        last_counter = fields.counter;
    }

    if (behind_by) {
        qCDebug(chronoidGeneratorLog) << "v7 clock reading" << *behind_by
                                      << "ms behind last timestamp; holding" << fields.unix_ms;
    }
    if (rolled_over) {
        if (fields.unix_ms == 0) {
            qCWarning(chronoidGeneratorLog) << "v7 timestamp register exhausted; wrapped to 0";
        } else {
            qCDebug(chronoidGeneratorLog) << "v7 counter exhausted; advanced timestamp to" << fields.unix_ms;
        }
    }
    if (generator_trace_enabled()) {
        qCInfo(chronoidGeneratorLog) << "v7 unix_ms=" << fields.unix_ms << "counter=" << fields.counter;
    }
    return Uuid(layout::pack_v7(fields));
}

Uuid Generator::generate_v8(std::optional<uint64_t> a,
                            std::optional<uint64_t> b,
                            std::optional<uint64_t> c) const {
    // No shared state; the blocks are masked to their widths by pack_v8.
    return Uuid(layout::pack_v8({
        .a = a ? *a : crypto::random_bits(layout::BLOCK_A_BITS),
        .b = b ? *b : crypto::random_bits(layout::BLOCK_B_BITS),
        .c = c ? *c : crypto::random_bits(layout::BLOCK_C_BITS),
    }));
}

GeneratorState Generator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Generator::restore(const GeneratorState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
    v7_clock_behind_ = false;
}

Generator& default_generator() {
    static Generator instance;
    return instance;
}

Uuid generate_v1(std::optional<uint64_t> node, std::optional<uint16_t> clock_seq) {
    return default_generator().generate_v1(node, clock_seq);
}

Uuid generate_v6(std::optional<uint64_t> node, std::optional<uint16_t> clock_seq) {
    return default_generator().generate_v6(node, clock_seq);
}

Uuid generate_v7() {
    return default_generator().generate_v7();
}

Uuid generate_v8(std::optional<uint64_t> a, std::optional<uint64_t> b, std::optional<uint64_t> c) {
    return default_generator().generate_v8(a, b, c);
}

} // namespace chronoid::generation
