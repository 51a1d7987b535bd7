#include "core/bit_packer.hpp"

namespace chronoid {

const char* to_string(Variant variant) noexcept {
    switch (variant) {
        case Variant::ReservedNcs: return "reserved for NCS compatibility";
        case Variant::Rfc4122: return "specified in RFC 4122";
        case Variant::ReservedMicrosoft: return "reserved for Microsoft compatibility";
        case Variant::ReservedFuture: return "reserved for future definition";
    }
    return "?";
}

namespace layout {
namespace {

Uint128 pack_clock_seq_and_node(uint16_t clock_seq, uint64_t node) {
    return (Uint128{clock_seq & low_mask(CLOCK_SEQ_BITS)} << 48) |
           Uint128{node & low_mask(NODE_BITS)};
}

} // namespace

Uint128 pack_v1(const TimeFields& fields) noexcept {
    const auto ticks = fields.ticks & low_mask(TICKS_BITS);
    const auto time_low = ticks & 0xFFFF'FFFF;
    const auto time_mid = (ticks >> 32) & 0xFFFF;
    const auto time_hi = (ticks >> 48) & 0x0FFF;

    auto payload = Uint128{time_low} << 96;
    payload |= Uint128{time_mid} << 80;
    payload |= Uint128{time_hi} << 64;
    payload |= pack_clock_seq_and_node(fields.clock_seq, fields.node);
    return pack(1, payload);
}

TimeFields unpack_v1(Uint128 value) noexcept {
    const auto time_low = value.bits(96, 32);
    const auto time_mid = value.bits(80, 16);
    const auto time_hi = value.bits(64, 12);
    return TimeFields{
        .ticks = (time_hi << 48) | (time_mid << 32) | time_low,
        .clock_seq = static_cast<uint16_t>(value.bits(48, CLOCK_SEQ_BITS)),
        .node = value.bits(0, NODE_BITS),
    };
}

Uint128 pack_v6(const TimeFields& fields) noexcept {
    const auto ticks = fields.ticks & low_mask(TICKS_BITS);
    // Most significant 48 bits first so that byte order follows time order.
    const auto time_hi_and_mid = ticks >> 12;
    const auto time_low = ticks & 0x0FFF;

    auto payload = Uint128{time_hi_and_mid} << 80;
    payload |= Uint128{time_low} << 64;
    payload |= pack_clock_seq_and_node(fields.clock_seq, fields.node);
    return pack(6, payload);
}

TimeFields unpack_v6(Uint128 value) noexcept {
    const auto time_hi_and_mid = value.bits(80, 48);
    const auto time_low = value.bits(64, 12);
    return TimeFields{
        .ticks = (time_hi_and_mid << 12) | time_low,
        .clock_seq = static_cast<uint16_t>(value.bits(48, CLOCK_SEQ_BITS)),
        .node = value.bits(0, NODE_BITS),
    };
}

Uint128 pack_v7(const CounterFields& fields) noexcept {
    const auto counter = fields.counter & MAX_COUNTER_V7;
    const auto counter_hi = counter >> COUNTER_LO_BITS;
    const auto counter_lo = counter & low_mask(COUNTER_LO_BITS);

    auto payload = Uint128{fields.unix_ms & low_mask(UNIX_MS_BITS)} << 80;
    payload |= Uint128{counter_hi} << 64;
    payload |= Uint128{counter_lo} << 32;
    payload |= Uint128{fields.tail};
    return pack(7, payload);
}

CounterFields unpack_v7(Uint128 value) noexcept {
    const auto counter_hi = value.bits(64, COUNTER_HI_BITS);
    const auto counter_lo = value.bits(32, COUNTER_LO_BITS);
    return CounterFields{
        .unix_ms = value.bits(80, UNIX_MS_BITS),
        .counter = (counter_hi << COUNTER_LO_BITS) | counter_lo,
        .tail = static_cast<uint32_t>(value.bits(0, TAIL_BITS)),
    };
}

Uint128 pack_v8(const CustomBlocks& blocks) noexcept {
    auto payload = Uint128{blocks.a & low_mask(BLOCK_A_BITS)} << 80;
    payload |= Uint128{blocks.b & low_mask(BLOCK_B_BITS)} << 64;
    payload |= Uint128{blocks.c & low_mask(BLOCK_C_BITS)};
    return pack(8, payload);
}

CustomBlocks unpack_v8(Uint128 value) noexcept {
    return CustomBlocks{
        .a = value.bits(80, BLOCK_A_BITS),
        .b = value.bits(64, BLOCK_B_BITS),
        .c = value.bits(0, BLOCK_C_BITS),
    };
}

} // namespace layout
} // namespace chronoid
