#include "crypto/entropy.hpp"

#include "core/logging.hpp"
#include "core/uint128.hpp"

#include <sodium.h>

#include <QDebug>

#include <array>
#include <mutex>

namespace chronoid::crypto {
namespace {

void ensure_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        // Throws out of call_once on failure; the next caller retries.
        init().unwrap();
    });
}

} // namespace

Result<void, Error> init() {
    // 0 on first success, 1 if already initialized, -1 on failure.
    if (sodium_init() < 0) {
        qCCritical(chronoidEntropyLog) << "sodium_init failed; no random source available";
        return Result<void, Error>::err(Error{"Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

void fill_random(std::span<uint8_t> out) {
    ensure_initialized();
    randombytes_buf(out.data(), out.size());
}

uint64_t random_bits(unsigned width) {
    std::array<uint8_t, 8> buf{};
    fill_random(buf);
    uint64_t value = 0;
    for (auto b : buf) {
        value = (value << 8) | b;
    }
    return value & low_mask(width);
}

} // namespace chronoid::crypto
