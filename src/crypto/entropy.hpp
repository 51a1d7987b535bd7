#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <span>

namespace chronoid::crypto {

/**
 * Initialize libsodium. Safe to call repeatedly and from several threads.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * Fill `out` from the operating system CSPRNG (libsodium randombytes).
 * Throws std::runtime_error if the library cannot be initialized.
 */
void fill_random(std::span<uint8_t> out);

/**
 * Uniformly random value in [0, 2^width), width in 1..64.
 */
[[nodiscard]] uint64_t random_bits(unsigned width);

} // namespace chronoid::crypto
