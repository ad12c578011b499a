#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace tuid::crypto {

/**
 * Initialize libsodium. Safe to call repeatedly and from several threads;
 * every function below calls it on first use.
 *
 * Throws std::runtime_error if the system entropy source is unusable.
 */
void init();

/**
 * Fill `out` with cryptographically strong random bytes.
 */
void fill_random(std::span<std::uint8_t> out);

template<std::size_t N>
[[nodiscard]] std::array<std::uint8_t, N> random_bytes() {
    std::array<std::uint8_t, N> out{};
    fill_random(out);
    return out;
}

/**
 * A uniformly distributed value in [0, upper_bound).
 */
[[nodiscard]] std::uint32_t random_uniform(std::uint32_t upper_bound);

} // namespace tuid::crypto
