#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace tuid::crypto {

using Md5Digest = std::array<std::uint8_t, 16>;
using Sha1Digest = std::array<std::uint8_t, 20>;

// Digests over the concatenation `prefix || data`.
[[nodiscard]] Md5Digest md5(std::span<const std::uint8_t> prefix,
                            std::span<const std::uint8_t> data);

[[nodiscard]] Sha1Digest sha1(std::span<const std::uint8_t> prefix,
                              std::span<const std::uint8_t> data);

} // namespace tuid::crypto
