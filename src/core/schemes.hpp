#pragma once

#include "core/features.hpp"

#include <concepts>
#include <cstdint>

namespace tuid {

// Scheme tags. Never instantiated; each one only names a generation
// algorithm and the version nibble that algorithm writes.

#if TUID_HAS_V1
struct V1 { static constexpr std::uint8_t version = 1; };   // time-based
#endif
#if TUID_HAS_V3
struct V3 { static constexpr std::uint8_t version = 3; };   // namespace + name, MD5
#endif
#if TUID_HAS_V4
struct V4 { static constexpr std::uint8_t version = 4; };   // random
#endif
#if TUID_HAS_V5
struct V5 { static constexpr std::uint8_t version = 5; };   // namespace + name, SHA-1
#endif
#if TUID_HAS_V6
struct V6 { static constexpr std::uint8_t version = 6; };   // time-based, sortable
#endif
#if TUID_HAS_V7
struct V7 { static constexpr std::uint8_t version = 7; };   // Unix epoch time-based
#endif
#if TUID_HAS_V8
struct V8 { static constexpr std::uint8_t version = 8; };   // custom
#endif

template<typename S>
concept Scheme = requires {
    { S::version } -> std::convertible_to<std::uint8_t>;
} && (S::version >= 1 && S::version <= 8 && S::version != 2);

} // namespace tuid
