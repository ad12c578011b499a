#pragma once

#include <cstdint>
#include <vector>

// Build-time scheme selection. CMake passes each switch as 0 or 1. The
// fallbacks below match the CMake option defaults (everything on).
#ifndef TUID_FEATURE_V1
#define TUID_FEATURE_V1 1
#endif
#ifndef TUID_FEATURE_V3
#define TUID_FEATURE_V3 1
#endif
#ifndef TUID_FEATURE_V4
#define TUID_FEATURE_V4 1
#endif
#ifndef TUID_FEATURE_V5
#define TUID_FEATURE_V5 1
#endif
#ifndef TUID_FEATURE_V6
#define TUID_FEATURE_V6 1
#endif
#ifndef TUID_FEATURE_V7
#define TUID_FEATURE_V7 1
#endif
#ifndef TUID_FEATURE_V8
#define TUID_FEATURE_V8 1
#endif
#ifndef TUID_UNSTABLE
#define TUID_UNSTABLE 1
#endif
#ifndef TUID_FEATURE_SERDE
#define TUID_FEATURE_SERDE 1
#endif

// v6, v7 and v8 need the unstable switch as well as their own.
#define TUID_HAS_V1 (TUID_FEATURE_V1 != 0)
#define TUID_HAS_V3 (TUID_FEATURE_V3 != 0)
#define TUID_HAS_V4 (TUID_FEATURE_V4 != 0)
#define TUID_HAS_V5 (TUID_FEATURE_V5 != 0)
#define TUID_HAS_V6 (TUID_FEATURE_V6 != 0 && TUID_UNSTABLE != 0)
#define TUID_HAS_V7 (TUID_FEATURE_V7 != 0 && TUID_UNSTABLE != 0)
#define TUID_HAS_V8 (TUID_FEATURE_V8 != 0 && TUID_UNSTABLE != 0)
#define TUID_HAS_SERDE (TUID_FEATURE_SERDE != 0)

namespace tuid::features {

/**
 * Whether the generation scheme with the given version number was compiled in.
 * Versions that name no supported scheme (0, 2, 9..15) always report false.
 */
[[nodiscard]] bool scheme_enabled(std::uint8_t version) noexcept;

/**
 * Every compiled-in scheme version, ascending.
 */
[[nodiscard]] std::vector<std::uint8_t> enabled_schemes();

[[nodiscard]] bool serialization_enabled() noexcept;

} // namespace tuid::features
