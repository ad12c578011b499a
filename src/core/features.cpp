#include "core/features.hpp"

namespace tuid::features {

bool scheme_enabled(std::uint8_t version) noexcept {
    switch (version) {
        case 1: return TUID_HAS_V1;
        case 3: return TUID_HAS_V3;
        case 4: return TUID_HAS_V4;
        case 5: return TUID_HAS_V5;
        case 6: return TUID_HAS_V6;
        case 7: return TUID_HAS_V7;
        case 8: return TUID_HAS_V8;
        default: return false;
    }
}

std::vector<std::uint8_t> enabled_schemes() {
    std::vector<std::uint8_t> out;
    for (std::uint8_t v = 1; v <= 8; ++v) {
        if (scheme_enabled(v)) {
            out.push_back(v);
        }
    }
    return out;
}

bool serialization_enabled() noexcept {
    return TUID_HAS_SERDE;
}

} // namespace tuid::features
