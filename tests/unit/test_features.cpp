#include <catch2/catch_test_macros.hpp>
#include "core/features.hpp"

#include <vector>

using namespace tuid;

TEST_CASE("Header switches agree with the compiled library", "[features]") {
    REQUIRE(features::scheme_enabled(1) == TUID_HAS_V1);
    REQUIRE(features::scheme_enabled(3) == TUID_HAS_V3);
    REQUIRE(features::scheme_enabled(4) == TUID_HAS_V4);
    REQUIRE(features::scheme_enabled(5) == TUID_HAS_V5);
    REQUIRE(features::scheme_enabled(6) == TUID_HAS_V6);
    REQUIRE(features::scheme_enabled(7) == TUID_HAS_V7);
    REQUIRE(features::scheme_enabled(8) == TUID_HAS_V8);
    REQUIRE(features::serialization_enabled() == TUID_HAS_SERDE);
}

TEST_CASE("Unstable schemes need the unstable switch", "[features]") {
    STATIC_REQUIRE(TUID_HAS_V6 == (TUID_FEATURE_V6 != 0 && TUID_UNSTABLE != 0));
    STATIC_REQUIRE(TUID_HAS_V7 == (TUID_FEATURE_V7 != 0 && TUID_UNSTABLE != 0));
    STATIC_REQUIRE(TUID_HAS_V8 == (TUID_FEATURE_V8 != 0 && TUID_UNSTABLE != 0));
}

TEST_CASE("enabled_schemes is ascending and skips reserved versions", "[features]") {
    const auto schemes = features::enabled_schemes();
    for (std::size_t i = 0; i < schemes.size(); ++i) {
        REQUIRE(schemes[i] != 2);
        REQUIRE(features::scheme_enabled(schemes[i]));
        if (i > 0) {
            REQUIRE(schemes[i - 1] < schemes[i]);
        }
    }
    REQUIRE_FALSE(features::scheme_enabled(0));
    REQUIRE_FALSE(features::scheme_enabled(9));
}
