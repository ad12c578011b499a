#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/id.hpp"

using namespace tuid;

namespace {

struct Account;

Uuid with_version(Uuid::Bytes bytes, std::uint8_t version) {
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | (version << 4));
    return Uuid::from_bytes(bytes);
}

template<typename S>
void check_conversion(const Uuid::Bytes& bytes, std::uint8_t nibble) {
    const auto uuid = with_version(bytes, nibble);
    const auto result = Id<Account, S>::from_untyped(uuid);

    if (nibble == S::version) {
        RC_ASSERT(result.is_ok());
        RC_ASSERT(result.unwrap().untyped() == uuid);
    } else {
        RC_ASSERT(result.is_err());
        RC_ASSERT(result.unwrap_err() == Error::wrong_version(S::version, nibble));
    }
}

} // namespace

TEST_CASE("Property: from_untyped accepts exactly the matching nibble", "[property][id]") {
    REQUIRE(rc::check("Ok iff version nibble equals the scheme version",
        [](const Uuid::Bytes& bytes) {
            const auto nibble = *rc::gen::inRange<int>(0, 16);
            const auto v = static_cast<std::uint8_t>(nibble);
#if TUID_HAS_V1
            check_conversion<V1>(bytes, v);
#endif
#if TUID_HAS_V3
            check_conversion<V3>(bytes, v);
#endif
#if TUID_HAS_V4
            check_conversion<V4>(bytes, v);
#endif
#if TUID_HAS_V5
            check_conversion<V5>(bytes, v);
#endif
#if TUID_HAS_V6
            check_conversion<V6>(bytes, v);
#endif
#if TUID_HAS_V7
            check_conversion<V7>(bytes, v);
#endif
#if TUID_HAS_V8
            check_conversion<V8>(bytes, v);
#endif
        }));
}

#if TUID_HAS_V4
TEST_CASE("Property: Id equality and hash depend only on the Uuid", "[property][id]") {
    using AccountId = Id<Account, V4>;

    REQUIRE(rc::check("ids over equal bits are equal and hash equally",
        [](const Uuid::Bytes& a, const Uuid::Bytes& b) {
            const auto ua = with_version(a, 4);
            const auto ub = with_version(b, 4);
            const auto ia = AccountId::from_untyped(ua).unwrap();
            const auto ib = AccountId::from_untyped(ub).unwrap();

            RC_ASSERT((ia == ib) == (ua == ub));
            RC_ASSERT((ia < ib) == (ua < ub));
            RC_ASSERT(std::hash<AccountId>{}(ia) == std::hash<Uuid>{}(ua));
            RC_ASSERT(qHash(ia) == qHash(ua));
            RC_ASSERT(ia.to_string() == ua.to_string());
        }));
}
#endif

#if TUID_HAS_V5
TEST_CASE("Property: typed v5 matches untyped v5", "[property][id][v5]") {
    REQUIRE(rc::check("Id<_, V5>::generate wraps Uuid::new_v5",
        [](const Uuid::Bytes& ns_bytes, const std::string& name) {
            const auto ns = Uuid::from_bytes(ns_bytes);
            const auto id = Id<Account, V5>::generate(ns, name);
            RC_ASSERT(id.untyped() == Uuid::new_v5(ns, name));
            RC_ASSERT(Id<Account, V5>::from_untyped(*id).unwrap() == id);
        }));
}
#endif
