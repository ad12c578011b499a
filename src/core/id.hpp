#pragma once

#include "core/logging.hpp"
#include "core/result.hpp"
#include "core/schemes.hpp"
#include "core/timestamp.hpp"
#include "core/uuid.hpp"

#include <QDebug>

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

namespace tuid {

/**
 * Id<Subject, Scheme> - A Uuid tagged with what it identifies and how it was
 * generated.
 *
 * Both parameters exist only for the type checker: nothing of them is stored,
 * so an Id is exactly as large as a Uuid, and Subject may be an incomplete
 * type. Id<User, V4> and Id<Role, V4> do not compare, convert or assign to each
 * other, and neither do Id<User, V1> and Id<User, V4>.
 *
 * Usage:
 *   struct User;
 *   using UserId = tuid::Id<User, tuid::V4>;
 *
 *   auto id = UserId::generate();
 *
 *   auto raw = tuid::Uuid::parse(text);
 *   if (raw) {
 *       auto checked = UserId::from_untyped(*raw);  // Result<UserId>
 *   }
 *
 * Every constructor writes the version nibble of its Scheme, so an Id built
 * through this class always reports Scheme::version. The Subject, on the other
 * hand, is whatever the caller of from_untyped claims it is.
 */
template<typename Subject, Scheme S>
class Id {
public:
    using subject_type = Subject;
    using scheme_type = S;

    static constexpr std::uint8_t version = S::version;

#if TUID_HAS_V1
    [[nodiscard]] static Id generate(const Timestamp& ts, const NodeId& node) noexcept
        requires std::same_as<S, V1>
    {
        return Id(Uuid::new_v1(ts, node));
    }
#endif

#if TUID_HAS_V3
    [[nodiscard]] static Id generate(const Uuid& ns, std::span<const std::uint8_t> name)
        requires std::same_as<S, V3>
    {
        return Id(Uuid::new_v3(ns, name));
    }

    [[nodiscard]] static Id generate(const Uuid& ns, std::string_view name)
        requires std::same_as<S, V3>
    {
        return Id(Uuid::new_v3(ns, name));
    }
#endif

#if TUID_HAS_V4
    [[nodiscard]] static Id generate()
        requires std::same_as<S, V4>
    {
        return Id(Uuid::new_v4());
    }
#endif

#if TUID_HAS_V5
    [[nodiscard]] static Id generate(const Uuid& ns, std::span<const std::uint8_t> name)
        requires std::same_as<S, V5>
    {
        return Id(Uuid::new_v5(ns, name));
    }

    [[nodiscard]] static Id generate(const Uuid& ns, std::string_view name)
        requires std::same_as<S, V5>
    {
        return Id(Uuid::new_v5(ns, name));
    }
#endif

#if TUID_HAS_V6
    [[nodiscard]] static Id generate(const Timestamp& ts, const NodeId& node) noexcept
        requires std::same_as<S, V6>
    {
        return Id(Uuid::new_v6(ts, node));
    }
#endif

#if TUID_HAS_V7
    [[nodiscard]] static Id generate(const Timestamp& ts)
        requires std::same_as<S, V7>
    {
        return Id(Uuid::new_v7(ts));
    }
#endif

#if TUID_HAS_V8
    [[nodiscard]] static Id generate(const Uuid::Bytes& buf) noexcept
        requires std::same_as<S, V8>
    {
        return Id(Uuid::new_v8(buf));
    }
#endif

    /**
     * Adopt an untyped Uuid if its version nibble matches this Scheme.
     * The bits are kept as they are; the Subject is not (and cannot be)
     * checked.
     */
    [[nodiscard]] static Result<Id> from_untyped(const Uuid& uuid) {
        const auto actual = uuid.version_num();
        if (actual != version) {
            qCDebug(lcId) << "from_untyped: rejecting" << uuid
                          << "expected version" << int(version) << "found" << int(actual);
            return Result<Id>::err(Error::wrong_version(version, actual));
        }
        return Result<Id>::ok(Id(uuid));
    }

    [[nodiscard]] constexpr const Uuid& untyped() const noexcept {
        return uuid_;
    }

    constexpr const Uuid& operator*() const noexcept {
        return uuid_;
    }

    constexpr const Uuid* operator->() const noexcept {
        return &uuid_;
    }

    [[nodiscard]] std::string to_string() const {
        return uuid_.to_string();
    }

    friend constexpr bool operator==(const Id& a, const Id& b) noexcept {
        return a.uuid_ == b.uuid_;
    }

    friend constexpr std::strong_ordering operator<=>(const Id& a, const Id& b) noexcept {
        return a.uuid_ <=> b.uuid_;
    }

    friend std::ostream& operator<<(std::ostream& os, const Id& id) {
        return os << id.uuid_;
    }

    friend QDebug operator<<(QDebug dbg, const Id& id) {
        QDebugStateSaver saver(dbg);
        dbg.nospace() << "Id(" << id.uuid_ << ')';
        return dbg;
    }

    friend std::size_t qHash(const Id& id, std::size_t seed = 0) noexcept {
        return ::tuid::qHash(id.uuid_, seed);
    }

private:
    explicit constexpr Id(const Uuid& uuid) noexcept : uuid_(uuid) {}

    Uuid uuid_;
};

} // namespace tuid

namespace std {
    template<typename Subject, tuid::Scheme S>
    struct hash<tuid::Id<Subject, S>> {
        size_t operator()(const tuid::Id<Subject, S>& id) const noexcept {
            return tuid::hash_value(id.untyped());
        }
    };
}
