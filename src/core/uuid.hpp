#pragma once

#include "core/features.hpp"
#include "core/timestamp.hpp"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>

class QDebug;

namespace tuid {

/**
 * Variant - The layout family encoded in the top bits of byte 8.
 */
enum class Variant : std::uint8_t {
    NCS,        // 0xx: reserved, NCS backward compatibility
    RFC9562,    // 10x: the layout every scheme in this library produces
    Microsoft,  // 110: reserved, Microsoft backward compatibility
    Future,     // 111: reserved for future definition
};

/**
 * Uuid - Universally Unique Identifier.
 *
 * A 128-bit value stored as 16 bytes in network order. Provides the
 * per-version generators, parsing, and string conversion. Carries no
 * information about what it identifies; see Id for that.
 */
class Uuid {
public:
    static constexpr std::size_t BYTE_SIZE = 16;
    using Bytes = std::array<std::uint8_t, BYTE_SIZE>;

    /**
     * Create a nil (all zeros) UUID.
     */
    constexpr Uuid() noexcept : bytes_{} {}

    /**
     * Create a UUID from raw bytes. No version or variant bits are touched.
     */
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] static constexpr Uuid from_bytes(Bytes bytes) noexcept {
        return Uuid(bytes);
    }

    [[nodiscard]] static constexpr Uuid nil() noexcept {
        return Uuid();
    }

    [[nodiscard]] static constexpr Uuid max() noexcept {
        Bytes b{};
        for (auto& byte : b) byte = 0xFF;
        return Uuid(b);
    }

#if TUID_HAS_V1
    /**
     * Time-based UUID: Gregorian ticks split low/mid/high, then the clock
     * sequence and node.
     */
    [[nodiscard]] static Uuid new_v1(const Timestamp& ts, const NodeId& node) noexcept;
#endif

#if TUID_HAS_V3
    /**
     * Name-based UUID from MD5(namespace || name). Deterministic.
     */
    [[nodiscard]] static Uuid new_v3(const Uuid& ns, std::span<const std::uint8_t> name);
    [[nodiscard]] static Uuid new_v3(const Uuid& ns, std::string_view name);
#endif

#if TUID_HAS_V4
    /**
     * Random UUID from the libsodium entropy source.
     */
    [[nodiscard]] static Uuid new_v4();
#endif

#if TUID_HAS_V5
    /**
     * Name-based UUID from SHA-1(namespace || name). Deterministic.
     */
    [[nodiscard]] static Uuid new_v5(const Uuid& ns, std::span<const std::uint8_t> name);
    [[nodiscard]] static Uuid new_v5(const Uuid& ns, std::string_view name);
#endif

#if TUID_HAS_V6
    /**
     * v1 with the timestamp stored most significant bits first, so the
     * bytes sort in creation order.
     */
    [[nodiscard]] static Uuid new_v6(const Timestamp& ts, const NodeId& node) noexcept;
#endif

#if TUID_HAS_V7
    /**
     * 48-bit Unix milliseconds followed by random bits.
     */
    [[nodiscard]] static Uuid new_v7(const Timestamp& ts);
#endif

#if TUID_HAS_V8
    /**
     * Caller-defined payload; only version and variant are overwritten.
     */
    [[nodiscard]] static Uuid new_v8(Bytes buf) noexcept;
#endif

    /**
     * Parse a UUID. Accepts the hyphenated, simple (32 hex digits), braced
     * and "urn:uuid:" forms, in either case.
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str);

    /**
     * Convert to string representation (hyphenated, lowercase).
     * Format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * The 4-bit version field (high nibble of byte 6).
     */
    [[nodiscard]] constexpr std::uint8_t version_num() const noexcept {
        return static_cast<std::uint8_t>(bytes_[6] >> 4);
    }

    [[nodiscard]] constexpr Variant variant() const noexcept {
        const auto b = bytes_[8];
        if ((b & 0x80) == 0x00) return Variant::NCS;
        if ((b & 0xC0) == 0x80) return Variant::RFC9562;
        if ((b & 0xE0) == 0xC0) return Variant::Microsoft;
        return Variant::Future;
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0x00) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr bool is_max() const noexcept {
        for (auto b : bytes_) {
            if (b != 0xFF) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    Bytes bytes_;
};

[[nodiscard]] const char* to_string(Variant variant) noexcept;

std::ostream& operator<<(std::ostream& os, const Uuid& uuid);
QDebug operator<<(QDebug dbg, const Uuid& uuid);

// Well-known namespaces for the name-based schemes (RFC 9562 Appendix C).
inline constexpr Uuid NAMESPACE_DNS{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid NAMESPACE_URL{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid NAMESPACE_OID{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid NAMESPACE_X500{Uuid::Bytes{
    0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

[[nodiscard]] std::size_t hash_value(const Uuid& uuid) noexcept;

// For QHash / QSet.
[[nodiscard]] inline std::size_t qHash(const Uuid& uuid, std::size_t seed = 0) noexcept {
    return hash_value(uuid) ^ seed;
}

} // namespace tuid

// Hash specialization for use in std containers
namespace std {
    template<>
    struct hash<tuid::Uuid> {
        size_t operator()(const tuid::Uuid& uuid) const noexcept {
            return tuid::hash_value(uuid);
        }
    };
}
