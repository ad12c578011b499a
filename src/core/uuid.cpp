#include "core/uuid.hpp"

#include "core/logging.hpp"
#include "crypto/digest.hpp"
#include "crypto/random.hpp"

#include <QDebug>

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace tuid {

namespace {

constexpr void stamp(Uuid::Bytes& bytes, std::uint8_t version) noexcept {
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | (version << 4));
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
}

[[maybe_unused]] Uuid::Bytes time_fields(std::uint32_t first,
                                         std::uint16_t second,
                                         std::uint16_t third,
                                         std::uint16_t counter,
                                         const NodeId& node) noexcept {
    Uuid::Bytes b{};
    b[0] = static_cast<std::uint8_t>(first >> 24);
    b[1] = static_cast<std::uint8_t>(first >> 16);
    b[2] = static_cast<std::uint8_t>(first >> 8);
    b[3] = static_cast<std::uint8_t>(first);
    b[4] = static_cast<std::uint8_t>(second >> 8);
    b[5] = static_cast<std::uint8_t>(second);
    b[6] = static_cast<std::uint8_t>(third >> 8);
    b[7] = static_cast<std::uint8_t>(third);
    b[8] = static_cast<std::uint8_t>((counter >> 8) & 0x3F);
    b[9] = static_cast<std::uint8_t>(counter);
    std::copy(node.begin(), node.end(), b.begin() + 10);
    return b;
}

[[maybe_unused]] std::span<const std::uint8_t> as_bytes(std::string_view s) noexcept {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool starts_with_ci(std::string_view str, std::string_view prefix) noexcept {
    if (str.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        const char c = str[i];
        const char lower = (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
        if (lower != prefix[i]) return false;
    }
    return true;
}

} // namespace

#if TUID_HAS_V1
Uuid Uuid::new_v1(const Timestamp& ts, const NodeId& node) noexcept {
    const auto [ticks, counter] = ts.to_gregorian();
    auto bytes = time_fields(static_cast<std::uint32_t>(ticks & 0xFFFF'FFFF),
                             static_cast<std::uint16_t>((ticks >> 32) & 0xFFFF),
                             static_cast<std::uint16_t>((ticks >> 48) & 0x0FFF),
                             counter, node);
    stamp(bytes, 1);
    return Uuid(bytes);
}
#endif

#if TUID_HAS_V3
Uuid Uuid::new_v3(const Uuid& ns, std::span<const std::uint8_t> name) {
    const auto digest = crypto::md5(ns.bytes(), name);
    Bytes bytes{};
    std::copy_n(digest.begin(), BYTE_SIZE, bytes.begin());
    stamp(bytes, 3);
    return Uuid(bytes);
}

Uuid Uuid::new_v3(const Uuid& ns, std::string_view name) {
    return new_v3(ns, as_bytes(name));
}
#endif

#if TUID_HAS_V4
Uuid Uuid::new_v4() {
    auto bytes = crypto::random_bytes<BYTE_SIZE>();
    stamp(bytes, 4);
    return Uuid(bytes);
}
#endif

#if TUID_HAS_V5
Uuid Uuid::new_v5(const Uuid& ns, std::span<const std::uint8_t> name) {
    const auto digest = crypto::sha1(ns.bytes(), name);
    Bytes bytes{};
    std::copy_n(digest.begin(), BYTE_SIZE, bytes.begin());
    stamp(bytes, 5);
    return Uuid(bytes);
}

Uuid Uuid::new_v5(const Uuid& ns, std::string_view name) {
    return new_v5(ns, as_bytes(name));
}
#endif

#if TUID_HAS_V6
Uuid Uuid::new_v6(const Timestamp& ts, const NodeId& node) noexcept {
    const auto [ticks, counter] = ts.to_gregorian();
    auto bytes = time_fields(static_cast<std::uint32_t>((ticks >> 28) & 0xFFFF'FFFF),
                             static_cast<std::uint16_t>((ticks >> 12) & 0xFFFF),
                             static_cast<std::uint16_t>(ticks & 0x0FFF),
                             counter, node);
    stamp(bytes, 6);
    return Uuid(bytes);
}
#endif

#if TUID_HAS_V7
Uuid Uuid::new_v7(const Timestamp& ts) {
    const auto millis = ts.unix_millis();
    auto bytes = crypto::random_bytes<BYTE_SIZE>();
    for (int i = 0; i < 6; ++i) {
        bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(millis >> (40 - 8 * i));
    }
    stamp(bytes, 7);
    return Uuid(bytes);
}
#endif

#if TUID_HAS_V8
Uuid Uuid::new_v8(Bytes buf) noexcept {
    stamp(buf, 8);
    return Uuid(buf);
}
#endif

std::optional<Uuid> Uuid::parse(std::string_view str) {
    const auto input = str;
    const auto reject = [input](const char* reason) -> std::optional<Uuid> {
        qCDebug(lcUuid) << "parse: rejecting"
                        << QString::fromUtf8(input.data(), static_cast<qsizetype>(input.size()))
                        << reason;
        return std::nullopt;
    };

    if (starts_with_ci(str, "urn:uuid:")) {
        str.remove_prefix(9);
    } else if (str.size() == 38 && str.front() == '{' && str.back() == '}') {
        str = str.substr(1, 36);
    }

    const bool hyphenated = str.size() == 36;
    if (!hyphenated && str.size() != 32) {
        return reject("(bad length)");
    }

    Bytes bytes{};
    std::size_t pos = 0;
    for (std::size_t i = 0; i < BYTE_SIZE; ++i) {
        if (hyphenated && (pos == 8 || pos == 13 || pos == 18 || pos == 23)) {
            if (str[pos] != '-') return reject("(misplaced hyphen)");
            ++pos;
        }
        const int hi = hex_value(str[pos]);
        const int lo = hex_value(str[pos + 1]);
        if (hi < 0 || lo < 0) return reject("(not hex)");
        bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
        pos += 2;
    }

    return Uuid(bytes);
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < BYTE_SIZE; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes_[i]);
    }

    return oss.str();
}

const char* to_string(Variant variant) noexcept {
    switch (variant) {
        case Variant::NCS: return "NCS";
        case Variant::RFC9562: return "RFC9562";
        case Variant::Microsoft: return "Microsoft";
        case Variant::Future: return "Future";
    }
    return "?";
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid) {
    return os << uuid.to_string();
}

QDebug operator<<(QDebug dbg, const Uuid& uuid) {
    QDebugStateSaver saver(dbg);
    dbg.noquote() << QString::fromStdString(uuid.to_string());
    return dbg;
}

std::size_t hash_value(const Uuid& uuid) noexcept {
    const auto& bytes = uuid.bytes();
    std::size_t h = 0;
    for (std::size_t i = 0; i < bytes.size(); i += sizeof(std::size_t)) {
        std::size_t chunk = 0;
        for (std::size_t j = 0; j < sizeof(std::size_t) && i + j < bytes.size(); ++j) {
            chunk |= static_cast<std::size_t>(bytes[i + j]) << (j * 8);
        }
        h ^= chunk + 0x9e3779b9 + (h << 6) + (h >> 2);
    }
    return h;
}

} // namespace tuid
