#include "cli/commands.hpp"

#include "core/features.hpp"
#include "core/id.hpp"
#include "core/logging.hpp"
#include "core/timestamp.hpp"
#include "core/uuid.hpp"
#include "crypto/random.hpp"

#include <QByteArray>
#include <QStringList>

#include <algorithm>
#include <optional>

namespace tuid::cli {

namespace {

// The command line knows nothing about what an identifier names.
struct Untagged;

template<typename S>
using CliId = Id<Untagged, S>;

[[nodiscard]] CommandResult fail(const QString& message) {
    return CommandResult::err(message);
}

[[nodiscard]] QString render(const Uuid& uuid) {
    return QString::fromStdString(uuid.to_string()) + QLatin1Char('\n');
}

[[nodiscard]] std::optional<Uuid> parse_uuid(const QString& text) {
    return Uuid::parse(text.trimmed().toStdString());
}

[[maybe_unused]] Result<Uuid, QString> resolve_namespace(const QString& text) {
    const auto key = text.trimmed().toLower();
    if (key.isEmpty()) {
        return Result<Uuid, QString>::err(QStringLiteral("--namespace is required for this scheme"));
    }
    if (key == QStringLiteral("dns")) return Result<Uuid, QString>::ok(NAMESPACE_DNS);
    if (key == QStringLiteral("url")) return Result<Uuid, QString>::ok(NAMESPACE_URL);
    if (key == QStringLiteral("oid")) return Result<Uuid, QString>::ok(NAMESPACE_OID);
    if (key == QStringLiteral("x500")) return Result<Uuid, QString>::ok(NAMESPACE_X500);

    const auto parsed = parse_uuid(key);
    if (!parsed) {
        return Result<Uuid, QString>::err(QStringLiteral("Invalid namespace: ") + text);
    }
    return Result<Uuid, QString>::ok(*parsed);
}

[[maybe_unused]] Result<NodeId, QString> resolve_node(const QString& text) {
    if (text.trimmed().isEmpty()) {
        // RFC 9562 6.10: random node with the multicast bit set.
        auto node = crypto::random_bytes<6>();
        node[0] |= 0x01;
        return Result<NodeId, QString>::ok(node);
    }

    QString hex = text.trimmed();
    hex.remove(QLatin1Char(':'));
    hex.remove(QLatin1Char('-'));
    const bool all_hex = std::all_of(hex.cbegin(), hex.cend(), [](QChar c) {
        return c.isDigit() || (c.toLower() >= QLatin1Char('a') && c.toLower() <= QLatin1Char('f'));
    });
    if (hex.size() != 12 || !all_hex) {
        return Result<NodeId, QString>::err(QStringLiteral("Invalid node id: ") + text);
    }
    const auto raw = QByteArray::fromHex(hex.toLatin1());

    NodeId node{};
    for (int i = 0; i < 6; ++i) {
        node[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(raw.at(i));
    }
    return Result<NodeId, QString>::ok(node);
}

[[maybe_unused]] ClockSequence& shared_context() {
    static Context context;
    return context;
}

template<typename S>
[[nodiscard]] CommandResult check_as(const Uuid& uuid) {
    return CliId<S>::from_untyped(uuid).match(
        [](const CliId<S>& id) {
            return CommandResult::ok(QStringLiteral("%1 is a valid v%2 identifier\n")
                                         .arg(QString::fromStdString(id.to_string()))
                                         .arg(int(S::version)));
        },
        [](const Error& error) {
            return CommandResult::err(QString::fromStdString(error.message()));
        });
}

} // namespace

CommandResult generate(const GenerateOptions& options) {
    qCDebug(lcCli) << "generate scheme" << options.scheme;

    switch (options.scheme) {
#if TUID_HAS_V1
        case 1: {
            const auto node = resolve_node(options.node);
            if (node.is_err()) return fail(node.unwrap_err());
            return CommandResult::ok(
                render(*CliId<V1>::generate(Timestamp::now(shared_context()), node.unwrap())));
        }
#endif
#if TUID_HAS_V3
        case 3: {
            const auto ns = resolve_namespace(options.ns);
            if (ns.is_err()) return fail(ns.unwrap_err());
            return CommandResult::ok(
                render(*CliId<V3>::generate(ns.unwrap(), options.name.toStdString())));
        }
#endif
#if TUID_HAS_V4
        case 4:
            return CommandResult::ok(render(*CliId<V4>::generate()));
#endif
#if TUID_HAS_V5
        case 5: {
            const auto ns = resolve_namespace(options.ns);
            if (ns.is_err()) return fail(ns.unwrap_err());
            return CommandResult::ok(
                render(*CliId<V5>::generate(ns.unwrap(), options.name.toStdString())));
        }
#endif
#if TUID_HAS_V6
        case 6: {
            const auto node = resolve_node(options.node);
            if (node.is_err()) return fail(node.unwrap_err());
            return CommandResult::ok(
                render(*CliId<V6>::generate(Timestamp::now(shared_context()), node.unwrap())));
        }
#endif
#if TUID_HAS_V7
        case 7:
            return CommandResult::ok(
                render(*CliId<V7>::generate(Timestamp::now(shared_context()))));
#endif
#if TUID_HAS_V8
        case 8: {
            const auto payload = parse_uuid(options.payload);
            if (!payload) {
                return fail(QStringLiteral("--bytes must be 32 hex digits for scheme 8"));
            }
            return CommandResult::ok(render(*CliId<V8>::generate(payload->bytes())));
        }
#endif
        default:
            return fail(QStringLiteral("Scheme %1 is not available in this build").arg(options.scheme));
    }
}

CommandResult inspect(const QString& text) {
    const auto uuid = parse_uuid(text);
    if (!uuid) {
        return fail(QStringLiteral("Not a UUID: ") + text);
    }

    return CommandResult::ok(QStringLiteral("uuid:    %1\nversion: %2\nvariant: %3\n")
                                 .arg(QString::fromStdString(uuid->to_string()))
                                 .arg(int(uuid->version_num()))
                                 .arg(QString::fromLatin1(to_string(uuid->variant()))));
}

CommandResult check(const QString& text, int scheme) {
    const auto uuid = parse_uuid(text);
    if (!uuid) {
        return fail(QStringLiteral("Not a UUID: ") + text);
    }

    switch (scheme) {
#if TUID_HAS_V1
        case 1: return check_as<V1>(*uuid);
#endif
#if TUID_HAS_V3
        case 3: return check_as<V3>(*uuid);
#endif
#if TUID_HAS_V4
        case 4: return check_as<V4>(*uuid);
#endif
#if TUID_HAS_V5
        case 5: return check_as<V5>(*uuid);
#endif
#if TUID_HAS_V6
        case 6: return check_as<V6>(*uuid);
#endif
#if TUID_HAS_V7
        case 7: return check_as<V7>(*uuid);
#endif
#if TUID_HAS_V8
        case 8: return check_as<V8>(*uuid);
#endif
        default:
            return fail(QStringLiteral("Scheme %1 is not available in this build").arg(scheme));
    }
}

QString features() {
    QStringList schemes;
    for (const auto v : features::enabled_schemes()) {
        schemes.append(QStringLiteral("v%1").arg(int(v)));
    }

    return QStringLiteral("schemes: %1\nserialization: %2\n")
        .arg(schemes.isEmpty() ? QStringLiteral("none") : schemes.join(QLatin1Char(' ')),
             features::serialization_enabled() ? QStringLiteral("on") : QStringLiteral("off"));
}

} // namespace tuid::cli
