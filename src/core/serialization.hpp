#pragma once

#include "core/features.hpp"

#if TUID_HAS_SERDE

#include "core/id.hpp"
#include "core/logging.hpp"
#include "core/uuid.hpp"

#include <QDataStream>

#include <optional>

namespace tuid {

/**
 * Binary serialization. A Uuid is written as its 16 bytes in network order;
 * an Id is written exactly like the Uuid it wraps, the phantom parameters
 * contribute nothing.
 */
QDataStream& operator<<(QDataStream& out, const Uuid& uuid);

/**
 * Read 16 bytes. On a short read the stream status becomes ReadPastEnd and
 * nullopt is returned.
 */
[[nodiscard]] std::optional<Uuid> read_uuid(QDataStream& in);

template<typename Subject, Scheme S>
QDataStream& operator<<(QDataStream& out, const Id<Subject, S>& id) {
    return out << id.untyped();
}

/**
 * Read an Id, validating the version nibble like Id::from_untyped does.
 * Bytes carrying another version set the stream status to ReadCorruptData
 * and yield nullopt.
 */
template<typename Subject, Scheme S>
[[nodiscard]] std::optional<Id<Subject, S>> read_id(QDataStream& in) {
    const auto raw = read_uuid(in);
    if (!raw) {
        return std::nullopt;
    }

    auto checked = Id<Subject, S>::from_untyped(*raw);
    if (checked.is_err()) {
        qCWarning(lcSerde) << "read_id:" << QString::fromStdString(checked.unwrap_err().message());
        in.setStatus(QDataStream::ReadCorruptData);
        return std::nullopt;
    }
    return checked.unwrap();
}

} // namespace tuid

#endif // TUID_HAS_SERDE
