#include "core/serialization.hpp"

#if TUID_HAS_SERDE

namespace tuid {

QDataStream& operator<<(QDataStream& out, const Uuid& uuid) {
    const auto& bytes = uuid.bytes();
    out.writeRawData(reinterpret_cast<const char*>(bytes.data()),
                     static_cast<int>(bytes.size()));
    return out;
}

std::optional<Uuid> read_uuid(QDataStream& in) {
    Uuid::Bytes bytes{};
    const auto read = in.readRawData(reinterpret_cast<char*>(bytes.data()),
                                     static_cast<int>(bytes.size()));
    if (read != static_cast<int>(bytes.size())) {
        qCDebug(lcSerde) << "read_uuid: short read of" << read << "bytes";
        if (in.status() == QDataStream::Ok) {
            in.setStatus(QDataStream::ReadPastEnd);
        }
        return std::nullopt;
    }
    return Uuid(bytes);
}

} // namespace tuid

#endif // TUID_HAS_SERDE
