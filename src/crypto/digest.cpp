#include "crypto/digest.hpp"

#include <QByteArray>
#include <QCryptographicHash>

#include <algorithm>

namespace tuid::crypto {

namespace {

template<std::size_t N>
std::array<std::uint8_t, N> hash_parts(QCryptographicHash::Algorithm algorithm,
                                       std::span<const std::uint8_t> prefix,
                                       std::span<const std::uint8_t> data) {
    QCryptographicHash hash(algorithm);
    hash.addData(QByteArrayView(reinterpret_cast<const char*>(prefix.data()),
                                static_cast<qsizetype>(prefix.size())));
    hash.addData(QByteArrayView(reinterpret_cast<const char*>(data.data()),
                                static_cast<qsizetype>(data.size())));
    const QByteArray result = hash.result();

    std::array<std::uint8_t, N> out{};
    std::copy_n(reinterpret_cast<const std::uint8_t*>(result.constData()), N, out.begin());
    return out;
}

} // namespace

Md5Digest md5(std::span<const std::uint8_t> prefix, std::span<const std::uint8_t> data) {
    return hash_parts<16>(QCryptographicHash::Md5, prefix, data);
}

Sha1Digest sha1(std::span<const std::uint8_t> prefix, std::span<const std::uint8_t> data) {
    return hash_parts<20>(QCryptographicHash::Sha1, prefix, data);
}

} // namespace tuid::crypto
