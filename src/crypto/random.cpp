#include "crypto/random.hpp"

#include "core/logging.hpp"

#include <sodium.h>

#include <stdexcept>

namespace tuid::crypto {

void init() {
    static const bool ready = [] {
        if (sodium_init() < 0) {
            qCCritical(lcCrypto) << "libsodium failed to initialize";
            return false;
        }
        qCDebug(lcCrypto) << "libsodium" << sodium_version_string() << "initialized";
        return true;
    }();

    if (!ready) {
        throw std::runtime_error("Failed to initialize libsodium");
    }
}

void fill_random(std::span<std::uint8_t> out) {
    init();
    randombytes_buf(out.data(), out.size());
}

std::uint32_t random_uniform(std::uint32_t upper_bound) {
    init();
    return randombytes_uniform(upper_bound);
}

} // namespace tuid::crypto
