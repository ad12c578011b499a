#include "core/timestamp.hpp"

#include "crypto/random.hpp"

namespace tuid {

Context::Context()
    : count_(static_cast<std::uint16_t>(crypto::random_uniform(MAX_SEQUENCE + 1U))) {}

Context::Context(std::uint16_t seed) noexcept
    : count_(static_cast<std::uint16_t>(seed & MAX_SEQUENCE)) {}

std::uint16_t Context::generate_sequence(std::uint64_t, std::uint32_t) {
    auto current = count_.load(std::memory_order_relaxed);
    std::uint16_t next;
    do {
        next = static_cast<std::uint16_t>((current + 1) & MAX_SEQUENCE);
    } while (!count_.compare_exchange_weak(current, next, std::memory_order_relaxed));
    return current;
}

Timestamp Timestamp::from_unix(ClockSequence& context, std::uint64_t seconds, std::uint32_t nanos) {
    const auto counter = static_cast<std::uint16_t>(
        context.generate_sequence(seconds, nanos) & Context::MAX_SEQUENCE);
    return Timestamp(seconds, nanos, counter);
}

Timestamp Timestamp::now(ClockSequence& context) {
    const auto since_epoch = Clock::now().time_since_epoch();
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
    return from_unix(context,
                     static_cast<std::uint64_t>(secs.count()),
                     static_cast<std::uint32_t>(nanos.count()));
}

} // namespace tuid
