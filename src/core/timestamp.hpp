#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <utility>

namespace tuid {

/**
 * NodeId - The 6-byte node field of time-based UUIDs (v1, v6).
 * Conventionally a MAC address, or random bytes with the multicast bit set.
 */
using NodeId = std::array<std::uint8_t, 6>;

/**
 * ClockSequence - Source of the 14-bit counter that disambiguates UUIDs
 * generated for the same timestamp.
 */
class ClockSequence {
public:
    virtual ~ClockSequence() = default;

    /**
     * Produce the counter for a timestamp. Only the low 14 bits are used.
     */
    virtual std::uint16_t generate_sequence(std::uint64_t seconds, std::uint32_t nanos) = 0;
};

/**
 * Context - Thread-safe wrapping counter, seeded randomly on construction.
 * Share one instance across every generator that must not collide.
 */
class Context final : public ClockSequence {
public:
    static constexpr std::uint16_t MAX_SEQUENCE = 0x3FFF;

    /**
     * Seed from the system random source.
     */
    Context();

    /**
     * Seed with an explicit value (masked to 14 bits).
     */
    explicit Context(std::uint16_t seed) noexcept;

    std::uint16_t generate_sequence(std::uint64_t seconds, std::uint32_t nanos) override;

private:
    std::atomic<std::uint16_t> count_;
};

/**
 * NullSequence - Always yields 0. For callers that guarantee unique
 * timestamps themselves.
 */
class NullSequence final : public ClockSequence {
public:
    std::uint16_t generate_sequence(std::uint64_t, std::uint32_t) override {
        return 0;
    }
};

/**
 * Timestamp - A point in time as consumed by the time-based schemes.
 *
 * Stores Unix seconds, the sub-second nanoseconds and the clock sequence
 * drawn when it was created.
 */
class Timestamp {
public:
    using Clock = std::chrono::system_clock;

    // 100ns intervals between 1582-10-15 (Gregorian reform) and 1970-01-01.
    static constexpr std::uint64_t GREGORIAN_UNIX_OFFSET = 0x01B21DD213814000ULL;

    /**
     * Build from Unix time, drawing the counter from `context`.
     */
    [[nodiscard]] static Timestamp from_unix(ClockSequence& context,
                                             std::uint64_t seconds,
                                             std::uint32_t nanos);

    /**
     * Build from a raw RFC 9562 tick count and counter.
     */
    [[nodiscard]] static constexpr Timestamp from_gregorian(std::uint64_t ticks,
                                                            std::uint16_t counter) noexcept {
        const auto since_unix = ticks - GREGORIAN_UNIX_OFFSET;
        return Timestamp(since_unix / TICKS_PER_SECOND,
                         static_cast<std::uint32_t>((since_unix % TICKS_PER_SECOND) * 100),
                         counter);
    }

    /**
     * Current system time.
     */
    [[nodiscard]] static Timestamp now(ClockSequence& context);

    /**
     * 60-bit tick count since the Gregorian epoch, and the counter.
     */
    [[nodiscard]] constexpr std::pair<std::uint64_t, std::uint16_t> to_gregorian() const noexcept {
        const auto ticks = GREGORIAN_UNIX_OFFSET + seconds_ * TICKS_PER_SECOND + nanos_ / 100;
        return {ticks & 0x0FFF'FFFF'FFFF'FFFFULL, counter_};
    }

    [[nodiscard]] constexpr std::pair<std::uint64_t, std::uint32_t> to_unix() const noexcept {
        return {seconds_, nanos_};
    }

    [[nodiscard]] constexpr std::uint64_t unix_millis() const noexcept {
        return seconds_ * 1000 + nanos_ / 1'000'000;
    }

    [[nodiscard]] constexpr std::uint16_t counter() const noexcept {
        return counter_;
    }

    bool operator==(const Timestamp&) const = default;

private:
    static constexpr std::uint64_t TICKS_PER_SECOND = 10'000'000;

    constexpr Timestamp(std::uint64_t seconds, std::uint32_t nanos, std::uint16_t counter) noexcept
        : seconds_(seconds), nanos_(nanos), counter_(counter) {}

    std::uint64_t seconds_;
    std::uint32_t nanos_;
    std::uint16_t counter_;
};

} // namespace tuid
