#include <catch2/catch_test_macros.hpp>
#include "core/timestamp.hpp"

#include <set>
#include <thread>
#include <vector>

using namespace tuid;

TEST_CASE("Timestamp converts between Unix and Gregorian time", "[timestamp]") {
    NullSequence seq;

    SECTION("the Unix epoch sits at the Gregorian offset") {
        const auto ts = Timestamp::from_unix(seq, 0, 0);
        REQUIRE(ts.to_gregorian().first == Timestamp::GREGORIAN_UNIX_OFFSET);
        REQUIRE(ts.to_gregorian().second == 0);
    }

    SECTION("ticks are 100ns intervals") {
        const auto ts = Timestamp::from_unix(seq, 1, 250);
        REQUIRE(ts.to_gregorian().first == Timestamp::GREGORIAN_UNIX_OFFSET + 10'000'002);
    }

    SECTION("from_gregorian round trips") {
        constexpr std::uint64_t ticks = 0x01EC9414C232AB00ULL;
        constexpr auto ts = Timestamp::from_gregorian(ticks, 0x33C8);
        static_assert(ts.to_gregorian().first == ticks);
        REQUIRE(ts.counter() == 0x33C8);
        REQUIRE(ts.to_unix().first == 1'645'557'742);
    }
}

TEST_CASE("Timestamp::unix_millis truncates sub-millisecond time", "[timestamp]") {
    NullSequence seq;
    const auto ts = Timestamp::from_unix(seq, 1'645'557'742, 999'999);
    REQUIRE(ts.unix_millis() == 0x017F22E279B0ULL);
}

TEST_CASE("Timestamp::now is close to the system clock", "[timestamp]") {
    NullSequence seq;
    const auto before = std::chrono::duration_cast<std::chrono::seconds>(
        Timestamp::Clock::now().time_since_epoch()).count();
    const auto ts = Timestamp::now(seq);
    const auto after = std::chrono::duration_cast<std::chrono::seconds>(
        Timestamp::Clock::now().time_since_epoch()).count();

    REQUIRE(ts.to_unix().first >= static_cast<std::uint64_t>(before));
    REQUIRE(ts.to_unix().first <= static_cast<std::uint64_t>(after));
    REQUIRE(ts.to_unix().second < 1'000'000'000U);
}

TEST_CASE("NullSequence always yields zero", "[timestamp]") {
    NullSequence seq;
    REQUIRE(seq.generate_sequence(1, 2) == 0);
    REQUIRE(Timestamp::from_unix(seq, 10, 0).counter() == 0);
    REQUIRE(Timestamp::from_unix(seq, 10, 0) == Timestamp::from_unix(seq, 10, 0));
}

TEST_CASE("Context advances and wraps at 14 bits", "[timestamp][context]") {
    SECTION("sequential values") {
        Context context(100);
        REQUIRE(context.generate_sequence(0, 0) == 100);
        REQUIRE(context.generate_sequence(0, 0) == 101);
        REQUIRE(Timestamp::from_unix(context, 0, 0).counter() == 102);
    }

    SECTION("wraps to zero") {
        Context context(Context::MAX_SEQUENCE);
        REQUIRE(context.generate_sequence(0, 0) == Context::MAX_SEQUENCE);
        REQUIRE(context.generate_sequence(0, 0) == 0);
    }

    SECTION("seed is masked") {
        Context context(0xFFFF);
        REQUIRE(context.generate_sequence(0, 0) == Context::MAX_SEQUENCE);
    }

    SECTION("random seed stays in range") {
        Context context;
        REQUIRE(context.generate_sequence(0, 0) <= Context::MAX_SEQUENCE);
    }
}

TEST_CASE("Context hands out distinct values across threads", "[timestamp][context]") {
    Context context(0);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 500;

    std::vector<std::vector<std::uint16_t>> drawn(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                drawn[static_cast<std::size_t>(t)].push_back(context.generate_sequence(0, 0));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::uint16_t> all;
    for (const auto& values : drawn) {
        all.insert(values.begin(), values.end());
    }
    REQUIRE(all.size() == kThreads * kPerThread);
}
