#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <string>

using namespace tuid;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries a WrongVersion error", "[result]") {
    auto result = Result<int>::err(Error::wrong_version(1, 4));

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::WrongVersion);
    REQUIRE(result.unwrap_err().expected == 1);
    REQUIRE(result.unwrap_err().actual == 4);
}

TEST_CASE("Error::message names both versions", "[result]") {
    const auto error = Error::wrong_version(7, 4);
    REQUIRE(error.message() == "wrong UUID version: expected 7, found 4");
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error::wrong_version(5, 3));

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::unwrap_err throws on success", "[result]") {
    auto result = Result<int>::ok(1);

    REQUIRE_THROWS_AS(result.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error::wrong_version(4, 0));

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });

    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.unwrap() == 42);
}

TEST_CASE("Result::map propagates error", "[result]") {
    auto mapped = Result<int>::err(Error::wrong_version(8, 1)).map([](int x) { return x * 2; });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err() == Error::wrong_version(8, 1));
}

TEST_CASE("Result::map_err converts the error type", "[result]") {
    auto converted = Result<int>::err(Error::wrong_version(3, 5))
        .map_err([](const Error& e) { return e.message(); });

    REQUIRE(converted.is_err());
    REQUIRE(converted.unwrap_err() == "wrong UUID version: expected 3, found 5");
}

TEST_CASE("Result::and_then chains operations", "[result]") {
    auto check_even = [](int x) -> Result<int> {
        if (x % 2 != 0) return Result<int>::err(Error::wrong_version(0, static_cast<std::uint8_t>(x)));
        return Result<int>::ok(x / 2);
    };

    REQUIRE(Result<int>::ok(8).and_then(check_even).unwrap() == 4);
    REQUIRE(Result<int>::ok(3).and_then(check_even).unwrap_err().actual == 3);
}

TEST_CASE("Result::match selects the branch", "[result]") {
    auto describe = [](const Result<int>& r) {
        return r.match([](int v) { return std::to_string(v); },
                       [](const Error& e) { return e.message(); });
    };

    REQUIRE(describe(Result<int>::ok(7)) == "7");
    REQUIRE(describe(Result<int>::err(Error::wrong_version(1, 2))) ==
            "wrong UUID version: expected 1, found 2");
}

TEST_CASE("Result works with identical value and error types", "[result]") {
    using Text = Result<std::string, std::string>;

    auto ok = Text::ok("value");
    auto err = Text::err("problem");

    REQUIRE(ok.is_ok());
    REQUIRE(ok.unwrap() == "value");
    REQUIRE(err.is_err());
    REQUIRE(err.unwrap_err() == "problem");
}
