#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace dropline;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries kind and message", "[result]") {
    auto result = Result<int>::err(Error{ErrorKind::Malformed, "truncated frame"});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::Malformed);
    REQUIRE(result.unwrap_err().message == "truncated frame");
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map and and_then chain", "[result]") {
    auto halve = [](int x) -> Result<int> {
        if (x % 2 != 0) return Result<int>::err(Error{ErrorKind::InvalidArgument, "odd"});
        return Result<int>::ok(x / 2);
    };

    auto chained = Result<int>::ok(21).map([](int x) { return x * 4; }).and_then(halve);
    REQUIRE(chained.is_ok());
    REQUIRE(chained.unwrap() == 42);

    auto failed = Result<int>::ok(3).and_then(halve);
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().kind == ErrorKind::InvalidArgument);
}

TEST_CASE("Result<void> works", "[result]") {
    auto ok = Result<void>::ok();
    auto err = Result<void>::err(Error{ErrorKind::IOFailure, "disk full"});

    REQUIRE(ok.is_ok());
    REQUIRE_NOTHROW(ok.unwrap());
    REQUIRE(err.is_err());
    REQUIRE_THROWS_AS(err.unwrap(), std::runtime_error);
}

TEST_CASE("Error::describe prefixes the kind", "[result]") {
    REQUIRE(Error{ErrorKind::Timeout, "no chunk for 15s"}.describe() == "Timeout: no chunk for 15s");
    REQUIRE(Error{ErrorKind::Rejected, ""}.describe() == "Rejected");
    REQUIRE(to_string(ErrorKind::SessionConflict) == "SessionConflict");
}
