#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "core/result.hpp"

#include <string>

using namespace chronoid;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries message and kind", "[result]") {
    auto result = Result<int>::err(Error::usage("two sources given"));

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "two sources given");
    REQUIRE(result.unwrap_err().kind == ErrorKind::Usage);
}

TEST_CASE("Error defaults to validation", "[result]") {
    Error e{"field out of range"};
    REQUIRE(e.kind == ErrorKind::Validation);
    REQUIRE(e == Error::validation("field out of range"));
    REQUIRE_FALSE(e == Error::usage("field out of range"));
}

TEST_CASE("Result::unwrap throws with the error kind in the message", "[result]") {
    auto result = Result<int>::err(Error::validation("bad hex"));

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
    REQUIRE_THROWS_WITH(result.unwrap(), ContainsSubstring("validation") && ContainsSubstring("bad hex"));
}

TEST_CASE("Result::unwrap_err throws on success", "[result]") {
    auto result = Result<int>::ok(1);
    REQUIRE_THROWS_AS(result.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success and propagates error", "[result]") {
    auto doubled = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(doubled.unwrap() == 42);

    auto failed = Result<int>::err(Error::usage("nope")).map([](int x) { return x * 2; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().kind == ErrorKind::Usage);
}

TEST_CASE("Result::and_then chains and short-circuits", "[result]") {
    auto check_width = [](int x) -> Result<int> {
        if (x > 0xFF) return Result<int>::err(Error::validation("too wide"));
        return Result<int>::ok(x);
    };

    REQUIRE(Result<int>::ok(0x12).and_then(check_width).unwrap() == 0x12);
    REQUIRE(Result<int>::ok(0x100).and_then(check_width).is_err());

    auto first = Result<int>::err(Error::usage("initial"));
    auto chained = first.and_then(check_width);
    REQUIRE(chained.unwrap_err().message == "initial");
}

TEST_CASE("Result chaining works with different types", "[result]") {
    auto result = Result<int>::ok(7)
        .map([](int x) { return std::to_string(x); })
        .map([](const std::string& s) { return "v" + s; });

    REQUIRE(result.unwrap() == "v7");
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("ErrorKind renders a name", "[result]") {
    REQUIRE(std::string(to_string(ErrorKind::Usage)) == "usage");
    REQUIRE(std::string(to_string(ErrorKind::Validation)) == "validation");
}
