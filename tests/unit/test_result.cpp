#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <string>

using namespace lanbridge;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries message and code", "[result]") {
    auto result = Result<int>::err(Error{"tunnel went away", ErrorCode::TunnelReadFailed});

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "tunnel went away");
    REQUIRE(result.unwrap_err().code == ErrorCode::TunnelReadFailed);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::unwrap_err throws on success", "[result]") {
    auto result = Result<int>::ok(1);

    REQUIRE_THROWS_AS(result.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error", ErrorCode::BindFailed});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE(err_result.unwrap_err().code == ErrorCode::BindFailed);
    REQUIRE_THROWS(ok_result.unwrap_err());
}

TEST_CASE("ErrorCode names are stable", "[result]") {
    REQUIRE(std::string(to_string(ErrorCode::HostNotFound)) == "host-not-found");
    REQUIRE(std::string(to_string(ErrorCode::MalformedEnvelope)) == "malformed-envelope");
    REQUIRE(std::string(to_string(ErrorCode::TunnelWriteFailed)) == "tunnel-write-failed");
    REQUIRE(std::string(to_string(ErrorCode::ConfigInvalid)) == "config-invalid");
}
