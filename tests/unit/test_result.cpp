#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace spool;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err creates an error result", "[result]") {
    auto result = Result<int>::err(Error{ErrorCode::NotFound, "no such record"});

    REQUIRE_FALSE(result.is_ok());
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "no such record");
    REQUIRE(result.unwrap_err().code == ErrorCode::NotFound);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{ErrorCode::IoFailure, "disk full"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::unwrap_err throws on success", "[result]") {
    auto result = Result<int>::ok(1);

    REQUIRE_THROWS_AS(result.unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{ErrorCode::IoFailure, "error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success value", "[result]") {
    auto result = Result<int>::ok(21);
    auto mapped = result.map([](int x) { return x * 2; });

    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.unwrap() == 42);
}

TEST_CASE("Result::map propagates error", "[result]") {
    auto result = Result<int>::err(Error{ErrorCode::Transport, "timeout"});
    auto mapped = result.map([](int x) { return x * 2; });

    REQUIRE(mapped.is_err());
    REQUIRE(mapped.unwrap_err().code == ErrorCode::Transport);
}

TEST_CASE("Result::and_then chains operations", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return fail<int>(ErrorCode::MalformedPayload, "division by zero");
        return Result<int>::ok(100 / x);
    };

    auto result = Result<int>::ok(5).and_then(divide);
    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap() == 20);

    auto zero = Result<int>::ok(0).and_then(divide);
    REQUIRE(zero.is_err());
    REQUIRE(zero.unwrap_err().code == ErrorCode::MalformedPayload);
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    bool called = false;
    auto step = [&](int x) -> Result<int> {
        called = true;
        return Result<int>::ok(x);
    };

    auto result = Result<int>::err(Error{ErrorCode::Busy, "initial error"}).and_then(step);

    REQUIRE(result.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(result.unwrap_err().message == "initial error");
}

TEST_CASE("Result::inspect_err sees only errors", "[result]") {
    int seen = 0;
    Result<int>::ok(1).inspect_err([&](const Error&) { ++seen; });
    Result<int>::err(Error{ErrorCode::IoFailure, "x"}).inspect_err([&](const Error&) { ++seen; });

    REQUIRE(seen == 1);
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = fail(ErrorCode::Cancelled, "stopped");

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE(err_result.unwrap_err().code == ErrorCode::Cancelled);

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("Result chaining works with different types", "[result]") {
    auto result = Result<int>::ok(5)
        .map([](int x) { return std::to_string(x); })
        .map([](const std::string& s) { return s + " records"; });

    REQUIRE(result.is_ok());
    REQUIRE(result.unwrap() == "5 records");
}

TEST_CASE("Error describes itself with its code", "[result]") {
    Error error{ErrorCode::SyncCursorInvalid, "cursor ahead of server"};

    REQUIRE(error.describe() == "SyncCursorInvalid: cursor ahead of server");
}

TEST_CASE("Error codes are grouped by how callers react", "[result]") {
    REQUIRE(is_crypto_error(ErrorCode::AuthenticationFailed));
    REQUIRE(is_crypto_error(ErrorCode::UnsupportedVersion));
    REQUIRE_FALSE(is_crypto_error(ErrorCode::Transport));

    REQUIRE(is_store_error(ErrorCode::DuplicateId));
    REQUIRE(is_store_error(ErrorCode::NotFound));
    REQUIRE_FALSE(is_store_error(ErrorCode::MalformedPayload));

    REQUIRE(is_protocol_error(ErrorCode::PayloadTooLarge));
    REQUIRE_FALSE(is_protocol_error(ErrorCode::Unauthorized));

    STATIC_REQUIRE(to_string(ErrorCode::Busy) == "Busy");
}
