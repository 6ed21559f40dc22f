#include <catch2/catch_test_macros.hpp>

#include "kookbridge/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        kookbridge::Error err(kookbridge::ErrorCode::NotFound, "resource not found");
        CHECK(err.code() == kookbridge::ErrorCode::NotFound);
        CHECK(err.message() == "resource not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "resource not found");
    }

    SECTION("error with detail") {
        kookbridge::Error err(kookbridge::ErrorCode::ApiError,
                              "message/create failed", "code 40000");
        CHECK(err.code() == kookbridge::ErrorCode::ApiError);
        CHECK(err.message() == "message/create failed");
        CHECK(err.detail() == "code 40000");
        CHECK(err.what() == "message/create failed: code 40000");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = kookbridge::make_error(kookbridge::ErrorCode::Unauthorized, "not authenticated");
        CHECK(err.code() == kookbridge::ErrorCode::Unauthorized);
        CHECK(err.message() == "not authenticated");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = kookbridge::make_error(kookbridge::ErrorCode::Timeout,
                                          "request timed out", "after 30s");
        CHECK(err.code() == kookbridge::ErrorCode::Timeout);
        CHECK(err.what() == "request timed out: after 30s");
    }
}

TEST_CASE("Result type success and error", "[error]") {
    SECTION("success") {
        kookbridge::Result<int> result = 42;
        REQUIRE(result.has_value());
        CHECK(*result == 42);
    }

    SECTION("error") {
        kookbridge::Result<int> result = std::unexpected(
            kookbridge::make_error(kookbridge::ErrorCode::InvalidArgument, "bad value"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == kookbridge::ErrorCode::InvalidArgument);
        CHECK(result.error().message() == "bad value");
    }

    SECTION("make_fail converts to any Result") {
        kookbridge::Result<std::string> result =
            kookbridge::make_fail(kookbridge::make_error(kookbridge::ErrorCode::IoError, "disk full"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == kookbridge::ErrorCode::IoError);
    }
}

TEST_CASE("error_code_to_string names every code", "[error]") {
    CHECK(kookbridge::error_code_to_string(kookbridge::ErrorCode::InvalidConfig) == "INVALID_CONFIG");
    CHECK(kookbridge::error_code_to_string(kookbridge::ErrorCode::ConnectionClosed) == "CONNECTION_CLOSED");
    CHECK(kookbridge::error_code_to_string(kookbridge::ErrorCode::ProtocolError) == "PROTOCOL_ERROR");
}

TEST_CASE("is_transient separates network failures from fatal ones", "[error]") {
    using kookbridge::ErrorCode;
    CHECK(kookbridge::is_transient(ErrorCode::ConnectionFailed));
    CHECK(kookbridge::is_transient(ErrorCode::ConnectionClosed));
    CHECK(kookbridge::is_transient(ErrorCode::Timeout));
    CHECK(kookbridge::is_transient(ErrorCode::IoError));
    CHECK_FALSE(kookbridge::is_transient(ErrorCode::InvalidConfig));
    CHECK_FALSE(kookbridge::is_transient(ErrorCode::Unauthorized));
    CHECK_FALSE(kookbridge::is_transient(ErrorCode::SerializationError));
}
