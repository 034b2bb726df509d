#include <catch2/catch_test_macros.hpp>

#include "chatstore/core/error.hpp"

TEST_CASE("Error creation and accessors", "[error]") {
    SECTION("basic error") {
        chatstore::Error err(chatstore::ErrorCode::NotFound, "message not found");
        CHECK(err.code() == chatstore::ErrorCode::NotFound);
        CHECK(err.message() == "message not found");
        CHECK(err.detail() == "");
        CHECK(err.what() == "message not found");
    }

    SECTION("error with detail") {
        chatstore::Error err(chatstore::ErrorCode::DatabaseError,
                             "query failed", "no such table: messages");
        CHECK(err.code() == chatstore::ErrorCode::DatabaseError);
        CHECK(err.message() == "query failed");
        CHECK(err.detail() == "no such table: messages");
        CHECK(err.what() == "query failed: no such table: messages");
    }
}

TEST_CASE("make_error helpers", "[error]") {
    SECTION("two-argument form") {
        auto err = chatstore::make_error(chatstore::ErrorCode::PermissionDenied, "not a member");
        CHECK(err.code() == chatstore::ErrorCode::PermissionDenied);
        CHECK(err.message() == "not a member");
        CHECK(err.detail() == "");
    }

    SECTION("three-argument form") {
        auto err = chatstore::make_error(chatstore::ErrorCode::Timeout,
                                         "Timed out waiting for a connection", "shard 2");
        CHECK(err.code() == chatstore::ErrorCode::Timeout);
        CHECK(err.what() == "Timed out waiting for a connection: shard 2");
    }
}

TEST_CASE("Result type carries value or error", "[error]") {
    SECTION("success") {
        chatstore::Result<int> result = 42;
        REQUIRE(result.has_value());
        CHECK(*result == 42);
    }

    SECTION("error") {
        chatstore::Result<int> result = std::unexpected(
            chatstore::make_error(chatstore::ErrorCode::InvalidArgument, "bad value"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == chatstore::ErrorCode::InvalidArgument);
        CHECK(result.error().message() == "bad value");
    }

    SECTION("void success") {
        chatstore::VoidResult result{};
        CHECK(result.has_value());
    }
}

TEST_CASE("error_code_to_string gives stable names", "[error]") {
    using chatstore::ErrorCode;
    CHECK(chatstore::error_code_to_string(ErrorCode::InvalidArgument) == "INVALID_ARGUMENT");
    CHECK(chatstore::error_code_to_string(ErrorCode::NotFound) == "NOT_FOUND");
    CHECK(chatstore::error_code_to_string(ErrorCode::PermissionDenied) == "PERMISSION_DENIED");
    CHECK(chatstore::error_code_to_string(ErrorCode::AlreadyExists) == "ALREADY_EXISTS");
    CHECK(chatstore::error_code_to_string(ErrorCode::StorageUnavailable) ==
          "STORAGE_UNAVAILABLE");
    CHECK(chatstore::error_code_to_string(ErrorCode::PublishFailed) == "PUBLISH_FAILED");
}

TEST_CASE("is_transient marks retryable storage failures", "[error]") {
    using chatstore::ErrorCode;
    CHECK(chatstore::is_transient(ErrorCode::StorageUnavailable));
    CHECK(chatstore::is_transient(ErrorCode::Timeout));
    CHECK(chatstore::is_transient(ErrorCode::ConnectionClosed));

    CHECK_FALSE(chatstore::is_transient(ErrorCode::InvalidArgument));
    CHECK_FALSE(chatstore::is_transient(ErrorCode::NotFound));
    CHECK_FALSE(chatstore::is_transient(ErrorCode::PermissionDenied));
    CHECK_FALSE(chatstore::is_transient(ErrorCode::DatabaseError));
    CHECK_FALSE(chatstore::is_transient(ErrorCode::Cancelled));
}
