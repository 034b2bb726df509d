#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace chatstore {

enum class ErrorCode {
    Unknown = 1,
    InvalidConfig,
    InvalidArgument,
    NotFound,
    AlreadyExists,
    PermissionDenied,
    Timeout,
    Cancelled,
    ConnectionClosed,
    StorageUnavailable,
    DatabaseError,
    SerializationError,
    PublishFailed,
    IoError,
    InternalError,
};

class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    Error(ErrorCode code, std::string message, std::string detail)
        : code_(code), message_(std::move(message)), detail_(std::move(detail)) {}

    [[nodiscard]] auto code() const noexcept -> ErrorCode { return code_; }
    [[nodiscard]] auto message() const noexcept -> std::string_view { return message_; }
    [[nodiscard]] auto detail() const noexcept -> std::string_view { return detail_; }

    [[nodiscard]] auto what() const -> std::string {
        if (detail_.empty()) return message_;
        return message_ + ": " + detail_;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::string detail_;
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

inline auto make_error(ErrorCode code, std::string message) -> Error {
    return Error(code, std::move(message));
}

inline auto make_error(ErrorCode code, std::string message, std::string detail) -> Error {
    return Error(code, std::move(message), std::move(detail));
}

/// Stable upper-case name of an ErrorCode, used in logs and wire errors.
inline auto error_code_to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::Unknown: return "UNKNOWN";
        case ErrorCode::InvalidConfig: return "INVALID_CONFIG";
        case ErrorCode::InvalidArgument: return "INVALID_ARGUMENT";
        case ErrorCode::NotFound: return "NOT_FOUND";
        case ErrorCode::AlreadyExists: return "ALREADY_EXISTS";
        case ErrorCode::PermissionDenied: return "PERMISSION_DENIED";
        case ErrorCode::Timeout: return "TIMEOUT";
        case ErrorCode::Cancelled: return "CANCELLED";
        case ErrorCode::ConnectionClosed: return "CONNECTION_CLOSED";
        case ErrorCode::StorageUnavailable: return "STORAGE_UNAVAILABLE";
        case ErrorCode::DatabaseError: return "DATABASE_ERROR";
        case ErrorCode::SerializationError: return "SERIALIZATION_ERROR";
        case ErrorCode::PublishFailed: return "PUBLISH_FAILED";
        case ErrorCode::IoError: return "IO_ERROR";
        case ErrorCode::InternalError: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
    }
}

/// True for failures a caller may retry unchanged: the store was busy,
/// unreachable, closed, or the call ran out of time.
inline auto is_transient(ErrorCode code) noexcept -> bool {
    switch (code) {
        case ErrorCode::Timeout:
        case ErrorCode::ConnectionClosed:
        case ErrorCode::StorageUnavailable:
            return true;
        default:
            return false;
    }
}

} // namespace chatstore
