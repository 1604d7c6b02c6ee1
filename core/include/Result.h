#pragma once

/**
 * @file Result.h
 * @brief Consistent error handling types for ChatStorage
 *
 * Provides a Result<T, E> type similar to Rust's Result or C++23's std::expected.
 * Every fallible operation of the client engine returns one of these instead of
 * throwing across module boundaries.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace ChatStorage {

/**
 * @brief Error codes for client engine operations
 */
enum class ErrorCode {
    Success = 0,

    // Frame codec errors (100-199)
    TruncatedHeader = 100,
    BadMagic = 101,
    UnknownType = 102,
    TruncatedPayload = 103,

    // Connection errors (200-299)
    NotConnected = 200,
    SendFailed = 201,
    Timeout = 202,
    ConnectionClosed = 203,
    ConnectionLost = 204,

    // Protocol / server errors (300-399)
    InvalidResponse = 300,
    ServerError = 301,

    // Local resource errors (400-499)
    FileNotFound = 400,
    FileIOError = 401,
    StoreError = 402,

    // Control flow (500-599)
    Cancelled = 500,

    // General errors (900-999)
    InvalidArgument = 900,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::TruncatedHeader: return "Truncated frame header";
        case ErrorCode::BadMagic: return "Bad frame magic";
        case ErrorCode::UnknownType: return "Unknown frame type";
        case ErrorCode::TruncatedPayload: return "Truncated frame payload";
        case ErrorCode::NotConnected: return "Not connected";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::Timeout: return "Timed out";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::ConnectionLost: return "Connection lost";
        case ErrorCode::InvalidResponse: return "Invalid response";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileIOError: return "File I/O error";
        case ErrorCode::StoreError: return "Task store error";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Error type with code, message and originating component
 *
 * serverCode carries the numeric code reported by the server for
 * ErrorCode::ServerError and is 0 otherwise.
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string component;
    int serverCode{0};

    Error(ErrorCode c) : code(c), message(errorCodeToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg, std::string comp)
        : code(c), message(std::move(msg)), component(std::move(comp)) {}

    static Error server(int serverCode, std::string msg) {
        Error e(ErrorCode::ServerError, std::move(msg));
        e.serverCode = serverCode;
        return e;
    }

    std::string toString() const {
        std::string out = component.empty() ? "" : "[" + component + "] ";
        out += errorCodeToString(code);
        if (code == ErrorCode::ServerError) {
            out += " (" + std::to_string(serverCode) + ")";
        }
        if (!message.empty() && message != errorCodeToString(code)) {
            out += ": " + message;
        }
        return out;
    }

    bool operator==(const Error& other) const { return code == other.code; }
    bool operator!=(const Error& other) const { return code != other.code; }
};

/**
 * @brief Result type for operations that can fail
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 *
 * Usage:
 * @code
 * Result<Frame> frame = FrameCodec::decode(bytes);
 * if (!frame) {
 *     Logger::instance().log(LogLevel::WARN, frame.error().toString(), "Connection");
 * }
 * @endcode
 */
template<typename T, typename E = Error>
class Result {
public:
    /// Construct success result
    Result(T value) : data_(std::move(value)) {}

    /// Construct error result
    Result(E error) : data_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return std::holds_alternative<T>(data_); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Check if result is error
    bool isError() const { return std::holds_alternative<E>(data_); }

    /// Get success value (throws if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get success value with default
    T valueOr(T defaultValue) const {
        if (ok()) return std::get<T>(data_);
        return defaultValue;
    }

    /// Get error (throws if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    T* operator->() { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, E> data_;
};

/**
 * @brief Specialization for void success type
 */
template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }
    bool isError() const { return error_.has_value(); }

    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

using VoidResult = Result<void, Error>;

/// Create a success result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result
template<typename T = void>
Result<T> Err(ErrorCode code) {
    return Result<T>(Error{code});
}

/// Create an error result with message
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

/// Create an error result with message and component
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message, std::string component) {
    return Result<T>(Error{code, std::move(message), std::move(component)});
}

} // namespace ChatStorage
