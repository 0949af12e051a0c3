#pragma once

/**
 * @file Result.h
 * @brief Consistent error handling types for Chunkwise
 *
 * Provides a Result<T, E> type similar to Rust's Result or C++23's std::expected.
 * Every fallible operation in the library returns one of these instead of throwing.
 */

#include <variant>
#include <string>
#include <optional>
#include <utility>

namespace Chunkwise {

/**
 * @brief Error codes for Chunkwise operations
 */
enum class ErrorCode {
    Success = 0,

    // Network errors (100-199)
    ConnectionFailed = 100,
    ConnectionTimeout = 101,
    ConnectionLost = 102,
    InvalidHeader = 103,
    SendFailure = 104,

    // File system errors (200-299)
    SourceUnreadable = 200,
    FileReadError = 201,
    FileWriteError = 202,
    ChunkMissing = 203,

    // Integrity errors (300-399)
    MalformedManifest = 300,
    HashMismatch = 301,
    IntegrityMismatch = 302,

    // Security errors (400-499)
    KeyUnavailable = 400,
    EncryptionFailed = 401,
    DecryptionFailed = 402,

    // Compression errors (500-599)
    CompressionFailed = 500,
    DecompressionFailed = 501,

    // Configuration errors (600-699)
    InvalidConfig = 600,

    // General errors (900-999)
    Cancelled = 900,
    InvalidArgument = 901,
    InternalError = 999
};

/**
 * @brief Convert error code to human-readable string
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConnectionFailed: return "Connection failed";
        case ErrorCode::ConnectionTimeout: return "Connection timeout";
        case ErrorCode::ConnectionLost: return "Connection lost";
        case ErrorCode::InvalidHeader: return "Invalid header";
        case ErrorCode::SendFailure: return "Send failure";
        case ErrorCode::SourceUnreadable: return "Source unreadable";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";
        case ErrorCode::ChunkMissing: return "Chunk missing";
        case ErrorCode::MalformedManifest: return "Malformed manifest";
        case ErrorCode::HashMismatch: return "Hash mismatch";
        case ErrorCode::IntegrityMismatch: return "Integrity mismatch";
        case ErrorCode::KeyUnavailable: return "Key unavailable";
        case ErrorCode::EncryptionFailed: return "Encryption failed";
        case ErrorCode::DecryptionFailed: return "Decryption failed";
        case ErrorCode::CompressionFailed: return "Compression failed";
        case ErrorCode::DecompressionFailed: return "Decompression failed";
        case ErrorCode::InvalidConfig: return "Invalid configuration";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";
        default: return "Unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    std::string toString() const {
        return std::string(errorCodeToString(code)) + ": " + message;
    }
};

/**
 * @brief Result type for operations that can fail
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error)
 *
 * Usage:
 * @code
 * Result<Manifest> loaded = Manifest::loadFromFile(path);
 * if (!loaded) {
 *     logger.error(loaded.error().toString(), "Sender");
 *     return;
 * }
 * const Manifest& manifest = *loaded;
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

    /// Get success value (throws if error)
    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    /// Get error (throws if success)
    E& error() & { return std::get<E>(data_); }
    const E& error() const& { return std::get<E>(data_); }

    /// Dereference operator (get value)
    T& operator*() & { return value(); }
    const T& operator*() const& { return value(); }
    T&& operator*() && { return std::move(value()); }

    /// Arrow operator (access value members)
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
    /// Construct success result
    Result() : error_(std::nullopt) {}

    /// Construct error result
    Result(E error) : error_(std::move(error)) {}

    /// Check if result is success
    bool ok() const { return !error_.has_value(); }

    /// Check if result is success (bool conversion)
    explicit operator bool() const { return ok(); }

    /// Get error (throws if success)
    E& error() { return *error_; }
    const E& error() const { return *error_; }

private:
    std::optional<E> error_;
};

/// Create a void success result
inline Result<void> Ok() {
    return Result<void>();
}

/// Create an error result with message
template<typename T = void>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

} // namespace Chunkwise
