#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chunkup {

/**
 * @brief Failure categories surfaced by the upload coordinator
 *
 * Each category maps to exactly one HTTP status in the API layer
 * (see server/api.cpp). Callers branch on the code, never on the message.
 */
enum class ErrorCode {
    Validation,         // Missing or malformed input, rejected before any mutation
    Unauthorized,       // No caller identity could be established
    Forbidden,          // Caller is not the session owner
    NotFound,           // Session absent or expired
    Incomplete,         // Finalize attempted before every chunk was recorded
    RemoteFileMissing,  // Storage node has no file for the session
    IntegrityMismatch,  // Storage node file size differs from the declared size
    RemoteUnavailable,  // Storage node transport failure or non-2xx reply (retryable)
    Storage,            // Durable store failure
    Internal
};

/**
 * @brief Structured error carried by Result<T, Error>
 */
struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;
    std::vector<std::int32_t> missing_chunks;  ///< Populated when code == Incomplete

    Error() = default;
    Error(ErrorCode c, std::string msg)
        : code(c), message(std::move(msg)) {}

    static Error validation(std::string msg) { return {ErrorCode::Validation, std::move(msg)}; }
    static Error unauthorized(std::string msg) { return {ErrorCode::Unauthorized, std::move(msg)}; }
    static Error forbidden(std::string msg) { return {ErrorCode::Forbidden, std::move(msg)}; }
    static Error not_found(std::string msg) { return {ErrorCode::NotFound, std::move(msg)}; }
    static Error remote_unavailable(std::string msg) { return {ErrorCode::RemoteUnavailable, std::move(msg)}; }
    static Error storage(std::string msg) { return {ErrorCode::Storage, std::move(msg)}; }
    static Error internal(std::string msg) { return {ErrorCode::Internal, std::move(msg)}; }

    static Error incomplete(std::string msg, std::vector<std::int32_t> missing) {
        Error error{ErrorCode::Incomplete, std::move(msg)};
        error.missing_chunks = std::move(missing);
        return error;
    }

    /// Retrying the same request later may succeed
    bool is_retryable() const noexcept {
        return code == ErrorCode::RemoteUnavailable || code == ErrorCode::Storage;
    }
};

/**
 * @brief Stable snake_case name used in JSON error bodies and logs
 */
inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Validation: return "validation_error";
        case ErrorCode::Unauthorized: return "unauthorized";
        case ErrorCode::Forbidden: return "forbidden";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Incomplete: return "incomplete_upload";
        case ErrorCode::RemoteFileMissing: return "remote_file_missing";
        case ErrorCode::IntegrityMismatch: return "integrity_mismatch";
        case ErrorCode::RemoteUnavailable: return "storage_unavailable";
        case ErrorCode::Storage: return "store_error";
        case ErrorCode::Internal: return "internal_error";
    }
    return "internal_error";
}

} // namespace chunkup
