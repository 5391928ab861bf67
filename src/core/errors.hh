#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace shardkeep {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : std::uint16_t {
    OK = 0,
    CONFIGURATION = 1,          // Invalid (k,n); never retried
    INSUFFICIENT_SHARDS = 2,    // Fewer than k usable shards
    CORRUPTION_DETECTED = 3,    // Checksum or content hash mismatch
    NOT_FOUND = 4,
    QUOTA_EXCEEDED = 5,
    TIMEOUT = 6,
    INVARIANT_VIOLATION = 7,    // Codec defect, not an environmental failure
    BACKEND_UNAVAILABLE = 8,
    INVALID_ARGUMENT = 9,
    IO_ERROR = 10,
    SHARD_ABSENT = 11,          // Nothing to store for this index
};

[[nodiscard]] inline std::string_view error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "ok";
        case ErrorCode::CONFIGURATION: return "configuration";
        case ErrorCode::INSUFFICIENT_SHARDS: return "insufficient_shards";
        case ErrorCode::CORRUPTION_DETECTED: return "corruption_detected";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::QUOTA_EXCEEDED: return "quota_exceeded";
        case ErrorCode::TIMEOUT: return "timeout";
        case ErrorCode::INVARIANT_VIOLATION: return "invariant_violation";
        case ErrorCode::BACKEND_UNAVAILABLE: return "backend_unavailable";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::SHARD_ABSENT: return "shard_absent";
    }
    return "unknown";
}

// ============================================================================
// Exceptions
// ============================================================================

class StorageError : public std::runtime_error {
public:
    StorageError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class ConfigurationError : public StorageError {
public:
    explicit ConfigurationError(const std::string& message)
        : StorageError(ErrorCode::CONFIGURATION, message) {}
};

class InsufficientShardsError : public StorageError {
public:
    explicit InsufficientShardsError(const std::string& message)
        : StorageError(ErrorCode::INSUFFICIENT_SHARDS, message) {}
};

class CorruptionDetectedError : public StorageError {
public:
    explicit CorruptionDetectedError(const std::string& message)
        : StorageError(ErrorCode::CORRUPTION_DETECTED, message) {}
};

class NotFoundError : public StorageError {
public:
    explicit NotFoundError(const std::string& message)
        : StorageError(ErrorCode::NOT_FOUND, message) {}
};

class QuotaExceededError : public StorageError {
public:
    explicit QuotaExceededError(const std::string& message)
        : StorageError(ErrorCode::QUOTA_EXCEEDED, message) {}
};

// Distinct from NotFoundError: a slow backend is not an empty one
class TimeoutError : public StorageError {
public:
    explicit TimeoutError(const std::string& message)
        : StorageError(ErrorCode::TIMEOUT, message) {}
};

class InvariantViolationError : public StorageError {
public:
    explicit InvariantViolationError(const std::string& message)
        : StorageError(ErrorCode::INVARIANT_VIOLATION, message) {}
};

class BackendUnavailableError : public StorageError {
public:
    explicit BackendUnavailableError(const std::string& message)
        : StorageError(ErrorCode::BACKEND_UNAVAILABLE, message) {}
};

// Throws the exception class matching code
[[noreturn]] inline void raise_error(ErrorCode code, const std::string& message) {
    switch (code) {
        case ErrorCode::CONFIGURATION: throw ConfigurationError(message);
        case ErrorCode::INSUFFICIENT_SHARDS: throw InsufficientShardsError(message);
        case ErrorCode::CORRUPTION_DETECTED: throw CorruptionDetectedError(message);
        case ErrorCode::NOT_FOUND: throw NotFoundError(message);
        case ErrorCode::QUOTA_EXCEEDED: throw QuotaExceededError(message);
        case ErrorCode::TIMEOUT: throw TimeoutError(message);
        case ErrorCode::INVARIANT_VIOLATION: throw InvariantViolationError(message);
        case ErrorCode::BACKEND_UNAVAILABLE: throw BackendUnavailableError(message);
        default: throw StorageError(code, message);
    }
}

}  // namespace shardkeep
