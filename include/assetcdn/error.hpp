#pragma once

#include <string>

namespace assetcdn {

/// Failure taxonomy shared by every component.
enum class ErrorKind {
    None,
    NotFound,   // absent key, object or upload: never an exceptional path
    Network,    // transport-level failure (DNS, connect, reset, curl timeout)
    Backend,    // backend reported an error status
    Throttled,  // 429 / SlowDown
    Auth,       // 401/403 or missing credentials
    Config,     // invalid or missing configuration, detected before any I/O
    Cancelled,
    Timeout,    // overall deadline expired; final remote state unknown
    Partial,    // some items processed, operation as a whole failed
};

const char* to_string(ErrorKind kind);

/// True for failures worth retrying automatically.
bool is_retryable(ErrorKind kind, int http_status = 0);

/// Classify an HTTP exchange. `body` is inspected for S3 error codes.
ErrorKind classify_http(int status, bool network_error, const std::string& body = {});

/// Generic success/failure result for operations without a payload.
struct OpResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    static OpResult ok() { return {true, ErrorKind::None, {}}; }
    static OpResult fail(ErrorKind kind, std::string message) {
        return {false, kind, std::move(message)};
    }
};

}  // namespace assetcdn
