#include "assetcdn/error.hpp"

namespace assetcdn {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Network: return "network";
        case ErrorKind::Backend: return "backend";
        case ErrorKind::Throttled: return "throttled";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::Config: return "config";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Partial: return "partial";
    }
    return "unknown";
}

bool is_retryable(ErrorKind kind, int http_status) {
    switch (kind) {
        case ErrorKind::Network:
        case ErrorKind::Throttled:
            return true;
        case ErrorKind::Backend:
            // Only server-side failures; 4xx will not change on retry
            return http_status >= 500 || http_status == 0;
        default:
            return false;
    }
}

ErrorKind classify_http(int status, bool network_error, const std::string& body) {
    if (network_error) return ErrorKind::Network;
    if (status >= 200 && status < 300) return ErrorKind::None;
    if (status == 401 || status == 403) return ErrorKind::Auth;
    if (status == 404) return ErrorKind::NotFound;
    if (status == 429) return ErrorKind::Throttled;
    if (status == 503 && body.find("<Code>SlowDown</Code>") != std::string::npos) {
        return ErrorKind::Throttled;
    }
    return ErrorKind::Backend;
}

}  // namespace assetcdn
