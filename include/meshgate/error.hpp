#pragma once

#include <string>
#include <utility>

namespace meshgate {

enum class ErrorCode {
    Configuration,
    Unavailable,
    CircuitOpen,
    Timeout,
    QueueFull,
    QueueTimeout,
    Upstream
};

struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

inline std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Configuration: return "configuration_error";
        case ErrorCode::Unavailable: return "unavailable";
        case ErrorCode::CircuitOpen: return "circuit_open";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::QueueFull: return "rate_limit_exceeded";
        case ErrorCode::QueueTimeout: return "queue_timeout";
        case ErrorCode::Upstream: return "upstream_error";
        default: return "unknown";
    }
}

// Status code the gateway answers with for a failed request
inline int http_status(const Error& error) {
    switch (error.code) {
        case ErrorCode::Unavailable:
        case ErrorCode::CircuitOpen:
            return 503;
        case ErrorCode::QueueFull:
            return 429;
        case ErrorCode::QueueTimeout:
            return 408;
        default:
            return 500;
    }
}

} // namespace meshgate
