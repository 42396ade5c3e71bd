#pragma once
// ============================================================================
// SIGNGATE - Error Taxonomy
// ============================================================================
// Exceptions for configuration, key and signing failures, plus the uniform
// error kinds reported to callers
// ============================================================================

#include <stdexcept>
#include <string>
#include <string_view>

namespace signgate {

// ============================================================================
// Exceptions
// ============================================================================

/// Missing or malformed configuration value
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Private key could not be obtained, parsed, or is of the wrong type
class KeyLoadError : public std::runtime_error {
public:
    enum class Kind {
        NotConfigured,
        ParseError,
        TypeMismatch
    };

    KeyLoadError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

/// Underlying crypto library failure while producing a signature
class SigningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Caller sent something the gateway will not forward
class InvalidRequest : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Logical path would leave the upstream API namespace or is malformed
class PathRejected : public InvalidRequest {
public:
    using InvalidRequest::InvalidRequest;
};

[[nodiscard]] constexpr std::string_view to_string(KeyLoadError::Kind kind) noexcept {
    switch (kind) {
        case KeyLoadError::Kind::NotConfigured: return "KeyNotConfigured";
        case KeyLoadError::Kind::ParseError:    return "KeyParseError";
        case KeyLoadError::Kind::TypeMismatch:  return "KeyTypeMismatch";
    }
    return "KeyLoadError";
}

// ============================================================================
// Caller-facing Error Kinds
// ============================================================================

enum class GatewayErrorKind {
    Config,
    KeyLoad,
    Signing,
    BadRequest,
    UpstreamTransport,
    UpstreamTimeout,
    Cancelled
};

/// Fixed HTTP status reported for each error kind
[[nodiscard]] constexpr int http_status(GatewayErrorKind kind) noexcept {
    switch (kind) {
        case GatewayErrorKind::Config:            return 500;
        case GatewayErrorKind::KeyLoad:           return 500;
        case GatewayErrorKind::Signing:           return 500;
        case GatewayErrorKind::BadRequest:        return 400;
        case GatewayErrorKind::UpstreamTransport: return 500;
        case GatewayErrorKind::UpstreamTimeout:   return 504;
        case GatewayErrorKind::Cancelled:         return 499;
    }
    return 500;
}

[[nodiscard]] constexpr std::string_view to_string(GatewayErrorKind kind) noexcept {
    switch (kind) {
        case GatewayErrorKind::Config:            return "config";
        case GatewayErrorKind::KeyLoad:           return "key_load";
        case GatewayErrorKind::Signing:           return "signing";
        case GatewayErrorKind::BadRequest:        return "bad_request";
        case GatewayErrorKind::UpstreamTransport: return "upstream_transport";
        case GatewayErrorKind::UpstreamTimeout:   return "upstream_timeout";
        case GatewayErrorKind::Cancelled:         return "cancelled";
    }
    return "unknown";
}

}  // namespace signgate
