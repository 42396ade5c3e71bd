#pragma once
// ============================================================================
// SIGNGATE - Core Types
// ============================================================================
// Fundamental type definitions shared by the signing and forwarding layers
// ============================================================================

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace signgate {

// ============================================================================
// Time Types
// ============================================================================

/// Nanosecond precision timestamp
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Get current wall-clock timestamp with nanosecond precision
[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

/// Convert timestamp to Unix epoch milliseconds (signing timestamp format)
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/// Convert Unix epoch milliseconds to Timestamp
[[nodiscard]] inline Timestamp from_epoch_ms(int64_t epoch_ms) noexcept {
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

/// Format as ISO-8601 UTC with millisecond precision (2024-01-02T03:04:05.678Z)
[[nodiscard]] std::string to_iso8601(Timestamp ts);

// ============================================================================
// HTTP Method
// ============================================================================

enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DEL  // Note: Using DEL instead of DELETE to avoid Windows macro conflict
};

/// Uppercase wire name ("GET", "DELETE", ...)
[[nodiscard]] constexpr std::string_view to_string(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::GET:   return "GET";
        case HttpMethod::POST:  return "POST";
        case HttpMethod::PUT:   return "PUT";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::DEL:   return "DELETE";
    }
    return "GET";
}

struct HttpHeader {
    std::string name;
    std::string value;
};

using HttpHeaders = std::vector<HttpHeader>;

// ============================================================================
// Query Parameters
// ============================================================================

/// Ordered query parameters; repeated keys are kept as separate entries
using QueryParams = std::vector<std::pair<std::string, std::string>>;

}  // namespace signgate
