#pragma once
// ============================================================================
// SIGNGATE - REST Client
// ============================================================================
// Async HTTP client for the upstream API (Boost.Beast, TLS or plain TCP)
// Features: whole-call deadline, cancellation, blocking and async forms
// ============================================================================

#include "signgate/core/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

// Forward declarations for Boost (avoid header pollution)
namespace boost::asio {
class io_context;
}  // namespace boost::asio

namespace signgate::network {

// ============================================================================
// HTTP Types
// ============================================================================

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string path;             // absolute path, no query
    QueryParams query_params;
    HttpHeaders headers;
    std::string body;
};

/// How the call ended at the transport level
enum class TransportStatus {
    Ok,          // a response was received (any HTTP status)
    Timeout,     // deadline elapsed before a full response arrived
    Failed,      // resolve/connect/TLS/read/write failure
    Cancelled    // cancelled by the caller
};

[[nodiscard]] constexpr std::string_view to_string(TransportStatus status) noexcept {
    switch (status) {
        case TransportStatus::Ok:        return "ok";
        case TransportStatus::Timeout:   return "timeout";
        case TransportStatus::Failed:    return "failed";
        case TransportStatus::Cancelled: return "cancelled";
    }
    return "failed";
}

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;  // names lowercased
    std::string content_type;
    std::string body;

    TransportStatus transport = TransportStatus::Ok;
    std::string error;  // transport failure description
};

// ============================================================================
// Upstream Endpoint
// ============================================================================

struct UpstreamEndpoint {
    std::string scheme;  // "https" or "http"
    std::string host;
    std::string port;
    std::string path;    // without trailing '/', may be empty

    [[nodiscard]] bool is_tls() const noexcept { return scheme == "https"; }

    /// Host header value; the port is added only when non-default
    [[nodiscard]] std::string host_header() const;
};

/// Parse "scheme://host[:port][/path]"
/// @throws ConfigError
[[nodiscard]] UpstreamEndpoint parse_base_url(std::string_view url);

/// path?k=v&k2=v2 with percent-encoded keys and values, caller order kept
[[nodiscard]] std::string build_target(std::string_view path, const QueryParams& params);

// ============================================================================
// REST Client Configuration
// ============================================================================

struct RestClientConfig {
    std::string base_url = "https://api.elections.kalshi.com";

    // Deadline for the whole call: resolve, connect, handshake, write, read
    std::chrono::milliseconds request_timeout{30000};

    bool verify_tls = true;
    std::string user_agent = "signgate/1.0";
    size_t max_response_bytes = 16 * 1024 * 1024;
};

// ============================================================================
// REST Client Interface
// ============================================================================

/// Handle to an in-flight call
class PendingRequest {
public:
    virtual ~PendingRequest() = default;

    /// Abort the call; the callback fires once with TransportStatus::Cancelled
    /// unless the call already completed. Safe from any thread.
    virtual void cancel() = 0;
};

class IRestClient {
public:
    using ResponseCallback = std::function<void(HttpResponse)>;

    virtual ~IRestClient() = default;

    /// Execute request synchronously (blocking)
    [[nodiscard]] virtual HttpResponse request(const HttpRequest& request) = 0;

    /// Execute request asynchronously; callback runs exactly once on an I/O thread
    virtual std::shared_ptr<PendingRequest> request_async(const HttpRequest& request,
                                                          ResponseCallback callback) = 0;
};

// ============================================================================
// REST Client Implementation
// ============================================================================

class RestClient : public IRestClient {
public:
    /// Async calls run on an internal I/O thread
    explicit RestClient(const RestClientConfig& config);

    /// Async calls run on io_context; the caller keeps it running
    RestClient(const RestClientConfig& config, boost::asio::io_context& io_context);

    ~RestClient() override;

    // Non-copyable
    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    [[nodiscard]] HttpResponse request(const HttpRequest& request) override;

    std::shared_ptr<PendingRequest> request_async(const HttpRequest& request,
                                                  ResponseCallback callback) override;

    [[nodiscard]] const UpstreamEndpoint& endpoint() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace signgate::network
