#pragma once
// ============================================================================
// SIGNGATE - Forwarding Engine
// ============================================================================
// Single-shot pipeline per call:
//   receive -> resolve path -> sign -> call upstream -> map response
// Upstream statuses and bodies are passed through verbatim; only failures
// the gateway itself detects are reported in the uniform {"error": ...} shape.
// No automatic retries: a retry needs a fresh timestamp and signature.
// ============================================================================

#include "signgate/auth/request_authenticator.hpp"
#include "signgate/core/error.hpp"
#include "signgate/core/types.hpp"
#include "signgate/network/rest_client.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace signgate::gateway {

// ============================================================================
// Request / Result
// ============================================================================

struct ForwardRequest {
    HttpMethod method = HttpMethod::GET;
    std::string logical_path;          // e.g. "portfolio/orders/abc"
    QueryParams query;
    std::optional<std::string> body;   // JSON text
};

struct ForwardResult {
    int status_code = 0;
    std::string body;
    std::string content_type;
    HttpHeaders headers;                    // upstream headers relayed to the caller
    std::optional<GatewayErrorKind> error;  // set only for gateway-side failures

    [[nodiscard]] bool is_gateway_error() const noexcept { return error.has_value(); }

    /// Uniform error shape with the fixed status for kind
    [[nodiscard]] static ForwardResult failure(GatewayErrorKind kind, std::string_view message);
};

// ============================================================================
// Path and Body Helpers
// ============================================================================

/// prefix + "/" + normalized logical path. Empty and "." segments are
/// dropped; "..", encoded dot segments, encoded slashes, backslashes,
/// control characters, '?' and '#' are rejected.
/// @throws PathRejected
[[nodiscard]] std::string resolve_upstream_path(std::string_view prefix,
                                                std::string_view logical_path);

/// Validate and minify a JSON document
/// @throws InvalidRequest
[[nodiscard]] std::string normalize_json_body(std::string_view body);

// ============================================================================
// Forwarding Engine
// ============================================================================

struct ForwardingConfig {
    /// Path prefix every signed upstream path lives under
    std::string upstream_prefix = "/trade-api/v2";
};

class ForwardingEngine {
public:
    using ResultCallback = std::function<void(ForwardResult)>;

    ForwardingEngine(ForwardingConfig config,
                     std::shared_ptr<const auth::RequestAuthenticator> authenticator,
                     std::shared_ptr<network::IRestClient> client);

    // Non-copyable
    ForwardingEngine(const ForwardingEngine&) = delete;
    ForwardingEngine& operator=(const ForwardingEngine&) = delete;

    /// Blocking forward
    [[nodiscard]] ForwardResult forward(const ForwardRequest& request) const;

    /// Async forward. When the request fails before reaching the network
    /// the callback runs inline and nullptr is returned.
    std::shared_ptr<network::PendingRequest> forward_async(const ForwardRequest& request,
                                                           ResultCallback callback) const;

    [[nodiscard]] const auth::RequestAuthenticator& authenticator() const noexcept {
        return *authenticator_;
    }
    [[nodiscard]] const ForwardingConfig& config() const noexcept { return config_; }

private:
    /// Upstream request ready to send, or the failure that stopped it
    [[nodiscard]] std::variant<network::HttpRequest, ForwardResult>
    prepare(const ForwardRequest& request) const;

    [[nodiscard]] static ForwardResult map_response(network::HttpResponse response);

    ForwardingConfig config_;
    std::shared_ptr<const auth::RequestAuthenticator> authenticator_;
    std::shared_ptr<network::IRestClient> client_;
};

}  // namespace signgate::gateway
