#pragma once
// ============================================================================
// SIGNGATE - Router
// ============================================================================
// Maps inbound method + path onto a logical upstream request. One declarative
// table replaces per-endpoint handlers; "/api/{path...}" passes any path
// through (the forwarding engine still enforces namespace containment).
// ============================================================================

#include "signgate/core/types.hpp"
#include "signgate/gateway/forwarding_engine.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace signgate::server {

struct InboundRequest {
    HttpMethod method = HttpMethod::GET;
    std::string path;                  // without query
    QueryParams query;
    std::optional<std::string> body;
};

/// Split "path?query" and percent-decode the query ('+' means space)
/// @returns nullopt on a malformed escape
[[nodiscard]] std::optional<std::pair<std::string, QueryParams>> split_target(std::string_view target);

struct Route {
    HttpMethod method;
    std::string pattern;         // "/market/{ticker}"
    std::string upstream;        // "markets/{ticker}"
    bool body_required = false;
    QueryParams default_query;   // added when the key is absent
};

/// Health check
struct HealthRoute {};

/// Request the router refuses outright
struct RouteError {
    int status_code;
    std::string message;
};

using RouteMatch = std::variant<HealthRoute, gateway::ForwardRequest, RouteError>;

class Router {
public:
    /// Built-in table
    Router();
    explicit Router(std::vector<Route> routes, std::string passthrough_prefix = "/api/");

    [[nodiscard]] RouteMatch match(const InboundRequest& request) const;

    [[nodiscard]] const std::vector<Route>& routes() const noexcept { return routes_; }

    [[nodiscard]] static std::vector<Route> default_routes();

private:
    std::vector<Route> routes_;
    std::string passthrough_prefix_;
};

/// {"status":"healthy","timestamp":...,"credentials_configured":...,...}
[[nodiscard]] std::string health_json(const auth::RequestAuthenticator& authenticator);

}  // namespace signgate::server
