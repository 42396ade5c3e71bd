#pragma once
// ============================================================================
// SIGNGATE - Configuration
// ============================================================================
// YAML file (optional) overlaid with environment variables; environment wins.
// Malformed values raise ConfigError so the process refuses to start.
// ============================================================================

#include "signgate/auth/algorithm.hpp"
#include "signgate/auth/key_store.hpp"
#include "signgate/auth/request_authenticator.hpp"
#include "signgate/network/rest_client.hpp"
#include "signgate/utils/logger.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace signgate::config {

struct ServerConfig {
    std::string address = "0.0.0.0";
    uint16_t port = 5000;
    int threads = 4;
    std::string cors_allow_origin = "*";
    bool eager_key_load = true;
    size_t body_limit = 1024 * 1024;
};

struct CredentialsConfig {
    std::string key_id;

    // Key sources; precedence inline PEM > base64 PEM > file path
    std::string private_key;
    std::string private_key_base64;
    std::string private_key_path;

    auth::SigningAlgorithm algorithm = auth::SigningAlgorithm::RsaPssSha256;
    auth::AuthHeaderNames headers;

    [[nodiscard]] auth::KeySource key_source() const;

    /// Key id and a key source are both present
    [[nodiscard]] bool configured() const { return !key_id.empty() && key_source().configured(); }
};

struct UpstreamConfig {
    std::string base_url = "https://api.elections.kalshi.com";
    std::string api_prefix = "/trade-api/v2";
    std::chrono::milliseconds timeout{30000};
    bool verify_tls = true;
};

struct GatewayConfig {
    ServerConfig server;
    CredentialsConfig credentials;
    UpstreamConfig upstream;
    utils::LogConfig logging;

    /// Full signed-path prefix: base URL path + API prefix
    [[nodiscard]] std::string upstream_prefix() const;

    [[nodiscard]] network::RestClientConfig rest_client_config() const;
};

/// Environment lookup; nullopt when unset
using Environment = std::function<std::optional<std::string>(const std::string&)>;

/// std::getenv-backed lookup
[[nodiscard]] std::optional<std::string> system_environment(const std::string& name);

/// Parse YAML text onto defaults
/// @throws ConfigError
[[nodiscard]] GatewayConfig parse_yaml(std::string_view yaml);

/// Load YAML file (empty path = defaults), apply environment, finalize
/// @throws ConfigError
[[nodiscard]] GatewayConfig load_config(const std::string& path,
                                        const Environment& env = system_environment);

/// Overlay environment variables
/// @throws ConfigError
void apply_environment(GatewayConfig& config, const Environment& env);

/// Normalize the API prefix and remove it from the base URL path when the
/// base URL already carries it
/// @throws ConfigError
void finalize(GatewayConfig& config);

/// Remove suffix from the end of path when path ends with it as a whole;
/// otherwise return path unchanged
[[nodiscard]] std::string strip_path_suffix(std::string_view path, std::string_view suffix);

}  // namespace signgate::config
