// ============================================================================
// SIGNGATE - Configuration Loader
// ============================================================================

#include "signgate/config/config.hpp"

#include "signgate/core/error.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace signgate::config {

namespace {

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool parse_bool(const std::string& name, const std::string& value) {
    const std::string s = to_lower(value);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    throw ConfigError(name + " is not a boolean: " + value);
}

long long parse_integer(const std::string& name, const std::string& value,
                        long long min, long long max) {
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError(name + " is not an integer: " + value);
    }
    if (consumed != value.size()) {
        throw ConfigError(name + " is not an integer: " + value);
    }
    if (parsed < min || parsed > max) {
        throw ConfigError(name + " out of range: " + value);
    }
    return parsed;
}

auth::SigningAlgorithm parse_algorithm(const std::string& value) {
    auto algorithm = auth::parse_signing_algorithm(value);
    if (!algorithm) {
        throw ConfigError("unknown signing algorithm: " + value);
    }
    return *algorithm;
}

void set_port(GatewayConfig& config, const std::string& name, const std::string& value) {
    config.server.port = static_cast<uint16_t>(parse_integer(name, value, 1, 65535));
}

void set_timeout(GatewayConfig& config, const std::string& name, const std::string& value) {
    config.upstream.timeout = std::chrono::milliseconds(
        parse_integer(name, value, 1, std::numeric_limits<int32_t>::max()));
}

void set_threads(GatewayConfig& config, const std::string& name, const std::string& value) {
    config.server.threads = static_cast<int>(parse_integer(name, value, 1, 256));
}

// Scalar as string, "" when absent
std::string scalar(const YAML::Node& node, const char* key) {
    if (!node || !node[key]) {
        return {};
    }
    return node[key].as<std::string>("");
}

}  // namespace

// ============================================================================
// Derived Values
// ============================================================================

auth::KeySource CredentialsConfig::key_source() const {
    if (!private_key.empty()) return auth::KeySource::inline_pem(private_key);
    if (!private_key_base64.empty()) return auth::KeySource::base64_pem(private_key_base64);
    if (!private_key_path.empty()) return auth::KeySource::file(private_key_path);
    return auth::KeySource{};
}

std::string GatewayConfig::upstream_prefix() const {
    return network::parse_base_url(upstream.base_url).path + upstream.api_prefix;
}

network::RestClientConfig GatewayConfig::rest_client_config() const {
    network::RestClientConfig rest;
    rest.base_url = upstream.base_url;
    rest.request_timeout = upstream.timeout;
    rest.verify_tls = upstream.verify_tls;
    return rest;
}

std::optional<std::string> system_environment(const std::string& name) {
    if (const char* value = std::getenv(name.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

// ============================================================================
// YAML
// ============================================================================

GatewayConfig parse_yaml(std::string_view yaml) {
    GatewayConfig config;

    try {
        const YAML::Node root = YAML::Load(std::string(yaml));
        if (!root || root.IsNull()) {
            return config;
        }

        // Credentials
        if (const auto creds = root["credentials"]) {
            config.credentials.key_id = scalar(creds, "key_id");
            config.credentials.private_key = scalar(creds, "private_key");
            config.credentials.private_key_base64 = scalar(creds, "private_key_base64");
            config.credentials.private_key_path = scalar(creds, "private_key_path");
            if (creds["algorithm"]) {
                config.credentials.algorithm = parse_algorithm(creds["algorithm"].as<std::string>());
            }
            if (const auto headers = creds["headers"]) {
                auto& names = config.credentials.headers;
                names.key_id = headers["key"].as<std::string>(names.key_id);
                names.signature = headers["signature"].as<std::string>(names.signature);
                names.timestamp = headers["timestamp"].as<std::string>(names.timestamp);
            }
        }

        // Upstream
        if (const auto upstream = root["upstream"]) {
            config.upstream.base_url = upstream["base_url"].as<std::string>(config.upstream.base_url);
            config.upstream.api_prefix = upstream["api_prefix"].as<std::string>(config.upstream.api_prefix);
            if (upstream["timeout_ms"]) {
                set_timeout(config, "upstream.timeout_ms", upstream["timeout_ms"].as<std::string>());
            }
            if (upstream["verify_tls"]) {
                config.upstream.verify_tls =
                    parse_bool("upstream.verify_tls", upstream["verify_tls"].as<std::string>());
            }
        }

        // Server
        if (const auto server = root["server"]) {
            config.server.address = server["address"].as<std::string>(config.server.address);
            if (server["port"]) {
                set_port(config, "server.port", server["port"].as<std::string>());
            }
            if (server["threads"]) {
                set_threads(config, "server.threads", server["threads"].as<std::string>());
            }
            config.server.cors_allow_origin =
                server["cors_allow_origin"].as<std::string>(config.server.cors_allow_origin);
            if (server["eager_key_load"]) {
                config.server.eager_key_load =
                    parse_bool("server.eager_key_load", server["eager_key_load"].as<std::string>());
            }
        }

        // Logging
        if (const auto logging = root["logging"]) {
            if (logging["level"]) {
                config.logging.level = utils::parse_log_level(to_lower(logging["level"].as<std::string>()));
            }
            config.logging.log_file = logging["file"].as<std::string>(config.logging.log_file);
            if (logging["async"]) {
                config.logging.async = parse_bool("logging.async", logging["async"].as<std::string>());
            }
        }

    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid YAML configuration: ") + e.what());
    }

    return config;
}

// ============================================================================
// Environment
// ============================================================================

void apply_environment(GatewayConfig& config, const Environment& env) {
    auto get = [&env](const char* name) { return env(name); };

    if (auto v = get("SIGNGATE_KEY_ID")) config.credentials.key_id = *v;
    if (auto v = get("SIGNGATE_PRIVATE_KEY")) config.credentials.private_key = *v;
    if (auto v = get("SIGNGATE_PRIVATE_KEY_BASE64")) config.credentials.private_key_base64 = *v;
    if (auto v = get("SIGNGATE_PRIVATE_KEY_PATH")) config.credentials.private_key_path = *v;
    if (auto v = get("SIGNGATE_ALGORITHM")) config.credentials.algorithm = parse_algorithm(*v);

    if (auto v = get("SIGNGATE_UPSTREAM_URL")) config.upstream.base_url = *v;
    if (auto v = get("SIGNGATE_TIMEOUT_MS")) set_timeout(config, "SIGNGATE_TIMEOUT_MS", *v);
    if (auto v = get("SIGNGATE_VERIFY_TLS")) {
        config.upstream.verify_tls = parse_bool("SIGNGATE_VERIFY_TLS", *v);
    }

    if (auto v = get("SIGNGATE_ADDRESS")) config.server.address = *v;
    if (auto v = get("PORT")) set_port(config, "PORT", *v);
    if (auto v = get("SIGNGATE_THREADS")) set_threads(config, "SIGNGATE_THREADS", *v);
    if (auto v = get("SIGNGATE_CORS_ORIGIN")) config.server.cors_allow_origin = *v;

    if (auto v = get("SIGNGATE_LOG_LEVEL")) config.logging.level = utils::parse_log_level(to_lower(*v));
}

// ============================================================================
// Finalize
// ============================================================================

std::string strip_path_suffix(std::string_view path, std::string_view suffix) {
    if (suffix.empty() || path.size() < suffix.size()) {
        return std::string(path);
    }
    if (path.compare(path.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return std::string(path);
    }
    return std::string(path.substr(0, path.size() - suffix.size()));
}

void finalize(GatewayConfig& config) {
    auto& prefix = config.upstream.api_prefix;
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    if (prefix.empty()) {
        throw ConfigError("upstream.api_prefix must not be empty");
    }
    if (prefix.front() != '/') {
        prefix.insert(prefix.begin(), '/');
    }

    const auto endpoint = network::parse_base_url(config.upstream.base_url);
    const std::string base_path = strip_path_suffix(endpoint.path, prefix);
    config.upstream.base_url = endpoint.scheme + "://" + endpoint.host_header() + base_path;
}

GatewayConfig load_config(const std::string& path, const Environment& env) {
    GatewayConfig config;

    if (!path.empty()) {
        std::ifstream in(path);
        if (!in) {
            throw ConfigError("cannot read configuration file: " + path);
        }
        std::ostringstream text;
        text << in.rdbuf();
        config = parse_yaml(text.str());
    }

    apply_environment(config, env);
    finalize(config);
    return config;
}

}  // namespace signgate::config
