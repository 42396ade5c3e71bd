// ============================================================================
// SIGNGATE - Forwarding Engine Implementation
// ============================================================================

#include "signgate/gateway/forwarding_engine.hpp"

#include "signgate/utils/encoding.hpp"
#include "signgate/utils/logger.hpp"

#include <simdjson.h>

#include <chrono>
#include <utility>
#include <vector>

namespace signgate::gateway {

namespace {

constexpr const char* kJsonContentType = "application/json";

// Upstream response headers the caller sees; keys match HttpResponse::headers
constexpr std::pair<const char*, const char*> kRelayedHeaders[] = {
    {"retry-after", "Retry-After"},
};

bool is_forbidden_char(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7f || c == '\\' || c == '?' || c == '#';
}

int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

}  // namespace

// ============================================================================
// ForwardResult
// ============================================================================

ForwardResult ForwardResult::failure(GatewayErrorKind kind, std::string_view message) {
    ForwardResult result;
    result.status_code = http_status(kind);
    result.body = utils::error_json(message);
    result.content_type = kJsonContentType;
    result.error = kind;
    return result;
}

// ============================================================================
// Path and Body Helpers
// ============================================================================

std::string resolve_upstream_path(std::string_view prefix, std::string_view logical_path) {
    std::vector<std::string_view> segments;

    size_t pos = 0;
    while (pos <= logical_path.size()) {
        const size_t slash = logical_path.find('/', pos);
        const size_t end = slash == std::string_view::npos ? logical_path.size() : slash;
        const std::string_view segment = logical_path.substr(pos, end - pos);
        pos = end + 1;

        if (segment.empty() || segment == ".") {
            continue;
        }
        for (char c : segment) {
            if (is_forbidden_char(c)) {
                throw PathRejected("path contains a forbidden character");
            }
        }
        if (segment == "..") {
            throw PathRejected("path traversal is not allowed");
        }

        const auto decoded = utils::url_decode(segment);
        if (!decoded) {
            throw PathRejected("path contains a malformed percent-escape");
        }
        if (*decoded == "." || *decoded == ".." ||
            decoded->find_first_of("/\\") != std::string::npos) {
            throw PathRejected("path traversal is not allowed");
        }

        segments.push_back(segment);
    }

    if (segments.empty()) {
        throw PathRejected("empty upstream path");
    }

    std::string path(prefix);
    for (const auto segment : segments) {
        path.push_back('/');
        path.append(segment);
    }

    // Containment: the joined path must stay under the prefix
    const std::string namespace_root = std::string(prefix) + "/";
    if (path.compare(0, namespace_root.size(), namespace_root) != 0) {
        throw PathRejected("path escapes the upstream API namespace");
    }
    return path;
}

std::string normalize_json_body(std::string_view body) {
    simdjson::dom::parser parser;
    simdjson::padded_string padded(body);
    simdjson::dom::element doc;
    auto error = parser.parse(padded).get(doc);
    if (error) {
        throw InvalidRequest(std::string("request body is not valid JSON: ") +
                             simdjson::error_message(error));
    }
    return simdjson::minify(doc);
}

// ============================================================================
// ForwardingEngine
// ============================================================================

ForwardingEngine::ForwardingEngine(ForwardingConfig config,
                                   std::shared_ptr<const auth::RequestAuthenticator> authenticator,
                                   std::shared_ptr<network::IRestClient> client)
    : config_(std::move(config))
    , authenticator_(std::move(authenticator))
    , client_(std::move(client)) {}

std::variant<network::HttpRequest, ForwardResult>
ForwardingEngine::prepare(const ForwardRequest& request) const {
    try {
        network::HttpRequest upstream;
        upstream.method = request.method;
        upstream.path = resolve_upstream_path(config_.upstream_prefix, request.logical_path);
        upstream.query_params = request.query;

        if (request.body && !request.body->empty()) {
            upstream.body = normalize_json_body(*request.body);
        }

        // Signed last so the timestamp is as fresh as possible
        auto auth = authenticator_->build_headers(request.method, upstream.path);
        upstream.headers = std::move(auth.headers);
        return upstream;

    } catch (const InvalidRequest& e) {
        LOG_WARN("Rejected {} {}: {}", to_string(request.method), request.logical_path, e.what());
        return ForwardResult::failure(GatewayErrorKind::BadRequest, e.what());
    } catch (const ConfigError& e) {
        LOG_ERROR("Configuration error: {}", e.what());
        return ForwardResult::failure(GatewayErrorKind::Config, e.what());
    } catch (const KeyLoadError& e) {
        LOG_ERROR("Signing key unavailable [{}]: {}", to_string(e.kind()), e.what());
        return ForwardResult::failure(GatewayErrorKind::KeyLoad, e.what());
    } catch (const SigningError& e) {
        LOG_ERROR("Signing failed: {}", e.what());
        return ForwardResult::failure(GatewayErrorKind::Signing, e.what());
    }
}

ForwardResult ForwardingEngine::map_response(network::HttpResponse response) {
    switch (response.transport) {
        case network::TransportStatus::Ok:
            break;
        case network::TransportStatus::Timeout:
            return ForwardResult::failure(GatewayErrorKind::UpstreamTimeout, response.error);
        case network::TransportStatus::Failed:
            return ForwardResult::failure(GatewayErrorKind::UpstreamTransport, response.error);
        case network::TransportStatus::Cancelled:
            return ForwardResult::failure(GatewayErrorKind::Cancelled, response.error);
    }

    ForwardResult result;
    result.status_code = response.status_code;
    result.body = std::move(response.body);
    result.content_type = response.content_type.empty() ? kJsonContentType
                                                        : std::move(response.content_type);
    for (const auto& [key, name] : kRelayedHeaders) {
        auto it = response.headers.find(key);
        if (it != response.headers.end()) {
            result.headers.push_back({name, it->second});
        }
    }
    return result;
}

ForwardResult ForwardingEngine::forward(const ForwardRequest& request) const {
    utils::ScopedTimer timer("forward");

    auto prepared = prepare(request);
    if (auto* failed = std::get_if<ForwardResult>(&prepared)) {
        return std::move(*failed);
    }

    const auto& upstream = std::get<network::HttpRequest>(prepared);
    auto result = map_response(client_->request(upstream));
    LOG_INFO("{} {} -> {}", to_string(upstream.method), upstream.path, result.status_code);
    return result;
}

std::shared_ptr<network::PendingRequest> ForwardingEngine::forward_async(
    const ForwardRequest& request, ResultCallback callback) const {
    auto prepared = prepare(request);
    if (auto* failed = std::get_if<ForwardResult>(&prepared)) {
        callback(std::move(*failed));
        return nullptr;
    }

    auto upstream = std::get<network::HttpRequest>(std::move(prepared));
    const auto start = std::chrono::steady_clock::now();
    std::string label = std::string(to_string(upstream.method)) + " " + upstream.path;

    return client_->request_async(
        upstream,
        [callback = std::move(callback), label = std::move(label), start](network::HttpResponse response) {
            auto result = map_response(std::move(response));
            if (result.error) {
                LOG_WARN("{} -> {} [{}] ({} ms)", label, result.status_code,
                         to_string(*result.error), elapsed_ms(start));
            } else if (result.status_code >= 400) {
                LOG_WARN("{} -> upstream {} ({} ms)", label, result.status_code, elapsed_ms(start));
            } else {
                LOG_INFO("{} -> {} ({} ms)", label, result.status_code, elapsed_ms(start));
            }
            callback(std::move(result));
        });
}

}  // namespace signgate::gateway
