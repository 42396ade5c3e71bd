// ============================================================================
// SIGNGATE - Router Implementation
// ============================================================================

#include "signgate/server/router.hpp"

#include "signgate/utils/encoding.hpp"

#include <simdjson.h>

#include <algorithm>
#include <map>
#include <sstream>

namespace signgate::server {

namespace {

std::vector<std::string_view> split_path(std::string_view path) {
    std::vector<std::string_view> segments;
    size_t pos = 0;
    while (pos < path.size()) {
        const size_t slash = path.find('/', pos);
        const size_t end = slash == std::string_view::npos ? path.size() : slash;
        if (end > pos) {
            segments.push_back(path.substr(pos, end - pos));
        }
        pos = end + 1;
    }
    return segments;
}

bool is_placeholder(std::string_view segment) noexcept {
    return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
}

/// Captures keyed by "{name}"; nullopt when the path does not fit the pattern
std::optional<std::map<std::string, std::string>> match_pattern(std::string_view pattern,
                                                                std::string_view path) {
    const auto want = split_path(pattern);
    const auto have = split_path(path);
    if (want.size() != have.size()) {
        return std::nullopt;
    }

    std::map<std::string, std::string> captures;
    for (size_t i = 0; i < want.size(); ++i) {
        if (is_placeholder(want[i])) {
            captures[std::string(want[i])] = std::string(have[i]);
        } else if (want[i] != have[i]) {
            return std::nullopt;
        }
    }
    return captures;
}

std::string substitute(std::string_view upstream, const std::map<std::string, std::string>& captures) {
    std::string out(upstream);
    for (const auto& [placeholder, value] : captures) {
        for (size_t pos = out.find(placeholder); pos != std::string::npos;
             pos = out.find(placeholder, pos + value.size())) {
            out.replace(pos, placeholder.size(), value);
        }
    }
    return out;
}

std::optional<std::string> decode_query_component(std::string_view value) {
    std::string plus_decoded(value);
    std::replace(plus_decoded.begin(), plus_decoded.end(), '+', ' ');
    return utils::url_decode(plus_decoded);
}

/// null, false, 0, "", {} and [] carry no payload. Malformed JSON is left
/// for the forwarding engine to reject.
bool is_empty_payload(std::string_view body) {
    simdjson::dom::parser parser;
    simdjson::padded_string padded(body);
    simdjson::dom::element doc;
    if (parser.parse(padded).get(doc)) {
        return false;
    }

    simdjson::dom::object object;
    if (doc.get(object) == simdjson::SUCCESS) return object.size() == 0;
    simdjson::dom::array array;
    if (doc.get(array) == simdjson::SUCCESS) return array.size() == 0;
    std::string_view text;
    if (doc.get(text) == simdjson::SUCCESS) return text.empty();
    bool flag = false;
    if (doc.get(flag) == simdjson::SUCCESS) return !flag;
    double number = 0;
    if (doc.get(number) == simdjson::SUCCESS) return number == 0;
    return doc.is_null();
}

}  // namespace

std::optional<std::pair<std::string, QueryParams>> split_target(std::string_view target) {
    const auto question = target.find('?');
    std::string path(target.substr(0, question));
    QueryParams query;

    if (question == std::string_view::npos) {
        return std::make_pair(std::move(path), std::move(query));
    }

    std::string_view rest = target.substr(question + 1);
    while (!rest.empty()) {
        const auto amp = rest.find('&');
        const std::string_view pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }

        const auto eq = pair.find('=');
        auto key = decode_query_component(pair.substr(0, eq));
        auto value = decode_query_component(
            eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1));
        if (!key || !value) {
            return std::nullopt;
        }
        query.emplace_back(std::move(*key), std::move(*value));
    }
    return std::make_pair(std::move(path), std::move(query));
}

// ============================================================================
// Router
// ============================================================================

std::vector<Route> Router::default_routes() {
    return {
        {HttpMethod::GET,  "/balance",        "portfolio/balance",     false, {}},
        {HttpMethod::GET,  "/markets",        "markets",               false, {{"limit", "20"}, {"status", "open"}}},
        {HttpMethod::GET,  "/market/{ticker}", "markets/{ticker}",     false, {}},
        {HttpMethod::GET,  "/positions",      "portfolio/positions",   false, {}},
        {HttpMethod::GET,  "/orders",         "portfolio/orders",      false, {}},
        {HttpMethod::POST, "/orders",         "portfolio/orders",      true,  {}},
        {HttpMethod::GET,  "/orders/{id}",    "portfolio/orders/{id}", false, {}},
        {HttpMethod::DEL,  "/orders/{id}",    "portfolio/orders/{id}", false, {}},
    };
}

Router::Router() : Router(default_routes()) {}

Router::Router(std::vector<Route> routes, std::string passthrough_prefix)
    : routes_(std::move(routes)), passthrough_prefix_(std::move(passthrough_prefix)) {}

RouteMatch Router::match(const InboundRequest& request) const {
    if (request.path == "/health") {
        if (request.method != HttpMethod::GET) {
            return RouteError{405, "method not allowed"};
        }
        return HealthRoute{};
    }

    if (!passthrough_prefix_.empty() &&
        request.path.compare(0, passthrough_prefix_.size(), passthrough_prefix_) == 0) {
        gateway::ForwardRequest forward;
        forward.method = request.method;
        forward.logical_path = request.path.substr(passthrough_prefix_.size());
        forward.query = request.query;
        forward.body = request.body;
        return forward;
    }

    bool path_known = false;
    for (const auto& route : routes_) {
        auto captures = match_pattern(route.pattern, request.path);
        if (!captures) {
            continue;
        }
        path_known = true;
        if (route.method != request.method) {
            continue;
        }

        if (route.body_required &&
            (!request.body || request.body->empty() || is_empty_payload(*request.body))) {
            return RouteError{400, "Order data required"};
        }

        gateway::ForwardRequest forward;
        forward.method = request.method;
        forward.logical_path = substitute(route.upstream, *captures);
        forward.query = request.query;
        for (const auto& [key, value] : route.default_query) {
            const bool present = std::any_of(forward.query.begin(), forward.query.end(),
                                             [&key](const auto& kv) { return kv.first == key; });
            if (!present) {
                forward.query.emplace_back(key, value);
            }
        }
        forward.body = request.body;
        return forward;
    }

    if (path_known) {
        return RouteError{405, "method not allowed"};
    }
    return RouteError{404, "not found"};
}

// ============================================================================
// Health
// ============================================================================

std::string health_json(const auth::RequestAuthenticator& authenticator) {
    std::ostringstream ss;
    ss << R"({"status":"healthy","timestamp":")" << to_iso8601(now()) << '"'
       << R"(,"credentials_configured":)" << (authenticator.credentials_configured() ? "true" : "false")
       << R"(,"key_loaded":)" << (authenticator.key_loaded() ? "true" : "false")
       << R"(,"algorithm":")" << auth::to_string(authenticator.algorithm()) << R"("})";
    return ss.str();
}

}  // namespace signgate::server
