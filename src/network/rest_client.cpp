// ============================================================================
// SIGNGATE - REST Client Implementation
// ============================================================================
// Boost.Beast HTTP client. Each call runs as an async chain on its own
// strand, bounded by one deadline timer that aborts whatever step is in
// progress.
// ============================================================================

#include "signgate/network/rest_client.hpp"

#include "signgate/core/error.hpp"
#include "signgate/utils/encoding.hpp"
#include "signgate/utils/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>
#include <thread>
#include <type_traits>

namespace signgate::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

template <typename Stream>
constexpr bool kIsTls = std::is_same_v<Stream, TlsStream>;

http::verb to_verb(HttpMethod method) noexcept {
    switch (method) {
        case HttpMethod::GET:   return http::verb::get;
        case HttpMethod::POST:  return http::verb::post;
        case HttpMethod::PUT:   return http::verb::put;
        case HttpMethod::PATCH: return http::verb::patch;
        case HttpMethod::DEL:   return http::verb::delete_;
    }
    return http::verb::get;
}

// ============================================================================
// Upstream Call
// ============================================================================

template <typename Stream>
class UpstreamCall : public PendingRequest,
                     public std::enable_shared_from_this<UpstreamCall<Stream>> {
public:
    using Executor = net::io_context::executor_type;

    UpstreamCall(Executor executor,
                 ssl::context& ssl_context,
                 const RestClientConfig& config,
                 const UpstreamEndpoint& endpoint,
                 http::request<http::string_body> request,
                 IRestClient::ResponseCallback callback)
        : strand_(net::make_strand(executor))
        , resolver_(strand_)
        , timer_(strand_)
        , endpoint_(endpoint)
        , timeout_(config.request_timeout)
        , verify_tls_(config.verify_tls)
        , request_(std::move(request))
        , callback_(std::move(callback)) {
        if constexpr (kIsTls<Stream>) {
            stream_ = std::make_unique<Stream>(strand_, ssl_context);
        } else {
            (void)ssl_context;
            stream_ = std::make_unique<Stream>(strand_);
        }
        parser_.body_limit(config.max_response_bytes);
    }

    void start() {
        net::dispatch(strand_, [self = this->shared_from_this()] {
            self->timer_.expires_after(self->timeout_);
            self->timer_.async_wait([self](beast::error_code ec) { self->on_timeout(ec); });

            self->resolver_.async_resolve(
                self->endpoint_.host,
                self->endpoint_.port,
                [self](beast::error_code ec, tcp::resolver::results_type results) {
                    self->on_resolve(ec, results);
                });
        });
    }

    void cancel() override {
        net::post(strand_, [self = this->shared_from_this()] {
            self->fail(TransportStatus::Cancelled, "upstream request cancelled");
        });
    }

private:
    void on_timeout(beast::error_code ec) {
        if (ec == net::error::operation_aborted) {
            return;
        }
        fail(TransportStatus::Timeout,
             "upstream request timed out after " + std::to_string(timeout_.count()) + " ms");
    }

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (done_) return;
        if (ec) {
            fail(TransportStatus::Failed, "resolve " + endpoint_.host + " failed: " + ec.message());
            return;
        }

        beast::get_lowest_layer(*stream_).async_connect(
            results,
            [self = this->shared_from_this()](beast::error_code ec, tcp::endpoint) {
                self->on_connect(ec);
            });
    }

    void on_connect(beast::error_code ec) {
        if (done_) return;
        if (ec) {
            fail(TransportStatus::Failed, "connect " + endpoint_.host + " failed: " + ec.message());
            return;
        }

        if constexpr (kIsTls<Stream>) {
            // Set SNI hostname for SSL
            if (!SSL_set_tlsext_host_name(stream_->native_handle(), endpoint_.host.c_str())) {
                fail(TransportStatus::Failed, "failed to set SNI hostname");
                return;
            }
            if (verify_tls_) {
                stream_->set_verify_mode(ssl::verify_peer);
                stream_->set_verify_callback(ssl::host_name_verification(endpoint_.host));
            }

            stream_->async_handshake(
                ssl::stream_base::client,
                [self = this->shared_from_this()](beast::error_code ec) {
                    self->on_handshake(ec);
                });
        } else {
            do_write();
        }
    }

    void on_handshake(beast::error_code ec) {
        if (done_) return;
        if (ec) {
            fail(TransportStatus::Failed, "TLS handshake failed: " + ec.message());
            return;
        }
        do_write();
    }

    void do_write() {
        http::async_write(
            *stream_, request_,
            [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_write(ec);
            });
    }

    void on_write(beast::error_code ec) {
        if (done_) return;
        if (ec) {
            fail(TransportStatus::Failed, "write failed: " + ec.message());
            return;
        }

        http::async_read(
            *stream_, buffer_, parser_,
            [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_read(ec);
            });
    }

    void on_read(beast::error_code ec) {
        if (done_) return;
        if (ec) {
            fail(TransportStatus::Failed, "read failed: " + ec.message());
            return;
        }

        auto& res = parser_.get();

        HttpResponse response;
        response.status_code = static_cast<int>(res.result_int());
        response.body = std::move(res.body());
        for (const auto& header : res) {
            std::string name(header.name_string());
            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            response.headers[std::move(name)] = std::string(header.value());
        }
        auto content_type = res.find(http::field::content_type);
        if (content_type != res.end()) {
            response.content_type = std::string(content_type->value());
        }

        finish(std::move(response));
    }

    void fail(TransportStatus status, std::string message) {
        if (done_) return;

        HttpResponse response;
        response.status_code = -1;
        response.transport = status;
        response.error = std::move(message);
        finish(std::move(response));
    }

    void finish(HttpResponse response) {
        if (done_) return;
        done_ = true;

        timer_.cancel();
        resolver_.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(*stream_).socket().shutdown(tcp::socket::shutdown_both, ignored);
        beast::get_lowest_layer(*stream_).close();

        auto callback = std::move(callback_);
        if (callback) {
            callback(std::move(response));
        }
    }

    net::strand<Executor> strand_;
    tcp::resolver resolver_;
    net::steady_timer timer_;
    std::unique_ptr<Stream> stream_;

    UpstreamEndpoint endpoint_;
    std::chrono::milliseconds timeout_;
    bool verify_tls_;

    http::request<http::string_body> request_;
    beast::flat_buffer buffer_;
    http::response_parser<http::string_body> parser_;

    IRestClient::ResponseCallback callback_;
    bool done_ = false;
};

}  // namespace

// ============================================================================
// Endpoint Parsing
// ============================================================================

std::string UpstreamEndpoint::host_header() const {
    const bool default_port = (is_tls() && port == "443") || (!is_tls() && port == "80");
    return default_port ? host : host + ":" + port;
}

UpstreamEndpoint parse_base_url(std::string_view url) {
    UpstreamEndpoint endpoint;

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        throw ConfigError("upstream URL has no scheme: " + std::string(url));
    }
    endpoint.scheme = std::string(url.substr(0, scheme_end));
    if (endpoint.scheme != "https" && endpoint.scheme != "http") {
        throw ConfigError("unsupported upstream URL scheme: " + endpoint.scheme);
    }

    std::string_view rest = url.substr(scheme_end + 3);
    const auto path_start = rest.find('/');
    std::string_view authority = rest.substr(0, path_start);
    std::string_view path = path_start == std::string_view::npos ? std::string_view{}
                                                                 : rest.substr(path_start);
    if (path.find_first_of("?#") != std::string_view::npos) {
        throw ConfigError("upstream URL must not carry a query or fragment");
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        endpoint.host = std::string(authority.substr(0, colon));
        endpoint.port = std::string(authority.substr(colon + 1));
        if (endpoint.port.empty() ||
            endpoint.port.find_first_not_of("0123456789") != std::string::npos) {
            throw ConfigError("invalid upstream URL port: " + std::string(url));
        }
    } else {
        endpoint.host = std::string(authority);
        endpoint.port = endpoint.is_tls() ? "443" : "80";
    }
    if (endpoint.host.empty()) {
        throw ConfigError("upstream URL has no host: " + std::string(url));
    }

    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    endpoint.path = std::string(path);
    return endpoint;
}

std::string build_target(std::string_view path, const QueryParams& params) {
    std::ostringstream ss;
    ss << path;
    bool first = true;
    for (const auto& [key, value] : params) {
        ss << (first ? '?' : '&') << utils::url_encode(key) << '=' << utils::url_encode(value);
        first = false;
    }
    return ss.str();
}

// ============================================================================
// REST Client Implementation
// ============================================================================

struct RestClient::Impl {
    Impl(const RestClientConfig& config, net::io_context* external)
        : config_(config)
        , endpoint_(parse_base_url(config.base_url))
        , ssl_context_(ssl::context::tls_client) {

        // Configure SSL
        ssl_context_.set_default_verify_paths();
        ssl_context_.set_verify_mode(config_.verify_tls ? ssl::verify_peer : ssl::verify_none);

        if (external != nullptr) {
            io_context_ = external;
        } else {
            owned_io_ = std::make_unique<net::io_context>(1);
            work_ = std::make_unique<WorkGuard>(net::make_work_guard(*owned_io_));
            io_context_ = owned_io_.get();
            io_thread_ = std::thread([this] { owned_io_->run(); });
        }
    }

    ~Impl() {
        if (owned_io_) {
            work_.reset();
            owned_io_->stop();
            if (io_thread_.joinable()) {
                io_thread_.join();
            }
        }
    }

    http::request<http::string_body> build_request(const HttpRequest& req) const {
        http::request<http::string_body> http_req;
        http_req.version(11);
        http_req.method(to_verb(req.method));
        http_req.target(build_target(req.path, req.query_params));

        http_req.set(http::field::host, endpoint_.host_header());
        http_req.set(http::field::user_agent, config_.user_agent);

        for (const auto& header : req.headers) {
            http_req.set(header.name, header.value);
        }

        http_req.body() = req.body;
        http_req.prepare_payload();
        return http_req;
    }

    std::shared_ptr<PendingRequest> start(net::io_context::executor_type executor,
                                          const HttpRequest& req,
                                          IRestClient::ResponseCallback callback) {
        LOG_DEBUG("Upstream {} {}{}", to_string(req.method), endpoint_.host_header(), req.path);

        if (endpoint_.is_tls()) {
            auto call = std::make_shared<UpstreamCall<TlsStream>>(
                executor, ssl_context_, config_, endpoint_, build_request(req), std::move(callback));
            call->start();
            return call;
        }
        auto call = std::make_shared<UpstreamCall<PlainStream>>(
            executor, ssl_context_, config_, endpoint_, build_request(req), std::move(callback));
        call->start();
        return call;
    }

    using WorkGuard = net::executor_work_guard<net::io_context::executor_type>;

    RestClientConfig config_;
    UpstreamEndpoint endpoint_;
    ssl::context ssl_context_;

    net::io_context* io_context_ = nullptr;
    std::unique_ptr<net::io_context> owned_io_;
    std::unique_ptr<WorkGuard> work_;
    std::thread io_thread_;
};

// ============================================================================
// RestClient Public Interface
// ============================================================================

RestClient::RestClient(const RestClientConfig& config)
    : impl_(std::make_unique<Impl>(config, nullptr)) {}

RestClient::RestClient(const RestClientConfig& config, net::io_context& io_context)
    : impl_(std::make_unique<Impl>(config, &io_context)) {}

RestClient::~RestClient() = default;

HttpResponse RestClient::request(const HttpRequest& request) {
    net::io_context io_context(1);
    HttpResponse result;
    impl_->start(io_context.get_executor(), request,
                 [&result](HttpResponse response) { result = std::move(response); });
    io_context.run();
    return result;
}

std::shared_ptr<PendingRequest> RestClient::request_async(const HttpRequest& request,
                                                          ResponseCallback callback) {
    return impl_->start(impl_->io_context_->get_executor(), request, std::move(callback));
}

const UpstreamEndpoint& RestClient::endpoint() const noexcept {
    return impl_->endpoint_;
}

}  // namespace signgate::network
