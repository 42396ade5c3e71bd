// ============================================================================
// SIGNGATE - HTTP Server Implementation
// ============================================================================

#include "signgate/server/http_server.hpp"

#include "signgate/utils/encoding.hpp"
#include "signgate/utils/logger.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <optional>

namespace signgate::server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

constexpr auto kIdleTimeout = std::chrono::seconds(60);

std::optional<HttpMethod> from_verb(http::verb verb) noexcept {
    switch (verb) {
        case http::verb::get:     return HttpMethod::GET;
        case http::verb::post:    return HttpMethod::POST;
        case http::verb::put:     return HttpMethod::PUT;
        case http::verb::patch:   return HttpMethod::PATCH;
        case http::verb::delete_: return HttpMethod::DEL;
        default:                  return std::nullopt;
    }
}

// ============================================================================
// Session
// ============================================================================

class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket,
            std::shared_ptr<const gateway::ForwardingEngine> engine,
            std::shared_ptr<const Router> router,
            const config::ServerConfig& config)
        : stream_(std::move(socket))
        , engine_(std::move(engine))
        , router_(std::move(router))
        , cors_origin_(config.cors_allow_origin)
        , body_limit_(config.body_limit) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      [self = shared_from_this()] { self->do_read(); });
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(body_limit_);
        stream_.expires_after(kIdleTimeout);

        http::async_read(stream_, buffer_, *parser_,
                         [self = shared_from_this()](beast::error_code ec, std::size_t) {
                             self->on_read(ec);
                         });
    }

    void on_read(beast::error_code ec) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
                LOG_DEBUG("Session read failed: {}", ec.message());
            }
            do_close();
            return;
        }

        auto req = parser_->release();
        version_ = req.version();
        keep_alive_ = req.keep_alive();

        if (req.method() == http::verb::options) {
            send(204, "", "");
            return;
        }

        auto method = from_verb(req.method());
        if (!method) {
            send_error(405, "method not allowed");
            return;
        }

        auto target = split_target(std::string_view(req.target().data(), req.target().size()));
        if (!target) {
            send_error(400, "malformed query string");
            return;
        }

        InboundRequest inbound;
        inbound.method = *method;
        inbound.path = std::move(target->first);
        inbound.query = std::move(target->second);
        if (!req.body().empty()) {
            inbound.body = std::move(req.body());
        }

        auto match = router_->match(inbound);
        if (std::holds_alternative<HealthRoute>(match)) {
            send(200, health_json(engine_->authenticator()), "application/json");
        } else if (auto* error = std::get_if<RouteError>(&match)) {
            send_error(error->status_code, error->message);
        } else {
            start_forward(std::get<gateway::ForwardRequest>(std::move(match)));
        }
    }

    void start_forward(const gateway::ForwardRequest& request) {
        // The upstream call has its own deadline; the idle timer must not fire meanwhile
        stream_.expires_never();
        forwarding_ = true;

        auto self = shared_from_this();
        pending_ = engine_->forward_async(request, [self](gateway::ForwardResult result) {
            net::post(self->stream_.get_executor(),
                      [self, result = std::move(result)]() mutable {
                          self->on_forwarded(std::move(result));
                      });
        });

        if (forwarding_ && pending_) {
            watch_disconnect();
        }
    }

    /// A readable socket with nothing to read means the caller hung up
    void watch_disconnect() {
        stream_.socket().async_wait(
            tcp::socket::wait_read,
            [self = shared_from_this()](beast::error_code ec) {
                if (!self->forwarding_ || ec == net::error::operation_aborted) {
                    return;
                }
                beast::error_code avail_ec;
                const auto available = self->stream_.socket().available(avail_ec);
                if (ec || avail_ec || available == 0) {
                    LOG_INFO("Caller disconnected; cancelling upstream call");
                    if (self->pending_) {
                        self->pending_->cancel();
                    }
                }
            });
    }

    void on_forwarded(gateway::ForwardResult result) {
        forwarding_ = false;
        pending_.reset();

        beast::error_code ignored;
        stream_.socket().cancel(ignored);

        if (result.error == GatewayErrorKind::Cancelled) {
            do_close();
            return;
        }

        send(static_cast<unsigned>(result.status_code), std::move(result.body),
             result.content_type, result.headers);
    }

    void send_error(int status, std::string_view message) {
        send(static_cast<unsigned>(status), utils::error_json(message), "application/json");
    }

    void send(unsigned status, std::string body, std::string_view content_type,
              const HttpHeaders& extra = {}) {
        auto res = std::make_shared<http::response<http::string_body>>();
        res->version(version_);
        res->result(status);
        res->set(http::field::server, "signgate");
        if (!content_type.empty()) {
            res->set(http::field::content_type, beast::string_view(content_type.data(), content_type.size()));
        }
        res->set(http::field::access_control_allow_origin, cors_origin_);
        for (const auto& header : extra) {
            res->set(header.name, header.value);
        }
        if (status == 204) {
            res->set(http::field::access_control_allow_methods, "GET, POST, PUT, PATCH, DELETE, OPTIONS");
            res->set(http::field::access_control_allow_headers, "Content-Type, Authorization");
        }
        res->keep_alive(keep_alive_);
        res->body() = std::move(body);
        res->prepare_payload();

        response_ = res;
        stream_.expires_after(kIdleTimeout);
        http::async_write(stream_, *res,
                          [self = shared_from_this()](beast::error_code ec, std::size_t) {
                              self->on_write(ec);
                          });
    }

    void on_write(beast::error_code ec) {
        response_.reset();
        if (ec) {
            LOG_DEBUG("Session write failed: {}", ec.message());
            do_close();
            return;
        }
        if (!keep_alive_) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        stream_.close();
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<http::response<http::string_body>> response_;

    std::shared_ptr<const gateway::ForwardingEngine> engine_;
    std::shared_ptr<const Router> router_;
    std::string cors_origin_;
    size_t body_limit_;

    unsigned version_ = 11;
    bool keep_alive_ = false;
    bool forwarding_ = false;
    std::shared_ptr<network::PendingRequest> pending_;
};

}  // namespace

// ============================================================================
// Listener
// ============================================================================

struct HttpServer::Impl : std::enable_shared_from_this<HttpServer::Impl> {
    Impl(const config::ServerConfig& config,
         std::shared_ptr<const gateway::ForwardingEngine> engine,
         net::io_context& io_context,
         Router router)
        : config_(config)
        , engine_(std::move(engine))
        , router_(std::make_shared<const Router>(std::move(router)))
        , io_context_(io_context)
        , acceptor_(net::make_strand(io_context)) {}

    void start() {
        const tcp::endpoint endpoint(net::ip::make_address(config_.address), config_.port);

        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);

        LOG_INFO("Listening on {}:{}", config_.address, acceptor_.local_endpoint().port());
        do_accept();
    }

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(io_context_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            LOG_WARN("Accept failed: {}", ec.message());
        } else {
            std::make_shared<Session>(std::move(socket), engine_, router_, config_)->run();
        }
        do_accept();
    }

    void stop() {
        net::post(acceptor_.get_executor(), [self = shared_from_this()] {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

    config::ServerConfig config_;
    std::shared_ptr<const gateway::ForwardingEngine> engine_;
    std::shared_ptr<const Router> router_;
    net::io_context& io_context_;
    tcp::acceptor acceptor_;
};

HttpServer::HttpServer(const config::ServerConfig& config,
                       std::shared_ptr<const gateway::ForwardingEngine> engine,
                       net::io_context& io_context,
                       Router router)
    : impl_(std::make_shared<Impl>(config, std::move(engine), io_context, std::move(router))) {}

HttpServer::~HttpServer() = default;

void HttpServer::start() {
    impl_->start();
}

void HttpServer::stop() {
    impl_->stop();
}

uint16_t HttpServer::port() const {
    beast::error_code ec;
    return impl_->acceptor_.local_endpoint(ec).port();
}

}  // namespace signgate::server
