#pragma once
// ============================================================================
// SIGNGATE - HTTP Server
// ============================================================================
// Async HTTP/1.1 server (Boost.Beast). Each connection is a session on its
// own strand; upstream calls are cancelled when the caller disconnects.
// ============================================================================

#include "signgate/config/config.hpp"
#include "signgate/gateway/forwarding_engine.hpp"
#include "signgate/server/router.hpp"

#include <cstdint>
#include <memory>

// Forward declarations for Boost (avoid header pollution)
namespace boost::asio {
class io_context;
}  // namespace boost::asio

namespace signgate::server {

class HttpServer {
public:
    HttpServer(const config::ServerConfig& config,
               std::shared_ptr<const gateway::ForwardingEngine> engine,
               boost::asio::io_context& io_context,
               Router router = Router{});
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind, listen and start accepting
    /// @throws boost::system::system_error when the address cannot be bound
    void start();

    /// Stop accepting; in-flight sessions finish on their own
    void stop();

    /// Bound port (useful when configured with port 0)
    [[nodiscard]] uint16_t port() const;

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

}  // namespace signgate::server
