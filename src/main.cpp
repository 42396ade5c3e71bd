// ============================================================================
// SIGNGATE - Request-Signing Gateway
// ============================================================================
// Holds the signing key and turns unauthenticated local calls into signed
// upstream calls.
//
//   [caller] --HTTP--> HttpServer --> Router --> ForwardingEngine
//                                                    │
//                                      RequestAuthenticator (Signer, KeyStore)
//                                                    │
//                                              RestClient --HTTPS--> upstream
// ============================================================================

#include "signgate/auth/key_store.hpp"
#include "signgate/auth/request_authenticator.hpp"
#include "signgate/auth/signer.hpp"
#include "signgate/config/config.hpp"
#include "signgate/core/error.hpp"
#include "signgate/gateway/forwarding_engine.hpp"
#include "signgate/network/rest_client.hpp"
#include "signgate/server/http_server.hpp"
#include "signgate/utils/logger.hpp"

#include <boost/asio.hpp>

#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace signgate;

namespace {

struct CommandLine {
    std::string config_path;
    std::optional<std::string> port;
    std::optional<std::string> log_level;
    bool check_only = false;
};

void print_usage() {
    std::cerr << "usage: signgate [config.yaml] [--config path] [--port N]"
                 " [--log-level L] [--check]\n";
}

std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cli;

    if (argc > 1 && argv[1][0] != '-') {
        cli.config_path = argv[1];
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cli.config_path = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            cli.port = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            cli.log_level = argv[++i];
        } else if (arg == "--check") {
            cli.check_only = true;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (i != 1 || arg[0] == '-') {
            std::cerr << "[ERROR] Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    return cli;
}

/// Command line beats environment, environment beats the YAML file
config::Environment layered_environment(const CommandLine& cli) {
    return [cli](const std::string& name) -> std::optional<std::string> {
        if (name == "PORT" && cli.port) return cli.port;
        if (name == "SIGNGATE_LOG_LEVEL" && cli.log_level) return cli.log_level;
        return config::system_environment(name);
    };
}

}  // namespace

int main(int argc, char* argv[]) {
    auto cli = parse_command_line(argc, argv);
    if (!cli) {
        print_usage();
        return 2;
    }

    config::GatewayConfig config;
    try {
        config = config::load_config(cli->config_path, layered_environment(*cli));
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] Config load failed: " << e.what() << "\n";
        return 1;
    }

    utils::Logger::initialize(config.logging);

    const auto& creds = config.credentials;
    LOG_INFO("========================================");
    LOG_INFO("  SIGNGATE - Request-Signing Gateway");
    LOG_INFO("  Upstream:  {}{}", config.upstream.base_url, config.upstream.api_prefix);
    LOG_INFO("  Algorithm: {}", auth::to_string(creds.algorithm));
    LOG_INFO("  Key ID:    {}", utils::mask_identifier(creds.key_id));
    LOG_INFO("  Key:       {}", auth::to_string(creds.key_source().kind));
    LOG_INFO("  Timeout:   {} ms", config.upstream.timeout.count());
    LOG_INFO("========================================");

    auto key_store = std::make_shared<const auth::KeyStore>(creds.key_source(), creds.algorithm);
    auto authenticator = std::make_shared<const auth::RequestAuthenticator>(
        auth::Credential{creds.key_id, key_store},
        auth::Signer(creds.algorithm),
        creds.headers);

    if (!creds.configured()) {
        LOG_WARN("Credentials not configured; every forwarded request will fail until they are");
    }

    // Load the key before listening so a bad key refuses to start
    if ((config.server.eager_key_load && key_store->configured()) || cli->check_only) {
        try {
            authenticator->preload();
            if (!authenticator->self_test()) {
                LOG_CRITICAL("Signing self-test failed: signature did not verify");
                utils::Logger::shutdown();
                return 1;
            }
            LOG_INFO("Signing self-test passed");
        } catch (const KeyLoadError& e) {
            LOG_CRITICAL("Cannot load signing key [{}]: {}", to_string(e.kind()), e.what());
            utils::Logger::shutdown();
            return 1;
        } catch (const SigningError& e) {
            LOG_CRITICAL("Signing self-test failed: {}", e.what());
            utils::Logger::shutdown();
            return 1;
        }
    }

    if (cli->check_only) {
        const bool ok = creds.configured();
        if (!ok) {
            LOG_ERROR("Key id not configured");
        }
        utils::Logger::shutdown();
        return ok ? 0 : 1;
    }

    const int threads = config.server.threads;
    boost::asio::io_context io_context(threads);

    try {
        auto client = std::make_shared<network::RestClient>(config.rest_client_config(), io_context);

        gateway::ForwardingConfig forwarding;
        forwarding.upstream_prefix = config.upstream_prefix();
        auto engine = std::make_shared<const gateway::ForwardingEngine>(
            forwarding, authenticator, client);

        server::HttpServer server(config.server, engine, io_context);
        server.start();

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int signal) {
            LOG_INFO("Received signal {}, stopping...", signal);
            server.stop();
            io_context.stop();
        });

        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(threads - 1));
        for (int i = 1; i < threads; ++i) {
            workers.emplace_back([&io_context] { io_context.run(); });
        }
        io_context.run();

        for (auto& worker : workers) {
            worker.join();
        }
    } catch (const ConfigError& e) {
        LOG_CRITICAL("Configuration error: {}", e.what());
        utils::Logger::shutdown();
        return 1;
    } catch (const boost::system::system_error& e) {
        LOG_CRITICAL("Server failed: {}", e.what());
        utils::Logger::shutdown();
        return 1;
    }

    LOG_INFO("Shutdown complete");
    utils::Logger::shutdown();
    return 0;
}
