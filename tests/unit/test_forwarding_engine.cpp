// ============================================================================
// SIGNGATE - Forwarding Engine Unit Tests
// ============================================================================

#include "signgate/gateway/forwarding_engine.hpp"
#include "support/test_keys.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <vector>

using namespace signgate;
using namespace signgate::gateway;

namespace {

/// Answers every call with a canned response and records what it was sent
class ScriptedRestClient : public network::IRestClient {
public:
    explicit ScriptedRestClient(network::HttpResponse reply) : reply_(std::move(reply)) {}

    network::HttpResponse request(const network::HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(request);
        return reply_;
    }

    std::shared_ptr<network::PendingRequest> request_async(const network::HttpRequest& request,
                                                           ResponseCallback callback) override {
        callback(this->request(request));
        return std::make_shared<NoopPending>();
    }

    std::vector<network::HttpRequest> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

private:
    struct NoopPending : network::PendingRequest {
        void cancel() override {}
    };

    network::HttpResponse reply_;
    mutable std::mutex mutex_;
    std::vector<network::HttpRequest> sent_;
};

network::HttpResponse upstream_reply(int status, std::string body, std::string content_type = "application/json") {
    network::HttpResponse response;
    response.status_code = status;
    response.body = std::move(body);
    response.content_type = std::move(content_type);
    return response;
}

network::HttpResponse transport_failure(network::TransportStatus status, std::string error) {
    network::HttpResponse response;
    response.status_code = -1;
    response.transport = status;
    response.error = std::move(error);
    return response;
}

std::string header_value(const network::HttpRequest& request, std::string_view name) {
    for (const auto& header : request.headers) {
        if (header.name == name) {
            return header.value;
        }
    }
    return {};
}

class ForwardingEngineTest : public ::testing::Test {
protected:
    std::shared_ptr<const auth::RequestAuthenticator> authenticator(bool with_key = true) {
        std::shared_ptr<const auth::KeyStore> store;
        if (with_key) {
            store = std::make_shared<auth::KeyStore>(
                auth::KeySource::inline_pem(test::rsa_private_pem()),
                auth::SigningAlgorithm::RsaPssSha256);
        } else {
            store = std::make_shared<auth::KeyStore>(auth::KeySource{},
                                                     auth::SigningAlgorithm::RsaPssSha256);
        }
        return std::make_shared<auth::RequestAuthenticator>(
            auth::Credential{"key-123", store},
            auth::Signer(auth::SigningAlgorithm::RsaPssSha256),
            auth::AuthHeaderNames{},
            [] { return 1700000000000LL; });
    }

    std::unique_ptr<ForwardingEngine> engine(network::HttpResponse reply, bool with_key = true) {
        client_ = std::make_shared<ScriptedRestClient>(std::move(reply));
        return std::make_unique<ForwardingEngine>(ForwardingConfig{}, authenticator(with_key), client_);
    }

    std::shared_ptr<ScriptedRestClient> client_;
};

}  // namespace

// ============================================================================
// Path Resolution Tests
// ============================================================================

TEST(ResolveUpstreamPathTest, JoinsUnderPrefix) {
    EXPECT_EQ(resolve_upstream_path("/trade-api/v2", "portfolio/balance"),
              "/trade-api/v2/portfolio/balance");
    EXPECT_EQ(resolve_upstream_path("/trade-api/v2", "/markets//KX-1/./"),
              "/trade-api/v2/markets/KX-1");
}

TEST(ResolveUpstreamPathTest, KeepsEncodedSegmentsVerbatim) {
    EXPECT_EQ(resolve_upstream_path("/p", "markets/A%20B"), "/p/markets/A%20B");
}

TEST(ResolveUpstreamPathTest, RejectsTraversal) {
    EXPECT_THROW((void)resolve_upstream_path("/trade-api/v2", "../admin"), PathRejected);
    EXPECT_THROW((void)resolve_upstream_path("/trade-api/v2", "portfolio/../../admin"), PathRejected);
    EXPECT_THROW((void)resolve_upstream_path("/trade-api/v2", "%2e%2e/admin"), PathRejected);
    EXPECT_THROW((void)resolve_upstream_path("/trade-api/v2", "a%2Fb"), PathRejected);
    EXPECT_THROW((void)resolve_upstream_path("/trade-api/v2", "a\\..\\b"), PathRejected);
}

TEST(ResolveUpstreamPathTest, RejectsMalformedAndEmpty) {
    EXPECT_THROW((void)resolve_upstream_path("/p", ""), PathRejected);
    EXPECT_THROW((void)resolve_upstream_path("/p", "//"), PathRejected);
    EXPECT_THROW((void)resolve_upstream_path("/p", "a?b=c"), PathRejected);
    EXPECT_THROW((void)resolve_upstream_path("/p", "a#frag"), PathRejected);
    EXPECT_THROW((void)resolve_upstream_path("/p", "a%zz"), PathRejected);
    EXPECT_THROW((void)resolve_upstream_path("/p", std::string("a\nb")), PathRejected);
}

// ============================================================================
// Body Tests
// ============================================================================

TEST(NormalizeJsonBodyTest, Minifies) {
    EXPECT_EQ(normalize_json_body("{ \"ticker\" : \"KX\",\n \"count\": 3 }"),
              R"({"ticker":"KX","count":3})");
}

TEST(NormalizeJsonBodyTest, RejectsInvalidJson) {
    EXPECT_THROW((void)normalize_json_body("{ticker: KX"), InvalidRequest);
    EXPECT_THROW((void)normalize_json_body("not json"), InvalidRequest);
}

// ============================================================================
// Pipeline Tests
// ============================================================================

TEST_F(ForwardingEngineTest, SignsAndForwards) {
    auto e = engine(upstream_reply(200, R"({"balance":100})"));

    ForwardRequest request;
    request.logical_path = "portfolio/balance";
    const auto result = e->forward(request);

    EXPECT_EQ(result.status_code, 200);
    EXPECT_EQ(result.body, R"({"balance":100})");
    EXPECT_EQ(result.content_type, "application/json");
    EXPECT_FALSE(result.is_gateway_error());

    const auto sent = client_->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].method, HttpMethod::GET);
    EXPECT_EQ(sent[0].path, "/trade-api/v2/portfolio/balance");
    EXPECT_EQ(header_value(sent[0], "KALSHI-ACCESS-KEY"), "key-123");
    EXPECT_EQ(header_value(sent[0], "KALSHI-ACCESS-TIMESTAMP"), "1700000000000");
    EXPECT_FALSE(header_value(sent[0], "KALSHI-ACCESS-SIGNATURE").empty());
}

TEST_F(ForwardingEngineTest, QueryIsForwardedButNotSigned) {
    auto e = engine(upstream_reply(200, "{}"));

    ForwardRequest request;
    request.logical_path = "markets";
    request.query = {{"limit", "5"}, {"status", "open"}};
    (void)e->forward(request);

    const auto sent = client_->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].path, "/trade-api/v2/markets");
    EXPECT_EQ(sent[0].query_params, request.query);
}

TEST_F(ForwardingEngineTest, BodyIsMinified) {
    auto e = engine(upstream_reply(201, R"({"order":{"id":"o1"}})"));

    ForwardRequest request;
    request.method = HttpMethod::POST;
    request.logical_path = "portfolio/orders";
    request.body = "{ \"ticker\": \"KX\", \"side\": \"yes\" }";
    const auto result = e->forward(request);

    EXPECT_EQ(result.status_code, 201);
    ASSERT_EQ(client_->sent().size(), 1u);
    EXPECT_EQ(client_->sent()[0].body, R"({"ticker":"KX","side":"yes"})");
}

TEST_F(ForwardingEngineTest, UpstreamErrorPassesThroughVerbatim) {
    auto e = engine(upstream_reply(429, R"({"error":"rate limited"})"));

    ForwardRequest request;
    request.logical_path = "markets";
    const auto result = e->forward(request);

    EXPECT_EQ(result.status_code, 429);
    EXPECT_EQ(result.body, R"({"error":"rate limited"})");
    EXPECT_FALSE(result.is_gateway_error());
}

TEST_F(ForwardingEngineTest, RetryAfterIsRelayed) {
    auto reply = upstream_reply(429, R"({"error":"rate limited"})");
    reply.headers["retry-after"] = "3";
    reply.headers["set-cookie"] = "session=abc";
    auto e = engine(std::move(reply));

    ForwardRequest request;
    request.logical_path = "portfolio/orders";
    const auto result = e->forward(request);

    EXPECT_EQ(result.status_code, 429);
    ASSERT_EQ(result.headers.size(), 1u);
    EXPECT_EQ(result.headers[0].name, "Retry-After");
    EXPECT_EQ(result.headers[0].value, "3");
}

TEST_F(ForwardingEngineTest, ContentTypeDefaultsToJson) {
    auto e = engine(upstream_reply(200, "ok", ""));
    ForwardRequest request;
    request.logical_path = "markets";
    EXPECT_EQ(e->forward(request).content_type, "application/json");

    auto text = engine(upstream_reply(502, "bad gateway", "text/plain"));
    const auto result = text->forward(request);
    EXPECT_EQ(result.status_code, 502);
    EXPECT_EQ(result.content_type, "text/plain");
}

TEST_F(ForwardingEngineTest, TimeoutMapsTo504) {
    auto e = engine(transport_failure(network::TransportStatus::Timeout, "upstream timed out"));
    ForwardRequest request;
    request.logical_path = "markets";
    const auto result = e->forward(request);

    EXPECT_EQ(result.status_code, 504);
    EXPECT_EQ(result.error, GatewayErrorKind::UpstreamTimeout);
    EXPECT_EQ(result.body, R"({"error":"upstream timed out"})");
}

TEST_F(ForwardingEngineTest, TransportFailureMapsTo500) {
    auto e = engine(transport_failure(network::TransportStatus::Failed, "connection refused"));
    ForwardRequest request;
    request.logical_path = "markets";
    const auto result = e->forward(request);

    EXPECT_EQ(result.status_code, 500);
    EXPECT_EQ(result.error, GatewayErrorKind::UpstreamTransport);
    EXPECT_EQ(result.body, R"({"error":"connection refused"})");
}

// ============================================================================
// Pre-flight Failure Tests
// ============================================================================

TEST_F(ForwardingEngineTest, MissingKeyFailsWithoutCallingUpstream) {
    auto e = engine(upstream_reply(200, "{}"), false);
    ForwardRequest request;
    request.logical_path = "portfolio/balance";
    const auto result = e->forward(request);

    EXPECT_EQ(result.status_code, 500);
    EXPECT_EQ(result.error, GatewayErrorKind::KeyLoad);
    EXPECT_NE(result.body.find("\"error\""), std::string::npos);
    EXPECT_TRUE(client_->sent().empty());
}

TEST_F(ForwardingEngineTest, TraversalIsRejectedWithoutCallingUpstream) {
    auto e = engine(upstream_reply(200, "{}"));
    ForwardRequest request;
    request.logical_path = "../admin";
    const auto result = e->forward(request);

    EXPECT_EQ(result.status_code, 400);
    EXPECT_EQ(result.error, GatewayErrorKind::BadRequest);
    EXPECT_TRUE(client_->sent().empty());
}

TEST_F(ForwardingEngineTest, InvalidBodyIsRejectedWithoutCallingUpstream) {
    auto e = engine(upstream_reply(200, "{}"));
    ForwardRequest request;
    request.method = HttpMethod::POST;
    request.logical_path = "portfolio/orders";
    request.body = "{broken";
    const auto result = e->forward(request);

    EXPECT_EQ(result.status_code, 400);
    EXPECT_TRUE(client_->sent().empty());
}

// ============================================================================
// Async Tests
// ============================================================================

TEST_F(ForwardingEngineTest, AsyncDeliversUpstreamResult) {
    auto e = engine(upstream_reply(200, R"({"positions":[]})"));
    ForwardRequest request;
    request.logical_path = "portfolio/positions";

    std::optional<ForwardResult> delivered;
    auto pending = e->forward_async(request, [&delivered](ForwardResult r) { delivered = std::move(r); });

    EXPECT_NE(pending, nullptr);
    ASSERT_TRUE(delivered.has_value());
    EXPECT_EQ(delivered->status_code, 200);
    EXPECT_EQ(delivered->body, R"({"positions":[]})");
}

TEST_F(ForwardingEngineTest, AsyncPreflightFailureRunsInline) {
    auto e = engine(upstream_reply(200, "{}"));
    ForwardRequest request;
    request.logical_path = "%2e%2e";

    std::optional<ForwardResult> delivered;
    auto pending = e->forward_async(request, [&delivered](ForwardResult r) { delivered = std::move(r); });

    EXPECT_EQ(pending, nullptr);
    ASSERT_TRUE(delivered.has_value());
    EXPECT_EQ(delivered->status_code, 400);
    EXPECT_TRUE(client_->sent().empty());
}

TEST(GatewayErrorKindTest, StatusTable) {
    EXPECT_EQ(http_status(GatewayErrorKind::Config), 500);
    EXPECT_EQ(http_status(GatewayErrorKind::KeyLoad), 500);
    EXPECT_EQ(http_status(GatewayErrorKind::Signing), 500);
    EXPECT_EQ(http_status(GatewayErrorKind::BadRequest), 400);
    EXPECT_EQ(http_status(GatewayErrorKind::UpstreamTransport), 500);
    EXPECT_EQ(http_status(GatewayErrorKind::UpstreamTimeout), 504);
}
