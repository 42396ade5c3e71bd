#pragma once
// ============================================================================
// SIGNGATE - Request Authenticator
// ============================================================================
// Builds the canonical message  <timestampMillis><METHOD><upstreamPath>
// (no separators), signs it and assembles the authentication header set.
// Every call takes a fresh timestamp; nothing is cached between calls.
// ============================================================================

#include "signgate/auth/key_store.hpp"
#include "signgate/auth/signer.hpp"
#include "signgate/core/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace signgate::auth {

/// Header names are a wire contract with the upstream; case is preserved
struct AuthHeaderNames {
    std::string key_id = "KALSHI-ACCESS-KEY";
    std::string signature = "KALSHI-ACCESS-SIGNATURE";
    std::string timestamp = "KALSHI-ACCESS-TIMESTAMP";
};

/// Single static identity for the process
struct Credential {
    std::string key_id;
    std::shared_ptr<const KeyStore> key_store;

    [[nodiscard]] bool configured() const noexcept {
        return !key_id.empty() && key_store && key_store->configured();
    }
};

struct AuthHeaders {
    std::string timestamp;   // decimal epoch milliseconds
    std::string signature;   // base64
    HttpHeaders headers;     // key id, signature, timestamp, content type
};

/// Exact concatenation timestamp + METHOD + path; method is uppercased
[[nodiscard]] std::string canonical_message(std::string_view timestamp_ms,
                                            std::string_view method,
                                            std::string_view upstream_path);

class RequestAuthenticator {
public:
    /// Wall-clock epoch milliseconds
    using Clock = std::function<int64_t()>;

    RequestAuthenticator(Credential credential,
                         Signer signer,
                         AuthHeaderNames names = {},
                         Clock clock = {});

    /// @throws ConfigError when no key id is configured
    /// @throws KeyLoadError, SigningError
    [[nodiscard]] AuthHeaders build_headers(std::string_view method,
                                            std::string_view upstream_path) const;

    [[nodiscard]] AuthHeaders build_headers(HttpMethod method,
                                            std::string_view upstream_path) const {
        return build_headers(to_string(method), upstream_path);
    }

    /// Load the key now instead of on first request
    /// @throws KeyLoadError
    void preload() const;

    /// Sign and verify a probe message with the loaded key
    /// @throws KeyLoadError, SigningError
    [[nodiscard]] bool self_test() const;

    [[nodiscard]] bool credentials_configured() const noexcept { return credential_.configured(); }
    [[nodiscard]] bool key_loaded() const noexcept {
        return credential_.key_store && credential_.key_store->loaded();
    }
    [[nodiscard]] SigningAlgorithm algorithm() const noexcept { return signer_.algorithm(); }
    [[nodiscard]] const AuthHeaderNames& header_names() const noexcept { return names_; }

private:
    [[nodiscard]] std::shared_ptr<const PrivateKey> key() const;

    Credential credential_;
    Signer signer_;
    AuthHeaderNames names_;
    Clock clock_;
};

}  // namespace signgate::auth
