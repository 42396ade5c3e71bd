// ============================================================================
// SIGNGATE - Request Authenticator Implementation
// ============================================================================

#include "signgate/auth/request_authenticator.hpp"

#include "signgate/core/error.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace signgate::auth {

namespace {

constexpr std::string_view kProbeMessage = "0GET/signgate/self-test";

}  // namespace

std::string canonical_message(std::string_view timestamp_ms,
                              std::string_view method,
                              std::string_view upstream_path) {
    std::string message;
    message.reserve(timestamp_ms.size() + method.size() + upstream_path.size());
    message.append(timestamp_ms);
    std::transform(method.begin(), method.end(), std::back_inserter(message),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    message.append(upstream_path);
    return message;
}

RequestAuthenticator::RequestAuthenticator(Credential credential,
                                           Signer signer,
                                           AuthHeaderNames names,
                                           Clock clock)
    : credential_(std::move(credential))
    , signer_(signer)
    , names_(std::move(names))
    , clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return to_epoch_ms(now()); };
    }
}

AuthHeaders RequestAuthenticator::build_headers(std::string_view method,
                                                std::string_view upstream_path) const {
    if (credential_.key_id.empty()) {
        throw ConfigError("access key id not configured");
    }
    auto signing_key = key();

    AuthHeaders out;
    out.timestamp = std::to_string(clock_());
    out.signature = signer_.sign_base64(
        canonical_message(out.timestamp, method, upstream_path), *signing_key);

    out.headers.push_back({names_.key_id, credential_.key_id});
    out.headers.push_back({names_.signature, out.signature});
    out.headers.push_back({names_.timestamp, out.timestamp});
    out.headers.push_back({"Content-Type", "application/json"});
    return out;
}

void RequestAuthenticator::preload() const {
    (void)key();
}

bool RequestAuthenticator::self_test() const {
    auto signing_key = key();
    const std::string signature = signer_.sign(kProbeMessage, *signing_key);
    return signer_.verify(kProbeMessage, signature, signing_key->native());
}

std::shared_ptr<const PrivateKey> RequestAuthenticator::key() const {
    if (!credential_.key_store) {
        throw KeyLoadError(KeyLoadError::Kind::NotConfigured, "no private key configured");
    }
    return credential_.key_store->get();
}

}  // namespace signgate::auth
