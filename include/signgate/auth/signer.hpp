#pragma once
// ============================================================================
// SIGNGATE - Signer
// ============================================================================
// Produces signatures over the canonical message with the configured
// algorithm:
//   RSA-PKCS1v15-SHA256  deterministic
//   RSA-PSS-SHA256       MGF1(SHA-256), maximum salt length, randomized
//   Ed25519              pure EdDSA over the raw message, deterministic
// ============================================================================

#include "signgate/auth/algorithm.hpp"
#include "signgate/auth/key_store.hpp"

#include <openssl/evp.h>

#include <string>
#include <string_view>

namespace signgate::auth {

class Signer {
public:
    explicit Signer(SigningAlgorithm algorithm) noexcept : algorithm_(algorithm) {}

    /// Raw signature bytes
    /// @throws SigningError on crypto failure or a key of the wrong type
    [[nodiscard]] std::string sign(std::string_view message, const PrivateKey& key) const;

    /// Standard base64 (no URL-safe alphabet, no line wrapping) of sign()
    [[nodiscard]] std::string sign_base64(std::string_view message, const PrivateKey& key) const;

    /// Verify raw signature bytes with a public (or private) key
    [[nodiscard]] bool verify(std::string_view message,
                              std::string_view signature,
                              EVP_PKEY* key) const;

    [[nodiscard]] SigningAlgorithm algorithm() const noexcept { return algorithm_; }

private:
    SigningAlgorithm algorithm_;
};

}  // namespace signgate::auth
