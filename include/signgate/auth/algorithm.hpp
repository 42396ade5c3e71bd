#pragma once
// ============================================================================
// SIGNGATE - Signing Algorithm
// ============================================================================
// Fixed per deployment; selects padding/hash parameters and the expected
// private key type
// ============================================================================

#include <optional>
#include <string_view>

namespace signgate::auth {

enum class SigningAlgorithm {
    RsaPkcs1v15Sha256,
    RsaPssSha256,
    Ed25519
};

enum class KeyType {
    Rsa,
    Ed25519
};

[[nodiscard]] constexpr KeyType required_key_type(SigningAlgorithm algorithm) noexcept {
    return algorithm == SigningAlgorithm::Ed25519 ? KeyType::Ed25519 : KeyType::Rsa;
}

[[nodiscard]] constexpr std::string_view to_string(SigningAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case SigningAlgorithm::RsaPkcs1v15Sha256: return "rsa-pkcs1v15-sha256";
        case SigningAlgorithm::RsaPssSha256:      return "rsa-pss-sha256";
        case SigningAlgorithm::Ed25519:           return "ed25519";
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(KeyType type) noexcept {
    return type == KeyType::Rsa ? "RSA" : "Ed25519";
}

/// Case-insensitive; also accepts "pkcs1", "pss" and "rs256"/"ps256" aliases
[[nodiscard]] std::optional<SigningAlgorithm> parse_signing_algorithm(std::string_view name);

}  // namespace signgate::auth
