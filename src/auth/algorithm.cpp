// ============================================================================
// SIGNGATE - Signing Algorithm Names
// ============================================================================

#include "signgate/auth/algorithm.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace signgate::auth {

std::optional<SigningAlgorithm> parse_signing_algorithm(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(lower.begin(), lower.end(), '_', '-');

    if (lower == "rsa-pkcs1v15-sha256" || lower == "pkcs1" || lower == "rs256") {
        return SigningAlgorithm::RsaPkcs1v15Sha256;
    }
    if (lower == "rsa-pss-sha256" || lower == "pss" || lower == "ps256") {
        return SigningAlgorithm::RsaPssSha256;
    }
    if (lower == "ed25519" || lower == "eddsa") {
        return SigningAlgorithm::Ed25519;
    }
    return std::nullopt;
}

}  // namespace signgate::auth
