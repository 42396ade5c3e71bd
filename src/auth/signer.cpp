// ============================================================================
// SIGNGATE - Signer Implementation
// ============================================================================
// OpenSSL EVP_DigestSign with per-algorithm padding parameters
// ============================================================================

#include "signgate/auth/signer.hpp"

#include "signgate/core/error.hpp"
#include "signgate/utils/encoding.hpp"

#include <openssl/err.h>
#include <openssl/rsa.h>

#include <memory>
#include <vector>

namespace signgate::auth {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string openssl_error(const char* what) {
    const unsigned long code = ERR_get_error();
    std::string message = what;
    if (code != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        message += ": ";
        message += buf;
    }
    ERR_clear_error();
    return message;
}

// Ed25519 takes no digest; RSA variants hash with SHA-256
const EVP_MD* digest_for(SigningAlgorithm algorithm) noexcept {
    return algorithm == SigningAlgorithm::Ed25519 ? nullptr : EVP_sha256();
}

bool configure_padding(EVP_PKEY_CTX* pctx, SigningAlgorithm algorithm, int salt_length) {
    switch (algorithm) {
        case SigningAlgorithm::RsaPkcs1v15Sha256:
            return EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) > 0;
        case SigningAlgorithm::RsaPssSha256:
            return EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) > 0 &&
                   EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, EVP_sha256()) > 0 &&
                   EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, salt_length) > 0;
        case SigningAlgorithm::Ed25519:
            return true;
    }
    return false;
}

}  // namespace

std::string Signer::sign(std::string_view message, const PrivateKey& key) const {
    if (!key.is_type(required_key_type(algorithm_))) {
        throw SigningError("key type " + key.type_name() + " cannot sign with " +
                           std::string(to_string(algorithm_)));
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw SigningError(openssl_error("EVP_MD_CTX_new failed"));
    }

    EVP_PKEY_CTX* pctx = nullptr;
    if (EVP_DigestSignInit(ctx.get(), &pctx, digest_for(algorithm_), nullptr, key.native()) != 1) {
        throw SigningError(openssl_error("EVP_DigestSignInit failed"));
    }
    if (!configure_padding(pctx, algorithm_, RSA_PSS_SALTLEN_MAX)) {
        throw SigningError(openssl_error("signature padding setup failed"));
    }

    const auto* data = reinterpret_cast<const unsigned char*>(message.data());

    // One-shot form: required for Ed25519, equivalent for RSA
    size_t sig_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, data, message.size()) != 1) {
        throw SigningError(openssl_error("EVP_DigestSign (size) failed"));
    }

    std::vector<unsigned char> sig(sig_len);
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, data, message.size()) != 1) {
        throw SigningError(openssl_error("EVP_DigestSign failed"));
    }

    return std::string(reinterpret_cast<const char*>(sig.data()), sig_len);
}

std::string Signer::sign_base64(std::string_view message, const PrivateKey& key) const {
    return utils::base64_encode(sign(message, key));
}

bool Signer::verify(std::string_view message, std::string_view signature, EVP_PKEY* key) const {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }

    EVP_PKEY_CTX* pctx = nullptr;
    if (EVP_DigestVerifyInit(ctx.get(), &pctx, digest_for(algorithm_), nullptr, key) != 1 ||
        !configure_padding(pctx, algorithm_, RSA_PSS_SALTLEN_AUTO)) {
        ERR_clear_error();
        return false;
    }

    const int rc = EVP_DigestVerify(
        ctx.get(),
        reinterpret_cast<const unsigned char*>(signature.data()), signature.size(),
        reinterpret_cast<const unsigned char*>(message.data()), message.size());
    ERR_clear_error();
    return rc == 1;
}

}  // namespace signgate::auth
