#pragma once
// ============================================================================
// SIGNGATE - Key Store
// ============================================================================
// Loads, parses and caches the private signing key. The parsed key is
// read-only and shared across concurrent requests without locking; loading
// happens at most once per KeyStore behind std::call_once.
// ============================================================================

#include "signgate/auth/algorithm.hpp"

#include <openssl/evp.h>

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace signgate::auth {

// ============================================================================
// Private Key Handle
// ============================================================================

class PrivateKey {
public:
    /// Takes ownership of key
    explicit PrivateKey(EVP_PKEY* key) noexcept : key_(key) {}
    ~PrivateKey();

    // Non-copyable due to OpenSSL key ownership
    PrivateKey(const PrivateKey&) = delete;
    PrivateKey& operator=(const PrivateKey&) = delete;

    /// Parse an unencrypted PEM private key (PKCS#8 or traditional RSA)
    /// @throws KeyLoadError(ParseError)
    [[nodiscard]] static std::shared_ptr<const PrivateKey> from_pem(std::string_view pem);

    [[nodiscard]] EVP_PKEY* native() const noexcept { return key_; }

    /// RSA-PSS restricted keys count as RSA
    [[nodiscard]] bool is_type(KeyType type) const noexcept;
    [[nodiscard]] std::string type_name() const;

    /// SubjectPublicKeyInfo PEM of the matching public key
    [[nodiscard]] std::string public_key_pem() const;

private:
    EVP_PKEY* key_;
};

// ============================================================================
// Key Source
// ============================================================================

struct KeySource {
    enum class Kind {
        None,
        InlinePem,
        Base64Pem,
        File
    };

    Kind kind = Kind::None;
    std::string value;

    [[nodiscard]] static KeySource inline_pem(std::string pem) {
        return KeySource{Kind::InlinePem, std::move(pem)};
    }
    [[nodiscard]] static KeySource base64_pem(std::string encoded) {
        return KeySource{Kind::Base64Pem, std::move(encoded)};
    }
    [[nodiscard]] static KeySource file(std::string path) {
        return KeySource{Kind::File, std::move(path)};
    }

    [[nodiscard]] bool configured() const noexcept {
        return kind != Kind::None && !value.empty();
    }
};

[[nodiscard]] std::string_view to_string(KeySource::Kind kind) noexcept;

/// Strip surrounding quotes and expand literal "\n" sequences, as PEMs
/// passed through environment variables often arrive
[[nodiscard]] std::string normalize_inline_pem(std::string_view pem);

/// Resolve the source to PEM text, parse it and check it against algorithm
/// @throws KeyLoadError
[[nodiscard]] std::shared_ptr<const PrivateKey> load_private_key(const KeySource& source,
                                                                 SigningAlgorithm algorithm);

// ============================================================================
// Key Store
// ============================================================================

class KeyStore {
public:
    KeyStore(KeySource source, SigningAlgorithm algorithm);

    // Non-copyable (owns the one-time barrier)
    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;

    /// Cached key, loading it on first call. A failed load is cached too and
    /// rethrown on every call; construct a new KeyStore to pick up new config.
    /// @throws KeyLoadError
    [[nodiscard]] std::shared_ptr<const PrivateKey> get() const;

    /// True when a key source is configured (no I/O)
    [[nodiscard]] bool configured() const noexcept { return source_.configured(); }

    /// True once a key has been loaded successfully
    [[nodiscard]] bool loaded() const noexcept { return loaded_.load(std::memory_order_acquire); }

    [[nodiscard]] SigningAlgorithm algorithm() const noexcept { return algorithm_; }

    /// Number of times the source has been read and parsed (0 or 1)
    [[nodiscard]] int load_attempts() const noexcept { return load_attempts_.load(); }

private:
    void load() const;

    KeySource source_;
    SigningAlgorithm algorithm_;

    mutable std::once_flag once_;
    mutable std::shared_ptr<const PrivateKey> key_;
    mutable std::exception_ptr error_;
    mutable std::atomic<bool> loaded_{false};
    mutable std::atomic<int> load_attempts_{0};
};

}  // namespace signgate::auth
