// ============================================================================
// SIGNGATE - Key Store Implementation
// ============================================================================
// OpenSSL PEM parsing with a key-type check against the configured algorithm
// ============================================================================

#include "signgate/auth/key_store.hpp"

#include "signgate/core/error.hpp"
#include "signgate/utils/encoding.hpp"
#include "signgate/utils/logger.hpp"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/pem.h>

#include <fstream>
#include <sstream>

namespace signgate::auth {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const noexcept { BIO_free(bio); }
};
using BioPtr = std::unique_ptr<BIO, BioDeleter>;

std::string last_openssl_error() {
    const unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

// Encrypted keys are not supported; never prompt on the terminal
int refuse_passphrase(char*, int, int, void*) {
    return 0;
}

std::string read_key_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw KeyLoadError(KeyLoadError::Kind::NotConfigured,
                           "private key file cannot be opened: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string resolve_pem(const KeySource& source) {
    switch (source.kind) {
        case KeySource::Kind::InlinePem:
            return normalize_inline_pem(source.value);

        case KeySource::Kind::Base64Pem: {
            auto decoded = utils::base64_decode(source.value);
            if (!decoded) {
                throw KeyLoadError(KeyLoadError::Kind::ParseError,
                                   "private key is not valid base64");
            }
            return *std::move(decoded);
        }

        case KeySource::Kind::File:
            return read_key_file(source.value);

        case KeySource::Kind::None:
            break;
    }
    throw KeyLoadError(KeyLoadError::Kind::NotConfigured, "no private key configured");
}

}  // namespace

// ============================================================================
// PrivateKey
// ============================================================================

PrivateKey::~PrivateKey() {
    EVP_PKEY_free(key_);
}

std::shared_ptr<const PrivateKey> PrivateKey::from_pem(std::string_view pem) {
    if (pem.find("-----BEGIN") == std::string_view::npos) {
        throw KeyLoadError(KeyLoadError::Kind::ParseError,
                           "private key is not PEM encoded");
    }

    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        throw KeyLoadError(KeyLoadError::Kind::ParseError, "BIO allocation failed");
    }

    EVP_PKEY* key = PEM_read_bio_PrivateKey(bio.get(), nullptr, refuse_passphrase, nullptr);
    if (key == nullptr) {
        throw KeyLoadError(KeyLoadError::Kind::ParseError,
                           "private key could not be parsed: " + last_openssl_error());
    }
    return std::make_shared<const PrivateKey>(key);
}

bool PrivateKey::is_type(KeyType type) const noexcept {
    const int id = EVP_PKEY_base_id(key_);
    switch (type) {
        case KeyType::Rsa:     return id == EVP_PKEY_RSA || id == EVP_PKEY_RSA_PSS;
        case KeyType::Ed25519: return id == EVP_PKEY_ED25519;
    }
    return false;
}

std::string PrivateKey::type_name() const {
    const int id = EVP_PKEY_base_id(key_);
    if (id == EVP_PKEY_RSA || id == EVP_PKEY_RSA_PSS) return "RSA";
    if (id == EVP_PKEY_ED25519) return "Ed25519";
    if (id == EVP_PKEY_EC) return "EC";
    const char* name = OBJ_nid2sn(id);
    return name != nullptr ? name : "unknown";
}

std::string PrivateKey::public_key_pem() const {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_) != 1) {
        throw KeyLoadError(KeyLoadError::Kind::ParseError,
                           "public key export failed: " + last_openssl_error());
    }
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, static_cast<size_t>(len));
}

// ============================================================================
// Loading
// ============================================================================

std::string_view to_string(KeySource::Kind kind) noexcept {
    switch (kind) {
        case KeySource::Kind::None:      return "none";
        case KeySource::Kind::InlinePem: return "inline";
        case KeySource::Kind::Base64Pem: return "base64";
        case KeySource::Kind::File:      return "file";
    }
    return "none";
}

std::string normalize_inline_pem(std::string_view pem) {
    std::string key(pem);

    if (key.size() >= 2 &&
        ((key.front() == '"' && key.back() == '"') || (key.front() == '\'' && key.back() == '\''))) {
        key = key.substr(1, key.size() - 2);
    }

    std::string out;
    out.reserve(key.size());
    for (size_t i = 0; i < key.size(); ++i) {
        if (key[i] == '\\' && i + 1 < key.size() && key[i + 1] == 'n') {
            out.push_back('\n');
            ++i;
        } else {
            out.push_back(key[i]);
        }
    }
    return out;
}

std::shared_ptr<const PrivateKey> load_private_key(const KeySource& source,
                                                   SigningAlgorithm algorithm) {
    if (!source.configured()) {
        throw KeyLoadError(KeyLoadError::Kind::NotConfigured, "no private key configured");
    }

    auto key = PrivateKey::from_pem(resolve_pem(source));

    const KeyType expected = required_key_type(algorithm);
    if (!key->is_type(expected)) {
        throw KeyLoadError(KeyLoadError::Kind::TypeMismatch,
                           "algorithm " + std::string(to_string(algorithm)) + " requires an " +
                               std::string(to_string(expected)) + " key, got " + key->type_name());
    }
    return key;
}

// ============================================================================
// KeyStore
// ============================================================================

KeyStore::KeyStore(KeySource source, SigningAlgorithm algorithm)
    : source_(std::move(source)), algorithm_(algorithm) {}

std::shared_ptr<const PrivateKey> KeyStore::get() const {
    std::call_once(once_, [this] { load(); });
    if (error_) {
        std::rethrow_exception(error_);
    }
    return key_;
}

void KeyStore::load() const {
    load_attempts_.fetch_add(1);
    try {
        key_ = load_private_key(source_, algorithm_);
        loaded_.store(true, std::memory_order_release);
        LOG_INFO("Private key loaded (source={}, algorithm={}, type={})",
                 to_string(source_.kind), to_string(algorithm_), key_->type_name());
    } catch (const KeyLoadError& e) {
        LOG_ERROR("Private key load failed [{}]: {}", to_string(e.kind()), e.what());
        error_ = std::current_exception();
    }
}

}  // namespace signgate::auth
