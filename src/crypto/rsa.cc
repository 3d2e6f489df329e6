#include "rsa.hh"
#include "core/logging.hh"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <stdexcept>

namespace eureka {

namespace detail {

void EvpPkeyDeleter::operator()(evp_pkey_st* key) const noexcept {
    EVP_PKEY_free(key);
}

}  // namespace detail

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const noexcept { BIO_free(bio); }
};
using bio_ptr = std::unique_ptr<BIO, BioDeleter>;

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const noexcept { EVP_PKEY_CTX_free(ctx); }
};
using pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

// Pops the thread's OpenSSL error queue into a single line
std::string last_openssl_error() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "no error reported";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return buf;
}

bio_ptr memory_bio(std::string_view data) {
    return bio_ptr(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
}

std::string drain_bio(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || data == nullptr) {
        return {};
    }
    return std::string(data, static_cast<std::size_t>(len));
}

bool is_usable_rsa_key(EVP_PKEY* key) {
    if (EVP_PKEY_get_base_id(key) != EVP_PKEY_RSA) {
        log::crypto.warn("Rejected non-RSA key");
        return false;
    }
    if (static_cast<std::size_t>(EVP_PKEY_get_bits(key)) < RSA_MIN_BITS) {
        EUREKA_LOG_WARN(log::crypto) << "Rejected RSA key of " << EVP_PKEY_get_bits(key)
                                     << " bits (minimum " << RSA_MIN_BITS << ")";
        return false;
    }
    return true;
}

}  // namespace

// ============================================================================
// RsaPublicKey Implementation
// ============================================================================

RsaPublicKey::RsaPublicKey(const RsaPublicKey& other) {
    if (other.key_ && EVP_PKEY_up_ref(other.key_.get()) == 1) {
        key_.reset(other.key_.get());
    }
}

RsaPublicKey& RsaPublicKey::operator=(const RsaPublicKey& other) {
    if (this != &other) {
        RsaPublicKey copy(other);
        key_ = std::move(copy.key_);
    }
    return *this;
}

std::optional<RsaPublicKey> RsaPublicKey::from_pem(std::string_view pem) {
    auto bio = memory_bio(pem);
    if (!bio) {
        log::crypto.error("Failed to allocate BIO for public key");
        return std::nullopt;
    }

    detail::evp_pkey_ptr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        EUREKA_LOG_WARN(log::crypto) << "Failed to parse public key PEM: " << last_openssl_error();
        return std::nullopt;
    }
    if (!is_usable_rsa_key(key.get())) {
        return std::nullopt;
    }

    return RsaPublicKey(std::move(key));
}

std::string RsaPublicKey::to_pem() const {
    bio_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key_.get()) != 1) {
        log::crypto.error("Failed to write public key PEM");
        throw std::runtime_error("Failed to write public key PEM");
    }
    return drain_bio(bio.get());
}

std::size_t RsaPublicKey::bits() const {
    return key_ ? static_cast<std::size_t>(EVP_PKEY_get_bits(key_.get())) : 0;
}

std::optional<bytes_t> RsaPublicKey::encrypt(std::span<const std::uint8_t> plaintext) const {
    if (!key_) {
        return std::nullopt;
    }
    if (plaintext.size() > max_plaintext_size()) {
        EUREKA_LOG_WARN(log::crypto) << "Plaintext of " << plaintext.size()
                                     << " bytes exceeds PKCS#1 v1.5 capacity of "
                                     << max_plaintext_size() << " bytes";
        return std::nullopt;
    }

    pkey_ctx_ptr ctx(EVP_PKEY_CTX_new(key_.get(), nullptr));
    if (!ctx ||
        EVP_PKEY_encrypt_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) != 1) {
        EUREKA_LOG_ERROR(log::crypto) << "Failed to set up RSA encryption: " << last_openssl_error();
        return std::nullopt;
    }

    std::size_t out_len = 0;
    if (EVP_PKEY_encrypt(ctx.get(), nullptr, &out_len, plaintext.data(), plaintext.size()) != 1) {
        EUREKA_LOG_ERROR(log::crypto) << "RSA encryption size query failed: " << last_openssl_error();
        return std::nullopt;
    }

    bytes_t ciphertext(out_len);
    if (EVP_PKEY_encrypt(ctx.get(), ciphertext.data(), &out_len,
                         plaintext.data(), plaintext.size()) != 1) {
        EUREKA_LOG_ERROR(log::crypto) << "RSA encryption failed: " << last_openssl_error();
        return std::nullopt;
    }
    ciphertext.resize(out_len);

    EUREKA_LOG_TRACE(log::crypto) << "RSA encrypted " << plaintext.size() << " bytes";
    return ciphertext;
}

// ============================================================================
// RsaPrivateKey Implementation
// ============================================================================

std::optional<RsaPrivateKey> RsaPrivateKey::generate(std::size_t bits) {
    if (bits < RSA_MIN_BITS) {
        EUREKA_LOG_WARN(log::crypto) << "Refusing to generate " << bits << "-bit RSA key";
        return std::nullopt;
    }

    detail::evp_pkey_ptr key(EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", bits));
    if (!key) {
        EUREKA_LOG_ERROR(log::crypto) << "RSA key generation failed: " << last_openssl_error();
        return std::nullopt;
    }

    EUREKA_LOG_DEBUG(log::crypto) << "Generated " << bits << "-bit RSA keypair";
    return RsaPrivateKey(std::move(key));
}

std::optional<RsaPrivateKey> RsaPrivateKey::from_pem(std::string_view pem) {
    auto bio = memory_bio(pem);
    if (!bio) {
        log::crypto.error("Failed to allocate BIO for private key");
        return std::nullopt;
    }

    detail::evp_pkey_ptr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        EUREKA_LOG_WARN(log::crypto) << "Failed to parse private key PEM: " << last_openssl_error();
        return std::nullopt;
    }
    if (!is_usable_rsa_key(key.get())) {
        return std::nullopt;
    }

    return RsaPrivateKey(std::move(key));
}

std::string RsaPrivateKey::to_pem() const {
    bio_ptr bio(BIO_new(BIO_s_mem()));
    if (!bio ||
        PEM_write_bio_PKCS8PrivateKey(bio.get(), key_.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        log::crypto.error("Failed to write private key PEM");
        throw std::runtime_error("Failed to write private key PEM");
    }
    return drain_bio(bio.get());
}

RsaPublicKey RsaPrivateKey::public_key() const {
    unsigned char* der = nullptr;
    int der_len = i2d_PUBKEY(key_.get(), &der);
    if (der_len <= 0) {
        log::crypto.error("Failed to export public half of RSA key");
        throw std::runtime_error("Failed to export public half of RSA key");
    }

    const unsigned char* cursor = der;
    detail::evp_pkey_ptr pub(d2i_PUBKEY(nullptr, &cursor, der_len));
    OPENSSL_free(der);
    if (!pub) {
        log::crypto.error("Failed to re-import RSA public key");
        throw std::runtime_error("Failed to re-import RSA public key");
    }

    return RsaPublicKey(std::move(pub));
}

std::size_t RsaPrivateKey::bits() const {
    return key_ ? static_cast<std::size_t>(EVP_PKEY_get_bits(key_.get())) : 0;
}

std::optional<bytes_t> RsaPrivateKey::decrypt(std::span<const std::uint8_t> ciphertext) const {
    if (!key_) {
        return std::nullopt;
    }
    // A PKCS#1 ciphertext is exactly one modulus wide
    if (ciphertext.size() != size_bytes()) {
        EUREKA_LOG_WARN(log::crypto) << "Ciphertext of " << ciphertext.size()
                                     << " bytes does not match modulus size " << size_bytes();
        return std::nullopt;
    }

    pkey_ctx_ptr ctx(EVP_PKEY_CTX_new(key_.get(), nullptr));
    if (!ctx ||
        EVP_PKEY_decrypt_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) != 1) {
        EUREKA_LOG_ERROR(log::crypto) << "Failed to set up RSA decryption: " << last_openssl_error();
        return std::nullopt;
    }

    std::size_t out_len = 0;
    if (EVP_PKEY_decrypt(ctx.get(), nullptr, &out_len, ciphertext.data(), ciphertext.size()) != 1) {
        EUREKA_LOG_ERROR(log::crypto) << "RSA decryption size query failed: " << last_openssl_error();
        return std::nullopt;
    }

    bytes_t plaintext(out_len);
    if (EVP_PKEY_decrypt(ctx.get(), plaintext.data(), &out_len,
                         ciphertext.data(), ciphertext.size()) != 1) {
        secure_zero(plaintext);
        EUREKA_LOG_WARN(log::crypto) << "RSA decryption failed: " << last_openssl_error();
        return std::nullopt;
    }
    plaintext.resize(out_len);

    EUREKA_LOG_TRACE(log::crypto) << "RSA decrypted " << ciphertext.size() << " bytes";
    return plaintext;
}

}  // namespace eureka
