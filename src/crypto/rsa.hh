#pragma once

#include "core/types.hh"
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

// Opaque OpenSSL key handle
struct evp_pkey_st;

namespace eureka {

namespace detail {

struct EvpPkeyDeleter {
    void operator()(evp_pkey_st* key) const noexcept;
};

using evp_pkey_ptr = std::unique_ptr<evp_pkey_st, EvpPkeyDeleter>;

}  // namespace detail

// ============================================================================
// RSA Public Key
// ============================================================================

// Evaluator public key, shared with every participant so they can encrypt
// submissions without any prior handshake.
class RsaPublicKey {
public:
    RsaPublicKey(RsaPublicKey&&) noexcept = default;
    RsaPublicKey& operator=(RsaPublicKey&&) noexcept = default;
    RsaPublicKey(const RsaPublicKey& other);
    RsaPublicKey& operator=(const RsaPublicKey& other);

    // Parse a PEM SubjectPublicKeyInfo ("BEGIN PUBLIC KEY") block
    [[nodiscard]] static std::optional<RsaPublicKey> from_pem(std::string_view pem);

    [[nodiscard]] std::string to_pem() const;

    // Modulus size in bits / bytes
    [[nodiscard]] std::size_t bits() const;
    [[nodiscard]] std::size_t size_bytes() const { return (bits() + 7) / 8; }

    // Largest plaintext PKCS#1 v1.5 can carry under this key
    [[nodiscard]] std::size_t max_plaintext_size() const {
        return size_bytes() > PKCS1_V15_OVERHEAD ? size_bytes() - PKCS1_V15_OVERHEAD : 0;
    }

    // Randomized PKCS#1 v1.5 encryption; nullopt on library failure or
    // oversized plaintext
    [[nodiscard]] std::optional<bytes_t> encrypt(std::span<const std::uint8_t> plaintext) const;

    [[nodiscard]] evp_pkey_st* handle() const { return key_.get(); }

private:
    explicit RsaPublicKey(detail::evp_pkey_ptr key) : key_(std::move(key)) {}

    detail::evp_pkey_ptr key_;

    friend class RsaPrivateKey;
};

// ============================================================================
// RSA Private Key
// ============================================================================

// Held by the evaluator only. Move-only; key material is released through
// the library's secure free.
class RsaPrivateKey {
public:
    RsaPrivateKey(const RsaPrivateKey&) = delete;
    RsaPrivateKey& operator=(const RsaPrivateKey&) = delete;
    RsaPrivateKey(RsaPrivateKey&&) noexcept = default;
    RsaPrivateKey& operator=(RsaPrivateKey&&) noexcept = default;

    // Generate a new random key
    [[nodiscard]] static std::optional<RsaPrivateKey> generate(std::size_t bits = RSA_DEFAULT_BITS);

    // Parse a PEM PKCS#8 or traditional RSA private key block
    [[nodiscard]] static std::optional<RsaPrivateKey> from_pem(std::string_view pem);

    // Unencrypted PKCS#8 PEM
    [[nodiscard]] std::string to_pem() const;

    [[nodiscard]] RsaPublicKey public_key() const;

    [[nodiscard]] std::size_t bits() const;
    [[nodiscard]] std::size_t size_bytes() const { return (bits() + 7) / 8; }

    // PKCS#1 v1.5 decryption; nullopt on malformed or corrupted ciphertext
    [[nodiscard]] std::optional<bytes_t> decrypt(std::span<const std::uint8_t> ciphertext) const;

private:
    explicit RsaPrivateKey(detail::evp_pkey_ptr key) : key_(std::move(key)) {}

    detail::evp_pkey_ptr key_;
};

}  // namespace eureka
