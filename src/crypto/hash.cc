#include "hash.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <stdexcept>

namespace eureka {

// ============================================================================
// SHA3Hasher Implementation
// ============================================================================

SHA3Hasher::SHA3Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        log::crypto.error("Failed to create EVP_MD_CTX");
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("Failed to initialize SHA3-256");
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        throw std::runtime_error("Failed to initialize SHA3-256");
    }
}

SHA3Hasher::~SHA3Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    }
}

SHA3Hasher::SHA3Hasher(SHA3Hasher&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

SHA3Hasher& SHA3Hasher::operator=(SHA3Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        }
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void SHA3Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void SHA3Hasher::update(std::string_view text) {
    update(text.data(), text.size());
}

void SHA3Hasher::update(const void* data, std::size_t len) {
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, len) != 1) {
        log::crypto.error("SHA3-256 update failed");
        throw std::runtime_error("SHA3-256 update failed");
    }
}

hash_t SHA3Hasher::finalize() {
    hash_t result;
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), result.data(), &len) != 1) {
        log::crypto.error("SHA3-256 finalize failed");
        throw std::runtime_error("SHA3-256 finalize failed");
    }
    return result;
}

void SHA3Hasher::reset() {
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("SHA3-256 reset failed");
        throw std::runtime_error("SHA3-256 reset failed");
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

hash_t sha3_256(std::span<const std::uint8_t> data) {
    return sha3_256(data.data(), data.size());
}

hash_t sha3_256(const void* data, std::size_t len) {
    hash_t result;
    unsigned int out_len = HASH_SIZE;
    if (EVP_Digest(data, len, result.data(), &out_len, EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("SHA3-256 failed");
        throw std::runtime_error("SHA3-256 failed");
    }
    return result;
}

std::string sha3_256_hex(std::string_view text) {
    return bytes_to_hex(sha3_256(text.data(), text.size()));
}

}  // namespace eureka
