#pragma once

#include "core/error.hh"
#include "core/types.hh"
#include "crypto/rsa.hh"
#include <optional>
#include <span>
#include <string>

namespace eureka {

// ============================================================================
// Message
// ============================================================================

// A participant's answer as the evaluator reads it after decryption
struct Message {
    identity_t sender;
    std::string content;

    // Canonical encoding: u32 sender_len | sender | u32 content_len | content
    [[nodiscard]] bytes_t serialize() const;

    // Rejects truncated fields, trailing bytes and oversized sender identities
    [[nodiscard]] static std::optional<Message> deserialize(std::span<const std::uint8_t> data);

    bool operator==(const Message&) const = default;
};

// ============================================================================
// Codec Results
// ============================================================================

struct EncryptResult {
    ErrorCode error = ErrorCode::OK;
    bytes_t ciphertext;

    [[nodiscard]] bool ok() const { return error == ErrorCode::OK; }
};

struct DecryptResult {
    ErrorCode error = ErrorCode::OK;
    Message message;

    [[nodiscard]] bool ok() const { return error == ErrorCode::OK; }
};

// ============================================================================
// Encrypt / Decrypt
// ============================================================================

// Serializes the message and encrypts it for the evaluator. Fails with
// ENCODING_ERROR if the message cannot be encoded and CRYPTO_ERROR if it
// does not fit the key's PKCS#1 v1.5 capacity or encryption fails.
[[nodiscard]] EncryptResult encrypt_message(const Message& message,
                                            const RsaPublicKey& evaluator_key);

// Fails with CRYPTO_ERROR on malformed or corrupted ciphertext and
// ENCODING_ERROR if the plaintext is not a valid message encoding.
[[nodiscard]] DecryptResult decrypt_message(std::span<const std::uint8_t> ciphertext,
                                            const RsaPrivateKey& evaluator_key);

}  // namespace eureka
