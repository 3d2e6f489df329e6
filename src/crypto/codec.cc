#include "codec.hh"
#include "core/logging.hh"
#include <limits>

namespace eureka {

// ============================================================================
// Message Implementation
// ============================================================================

bytes_t Message::serialize() const {
    bytes_t result;
    result.reserve(sizeof(std::uint32_t) * 2 + sender.size() + content.size());
    append_string(result, sender);
    append_string(result, content);
    return result;
}

std::optional<Message> Message::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);

    auto sender = reader.read_string();
    if (!sender || sender->size() > MAX_IDENTITY_SIZE) {
        return std::nullopt;
    }

    auto content = reader.read_string();
    if (!content || !reader.at_end()) {
        return std::nullopt;
    }

    return Message{std::move(*sender), std::move(*content)};
}

// ============================================================================
// Encrypt / Decrypt
// ============================================================================

EncryptResult encrypt_message(const Message& message, const RsaPublicKey& evaluator_key) {
    EncryptResult result;

    if (message.sender.size() > MAX_IDENTITY_SIZE ||
        message.content.size() > std::numeric_limits<std::uint32_t>::max()) {
        log::crypto.warn("Message cannot be encoded");
        result.error = ErrorCode::ENCODING_ERROR;
        return result;
    }

    bytes_t plaintext = message.serialize();
    auto ciphertext = evaluator_key.encrypt(plaintext);
    secure_zero(plaintext);

    if (!ciphertext) {
        result.error = ErrorCode::CRYPTO_ERROR;
        return result;
    }

    result.ciphertext = std::move(*ciphertext);
    return result;
}

DecryptResult decrypt_message(std::span<const std::uint8_t> ciphertext,
                              const RsaPrivateKey& evaluator_key) {
    DecryptResult result;

    auto plaintext = evaluator_key.decrypt(ciphertext);
    if (!plaintext) {
        result.error = ErrorCode::CRYPTO_ERROR;
        return result;
    }

    auto message = Message::deserialize(*plaintext);
    secure_zero(*plaintext);
    if (!message) {
        log::crypto.warn("Decrypted payload is not a valid message");
        result.error = ErrorCode::ENCODING_ERROR;
        return result;
    }

    result.message = std::move(*message);
    return result;
}

}  // namespace eureka
