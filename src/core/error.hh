#pragma once

#include <cstdint>
#include <string_view>

namespace eureka {

// ============================================================================
// Error Codes
// ============================================================================

// Result of every action delivered to a session. A failed action never
// changes the ledger, balances or caches.
enum class ErrorCode : std::uint8_t {
    OK = 0,
    UNKNOWN_PARTICIPANT = 1,  // Sender or credited identity not registered
    CRYPTO_ERROR = 2,         // Encrypt/decrypt or key handling failed
    ENCODING_ERROR = 3,       // Plaintext message (de)serialization failed
    DECODE_ERROR = 4,         // Malformed action or account payload
    UNAUTHORIZED = 5,         // Privileged action from a non-evaluator caller
    QUEUE_FULL = 6,           // Pending submission bound reached
    INVALID_CONFIG = 7,
};

[[nodiscard]] inline std::string_view error_code_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "ok";
        case ErrorCode::UNKNOWN_PARTICIPANT: return "unknown_participant";
        case ErrorCode::CRYPTO_ERROR: return "crypto_error";
        case ErrorCode::ENCODING_ERROR: return "encoding_error";
        case ErrorCode::DECODE_ERROR: return "decode_error";
        case ErrorCode::UNAUTHORIZED: return "unauthorized";
        case ErrorCode::QUEUE_FULL: return "queue_full";
        case ErrorCode::INVALID_CONFIG: return "invalid_config";
    }
    return "unknown";
}

}  // namespace eureka
