#pragma once

#include "core/config.hh"
#include "core/error.hh"
#include "crypto/codec.hh"
#include "crypto/rsa.hh"
#include "game/events.hh"
#include "game/session.hh"
#include <optional>
#include <string>

namespace eureka {

// ============================================================================
// Evaluation Draft
// ============================================================================

struct EvaluationDraft {
    ErrorCode error = ErrorCode::OK;
    Message decrypted;   // Plaintext of the oldest pending submission
    CustomEvent event;   // Encoded Evaluate or Reject action, ready for delivery

    [[nodiscard]] bool ok() const { return error == ErrorCode::OK; }
};

// ============================================================================
// Evaluator
// ============================================================================

// The privileged reader. Holds the only private key able to open
// submissions and turns the head of the pending queue into an Evaluate
// action.
class Evaluator {
public:
    Evaluator(identity_t identity, RsaPrivateKey private_key,
              ResultKeyPolicy policy = ResultKeyPolicy::DIGEST);

    [[nodiscard]] const identity_t& identity() const { return identity_; }
    [[nodiscard]] const RsaPublicKey& public_key() const { return public_key_; }

    // PEM to publish in the session's account data
    [[nodiscard]] std::string public_key_pem() const { return public_key_.to_pem(); }

    // Decrypt the oldest pending submission of `session`. Returns nullopt if
    // nothing is pending. If the ciphertext cannot be opened the draft
    // carries CRYPTO_ERROR or ENCODING_ERROR and a Reject action that
    // discards it.
    [[nodiscard]] std::optional<EvaluationDraft> prepare_evaluation(const GameSession& session) const;

    // Build the Evaluate action for a decrypted message. Under VERBATIM the
    // content is replaced by its canonical key before it leaves the evaluator.
    [[nodiscard]] CustomEvent evaluate_event(const Message& decrypted) const;

    [[nodiscard]] CustomEvent reject_event(ErrorCode reason) const;

private:
    identity_t identity_;
    RsaPrivateKey private_key_;
    RsaPublicKey public_key_;
    ResultKeyPolicy policy_;
};

}  // namespace eureka
