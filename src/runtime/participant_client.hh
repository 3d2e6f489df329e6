#pragma once

#include "core/types.hh"
#include "crypto/codec.hh"
#include "crypto/rsa.hh"
#include "game/events.hh"
#include <optional>
#include <string_view>

namespace eureka {

class GameSession;

// ============================================================================
// Participant Client
// ============================================================================

// Participant side of the protocol: seals answers for the evaluator and
// wraps them as Submit actions.
class ParticipantClient {
public:
    ParticipantClient(identity_t identity, RsaPublicKey evaluator_key);

    // Client for `identity` using the evaluator key published by `session`;
    // nullopt if the session's key does not parse
    [[nodiscard]] static std::optional<ParticipantClient> for_session(identity_t identity,
                                                                      const GameSession& session);

    [[nodiscard]] const identity_t& identity() const { return identity_; }

    // Encrypt {identity, content} for the evaluator
    [[nodiscard]] EncryptResult seal(std::string_view content) const;

    [[nodiscard]] CustomEvent submit_event(bytes_t ciphertext) const;

private:
    identity_t identity_;
    RsaPublicKey evaluator_key_;
};

}  // namespace eureka
