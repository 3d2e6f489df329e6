#include "participant_client.hh"
#include "core/logging.hh"
#include "game/session.hh"

namespace eureka {

ParticipantClient::ParticipantClient(identity_t identity, RsaPublicKey evaluator_key)
    : identity_(std::move(identity))
    , evaluator_key_(std::move(evaluator_key)) {}

std::optional<ParticipantClient> ParticipantClient::for_session(identity_t identity,
                                                                const GameSession& session) {
    auto key = RsaPublicKey::from_pem(session.public_key_pem());
    if (!key) {
        EUREKA_LOG_WARN(log::runtime) << "Session publishes an unusable evaluator key";
        return std::nullopt;
    }
    return ParticipantClient(std::move(identity), std::move(*key));
}

EncryptResult ParticipantClient::seal(std::string_view content) const {
    return encrypt_message(Message{identity_, std::string(content)}, evaluator_key_);
}

CustomEvent ParticipantClient::submit_event(bytes_t ciphertext) const {
    return CustomEvent{identity_, encode_game_event(SubmitEvent{std::move(ciphertext)})};
}

}  // namespace eureka
