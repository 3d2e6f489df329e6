#include "evaluator.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"

namespace eureka {

Evaluator::Evaluator(identity_t identity, RsaPrivateKey private_key, ResultKeyPolicy policy)
    : identity_(std::move(identity))
    , private_key_(std::move(private_key))
    , public_key_(private_key_.public_key())
    , policy_(policy) {}

std::optional<EvaluationDraft> Evaluator::prepare_evaluation(const GameSession& session) const {
    const bytes_t* head = session.pending().front();
    if (!head) {
        log::evaluator.debug("Nothing pending");
        return std::nullopt;
    }

    EvaluationDraft draft;
    auto decrypted = decrypt_message(*head, private_key_);
    if (!decrypted.ok()) {
        EUREKA_LOG_WARN(log::evaluator) << "Cannot open pending submission: "
                                        << error_code_string(decrypted.error);
        draft.error = decrypted.error;
        draft.event = reject_event(decrypted.error);
        return draft;
    }

    EUREKA_LOG_DEBUG(log::evaluator) << "Opened submission from " << decrypted.message.sender;

    draft.decrypted = std::move(decrypted.message);
    draft.event = evaluate_event(draft.decrypted);
    return draft;
}

CustomEvent Evaluator::reject_event(ErrorCode reason) const {
    return CustomEvent{identity_, encode_game_event(RejectEvent{reason})};
}

CustomEvent Evaluator::evaluate_event(const Message& decrypted) const {
    Message verdict = decrypted;
    if (policy_ == ResultKeyPolicy::VERBATIM) {
        verdict.content = derive_result_key(decrypted.content, ResultKeyPolicy::DIGEST);
    }
    return CustomEvent{identity_, encode_game_event(EvaluateEvent{std::move(verdict)})};
}

}  // namespace eureka
