#include "session.hh"
#include "core/logging.hh"
#include <limits>

namespace eureka {

GameSession::GameSession(const GameConfig& config, AccountData data)
    : config_(config)
    , reward_amount_(data.reward_amount)
    , public_key_pem_(std::move(data.public_key_pem))
    , ledger_(std::move(data.results)) {}

std::optional<GameSession> GameSession::init_state(const InitAccount& account,
                                                   const GameConfig& config) {
    auto data = AccountData::deserialize(account.data);
    if (!data) {
        log::game.warn("Failed to decode account data");
        return std::nullopt;
    }

    GameSession session(config, std::move(*data));
    for (const auto& join : account.players) {
        session.participants_.append(join, session.ledger_.entries());
    }

    EUREKA_LOG_INFO(log::game) << "Session initialized: " << session.participants_.size()
                               << " participants, " << session.ledger_.size()
                               << " known results, reward " << session.reward_amount_
                               << ", key policy " << result_key_policy_name(config.result_key_policy);
    return session;
}

// ============================================================================
// Dispatch
// ============================================================================

ErrorCode GameSession::handle_event(const Event& event, TimeoutPolicy& timeouts) {
    if (const auto* custom = std::get_if<CustomEvent>(&event)) {
        auto decoded = decode_game_event(custom->raw);
        if (!decoded) {
            EUREKA_LOG_WARN(log::game) << "Malformed payload from " << custom->sender;
            return ErrorCode::DECODE_ERROR;
        }
        return apply(custom->sender, *decoded, timeouts);
    }

    if (const auto* sync_event = std::get_if<SyncEvent>(&event)) {
        sync(sync_event->new_players);
        return ErrorCode::OK;
    }

    log::game.debug("Ignoring runtime event");
    return ErrorCode::OK;
}

ErrorCode GameSession::apply(const identity_t& sender, const GameEvent& event, TimeoutPolicy& timeouts) {
    if (const auto* submit_event = std::get_if<SubmitEvent>(&event)) {
        return submit(sender, submit_event->ciphertext);
    }
    if (const auto* reject_event = std::get_if<RejectEvent>(&event)) {
        return reject_head(reject_event->reason);
    }
    return evaluate(std::get<EvaluateEvent>(event).message, timeouts).error;
}

// ============================================================================
// Transitions
// ============================================================================

ErrorCode GameSession::submit(const identity_t& sender, bytes_t ciphertext) {
    if (!participants_.contains(sender)) {
        EUREKA_LOG_WARN(log::game) << "Submission from unknown participant " << sender;
        return ErrorCode::UNKNOWN_PARTICIPANT;
    }

    EUREKA_LOG_DEBUG(log::game) << sender << " submitted " << ciphertext.size()
                                << " bytes (" << pending_.size() + 1 << " pending)";

    pending_.push(std::move(ciphertext));
    stage_ = Stage::SUBMITTED;
    return ErrorCode::OK;
}

EvaluateResult GameSession::evaluate(const Message& message, TimeoutPolicy& timeouts) {
    EvaluateResult result;
    result.key = derive_result_key(message.content, config_.result_key_policy);

    if (ledger_.contains(result.key)) {
        pending_.pop();
        stage_ = Stage::WAITING;
        result.outcome = EvaluateOutcome::DUPLICATE;
        EUREKA_LOG_INFO(log::game) << "Result " << result.key << " already exists; "
                                   << message.sender << " not rewarded";
        return result;
    }

    // The head is consumed either way; only a registered claimant is credited
    pending_.pop();
    Participant* claimant = participants_.find(message.sender);
    if (!claimant) {
        EUREKA_LOG_WARN(log::game) << "Evaluated result credits unknown participant " << message.sender
                                   << "; submission discarded";
        result.error = ErrorCode::UNKNOWN_PARTICIPANT;
        return result;
    }

    if (claimant->balance > std::numeric_limits<std::uint64_t>::max() - reward_amount_) {
        EUREKA_LOG_WARN(log::game) << "Balance of " << claimant->identity << " saturated";
        claimant->balance = std::numeric_limits<std::uint64_t>::max();
    } else {
        claimant->balance += reward_amount_;
    }
    ledger_.insert(result.key, claimant->identity);
    timeouts.arm(claimant->identity, config_.action_timeout_ms);
    participants_.broadcast(ledger_.entries());

    result.outcome = EvaluateOutcome::ACCEPTED;
    EUREKA_LOG_INFO(log::game) << "Accepted result " << result.key << " from " << claimant->identity
                               << " (balance " << claimant->balance << ", "
                               << ledger_.size() << " results)";
    return result;
}

ErrorCode GameSession::reject_head(ErrorCode reason) {
    if (!pending_.pop()) {
        log::game.debug("Reject with nothing pending");
        return ErrorCode::OK;
    }
    EUREKA_LOG_INFO(log::game) << "Discarded unreadable submission (" << error_code_string(reason)
                               << ", " << pending_.size() << " pending)";
    return ErrorCode::OK;
}

void GameSession::sync(const std::vector<PlayerJoin>& new_players) {
    for (const auto& join : new_players) {
        participants_.append(join, ledger_.entries());
        EUREKA_LOG_INFO(log::game) << join.identity << " joined with "
                                   << ledger_.size() << " known results";
    }
}

}  // namespace eureka
