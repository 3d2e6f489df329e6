#pragma once

#include "core/config.hh"
#include "core/error.hh"
#include "core/types.hh"
#include "game/events.hh"
#include "game/participant.hh"
#include "game/pending_queue.hh"
#include "game/result_ledger.hh"
#include "game/timeout.hh"
#include <optional>
#include <span>
#include <string>

namespace eureka {

// ============================================================================
// Evaluate Result
// ============================================================================

enum class EvaluateOutcome : std::uint8_t {
    ACCEPTED = 0,   // New result: sender credited, ledger and caches updated
    DUPLICATE = 1,  // Key already claimed: nothing changes except the stage
};

struct EvaluateResult {
    ErrorCode error = ErrorCode::OK;
    EvaluateOutcome outcome = EvaluateOutcome::DUPLICATE;
    std::string key;

    [[nodiscard]] bool ok() const { return error == ErrorCode::OK; }
    [[nodiscard]] bool accepted() const { return ok() && outcome == EvaluateOutcome::ACCEPTED; }
};

// ============================================================================
// Game Session
// ============================================================================

// Deterministic state machine for one game instance. It exclusively owns the
// participant registry, the pending queue and the result ledger; callers see
// them only through const accessors or by copy.
//
// Transitions run to completion one at a time. A failed transition never
// touches the ledger, balances or caches; a ruling on a submission that
// cannot be credited still consumes it. The
// surrounding runtime is responsible for delivering actions in a single
// total order and for authenticating the evaluator.
class GameSession {
public:
    // Build a session from the runtime's init payload. Returns nullopt if the
    // account data cannot be decoded.
    [[nodiscard]] static std::optional<GameSession> init_state(const InitAccount& account,
                                                               const GameConfig& config = GameConfig{});

    // Dispatch a runtime event. Custom payloads that fail to decode return
    // DECODE_ERROR before anything is touched; other events are ignored.
    ErrorCode handle_event(const Event& event, TimeoutPolicy& timeouts);

    // Apply an already decoded game event from `sender`
    ErrorCode apply(const identity_t& sender, const GameEvent& event, TimeoutPolicy& timeouts);

    // Queue a ciphertext from a registered participant. Content-blind and
    // accepted in every stage.
    ErrorCode submit(const identity_t& sender, bytes_t ciphertext);

    // Consume the oldest pending submission and rule on the decrypted
    // message. The popped ciphertext is not cross-checked against `message`.
    // A message crediting an unknown identity consumes the head and returns
    // UNKNOWN_PARTICIPANT. Balances saturate at UINT64_MAX.
    EvaluateResult evaluate(const Message& message, TimeoutPolicy& timeouts);

    // Discard the oldest pending submission, which the evaluator could not open
    ErrorCode reject_head(ErrorCode reason);

    // Admit participants; each cache starts as a copy of the current ledger
    void sync(const std::vector<PlayerJoin>& new_players);

    [[nodiscard]] GameCheckpoint into_checkpoint() const { return GameCheckpoint{}; }

    // Accessors
    [[nodiscard]] Stage stage() const { return stage_; }
    [[nodiscard]] std::uint64_t reward_amount() const { return reward_amount_; }
    [[nodiscard]] const std::string& public_key_pem() const { return public_key_pem_; }
    [[nodiscard]] const ParticipantRegistry& participants() const { return participants_; }
    [[nodiscard]] const PendingQueue& pending() const { return pending_; }
    [[nodiscard]] const ResultLedger& ledger() const { return ledger_; }
    [[nodiscard]] const GameConfig& config() const { return config_; }

    // True if every participant's cache equals the ledger
    [[nodiscard]] bool is_converged() const { return participants_.converged_with(ledger_.entries()); }

private:
    GameSession(const GameConfig& config, AccountData data);

    GameConfig config_;
    ParticipantRegistry participants_;
    Stage stage_ = Stage::WAITING;
    std::uint64_t reward_amount_ = 0;
    std::string public_key_pem_;
    ResultLedger ledger_;
    PendingQueue pending_;
};

}  // namespace eureka
