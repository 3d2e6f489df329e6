#pragma once

#include "core/error.hh"
#include "core/types.hh"
#include "crypto/codec.hh"
#include "game/participant.hh"
#include "game/result_ledger.hh"
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace eureka {

// ============================================================================
// Game Events (custom payloads carried by the runtime)
// ============================================================================

enum class GameEventTag : std::uint8_t {
    SUBMIT = 0x01,
    EVALUATE = 0x02,
    REJECT = 0x03,
};

// Encrypted answer from a registered participant
struct SubmitEvent {
    bytes_t ciphertext;

    bool operator==(const SubmitEvent&) const = default;
};

// Evaluator verdict on the oldest pending submission, already decrypted
struct EvaluateEvent {
    Message message;

    bool operator==(const EvaluateEvent&) const = default;
};

// Evaluator discards the oldest pending submission because it cannot be
// opened. `reason` is CRYPTO_ERROR or ENCODING_ERROR.
struct RejectEvent {
    ErrorCode reason = ErrorCode::CRYPTO_ERROR;

    bool operator==(const RejectEvent&) const = default;
};

using GameEvent = std::variant<SubmitEvent, EvaluateEvent, RejectEvent>;

// u8 tag | body. Submit body: u32 len | ciphertext. Evaluate body: Message.
// Reject body: u8 reason.
[[nodiscard]] bytes_t encode_game_event(const GameEvent& event);

// nullopt on unknown tag, truncation, trailing bytes or oversize input
[[nodiscard]] std::optional<GameEvent> decode_game_event(std::span<const std::uint8_t> raw);

[[nodiscard]] std::string_view game_event_name(const GameEvent& event);

// ============================================================================
// Runtime Events
// ============================================================================

// Opaque game payload from an authenticated sender
struct CustomEvent {
    identity_t sender;
    bytes_t raw;
};

// Membership change: participants admitted since the last sync
struct SyncEvent {
    std::vector<PlayerJoin> new_players;
};

// Emitted by the runtime when the session starts; carries nothing
struct GameStartEvent {};

using Event = std::variant<CustomEvent, SyncEvent, GameStartEvent>;

// ============================================================================
// Session Initialization
// ============================================================================

struct AccountData {
    std::uint64_t reward_amount = 0;
    std::string public_key_pem;
    ResultLedger results;

    // u64 reward | u32 pem_len | pem | ledger encoding
    [[nodiscard]] bytes_t serialize() const;
    [[nodiscard]] static std::optional<AccountData> deserialize(std::span<const std::uint8_t> data);
};

struct InitAccount {
    std::vector<PlayerJoin> players;
    bytes_t data;  // Encoded AccountData
};

// ============================================================================
// Checkpoint
// ============================================================================

// The session keeps no durable state of its own; the checkpoint is empty.
struct GameCheckpoint {
    [[nodiscard]] bytes_t serialize() const { return {}; }

    bool operator==(const GameCheckpoint&) const = default;
};

}  // namespace eureka
