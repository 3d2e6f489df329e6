#include "events.hh"
#include "core/logging.hh"

namespace eureka {

// ============================================================================
// Game Event Encoding
// ============================================================================

namespace {

struct EventEncoder {
    bytes_t& out;

    void operator()(const SubmitEvent& event) const {
        out.push_back(static_cast<std::uint8_t>(GameEventTag::SUBMIT));
        append_bytes(out, event.ciphertext);
    }

    void operator()(const EvaluateEvent& event) const {
        out.push_back(static_cast<std::uint8_t>(GameEventTag::EVALUATE));
        auto body = event.message.serialize();
        out.insert(out.end(), body.begin(), body.end());
    }

    void operator()(const RejectEvent& event) const {
        out.push_back(static_cast<std::uint8_t>(GameEventTag::REJECT));
        out.push_back(static_cast<std::uint8_t>(event.reason));
    }
};

}  // namespace

bytes_t encode_game_event(const GameEvent& event) {
    bytes_t result;
    std::visit(EventEncoder{result}, event);
    return result;
}

std::optional<GameEvent> decode_game_event(std::span<const std::uint8_t> raw) {
    if (raw.size() > MAX_EVENT_SIZE) {
        return std::nullopt;
    }

    ByteReader reader(raw);
    auto tag = reader.read_u8();
    if (!tag) {
        return std::nullopt;
    }

    switch (static_cast<GameEventTag>(*tag)) {
        case GameEventTag::SUBMIT: {
            auto ciphertext = reader.read_bytes();
            if (!ciphertext || !reader.at_end()) {
                return std::nullopt;
            }
            return SubmitEvent{std::move(*ciphertext)};
        }
        case GameEventTag::EVALUATE: {
            auto message = Message::deserialize(raw.subspan(1));
            if (!message) {
                return std::nullopt;
            }
            return EvaluateEvent{std::move(*message)};
        }
        case GameEventTag::REJECT: {
            auto reason = reader.read_u8();
            if (!reason || !reader.at_end()) {
                return std::nullopt;
            }
            auto code = static_cast<ErrorCode>(*reason);
            if (code != ErrorCode::CRYPTO_ERROR && code != ErrorCode::ENCODING_ERROR) {
                return std::nullopt;
            }
            return RejectEvent{code};
        }
    }

    EUREKA_LOG_DEBUG(log::game) << "Unknown game event tag " << static_cast<int>(*tag);
    return std::nullopt;
}

std::string_view game_event_name(const GameEvent& event) {
    if (std::holds_alternative<SubmitEvent>(event)) {
        return "submit";
    }
    return std::holds_alternative<EvaluateEvent>(event) ? "evaluate" : "reject";
}

// ============================================================================
// AccountData Implementation
// ============================================================================

bytes_t AccountData::serialize() const {
    bytes_t result;
    append_u64(result, reward_amount);
    append_string(result, public_key_pem);
    auto ledger = results.serialize();
    result.insert(result.end(), ledger.begin(), ledger.end());
    return result;
}

std::optional<AccountData> AccountData::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);

    auto reward = reader.read_u64();
    if (!reward) {
        return std::nullopt;
    }

    auto pem = reader.read_string();
    if (!pem) {
        return std::nullopt;
    }

    auto results = ResultLedger::deserialize(reader);
    if (!results || !reader.at_end()) {
        return std::nullopt;
    }

    return AccountData{*reward, std::move(*pem), std::move(*results)};
}

}  // namespace eureka
