#pragma once

#include "core/types.hh"
#include <optional>
#include <string>

namespace eureka {

// ============================================================================
// Result Key Policy
// ============================================================================

// How the state machine turns evaluated content into a ledger key.
enum class ResultKeyPolicy : std::uint8_t {
    DIGEST = 0,    // key = hex(SHA3-256(content))
    VERBATIM = 1,  // content already is the canonical key
};

[[nodiscard]] inline std::string_view result_key_policy_name(ResultKeyPolicy policy) {
    switch (policy) {
        case ResultKeyPolicy::DIGEST: return "digest";
        case ResultKeyPolicy::VERBATIM: return "verbatim";
    }
    return "unknown";
}

// ============================================================================
// Game Configuration
// ============================================================================

struct GameConfig {
    // Reaction window armed for the credited participant after each accepted result
    std::uint64_t action_timeout_ms = ACTION_TIMEOUT_MS;

    ResultKeyPolicy result_key_policy = ResultKeyPolicy::DIGEST;

    // Caller admitted for Evaluate by the host; empty trusts every caller
    identity_t evaluator_identity;

    // Host-side bound on queued submissions; 0 means unbounded
    std::size_t max_pending_submissions = 0;

    // Returns a description of the first invalid field, if any
    [[nodiscard]] std::optional<std::string> validate() const;
};

}  // namespace eureka
