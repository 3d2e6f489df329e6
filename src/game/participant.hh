#pragma once

#include "core/types.hh"
#include <vector>

namespace eureka {

// ============================================================================
// Player Join
// ============================================================================

// A participant admitted by the surrounding runtime, at session start or
// mid-session
struct PlayerJoin {
    identity_t identity;
    std::uint64_t balance = 0;

    bool operator==(const PlayerJoin&) const = default;
};

// ============================================================================
// Participant
// ============================================================================

struct Participant {
    identity_t identity;
    std::uint64_t balance = 0;

    // Locally cached copy of the accepted result set
    result_map_t local_results;

    bool operator==(const Participant&) const = default;
};

// ============================================================================
// Participant Registry
// ============================================================================

// Append-only, join-ordered collection. Identities are not deduplicated:
// the runtime may admit the same identity twice, and lookups resolve to the
// earliest entry.
class ParticipantRegistry {
public:
    ParticipantRegistry() = default;

    // Add a participant whose cache starts as a copy of `results`
    Participant& append(const PlayerJoin& join, const result_map_t& results);

    [[nodiscard]] Participant* find(const identity_t& identity);
    [[nodiscard]] const Participant* find(const identity_t& identity) const;
    [[nodiscard]] bool contains(const identity_t& identity) const;

    // Overwrite every participant's cache with a copy of `results`
    void broadcast(const result_map_t& results);

    // True if every cache equals `results`
    [[nodiscard]] bool converged_with(const result_map_t& results) const;

    [[nodiscard]] std::size_t size() const { return participants_.size(); }
    [[nodiscard]] bool empty() const { return participants_.empty(); }
    [[nodiscard]] const Participant& at(std::size_t index) const { return participants_.at(index); }

    [[nodiscard]] auto begin() const { return participants_.begin(); }
    [[nodiscard]] auto end() const { return participants_.end(); }

    bool operator==(const ParticipantRegistry&) const = default;

private:
    std::vector<Participant> participants_;
};

}  // namespace eureka
