#include "participant.hh"
#include "core/logging.hh"
#include <algorithm>

namespace eureka {

// ============================================================================
// ParticipantRegistry Implementation
// ============================================================================

Participant& ParticipantRegistry::append(const PlayerJoin& join, const result_map_t& results) {
    if (contains(join.identity)) {
        EUREKA_LOG_WARN(log::registry) << "Identity " << join.identity
                                       << " joined again; keeping both entries";
    }

    participants_.push_back(Participant{join.identity, join.balance, results});

    EUREKA_LOG_DEBUG(log::registry) << "Registered " << join.identity
                                    << " (balance " << join.balance
                                    << ", " << results.size() << " cached results)";
    return participants_.back();
}

Participant* ParticipantRegistry::find(const identity_t& identity) {
    auto it = std::find_if(participants_.begin(), participants_.end(),
                           [&](const Participant& p) { return p.identity == identity; });
    return it == participants_.end() ? nullptr : &*it;
}

const Participant* ParticipantRegistry::find(const identity_t& identity) const {
    auto it = std::find_if(participants_.begin(), participants_.end(),
                           [&](const Participant& p) { return p.identity == identity; });
    return it == participants_.end() ? nullptr : &*it;
}

bool ParticipantRegistry::contains(const identity_t& identity) const {
    return find(identity) != nullptr;
}

void ParticipantRegistry::broadcast(const result_map_t& results) {
    for (auto& participant : participants_) {
        participant.local_results = results;
    }
    EUREKA_LOG_TRACE(log::registry) << "Synced " << results.size() << " results to "
                                    << participants_.size() << " participants";
}

bool ParticipantRegistry::converged_with(const result_map_t& results) const {
    return std::all_of(participants_.begin(), participants_.end(),
                       [&](const Participant& p) { return p.local_results == results; });
}

}  // namespace eureka
