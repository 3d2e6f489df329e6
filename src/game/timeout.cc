#include "timeout.hh"
#include "core/logging.hh"

namespace eureka {

void RecordingTimeoutPolicy::arm(const identity_t& identity, std::uint64_t duration_ms) {
    EUREKA_LOG_DEBUG(log::timeout) << "Armed " << duration_ms << "ms window for " << identity;
    armed_.push_back(ActionTimeout{identity, duration_ms});
}

std::optional<ActionTimeout> RecordingTimeoutPolicy::last() const {
    if (armed_.empty()) {
        return std::nullopt;
    }
    return armed_.back();
}

std::vector<ActionTimeout> RecordingTimeoutPolicy::drain() {
    std::vector<ActionTimeout> result;
    result.swap(armed_);
    return result;
}

}  // namespace eureka
