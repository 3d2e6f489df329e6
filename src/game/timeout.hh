#pragma once

#include "core/types.hh"
#include <optional>
#include <vector>

namespace eureka {

// ============================================================================
// Timeout Policy
// ============================================================================

// Arms a bounded reaction window for a participant. Firing and whatever
// reacts to it belong to the surrounding runtime.
class TimeoutPolicy {
public:
    virtual ~TimeoutPolicy() = default;
    virtual void arm(const identity_t& identity, std::uint64_t duration_ms) = 0;
};

struct ActionTimeout {
    identity_t identity;
    std::uint64_t duration_ms = 0;

    bool operator==(const ActionTimeout&) const = default;
};

// Records every armed window in order. Hosts hand the list to their
// scheduler; tests inspect it directly.
class RecordingTimeoutPolicy : public TimeoutPolicy {
public:
    void arm(const identity_t& identity, std::uint64_t duration_ms) override;

    [[nodiscard]] const std::vector<ActionTimeout>& armed() const { return armed_; }
    [[nodiscard]] std::optional<ActionTimeout> last() const;

    // Hand over and forget all recorded windows
    std::vector<ActionTimeout> drain();

private:
    std::vector<ActionTimeout> armed_;
};

}  // namespace eureka
