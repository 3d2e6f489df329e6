#pragma once

#include "core/config.hh"
#include "core/error.hh"
#include "game/events.hh"
#include "game/session.hh"
#include "game/timeout.hh"
#include <memory>
#include <mutex>

namespace eureka {

// ============================================================================
// Session Host
// ============================================================================

// Stand-in for the runtime around a GameSession: admits one action at a
// time, decodes payloads, checks the evaluator capability, enforces the
// pending bound and owns the timeout scheduler.
class SessionHost {
public:
    struct OpenResult {
        ErrorCode error = ErrorCode::OK;
        std::unique_ptr<SessionHost> host;

        [[nodiscard]] bool ok() const { return error == ErrorCode::OK; }
    };

    // INVALID_CONFIG if `config` fails validation, DECODE_ERROR if the
    // account data cannot be decoded
    [[nodiscard]] static OpenResult open(const GameConfig& config,
                                         const InitAccount& account,
                                         std::shared_ptr<TimeoutPolicy> timeouts);

    SessionHost(const SessionHost&) = delete;
    SessionHost& operator=(const SessionHost&) = delete;

    // Apply one runtime event and return its result
    ErrorCode deliver(const Event& event);

    // Copy of the session as of the last completed action
    [[nodiscard]] GameSession snapshot() const;

    [[nodiscard]] std::size_t delivered() const;
    [[nodiscard]] std::size_t rejected() const;

private:
    struct ConstructTag {
        explicit ConstructTag() = default;
    };

public:
    // Reachable only through open()
    SessionHost(ConstructTag, GameSession session, std::shared_ptr<TimeoutPolicy> timeouts);

private:
    ErrorCode deliver_custom(const CustomEvent& event);

    GameSession session_;
    std::shared_ptr<TimeoutPolicy> timeouts_;
    std::size_t delivered_ = 0;
    std::size_t rejected_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace eureka
