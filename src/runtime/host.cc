#include "host.hh"
#include "core/logging.hh"

namespace eureka {

SessionHost::OpenResult SessionHost::open(const GameConfig& config,
                                          const InitAccount& account,
                                          std::shared_ptr<TimeoutPolicy> timeouts) {
    OpenResult result;

    if (auto problem = config.validate()) {
        EUREKA_LOG_ERROR(log::host) << "Invalid game config: " << *problem;
        result.error = ErrorCode::INVALID_CONFIG;
        return result;
    }
    if (!timeouts) {
        log::host.error("No timeout policy supplied");
        result.error = ErrorCode::INVALID_CONFIG;
        return result;
    }

    auto session = GameSession::init_state(account, config);
    if (!session) {
        result.error = ErrorCode::DECODE_ERROR;
        return result;
    }

    result.host = std::make_unique<SessionHost>(ConstructTag{}, std::move(*session), std::move(timeouts));
    return result;
}

SessionHost::SessionHost(ConstructTag, GameSession session, std::shared_ptr<TimeoutPolicy> timeouts)
    : session_(std::move(session))
    , timeouts_(std::move(timeouts)) {}

ErrorCode SessionHost::deliver(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    ErrorCode error = ErrorCode::OK;
    if (const auto* custom = std::get_if<CustomEvent>(&event)) {
        error = deliver_custom(*custom);
    } else {
        error = session_.handle_event(event, *timeouts_);
    }

    ++delivered_;
    if (error != ErrorCode::OK) {
        ++rejected_;
        EUREKA_LOG_DEBUG(log::host) << "Action " << delivered_ << " rejected: "
                                    << error_code_string(error);
    }
    return error;
}

ErrorCode SessionHost::deliver_custom(const CustomEvent& event) {
    auto decoded = decode_game_event(event.raw);
    if (!decoded) {
        EUREKA_LOG_WARN(log::host) << "Malformed payload from " << event.sender;
        return ErrorCode::DECODE_ERROR;
    }

    const auto& config = session_.config();

    if (!std::holds_alternative<SubmitEvent>(*decoded) &&
        !config.evaluator_identity.empty() &&
        event.sender != config.evaluator_identity) {
        EUREKA_LOG_WARN(log::host) << game_event_name(*decoded) << " from " << event.sender << " refused";
        return ErrorCode::UNAUTHORIZED;
    }

    if (std::holds_alternative<SubmitEvent>(*decoded) &&
        config.max_pending_submissions > 0 &&
        session_.pending().size() >= config.max_pending_submissions) {
        EUREKA_LOG_WARN(log::host) << "Submission from " << event.sender << " refused: "
                                   << session_.pending().size() << " already pending";
        return ErrorCode::QUEUE_FULL;
    }

    return session_.apply(event.sender, *decoded, *timeouts_);
}

GameSession SessionHost::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

std::size_t SessionHost::delivered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delivered_;
}

std::size_t SessionHost::rejected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

}  // namespace eureka
