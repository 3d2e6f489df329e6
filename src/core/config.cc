#include "config.hh"

namespace eureka {

std::optional<std::string> GameConfig::validate() const {
    if (action_timeout_ms == 0) {
        return "action_timeout_ms must be positive";
    }
    if (result_key_policy != ResultKeyPolicy::DIGEST &&
        result_key_policy != ResultKeyPolicy::VERBATIM) {
        return "unknown result_key_policy";
    }
    if (evaluator_identity.size() > MAX_IDENTITY_SIZE) {
        return "evaluator_identity exceeds " + std::to_string(MAX_IDENTITY_SIZE) + " bytes";
    }
    return std::nullopt;
}

}  // namespace eureka
