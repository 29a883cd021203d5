#include "backend/backend_provider.h"

namespace conductor {

const char* backend_state_name(BackendState state) {
    switch (state) {
        case BackendState::Unregistered: return "unregistered";
        case BackendState::Registered: return "registered";
        case BackendState::Initializing: return "initializing";
        case BackendState::Ready: return "ready";
        case BackendState::Degraded: return "degraded";
        case BackendState::Failed: return "failed";
    }
    return "unregistered";
}

nlohmann::json BackendStatus::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["display_name"] = display_name;
    j["description"] = description;
    j["state"] = backend_state_name(state);
    j["ready"] = ready();
    j["selected"] = selected;
    j["reason"] = reason;
    j["remediation"] = remediation;
    j["checked_at"] = checked_at;
    return j;
}

} // namespace conductor
