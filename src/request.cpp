#include "request.h"

using json = nlohmann::json;

namespace conductor {

const char* request_status_name(RequestStatus status) {
    switch (status) {
        case RequestStatus::Queued: return "queued";
        case RequestStatus::Running: return "running";
        case RequestStatus::Succeeded: return "succeeded";
        case RequestStatus::Failed: return "failed";
        case RequestStatus::Cancelled: return "cancelled";
    }
    return "failed";
}

json RequestRecord::to_json() const {
    json j;
    j["id"] = id;
    j["input"] = {{"text", input.text}, {"media", input.media}};
    j["status"] = request_status_name(status);
    j["trace"] = json::array();
    for (const auto& turn : trace) {
        j["trace"].push_back(turn.to_json());
    }
    j["result"] = result_text;
    if (error.is_error()) {
        j["error"] = {{"type", error_type_name(error.type)}, {"message", error.message}};
    } else {
        j["error"] = nullptr;
    }
    j["submitted_at"] = utc_timestamp(submitted_at);
    j["started_at"] = started_at ? json(utc_timestamp(*started_at)) : json(nullptr);
    j["finished_at"] = finished_at ? json(utc_timestamp(*finished_at)) : json(nullptr);
    return j;
}

} // namespace conductor
