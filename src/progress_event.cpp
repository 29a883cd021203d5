#include "progress_event.h"

using json = nlohmann::json;

namespace conductor {

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Status: return "status";
        case EventKind::Turn: return "turn";
        case EventKind::Result: return "result";
        case EventKind::Error: return "error";
    }
    return "status";
}

json ProgressEvent::to_json() const {
    json data;
    data["request_id"] = request_id;
    data["sequence"] = sequence;
    data["status"] = request_status_name(status);

    std::string type;
    switch (kind) {
        case EventKind::Status:
            type = "status";
            data["message"] = text;
            break;
        case EventKind::Turn:
            type = "turn";
            data["turn"] = turn ? turn->to_json() : json(nullptr);
            break;
        case EventKind::Result:
            type = "chat_response";
            data["response"] = text;
            break;
        case EventKind::Error:
            type = "error";
            data["error_type"] = error_type;
            data["message"] = text;
            break;
    }

    json j;
    j["type"] = type;
    j["timestamp"] = timestamp;
    j["data"] = data;
    return j;
}

} // namespace conductor
