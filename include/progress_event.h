#pragma once

#include "request.h"
#include "turn.h"
#include <cstdint>
#include <string>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>

namespace conductor {

enum class EventKind {
    Status,   ///< Request status transition
    Turn,     ///< A completed Turn of the running request
    Result,   ///< Final answer (precedes the succeeded status event)
    Error     ///< Terminal failure reason (precedes the failed/cancelled status event)
};

const char* event_kind_name(EventKind kind);

/**
 * @brief One progress/result signal for a request
 *
 * `sequence` starts at 1 per request and strictly increases in delivery
 * order. Consumers must tolerate duplicates.
 */
struct ProgressEvent {
    std::string request_id;
    uint64_t sequence = 0;
    EventKind kind = EventKind::Status;
    RequestStatus status = RequestStatus::Queued;
    std::optional<Turn> turn;
    std::string text;          ///< Answer, error reason or status message
    std::string error_type;    ///< error_type_name() for Error events
    std::string timestamp;

    bool is_terminal_status() const {
        return kind == EventKind::Status && is_terminal(status);
    }

    /**
     * @brief Transport message {"type", "timestamp", "data"}
     *
     * type is "status", "turn", "chat_response" or "error".
     */
    nlohmann::json to_json() const;
};

using EventCallback = std::function<void(const ProgressEvent&)>;

} // namespace conductor
