#pragma once

#include "common.h"
#include "errors.h"
#include "turn.h"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace conductor {

/**
 * @brief Request lifecycle: queued -> running -> {succeeded | failed | cancelled}
 *
 * Transitions are monotonic; a queued request may go straight to cancelled.
 */
enum class RequestStatus {
    Queued,
    Running,
    Succeeded,
    Failed,
    Cancelled
};

const char* request_status_name(RequestStatus status);

inline bool is_terminal(RequestStatus status) {
    return status == RequestStatus::Succeeded ||
           status == RequestStatus::Failed ||
           status == RequestStatus::Cancelled;
}

/**
 * @brief What the caller submitted
 */
struct RequestInput {
    std::string text;
    std::vector<std::string> media;  ///< Optional media references (paths or URLs)
};

/**
 * @brief In-memory record of one submission
 *
 * Sufficient input for an external history store; see to_json().
 */
struct RequestRecord {
    std::string id;
    RequestInput input;
    RequestStatus status = RequestStatus::Queued;
    std::vector<Turn> trace;
    std::string result_text;   ///< Final answer when succeeded
    Error error;               ///< Reason when failed or cancelled
    WallTime submitted_at;
    std::optional<WallTime> started_at;
    std::optional<WallTime> finished_at;

    nlohmann::json to_json() const;
};

} // namespace conductor
