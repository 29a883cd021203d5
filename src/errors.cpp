#include "errors.h"

namespace conductor {

const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::DelegateNotFound: return "delegate_not_found";
        case ErrorType::DelegateTimeout: return "delegate_timeout";
        case ErrorType::DelegateFailure: return "delegate_failure";
        case ErrorType::MalformedTurn: return "malformed_turn";
        case ErrorType::BudgetExceeded: return "budget_exceeded";
        case ErrorType::UnknownBackend: return "unknown_backend";
        case ErrorType::BackendNotReady: return "backend_not_ready";
        case ErrorType::DuplicateBackend: return "duplicate_backend";
        case ErrorType::QueueFull: return "queue_full";
        case ErrorType::UnknownRequest: return "unknown_request";
        case ErrorType::PipelineStageFailure: return "pipeline_stage_failure";
        case ErrorType::Cancelled: return "cancelled";
        case ErrorType::Timeout: return "timeout";
        case ErrorType::InvalidArgument: return "invalid_argument";
        case ErrorType::InvalidState: return "invalid_state";
        case ErrorType::EmptyInput: return "empty_input";
        case ErrorType::IOError: return "io_error";
        case ErrorType::NetworkError: return "network_error";
        case ErrorType::ParseError: return "parse_error";
        case ErrorType::Unknown: return "unknown";
    }
    return "unknown";
}

std::string Error::describe() const {
    if (message.empty()) {
        return error_type_name(type);
    }
    return std::string(error_type_name(type)) + ": " + message;
}

} // namespace conductor
