#pragma once

#include <string>
#include <variant>
#include <optional>
#include <stdexcept>

namespace conductor {

/**
 * @brief Error types for different failure modes
 *
 * The first group is the orchestration taxonomy; the second group covers
 * transport and I/O failures raised by concrete backends and delegates.
 */
enum class ErrorType {
    None,
    // Reasoning loop
    DelegateNotFound,
    DelegateTimeout,
    DelegateFailure,
    MalformedTurn,
    BudgetExceeded,
    // Backend registries
    UnknownBackend,
    BackendNotReady,
    DuplicateBackend,
    // Queue
    QueueFull,
    UnknownRequest,
    // Facade
    PipelineStageFailure,
    // General
    Cancelled,
    Timeout,
    InvalidArgument,
    InvalidState,
    EmptyInput,
    IOError,
    NetworkError,
    ParseError,
    Unknown
};

/// Stable snake_case name used in logs and JSON payloads.
const char* error_type_name(ErrorType type);

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }

    /// "<type>: <message>"
    std::string describe() const;
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an error of type E (Error by default).
 */
template<typename T, typename E = Error>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const E& error) : data_(error) {}
    Result(E&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<E>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const E& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<E>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, E> data_;
};

// Specialization for void (success/failure only)
template<typename E>
class Result<void, E> {
public:
    Result() : is_ok_(true) {}
    Result(const E& error) : is_ok_(false), error_(error) {}
    Result(E&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const E& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    E error_;
};

using VoidResult = Result<void>;

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

} // namespace conductor
