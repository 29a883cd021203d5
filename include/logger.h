#pragma once

#include <string>
#include <memory>

namespace conductor {

/**
 * @brief Log levels for filtering output
 */
enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * @brief Parse "debug" | "info" | "warn" | "error" (case-insensitive).
 * Unknown strings map to INFO.
 */
LogLevel parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level);

/**
 * @brief Thread-safe logging with levels, optional file output and a
 * per-thread context tag
 *
 * The queue worker, registry initialization threads and delegate workers
 * all log concurrently. Each line carries the context of the thread that
 * wrote it (see ScopedLogContext), so interleaved output from a request
 * and the sub-agents it spawned can be told apart.
 */
class Logger {
public:
    /**
     * @brief Initialize logger with minimum log level. Only the first call
     * takes effect.
     * @param min_level Minimum level to output (default: INFO)
     * @param output_file Optional file path for log output (empty = console only)
     */
    static void initialize(LogLevel min_level = LogLevel::INFO,
                           const std::string& output_file = "");

    static void shutdown();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    static void set_level(LogLevel level);
    static LogLevel get_level();

    /// Context tag of the calling thread, e.g. "req-3/researcher"; empty if none
    static std::string current_context();

private:
    class Impl;
    static std::unique_ptr<Impl> impl_;

    static void log(LogLevel level, const std::string& message);
};

/**
 * @brief Push a context tag for the calling thread for the lifetime of the
 * object. Nested scopes join with '/'.
 */
class ScopedLogContext {
public:
    explicit ScopedLogContext(const std::string& tag);
    ~ScopedLogContext();

    ScopedLogContext(const ScopedLogContext&) = delete;
    ScopedLogContext& operator=(const ScopedLogContext&) = delete;

private:
    size_t previous_length_;
};

#define LOG_DEBUG(msg) conductor::Logger::debug("[" + std::string(__FILE__) + ":" + std::to_string(__LINE__) + "] " + msg)
#define LOG_INFO(msg) conductor::Logger::info(msg)
#define LOG_WARN(msg) conductor::Logger::warn(msg)
#define LOG_ERROR(msg) conductor::Logger::error(msg)

// Component-specific logging macros
#define LOG_AGENT(msg) conductor::Logger::info(std::string("[Agent] ") + (msg))
#define LOG_DELEGATE(msg) conductor::Logger::info(std::string("[Delegate] ") + (msg))
#define LOG_QUEUE(msg) conductor::Logger::info(std::string("[Queue] ") + (msg))
#define LOG_REGISTRY(msg) conductor::Logger::info(std::string("[Registry] ") + (msg))
#define LOG_STT(msg) conductor::Logger::info(std::string("[STT] ") + (msg))
#define LOG_TTS(msg) conductor::Logger::info(std::string("[TTS] ") + (msg))
#define LOG_LLM(msg) conductor::Logger::info(std::string("[LLM] ") + (msg))
#define LOG_PIPELINE(msg) conductor::Logger::info(std::string("[Pipeline] ") + (msg))
#define LOG_TRACE(request_id, stage, data) conductor::Logger::debug(std::string("[trace] request_id=") + (request_id) + " stage=" + (stage) + " " + (data))

} // namespace conductor
