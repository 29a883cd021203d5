#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace conductor {

namespace {

thread_local std::string t_context;

/// "[LEVEL] 2026-01-01 12:00:00.123 [ctx]: message"; timestamp omitted when stamp is false
std::string format_line(LogLevel level, const std::string& message, bool stamp) {
    std::ostringstream oss;
    oss << "[" << log_level_name(level) << "]";
    if (stamp) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);
        oss << " " << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count();
    }
    if (!t_context.empty()) {
        oss << " [" << t_context << "]";
    }
    oss << ": " << message;
    return oss.str();
}

void write_console(LogLevel level, const std::string& line) {
    if (level >= LogLevel::WARN) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

} // anonymous namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lowered == "debug") return LogLevel::DEBUG;
    if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
    if (lowered == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

class Logger::Impl {
public:
    Impl(LogLevel min_level, const std::string& output_file) : min_level_(min_level) {
        if (!output_file.empty()) {
            file_stream_ = std::make_unique<std::ofstream>(output_file, std::ios::app);
            if (!file_stream_->is_open()) {
                std::cerr << "Warning: Failed to open log file: " << output_file << std::endl;
                file_stream_.reset();
            }
        }
    }

    void log(LogLevel level, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < min_level_) {
            return;
        }
        std::string line = format_line(level, message, true);
        write_console(level, line);
        if (file_stream_) {
            *file_stream_ << line << std::endl;
        }
    }

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

private:
    mutable std::mutex mutex_;
    LogLevel min_level_;
    std::unique_ptr<std::ofstream> file_stream_;
};

std::unique_ptr<Logger::Impl> Logger::impl_ = nullptr;

void Logger::initialize(LogLevel min_level, const std::string& output_file) {
    if (!impl_) {
        impl_ = std::make_unique<Impl>(min_level, output_file);
    }
}

void Logger::shutdown() {
    impl_.reset();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (impl_) {
        impl_->log(level, message);
        return;
    }
    // Not initialized (early startup): INFO and above, unstamped
    if (level >= LogLevel::INFO) {
        write_console(level, format_line(level, message, false));
    }
}

void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { log(LogLevel::INFO, message); }
void Logger::warn(const std::string& message) { log(LogLevel::WARN, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }

void Logger::set_level(LogLevel level) {
    if (impl_) {
        impl_->set_level(level);
    }
}

LogLevel Logger::get_level() {
    return impl_ ? impl_->get_level() : LogLevel::INFO;
}

std::string Logger::current_context() {
    return t_context;
}

ScopedLogContext::ScopedLogContext(const std::string& tag) : previous_length_(t_context.size()) {
    if (tag.empty()) return;
    if (!t_context.empty()) t_context += "/";
    t_context += tag;
}

ScopedLogContext::~ScopedLogContext() {
    t_context.resize(previous_length_);
}

} // namespace conductor
