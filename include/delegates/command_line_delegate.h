#pragma once

#include "delegate.h"
#include <string>

namespace conductor {

struct CommandLineOptions {
    int timeout_ms = 10000;
    bool allow_sudo = false;
    size_t max_output_chars = 4000;
};

/**
 * @brief execute_command: runs one non-interactive command without a shell
 *
 * Args: {"command": "...", "cwd": "...", "timeout": seconds}. A requested
 * timeout can only shorten CommandLineOptions::timeout_ms. The command is
 * split into argv (quotes and backslashes honored). `sudo` is refused unless
 * allowed by configuration; destructive patterns are refused outright.
 * Refusals, non-zero exits and timeouts come back as failures; stdout (or
 * stderr when stdout is empty) is truncated to max_output_chars.
 */
class CommandLineDelegate : public Delegate {
public:
    explicit CommandLineDelegate(CommandLineOptions options = CommandLineOptions())
        : options_(options) {}

    std::string name() const override { return "execute_command"; }
    std::string description() const override {
        return "Execute a safe, non-interactive shell command on the local machine and return its output.";
    }
    std::string usage() const override {
        return "execute_command({\"command\": \"ls -la\", \"cwd\": \".\", \"timeout\": 10})";
    }
    DelegateResult invoke(const nlohmann::json& args) override;

    /**
     * @brief Reason the command is refused, empty when it may run
     */
    std::string refusal_reason(const std::string& command, const std::vector<std::string>& argv) const;

    /**
     * @brief Milliseconds to allow the command: the requested "timeout"
     * (seconds) clamped to [1, max_ms]; max_ms when absent or not positive
     */
    static int timeout_from_args(const nlohmann::json& args, int max_ms);

private:
    CommandLineOptions options_;
};

} // namespace conductor
