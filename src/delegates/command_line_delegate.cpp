#include "delegates/command_line_delegate.h"
#include "logger.h"
#include "process.h"
#include "utils.h"
#include <algorithm>
#include <regex>

namespace conductor {

namespace {

const std::vector<std::regex>& blacklist() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\brm\s+-(rf|fr)\b)", std::regex::icase),
        std::regex(R"(\bdd\b)", std::regex::icase),
        std::regex(R"(\bmkfs\b)", std::regex::icase),
        std::regex(R"(\bformat\b)", std::regex::icase),
        std::regex(R"(\bshutdown\b|\breboot\b|\bhalt\b)", std::regex::icase),
        std::regex(R"(:\s*\(\s*\)\s*\{)"),  // fork bomb
    };
    return patterns;
}

} // anonymous namespace

int CommandLineDelegate::timeout_from_args(const nlohmann::json& args, int max_ms) {
    if (max_ms < 1) max_ms = 1;
    if (!args.is_object() || !args.contains("timeout")) return max_ms;
    const auto& raw = args["timeout"];
    if (!raw.is_number()) return max_ms;
    double requested_ms = raw.get<double>() * 1000.0;
    // Negated test also rejects NaN
    if (!(requested_ms > 0.0)) return max_ms;
    if (requested_ms >= static_cast<double>(max_ms)) return max_ms;
    return std::max(1, static_cast<int>(requested_ms));
}

std::string CommandLineDelegate::refusal_reason(const std::string& command,
                                                const std::vector<std::string>& argv) const {
    if (!options_.allow_sudo) {
        for (const auto& token : argv) {
            if (utils::normalize_copy(token) == "sudo") {
                return "unsafe to run: sudo is not allowed";
            }
        }
    }
    for (const auto& rx : blacklist()) {
        if (std::regex_search(command, rx)) {
            return "unsafe to run: command matches a blocked pattern";
        }
    }
    return "";
}

DelegateResult CommandLineDelegate::invoke(const nlohmann::json& args) {
    std::string command = utils::trim_copy(text_argument(args, {"command", "inputs", "query"}));
    if (command.empty()) {
        return DelegateResult::error_result("execute_command needs a 'command'", "invalid_arguments");
    }

    bool split_ok = true;
    std::vector<std::string> argv = utils::split_command_line(command, split_ok);
    if (!split_ok || argv.empty()) {
        argv = {command};
    }

    std::string refusal = refusal_reason(command, argv);
    if (!refusal.empty()) {
        LOG_DELEGATE("execute_command refused: " + command);
        return DelegateResult::error_result(refusal, "refused");
    }

    ProcessOptions process;
    process.timeout_ms = timeout_from_args(args, options_.timeout_ms);
    if (args.is_object() && args.contains("cwd") && args["cwd"].is_string()) {
        process.cwd = args["cwd"].get<std::string>();
    }

    LOG_DELEGATE("execute_command: " + command);
    auto ran = run_process(argv, process);
    if (ran.is_error()) {
        return DelegateResult::error_result(ran.error().message, "spawn_failed");
    }
    const ProcessOutput& output = ran.value();
    if (output.timed_out) {
        return DelegateResult::error_result("Command timed out after " +
                                            std::to_string(process.timeout_ms) + "ms", "timeout");
    }

    std::string text = !output.stdout_text.empty() ? output.stdout_text : output.stderr_text;
    text = utils::truncate_with_marker(text, options_.max_output_chars);
    if (output.exit_code != 0) {
        return DelegateResult::error_result("exit code " + std::to_string(output.exit_code) +
                                            (text.empty() ? "" : ": " + text), "exit_status");
    }
    return DelegateResult::success_result(text);
}

} // namespace conductor
