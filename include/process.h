#pragma once

/**
 * @file process.h
 * @brief Run a child process without a shell, with captured output and a deadline
 */

#include "common.h"
#include "errors.h"
#include <string>
#include <vector>

namespace conductor {

struct ProcessOptions {
    std::string cwd;            ///< Empty = inherit
    std::string stdin_data;     ///< Written to the child's stdin, then closed
    int timeout_ms = 0;         ///< 0 = no deadline; the child is SIGKILLed when exceeded
    CancelToken cancel;
};

struct ProcessOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;         ///< 128 + signal when killed by a signal
    bool timed_out = false;
    bool cancelled = false;
    int64_t duration_ms = 0;

    bool succeeded() const { return exit_code == 0 && !timed_out && !cancelled; }
};

/**
 * @brief fork/exec argv[0] (looked up on PATH) with stdout/stderr captured
 * @return IOError when the executable cannot be started (not found,
 *         not executable), InvalidArgument for an empty argv
 */
Result<ProcessOutput> run_process(const std::vector<std::string>& argv,
                                  const ProcessOptions& options = ProcessOptions());

} // namespace conductor
