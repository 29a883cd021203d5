#pragma once

#include "common.h"
#include "errors.h"
#include "turn.h"
#include "reasoning_backend.h"
#include "delegate_registry.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>

namespace conductor {

/**
 * @brief Reasoning loop states
 *
 * OBSERVE -> PLAN -> ACT -> (DELEGATE_CALL -> OBSERVE | FINAL).
 * FINAL, ERROR, BUDGET_EXCEEDED and CANCELLED are terminal.
 */
enum class LoopState {
    Observe,
    Plan,
    Act,
    DelegateCall,
    Final,
    Error,
    BudgetExceeded,
    Cancelled
};

const char* loop_state_name(LoopState state);

/**
 * @brief Terminal status of one run
 */
enum class RunStatus {
    Final,
    Error,
    BudgetExceeded,
    Cancelled
};

const char* run_status_name(RunStatus status);

struct LoopOptions {
    int max_iterations = 8;
    int delegate_timeout_ms = 30000;   ///< Per delegate invocation (0 = unbounded)
    int max_duration_ms = 0;           ///< Wall-clock cap per run (0 = none)
    int backend_timeout_ms = 0;        ///< Bound on each reasoning backend call (0 = none)
};

/**
 * @brief Result of ReasoningLoop::run
 *
 * `error` is set for every non-Final status and always carries a reason.
 */
struct RunOutcome {
    RunStatus status = RunStatus::Error;
    std::string final_text;
    Error error;
    std::vector<Turn> trace;

    bool ok() const { return status == RunStatus::Final; }
};

using TurnCallback = std::function<void(const Turn&)>;

/**
 * @brief Per-run hooks supplied by the caller (usually the orchestration queue)
 */
struct RunHooks {
    std::string trace_id;   ///< Correlates log lines, normally the request id
    CancelToken cancel;     ///< Checked at Turn boundaries
    TurnCallback on_turn;   ///< Called with each completed Turn, in order
    std::vector<std::string> media;  ///< Image references shown to the backend every iteration
};

/**
 * @brief Drives observe/plan/act iterations for a single request
 *
 * Each iteration asks the backend for a Turn. A tool Turn resolves its
 * delegate by name (unknown name is a terminal error) and invokes it with
 * the delegate timeout; success, failure and timeout alike become the next
 * observation. An answer Turn is terminal. Runs never exceed
 * max_iterations Turns.
 *
 * One ReasoningLoop may serve many sequential runs; concurrent runs on the
 * same instance share its delegate workers.
 */
class ReasoningLoop {
public:
    /**
     * @param name Agent name used in logs and prompts
     * @param backend Language-model collaborator (shared with sub-agents)
     * @param delegates Delegate table; must outlive the loop
     * @param options Default budget
     * @param max_concurrent Delegate worker threads
     */
    ReasoningLoop(std::string name,
                  std::shared_ptr<ReasoningBackend> backend,
                  const DelegateRegistry& delegates,
                  LoopOptions options = LoopOptions(),
                  size_t max_concurrent = 1);

    ~ReasoningLoop();

    // Non-copyable
    ReasoningLoop(const ReasoningLoop&) = delete;
    ReasoningLoop& operator=(const ReasoningLoop&) = delete;

    RunOutcome run(const std::string& input, const RunHooks& hooks = RunHooks());

    RunOutcome run(const std::string& input, const LoopOptions& options, const RunHooks& hooks);

    const std::string& name() const;
    const LoopOptions& options() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace conductor
