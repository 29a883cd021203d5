#include "reasoning_loop.h"
#include "delegate_executor.h"
#include "core/deadline.h"
#include "logger.h"
#include "utils.h"
#include <sstream>

namespace conductor {

const char* loop_state_name(LoopState state) {
    switch (state) {
        case LoopState::Observe: return "OBSERVE";
        case LoopState::Plan: return "PLAN";
        case LoopState::Act: return "ACT";
        case LoopState::DelegateCall: return "DELEGATE_CALL";
        case LoopState::Final: return "FINAL";
        case LoopState::Error: return "ERROR";
        case LoopState::BudgetExceeded: return "BUDGET_EXCEEDED";
        case LoopState::Cancelled: return "CANCELLED";
    }
    return "ERROR";
}

const char* run_status_name(RunStatus status) {
    switch (status) {
        case RunStatus::Final: return "final";
        case RunStatus::Error: return "error";
        case RunStatus::BudgetExceeded: return "budget_exceeded";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "error";
}

class ReasoningLoop::Impl {
public:
    Impl(std::string name, std::shared_ptr<ReasoningBackend> backend,
         const DelegateRegistry& delegates, LoopOptions options, size_t max_concurrent)
        : name_(std::move(name)), backend_(std::move(backend)), delegates_(delegates),
          options_(options), executor_(max_concurrent) {}

    RunOutcome run(const std::string& input, const LoopOptions& options, const RunHooks& hooks) {
        RunOutcome outcome;
        const std::string trace_id = hooks.trace_id.empty() ? name_ : hooks.trace_id;
        const int max_iterations = options.max_iterations > 0 ? options.max_iterations : 1;
        const TimePoint started = Clock::now();

        if (!backend_) {
            return finish(outcome, RunStatus::Error,
                          make_error(ErrorType::InvalidState, name_ + " has no reasoning backend"), trace_id);
        }

        ScopedLogContext log_context(name_);
        LOG_AGENT(name_ + " run started (max_iterations=" + std::to_string(max_iterations) + ")");
        std::string observation = input;
        const std::string catalogue = delegates_.catalogue();

        for (int iteration = 1; iteration <= max_iterations; ++iteration) {
            // Turn boundary: cancellation and wall-clock budget
            if (is_cancelled(hooks.cancel)) {
                return finish(outcome, RunStatus::Cancelled,
                              make_error(ErrorType::Cancelled, "request cancelled after " +
                                         std::to_string(outcome.trace.size()) + " turn(s)"), trace_id);
            }
            if (options.max_duration_ms > 0 && ms_since(started) >= options.max_duration_ms) {
                return finish(outcome, RunStatus::BudgetExceeded,
                              make_error(ErrorType::BudgetExceeded, "wall-clock budget of " +
                                         std::to_string(options.max_duration_ms) + "ms exhausted after " +
                                         std::to_string(outcome.trace.size()) + " turn(s)"), trace_id);
            }

            transition(trace_id, LoopState::Observe, iteration);
            ReasoningContext context;
            context.agent_name = name_;
            context.input = input;
            context.observation = observation;
            context.trace = outcome.trace;
            context.catalogue = catalogue;
            context.media = hooks.media;
            context.iteration = iteration;
            context.max_iterations = max_iterations;

            transition(trace_id, LoopState::Plan, iteration);
            Result<Turn> produced = request_turn(context, options.backend_timeout_ms);
            if (produced.is_error()) {
                Error cause = produced.error();
                if (cause.message.empty()) cause.message = "reasoning backend failed";
                LOG_AGENT(name_ + " backend failure at iteration " + std::to_string(iteration) +
                          ": " + cause.describe());
                return finish(outcome, RunStatus::Error, cause, trace_id);
            }

            Turn turn = produced.value();
            turn.iteration = iteration;
            transition(trace_id, LoopState::Act, iteration);

            if (turn.is_answer()) {
                turn.outcome = turn.answer;
                turn.outcome_ok = true;
                append(outcome, turn, hooks);
                outcome.final_text = !turn.answer.empty() ? turn.answer : turn.observation;
                LOG_AGENT(name_ + " final answer at iteration " + std::to_string(iteration));
                return finish(outcome, RunStatus::Final, Error(), trace_id);
            }

            auto delegate = delegates_.get(turn.call.delegate);
            if (!delegate) {
                std::string available = utils::join(delegates_.names(), ", ");
                std::string reason = "delegate not found: '" + turn.call.delegate + "'. Available: " +
                                     (available.empty() ? "none" : available);
                turn.outcome = reason;
                turn.outcome_ok = false;
                append(outcome, turn, hooks);
                return finish(outcome, RunStatus::Error,
                              make_error(ErrorType::DelegateNotFound, reason), trace_id);
            }

            transition(trace_id, LoopState::DelegateCall, iteration);
            LOG_TRACE(trace_id, "delegate_start", turn.call.delegate + " " + turn.call.args.dump());
            const TimePoint call_started = Clock::now();
            DelegateResult result = executor_.execute_sync(delegate, turn.call.args, options.delegate_timeout_ms);
            LOG_TRACE(trace_id, result.success ? "delegate_end" : "delegate_error",
                      turn.call.delegate + " duration_ms=" + std::to_string(ms_since(call_started)));

            turn.outcome = result.observation_text();
            turn.outcome_ok = result.success;
            append(outcome, turn, hooks);
            observation = turn.call.delegate + ": " + turn.outcome;
        }

        return finish(outcome, RunStatus::BudgetExceeded,
                      make_error(ErrorType::BudgetExceeded, "no final answer within " +
                                 std::to_string(max_iterations) + " iteration(s)"), trace_id);
    }

    const std::string& name() const { return name_; }
    const LoopOptions& options() const { return options_; }

private:
    Result<Turn> request_turn(const ReasoningContext& context, int timeout_ms) {
        std::shared_ptr<ReasoningBackend> backend = backend_;
        // Context is copied into the call so a late result never touches this frame
        std::function<Result<Turn>()> call = [backend, context]() { return backend->complete(context); };
        return call_with_deadline<Turn>(call, timeout_ms, "reasoning backend");
    }

    void append(RunOutcome& outcome, const Turn& turn, const RunHooks& hooks) {
        outcome.trace.push_back(turn);
        if (hooks.on_turn) {
            try {
                hooks.on_turn(outcome.trace.back());
            } catch (const std::exception& e) {
                Logger::error(name_ + " turn callback threw: " + e.what());
            }
        }
    }

    void transition(const std::string& trace_id, LoopState state, int iteration) {
        LOG_TRACE(trace_id, loop_state_name(state), "iteration=" + std::to_string(iteration));
    }

    RunOutcome& finish(RunOutcome& outcome, RunStatus status, const Error& error, const std::string& trace_id) {
        outcome.status = status;
        outcome.error = error;
        LoopState terminal = LoopState::Final;
        switch (status) {
            case RunStatus::Final: terminal = LoopState::Final; break;
            case RunStatus::Error: terminal = LoopState::Error; break;
            case RunStatus::BudgetExceeded: terminal = LoopState::BudgetExceeded; break;
            case RunStatus::Cancelled: terminal = LoopState::Cancelled; break;
        }
        LOG_TRACE(trace_id, loop_state_name(terminal),
                  "turns=" + std::to_string(outcome.trace.size()) +
                  (error.is_error() ? " reason=" + error.describe() : ""));
        if (status != RunStatus::Final) {
            LOG_AGENT(name_ + " ended " + run_status_name(status) + ": " + error.describe());
        }
        return outcome;
    }

    std::string name_;
    std::shared_ptr<ReasoningBackend> backend_;
    const DelegateRegistry& delegates_;
    LoopOptions options_;
    DelegateExecutor executor_;
};

ReasoningLoop::ReasoningLoop(std::string name,
                             std::shared_ptr<ReasoningBackend> backend,
                             const DelegateRegistry& delegates,
                             LoopOptions options,
                             size_t max_concurrent)
    : pimpl_(std::make_unique<Impl>(std::move(name), std::move(backend), delegates, options, max_concurrent)) {}

ReasoningLoop::~ReasoningLoop() = default;

RunOutcome ReasoningLoop::run(const std::string& input, const RunHooks& hooks) {
    return pimpl_->run(input, pimpl_->options(), hooks);
}

RunOutcome ReasoningLoop::run(const std::string& input, const LoopOptions& options, const RunHooks& hooks) {
    return pimpl_->run(input, options, hooks);
}

const std::string& ReasoningLoop::name() const {
    return pimpl_->name();
}

const LoopOptions& ReasoningLoop::options() const {
    return pimpl_->options();
}

} // namespace conductor
