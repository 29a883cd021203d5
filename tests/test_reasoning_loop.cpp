/**
 * Reasoning loop against a scripted backend: final answers, budgets,
 * unknown delegates, malformed output, cancellation and delegate timeouts.
 *
 * Run from build dir: ./test_reasoning_loop
 */

#include "test_support.h"
#include "delegate.h"
#include "delegate_registry.h"
#include "reasoning_loop.h"
#include "core/deadline.h"
#include <atomic>
#include <memory>

using namespace conductor;
using test_support::ScriptedBackend;

namespace {

std::shared_ptr<Delegate> answer_delegate(const std::string& name, const std::string& answer) {
    return std::make_shared<FunctionDelegate>(name, "Returns a fixed answer",
        [answer](const nlohmann::json&) { return DelegateResult::success_result(answer); });
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- tool call then answer ---
    {
        DelegateRegistry delegates;
        std::atomic<int> search_calls{0};
        nlohmann::json search_args;
        delegates.register_delegate(std::make_shared<FunctionDelegate>("search", "Finds the answer",
            [&search_calls, &search_args](const nlohmann::json& args) {
                search_calls++;
                search_args = args;
                return DelegateResult::success_result("42");
            }));
        auto backend = std::make_shared<ScriptedBackend>();
        backend->push(make_tool_turn("search", {{"q", "answer"}}, "user asked"));
        backend->push(make_answer_turn("The answer is 42", "search returned 42"));

        LoopOptions options;
        options.max_iterations = 5;
        ReasoningLoop loop("orchestrator", backend, delegates, options);

        std::vector<int> seen;
        RunHooks hooks;
        hooks.trace_id = "req-1";
        hooks.on_turn = [&seen](const Turn& t) { seen.push_back(t.iteration); };
        hooks.media = {"https://example.com/chart.png"};
        RunOutcome out = loop.run("What is the answer?", hooks);

        ASSERT(out.status == RunStatus::Final);
        ASSERT(out.ok());
        ASSERT(out.final_text == "The answer is 42");
        ASSERT(!out.error.is_error());
        ASSERT(search_calls == 1);
        ASSERT(search_args == nlohmann::json({{"q", "answer"}}));
        ASSERT(out.trace.size() == 2);
        if (out.trace.size() == 2) {
            ASSERT(out.trace[0].iteration == 1);
            ASSERT(out.trace[0].is_tool());
            ASSERT(out.trace[0].outcome == "42");
            ASSERT(out.trace[0].outcome_ok);
            ASSERT(out.trace[1].iteration == 2);
            ASSERT(out.trace[1].is_answer());
        }
        ASSERT(seen.size() == 2 && seen[0] == 1 && seen[1] == 2);

        // Second iteration sees the prior Turn and its outcome
        ReasoningContext second = backend->context_at(1);
        ASSERT(second.iteration == 2);
        ASSERT(second.trace.size() == 1);
        ASSERT(second.observation == "search: 42");
        ASSERT(second.input == "What is the answer?");
        ASSERT(second.catalogue.find("search") != std::string::npos);
        ASSERT(second.media.size() == 1 && second.media[0] == "https://example.com/chart.png");
    }

    // --- failing delegate every iteration: budget exhausted ---
    {
        DelegateRegistry delegates;
        delegates.register_delegate(std::make_shared<FunctionDelegate>("flaky", "Always fails",
            [](const nlohmann::json&) { return DelegateResult::error_result("service down"); }));
        auto backend = std::make_shared<ScriptedBackend>();
        backend->push(make_tool_turn("flaky", {{"x", 1}}));

        LoopOptions options;
        options.max_iterations = 3;
        ReasoningLoop loop("orchestrator", backend, delegates, options);
        RunOutcome out = loop.run("try it");

        ASSERT(out.status == RunStatus::BudgetExceeded);
        ASSERT(out.error.type == ErrorType::BudgetExceeded);
        ASSERT(!out.error.message.empty());
        ASSERT(out.trace.size() == 3);
        ASSERT(backend->calls() == 3);
        for (const auto& t : out.trace) {
            ASSERT(!t.outcome_ok);
            ASSERT(t.outcome == "Error (failure): service down");
        }
    }

    // --- unknown delegate is terminal, and the Turn is still recorded ---
    {
        DelegateRegistry delegates;
        delegates.register_delegate(answer_delegate("search", "42"));
        auto backend = std::make_shared<ScriptedBackend>();
        backend->push(make_tool_turn("teleport", {{"to", "mars"}}));

        ReasoningLoop loop("orchestrator", backend, delegates);
        RunOutcome out = loop.run("go to mars");

        ASSERT(out.status == RunStatus::Error);
        ASSERT(out.error.type == ErrorType::DelegateNotFound);
        ASSERT(out.error.message.find("teleport") != std::string::npos);
        ASSERT(out.trace.size() == 1);
        if (!out.trace.empty()) {
            ASSERT(!out.trace[0].outcome_ok);
            ASSERT(out.trace[0].outcome.find("search") != std::string::npos);
        }
        ASSERT(backend->calls() == 1);
    }

    // --- malformed backend output ends the run ---
    {
        DelegateRegistry delegates;
        auto backend = std::make_shared<ScriptedBackend>();
        backend->push(make_error(ErrorType::MalformedTurn, "no JSON object found in response"));

        ReasoningLoop loop("orchestrator", backend, delegates);
        RunOutcome out = loop.run("hello");
        ASSERT(out.status == RunStatus::Error);
        ASSERT(out.error.type == ErrorType::MalformedTurn);
        ASSERT(out.trace.empty());
    }

    // --- backend failure without a message still carries a reason ---
    {
        DelegateRegistry delegates;
        auto backend = std::make_shared<ScriptedBackend>();
        backend->push(Error(ErrorType::NetworkError, ""));

        ReasoningLoop loop("orchestrator", backend, delegates);
        RunOutcome out = loop.run("hello");
        ASSERT(out.status == RunStatus::Error);
        ASSERT(out.error.type == ErrorType::NetworkError);
        ASSERT(!out.error.message.empty());
    }

    // --- cancellation is honored at the next Turn boundary ---
    {
        DelegateRegistry delegates;
        delegates.register_delegate(answer_delegate("search", "still looking"));
        auto backend = std::make_shared<ScriptedBackend>();
        backend->push(make_tool_turn("search", {{"q", "x"}}));

        ReasoningLoop loop("orchestrator", backend, delegates);

        RunHooks hooks;
        hooks.cancel = make_cancel_token();
        hooks.on_turn = [&hooks](const Turn&) { hooks.cancel->store(true); };
        RunOutcome out = loop.run("keep searching", hooks);

        ASSERT(out.status == RunStatus::Cancelled);
        ASSERT(out.error.type == ErrorType::Cancelled);
        ASSERT(out.trace.size() == 1);
        ASSERT(backend->calls() == 1);

        RunHooks already;
        already.cancel = make_cancel_token();
        already.cancel->store(true);
        RunOutcome none = loop.run("never starts", already);
        ASSERT(none.status == RunStatus::Cancelled);
        ASSERT(none.trace.empty());
        ASSERT(backend->calls() == 1);
    }

    // --- delegate timeout becomes the observation, loop continues ---
    {
        DelegateRegistry delegates;
        delegates.register_delegate(std::make_shared<FunctionDelegate>("slow", "Sleeps",
            [](const nlohmann::json&) {
                test_support::sleep_ms(400);
                return DelegateResult::success_result("late");
            }));
        auto backend = std::make_shared<ScriptedBackend>();
        backend->push(make_tool_turn("slow", {{"q", "x"}}));
        backend->push(make_answer_turn("gave up waiting"));

        LoopOptions options;
        options.max_iterations = 4;
        options.delegate_timeout_ms = 50;
        ReasoningLoop loop("orchestrator", backend, delegates, options);
        RunOutcome out = loop.run("be quick");

        ASSERT(out.status == RunStatus::Final);
        ASSERT(out.final_text == "gave up waiting");
        ASSERT(out.trace.size() == 2);
        if (!out.trace.empty()) {
            ASSERT(!out.trace[0].outcome_ok);
            ASSERT(out.trace[0].outcome.rfind("Error (timeout): ", 0) == 0);
        }
    }

    // --- a timed-out call does not hold up the next one ---
    {
        DelegateRegistry delegates;
        std::atomic<int> fast_calls{0};
        delegates.register_delegate(std::make_shared<FunctionDelegate>("slow", "Sleeps",
            [](const nlohmann::json&) {
                test_support::sleep_ms(600);
                return DelegateResult::success_result("late");
            }));
        delegates.register_delegate(std::make_shared<FunctionDelegate>("fast", "Returns at once",
            [&fast_calls](const nlohmann::json&) {
                fast_calls++;
                return DelegateResult::success_result("quick result");
            }));
        auto backend = std::make_shared<ScriptedBackend>();
        backend->push(make_tool_turn("slow", nlohmann::json::object()));
        backend->push(make_tool_turn("fast", nlohmann::json::object()));
        backend->push(make_answer_turn("both tried"));

        LoopOptions options;
        options.max_iterations = 5;
        options.delegate_timeout_ms = 100;
        ReasoningLoop loop("orchestrator", backend, delegates, options, 1);
        RunOutcome out = loop.run("slow then fast");

        ASSERT(out.status == RunStatus::Final);
        ASSERT(fast_calls == 1);
        ASSERT(out.trace.size() == 3);
        if (out.trace.size() == 3) {
            ASSERT(!out.trace[0].outcome_ok);
            ASSERT(out.trace[0].outcome.rfind("Error (timeout): ", 0) == 0);
            ASSERT(out.trace[1].outcome_ok);
            ASSERT(out.trace[1].outcome == "quick result");
        }
    }

    // --- wall-clock budget ---
    {
        DelegateRegistry delegates;
        delegates.register_delegate(answer_delegate("search", "more"));
        auto backend = std::make_shared<ScriptedBackend>();
        backend->push(make_tool_turn("search", {{"q", "x"}}));
        backend->set_delay_ms(30);

        LoopOptions options;
        options.max_iterations = 100;
        options.max_duration_ms = 100;
        ReasoningLoop loop("orchestrator", backend, delegates, options);
        RunOutcome out = loop.run("loop forever");
        ASSERT(out.status == RunStatus::BudgetExceeded);
        ASSERT(out.trace.size() < 100);
    }

    // --- slow backend bounded by backend_timeout_ms ---
    {
        DelegateRegistry delegates;
        auto backend = std::make_shared<ScriptedBackend>();
        backend->push(make_answer_turn("too late"));
        backend->set_delay_ms(300);

        LoopOptions options;
        options.backend_timeout_ms = 50;
        ReasoningLoop loop("orchestrator", backend, delegates, options);
        RunOutcome out = loop.run("hurry");
        ASSERT(out.status == RunStatus::Error);
        ASSERT(out.error.type == ErrorType::Timeout);
        // The abandoned backend call is still running and tracked
        ASSERT(detached_work_count() >= 1);
    }

    // Abandoned delegate and backend calls return before teardown
    ASSERT(wait_for_detached_work(2000));

    if (failed) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "All reasoning loop tests passed.\n";
    return 0;
}
