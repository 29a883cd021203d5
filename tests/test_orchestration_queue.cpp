/**
 * Orchestration queue: FIFO order, one running request, cancellation,
 * capacity, progress event ordering and wait semantics.
 *
 * Run from build dir: ./test_orchestration_queue
 */

#include "test_support.h"
#include "delegate.h"
#include "delegate_registry.h"
#include "orchestration_queue.h"
#include "reasoning_loop.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

using namespace conductor;
using test_support::ScriptedBackend;
using test_support::sleep_ms;

namespace {

std::atomic<bool> g_gate_open{false};
std::atomic<int> g_active{0};
std::atomic<int> g_max_active{0};
std::mutex g_started_mutex;
std::vector<std::string> g_started;
std::vector<std::string> g_last_media;

/// Request text picks the behavior
Result<Turn> scripted_turn(const ReasoningContext& ctx) {
    int now_active = ++g_active;
    int seen = g_max_active.load();
    while (now_active > seen && !g_max_active.compare_exchange_weak(seen, now_active)) {}

    if (ctx.iteration == 1) {
        std::lock_guard<std::mutex> lock(g_started_mutex);
        g_started.push_back(ctx.input);
        g_last_media = ctx.media;
    }

    Result<Turn> turn = make_answer_turn("echo: " + ctx.input);
    if (ctx.input == "block") {
        while (!g_gate_open.load()) sleep_ms(5);
        turn = make_answer_turn("unblocked");
    } else if (ctx.input == "search") {
        turn = ctx.trace.empty() ? make_tool_turn("search", {{"q", "x"}})
                                 : make_answer_turn("found " + ctx.trace.back().outcome);
    } else if (ctx.input == "fail") {
        turn = make_network_error("model server unreachable");
    } else if (ctx.input == "long") {
        turn = make_tool_turn("nap", nlohmann::json::object());
    } else {
        sleep_ms(20);
    }

    --g_active;
    return turn;
}

std::vector<std::string> started_inputs() {
    std::lock_guard<std::mutex> lock(g_started_mutex);
    return g_started;
}

bool wait_for_running(OrchestrationQueue& queue, const std::string& id) {
    for (int i = 0; i < 400; ++i) {
        if (queue.running_id() == id) return true;
        sleep_ms(5);
    }
    return false;
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::WARN);

    DelegateRegistry delegates;
    delegates.register_delegate(std::make_shared<FunctionDelegate>("search", "Finds 42",
        [](const nlohmann::json&) { return DelegateResult::success_result("42"); }));
    delegates.register_delegate(std::make_shared<FunctionDelegate>("nap", "Sleeps briefly",
        [](const nlohmann::json&) {
            sleep_ms(30);
            return DelegateResult::success_result("rested");
        }));

    auto backend = std::make_shared<ScriptedBackend>(scripted_turn);
    LoopOptions loop_options;
    loop_options.max_iterations = 1000;
    ReasoningLoop loop("orchestrator", backend, delegates, loop_options);

    // --- not started: submissions are refused ---
    {
        OrchestrationQueue idle(loop);
        auto refused = idle.submit("hello");
        ASSERT(refused.is_error() && refused.error().type == ErrorType::InvalidState);
    }

    // --- FIFO, one at a time ---
    {
        g_started.clear();
        g_max_active = 0;
        OrchestrationQueue queue(loop);
        queue.start();
        ASSERT(queue.is_running());

        auto empty = queue.submit("   ");
        ASSERT(empty.is_error() && empty.error().type == ErrorType::EmptyInput);

        std::vector<std::string> ids;
        for (const char* text : {"first", "second", "third"}) {
            auto id = queue.submit(text);
            ASSERT(id.is_ok());
            if (id.is_ok()) ids.push_back(id.value());
        }
        ASSERT(ids.size() == 3);
        ASSERT(ids[0] == "req-1" && ids[1] == "req-2" && ids[2] == "req-3");

        for (size_t i = 0; i < ids.size(); ++i) {
            auto record = queue.wait(ids[i], 5000);
            ASSERT(record.is_ok());
            if (record.is_ok()) {
                ASSERT(record.value().status == RequestStatus::Succeeded);
                ASSERT(record.value().trace.size() == 1);
            }
        }
        RequestInput with_image;
        with_image.text = "what is in this picture";
        with_image.media = {"https://example.com/cat.png"};
        auto pictured = queue.submit(with_image);
        ASSERT(pictured.is_ok());
        auto pictured_record = queue.wait(pictured.value(), 5000);
        ASSERT(pictured_record.is_ok() &&
               pictured_record.value().result_text == "echo: what is in this picture");
        {
            std::lock_guard<std::mutex> lock(g_started_mutex);
            ASSERT(g_last_media.size() == 1 && g_last_media[0] == "https://example.com/cat.png");
            g_started.pop_back();
        }

        auto first = queue.snapshot(ids[0]);
        ASSERT(first.has_value() && first->result_text == "echo: first");

        auto order = started_inputs();
        ASSERT(order.size() == 3);
        ASSERT(order[0] == "first" && order[1] == "second" && order[2] == "third");
        ASSERT(g_max_active.load() == 1);

        auto again = queue.cancel(ids[0]);
        ASSERT(again.is_error() && again.error().type == ErrorType::InvalidState);
        auto unknown = queue.cancel("req-999");
        ASSERT(unknown.is_error() && unknown.error().type == ErrorType::UnknownRequest);
        auto unknown_wait = queue.wait("req-999", 10);
        ASSERT(unknown_wait.is_error() && unknown_wait.error().type == ErrorType::UnknownRequest);

        queue.stop();
        ASSERT(!queue.is_running());
    }

    // --- progress events arrive in transition order ---
    {
        OrchestrationQueue queue(loop);
        std::mutex events_mutex;
        std::vector<ProgressEvent> events;
        queue.subscribe([&](const ProgressEvent& e) {
            std::lock_guard<std::mutex> lock(events_mutex);
            events.push_back(e);
        });
        queue.start();

        auto id = queue.submit("search");
        ASSERT(id.is_ok());
        auto record = queue.wait(id.value(), 5000);
        ASSERT(record.is_ok() && record.value().result_text == "found 42");
        ASSERT(queue.drain_events(2000));

        std::lock_guard<std::mutex> lock(events_mutex);
        ASSERT(events.size() == 6);
        if (events.size() == 6) {
            ASSERT(events[0].kind == EventKind::Status && events[0].status == RequestStatus::Queued);
            ASSERT(events[1].kind == EventKind::Status && events[1].status == RequestStatus::Running);
            ASSERT(events[2].kind == EventKind::Turn && events[2].turn.has_value());
            ASSERT(events[2].turn->call.delegate == "search");
            ASSERT(events[3].kind == EventKind::Turn);
            ASSERT(events[4].kind == EventKind::Result && events[4].text == "found 42");
            ASSERT(events[5].is_terminal_status());
            ASSERT(events[5].status == RequestStatus::Succeeded);
            for (size_t i = 0; i < events.size(); ++i) {
                ASSERT(events[i].request_id == id.value());
                ASSERT(events[i].sequence == i + 1);
            }
            ASSERT(events[4].to_json()["type"] == "chat_response");
        }
        queue.stop();
    }

    // --- failing request is reported with its reason ---
    {
        OrchestrationQueue queue(loop);
        std::vector<ProgressEvent> errors;
        std::mutex errors_mutex;
        queue.start();
        auto id = queue.submit("fail");
        ASSERT(id.is_ok());
        queue.subscribe([&](const ProgressEvent& e) {
            if (e.kind != EventKind::Error) return;
            std::lock_guard<std::mutex> lock(errors_mutex);
            errors.push_back(e);
        }, id.value());
        auto record = queue.wait(id.value(), 5000);
        ASSERT(record.is_ok());
        if (record.is_ok()) {
            ASSERT(record.value().status == RequestStatus::Failed);
            ASSERT(record.value().error.type == ErrorType::NetworkError);
            ASSERT(record.value().error.message == "model server unreachable");
        }
        ASSERT(queue.drain_events(2000));
        std::lock_guard<std::mutex> lock(errors_mutex);
        // Subscription may have raced the error; when seen it carries the reason
        for (const auto& e : errors) {
            ASSERT(e.text == "model server unreachable");
            ASSERT(e.error_type == "network_error");
        }
        queue.stop();
    }

    // --- cancel a queued request, capacity, wait timeout ---
    {
        g_gate_open = false;
        g_started.clear();
        QueueOptions options;
        options.capacity = 1;
        OrchestrationQueue queue(loop, options);
        queue.start();

        auto blocker = queue.submit("block");
        ASSERT(blocker.is_ok());
        ASSERT(wait_for_running(queue, blocker.value()));

        auto queued = queue.submit("queued work");
        ASSERT(queued.is_ok());
        ASSERT(queue.depth() == 1);

        auto overflow = queue.submit("one too many");
        ASSERT(overflow.is_error() && overflow.error().type == ErrorType::QueueFull);

        auto pending = queue.wait(blocker.value(), 50);
        ASSERT(pending.is_error() && pending.error().type == ErrorType::Timeout);

        ASSERT(queue.cancel(queued.value()).is_ok());
        auto snapshot = queue.snapshot(queued.value());
        ASSERT(snapshot.has_value() && snapshot->status == RequestStatus::Cancelled);
        ASSERT(queue.depth() == 0);

        g_gate_open = true;
        auto done = queue.wait(blocker.value(), 5000);
        ASSERT(done.is_ok() && done.value().status == RequestStatus::Succeeded);
        ASSERT(done.is_ok() && done.value().result_text == "unblocked");

        auto order = started_inputs();
        ASSERT(order.size() == 1 && order[0] == "block");
        queue.stop();
    }

    // --- cancel the running request at a Turn boundary ---
    {
        OrchestrationQueue queue(loop);
        queue.start();
        auto id = queue.submit("long");
        ASSERT(id.is_ok());
        ASSERT(wait_for_running(queue, id.value()));
        sleep_ms(80);
        ASSERT(queue.cancel(id.value()).is_ok());

        auto record = queue.wait(id.value(), 5000);
        ASSERT(record.is_ok());
        if (record.is_ok()) {
            ASSERT(record.value().status == RequestStatus::Cancelled);
            ASSERT(record.value().error.type == ErrorType::Cancelled);
            ASSERT(!record.value().trace.empty());
        }
        queue.stop();
    }

    // --- stop cancels whatever is still queued ---
    {
        g_gate_open = false;
        OrchestrationQueue queue(loop);
        queue.start();
        auto blocker = queue.submit("block");
        ASSERT(wait_for_running(queue, blocker.value()));
        auto waiting = queue.submit("never runs");
        ASSERT(waiting.is_ok());

        std::thread opener([] {
            sleep_ms(50);
            g_gate_open = true;
        });
        queue.stop();
        opener.join();

        auto record = queue.snapshot(waiting.value());
        ASSERT(record.has_value() && record->status == RequestStatus::Cancelled);
        auto finished = queue.snapshot(blocker.value());
        ASSERT(finished.has_value() && finished->status == RequestStatus::Succeeded);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "All orchestration queue tests passed.\n";
    return 0;
}
