#include "delegate_executor.h"
#include "core/deadline.h"
#include "logger.h"
#include <algorithm>
#include <chrono>

namespace conductor {

/// Shared between execute_sync and the worker so an abandoned call never touches a dead frame
struct DelegateExecutor::SyncTicket {
    std::mutex mutex;
    std::condition_variable cv;
    bool started = false;      ///< A worker popped the task (set under queue_mutex_)
    bool completed = false;
    bool abandoned = false;
    std::thread::id worker;
    DelegateResult result;
};

DelegateExecutor::DelegateExecutor(size_t max_concurrent)
    : max_concurrent_(max_concurrent == 0 ? 1 : max_concurrent), running_(true), active_executions_(0) {

    for (size_t i = 0; i < max_concurrent_; ++i) {
        worker_threads_.emplace_back(&DelegateExecutor::worker_thread, this);
    }
}

DelegateExecutor::~DelegateExecutor() {
    shutdown();

    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        workers.swap(worker_threads_);
    }
    for (auto& thread : workers) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool DelegateExecutor::enqueue(ExecutionTask task) {
    if (!task.delegate) {
        Logger::error("DelegateExecutor: null delegate");
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_) {
            Logger::warn("DelegateExecutor is shut down, cannot invoke: " + task.delegate->name());
            return false;
        }
        task.start_time = std::chrono::steady_clock::now();
        task_queue_.push(std::move(task));
    }
    queue_cv_.notify_one();
    return true;
}

bool DelegateExecutor::execute_async(std::shared_ptr<Delegate> delegate,
                                     const nlohmann::json& args,
                                     DelegateCallback callback,
                                     int timeout_ms) {
    ExecutionTask task;
    task.delegate = std::move(delegate);
    task.args = args;
    task.callback = std::move(callback);
    task.timeout_ms = timeout_ms;
    return enqueue(std::move(task));
}

DelegateResult DelegateExecutor::execute_sync(std::shared_ptr<Delegate> delegate,
                                              const nlohmann::json& args,
                                              int timeout_ms) {
    std::string name = delegate ? delegate->name() : "<null>";
    auto ticket = std::make_shared<SyncTicket>();

    ExecutionTask task;
    task.delegate = std::move(delegate);
    task.args = args;
    task.ticket = ticket;
    task.timeout_ms = timeout_ms;
    if (!enqueue(std::move(task))) {
        return DelegateResult::error_result("failed to queue invocation of " + name, "unavailable");
    }

    {
        std::unique_lock<std::mutex> lock(ticket->mutex);
        if (timeout_ms <= 0) {
            ticket->cv.wait(lock, [&] { return ticket->completed; });
            return ticket->result;
        }
        if (ticket->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                [&] { return ticket->completed; })) {
            return ticket->result;
        }
    }

    if (abandon(ticket)) {
        std::lock_guard<std::mutex> lock(ticket->mutex);
        return ticket->result;
    }
    LOG_DELEGATE(name + " timed out after " + std::to_string(timeout_ms) + "ms");
    return DelegateResult::error_result(
        name + " did not finish within " + std::to_string(timeout_ms) + "ms", "timeout");
}

bool DelegateExecutor::abandon(const std::shared_ptr<SyncTicket>& ticket) {
    std::lock_guard<std::mutex> queue_lock(queue_mutex_);
    std::lock_guard<std::mutex> lock(ticket->mutex);
    if (ticket->completed) {
        return true;
    }
    ticket->abandoned = true;
    ++abandoned_;
    if (!ticket->started) {
        // Still queued: the worker that pops it skips it
        return false;
    }

    auto it = std::find_if(worker_threads_.begin(), worker_threads_.end(),
                           [&](const std::thread& t) { return t.get_id() == ticket->worker; });
    if (it != worker_threads_.end()) {
        detached_work_begin();
        it->detach();
        worker_threads_.erase(it);
    }
    active_executions_--;
    if (running_) {
        worker_threads_.emplace_back(&DelegateExecutor::worker_thread, this);
    }
    return false;
}

bool DelegateExecutor::is_idle() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.empty() && active_executions_ == 0;
}

size_t DelegateExecutor::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size() + active_executions_;
}

size_t DelegateExecutor::abandoned_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return abandoned_;
}

void DelegateExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
}

void DelegateExecutor::worker_thread() {
    while (true) {
        ExecutionTask task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !task_queue_.empty() || !running_;
            });

            if (!running_ && task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            if (task.ticket) {
                std::lock_guard<std::mutex> ticket_lock(task.ticket->mutex);
                if (task.ticket->abandoned) {
                    continue;
                }
                task.ticket->started = true;
                task.ticket->worker = std::this_thread::get_id();
            }
            active_executions_++;
        }

        DelegateResult result = run_task(task);

        if (task.ticket) {
            bool discarded = false;
            {
                std::lock_guard<std::mutex> ticket_lock(task.ticket->mutex);
                if (task.ticket->abandoned) {
                    discarded = true;
                } else {
                    task.ticket->result = result;
                    task.ticket->completed = true;
                    task.ticket->cv.notify_one();
                }
            }
            if (discarded) {
                // Detached from the pool: the executor may already be gone
                LOG_DELEGATE(task.delegate->name() + " finished after its caller gave up; result discarded");
                task = ExecutionTask();
                detached_work_end();
                return;
            }
        } else if (task.callback) {
            task.callback(result);
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_executions_--;
        }
    }
}

DelegateResult DelegateExecutor::run_task(const ExecutionTask& task) {
    const std::string name = task.delegate->name();

    // Deadline passed while queued behind another call
    if (task.timeout_ms > 0) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - task.start_time).count();
        if (elapsed >= task.timeout_ms) {
            return DelegateResult::error_result(name + " expired before it started", "timeout");
        }
    }

    DelegateResult result;
    try {
        result = task.delegate->invoke(task.args);
    } catch (const std::exception& e) {
        Logger::error("Delegate exception for " + name + ": " + e.what());
        result = DelegateResult::error_result("Error executing " + name + ": " + e.what(), "exception");
    } catch (...) {
        Logger::error("Unknown exception during delegate invocation: " + name);
        result = DelegateResult::error_result("Error executing " + name + ": unknown exception", "exception");
    }

    if (!result.success && result.error_code.empty()) {
        result.error_code = "failure";
    }
    return result;
}

} // namespace conductor
