#pragma once

#include "delegate.h"
#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <queue>
#include <chrono>
#include <condition_variable>

namespace conductor {

/**
 * @brief Callback type for delegate completion
 */
using DelegateCallback = std::function<void(const DelegateResult&)>;

/**
 * @brief Runs delegate invocations on a worker pool with per-call timeouts
 *
 * execute_sync races the call against its deadline. When the deadline wins
 * the caller gets a "timeout" failure immediately; the worker running the
 * abandoned call is detached from the pool and a replacement is started, so
 * a hung delegate never holds a slot that later calls wait on. The detached
 * thread finishes the call in the background and discards its result.
 * Tasks whose deadline passed while still queued are not started.
 */
class DelegateExecutor {
public:
    /**
     * @param max_concurrent Number of worker threads (at least 1)
     */
    explicit DelegateExecutor(size_t max_concurrent = 1);

    /**
     * @brief Destructor - stops accepting work and joins pool workers.
     * Detached workers running abandoned calls are not waited for.
     */
    ~DelegateExecutor();

    // Non-copyable
    DelegateExecutor(const DelegateExecutor&) = delete;
    DelegateExecutor& operator=(const DelegateExecutor&) = delete;

    /**
     * @brief Queue an invocation
     * @param timeout_ms Skip the call if it has not started within this window (0 = no limit)
     * @return false if the executor is shut down or delegate is null
     */
    bool execute_async(std::shared_ptr<Delegate> delegate,
                       const nlohmann::json& args,
                       DelegateCallback callback,
                       int timeout_ms = 0);

    /**
     * @brief Invoke and wait for the result or the deadline
     * @param timeout_ms 0 = wait indefinitely
     */
    DelegateResult execute_sync(std::shared_ptr<Delegate> delegate,
                                const nlohmann::json& args,
                                int timeout_ms = 0);

    bool is_idle() const;

    /**
     * @brief Count of queued and executing invocations
     */
    size_t pending_count() const;

    /**
     * @brief Number of calls abandoned after their deadline since construction
     */
    size_t abandoned_count() const;

    /**
     * @brief Stop accepting new invocations
     */
    void shutdown();

private:
    struct SyncTicket;

    struct ExecutionTask {
        std::shared_ptr<Delegate> delegate;
        nlohmann::json args;
        DelegateCallback callback;
        std::shared_ptr<SyncTicket> ticket;  ///< Set for execute_sync calls
        int timeout_ms = 0;
        std::chrono::steady_clock::time_point start_time;
    };

    bool enqueue(ExecutionTask task);
    void worker_thread();
    DelegateResult run_task(const ExecutionTask& task);

    /// Give up on a timed-out sync call; returns true if it completed meanwhile
    bool abandon(const std::shared_ptr<SyncTicket>& ticket);

    size_t max_concurrent_;
    std::atomic<bool> running_;
    std::atomic<size_t> active_executions_;
    size_t abandoned_ = 0;  ///< Guarded by queue_mutex_

    std::queue<ExecutionTask> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;

    std::vector<std::thread> worker_threads_;
};

} // namespace conductor
