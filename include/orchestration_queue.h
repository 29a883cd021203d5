#pragma once

#include "errors.h"
#include "request.h"
#include "progress_event.h"
#include "reasoning_loop.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace conductor {

struct QueueOptions {
    size_t capacity = 0;           ///< Max queued (not running) requests; 0 = unbounded
    size_t retain_completed = 100; ///< Terminal records kept after their terminal event
};

/**
 * @brief Single-worker FIFO in front of the reasoning loop
 *
 * submit() never blocks on the running request. Exactly one request runs at
 * a time, in submission order. Every status transition and every Turn is
 * published as a ProgressEvent: events are enqueued atomically with the
 * transition and delivered in order on a dispatcher thread, so callbacks
 * may call back into the queue.
 *
 * Cancellation of a queued request is immediate; for the running request it
 * is cooperative and takes effect at the next Turn boundary.
 */
class OrchestrationQueue {
public:
    /**
     * @param loop Reasoning loop that runs each request; must outlive the queue
     */
    explicit OrchestrationQueue(ReasoningLoop& loop, QueueOptions options = QueueOptions());

    /**
     * @brief Destructor - stops the queue if still running
     */
    ~OrchestrationQueue();

    // Non-copyable
    OrchestrationQueue(const OrchestrationQueue&) = delete;
    OrchestrationQueue& operator=(const OrchestrationQueue&) = delete;

    /**
     * @brief Start the worker and dispatcher threads
     */
    void start();

    /**
     * @brief Cancel every queued request, let the running one finish, join threads
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Enqueue a request
     * @return Request id, QueueFull when at capacity, InvalidState when stopped,
     *         EmptyInput for blank text
     */
    Result<std::string> submit(const RequestInput& input);
    Result<std::string> submit(const std::string& text);

    /**
     * @brief Cancel a request
     * @return UnknownRequest if the id is not known, InvalidState if already terminal
     */
    VoidResult cancel(const std::string& request_id);

    /**
     * @brief Copy of the current record, if retained
     */
    std::optional<RequestRecord> snapshot(const std::string& request_id) const;

    /**
     * @brief Block until the request is terminal
     * @param timeout_ms 0 = wait indefinitely
     * @return Terminal record, Timeout if still pending, UnknownRequest if not known
     */
    Result<RequestRecord> wait(const std::string& request_id, int timeout_ms = 0);

    /**
     * @brief Id of the running request, empty when idle
     */
    std::string running_id() const;

    /**
     * @brief Number of queued (not yet running) requests
     */
    size_t depth() const;

    /**
     * @brief Subscribe to progress events
     * @param request_filter Only events for this id; empty = all requests
     * @return Subscription id for unsubscribe()
     */
    uint64_t subscribe(EventCallback callback, const std::string& request_filter = "");

    void unsubscribe(uint64_t subscription_id);

    /**
     * @brief Wait until every published event has been delivered
     * @return false on timeout
     */
    bool drain_events(int timeout_ms = 0);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace conductor
