#include "orchestration_queue.h"
#include "logger.h"
#include "utils.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace conductor {

class OrchestrationQueue::Impl {
public:
    Impl(ReasoningLoop& loop, QueueOptions options)
        : loop_(loop), options_(options) {}

    ~Impl() {
        stop();
    }

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return;
        running_ = true;
        stopping_ = false;
        dispatching_ = true;
        dispatcher_ = std::thread(&Impl::dispatcher_thread, this);
        worker_ = std::thread(&Impl::worker_thread, this);
        LOG_QUEUE("Started (capacity=" +
                  (options_.capacity == 0 ? std::string("unbounded") : std::to_string(options_.capacity)) + ")");
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            stopping_ = true;
            for (const auto& id : pending_) {
                auto it = entries_.find(id);
                if (it != entries_.end() && it->second.record.status == RequestStatus::Queued) {
                    finish_locked(it->second, RequestStatus::Cancelled,
                                  make_error(ErrorType::Cancelled, "queue stopped before the request started"));
                }
            }
            pending_.clear();
        }
        work_cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }

        drain_events(0);
        {
            std::lock_guard<std::mutex> lock(events_mutex_);
            dispatching_ = false;
        }
        events_cv_.notify_all();
        if (dispatcher_.joinable()) {
            dispatcher_.join();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
        LOG_QUEUE("Stopped");
    }

    bool is_running() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_ && !stopping_;
    }

    Result<std::string> submit(const RequestInput& input) {
        if (utils::is_empty_or_whitespace(input.text) && input.media.empty()) {
            return make_error(ErrorType::EmptyInput, "request text is empty");
        }

        std::string id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_ || stopping_) {
                return make_error(ErrorType::InvalidState, "queue is not accepting requests");
            }
            if (options_.capacity > 0 && pending_.size() >= options_.capacity) {
                LOG_QUEUE("Rejecting request: queue full (" + std::to_string(pending_.size()) + ")");
                return make_error(ErrorType::QueueFull,
                                  "queue is full (" + std::to_string(options_.capacity) + " queued requests)");
            }

            id = "req-" + std::to_string(++next_id_);
            Entry& entry = entries_[id];
            entry.record.id = id;
            entry.record.input = input;
            entry.record.status = RequestStatus::Queued;
            entry.record.submitted_at = WallClock::now();
            entry.cancel = make_cancel_token();
            pending_.push_back(id);

            publish_locked(entry, EventKind::Status, "queued at position " + std::to_string(pending_.size()));
        }
        LOG_QUEUE("Submitted " + id);
        work_cv_.notify_one();
        return id;
    }

    VoidResult cancel(const std::string& request_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(request_id);
        if (it == entries_.end()) {
            return make_error(ErrorType::UnknownRequest, "unknown request: " + request_id);
        }
        Entry& entry = it->second;
        switch (entry.record.status) {
            case RequestStatus::Queued:
                for (auto p = pending_.begin(); p != pending_.end(); ++p) {
                    if (*p == request_id) {
                        pending_.erase(p);
                        break;
                    }
                }
                finish_locked(entry, RequestStatus::Cancelled,
                              make_error(ErrorType::Cancelled, "cancelled before it started"));
                LOG_QUEUE("Cancelled queued " + request_id);
                return VoidResult();
            case RequestStatus::Running:
                entry.cancel->store(true);
                publish_locked(entry, EventKind::Status, "cancellation requested");
                LOG_QUEUE("Cancellation requested for running " + request_id);
                return VoidResult();
            default:
                return make_error(ErrorType::InvalidState,
                                  request_id + " is already " + request_status_name(entry.record.status));
        }
    }

    std::optional<RequestRecord> snapshot(const std::string& request_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(request_id);
        if (it == entries_.end()) return std::nullopt;
        return it->second.record;
    }

    Result<RequestRecord> wait(const std::string& request_id, int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto done = [&] {
            auto it = entries_.find(request_id);
            return it == entries_.end() || is_terminal(it->second.record.status);
        };
        if (entries_.find(request_id) == entries_.end()) {
            return make_error(ErrorType::UnknownRequest, "unknown request: " + request_id);
        }
        if (timeout_ms > 0) {
            if (!done_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), done)) {
                return make_timeout_error(request_id + " not finished after " + std::to_string(timeout_ms) + "ms");
            }
        } else {
            done_cv_.wait(lock, done);
        }
        auto it = entries_.find(request_id);
        if (it == entries_.end()) {
            return make_error(ErrorType::UnknownRequest, request_id + " is no longer retained");
        }
        return it->second.record;
    }

    std::string running_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return running_id_;
    }

    size_t depth() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    uint64_t subscribe(EventCallback callback, const std::string& request_filter) {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        uint64_t id = ++next_subscription_;
        subscribers_[id] = Subscriber{std::move(callback), request_filter};
        return id;
    }

    void unsubscribe(uint64_t subscription_id) {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        subscribers_.erase(subscription_id);
    }

    bool drain_events(int timeout_ms) {
        std::unique_lock<std::mutex> lock(events_mutex_);
        auto idle = [this] { return events_.empty() && !delivering_; };
        if (timeout_ms > 0) {
            return drained_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
        }
        drained_cv_.wait(lock, idle);
        return true;
    }

private:
    struct Entry {
        RequestRecord record;
        CancelToken cancel;
        uint64_t next_sequence = 1;
    };

    struct Subscriber {
        EventCallback callback;
        std::string filter;
    };

    void worker_thread() {
        while (true) {
            std::string id;
            RequestInput input;
            CancelToken cancel;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                work_cv_.wait(lock, [this] { return !pending_.empty() || stopping_; });
                if (pending_.empty()) {
                    break;  // stopping
                }
                id = pending_.front();
                pending_.pop_front();

                auto it = entries_.find(id);
                if (it == entries_.end() || it->second.record.status != RequestStatus::Queued) {
                    continue;
                }
                Entry& entry = it->second;
                entry.record.status = RequestStatus::Running;
                entry.record.started_at = WallClock::now();
                running_id_ = id;
                input = entry.record.input;
                cancel = entry.cancel;
                publish_locked(entry, EventKind::Status, "running");
            }

            RunOutcome outcome;
            {
                ScopedLogContext log_context(id);
                LOG_QUEUE("Running " + id);
                outcome = execute(id, input, cancel);
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                running_id_.clear();
                auto it = entries_.find(id);
                if (it == entries_.end()) continue;
                Entry& entry = it->second;
                entry.record.trace = outcome.trace;

                switch (outcome.status) {
                    case RunStatus::Final:
                        entry.record.result_text = outcome.final_text;
                        finish_locked(entry, RequestStatus::Succeeded, Error());
                        break;
                    case RunStatus::Cancelled:
                        finish_locked(entry, RequestStatus::Cancelled, outcome.error);
                        break;
                    case RunStatus::Error:
                    case RunStatus::BudgetExceeded:
                        finish_locked(entry, RequestStatus::Failed, outcome.error);
                        break;
                }
            }
            LOG_QUEUE("Finished " + id + " (" + run_status_name(outcome.status) + ")");
        }
    }

    RunOutcome execute(const std::string& id, const RequestInput& input, const CancelToken& cancel) {
        RunHooks hooks;
        hooks.trace_id = id;
        hooks.cancel = cancel;
        hooks.on_turn = [this, id](const Turn& turn) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(id);
            if (it == entries_.end()) return;
            it->second.record.trace.push_back(turn);
            publish_locked(it->second, EventKind::Turn, "", &turn);
        };

        hooks.media = input.media;

        try {
            return loop_.run(input.text, hooks);
        } catch (const std::exception& e) {
            Logger::error("Reasoning loop threw for " + id + ": " + e.what());
            RunOutcome outcome;
            outcome.status = RunStatus::Error;
            outcome.error = make_error(ErrorType::Unknown, std::string("reasoning loop failed: ") + e.what());
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(id);
            if (it != entries_.end()) outcome.trace = it->second.record.trace;
            return outcome;
        }
    }

    /// Terminal transition; caller holds mutex_
    void finish_locked(Entry& entry, RequestStatus status, const Error& error) {
        entry.record.status = status;
        entry.record.error = error;
        entry.record.finished_at = WallClock::now();
        if (status == RequestStatus::Succeeded) {
            publish_locked(entry, EventKind::Result, entry.record.result_text);
        } else {
            std::string reason = error.message.empty() ? request_status_name(status) : error.message;
            publish_locked(entry, EventKind::Error, reason);
        }
        publish_locked(entry, EventKind::Status, request_status_name(status));
        done_cv_.notify_all();
    }

    /// Caller holds mutex_, so sequence order equals transition order
    void publish_locked(Entry& entry, EventKind kind, const std::string& text, const Turn* turn = nullptr) {
        ProgressEvent event;
        event.request_id = entry.record.id;
        event.sequence = entry.next_sequence++;
        event.kind = kind;
        event.status = entry.record.status;
        event.text = text;
        event.timestamp = utc_timestamp();
        if (turn) event.turn = *turn;
        if (kind == EventKind::Error) {
            event.error_type = error_type_name(entry.record.error.type);
        }
        LOG_TRACE(event.request_id, event_kind_name(kind),
                  std::string("seq=") + std::to_string(event.sequence) + " status=" + request_status_name(event.status));
        {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(std::move(event));
        }
        events_cv_.notify_one();
    }

    void dispatcher_thread() {
        while (true) {
            ProgressEvent event;
            {
                std::unique_lock<std::mutex> lock(events_mutex_);
                events_cv_.wait(lock, [this] { return !events_.empty() || !dispatching_; });
                if (events_.empty()) {
                    break;
                }
                event = std::move(events_.front());
                events_.pop_front();
                delivering_ = true;
            }

            deliver(event);
            if (event.is_terminal_status()) {
                retain(event.request_id);
            }

            {
                std::lock_guard<std::mutex> lock(events_mutex_);
                delivering_ = false;
            }
            drained_cv_.notify_all();
        }
    }

    void deliver(const ProgressEvent& event) {
        std::vector<Subscriber> targets;
        {
            std::lock_guard<std::mutex> lock(subscribers_mutex_);
            for (const auto& [id, subscriber] : subscribers_) {
                if (subscriber.filter.empty() || subscriber.filter == event.request_id) {
                    targets.push_back(subscriber);
                }
            }
        }
        for (const auto& subscriber : targets) {
            try {
                subscriber.callback(event);
            } catch (const std::exception& e) {
                Logger::error(std::string("Progress subscriber threw: ") + e.what());
            }
        }
    }

    /// Terminal event delivered; drop the oldest terminal records beyond the retention limit
    void retain(const std::string& request_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        terminal_order_.push_back(request_id);
        while (terminal_order_.size() > options_.retain_completed) {
            entries_.erase(terminal_order_.front());
            terminal_order_.pop_front();
        }
    }

    ReasoningLoop& loop_;
    QueueOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable done_cv_;
    std::unordered_map<std::string, Entry> entries_;
    std::deque<std::string> pending_;
    std::deque<std::string> terminal_order_;
    std::string running_id_;
    uint64_t next_id_ = 0;
    bool running_ = false;
    bool stopping_ = false;

    std::mutex events_mutex_;
    std::condition_variable events_cv_;
    std::condition_variable drained_cv_;
    std::deque<ProgressEvent> events_;
    bool delivering_ = false;
    bool dispatching_ = false;

    std::mutex subscribers_mutex_;
    std::map<uint64_t, Subscriber> subscribers_;
    uint64_t next_subscription_ = 0;

    std::thread worker_;
    std::thread dispatcher_;
};

OrchestrationQueue::OrchestrationQueue(ReasoningLoop& loop, QueueOptions options)
    : pimpl_(std::make_unique<Impl>(loop, options)) {}

OrchestrationQueue::~OrchestrationQueue() = default;

void OrchestrationQueue::start() {
    pimpl_->start();
}

void OrchestrationQueue::stop() {
    pimpl_->stop();
}

bool OrchestrationQueue::is_running() const {
    return pimpl_->is_running();
}

Result<std::string> OrchestrationQueue::submit(const RequestInput& input) {
    return pimpl_->submit(input);
}

Result<std::string> OrchestrationQueue::submit(const std::string& text) {
    RequestInput input;
    input.text = text;
    return pimpl_->submit(input);
}

VoidResult OrchestrationQueue::cancel(const std::string& request_id) {
    return pimpl_->cancel(request_id);
}

std::optional<RequestRecord> OrchestrationQueue::snapshot(const std::string& request_id) const {
    return pimpl_->snapshot(request_id);
}

Result<RequestRecord> OrchestrationQueue::wait(const std::string& request_id, int timeout_ms) {
    return pimpl_->wait(request_id, timeout_ms);
}

std::string OrchestrationQueue::running_id() const {
    return pimpl_->running_id();
}

size_t OrchestrationQueue::depth() const {
    return pimpl_->depth();
}

uint64_t OrchestrationQueue::subscribe(EventCallback callback, const std::string& request_filter) {
    return pimpl_->subscribe(std::move(callback), request_filter);
}

void OrchestrationQueue::unsubscribe(uint64_t subscription_id) {
    pimpl_->unsubscribe(subscription_id);
}

bool OrchestrationQueue::drain_events(int timeout_ms) {
    return pimpl_->drain_events(timeout_ms);
}

} // namespace conductor
