#pragma once

/**
 * @file backend_registry.h
 * @brief Runtime-swappable provider set for one capability family
 *
 * Lifecycle per provider:
 *   registered -> initializing -> ready <-> degraded
 *                              \-> failed -> (reinitialize) -> initializing
 *
 * Selection is a shared_ptr held under the registry mutex: current() hands
 * out a copy, so a request that captured a provider keeps it alive and
 * finishes against it even if another caller swaps the selection.
 *
 * Health probes are cached per provider for Options::health_ttl_ms.
 */

#include "backend/backend_provider.h"
#include "common.h"
#include "errors.h"
#include "logger.h"
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace conductor {

template <typename Provider>
class BackendRegistry {
    static_assert(std::is_base_of<BackendProvider, Provider>::value,
                  "Provider must derive from BackendProvider");

public:
    struct Options {
        int select_timeout_ms = 60000;  ///< Bound on select() waiting for an initializing provider
        int health_ttl_ms = 5000;       ///< Probe cache lifetime
    };

    explicit BackendRegistry(std::string family, Options options = Options())
        : family_(std::move(family)), options_(options) {}

    /**
     * @brief Destructor - waits for outstanding preparation threads
     */
    ~BackendRegistry() {
        std::vector<std::shared_future<void>> tasks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks.swap(tasks_);
        }
        for (auto& task : tasks) {
            task.wait();
        }
    }

    // Non-copyable
    BackendRegistry(const BackendRegistry&) = delete;
    BackendRegistry& operator=(const BackendRegistry&) = delete;

    const std::string& family() const { return family_; }

    /**
     * @brief Add a provider under its id
     *
     * The first registered provider becomes the selection until
     * set_preferred() or select() says otherwise.
     * @return DuplicateBackend if the id is taken (the first registration stays)
     */
    VoidResult register_provider(std::shared_ptr<Provider> provider) {
        if (!provider) {
            return make_error(ErrorType::InvalidArgument, family_ + ": cannot register a null provider");
        }
        const std::string id = provider->id();
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.find(id) != entries_.end()) {
            return make_error(ErrorType::DuplicateBackend, family_ + " backend already registered: " + id);
        }
        Entry entry;
        entry.provider = std::move(provider);
        entry.state = BackendState::Registered;
        entries_.emplace(id, std::move(entry));
        order_.push_back(id);
        if (selected_.empty()) {
            selected_ = id;
        }
        LOG_REGISTRY(family_ + ": registered " + id);
        return VoidResult();
    }

    /**
     * @brief Choose the initial selection (process-preferred backend)
     *
     * Does not wait for readiness; initialize_all() falls back to a ready
     * provider if this one fails.
     */
    VoidResult set_preferred(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.find(id) == entries_.end()) {
            return make_error(ErrorType::UnknownBackend, unknown_message(id));
        }
        selected_ = id;
        return VoidResult();
    }

    /**
     * @brief Start preparation of every registered provider, concurrently
     *
     * Providers are independent: one failing never blocks the others. When
     * all have resolved, a failed selection falls back to the first ready
     * provider in registration order; if none is ready the selection stays
     * on the failed provider and failure_reason() explains why.
     * @return Future that becomes ready once every started preparation resolved
     */
    std::shared_future<void> initialize_all() {
        std::vector<std::shared_future<void>> batch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& id : order_) {
                Entry& entry = entries_.at(id);
                if (entry.state == BackendState::Registered) {
                    batch.push_back(start_preparation_locked(id, entry));
                } else if (entry.state == BackendState::Initializing && entry.task.valid()) {
                    batch.push_back(entry.task);
                }
            }
        }
        LOG_REGISTRY(family_ + ": initializing " + std::to_string(batch.size()) + " provider(s)");

        std::shared_future<void> done = std::async(std::launch::async, [this, batch]() {
            for (const auto& task : batch) {
                task.wait();
            }
            apply_fallback();
        }).share();

        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(done);
        return done;
    }

    /**
     * @brief Atomically switch the selection
     *
     * A registered provider has its preparation started; an initializing
     * one is waited for (up to timeout_ms) before deciding.
     * @return UnknownBackend, BackendNotReady (failed, selection unchanged),
     *         or Timeout (still initializing, selection unchanged)
     */
    VoidResult select(const std::string& id) {
        return select(id, options_.select_timeout_ms);
    }

    VoidResult select(const std::string& id, int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return make_error(ErrorType::UnknownBackend, unknown_message(id));
        }
        if (it->second.state == BackendState::Registered) {
            start_preparation_locked(id, it->second);
        }
        if (it->second.state == BackendState::Initializing) {
            LOG_REGISTRY(family_ + ": waiting for " + id + " to finish initializing");
            auto resolved = [&] { return entries_.at(id).state != BackendState::Initializing; };
            if (timeout_ms > 0) {
                if (!cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), resolved)) {
                    return make_timeout_error(family_ + " backend " + id + " still initializing after " +
                                              std::to_string(timeout_ms) + "ms");
                }
            } else {
                cv_.wait(lock, resolved);
            }
        }

        const Entry& entry = entries_.at(id);
        if (entry.state == BackendState::Failed) {
            std::string reason = entry.failure_reason.empty() ? "initialization failed" : entry.failure_reason;
            return make_error(ErrorType::BackendNotReady, family_ + " backend " + id + " is not ready: " + reason);
        }
        if (selected_ != id) {
            LOG_REGISTRY(family_ + ": selected " + id + " (was " + selected_ + ")");
        }
        selected_ = id;
        return VoidResult();
    }

    /**
     * @brief Selected provider; never blocks on readiness
     * @return nullptr only when nothing is registered
     */
    std::shared_ptr<Provider> current() const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(selected_);
        if (it == entries_.end()) return nullptr;
        return it->second.provider;
    }

    std::string selected_id() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return selected_;
    }

    BackendState state(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return BackendState::Unregistered;
        return it->second.state;
    }

    /**
     * @brief Why a provider is failed or degraded
     */
    std::optional<std::string> failure_reason(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return std::nullopt;
        const Entry& entry = it->second;
        if (entry.state == BackendState::Failed) return entry.failure_reason;
        if (entry.state == BackendState::Degraded) return entry.probe.reason;
        return std::nullopt;
    }

    /**
     * @brief Retry preparation of a failed provider (asynchronous)
     *
     * A provider that already prepared successfully is never prepared again.
     */
    VoidResult reinitialize(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return make_error(ErrorType::UnknownBackend, unknown_message(id));
        }
        Entry& entry = it->second;
        if (entry.state == BackendState::Failed || entry.state == BackendState::Registered) {
            LOG_REGISTRY(family_ + ": re-initializing " + id);
            start_preparation_locked(id, entry);
        }
        return VoidResult();
    }

    /**
     * @brief Block until the provider is no longer registered/initializing
     * @return Resolved state (Initializing on timeout)
     */
    BackendState wait_until_resolved(const std::string& id, int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return BackendState::Unregistered;
        auto resolved = [&] {
            BackendState s = entries_.at(id).state;
            return s != BackendState::Initializing && s != BackendState::Registered;
        };
        if (timeout_ms > 0) {
            cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), resolved);
        } else {
            cv_.wait(lock, resolved);
        }
        return entries_.at(id).state;
    }

    /**
     * @brief Per-provider health snapshot
     *
     * Prepared providers are probed when their cached probe is older than
     * health_ttl_ms; a failed probe marks them degraded and a passing one
     * ready again. Unprepared or failed providers are reported as-is.
     */
    std::vector<BackendStatus> health() {
        std::vector<std::pair<std::string, std::shared_ptr<Provider>>> stale;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const TimePoint now = Clock::now();
            for (const auto& id : order_) {
                const Entry& entry = entries_.at(id);
                bool prepared = entry.state == BackendState::Ready || entry.state == BackendState::Degraded;
                bool fresh = entry.probed &&
                    std::chrono::duration_cast<Duration>(now - entry.probed_at).count() < options_.health_ttl_ms;
                if (prepared && !fresh) {
                    stale.emplace_back(id, entry.provider);
                }
            }
        }

        // Probe outside the lock; probes may do I/O
        for (const auto& [id, provider] : stale) {
            HealthProbe probe;
            try {
                probe = provider->health_check();
            } catch (const std::exception& e) {
                probe = HealthProbe::unhealthy(std::string("health check raised: ") + e.what());
            }

            std::lock_guard<std::mutex> lock(mutex_);
            Entry& entry = entries_.at(id);
            entry.probe = probe;
            entry.probed = true;
            entry.probed_at = Clock::now();
            entry.probed_wall = WallClock::now();
            if (entry.state == BackendState::Ready && !probe.ready) {
                entry.state = BackendState::Degraded;
                LOG_REGISTRY(family_ + ": " + id + " degraded: " + probe.reason);
            } else if (entry.state == BackendState::Degraded && probe.ready) {
                entry.state = BackendState::Ready;
                LOG_REGISTRY(family_ + ": " + id + " recovered");
            }
        }

        return list();
    }

    /**
     * @brief Options listing in registration order (no probing)
     */
    std::vector<BackendStatus> list() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<BackendStatus> result;
        result.reserve(order_.size());
        for (const auto& id : order_) {
            const Entry& entry = entries_.at(id);
            BackendStatus status;
            status.id = id;
            status.display_name = entry.provider->display_name();
            status.description = entry.provider->description();
            status.state = entry.state;
            status.selected = (id == selected_);
            if (entry.state == BackendState::Failed) {
                status.reason = entry.failure_reason;
                status.remediation = entry.remediation;
            } else if (entry.probed) {
                status.reason = entry.probe.reason;
                status.remediation = entry.probe.remediation;
            }
            if (entry.probed) {
                status.checked_at = utc_timestamp(entry.probed_wall);
            }
            result.push_back(status);
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return order_.size();
    }

private:
    struct Entry {
        std::shared_ptr<Provider> provider;
        BackendState state = BackendState::Registered;
        std::string failure_reason;
        std::string remediation;
        std::shared_future<void> task;
        HealthProbe probe;
        bool probed = false;
        TimePoint probed_at;
        WallTime probed_wall;
    };

    /// Caller holds mutex_
    std::shared_future<void> start_preparation_locked(const std::string& id, Entry& entry) {
        entry.state = BackendState::Initializing;
        entry.failure_reason.clear();
        entry.remediation.clear();
        std::shared_ptr<Provider> provider = entry.provider;
        entry.task = std::async(std::launch::async, [this, id, provider]() {
            prepare_one(id, provider);
        }).share();
        tasks_.push_back(entry.task);
        return entry.task;
    }

    void prepare_one(const std::string& id, const std::shared_ptr<Provider>& provider) {
        LOG_REGISTRY(family_ + ": preparing " + id);
        const TimePoint started = Clock::now();
        VoidResult result;
        try {
            result = provider->prepare();
        } catch (const std::exception& e) {
            result = make_error(ErrorType::Unknown, std::string("prepare raised: ") + e.what());
        }

        HealthProbe probe;
        if (result.is_error()) {
            // Ask the provider for remediation text to accompany the failure
            try {
                probe = provider->health_check();
            } catch (const std::exception& e) {
                probe = HealthProbe::unhealthy(e.what());
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            Entry& entry = entries_.at(id);
            if (result.is_ok()) {
                entry.state = BackendState::Ready;
                LOG_REGISTRY(family_ + ": " + id + " ready (" + std::to_string(ms_since(started)) + "ms)");
            } else {
                entry.state = BackendState::Failed;
                entry.failure_reason = result.error().describe();
                entry.remediation = probe.remediation;
                Logger::warn("[Registry] " + family_ + ": " + id + " failed: " + entry.failure_reason);
            }
        }
        cv_.notify_all();
    }

    void apply_fallback() {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(selected_);
        if (it == entries_.end() || it->second.state != BackendState::Failed) {
            return;
        }
        for (const auto& id : order_) {
            if (entries_.at(id).state == BackendState::Ready) {
                Logger::warn("[Registry] " + family_ + ": " + selected_ + " failed, falling back to " + id);
                selected_ = id;
                return;
            }
        }
        Logger::warn("[Registry] " + family_ + ": no ready provider; selection stays on " + selected_ +
                     " (" + it->second.failure_reason + ")");
    }

    std::string unknown_message(const std::string& id) const {
        std::string known;
        for (const auto& name : order_) {
            if (!known.empty()) known += ", ";
            known += name;
        }
        return "unknown " + family_ + " backend: " + id + " (registered: " + (known.empty() ? "none" : known) + ")";
    }

    std::string family_;
    Options options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> order_;
    std::string selected_;
    std::vector<std::shared_future<void>> tasks_;
};

} // namespace conductor
