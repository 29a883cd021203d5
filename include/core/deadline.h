#pragma once

#include "errors.h"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace conductor {

namespace detail {

/// Never destroyed: detached threads may still finish during static destruction
struct DetachedWork {
    std::mutex mutex;
    std::condition_variable cv;
    size_t count = 0;
};

inline DetachedWork& detached_work() {
    static DetachedWork* work = new DetachedWork();
    return *work;
}

} // namespace detail

/**
 * @brief Track a thread that may be detached from its owner
 *
 * Call detached_work_begin() before the thread can be abandoned and
 * detached_work_end() as the last thing it does. wait_for_detached_work()
 * lets shutdown code give abandoned calls a bounded chance to return before
 * the process tears down the logger and providers.
 */
inline void detached_work_begin() {
    auto& work = detail::detached_work();
    std::lock_guard<std::mutex> lock(work.mutex);
    ++work.count;
}

inline void detached_work_end() {
    auto& work = detail::detached_work();
    std::lock_guard<std::mutex> lock(work.mutex);
    if (work.count > 0) --work.count;
    work.cv.notify_all();
}

inline size_t detached_work_count() {
    auto& work = detail::detached_work();
    std::lock_guard<std::mutex> lock(work.mutex);
    return work.count;
}

/// @return true when no tracked thread is left running
inline bool wait_for_detached_work(int timeout_ms) {
    auto& work = detail::detached_work();
    std::unique_lock<std::mutex> lock(work.mutex);
    return work.cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] { return work.count == 0; });
}

/**
 * @brief Race fn() against a deadline
 *
 * fn runs on its own thread. If it has not returned within timeout_ms the
 * caller gets a Timeout error and the thread is detached to finish in the
 * background; its late result is discarded. Anything fn captures must
 * therefore be owned by value (shared_ptr, copies). timeout_ms <= 0 calls
 * fn inline. Worker threads are tracked with detached_work_begin/end so
 * shutdown can wait for abandoned ones.
 *
 * Exceptions escaping fn are converted into ErrorType::Unknown.
 */
template <typename T>
Result<T> call_with_deadline(std::function<Result<T>()> fn, int timeout_ms, const std::string& what) {
    auto guarded = [fn, what]() -> Result<T> {
        try {
            return fn();
        } catch (const std::exception& e) {
            return make_error(ErrorType::Unknown, what + " raised: " + e.what());
        } catch (...) {
            return make_error(ErrorType::Unknown, what + " raised an unknown exception");
        }
    };

    if (timeout_ms <= 0) {
        return guarded();
    }

    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<Result<T>> result;
    };
    auto state = std::make_shared<State>();

    detached_work_begin();
    std::thread worker([state, guarded]() {
        Result<T> r = guarded();
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->result.emplace(std::move(r));
            state->cv.notify_one();
        }
        detached_work_end();
    });

    std::unique_lock<std::mutex> lock(state->mutex);
    bool finished = state->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                       [&] { return state->result.has_value(); });
    if (!finished) {
        lock.unlock();
        worker.detach();  // Let it finish in background
        return make_timeout_error(what + " exceeded " + std::to_string(timeout_ms) + "ms");
    }
    Result<T> out = std::move(*state->result);
    lock.unlock();
    worker.join();
    return out;
}

} // namespace conductor
