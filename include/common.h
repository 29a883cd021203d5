#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <memory>
#include <atomic>

namespace conductor {

// Audio types
using Sample = int16_t;
using AudioBuffer = std::vector<Sample>;
using Bytes = std::vector<uint8_t>;

// Timing
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    auto now = Clock::now();
    return std::chrono::duration_cast<Duration>(now - start).count();
}

/// ISO-8601 UTC timestamp with millisecond precision ("2026-01-01T00:00:00.000Z")
std::string utc_timestamp(WallTime when = WallClock::now());

/// ISO-8601 local timestamp with UTC offset ("2026-01-01T01:00:00+0100")
std::string local_timestamp(WallTime when = WallClock::now());

/// Shared cooperative cancellation flag
using CancelToken = std::shared_ptr<std::atomic<bool>>;

inline CancelToken make_cancel_token() {
    return std::make_shared<std::atomic<bool>>(false);
}

inline bool is_cancelled(const CancelToken& token) {
    return token && token->load();
}

// Audio format constants
constexpr int DEFAULT_SAMPLE_RATE = 16000;

/**
 * @brief Encoded audio as received from a client or produced by a synthesizer
 *
 * `bytes` is the whole file (WAV, WebM, ...); `filename` carries the
 * extension backends use to pick a decoder.
 */
struct AudioClip {
    Bytes bytes;
    std::string filename = "audio.wav";

    bool empty() const { return bytes.empty(); }
};

} // namespace conductor
