#pragma once

/**
 * @file playback.h
 * @brief Local audio output capability
 *
 * Kept separate from readiness: a synthesis provider that plays locally
 * holds a PlaybackSink rather than inheriting playback behavior.
 */

#include "common.h"
#include "errors.h"

namespace conductor {
namespace audio {

class PlaybackSink {
public:
    virtual ~PlaybackSink() = default;

    /**
     * @brief Play a complete clip (blocking until done)
     */
    virtual VoidResult play(const AudioBuffer& samples, int sample_rate) = 0;

    virtual bool is_available() const = 0;
};

} // namespace audio
} // namespace conductor
