#pragma once

#include "audio/playback.h"
#include <memory>
#include <string>

namespace conductor {
namespace audio {

/**
 * @brief Blocking mono 16-bit playback on a PortAudio output device
 *
 * PortAudio is initialized in the constructor and terminated in the
 * destructor. Calls to play() are serialized.
 */
class PortAudioPlayer : public PlaybackSink {
public:
    /**
     * @param output_device Device name (substring match) or "" / "default"
     */
    explicit PortAudioPlayer(const std::string& output_device = "");
    ~PortAudioPlayer() override;

    // Non-copyable
    PortAudioPlayer(const PortAudioPlayer&) = delete;
    PortAudioPlayer& operator=(const PortAudioPlayer&) = delete;

    VoidResult play(const AudioBuffer& samples, int sample_rate) override;
    bool is_available() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace audio
} // namespace conductor
