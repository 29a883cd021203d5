#pragma once

#include "tts/synthesis_provider.h"
#include "audio/playback.h"
#include "config.h"
#include <memory>

namespace conductor {
namespace tts {

/**
 * @brief Remote synthesis through an OpenAI-compatible /audio/speech
 *
 * Requests WAV output. Health is a GET on {api_url}/models answering
 * below 500.
 */
class SpeechApiSynthesizer : public SynthesisProvider {
public:
    SpeechApiSynthesizer(const TTSConfig& config, std::shared_ptr<audio::PlaybackSink> player = nullptr);

    std::string id() const override { return "speech_api"; }
    std::string display_name() const override { return "Speech API"; }
    std::string description() const override;

    VoidResult prepare() override;
    HealthProbe health_check() override;
    Result<SynthesisResult> synthesize(const std::string& text) override;

private:
    TTSConfig config_;
    std::shared_ptr<audio::PlaybackSink> player_;
};

} // namespace tts
} // namespace conductor
