#pragma once

#include "stt/transcription_provider.h"
#include "config.h"

namespace conductor {
namespace stt {

/**
 * @brief Remote transcription through an OpenAI-compatible /audio/transcriptions
 *
 * Nothing to prepare beyond reaching the server; health is a GET on
 * {api_url}/models that answers below 500.
 */
class WhisperApiTranscriber : public TranscriptionProvider {
public:
    explicit WhisperApiTranscriber(const STTConfig& config);

    std::string id() const override { return "whisper_api"; }
    std::string display_name() const override { return "Whisper API"; }
    std::string description() const override;

    VoidResult prepare() override;
    HealthProbe health_check() override;
    Result<TranscriptionResult> transcribe(const TranscriptionRequest& request) override;

private:
    STTConfig config_;
};

} // namespace stt
} // namespace conductor
