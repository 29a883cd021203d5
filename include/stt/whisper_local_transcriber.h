#pragma once

#include "stt/transcription_provider.h"
#include "asset_fetcher.h"
#include "config.h"
#include <memory>

namespace conductor {
namespace stt {

/**
 * @brief On-device transcription with whisper.cpp
 *
 * prepare() fetches the ggml model if it is missing and loads it. Input
 * must be 16-bit PCM WAV; it is downmixed and resampled to 16 kHz.
 */
class WhisperLocalTranscriber : public TranscriptionProvider {
public:
    WhisperLocalTranscriber(const STTConfig& config, std::shared_ptr<AssetFetcher> fetcher);
    ~WhisperLocalTranscriber() override;

    // Non-copyable
    WhisperLocalTranscriber(const WhisperLocalTranscriber&) = delete;
    WhisperLocalTranscriber& operator=(const WhisperLocalTranscriber&) = delete;

    std::string id() const override { return "whisper_local"; }
    std::string display_name() const override { return "Whisper (local)"; }
    std::string description() const override;

    VoidResult prepare() override;
    HealthProbe health_check() override;
    Result<TranscriptionResult> transcribe(const TranscriptionRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace stt
} // namespace conductor
