#pragma once

/**
 * @file piper_tts.h
 * @brief Piper synthesis provider
 *
 * Features:
 * - Voice fetch on prepare (.onnx and .onnx.json)
 * - Path caching (find piper once)
 * - Phrase caching (LRU cache of encoded WAV)
 * - Warmup synthesis as the readiness check
 * - Optional local playback through a PlaybackSink
 */

#include "tts/synthesis_provider.h"
#include "audio/playback.h"
#include "asset_fetcher.h"
#include "config.h"
#include <string>
#include <memory>

namespace conductor {
namespace tts {

/**
 * @brief Piper TTS provider (runs the piper binary, no shell)
 */
class PiperTTS : public SynthesisProvider {
public:
    /**
     * @param player When non-null and config.local_playback is set, audio is
     *               also played locally and results report LocalPlayback
     */
    PiperTTS(const TTSConfig& config,
             std::shared_ptr<AssetFetcher> fetcher,
             std::shared_ptr<audio::PlaybackSink> player = nullptr);
    ~PiperTTS() override;

    // Non-copyable
    PiperTTS(const PiperTTS&) = delete;
    PiperTTS& operator=(const PiperTTS&) = delete;

    std::string id() const override { return "piper"; }
    std::string display_name() const override { return "Piper"; }
    std::string description() const override;

    VoidResult prepare() override;
    HealthProbe health_check() override;
    Result<SynthesisResult> synthesize(const std::string& text) override;

    struct Stats {
        size_t cache_size = 0;
        size_t cache_hits = 0;
        size_t cache_misses = 0;
        int64_t avg_synthesis_ms = 0;
    };

    Stats get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tts
} // namespace conductor
