#pragma once

#include "config.h"
#include "delegate_registry.h"
#include "llm_client.h"
#include "orchestration_queue.h"
#include "reasoning_loop.h"
#include "speech_pipeline.h"
#include "stt/transcription_provider.h"
#include "tts/synthesis_provider.h"
#include <memory>
#include <nlohmann/json.hpp>

namespace conductor {

namespace audio {
class PlaybackSink;
}
class AssetFetcher;

/**
 * @brief Everything the process runs, built once in main
 *
 * Owns the configuration, both backend registries, the reasoning backend,
 * the top-level delegate table and loop, the orchestration queue and the
 * speech pipeline. Components get references to what they need.
 */
class AppContext {
public:
    explicit AppContext(const Config& config);

    /**
     * @brief Destructor - stops the queue
     */
    ~AppContext();

    // Non-copyable
    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    /**
     * @brief Kick off backend preparation and start the queue
     */
    void start();

    /**
     * @brief Stop the queue, then wait (bounded) for calls abandoned after a
     * timeout to return so they do not outlive the logger and providers
     */
    void stop();

    const Config& config() const { return config_; }
    LLMClient& llm() { return *llm_; }
    DelegateRegistry& delegates() { return delegates_; }
    ReasoningLoop& loop() { return *loop_; }
    OrchestrationQueue& queue() { return *queue_; }
    TranscriptionRegistry& transcription() { return transcription_; }
    SynthesisRegistry& synthesis() { return synthesis_; }
    SpeechPipeline& pipeline() { return *pipeline_; }

    /**
     * @brief {"llm": {...}, "transcription": [...], "synthesis": [...]} health snapshot
     */
    nlohmann::json health_report();

private:
    Result<std::string> reason(const std::string& text, int timeout_ms);
    void register_providers();

    Config config_;
    std::shared_ptr<AssetFetcher> fetcher_;
    std::shared_ptr<audio::PlaybackSink> player_;
    TranscriptionRegistry transcription_;
    SynthesisRegistry synthesis_;
    std::shared_ptr<LLMClient> llm_;
    DelegateRegistry delegates_;
    std::unique_ptr<ReasoningLoop> loop_;
    std::unique_ptr<OrchestrationQueue> queue_;
    std::unique_ptr<SpeechPipeline> pipeline_;
};

} // namespace conductor
