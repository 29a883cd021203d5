#pragma once

/**
 * @file speech_pipeline.h
 * @brief transcribe -> reason -> synthesize as one request/response operation
 */

#include "common.h"
#include "errors.h"
#include "stt/transcription_provider.h"
#include "tts/synthesis_provider.h"
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace conductor {

enum class PipelineStage {
    Transcription,
    Reasoning,
    Synthesis
};

const char* pipeline_stage_name(PipelineStage stage);

/**
 * @brief Uniform failure for any pipeline stage
 *
 * `terminal` is false only for synthesis failures, where the transcript and
 * response text are still usable by the caller.
 */
struct PipelineFailure {
    PipelineStage stage = PipelineStage::Transcription;
    Error cause;
    bool terminal = true;
    std::string transcript;
    std::string response;

    /// "<stage> stage failed: <type>: <message>"
    std::string describe() const;
    nlohmann::json to_json() const;
};

/**
 * @brief Successful round trip
 */
struct SpeechExchange {
    std::string transcript;
    std::string transcription_backend;
    std::string response;
    std::optional<tts::SynthesisResult> speech;  ///< Absent when auto_speak is off
    int64_t transcription_ms = 0;
    int64_t reasoning_ms = 0;
    int64_t synthesis_ms = 0;

    /// Summary without audio payload
    nlohmann::json to_json() const;
};

struct PipelineOptions {
    int transcription_timeout_ms = 30000;
    int reasoning_timeout_ms = 120000;
    int synthesis_timeout_ms = 30000;
    bool auto_speak = true;
    std::string language;  ///< Passed to transcription; empty = provider default
};

/**
 * @brief Reasoning stage hook: run text through the reasoning loop
 *
 * Must return within timeout_ms (a Timeout error when it cannot).
 */
using ReasonFunction = std::function<Result<std::string>(const std::string& text, int timeout_ms)>;

using PipelineResult = Result<SpeechExchange, PipelineFailure>;

/**
 * @brief Speech capability facade over the two registries
 *
 * Each stage asks its registry for current() at the moment it starts, so a
 * hot-swap between stages or between requests takes effect without
 * rebuilding the pipeline. Stage failures never touch registry state.
 */
class SpeechPipeline {
public:
    SpeechPipeline(TranscriptionRegistry& transcription,
                   SynthesisRegistry& synthesis,
                   ReasonFunction reason,
                   PipelineOptions options = PipelineOptions());

    PipelineResult process(const AudioClip& clip);
    PipelineResult process(const AudioClip& clip, const PipelineOptions& options);

    /**
     * @brief Synthesis stage alone (used by the speak delegate)
     */
    Result<tts::SynthesisResult, PipelineFailure> speak(const std::string& text);

    const PipelineOptions& options() const { return options_; }

private:
    Result<stt::TranscriptionResult> run_transcription(const AudioClip& clip, const PipelineOptions& options);
    Result<tts::SynthesisResult> run_synthesis(const std::string& text, int timeout_ms);

    TranscriptionRegistry& transcription_;
    SynthesisRegistry& synthesis_;
    ReasonFunction reason_;
    PipelineOptions options_;
};

} // namespace conductor
