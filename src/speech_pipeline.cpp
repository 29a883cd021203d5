#include "speech_pipeline.h"
#include "core/deadline.h"
#include "logger.h"
#include "utils.h"

using json = nlohmann::json;

namespace conductor {

const char* pipeline_stage_name(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Transcription: return "transcription";
        case PipelineStage::Reasoning: return "reasoning";
        case PipelineStage::Synthesis: return "synthesis";
    }
    return "transcription";
}

std::string PipelineFailure::describe() const {
    return std::string(pipeline_stage_name(stage)) + " stage failed: " + cause.describe();
}

json PipelineFailure::to_json() const {
    json j;
    j["error_code"] = "pipeline_stage_failure";
    j["stage"] = pipeline_stage_name(stage);
    j["cause"] = {{"type", error_type_name(cause.type)}, {"message", cause.message}};
    j["terminal"] = terminal;
    j["message"] = describe();
    if (!transcript.empty()) j["transcript"] = transcript;
    if (!response.empty()) j["response"] = response;
    return j;
}

json SpeechExchange::to_json() const {
    json j;
    j["transcript"] = transcript;
    j["transcription_backend"] = transcription_backend;
    j["response"] = response;
    if (speech) {
        j["speech"] = {
            {"mode", tts::synthesis_mode_name(speech->mode)},
            {"backend", speech->backend},
            {"audio_bytes", speech->audio.bytes.size()},
            {"synthesis_ms", speech->synthesis_ms}
        };
    } else {
        j["speech"] = nullptr;
    }
    j["timing_ms"] = {
        {"transcription", transcription_ms},
        {"reasoning", reasoning_ms},
        {"synthesis", synthesis_ms}
    };
    return j;
}

namespace {

PipelineFailure stage_failure(PipelineStage stage, const Error& cause, bool terminal = true) {
    PipelineFailure failure;
    failure.stage = stage;
    failure.cause = cause;
    if (failure.cause.message.empty()) {
        failure.cause.message = std::string(pipeline_stage_name(stage)) + " failed without a reason";
    }
    failure.terminal = terminal;
    return failure;
}

} // anonymous namespace

SpeechPipeline::SpeechPipeline(TranscriptionRegistry& transcription,
                               SynthesisRegistry& synthesis,
                               ReasonFunction reason,
                               PipelineOptions options)
    : transcription_(transcription), synthesis_(synthesis),
      reason_(std::move(reason)), options_(std::move(options)) {}

PipelineResult SpeechPipeline::process(const AudioClip& clip) {
    return process(clip, options_);
}

PipelineResult SpeechPipeline::process(const AudioClip& clip, const PipelineOptions& options) {
    SpeechExchange exchange;

    // Transcription
    TimePoint stage_start = Clock::now();
    auto transcribed = run_transcription(clip, options);
    exchange.transcription_ms = ms_since(stage_start);
    if (transcribed.is_error()) {
        auto failure = stage_failure(PipelineStage::Transcription, transcribed.error());
        LOG_PIPELINE(failure.describe());
        return failure;
    }
    exchange.transcript = utils::trim_copy(transcribed.value().text);
    exchange.transcription_backend = transcribed.value().backend;
    if (exchange.transcript.empty()) {
        auto failure = stage_failure(PipelineStage::Transcription,
                                     make_error(ErrorType::EmptyInput, "no speech detected in audio"));
        LOG_PIPELINE(failure.describe());
        return failure;
    }
    LOG_PIPELINE("Transcript (" + exchange.transcription_backend + ", " +
                 std::to_string(exchange.transcription_ms) + "ms): \"" + exchange.transcript + "\"");

    // Reasoning
    stage_start = Clock::now();
    Result<std::string> reasoned = make_error(ErrorType::InvalidState, "no reasoning function configured");
    if (reason_) {
        try {
            reasoned = reason_(exchange.transcript, options.reasoning_timeout_ms);
        } catch (const std::exception& e) {
            reasoned = make_error(ErrorType::Unknown, std::string("reasoning raised: ") + e.what());
        }
    }
    exchange.reasoning_ms = ms_since(stage_start);
    if (reasoned.is_error()) {
        auto failure = stage_failure(PipelineStage::Reasoning, reasoned.error());
        failure.transcript = exchange.transcript;
        LOG_PIPELINE(failure.describe());
        return failure;
    }
    exchange.response = reasoned.value();

    if (!options.auto_speak) {
        return exchange;
    }

    // Synthesis
    stage_start = Clock::now();
    auto spoken = run_synthesis(exchange.response, options.synthesis_timeout_ms);
    exchange.synthesis_ms = ms_since(stage_start);
    if (spoken.is_error()) {
        auto failure = stage_failure(PipelineStage::Synthesis, spoken.error(), false);
        failure.transcript = exchange.transcript;
        failure.response = exchange.response;
        LOG_PIPELINE(failure.describe());
        return failure;
    }
    exchange.speech = spoken.value();
    return exchange;
}

Result<tts::SynthesisResult, PipelineFailure> SpeechPipeline::speak(const std::string& text) {
    if (utils::is_empty_or_whitespace(text)) {
        return stage_failure(PipelineStage::Synthesis, make_error(ErrorType::EmptyInput, "nothing to speak"));
    }
    auto spoken = run_synthesis(text, options_.synthesis_timeout_ms);
    if (spoken.is_error()) {
        return stage_failure(PipelineStage::Synthesis, spoken.error());
    }
    return spoken.value();
}

Result<stt::TranscriptionResult> SpeechPipeline::run_transcription(const AudioClip& clip,
                                                                   const PipelineOptions& options) {
    if (clip.empty()) {
        return make_error(ErrorType::EmptyInput, "audio clip is empty");
    }
    std::shared_ptr<stt::TranscriptionProvider> provider = transcription_.current();
    if (!provider) {
        return make_error(ErrorType::BackendNotReady, "no transcription backend registered");
    }
    stt::TranscriptionRequest request;
    request.audio = clip;
    request.language = options.language;
    std::function<Result<stt::TranscriptionResult>()> call = [provider, request]() {
        return provider->transcribe(request);
    };
    return call_with_deadline<stt::TranscriptionResult>(call, options.transcription_timeout_ms,
                                                        "transcription via " + provider->id());
}

Result<tts::SynthesisResult> SpeechPipeline::run_synthesis(const std::string& text, int timeout_ms) {
    std::shared_ptr<tts::SynthesisProvider> provider = synthesis_.current();
    if (!provider) {
        return make_error(ErrorType::BackendNotReady, "no synthesis backend registered");
    }
    std::function<Result<tts::SynthesisResult>()> call = [provider, text]() {
        return provider->synthesize(text);
    };
    return call_with_deadline<tts::SynthesisResult>(call, timeout_ms, "synthesis via " + provider->id());
}

} // namespace conductor
