/**
 * Speech pipeline over fake providers: stage failures, stage timeouts,
 * hot-swapping between requests and the speak delegate.
 *
 * Run from build dir: ./test_speech_pipeline
 */

#include "test_support.h"
#include "core/deadline.h"
#include "delegates/speak_delegate.h"
#include "speech_pipeline.h"
#include <atomic>
#include <memory>

using namespace conductor;
using test_support::FakeSynthesizer;
using test_support::FakeTranscriber;

namespace {

AudioClip sample_clip() {
    AudioClip clip;
    clip.bytes = {'R', 'I', 'F', 'F', 0, 0, 0, 0};
    clip.filename = "question.wav";
    return clip;
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::WARN);

    TranscriptionRegistry transcription("transcription");
    SynthesisRegistry synthesis("synthesis");

    auto ears = std::make_shared<FakeTranscriber>("ears", "what is the answer");
    auto slow_ears = std::make_shared<FakeTranscriber>("slow_ears", "too slow");
    slow_ears->transcribe_delay_ms = 300;
    auto deaf = std::make_shared<FakeTranscriber>("deaf", "   ");
    auto voice = std::make_shared<FakeSynthesizer>("voice");
    auto broken_voice = std::make_shared<FakeSynthesizer>("broken_voice");
    broken_voice->synthesize_error = "audio device busy";

    transcription.register_provider(ears);
    transcription.register_provider(slow_ears);
    transcription.register_provider(deaf);
    synthesis.register_provider(voice);
    synthesis.register_provider(broken_voice);
    transcription.initialize_all().wait();
    synthesis.initialize_all().wait();

    std::atomic<int> reason_calls{0};
    std::atomic<bool> reason_fails{false};
    ReasonFunction reason = [&](const std::string& text, int) -> Result<std::string> {
        reason_calls++;
        if (reason_fails) return make_timeout_error("request not finished in time");
        if (text == "what is the answer") return std::string("42");
        return "you said: " + text;
    };

    PipelineOptions options;
    options.transcription_timeout_ms = 1000;
    options.synthesis_timeout_ms = 1000;
    SpeechPipeline pipeline(transcription, synthesis, reason, options);

    // --- full round trip ---
    {
        auto r = pipeline.process(sample_clip());
        ASSERT(r.is_ok());
        if (r.is_ok()) {
            const SpeechExchange& ex = r.value();
            ASSERT(ex.transcript == "what is the answer");
            ASSERT(ex.transcription_backend == "ears");
            ASSERT(ex.response == "42");
            ASSERT(ex.speech.has_value());
            ASSERT(ex.speech->backend == "voice");
            ASSERT(ex.speech->audio.bytes.size() == 2);
            nlohmann::json j = ex.to_json();
            ASSERT(j["speech"]["mode"] == "audio_bytes");
            ASSERT(j["transcript"] == "what is the answer");
        }
        ASSERT(voice->last_text() == "42");
    }

    // --- transcription timeout: synthesis never runs ---
    {
        ASSERT(transcription.select("slow_ears").is_ok());
        int synth_before = voice->synthesize_calls;
        int reason_before = reason_calls;
        PipelineOptions tight = options;
        tight.transcription_timeout_ms = 50;

        auto r = pipeline.process(sample_clip(), tight);
        ASSERT(r.is_error());
        if (r.is_error()) {
            ASSERT(r.error().stage == PipelineStage::Transcription);
            ASSERT(r.error().cause.type == ErrorType::Timeout);
            ASSERT(r.error().terminal);
            ASSERT(r.error().describe().rfind("transcription stage failed", 0) == 0);
        }
        ASSERT(voice->synthesize_calls == synth_before);
        ASSERT(reason_calls == reason_before);
        // A stage failure leaves the registry alone
        ASSERT(transcription.state("slow_ears") == BackendState::Ready);
        ASSERT(transcription.selected_id() == "slow_ears");
    }

    // --- hot swap between requests ---
    {
        ASSERT(transcription.select("ears").is_ok());
        auto r = pipeline.process(sample_clip());
        ASSERT(r.is_ok() && r.value().transcription_backend == "ears");
    }

    // --- nothing heard ---
    {
        ASSERT(transcription.select("deaf").is_ok());
        auto r = pipeline.process(sample_clip());
        ASSERT(r.is_error());
        if (r.is_error()) {
            ASSERT(r.error().stage == PipelineStage::Transcription);
            ASSERT(r.error().cause.type == ErrorType::EmptyInput);
        }
        ASSERT(transcription.select("ears").is_ok());

        auto empty = pipeline.process(AudioClip());
        ASSERT(empty.is_error() && empty.error().cause.type == ErrorType::EmptyInput);
    }

    // --- reasoning failure carries the transcript ---
    {
        int synth_before = voice->synthesize_calls;
        reason_fails = true;
        auto r = pipeline.process(sample_clip());
        reason_fails = false;
        ASSERT(r.is_error());
        if (r.is_error()) {
            ASSERT(r.error().stage == PipelineStage::Reasoning);
            ASSERT(r.error().cause.type == ErrorType::Timeout);
            ASSERT(r.error().terminal);
            ASSERT(r.error().transcript == "what is the answer");
        }
        ASSERT(voice->synthesize_calls == synth_before);
    }

    // --- synthesis failure is not terminal: text results survive ---
    {
        ASSERT(synthesis.select("broken_voice").is_ok());
        auto r = pipeline.process(sample_clip());
        ASSERT(r.is_error());
        if (r.is_error()) {
            const PipelineFailure& f = r.error();
            ASSERT(f.stage == PipelineStage::Synthesis);
            ASSERT(!f.terminal);
            ASSERT(f.transcript == "what is the answer");
            ASSERT(f.response == "42");
            ASSERT(f.cause.message == "audio device busy");
            nlohmann::json j = f.to_json();
            ASSERT(j["error_code"] == "pipeline_stage_failure");
            ASSERT(j["stage"] == "synthesis");
            ASSERT(j["terminal"] == false);
        }
        ASSERT(synthesis.select("voice").is_ok());
    }

    // --- auto_speak off skips synthesis ---
    {
        int synth_before = voice->synthesize_calls;
        PipelineOptions quiet = options;
        quiet.auto_speak = false;
        auto r = pipeline.process(sample_clip(), quiet);
        ASSERT(r.is_ok());
        if (r.is_ok()) {
            ASSERT(r.value().response == "42");
            ASSERT(!r.value().speech.has_value());
            ASSERT(r.value().to_json()["speech"].is_null());
        }
        ASSERT(voice->synthesize_calls == synth_before);
    }

    // --- speak delegate ---
    {
        SpeakDelegate speak(pipeline);
        ASSERT(speak.name() == "speak");

        auto ok = speak.invoke({{"text", "hello"}});
        ASSERT(ok.success);
        ASSERT(ok.content == "Spoke 5 characters via voice (audio_bytes, 5 bytes)");
        ASSERT(voice->last_text() == "hello");

        auto missing = speak.invoke(nlohmann::json::object());
        ASSERT(!missing.success && missing.error_code == "invalid_arguments");

        ASSERT(synthesis.select("broken_voice").is_ok());
        auto broken = speak.invoke({{"message", "hello"}});
        ASSERT(!broken.success && broken.error_code == "synthesis_failed");
        ASSERT(synthesis.select("voice").is_ok());

        auto blank = pipeline.speak("  ");
        ASSERT(blank.is_error() && blank.error().cause.type == ErrorType::EmptyInput);
    }

    // --- no provider registered at all ---
    {
        TranscriptionRegistry none_stt("transcription");
        SynthesisRegistry none_tts("synthesis");
        SpeechPipeline bare(none_stt, none_tts, reason);
        auto r = bare.process(sample_clip());
        ASSERT(r.is_error() && r.error().cause.type == ErrorType::BackendNotReady);
    }

    // Abandoned calls return before teardown
    ASSERT(wait_for_detached_work(2000));

    if (failed) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "All speech pipeline tests passed.\n";
    return 0;
}
