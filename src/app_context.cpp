#include "app_context.h"
#include "asset_fetcher.h"
#include "core/deadline.h"
#include "audio/portaudio_player.h"
#include "delegates/delegate_manifest.h"
#include "http_client.h"
#include "logger.h"
#include "stt/whisper_api_transcriber.h"
#include "stt/whisper_local_transcriber.h"
#include "tts/piper_tts.h"
#include "tts/speech_api_synthesizer.h"
#include "utils.h"

namespace conductor {

namespace {

constexpr int kDetachedDrainMs = 5000;

TranscriptionRegistry::Options stt_options(const Config& config) {
    TranscriptionRegistry::Options options;
    options.select_timeout_ms = config.stt.select_timeout_ms;
    options.health_ttl_ms = config.stt.health_ttl_ms;
    return options;
}

SynthesisRegistry::Options tts_options(const Config& config) {
    SynthesisRegistry::Options options;
    options.select_timeout_ms = config.tts.select_timeout_ms;
    options.health_ttl_ms = config.tts.health_ttl_ms;
    return options;
}

Result<std::string> fetch_search(const std::string& url, int timeout_ms) {
    auto response = http::get(url, {"Accept: application/json"}, timeout_ms);
    if (response.is_error()) return response.error();
    if (!response.value().ok()) {
        return make_network_error("search failed: " + response.value().describe());
    }
    return response.value().body;
}

} // anonymous namespace

AppContext::AppContext(const Config& config)
    : config_(config)
    , transcription_("transcription", stt_options(config))
    , synthesis_("synthesis", tts_options(config))
{
    http::global_init();
    fetcher_ = std::make_shared<CurlAssetFetcher>(config_.assets.timeout_ms);
    if (config_.tts.local_playback) {
        player_ = std::make_shared<audio::PortAudioPlayer>(config_.tts.output_device);
    }
    register_providers();

    llm_ = std::make_shared<LLMClient>(config_.llm, config_.agent.system_prompt);

    LoopOptions loop_options;
    loop_options.max_iterations = config_.agent.max_iterations;
    loop_options.delegate_timeout_ms = config_.agent.delegate_timeout_ms;
    loop_options.max_duration_ms = config_.agent.max_duration_ms;
    loop_ = std::make_unique<ReasoningLoop>("orchestrator", llm_, delegates_, loop_options,
                                            config_.tools.max_concurrent);

    QueueOptions queue_options;
    queue_options.capacity = config_.queue.capacity;
    queue_options.retain_completed = config_.queue.retain_completed;
    queue_ = std::make_unique<OrchestrationQueue>(*loop_, queue_options);

    PipelineOptions pipeline_options;
    pipeline_options.transcription_timeout_ms = config_.stt.stage_timeout_ms;
    pipeline_options.reasoning_timeout_ms = config_.agent.request_timeout_ms;
    pipeline_options.synthesis_timeout_ms = config_.tts.stage_timeout_ms;
    pipeline_options.auto_speak = config_.tts.auto_speak;
    pipeline_options.language = config_.stt.language;
    pipeline_ = std::make_unique<SpeechPipeline>(
        transcription_, synthesis_,
        [this](const std::string& text, int timeout_ms) { return reason(text, timeout_ms); },
        pipeline_options);

    const int search_timeout_ms = config_.tools.timeout_ms;
    DelegateManifest manifest;
    manifest.backend = llm_;
    manifest.search_fetch = [search_timeout_ms](const std::string& url) {
        return fetch_search(url, search_timeout_ms);
    };
    manifest.pipeline = pipeline_.get();
    auto registered = register_builtin_delegates(delegates_, config_, manifest);
    LOG_AGENT("Delegates: " + utils::join(registered, ", "));
}

AppContext::~AppContext() {
    stop();
}

void AppContext::register_providers() {
    auto register_stt = [this](std::shared_ptr<stt::TranscriptionProvider> provider) {
        auto added = transcription_.register_provider(std::move(provider));
        if (added.is_error()) Logger::error(added.error().describe());
    };
    register_stt(std::make_shared<stt::WhisperApiTranscriber>(config_.stt));
    register_stt(std::make_shared<stt::WhisperLocalTranscriber>(config_.stt, fetcher_));

    auto register_tts = [this](std::shared_ptr<tts::SynthesisProvider> provider) {
        auto added = synthesis_.register_provider(std::move(provider));
        if (added.is_error()) Logger::error(added.error().describe());
    };
    register_tts(std::make_shared<tts::PiperTTS>(config_.tts, fetcher_, player_));
    register_tts(std::make_shared<tts::SpeechApiSynthesizer>(config_.tts, player_));

    auto preferred_stt = transcription_.set_preferred(config_.stt.backend);
    if (preferred_stt.is_error()) {
        Logger::warn("stt.backend: " + preferred_stt.error().describe());
    }
    auto preferred_tts = synthesis_.set_preferred(config_.tts.backend);
    if (preferred_tts.is_error()) {
        Logger::warn("tts.backend: " + preferred_tts.error().describe());
    }
}

void AppContext::start() {
    transcription_.initialize_all();
    synthesis_.initialize_all();
    queue_->start();
    LOG_INFO("Conductor started (model=" + llm_->model_id() +
             ", stt=" + transcription_.selected_id() + ", tts=" + synthesis_.selected_id() + ")");
}

void AppContext::stop() {
    if (queue_ && queue_->is_running()) {
        queue_->stop();
    }
    // Calls abandoned after a timeout still run on detached threads
    if (!wait_for_detached_work(kDetachedDrainMs)) {
        Logger::warn(std::to_string(detached_work_count()) +
                     " abandoned call(s) still running at shutdown");
    }
}

Result<std::string> AppContext::reason(const std::string& text, int timeout_ms) {
    auto submitted = queue_->submit(text);
    if (submitted.is_error()) {
        return submitted.error();
    }
    const std::string id = submitted.value();

    auto waited = queue_->wait(id, timeout_ms);
    if (waited.is_error()) {
        if (waited.error().type == ErrorType::Timeout) {
            auto cancelled = queue_->cancel(id);
            if (cancelled.is_error()) {
                LOG_PIPELINE("cancel " + id + ": " + cancelled.error().describe());
            }
        }
        return waited.error();
    }

    const RequestRecord& record = waited.value();
    if (record.status == RequestStatus::Succeeded) {
        return record.result_text;
    }
    if (record.error.is_error()) {
        return record.error;
    }
    return make_error(ErrorType::Unknown, id + " ended " + request_status_name(record.status));
}

nlohmann::json AppContext::health_report() {
    nlohmann::json report;

    HealthProbe llm = llm_->probe();
    report["llm"] = {{"model", llm_->model_id()}, {"ready", llm.ready}, {"reason", llm.reason},
                     {"remediation", llm.remediation}};

    report["transcription"] = nlohmann::json::array();
    for (const auto& status : transcription_.health()) {
        report["transcription"].push_back(status.to_json());
    }
    report["synthesis"] = nlohmann::json::array();
    for (const auto& status : synthesis_.health()) {
        report["synthesis"].push_back(status.to_json());
    }
    report["queue"] = {{"running", queue_->running_id()}, {"depth", queue_->depth()}};
    return report;
}

} // namespace conductor
