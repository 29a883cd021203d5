#include "stt/whisper_local_transcriber.h"
#include "audio/wav_codec.h"
#include "logger.h"
#include "path_utils.h"
#include "utils.h"
#include <whisper.h>
#include <mutex>
#include <vector>

namespace conductor {
namespace stt {

class WhisperLocalTranscriber::Impl {
public:
    Impl(const STTConfig& config, std::shared_ptr<AssetFetcher> fetcher)
        : config_(config), fetcher_(std::move(fetcher)), ctx_(nullptr) {}

    ~Impl() {
        if (ctx_) {
            whisper_free(ctx_);
        }
    }

    VoidResult prepare() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ctx_) return VoidResult();

        if (config_.model_path.empty()) {
            return make_error(ErrorType::InvalidArgument, "No model path specified");
        }
        if (fetcher_) {
            auto fetched = fetcher_->fetch(config_.model_url, config_.model_path);
            if (fetched.is_error()) return fetched;
        } else if (!file_exists(config_.model_path)) {
            return make_io_error("Model not found: " + config_.model_path);
        }

        // Metal / CUDA when whisper.cpp was built with them
        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = config_.use_gpu;

        ctx_ = whisper_init_from_file_with_params(config_.model_path.c_str(), cparams);
        if (!ctx_) {
            return make_io_error("Failed to load whisper model: " + config_.model_path);
        }
        LOG_STT("Model loaded: " + file_name(config_.model_path));
        return VoidResult();
    }

    HealthProbe health_check() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ctx_) return HealthProbe::healthy();
        if (!file_exists(config_.model_path)) {
            return HealthProbe::unhealthy("Model not found: " + config_.model_path,
                                          "Download a ggml model to stt.model_path or set stt.model_url");
        }
        return HealthProbe::unhealthy("Model not loaded", "Re-initialize the whisper_local backend");
    }

    Result<TranscriptionResult> transcribe(const TranscriptionRequest& request) {
        if (request.audio.empty()) {
            return make_error(ErrorType::EmptyInput, "no audio to transcribe");
        }
        auto decoded = audio::decode_wav(request.audio.bytes);
        if (decoded.is_error()) {
            return make_error(ErrorType::InvalidArgument,
                              "whisper_local needs 16-bit PCM WAV: " + decoded.error().message);
        }
        const audio::PcmAudio& pcm = decoded.value();
        AudioBuffer mono = audio::to_mono(pcm.samples, pcm.channels);
        AudioBuffer segment = audio::resample(mono, pcm.sample_rate, WHISPER_SAMPLE_RATE);
        if (segment.empty()) {
            return make_error(ErrorType::EmptyInput, "audio contains no samples");
        }

        std::vector<float> pcmf32(segment.size());
        for (size_t i = 0; i < segment.size(); i++) {
            pcmf32[i] = static_cast<float>(segment[i]) / 32768.0f;
        }

        const std::string language = request.language.empty() ? config_.language : request.language;

        // whisper_context is not re-entrant
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ctx_) {
            return make_error(ErrorType::BackendNotReady, "whisper model is not loaded");
        }

        struct whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.print_progress = false;
        params.print_special = false;
        params.print_realtime = false;
        params.print_timestamps = false;
        params.translate = false;
        params.language = language.c_str();
        params.n_threads = 4;
        params.no_context = true;

        int ret = whisper_full(ctx_, params, pcmf32.data(), static_cast<int>(pcmf32.size()));
        if (ret != 0) {
            return make_error(ErrorType::Unknown, "whisper_full failed: " + std::to_string(ret));
        }

        std::string text;
        int n_segments = whisper_full_n_segments(ctx_);
        for (int i = 0; i < n_segments; i++) {
            text += whisper_full_get_segment_text(ctx_, i);
        }

        TranscriptionResult result;
        result.text = utils::trim_copy(text);
        result.backend = "whisper_local";
        result.model = file_name(config_.model_path);
        if (result.text.empty()) {
            return make_error(ErrorType::EmptyInput, "transcription was empty");
        }
        LOG_STT("whisper_local transcript: " + result.text);
        return result;
    }

    const STTConfig& config() const { return config_; }

private:
    STTConfig config_;
    std::shared_ptr<AssetFetcher> fetcher_;
    whisper_context* ctx_;
    std::mutex mutex_;
};

WhisperLocalTranscriber::WhisperLocalTranscriber(const STTConfig& config, std::shared_ptr<AssetFetcher> fetcher)
    : pimpl_(std::make_unique<Impl>(config, std::move(fetcher))) {}

WhisperLocalTranscriber::~WhisperLocalTranscriber() = default;

std::string WhisperLocalTranscriber::description() const {
    return "whisper.cpp with " + file_name(pimpl_->config().model_path);
}

VoidResult WhisperLocalTranscriber::prepare() {
    return pimpl_->prepare();
}

HealthProbe WhisperLocalTranscriber::health_check() {
    return pimpl_->health_check();
}

Result<TranscriptionResult> WhisperLocalTranscriber::transcribe(const TranscriptionRequest& request) {
    return pimpl_->transcribe(request);
}

} // namespace stt
} // namespace conductor
