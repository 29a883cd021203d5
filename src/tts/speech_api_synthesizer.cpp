#include "tts/speech_api_synthesizer.h"
#include "audio/wav_codec.h"
#include "http_client.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace conductor {
namespace tts {

SpeechApiSynthesizer::SpeechApiSynthesizer(const TTSConfig& config, std::shared_ptr<audio::PlaybackSink> player)
    : config_(config), player_(std::move(player)) {}

std::string SpeechApiSynthesizer::description() const {
    return config_.api_model + "/" + config_.api_voice + " at " + config_.api_url;
}

VoidResult SpeechApiSynthesizer::prepare() {
    HealthProbe probe = health_check();
    if (!probe.ready) {
        return make_network_error(probe.reason);
    }
    return VoidResult();
}

HealthProbe SpeechApiSynthesizer::health_check() {
    const std::string remediation = "Start an OpenAI-compatible speech server at " + config_.api_url;
    auto response = http::get(http::join_url(config_.api_url, "models"),
                              http::bearer_headers(config_.api_key), 3000);
    if (response.is_error()) {
        return HealthProbe::unhealthy("speech_api unreachable: " + response.error().message, remediation);
    }
    if (response.value().status >= 500) {
        return HealthProbe::unhealthy("Endpoint responded with " + std::to_string(response.value().status) + ".",
                                      remediation);
    }
    return HealthProbe::healthy();
}

Result<SynthesisResult> SpeechApiSynthesizer::synthesize(const std::string& text) {
    if (utils::is_empty_or_whitespace(text)) {
        return make_error(ErrorType::EmptyInput, "nothing to synthesize");
    }
    const TimePoint start = Clock::now();

    json request;
    request["model"] = config_.api_model;
    request["voice"] = config_.api_voice;
    request["input"] = text;
    request["response_format"] = "wav";

    auto response = http::post_json(http::join_url(config_.api_url, "audio/speech"), request,
                                    http::bearer_headers(config_.api_key), config_.stage_timeout_ms);
    if (response.is_error()) return response.error();
    const auto& reply = response.value();
    if (!reply.ok()) {
        return make_network_error("speech synthesis failed: " + reply.describe());
    }
    if (reply.body.empty()) {
        return make_error(ErrorType::EmptyInput, "speech server returned no audio");
    }

    SynthesisResult result;
    result.backend = id();
    result.audio.bytes.assign(reply.body.begin(), reply.body.end());
    result.audio.filename = "speech.wav";

    if (config_.local_playback && player_ && player_->is_available()) {
        auto decoded = audio::decode_wav(result.audio.bytes);
        if (decoded.is_error()) return decoded.error();
        const auto& pcm = decoded.value();
        auto played = player_->play(audio::to_mono(pcm.samples, pcm.channels), pcm.sample_rate);
        if (played.is_error()) return played.error();
        result.mode = SynthesisMode::LocalPlayback;
    }

    result.synthesis_ms = ms_since(start);
    LOG_TTS("speech_api synthesized " + std::to_string(result.audio.bytes.size()) + " bytes in " +
            std::to_string(result.synthesis_ms) + "ms");
    return result;
}

} // namespace tts
} // namespace conductor
