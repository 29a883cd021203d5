#include "stt/whisper_api_transcriber.h"
#include "http_client.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace conductor {
namespace stt {

namespace {

std::string content_type_for(const std::string& filename) {
    if (utils::ends_with(filename, ".wav")) return "audio/wav";
    if (utils::ends_with(filename, ".mp3")) return "audio/mpeg";
    if (utils::ends_with(filename, ".webm")) return "audio/webm";
    if (utils::ends_with(filename, ".ogg")) return "audio/ogg";
    if (utils::ends_with(filename, ".m4a")) return "audio/mp4";
    return "application/octet-stream";
}

} // anonymous namespace

WhisperApiTranscriber::WhisperApiTranscriber(const STTConfig& config) : config_(config) {}

std::string WhisperApiTranscriber::description() const {
    return config_.api_model + " at " + config_.api_url;
}

VoidResult WhisperApiTranscriber::prepare() {
    HealthProbe probe = health_check();
    if (!probe.ready) {
        return make_network_error(probe.reason);
    }
    return VoidResult();
}

HealthProbe WhisperApiTranscriber::health_check() {
    const std::string remediation = "Start a Whisper-compatible server at " + config_.api_url +
                                    " or set WHISPER_API_URL";
    auto response = http::get(http::join_url(config_.api_url, "models"),
                              http::bearer_headers(config_.api_key), 3000);
    if (response.is_error()) {
        return HealthProbe::unhealthy("whisper_api unreachable: " + response.error().message, remediation);
    }
    if (response.value().status >= 500) {
        return HealthProbe::unhealthy("Endpoint responded with " + std::to_string(response.value().status) + ".",
                                      remediation);
    }
    return HealthProbe::healthy();
}

Result<TranscriptionResult> WhisperApiTranscriber::transcribe(const TranscriptionRequest& request) {
    if (request.audio.empty()) {
        return make_error(ErrorType::EmptyInput, "no audio to transcribe");
    }

    std::vector<http::FormPart> parts;
    parts.push_back(http::FormPart::file("file", request.audio.bytes, request.audio.filename,
                                         content_type_for(request.audio.filename)));
    parts.push_back(http::FormPart::field("model", config_.api_model));
    parts.push_back(http::FormPart::field("response_format", "json"));
    std::string language = request.language.empty() ? config_.language : request.language;
    if (!language.empty()) {
        parts.push_back(http::FormPart::field("language", language));
    }

    auto response = http::post_form(http::join_url(config_.api_url, "audio/transcriptions"), parts,
                                    http::bearer_headers(config_.api_key), config_.stage_timeout_ms);
    if (response.is_error()) return response.error();
    if (!response.value().ok()) {
        return make_network_error("transcription failed: " + response.value().describe());
    }

    TranscriptionResult result;
    result.backend = id();
    result.model = config_.api_model;
    try {
        json body = json::parse(response.value().body);
        if (body.contains("text") && body["text"].is_string()) {
            result.text = utils::trim_copy(body["text"].get<std::string>());
        }
    } catch (const json::exception&) {
        // Some servers answer text/plain
        result.text = utils::trim_copy(response.value().body);
    }

    if (result.text.empty()) {
        return make_error(ErrorType::EmptyInput, "transcription was empty");
    }
    LOG_STT("whisper_api transcript: " + result.text);
    return result;
}

} // namespace stt
} // namespace conductor
