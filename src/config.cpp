#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include <fstream>
#include <cstdlib>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') return nullptr;
    return value;
}

void read_string_list(const json& arr, std::vector<std::string>& out) {
    out.clear();
    for (const auto& item : arr) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
}

/// Apply every known section of j onto cfg. Unknown keys are ignored.
void apply_json_to_config(conductor::Config& cfg, const json& j) {
    // Agent config
    if (j.contains("agent")) {
        auto& a = j["agent"];
        if (a.contains("max_iterations")) cfg.agent.max_iterations = a["max_iterations"];
        if (a.contains("delegate_timeout_ms")) cfg.agent.delegate_timeout_ms = a["delegate_timeout_ms"];
        if (a.contains("max_duration_ms")) cfg.agent.max_duration_ms = a["max_duration_ms"];
        if (a.contains("request_timeout_ms")) cfg.agent.request_timeout_ms = a["request_timeout_ms"];
        if (a.contains("system_prompt") && a["system_prompt"].is_string())
            cfg.agent.system_prompt = a["system_prompt"].get<std::string>();
    }

    // Queue config
    if (j.contains("queue")) {
        auto& q = j["queue"];
        if (q.contains("capacity")) cfg.queue.capacity = q["capacity"];
        if (q.contains("retain_completed")) cfg.queue.retain_completed = q["retain_completed"];
    }

    // LLM config
    if (j.contains("llm")) {
        auto& l = j["llm"];
        if (l.contains("base_url")) cfg.llm.base_url = l["base_url"];
        if (l.contains("api_key")) cfg.llm.api_key = l["api_key"];
        if (l.contains("model_id")) cfg.llm.model_id = l["model_id"];
        if (l.contains("timeout_ms")) cfg.llm.timeout_ms = l["timeout_ms"];
        if (l.contains("max_tokens")) cfg.llm.max_tokens = l["max_tokens"];
        if (l.contains("temperature")) cfg.llm.temperature = l["temperature"];
    }

    // STT config
    if (j.contains("stt")) {
        auto& s = j["stt"];
        if (s.contains("backend")) cfg.stt.backend = s["backend"];
        if (s.contains("api_url")) cfg.stt.api_url = s["api_url"];
        if (s.contains("api_model")) cfg.stt.api_model = s["api_model"];
        if (s.contains("api_key")) cfg.stt.api_key = s["api_key"];
        if (s.contains("model_path")) cfg.stt.model_path = s["model_path"];
        if (s.contains("model_url")) cfg.stt.model_url = s["model_url"];
        if (s.contains("language")) cfg.stt.language = s["language"];
        if (s.contains("use_gpu")) cfg.stt.use_gpu = s["use_gpu"];
        if (s.contains("stage_timeout_ms")) cfg.stt.stage_timeout_ms = s["stage_timeout_ms"];
        if (s.contains("select_timeout_ms")) cfg.stt.select_timeout_ms = s["select_timeout_ms"];
        if (s.contains("health_ttl_ms")) cfg.stt.health_ttl_ms = s["health_ttl_ms"];
    }

    // TTS config
    if (j.contains("tts")) {
        auto& t = j["tts"];
        if (t.contains("backend")) cfg.tts.backend = t["backend"];
        if (t.contains("voice_path")) cfg.tts.voice_path = t["voice_path"];
        if (t.contains("voice_url")) cfg.tts.voice_url = t["voice_url"];
        if (t.contains("piper_path")) cfg.tts.piper_path = t["piper_path"];
        if (t.contains("espeak_data_path")) cfg.tts.espeak_data_path = t["espeak_data_path"];
        if (t.contains("api_url")) cfg.tts.api_url = t["api_url"];
        if (t.contains("api_model")) cfg.tts.api_model = t["api_model"];
        if (t.contains("api_voice")) cfg.tts.api_voice = t["api_voice"];
        if (t.contains("api_key")) cfg.tts.api_key = t["api_key"];
        if (t.contains("local_playback")) cfg.tts.local_playback = t["local_playback"];
        if (t.contains("output_device")) cfg.tts.output_device = t["output_device"];
        if (t.contains("auto_speak")) cfg.tts.auto_speak = t["auto_speak"];
        if (t.contains("stage_timeout_ms")) cfg.tts.stage_timeout_ms = t["stage_timeout_ms"];
        if (t.contains("select_timeout_ms")) cfg.tts.select_timeout_ms = t["select_timeout_ms"];
        if (t.contains("health_ttl_ms")) cfg.tts.health_ttl_ms = t["health_ttl_ms"];
    }

    // Asset cache
    if (j.contains("assets")) {
        auto& a = j["assets"];
        if (a.contains("cache_dir")) cfg.assets.cache_dir = a["cache_dir"];
        if (a.contains("timeout_ms")) cfg.assets.timeout_ms = a["timeout_ms"];
    }

    // Tools config
    if (j.contains("tools")) {
        auto& tools = j["tools"];
        if (tools.contains("timeout_ms")) cfg.tools.timeout_ms = tools["timeout_ms"];
        if (tools.contains("max_concurrent")) cfg.tools.max_concurrent = tools["max_concurrent"];
        if (tools.contains("allow_sudo")) cfg.tools.allow_sudo = tools["allow_sudo"];
        if (tools.contains("max_output_chars")) cfg.tools.max_output_chars = tools["max_output_chars"];
        if (tools.contains("search_max_results")) cfg.tools.search_max_results = tools["search_max_results"];
        if (tools.contains("search_endpoint")) cfg.tools.search_endpoint = tools["search_endpoint"];
        if (tools.contains("enabled") && tools["enabled"].is_array()) {
            read_string_list(tools["enabled"], cfg.tools.enabled);
        }
    }

    // Logging
    if (j.contains("logging")) {
        auto& lg = j["logging"];
        if (lg.contains("level")) cfg.logging.level = lg["level"];
        if (lg.contains("file")) cfg.logging.file = lg["file"];
    }
}

} // anonymous namespace

namespace conductor {

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::ifstream file(path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + path + ". Using defaults.");
    } else {
        json j;
        try {
            file >> j;
            apply_json_to_config(cfg, j);
        } catch (const json::exception& e) {
            Logger::error("Error parsing config JSON: " + std::string(e.what()));
            cfg = Config();
        }
    }

    cfg.apply_env_overrides();
    cfg.expand_paths();
    return cfg;
}

void Config::apply_env_overrides() {
    if (const char* v = env_value("MAX_ITERATIONS")) {
        int parsed = std::atoi(v);
        if (parsed > 0) {
            agent.max_iterations = parsed;
        } else {
            Logger::warn(std::string("Ignoring invalid MAX_ITERATIONS: ") + v);
        }
    }
    if (const char* v = env_value("MODEL_ID")) llm.model_id = v;
    if (const char* v = env_value("LLM_BASE_URL")) llm.base_url = v;
    if (const char* v = env_value("LLM_API_KEY")) llm.api_key = v;
    if (const char* v = env_value("STS_TRANSCRIBE_BACKEND")) stt.backend = v;
    if (const char* v = env_value("STS_TTS_BACKEND")) tts.backend = v;
    if (const char* v = env_value("WHISPER_API_URL")) stt.api_url = v;
    if (const char* v = env_value("WHISPER_MODEL")) stt.api_model = v;
    if (const char* v = env_value("CONDUCTOR_LOG_LEVEL")) logging.level = v;
}

void Config::expand_paths() {
    if (!stt.model_path.empty()) stt.model_path = expand_path(stt.model_path);
    if (!tts.voice_path.empty()) tts.voice_path = expand_path(tts.voice_path);
    if (!tts.piper_path.empty()) tts.piper_path = expand_path(tts.piper_path);
    if (!tts.espeak_data_path.empty()) tts.espeak_data_path = expand_path(tts.espeak_data_path);
    if (!assets.cache_dir.empty()) assets.cache_dir = expand_path(assets.cache_dir);
    if (!logging.file.empty()) logging.file = expand_path(logging.file);
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["agent"]["max_iterations"] = agent.max_iterations;
    j["agent"]["delegate_timeout_ms"] = agent.delegate_timeout_ms;
    j["agent"]["max_duration_ms"] = agent.max_duration_ms;
    j["agent"]["request_timeout_ms"] = agent.request_timeout_ms;
    j["agent"]["system_prompt"] = agent.system_prompt;

    j["queue"]["capacity"] = queue.capacity;
    j["queue"]["retain_completed"] = queue.retain_completed;

    j["llm"]["base_url"] = llm.base_url;
    j["llm"]["model_id"] = llm.model_id;
    j["llm"]["timeout_ms"] = llm.timeout_ms;
    j["llm"]["max_tokens"] = llm.max_tokens;
    j["llm"]["temperature"] = llm.temperature;

    j["stt"]["backend"] = stt.backend;
    j["stt"]["api_url"] = stt.api_url;
    j["stt"]["api_model"] = stt.api_model;
    j["stt"]["model_path"] = stt.model_path;
    j["stt"]["model_url"] = stt.model_url;
    j["stt"]["language"] = stt.language;
    j["stt"]["use_gpu"] = stt.use_gpu;
    j["stt"]["stage_timeout_ms"] = stt.stage_timeout_ms;
    j["stt"]["select_timeout_ms"] = stt.select_timeout_ms;
    j["stt"]["health_ttl_ms"] = stt.health_ttl_ms;

    j["tts"]["backend"] = tts.backend;
    j["tts"]["voice_path"] = tts.voice_path;
    j["tts"]["voice_url"] = tts.voice_url;
    j["tts"]["piper_path"] = tts.piper_path;
    j["tts"]["espeak_data_path"] = tts.espeak_data_path;
    j["tts"]["api_url"] = tts.api_url;
    j["tts"]["api_model"] = tts.api_model;
    j["tts"]["api_voice"] = tts.api_voice;
    j["tts"]["local_playback"] = tts.local_playback;
    j["tts"]["output_device"] = tts.output_device;
    j["tts"]["auto_speak"] = tts.auto_speak;
    j["tts"]["stage_timeout_ms"] = tts.stage_timeout_ms;
    j["tts"]["select_timeout_ms"] = tts.select_timeout_ms;
    j["tts"]["health_ttl_ms"] = tts.health_ttl_ms;

    j["assets"]["cache_dir"] = assets.cache_dir;
    j["assets"]["timeout_ms"] = assets.timeout_ms;

    j["tools"]["enabled"] = tools.enabled;
    j["tools"]["timeout_ms"] = tools.timeout_ms;
    j["tools"]["max_concurrent"] = tools.max_concurrent;
    j["tools"]["allow_sudo"] = tools.allow_sudo;
    j["tools"]["max_output_chars"] = tools.max_output_chars;
    j["tools"]["search_max_results"] = tools.search_max_results;
    j["tools"]["search_endpoint"] = tools.search_endpoint;

    j["logging"]["level"] = logging.level;
    j["logging"]["file"] = logging.file;

    // API keys are never written back
    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Could not write config file: " + path);
        return;
    }
    file << j.dump(2) << std::endl;
}

} // namespace conductor
