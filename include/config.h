#pragma once

#include <string>
#include <cstdint>
#include <cstddef>
#include <vector>

namespace conductor {

/// Reasoning loop budget and prompt
struct AgentConfig {
    int max_iterations = 8;             ///< Turns per request before BudgetExceeded
    int delegate_timeout_ms = 30000;    ///< Per delegate invocation
    int max_duration_ms = 0;            ///< Wall-clock cap per run (0 = none)
    int request_timeout_ms = 120000;    ///< Reasoning stage bound inside the speech pipeline
    std::string system_prompt = "You are a helpful assistant that completes the user's request by "
                                "calling delegates when needed and answering concisely when done.";
};

struct QueueConfig {
    size_t capacity = 0;             ///< 0 = unbounded
    size_t retain_completed = 100;   ///< Terminal records kept for status/wait
};

/// OpenAI-compatible chat completion endpoint
struct LLMConfig {
    std::string base_url = "http://localhost:11434/v1";
    std::string api_key;
    std::string model_id = "qwen2.5:7b";
    int timeout_ms = 60000;
    int max_tokens = 0;  ///< 0 = server default
    float temperature = 0.2f;
};

struct STTConfig {
    std::string backend = "whisper_api";  ///< Preferred provider id
    std::string api_url = "http://localhost:8000/v1";
    std::string api_model = "whisper-1";
    std::string api_key;
    /// whisper.cpp ggml model; fetched from model_url when missing
    std::string model_path = "~/.cache/conductor/models/ggml-base.en.bin";
    std::string model_url = "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-base.en.bin";
    std::string language = "en";
    bool use_gpu = true;
    int stage_timeout_ms = 30000;
    int select_timeout_ms = 60000;
    int health_ttl_ms = 5000;
};

struct TTSConfig {
    std::string backend = "piper";  ///< Preferred provider id
    std::string voice_path = "~/.cache/conductor/voices/en_US-lessac-medium.onnx";
    std::string voice_url = "https://huggingface.co/rhasspy/piper-voices/resolve/main/en/en_US/lessac/medium/en_US-lessac-medium.onnx";
    std::string piper_path;        ///< Piper binary path (empty = auto-detect)
    std::string espeak_data_path;  ///< espeak-ng data dir (empty = piper default)
    std::string api_url = "http://localhost:8880/v1";
    std::string api_model = "tts-1";
    std::string api_voice = "alloy";
    std::string api_key;
    bool local_playback = false;   ///< Play synthesized audio on the output device
    std::string output_device;
    bool auto_speak = true;        ///< Run synthesis at the end of the speech pipeline
    int stage_timeout_ms = 30000;
    int select_timeout_ms = 60000;
    int health_ttl_ms = 5000;
};

struct AssetsConfig {
    std::string cache_dir = "~/.cache/conductor";
    int timeout_ms = 600000;
};

struct ToolsConfig {
    /// Delegates registered at startup; empty = all known delegates
    std::vector<std::string> enabled;
    int timeout_ms = 10000;          ///< Command execution timeout
    size_t max_concurrent = 2;       ///< Delegate executor workers
    bool allow_sudo = false;
    size_t max_output_chars = 4000;
    int search_max_results = 5;
    std::string search_endpoint = "https://api.duckduckgo.com/";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;  ///< Empty = console only
};

struct Config {
    AgentConfig agent;
    QueueConfig queue;
    LLMConfig llm;
    STTConfig stt;
    TTSConfig tts;
    AssetsConfig assets;
    ToolsConfig tools;
    LoggingConfig logging;

    /// Missing or unreadable file yields defaults (with a warning); env overrides always apply.
    static Config load_from_file(const std::string& path);

    /// Apply MAX_ITERATIONS, MODEL_ID, LLM_BASE_URL, LLM_API_KEY, STS_TRANSCRIBE_BACKEND,
    /// STS_TTS_BACKEND, WHISPER_API_URL, WHISPER_MODEL and CONDUCTOR_LOG_LEVEL.
    void apply_env_overrides();

    /// Expand ~ in every path field.
    void expand_paths();

    void save_to_file(const std::string& path) const;
};

} // namespace conductor
