/**
 * Configuration: defaults, file loading, environment overrides and the
 * fallback to defaults on unreadable input.
 *
 * Run from build dir: ./test_config
 */

#include "test_support.h"
#include "config.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>

using namespace conductor;

namespace {

std::string temp_path(const std::string& name) {
    return "/tmp/conductor_test_" + std::to_string(::getpid()) + "_" + name;
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

const char* kOverrideVars[] = {
    "MAX_ITERATIONS", "MODEL_ID", "LLM_BASE_URL", "LLM_API_KEY", "STS_TRANSCRIBE_BACKEND",
    "STS_TTS_BACKEND", "WHISPER_API_URL", "WHISPER_MODEL", "CONDUCTOR_LOG_LEVEL"
};

void clear_env() {
    for (const char* name : kOverrideVars) {
        ::unsetenv(name);
    }
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::ERROR);
    clear_env();

    // --- defaults ---
    {
        Config cfg;
        ASSERT(cfg.agent.max_iterations == 8);
        ASSERT(cfg.queue.capacity == 0);
        ASSERT(cfg.stt.backend == "whisper_api");
        ASSERT(cfg.tts.backend == "piper");
        ASSERT(cfg.stt.health_ttl_ms == 5000);
        ASSERT(cfg.tools.enabled.empty());
        ASSERT(cfg.tools.allow_sudo == false);
    }

    // --- missing file: defaults ---
    {
        Config cfg = Config::load_from_file(temp_path("does_not_exist.json"));
        ASSERT(cfg.agent.max_iterations == 8);
        ASSERT(cfg.llm.model_id == Config().llm.model_id);
    }

    // --- file values, unknown keys ignored, ~ expanded ---
    {
        std::string path = temp_path("config.json");
        write_file(path, R"({
            "agent": {"max_iterations": 3, "delegate_timeout_ms": 1500},
            "queue": {"capacity": 4},
            "llm": {"model_id": "llama3", "temperature": 0.5},
            "stt": {"backend": "whisper_local", "model_path": "~/models/base.bin"},
            "tts": {"backend": "speech_api", "auto_speak": false},
            "tools": {"enabled": ["execute_command", 7, "web_search"], "allow_sudo": true},
            "unrelated": {"anything": 1}
        })");
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.agent.max_iterations == 3);
        ASSERT(cfg.agent.delegate_timeout_ms == 1500);
        ASSERT(cfg.queue.capacity == 4);
        ASSERT(cfg.llm.model_id == "llama3");
        ASSERT(cfg.stt.backend == "whisper_local");
        ASSERT(cfg.tts.backend == "speech_api");
        ASSERT(cfg.tts.auto_speak == false);
        ASSERT(cfg.tools.allow_sudo);
        ASSERT(cfg.tools.enabled.size() == 2);
        if (std::getenv("HOME")) {
            ASSERT(cfg.stt.model_path.find('~') == std::string::npos);
        }
        ASSERT(cfg.stt.model_path.find("models/base.bin") != std::string::npos);
        // Untouched sections keep their defaults
        ASSERT(cfg.tts.stage_timeout_ms == 30000);

        // --- environment wins over the file ---
        ::setenv("MAX_ITERATIONS", "12", 1);
        ::setenv("MODEL_ID", "qwen-from-env", 1);
        ::setenv("STS_TRANSCRIBE_BACKEND", "whisper_api", 1);
        ::setenv("STS_TTS_BACKEND", "piper", 1);
        Config env = Config::load_from_file(path);
        ASSERT(env.agent.max_iterations == 12);
        ASSERT(env.llm.model_id == "qwen-from-env");
        ASSERT(env.stt.backend == "whisper_api");
        ASSERT(env.tts.backend == "piper");

        ::setenv("MAX_ITERATIONS", "zero", 1);
        Config bad_env = Config::load_from_file(path);
        ASSERT(bad_env.agent.max_iterations == 3);
        clear_env();

        // --- save then reload keeps values, never writes API keys ---
        Config saved = cfg;
        saved.llm.api_key = "secret-key";
        std::string out_path = temp_path("saved.json");
        saved.save_to_file(out_path);
        std::ifstream in(out_path);
        std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        ASSERT(text.find("secret-key") == std::string::npos);
        Config reloaded = Config::load_from_file(out_path);
        ASSERT(reloaded.agent.max_iterations == 3);
        ASSERT(reloaded.queue.capacity == 4);
        ASSERT(reloaded.tools.enabled.size() == 2);

        std::remove(path.c_str());
        std::remove(out_path.c_str());
    }

    // --- invalid JSON: defaults ---
    {
        std::string path = temp_path("broken.json");
        write_file(path, "{ \"agent\": { \"max_iterations\": 2, ");
        Config cfg = Config::load_from_file(path);
        ASSERT(cfg.agent.max_iterations == 8);
        std::remove(path.c_str());

        std::string wrong_type = temp_path("wrong_type.json");
        write_file(wrong_type, R"({"agent": {"max_iterations": 2}, "llm": {"model_id": 42}})");
        Config typed = Config::load_from_file(wrong_type);
        ASSERT(typed.agent.max_iterations == 8);
        ASSERT(typed.llm.model_id == Config().llm.model_id);
        std::remove(wrong_type.c_str());
    }

    // --- log level names and per-thread context ---
    {
        ASSERT(parse_log_level("WARNING") == LogLevel::WARN);
        ASSERT(parse_log_level("verbose") == LogLevel::INFO);
        ASSERT(Logger::current_context().empty());
        {
            ScopedLogContext request("req-7");
            {
                ScopedLogContext agent("researcher");
                ASSERT(Logger::current_context() == "req-7/researcher");
                std::string other;
                std::thread([&] { other = Logger::current_context(); }).join();
                ASSERT(other.empty());
            }
            ASSERT(Logger::current_context() == "req-7");
        }
        ASSERT(Logger::current_context().empty());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
