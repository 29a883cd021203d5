#include "app_context.h"
#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include "utils.h"
#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <mutex>
#include <unistd.h>

namespace conductor {

static std::atomic<bool> g_shutdown(false);

void signal_handler(int) {
    g_shutdown = true;
    // Unblocks the getline() in the REPL
    close(STDIN_FILENO);
}

namespace {

std::mutex g_out_mutex;

void print_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_out_mutex);
    std::cout << line << std::endl;
}

void print_error(const Error& error) {
    print_line(nlohmann::json{{"type", "error"},
                              {"timestamp", utc_timestamp()},
                              {"data", {{"error_type", error_type_name(error.type)},
                                        {"message", error.message}}}}.dump());
}

void print_help() {
    print_line("Commands:\n"
               "  <text>               submit a request\n"
               "  /stt <id>            switch transcription backend\n"
               "  /tts <id>            switch synthesis backend\n"
               "  /health              backend health as JSON\n"
               "  /cancel <request-id> cancel a queued or running request\n"
               "  /status <request-id> request record as JSON\n"
               "  /speak <wav-path>    transcribe, reason and synthesize a WAV file\n"
               "  /quit                exit");
}

template<typename Registry>
void switch_backend(Registry& registry, const std::string& id) {
    if (id.empty()) {
        print_line("usage: /stt <id> or /tts <id>");
        return;
    }
    auto selected = registry.select(id);
    if (selected.is_error()) {
        print_error(selected.error());
        return;
    }
    print_line(nlohmann::json{{"type", "backend_selected"}, {"data", {{"id", id}}}}.dump());
}

void run_speech(AppContext& ctx, const std::string& path) {
    auto bytes = read_file_bytes(path);
    if (bytes.is_error()) {
        print_error(bytes.error());
        return;
    }
    AudioClip clip;
    clip.bytes = std::move(bytes.value());
    clip.filename = file_name(path);

    auto result = ctx.pipeline().process(clip);
    if (result.is_error()) {
        print_line(nlohmann::json{{"type", "error"},
                                  {"timestamp", utc_timestamp()},
                                  {"data", result.error().to_json()}}.dump());
        return;
    }
    const SpeechExchange& exchange = result.value();
    if (exchange.speech && exchange.speech->mode == tts::SynthesisMode::AudioBytes) {
        const std::string out_path = path + ".reply.wav";
        auto written = write_file_bytes(out_path, exchange.speech->audio.bytes);
        if (written.is_error()) {
            print_error(written.error());
        } else {
            Logger::info("Reply audio written to " + out_path);
        }
    }
    print_line(nlohmann::json{{"type", "speech_exchange"},
                              {"timestamp", utc_timestamp()},
                              {"data", exchange.to_json()}}.dump());
}

void handle_command(AppContext& ctx, const std::string& line, bool& quit) {
    size_t space = line.find(' ');
    const std::string command = line.substr(0, space);
    const std::string arg = space == std::string::npos ? "" : utils::trim_copy(line.substr(space + 1));

    if (command == "/quit" || command == "/exit") {
        quit = true;
    } else if (command == "/help") {
        print_help();
    } else if (command == "/stt") {
        switch_backend(ctx.transcription(), arg);
    } else if (command == "/tts") {
        switch_backend(ctx.synthesis(), arg);
    } else if (command == "/health") {
        print_line(ctx.health_report().dump(2));
    } else if (command == "/cancel") {
        auto cancelled = ctx.queue().cancel(arg);
        if (cancelled.is_error()) print_error(cancelled.error());
    } else if (command == "/status") {
        auto record = ctx.queue().snapshot(arg);
        if (!record) {
            print_error(make_error(ErrorType::UnknownRequest, "unknown request: " + arg));
        } else {
            print_line(record->to_json().dump(2));
        }
    } else if (command == "/speak") {
        run_speech(ctx, expand_path(arg));
    } else {
        print_line("Unknown command " + command + " (try /help)");
    }
}

std::string default_config_path() {
    // Config next to the executable (e.g. build/../config/config.json)
    char buf[1024];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len != -1) {
        buf[len] = '\0';
        std::string exe_dir = parent_path(std::string(buf));
        std::string candidate = exe_dir + "/../config/config.json";
        std::ifstream test(candidate);
        if (test.good()) {
            return candidate;
        }
    }
    return "config/config.json";
}

} // anonymous namespace

} // namespace conductor

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : conductor::default_config_path();
    conductor::Config config = conductor::Config::load_from_file(config_path);
    // Before this point the logger prints INFO and above to the console
    conductor::Logger::initialize(conductor::parse_log_level(config.logging.level), config.logging.file);

    std::signal(SIGINT, conductor::signal_handler);
    std::signal(SIGTERM, conductor::signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    {
        conductor::AppContext ctx(config);
        ctx.queue().subscribe([](const conductor::ProgressEvent& event) {
            conductor::print_line(event.to_json().dump());
        });
        ctx.start();
        conductor::print_help();

        std::string line;
        bool quit = false;
        while (!quit && !conductor::g_shutdown && std::getline(std::cin, line)) {
            conductor::utils::trim(line);
            if (line.empty()) continue;
            if (line[0] == '/') {
                conductor::handle_command(ctx, line, quit);
                continue;
            }
            auto submitted = ctx.queue().submit(line);
            if (submitted.is_error()) {
                conductor::print_error(submitted.error());
            }
        }

        conductor::Logger::info("Shutting down...");
        ctx.stop();
    }

    conductor::Logger::shutdown();
    return 0;
}
