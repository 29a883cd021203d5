#include "delegates/delegate_manifest.h"
#include "delegates/command_line_delegate.h"
#include "delegates/speak_delegate.h"
#include "delegates/sub_agent_delegate.h"
#include "logger.h"
#include <algorithm>

namespace conductor {

namespace {

LoopOptions sub_agent_options(const Config& config) {
    LoopOptions options;
    options.max_iterations = config.agent.max_iterations;
    options.delegate_timeout_ms = config.tools.timeout_ms + 1000;
    options.max_duration_ms = config.agent.max_duration_ms;
    return options;
}

std::shared_ptr<Delegate> make_command_tool(const Config& config) {
    CommandLineOptions options;
    options.timeout_ms = config.tools.timeout_ms;
    options.allow_sudo = config.tools.allow_sudo;
    options.max_output_chars = config.tools.max_output_chars;
    return std::make_shared<CommandLineDelegate>(options);
}

std::shared_ptr<Delegate> make_search_tool(const Config& config, const DelegateManifest& manifest) {
    return std::make_shared<WebSearchDelegate>(manifest.search_fetch, config.tools.search_endpoint,
                                               config.tools.search_max_results);
}

std::shared_ptr<Delegate> make_delegate(const std::string& name, const Config& config,
                                        const DelegateManifest& manifest) {
    if (name == "execute_command") {
        return make_command_tool(config);
    }
    if (name == "web_search") {
        if (!manifest.search_fetch) return nullptr;
        return make_search_tool(config, manifest);
    }
    if (name == "speak") {
        if (!manifest.pipeline) return nullptr;
        return std::make_shared<SpeakDelegate>(*manifest.pipeline);
    }
    if (name == "command_line_agent") {
        if (!manifest.backend) return nullptr;
        auto agent = std::make_shared<SubAgentDelegate>(
            name,
            "Executes safe, non-interactive shell commands on the local machine.\n"
            "Best for inspecting files, running quick dev commands and collecting local environment facts.\n"
            "Safety: blocks sudo, rm -rf, dd, mkfs and fork bombs. Output truncated to ~4k chars.",
            manifest.backend, sub_agent_options(config));
        agent->add_delegate(make_command_tool(config));
        return agent;
    }
    if (name == "web_search_agent") {
        if (!manifest.backend || !manifest.search_fetch) return nullptr;
        auto agent = std::make_shared<SubAgentDelegate>(
            name,
            "Internet research agent using DuckDuckGo.\n"
            "Best for time-sensitive facts, official docs and quick comparisons with URLs.",
            manifest.backend, sub_agent_options(config));
        agent->add_delegate(make_search_tool(config, manifest));
        return agent;
    }
    return nullptr;
}

} // anonymous namespace

std::vector<std::string> known_delegates() {
    return {"command_line_agent", "web_search_agent", "speak", "execute_command", "web_search"};
}

std::vector<std::string> default_delegates() {
    return {"command_line_agent", "web_search_agent", "speak"};
}

std::vector<std::string> register_builtin_delegates(DelegateRegistry& registry,
                                                    const Config& config,
                                                    const DelegateManifest& manifest) {
    const std::vector<std::string> known = known_delegates();
    const std::vector<std::string> wanted = config.tools.enabled.empty() ? default_delegates()
                                                                         : config.tools.enabled;
    std::vector<std::string> registered;

    for (const auto& name : wanted) {
        if (std::find(known.begin(), known.end(), name) == known.end()) {
            Logger::warn("Unknown delegate in tools.enabled: " + name);
            continue;
        }
        auto delegate = make_delegate(name, config, manifest);
        if (!delegate) {
            Logger::warn("Delegate " + name + " skipped: its dependencies are not available");
            continue;
        }
        if (registry.register_delegate(delegate)) {
            registered.push_back(name);
        }
    }
    return registered;
}

} // namespace conductor
