#pragma once

/**
 * @file delegate_manifest.h
 * @brief Startup registration of the built-in delegates
 */

#include "config.h"
#include "delegate_registry.h"
#include "reasoning_backend.h"
#include "delegates/web_search_delegate.h"
#include <memory>
#include <string>
#include <vector>

namespace conductor {

class SpeechPipeline;

/**
 * @brief What the built-in delegates need from the application
 */
struct DelegateManifest {
    std::shared_ptr<ReasoningBackend> backend;   ///< Shared by the sub-agents
    WebSearchDelegate::Fetch search_fetch;       ///< web_search is skipped when unset
    SpeechPipeline* pipeline = nullptr;          ///< speak is skipped when null
};

/**
 * @brief Every name tools.enabled may list
 *
 * command_line_agent, web_search_agent, speak, execute_command, web_search.
 * The last two register the tool directly on the top-level agent.
 */
std::vector<std::string> known_delegates();

/**
 * @brief Names registered when tools.enabled is empty
 */
std::vector<std::string> default_delegates();

/**
 * @brief Register the built-in delegates selected by config.tools.enabled
 * @return Names actually registered, in registration order
 */
std::vector<std::string> register_builtin_delegates(DelegateRegistry& registry,
                                                    const Config& config,
                                                    const DelegateManifest& manifest);

} // namespace conductor
