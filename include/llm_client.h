#pragma once

#include "config.h"
#include "errors.h"
#include "reasoning_backend.h"
#include "backend/backend_provider.h"
#include <string>
#include <memory>

namespace conductor {

/**
 * @brief Chat-completion reasoning backend (OpenAI-compatible /chat/completions)
 *
 * Renders the ReasoningContext with PromptBuilder, posts it as a single user
 * message after the system prompt, and parses the reply with TurnParser.
 * Transport failures and non-2xx replies are NetworkError; a reply that is
 * not a Turn is MalformedTurn.
 */
class LLMClient : public ReasoningBackend {
public:
    LLMClient(const LLMConfig& config, const std::string& system_prompt);
    ~LLMClient() override;

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    Result<Turn> complete(const ReasoningContext& context) override;

    /**
     * @brief Raw completion: returns the assistant message content
     * @param timeout_ms Timeout in ms (0 = use config default)
     */
    Result<std::string> chat(const std::string& system_prompt,
                             const std::string& user_message,
                             int timeout_ms = 0);

    /**
     * @brief GET {base_url}/models; ready when the server answers below 500
     */
    HealthProbe probe(int timeout_ms = 3000) const;

    const std::string& model_id() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace conductor
