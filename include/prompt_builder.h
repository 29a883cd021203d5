#pragma once

#include "reasoning_backend.h"
#include "common.h"
#include <string>

namespace conductor {

/**
 * @brief Renders a ReasoningContext into the single user prompt sent to the model
 *
 * Sections, in order: system prompt, CONTEXT (local and UTC time),
 * TRACE (completed Turns), the delegate catalogue, RESPONSE FORMAT and
 * CURRENT REQUEST. Empty sections are omitted.
 */
class PromptBuilder {
public:
    explicit PromptBuilder(std::string system_prompt = "")
        : system_prompt_(std::move(system_prompt)) {}

    std::string render(const ReasoningContext& context, WallTime now = WallClock::now()) const;

    /// Numbered history of completed Turns; empty when the trace is empty
    static std::string render_trace(const std::vector<Turn>& trace, size_t max_outcome_chars = 2000);

    /// Field list and output rules for the JSON Turn object
    static std::string response_format();

    const std::string& system_prompt() const { return system_prompt_; }

private:
    std::string system_prompt_;
};

} // namespace conductor
