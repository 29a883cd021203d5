#include "prompt_builder.h"
#include "utils.h"
#include <sstream>
#include <vector>

namespace conductor {

std::string PromptBuilder::render(const ReasoningContext& context, WallTime now) const {
    std::vector<std::string> parts;

    if (!utils::is_empty_or_whitespace(system_prompt_)) {
        parts.push_back(utils::trim_copy(system_prompt_));
    }

    std::ostringstream ctx;
    ctx << "## CONTEXT\n"
        << "Current local time: " << local_timestamp(now) << "\n"
        << "Current UTC time: " << utc_timestamp(now) << "\n"
        << "Iteration: " << context.iteration << " of " << context.max_iterations;
    if (context.remaining() <= 1) {
        ctx << "\nThis is your last turn: answer now with what you have.";
    }
    parts.push_back(ctx.str());

    std::string trace = render_trace(context.trace);
    if (!trace.empty()) {
        parts.push_back(trace);
        parts.push_back("## LATEST OBSERVATION\n\n" + context.observation);
    }

    if (!context.catalogue.empty()) {
        parts.push_back(context.catalogue +
                        "\n## DELEGATE INVOCATION FORMAT\n\n"
                        "Use exact format: delegate_name({\"param\": \"value\"})\n"
                        "For sub-agents: agent_name({\"query\": \"task description\"})");
    }

    parts.push_back(response_format());
    std::string request = "## CURRENT REQUEST\n\n" + context.input;
    if (!context.media.empty()) {
        request += "\n\n(" + std::to_string(context.media.size()) + " image(s) attached to this request)";
    }
    parts.push_back(request);
    return utils::join(parts, "\n\n");
}

std::string PromptBuilder::render_trace(const std::vector<Turn>& trace, size_t max_outcome_chars) {
    if (trace.empty()) return "";

    std::ostringstream oss;
    oss << "## TRACE\n";
    int index = 1;
    for (const auto& turn : trace) {
        oss << "\n" << index++ << ". ";
        if (turn.is_tool()) {
            oss << "[TOOL] " << turn.call.delegate << "(" << turn.call.args.dump() << ")";
        } else {
            oss << "[ANSWER] " << turn.answer;
        }
        if (!turn.observation.empty()) {
            oss << "\n   observation: " << turn.observation;
        }
        if (turn.is_tool()) {
            oss << "\n   " << (turn.outcome_ok ? "result" : "failed") << ": "
                << utils::truncate_with_marker(turn.outcome, max_outcome_chars);
        }
    }
    return oss.str();
}

std::string PromptBuilder::response_format() {
    return "## RESPONSE FORMAT\n\n"
           "Respond with a single JSON object containing these fields:\n\n"
           "- **observation** (string): what you learned from the latest observation\n"
           "- **plan** (list): the remaining steps, shortest first\n"
           "- **action** (string): exactly \"tool\" or exactly \"answer\"\n"
           "- **response** (string | object): for \"answer\", the final answer text; for \"tool\", "
           "{\"delegate\": \"name\", \"args\": {...}} or name({\"key\": \"value\"})\n\n"
           "Never write a delegate name in 'action'.\n"
           "Important: Output ONLY the JSON object, no markdown fences.";
}

} // namespace conductor
