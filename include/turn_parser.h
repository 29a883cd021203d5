#pragma once

#include "turn.h"
#include "errors.h"
#include <string>

namespace conductor {

/**
 * @brief Parses raw reasoning-backend output into a validated Turn
 *
 * Accepted shapes (after extracting the first balanced JSON object from the text):
 *   {"observation": "...", "plan": [...], "action": "tool",
 *    "response": {"delegate": "search", "args": {"q": "..."}}}
 *   {"action": "tool", "response": "search({\"q\": \"...\"})"}
 *   {"action": "answer", "response": "text" | ["line", ...]}
 * Everything else is a MalformedTurn error with a reason.
 */
class TurnParser {
public:
    static Result<Turn> parse(const std::string& text);

    /**
     * @brief Return the first balanced {...} span in text, honoring JSON strings
     * @return Empty string if there is none
     */
    static std::string extract_json_object(const std::string& text);

    /**
     * @brief Parse `name({...})` call syntax
     *
     * Arguments that are not valid JSON become {"query": <raw>}.
     */
    static Result<DelegateCall> parse_call_expression(const std::string& expr);
};

} // namespace conductor
