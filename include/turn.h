#pragma once

#include "errors.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace conductor {

/**
 * @brief What a Turn asks the loop to do next
 */
enum class TurnAction {
    Tool,    ///< Invoke a delegate and loop
    Answer   ///< Final answer, terminal
};

/// "tool" | "answer"
const char* turn_action_name(TurnAction action);

/**
 * @brief Structured delegate invocation request
 */
struct DelegateCall {
    std::string delegate;
    nlohmann::json args = nlohmann::json::object();
};

/**
 * @brief One iteration of the reasoning loop
 *
 * Produced by the reasoning backend; the loop fills `iteration` and
 * `outcome` before appending it to the request trace. A Turn in a trace is
 * never modified again.
 */
struct Turn {
    int iteration = 0;                 ///< 1-based position in the trace
    std::string observation;           ///< What the backend saw (prior result or request)
    std::vector<std::string> plan;     ///< Advisory steps
    TurnAction action = TurnAction::Answer;
    DelegateCall call;                 ///< Valid when action == Tool
    std::string answer;                ///< Valid when action == Answer
    std::string outcome;               ///< Delegate result or failure text
    bool outcome_ok = true;            ///< False when outcome describes a delegate failure

    bool is_tool() const { return action == TurnAction::Tool; }
    bool is_answer() const { return action == TurnAction::Answer; }

    /**
     * @brief Lossless JSON form
     *
     * {"iteration", "observation", "plan", "action", "response", "outcome", "outcome_ok"};
     * `response` is {"delegate", "args"} for tool Turns and a string for answers.
     */
    nlohmann::json to_json() const;

    /**
     * @brief Strict inverse of to_json
     * @return MalformedTurn when `action` is missing or unknown, or `response`
     *         does not match the action
     */
    static Result<Turn> from_json(const nlohmann::json& j);
};

/**
 * @brief Build a tool Turn (used by test doubles and sub-agents)
 */
Turn make_tool_turn(const std::string& delegate, const nlohmann::json& args,
                    const std::string& observation = "",
                    const std::vector<std::string>& plan = {});

/**
 * @brief Build an answer Turn
 */
Turn make_answer_turn(const std::string& answer,
                      const std::string& observation = "",
                      const std::vector<std::string>& plan = {});

} // namespace conductor
