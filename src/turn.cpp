#include "turn.h"
#include "utils.h"

using json = nlohmann::json;

namespace conductor {

namespace {

Error malformed(const std::string& reason) {
    return make_error(ErrorType::MalformedTurn, reason);
}

/// Arguments given as a JSON-looking string are decoded; anything else is a query.
json coerce_args(const json& raw) {
    if (raw.is_null()) return json::object();
    if (raw.is_object()) return raw;
    if (raw.is_string()) {
        std::string text = utils::trim_copy(raw.get<std::string>());
        if (text.empty()) return json::object();
        try {
            json parsed = json::parse(text);
            if (parsed.is_object()) return parsed;
        } catch (const json::exception&) {
            // not JSON, fall through
        }
        return json{{"query", raw.get<std::string>()}};
    }
    return json{{"query", raw.dump()}};
}

} // anonymous namespace

const char* turn_action_name(TurnAction action) {
    switch (action) {
        case TurnAction::Tool: return "tool";
        case TurnAction::Answer: return "answer";
    }
    return "answer";
}

json Turn::to_json() const {
    json j;
    j["iteration"] = iteration;
    j["observation"] = observation;
    j["plan"] = plan;
    j["action"] = turn_action_name(action);
    if (action == TurnAction::Tool) {
        j["response"] = {{"delegate", call.delegate}, {"args", call.args}};
    } else {
        j["response"] = answer;
    }
    j["outcome"] = outcome;
    j["outcome_ok"] = outcome_ok;
    return j;
}

Result<Turn> Turn::from_json(const json& j) {
    if (!j.is_object()) {
        return malformed("turn is not a JSON object");
    }
    if (!j.contains("action") || !j["action"].is_string()) {
        return malformed("missing required field 'action'");
    }
    if (!j.contains("response")) {
        return malformed("missing required field 'response'");
    }

    Turn turn;
    std::string action = utils::normalize_copy(utils::trim_copy(j["action"].get<std::string>()));
    if (action == "tool") {
        turn.action = TurnAction::Tool;
    } else if (action == "answer") {
        turn.action = TurnAction::Answer;
    } else {
        return malformed("unknown action '" + j["action"].get<std::string>() + "'");
    }

    if (j.contains("iteration") && j["iteration"].is_number_integer()) {
        turn.iteration = j["iteration"].get<int>();
    }
    if (j.contains("observation")) {
        const auto& obs = j["observation"];
        turn.observation = obs.is_string() ? obs.get<std::string>() : (obs.is_null() ? "" : obs.dump());
    }
    if (j.contains("plan")) {
        const auto& plan = j["plan"];
        if (plan.is_array()) {
            for (const auto& step : plan) {
                turn.plan.push_back(step.is_string() ? step.get<std::string>() : step.dump());
            }
        } else if (plan.is_string() && !plan.get<std::string>().empty()) {
            turn.plan.push_back(plan.get<std::string>());
        }
    }
    if (j.contains("outcome") && j["outcome"].is_string()) {
        turn.outcome = j["outcome"].get<std::string>();
    }
    if (j.contains("outcome_ok") && j["outcome_ok"].is_boolean()) {
        turn.outcome_ok = j["outcome_ok"].get<bool>();
    }

    const auto& response = j["response"];
    if (turn.action == TurnAction::Tool) {
        if (!response.is_object()) {
            return malformed("tool response must be an object with 'delegate' and 'args'");
        }
        if (!response.contains("delegate") || !response["delegate"].is_string()) {
            return malformed("tool response is missing 'delegate'");
        }
        turn.call.delegate = utils::trim_copy(response["delegate"].get<std::string>());
        if (turn.call.delegate.empty()) {
            return malformed("tool response has an empty delegate name");
        }
        turn.call.args = response.contains("args") ? coerce_args(response["args"]) : json::object();
    } else {
        if (response.is_string()) {
            turn.answer = response.get<std::string>();
        } else if (response.is_array()) {
            std::vector<std::string> lines;
            for (const auto& item : response) {
                lines.push_back(item.is_string() ? item.get<std::string>() : item.dump());
            }
            turn.answer = utils::join(lines, "\n");
        } else {
            return malformed("answer response must be text");
        }
    }
    return turn;
}

Turn make_tool_turn(const std::string& delegate, const json& args,
                    const std::string& observation,
                    const std::vector<std::string>& plan) {
    Turn turn;
    turn.action = TurnAction::Tool;
    turn.call.delegate = delegate;
    turn.call.args = args;
    turn.observation = observation;
    turn.plan = plan;
    return turn;
}

Turn make_answer_turn(const std::string& answer,
                      const std::string& observation,
                      const std::vector<std::string>& plan) {
    Turn turn;
    turn.action = TurnAction::Answer;
    turn.answer = answer;
    turn.observation = observation;
    turn.plan = plan;
    return turn;
}

} // namespace conductor
