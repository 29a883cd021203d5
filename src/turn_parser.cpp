#include "turn_parser.h"
#include "utils.h"
#include <cctype>

using json = nlohmann::json;

namespace conductor {

namespace {

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

/// Index one past the '}' closing the object opened at `open`, or npos.
size_t match_object(const std::string& text, size_t open) {
    int depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (size_t i = open; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) return i + 1;
        }
    }
    return std::string::npos;
}

} // anonymous namespace

std::string TurnParser::extract_json_object(const std::string& text) {
    size_t open = text.find('{');
    while (open != std::string::npos) {
        size_t end = match_object(text, open);
        if (end != std::string::npos) {
            return text.substr(open, end - open);
        }
        open = text.find('{', open + 1);
    }
    return "";
}

Result<DelegateCall> TurnParser::parse_call_expression(const std::string& expr) {
    const std::string text = utils::trim_copy(expr);
    size_t paren = text.find('(');
    while (paren != std::string::npos) {
        // Identifier immediately before '(' (whitespace allowed)
        size_t name_end = paren;
        while (name_end > 0 && std::isspace(static_cast<unsigned char>(text[name_end - 1]))) --name_end;
        size_t name_start = name_end;
        while (name_start > 0 && is_identifier_char(text[name_start - 1])) --name_start;

        if (name_start < name_end) {
            DelegateCall call;
            call.delegate = text.substr(name_start, name_end - name_start);

            size_t close = text.rfind(')');
            if (close == std::string::npos || close < paren) {
                return make_error(ErrorType::MalformedTurn,
                                  "unterminated call to '" + call.delegate + "'");
            }
            std::string inner = utils::trim_copy(text.substr(paren + 1, close - paren - 1));
            std::string object = extract_json_object(inner);
            if (inner.empty()) {
                call.args = json::object();
            } else if (!object.empty()) {
                try {
                    json parsed = json::parse(object);
                    call.args = parsed.is_object() ? parsed : json{{"query", object}};
                } catch (const json::exception&) {
                    call.args = json{{"query", object}};
                }
            } else {
                // name("free text") or name(free text)
                if (inner.size() >= 2 && (inner.front() == '"' || inner.front() == '\'') &&
                    inner.back() == inner.front()) {
                    inner = inner.substr(1, inner.size() - 2);
                }
                call.args = json{{"query", inner}};
            }
            return call;
        }
        paren = text.find('(', paren + 1);
    }
    return make_error(ErrorType::MalformedTurn, "no valid delegate call found in response");
}

Result<Turn> TurnParser::parse(const std::string& text) {
    if (utils::is_empty_or_whitespace(text)) {
        return make_error(ErrorType::MalformedTurn, "empty response from reasoning backend");
    }

    std::string object = extract_json_object(text);
    if (object.empty()) {
        return make_error(ErrorType::MalformedTurn, "no JSON object found in response");
    }

    json j;
    try {
        j = json::parse(object);
    } catch (const json::exception& e) {
        return make_error(ErrorType::MalformedTurn, std::string("invalid JSON: ") + e.what());
    }

    // Call syntax inside a string response is rewritten to the structured form
    if (j.contains("action") && j["action"].is_string() &&
        utils::normalize_copy(utils::trim_copy(j["action"].get<std::string>())) == "tool" &&
        j.contains("response") && (j["response"].is_string() || j["response"].is_array())) {
        std::string expr;
        if (j["response"].is_string()) {
            expr = j["response"].get<std::string>();
        } else {
            std::vector<std::string> parts;
            for (const auto& item : j["response"]) {
                parts.push_back(item.is_string() ? item.get<std::string>() : item.dump());
            }
            expr = utils::join(parts, " ");
        }
        auto call = parse_call_expression(expr);
        if (call.is_error()) {
            return call.error();
        }
        j["response"] = {{"delegate", call.value().delegate}, {"args", call.value().args}};
    }

    return Turn::from_json(j);
}

} // namespace conductor
