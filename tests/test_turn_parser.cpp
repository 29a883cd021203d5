/**
 * Turn parsing: structured responses, call syntax, and the malformed cases
 * the reasoning loop must reject.
 *
 * Run from build dir: ./test_turn_parser
 */

#include "test_support.h"
#include "turn.h"
#include "turn_parser.h"
#include "prompt_builder.h"

using namespace conductor;

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- extract_json_object ---
    ASSERT(TurnParser::extract_json_object("no braces here").empty());
    ASSERT(TurnParser::extract_json_object("prefix {\"a\": 1} suffix") == "{\"a\": 1}");
    ASSERT(TurnParser::extract_json_object("{\"a\": \"}\", \"b\": {\"c\": 2}} tail") ==
           "{\"a\": \"}\", \"b\": {\"c\": 2}}");
    ASSERT(TurnParser::extract_json_object("{ unterminated").empty());

    // --- structured tool Turn ---
    {
        auto r = TurnParser::parse(
            "{\"observation\": \"user asked\", \"plan\": [\"search\", \"answer\"], \"action\": \"tool\","
            " \"response\": {\"delegate\": \"search\", \"args\": {\"q\": \"answer to everything\"}}}");
        ASSERT(r.is_ok());
        if (r.is_ok()) {
            const Turn& t = r.value();
            ASSERT(t.is_tool());
            ASSERT(t.call.delegate == "search");
            ASSERT(t.call.args["q"] == "answer to everything");
            ASSERT(t.observation == "user asked");
            ASSERT(t.plan.size() == 2);
        }
    }

    // --- call syntax inside a string response ---
    {
        auto r = TurnParser::parse("```json\n{\"action\": \"tool\", \"response\": \"web_search({\\\"query\\\": \\\"weather\\\"})\"}\n```");
        ASSERT(r.is_ok());
        if (r.is_ok()) {
            ASSERT(r.value().call.delegate == "web_search");
            ASSERT(r.value().call.args["query"] == "weather");
        }
    }

    // --- answer Turns ---
    {
        auto r = TurnParser::parse("{\"action\": \"answer\", \"response\": \"42\"}");
        ASSERT(r.is_ok());
        if (r.is_ok()) {
            ASSERT(r.value().is_answer());
            ASSERT(r.value().answer == "42");
        }
        auto lines = TurnParser::parse("{\"action\": \"ANSWER\", \"response\": [\"line one\", \"line two\"]}");
        ASSERT(lines.is_ok());
        if (lines.is_ok()) {
            ASSERT(lines.value().answer.find("line one") != std::string::npos);
            ASSERT(lines.value().answer.find("line two") != std::string::npos);
        }
    }

    // --- parse_call_expression ---
    {
        auto c = TurnParser::parse_call_expression("execute_command({\"command\": \"ls\"})");
        ASSERT(c.is_ok());
        if (c.is_ok()) {
            ASSERT(c.value().delegate == "execute_command");
            ASSERT(c.value().args["command"] == "ls");
        }
        auto free_text = TurnParser::parse_call_expression("search(\"latest news\")");
        ASSERT(free_text.is_ok());
        if (free_text.is_ok()) {
            ASSERT(free_text.value().args["query"] == "latest news");
        }
        auto no_args = TurnParser::parse_call_expression("status()");
        ASSERT(no_args.is_ok());
        if (no_args.is_ok()) {
            ASSERT(no_args.value().args.is_object());
            ASSERT(no_args.value().args.empty());
        }
        ASSERT(TurnParser::parse_call_expression("just words").is_error());
        ASSERT(TurnParser::parse_call_expression("search({\"q\": 1}").is_error());
    }

    // --- malformed output ---
    {
        auto empty = TurnParser::parse("   ");
        ASSERT(empty.is_error() && empty.error().type == ErrorType::MalformedTurn);

        auto prose = TurnParser::parse("I think the answer is 42.");
        ASSERT(prose.is_error() && prose.error().type == ErrorType::MalformedTurn);

        auto no_action = TurnParser::parse("{\"response\": \"42\"}");
        ASSERT(no_action.is_error() && no_action.error().type == ErrorType::MalformedTurn);

        auto bad_action = TurnParser::parse("{\"action\": \"dance\", \"response\": \"42\"}");
        ASSERT(bad_action.is_error() && bad_action.error().type == ErrorType::MalformedTurn);

        auto no_delegate = TurnParser::parse("{\"action\": \"tool\", \"response\": {\"args\": {}}}");
        ASSERT(no_delegate.is_error() && no_delegate.error().type == ErrorType::MalformedTurn);

        auto bad_call = TurnParser::parse("{\"action\": \"tool\", \"response\": \"nothing callable\"}");
        ASSERT(bad_call.is_error() && bad_call.error().type == ErrorType::MalformedTurn);

        auto answer_object = TurnParser::parse("{\"action\": \"answer\", \"response\": {\"x\": 1}}");
        ASSERT(answer_object.is_error() && answer_object.error().type == ErrorType::MalformedTurn);
    }

    // --- Turn JSON form survives a trip through from_json ---
    {
        Turn t = make_tool_turn("search", {{"q", "x"}}, "obs", {"step"});
        t.iteration = 3;
        t.outcome = "found";
        t.outcome_ok = true;
        auto back = Turn::from_json(t.to_json());
        ASSERT(back.is_ok());
        if (back.is_ok()) {
            ASSERT(back.value().iteration == 3);
            ASSERT(back.value().call.delegate == "search");
            ASSERT(back.value().outcome == "found");
            ASSERT(back.value().plan.size() == 1);
        }
    }

    // --- prompt rendering ---
    {
        PromptBuilder builder("You are the orchestrator.");
        ReasoningContext ctx;
        ctx.input = "what is the answer";
        ctx.observation = ctx.input;
        ctx.catalogue = "## AVAILABLE DELEGATES\n\n- search: finds things\n";
        ctx.iteration = 1;
        ctx.max_iterations = 4;

        std::string first = builder.render(ctx);
        ASSERT(first.rfind("You are the orchestrator.", 0) == 0);
        ASSERT(first.find("## TRACE") == std::string::npos);
        ASSERT(first.find("last turn") == std::string::npos);
        size_t catalogue_at = first.find("## AVAILABLE DELEGATES");
        size_t format_at = first.find("## RESPONSE FORMAT");
        size_t request_at = first.find("## CURRENT REQUEST");
        ASSERT(catalogue_at != std::string::npos);
        ASSERT(catalogue_at < format_at && format_at < request_at);
        ASSERT(first.find("what is the answer", request_at) != std::string::npos);

        Turn done;
        done.action = TurnAction::Tool;
        done.call.delegate = "search";
        done.call.args = {{"q", "answer"}};
        done.outcome = "42";
        Turn broken = done;
        broken.outcome = "Error (timeout): search";
        broken.outcome_ok = false;
        ctx.trace = {done, broken};
        ctx.observation = broken.outcome;
        ctx.iteration = 4;

        std::string later = builder.render(ctx);
        ASSERT(later.find("## TRACE") != std::string::npos);
        ASSERT(later.find("1. [TOOL] search({\"q\":\"answer\"})") != std::string::npos);
        ASSERT(later.find("result: 42") != std::string::npos);
        ASSERT(later.find("failed: Error (timeout): search") != std::string::npos);
        ASSERT(later.find("last turn") != std::string::npos);

        ASSERT(PromptBuilder::render_trace({}).empty());
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "All turn parser tests passed.\n";
    return 0;
}
