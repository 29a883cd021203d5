#include "llm_client.h"
#include "http_client.h"
#include "media.h"
#include "prompt_builder.h"
#include "turn_parser.h"
#include "logger.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace conductor {

class LLMClient::Impl {
public:
    Impl(const LLMConfig& config, const std::string& system_prompt)
        : config_(config), prompt_(system_prompt) {
        http::global_init();
    }

    Result<Turn> complete(const ReasoningContext& context) {
        std::string prompt = prompt_.render(context);
        LOG_TRACE(context.agent_name, "llm_request", "iteration=" + std::to_string(context.iteration) +
                  " prompt_chars=" + std::to_string(prompt.size()));

        auto reply = chat(prompt_.system_prompt(), build_user_content(prompt, context.media), 0);
        if (reply.is_error()) {
            return reply.error();
        }

        auto turn = TurnParser::parse(reply.value());
        if (turn.is_error()) {
            LOG_LLM(context.agent_name + " unparseable reply: " +
                    utils::truncate_with_marker(reply.value(), 500));
        }
        return turn;
    }

    Result<std::string> chat(const std::string& system_prompt, const json& user_content, int timeout_ms) {
        if (timeout_ms == 0) timeout_ms = config_.timeout_ms;

        json request = build_chat_request(config_, system_prompt, user_content);

        const std::string url = http::join_url(config_.base_url, "chat/completions");
        LOG_LLM("POST " + url + " model=" + config_.model_id);
        auto response = http::post_json(url, request, http::bearer_headers(config_.api_key), timeout_ms);
        if (response.is_error()) {
            LOG_LLM("Error: " + response.error().describe());
            return response.error();
        }
        const auto& reply = response.value();
        if (!reply.ok()) {
            LOG_LLM("Error: " + reply.describe());
            return make_network_error("chat completion failed: " + reply.describe());
        }

        try {
            json body = json::parse(reply.body);
            if (!body.contains("choices") || !body["choices"].is_array() || body["choices"].empty()) {
                return make_parse_error("No choices in completion response");
            }
            const json& message = body["choices"][0]["message"];
            if (!message.contains("content") || !message["content"].is_string()) {
                return make_parse_error("No content in completion message");
            }
            std::string content = message["content"].get<std::string>();
            LOG_TRACE("llm", "reply", utils::truncate_with_marker(content, 1000));
            return content;
        } catch (const json::exception& e) {
            LOG_LLM("Response buffer: " + utils::truncate_with_marker(reply.body, 500));
            return make_parse_error("JSON parse error: " + std::string(e.what()));
        }
    }

    HealthProbe probe(int timeout_ms) const {
        auto response = http::get(http::join_url(config_.base_url, "models"),
                                  http::bearer_headers(config_.api_key), timeout_ms);
        if (response.is_error()) {
            return HealthProbe::unhealthy(response.error().message,
                                          "Start an OpenAI-compatible server at " + config_.base_url +
                                          " or set LLM_BASE_URL");
        }
        if (response.value().status >= 500) {
            return HealthProbe::unhealthy(response.value().describe());
        }
        return HealthProbe::healthy();
    }

    const std::string& model_id() const { return config_.model_id; }

private:
    LLMConfig config_;
    PromptBuilder prompt_;
};

LLMClient::LLMClient(const LLMConfig& config, const std::string& system_prompt)
    : pimpl_(std::make_unique<Impl>(config, system_prompt)) {}

LLMClient::~LLMClient() = default;

Result<Turn> LLMClient::complete(const ReasoningContext& context) {
    return pimpl_->complete(context);
}

Result<std::string> LLMClient::chat(const std::string& system_prompt,
                                    const std::string& user_message,
                                    int timeout_ms) {
    return pimpl_->chat(system_prompt, json(user_message), timeout_ms);
}

HealthProbe LLMClient::probe(int timeout_ms) const {
    return pimpl_->probe(timeout_ms);
}

const std::string& LLMClient::model_id() const {
    return pimpl_->model_id();
}

} // namespace conductor
