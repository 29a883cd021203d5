#include "delegates/sub_agent_delegate.h"
#include "logger.h"

namespace conductor {

SubAgentDelegate::SubAgentDelegate(std::string name,
                                   std::string description,
                                   std::shared_ptr<ReasoningBackend> backend,
                                   LoopOptions options,
                                   size_t max_concurrent)
    : name_(std::move(name)), description_(std::move(description)) {
    loop_ = std::make_unique<ReasoningLoop>(name_, std::move(backend), delegates_, options, max_concurrent);
}

SubAgentDelegate::~SubAgentDelegate() = default;

bool SubAgentDelegate::add_delegate(std::shared_ptr<Delegate> delegate) {
    return delegates_.register_delegate(std::move(delegate));
}

std::string SubAgentDelegate::usage() const {
    return name_ + "({\"query\": \"your detailed task description\"})";
}

DelegateResult SubAgentDelegate::invoke(const nlohmann::json& args) {
    std::string query = text_argument(args, {"query", "task", "prompt", "text"});
    if (query.empty()) {
        return DelegateResult::error_result(name_ + " needs a 'query' describing the task", "invalid_arguments");
    }

    LOG_AGENT(name_ + " sub-agent started: " + query);
    RunHooks hooks;
    hooks.trace_id = name_;
    RunOutcome outcome = loop_->run(query, hooks);
    if (outcome.ok()) {
        return DelegateResult::success_result(outcome.final_text);
    }
    return DelegateResult::error_result(name_ + " could not complete the task: " + outcome.error.describe(),
                                        run_status_name(outcome.status));
}

} // namespace conductor
