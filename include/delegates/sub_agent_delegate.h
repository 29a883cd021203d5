#pragma once

#include "delegate.h"
#include "delegate_registry.h"
#include "reasoning_loop.h"
#include <memory>
#include <string>

namespace conductor {

/**
 * @brief A delegate that runs its own reasoning loop over its own delegates
 *
 * invoke({"query": "..."}) runs a nested loop and returns its final text;
 * any other terminal status comes back as a failure whose code is the run
 * status ("error", "budget_exceeded", ...).
 */
class SubAgentDelegate : public Delegate {
public:
    SubAgentDelegate(std::string name,
                     std::string description,
                     std::shared_ptr<ReasoningBackend> backend,
                     LoopOptions options = LoopOptions(),
                     size_t max_concurrent = 1);
    ~SubAgentDelegate() override;

    // Non-copyable
    SubAgentDelegate(const SubAgentDelegate&) = delete;
    SubAgentDelegate& operator=(const SubAgentDelegate&) = delete;

    /**
     * @brief Give the sub-agent a delegate; call before the first invoke
     */
    bool add_delegate(std::shared_ptr<Delegate> delegate);

    const DelegateRegistry& delegates() const { return delegates_; }

    std::string name() const override { return name_; }
    std::string description() const override { return description_; }
    std::string usage() const override;
    bool is_agent() const override { return true; }
    DelegateResult invoke(const nlohmann::json& args) override;

private:
    std::string name_;
    std::string description_;
    DelegateRegistry delegates_;  // must outlive loop_
    std::unique_ptr<ReasoningLoop> loop_;
};

} // namespace conductor
