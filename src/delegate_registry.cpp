#include "delegate_registry.h"
#include "logger.h"
#include <sstream>

namespace conductor {

bool DelegateRegistry::register_delegate(std::shared_ptr<Delegate> delegate) {
    if (!delegate) {
        Logger::error("Attempted to register null delegate");
        return false;
    }

    std::string name = delegate->name();
    if (delegates_.find(name) != delegates_.end()) {
        Logger::warn("Delegate '" + name + "' is already registered. Skipping.");
        return false;
    }

    delegates_[name] = delegate;
    LOG_DELEGATE("Registered " + std::string(delegate->is_agent() ? "sub-agent" : "tool") + ": " + name);
    return true;
}

std::shared_ptr<Delegate> DelegateRegistry::get(const std::string& name) const {
    auto it = delegates_.find(name);
    if (it != delegates_.end()) {
        return it->second;
    }
    return nullptr;
}

bool DelegateRegistry::has(const std::string& name) const {
    return delegates_.find(name) != delegates_.end();
}

std::vector<std::string> DelegateRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(delegates_.size());
    for (const auto& [name, delegate] : delegates_) {
        result.push_back(name);
    }
    return result;
}

std::string DelegateRegistry::catalogue() const {
    if (delegates_.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "## AVAILABLE DELEGATES\n\n";
    for (const auto& [name, delegate] : delegates_) {
        oss << "## " << name << "\n"
            << "**Type**: " << (delegate->is_agent() ? "Sub-Agent" : "Tool") << "\n"
            << "**Description**:\n" << delegate->description() << "\n"
            << "**Usage**: " << delegate->usage() << "\n\n";
    }
    return oss.str();
}

void DelegateRegistry::clear() {
    delegates_.clear();
}

} // namespace conductor
