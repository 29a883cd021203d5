#pragma once

#include <string>
#include <functional>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace conductor {

/**
 * @brief Result of one delegate invocation
 *
 * On failure `error_code` is a short machine token ("failure", "timeout",
 * "exception", "invalid_arguments", ...) and `error` the human message.
 */
struct DelegateResult {
    bool success = false;
    std::string content;     // Result text fed back to the reasoning backend
    std::string error_code;
    std::string error;

    static DelegateResult success_result(const std::string& content) {
        DelegateResult result;
        result.success = true;
        result.content = content;
        return result;
    }

    static DelegateResult error_result(const std::string& error_msg,
                                       const std::string& code = "failure") {
        DelegateResult result;
        result.success = false;
        result.error_code = code;
        result.error = error_msg;
        return result;
    }

    /// Text recorded as the Turn outcome / next observation
    std::string observation_text() const {
        if (success) return content;
        return "Error (" + error_code + "): " + error;
    }
};

/**
 * @brief First non-empty string among `keys`, else the first string value in args
 * @return Empty string when args carries no text at all
 */
inline std::string text_argument(const nlohmann::json& args, const std::vector<std::string>& keys) {
    if (args.is_string()) return args.get<std::string>();
    if (!args.is_object()) return "";
    for (const auto& key : keys) {
        if (args.contains(key) && args[key].is_string() && !args[key].get<std::string>().empty()) {
            return args[key].get<std::string>();
        }
    }
    for (const auto& item : args.items()) {
        if (item.value().is_string() && !item.value().get<std::string>().empty()) {
            return item.value().get<std::string>();
        }
    }
    return "";
}

/**
 * @brief A named unit of capability: a tool or a sub-agent
 *
 * Every delegate is invoked the same way, with a mapping of named fields.
 * Implementations must be safe to call from a worker thread. A delegate
 * is immutable once registered.
 */
class Delegate {
public:
    virtual ~Delegate() = default;

    /**
     * @brief Unique, stable key (e.g. "execute_command", "web_search_agent")
     */
    virtual std::string name() const = 0;

    /**
     * @brief Description shown to the reasoning backend for selection
     */
    virtual std::string description() const = 0;

    /**
     * @brief Example invocation shown to the reasoning backend
     */
    virtual std::string usage() const {
        return name() + "({\"key\": \"value\"})";
    }

    /// Sub-agents run their own reasoning loop
    virtual bool is_agent() const { return false; }

    /**
     * @brief Perform the capability
     * @param args JSON object of named arguments
     */
    virtual DelegateResult invoke(const nlohmann::json& args) = 0;
};

/**
 * @brief Delegate backed by a callable
 */
class FunctionDelegate : public Delegate {
public:
    using Handler = std::function<DelegateResult(const nlohmann::json&)>;

    FunctionDelegate(std::string name, std::string description, Handler handler,
                     std::string usage = "")
        : name_(std::move(name)), description_(std::move(description)),
          usage_(std::move(usage)), handler_(std::move(handler)) {}

    std::string name() const override { return name_; }
    std::string description() const override { return description_; }
    std::string usage() const override {
        return usage_.empty() ? Delegate::usage() : usage_;
    }

    DelegateResult invoke(const nlohmann::json& args) override {
        if (!handler_) {
            return DelegateResult::error_result("no handler bound for " + name_);
        }
        return handler_(args);
    }

private:
    std::string name_;
    std::string description_;
    std::string usage_;
    Handler handler_;
};

} // namespace conductor
