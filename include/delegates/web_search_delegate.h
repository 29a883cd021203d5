#pragma once

#include "delegate.h"
#include "errors.h"
#include <functional>
#include <string>

namespace conductor {

/**
 * @brief web_search: DuckDuckGo instant-answer lookup
 *
 * Args: {"query": "...", "max_results": 5}. The query is taken from
 * query|q|keywords|text|prompt, else the first string value.
 * max_results is clamped to 1..10.
 */
class WebSearchDelegate : public Delegate {
public:
    /// GET url and return the body; NetworkError on transport failure
    using Fetch = std::function<Result<std::string>(const std::string& url)>;

    WebSearchDelegate(Fetch fetch,
                      std::string endpoint = "https://api.duckduckgo.com/",
                      int default_max_results = 5);

    std::string name() const override { return "web_search"; }
    std::string description() const override {
        return "Search the web using DuckDuckGo and return titles, URLs and snippets.";
    }
    std::string usage() const override { return "web_search({\"query\": \"...\", \"max_results\": 5})"; }
    DelegateResult invoke(const nlohmann::json& args) override;

    static std::string resolve_query(const nlohmann::json& args);
    static int resolve_max_results(const nlohmann::json& args, int fallback);

    /**
     * @brief Render an instant-answer JSON document as numbered results
     * @return Empty string when the document carries no hits
     */
    static std::string format_results(const nlohmann::json& document, int max_results);

    std::string build_url(const std::string& query) const;

private:
    Fetch fetch_;
    std::string endpoint_;
    int default_max_results_;
};

} // namespace conductor
