#include "delegates/web_search_delegate.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>
#include <vector>

namespace conductor {

namespace {

struct Hit {
    std::string title;
    std::string url;
    std::string snippet;
};

std::string string_field(const nlohmann::json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

void collect_topics(const nlohmann::json& topics, std::vector<Hit>& hits) {
    if (!topics.is_array()) return;
    for (const auto& topic : topics) {
        if (topic.contains("Topics")) {
            collect_topics(topic["Topics"], hits);
            continue;
        }
        std::string text = string_field(topic, "Text");
        if (text.empty()) continue;
        Hit hit;
        size_t dash = text.find(" - ");
        hit.title = dash != std::string::npos ? text.substr(0, dash) : text;
        hit.url = string_field(topic, "FirstURL");
        hit.snippet = text;
        hits.push_back(hit);
    }
}

std::string percent_encode(const std::string& value) {
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

} // anonymous namespace

WebSearchDelegate::WebSearchDelegate(Fetch fetch, std::string endpoint, int default_max_results)
    : fetch_(std::move(fetch)), endpoint_(std::move(endpoint)), default_max_results_(default_max_results) {}

std::string WebSearchDelegate::resolve_query(const nlohmann::json& args) {
    return utils::trim_copy(text_argument(args, {"query", "key", "q", "keywords", "text", "prompt"}));
}

int WebSearchDelegate::resolve_max_results(const nlohmann::json& args, int fallback) {
    int value = fallback;
    if (args.is_object() && args.contains("max_results")) {
        const auto& raw = args["max_results"];
        if (raw.is_number()) {
            value = static_cast<int>(raw.get<double>());
        } else if (raw.is_string()) {
            try {
                value = std::stoi(raw.get<std::string>());
            } catch (const std::exception&) {
                value = fallback;
            }
        }
    }
    return std::min(std::max(1, value), 10);
}

std::string WebSearchDelegate::build_url(const std::string& query) const {
    std::string sep = endpoint_.find('?') == std::string::npos ? "?" : "&";
    return endpoint_ + sep + "q=" + percent_encode(query) + "&format=json&no_html=1&skip_disambig=1";
}

std::string WebSearchDelegate::format_results(const nlohmann::json& document, int max_results) {
    std::vector<Hit> hits;

    std::string answer = string_field(document, "Answer");
    if (!answer.empty()) {
        hits.push_back({"Instant answer", string_field(document, "AbstractURL"), answer});
    }
    std::string abstract = string_field(document, "AbstractText");
    if (!abstract.empty()) {
        std::string heading = string_field(document, "Heading");
        hits.push_back({heading.empty() ? "Abstract" : heading, string_field(document, "AbstractURL"), abstract});
    }
    if (document.contains("Results")) collect_topics(document["Results"], hits);
    if (document.contains("RelatedTopics")) collect_topics(document["RelatedTopics"], hits);

    if (hits.empty()) return "";

    std::ostringstream oss;
    oss << "Search Results:\n";
    int shown = 0;
    for (const auto& hit : hits) {
        if (shown >= max_results) break;
        ++shown;
        oss << "\n" << shown << ". " << (hit.title.empty() ? "No title" : hit.title) << "\n"
            << "   URL: " << (hit.url.empty() ? "No URL" : hit.url) << "\n"
            << "   " << hit.snippet.substr(0, 200) << "\n";
    }
    return oss.str();
}

DelegateResult WebSearchDelegate::invoke(const nlohmann::json& args) {
    std::string query = resolve_query(args);
    if (query.empty()) {
        return DelegateResult::error_result("search query is required (use 'query')", "invalid_arguments");
    }
    int max_results = resolve_max_results(args, default_max_results_);

    LOG_DELEGATE("web_search: " + query);
    auto body = fetch_(build_url(query));
    if (body.is_error()) {
        return DelegateResult::error_result(body.error().describe(), "search_failed");
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(body.value());
    } catch (const nlohmann::json::exception& e) {
        return DelegateResult::error_result(std::string("unreadable search response: ") + e.what(), "search_failed");
    }

    std::string results = format_results(document, max_results);
    if (results.empty()) {
        return DelegateResult::success_result("No results found for: " + query);
    }
    return DelegateResult::success_result(results);
}

} // namespace conductor
