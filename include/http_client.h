#pragma once

#include "errors.h"
#include "common.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace conductor {
namespace http {

/**
 * @brief Response of a completed HTTP exchange
 *
 * A non-2xx status is still a completed exchange; callers decide.
 */
struct Response {
    long status = 0;
    std::string body;
    std::string content_type;

    bool ok() const { return status >= 200 && status < 300; }

    /// "HTTP <status>: <first 200 chars of body>"
    std::string describe() const;
};

/**
 * @brief One part of a multipart/form-data upload
 */
struct FormPart {
    std::string name;
    std::string value;           ///< Field value or file contents
    std::string filename;        ///< Non-empty marks a file part
    std::string content_type;

    static FormPart field(const std::string& name, const std::string& value);
    static FormPart file(const std::string& name, const Bytes& data,
                         const std::string& filename, const std::string& content_type);
};

using Headers = std::vector<std::string>;

/**
 * @brief Initialize libcurl once per process; safe to call repeatedly
 */
void global_init();

/// "Authorization: Bearer <key>" when key is non-empty
Headers bearer_headers(const std::string& api_key);

/// Join base and path with exactly one '/'
std::string join_url(const std::string& base, const std::string& path);

/// Percent-encode a query component
std::string url_encode(const std::string& value);

/**
 * @brief Transport failures (DNS, connect, timeout) are NetworkError / Timeout
 */
Result<Response> get(const std::string& url, const Headers& headers, int timeout_ms);

Result<Response> post_json(const std::string& url, const nlohmann::json& body,
                           const Headers& headers, int timeout_ms);

Result<Response> post_form(const std::string& url, const std::vector<FormPart>& parts,
                           const Headers& headers, int timeout_ms);

/**
 * @brief Stream url into path; the file is removed on any failure
 */
VoidResult download(const std::string& url, const std::string& path, int timeout_ms);

} // namespace http
} // namespace conductor
