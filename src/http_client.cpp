#include "http_client.h"
#include "logger.h"
#include <curl/curl.h>
#include <cstdio>
#include <mutex>

namespace conductor {
namespace http {

namespace {

std::once_flag g_curl_once;

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    std::string* buffer = static_cast<std::string*>(userp);
    size_t total_size = size * nmemb;
    buffer->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t file_write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    return std::fwrite(contents, size, nmemb, static_cast<FILE*>(userp)) * size;
}

Error transport_error(CURLcode code, const std::string& url) {
    std::string message = std::string(curl_easy_strerror(code)) + " (" + url + ")";
    if (code == CURLE_OPERATION_TIMEDOUT) {
        return make_timeout_error(message);
    }
    return make_network_error(message);
}

/// Owns the easy handle and header list for one request
class Request {
public:
    explicit Request(const std::string& url) : url_(url) {
        global_init();
        curl_ = curl_easy_init();
        if (curl_) {
            curl_easy_setopt(curl_, CURLOPT_URL, url_.c_str());
            curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
            curl_easy_setopt(curl_, CURLOPT_USERAGENT, "conductor/1.0");
        }
    }

    ~Request() {
        if (mime_) curl_mime_free(mime_);
        if (headers_) curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }

    Request(const Request&) = delete;
    Request& operator=(const Request&) = delete;

    bool valid() const { return curl_ != nullptr; }
    CURL* handle() { return curl_; }

    void add_headers(const Headers& headers) {
        for (const auto& h : headers) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
    }

    void set_timeout(int timeout_ms) {
        if (timeout_ms > 0) {
            curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
        }
    }

    curl_mime* mime() {
        if (!mime_) mime_ = curl_mime_init(curl_);
        return mime_;
    }

    Result<Response> perform() {
        Response response;
        if (headers_) curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);

        CURLcode res = curl_easy_perform(curl_);
        if (res != CURLE_OK) {
            return transport_error(res, url_);
        }
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status);
        char* content_type = nullptr;
        curl_easy_getinfo(curl_, CURLINFO_CONTENT_TYPE, &content_type);
        if (content_type) response.content_type = content_type;
        return response;
    }

    const std::string& url() const { return url_; }

private:
    std::string url_;
    CURL* curl_ = nullptr;
    struct curl_slist* headers_ = nullptr;
    curl_mime* mime_ = nullptr;
};

} // anonymous namespace

std::string Response::describe() const {
    std::string snippet = body.size() > 200 ? body.substr(0, 200) + "..." : body;
    return "HTTP " + std::to_string(status) + ": " + snippet;
}

FormPart FormPart::field(const std::string& name, const std::string& value) {
    FormPart part;
    part.name = name;
    part.value = value;
    return part;
}

FormPart FormPart::file(const std::string& name, const Bytes& data,
                        const std::string& filename, const std::string& content_type) {
    FormPart part;
    part.name = name;
    part.value.assign(data.begin(), data.end());
    part.filename = filename.empty() ? "upload.bin" : filename;
    part.content_type = content_type;
    return part;
}

void global_init() {
    std::call_once(g_curl_once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Headers bearer_headers(const std::string& api_key) {
    Headers headers;
    if (!api_key.empty()) {
        headers.push_back("Authorization: Bearer " + api_key);
    }
    return headers;
}

std::string join_url(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    std::string left = base;
    while (!left.empty() && left.back() == '/') left.pop_back();
    size_t start = 0;
    while (start < path.size() && path[start] == '/') ++start;
    return left + "/" + path.substr(start);
}

std::string url_encode(const std::string& value) {
    global_init();
    CURL* curl = curl_easy_init();
    if (!curl) return value;
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    std::string result = escaped ? escaped : value;
    if (escaped) curl_free(escaped);
    curl_easy_cleanup(curl);
    return result;
}

Result<Response> get(const std::string& url, const Headers& headers, int timeout_ms) {
    Request request(url);
    if (!request.valid()) return make_network_error("Failed to initialize CURL");
    request.add_headers(headers);
    request.set_timeout(timeout_ms);
    curl_easy_setopt(request.handle(), CURLOPT_HTTPGET, 1L);
    return request.perform();
}

Result<Response> post_json(const std::string& url, const nlohmann::json& body,
                           const Headers& headers, int timeout_ms) {
    Request request(url);
    if (!request.valid()) return make_network_error("Failed to initialize CURL");
    const std::string payload = body.dump();
    request.add_headers({"Content-Type: application/json"});
    request.add_headers(headers);
    request.set_timeout(timeout_ms);
    curl_easy_setopt(request.handle(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(request.handle(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    return request.perform();
}

Result<Response> post_form(const std::string& url, const std::vector<FormPart>& parts,
                           const Headers& headers, int timeout_ms) {
    Request request(url);
    if (!request.valid()) return make_network_error("Failed to initialize CURL");
    request.add_headers(headers);
    request.set_timeout(timeout_ms);

    curl_mime* mime = request.mime();
    for (const auto& part : parts) {
        curl_mimepart* mp = curl_mime_addpart(mime);
        curl_mime_name(mp, part.name.c_str());
        curl_mime_data(mp, part.value.data(), part.value.size());
        if (!part.filename.empty()) curl_mime_filename(mp, part.filename.c_str());
        if (!part.content_type.empty()) curl_mime_type(mp, part.content_type.c_str());
    }
    curl_easy_setopt(request.handle(), CURLOPT_MIMEPOST, mime);
    return request.perform();
}

VoidResult download(const std::string& url, const std::string& path, int timeout_ms) {
    Request request(url);
    if (!request.valid()) return make_network_error("Failed to initialize CURL");

    FILE* out = std::fopen(path.c_str(), "wb");
    if (!out) return make_io_error("Cannot open " + path + " for writing");

    request.set_timeout(timeout_ms);
    curl_easy_setopt(request.handle(), CURLOPT_WRITEFUNCTION, file_write_callback);
    curl_easy_setopt(request.handle(), CURLOPT_WRITEDATA, out);
    curl_easy_setopt(request.handle(), CURLOPT_FAILONERROR, 1L);

    CURLcode res = curl_easy_perform(request.handle());
    bool closed = std::fclose(out) == 0;
    if (res != CURLE_OK || !closed) {
        std::remove(path.c_str());
        if (res != CURLE_OK) return transport_error(res, url);
        return make_io_error("Failed to flush " + path);
    }
    return VoidResult();
}

} // namespace http
} // namespace conductor
