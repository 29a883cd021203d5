#include "media.h"
#include "config.h"
#include "logger.h"
#include "path_utils.h"
#include "utils.h"
#include <algorithm>
#include <cctype>

namespace conductor {

namespace {

const char kBase64Chars[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/' || c == '=';
}

} // anonymous namespace

std::string base64_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    size_t i = 0;
    for (; i + 2 < len; i += 3) {
        uint32_t triple = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out += kBase64Chars[(triple >> 18) & 0x3F];
        out += kBase64Chars[(triple >> 12) & 0x3F];
        out += kBase64Chars[(triple >> 6) & 0x3F];
        out += kBase64Chars[triple & 0x3F];
    }
    if (i < len) {
        uint32_t triple = uint32_t(data[i]) << 16;
        if (i + 1 < len) triple |= uint32_t(data[i + 1]) << 8;
        out += kBase64Chars[(triple >> 18) & 0x3F];
        out += kBase64Chars[(triple >> 12) & 0x3F];
        out += (i + 1 < len) ? kBase64Chars[(triple >> 6) & 0x3F] : '=';
        out += '=';
    }
    return out;
}

bool looks_like_base64(const std::string& value) {
    if (value.size() < 32) return false;
    return std::all_of(value.begin(), value.end(), is_base64_char);
}

std::string image_mime_type(const std::string& path) {
    std::string lowered = utils::normalize_copy(path);
    if (utils::ends_with(lowered, ".jpg") || utils::ends_with(lowered, ".jpeg")) return "image/jpeg";
    if (utils::ends_with(lowered, ".gif")) return "image/gif";
    if (utils::ends_with(lowered, ".webp")) return "image/webp";
    if (utils::ends_with(lowered, ".bmp")) return "image/bmp";
    return "image/png";
}

std::optional<std::string> resolve_image_url(const std::string& reference) {
    std::string ref = utils::trim_copy(reference);
    if (ref.empty()) return std::nullopt;

    if (utils::starts_with(ref, "http://") || utils::starts_with(ref, "https://") ||
        utils::starts_with(ref, "data:")) {
        return ref;
    }

    std::string path = expand_path(ref);
    if (file_exists(path)) {
        auto bytes = read_file_bytes(path);
        if (bytes.is_error()) {
            LOG_WARN("Cannot attach " + path + ": " + bytes.error().message);
            return std::nullopt;
        }
        return "data:" + image_mime_type(path) + ";base64," +
               base64_encode(bytes.value().data(), bytes.value().size());
    }

    if (looks_like_base64(ref)) {
        return "data:image/png;base64," + ref;
    }
    return std::nullopt;
}

nlohmann::json build_user_content(const std::string& text, const std::vector<std::string>& media) {
    nlohmann::json parts = nlohmann::json::array();
    parts.push_back({{"type", "text"}, {"text", text}});
    for (const auto& reference : media) {
        auto url = resolve_image_url(reference);
        if (!url) {
            LOG_WARN("Skipping unusable media reference: " + utils::truncate_with_marker(reference, 80));
            continue;
        }
        parts.push_back({{"type", "image_url"}, {"image_url", {{"url", *url}}}});
    }
    if (parts.size() == 1) {
        return text;
    }
    return parts;
}

nlohmann::json build_chat_request(const LLMConfig& config, const std::string& system_prompt,
                                  const nlohmann::json& user_content) {
    nlohmann::json messages = nlohmann::json::array();
    if (!system_prompt.empty()) {
        messages.push_back({{"role", "system"}, {"content", system_prompt}});
    }
    messages.push_back({{"role", "user"}, {"content", user_content}});

    nlohmann::json request;
    request["model"] = config.model_id;
    request["messages"] = messages;
    request["temperature"] = config.temperature;
    request["stream"] = false;
    if (config.max_tokens > 0) {
        request["max_tokens"] = config.max_tokens;
    }
    return request;
}

} // namespace conductor
