#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace conductor {

/**
 * @brief Turn a media reference into something a vision model can fetch
 *
 * http(s) and data: URLs pass through unchanged. An existing local file is
 * read and inlined as a base64 data: URL, its MIME type taken from the
 * extension. A bare base64 string is wrapped as a PNG data: URL. Anything
 * else yields nullopt.
 */
std::optional<std::string> resolve_image_url(const std::string& reference);

/// "image/png" | "image/jpeg" | "image/gif" | "image/webp" | "image/bmp"; PNG when unknown
std::string image_mime_type(const std::string& path);

/// At least 32 characters of the base64 alphabet with no whitespace
bool looks_like_base64(const std::string& value);

std::string base64_encode(const uint8_t* data, size_t len);

/**
 * @brief Chat-completions user message content
 *
 * Plain string when no media resolves; otherwise an array holding one
 * {"type": "text"} part followed by one {"type": "image_url"} part per
 * resolved reference. Unresolvable references are logged and skipped.
 */
nlohmann::json build_user_content(const std::string& text, const std::vector<std::string>& media);

struct LLMConfig;

/**
 * @brief Body for POST /chat/completions: model, optional system message,
 * one user message carrying `user_content`, temperature, max_tokens when set
 */
nlohmann::json build_chat_request(const LLMConfig& config, const std::string& system_prompt,
                                  const nlohmann::json& user_content);

} // namespace conductor
