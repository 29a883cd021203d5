/**
 * Media references: URL resolution, base64 inlining and the chat payload
 * the LLM client sends.
 *
 * Run from build dir: ./test_media
 */

#include "test_support.h"
#include "config.h"
#include "media.h"
#include <cstdio>
#include <fstream>
#include <unistd.h>

using namespace conductor;
using json = nlohmann::json;

namespace {

std::string base64_of(const std::string& text) {
    return base64_encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- base64 ---
    {
        ASSERT(base64_of("") == "");
        ASSERT(base64_of("f") == "Zg==");
        ASSERT(base64_of("fo") == "Zm8=");
        ASSERT(base64_of("foo") == "Zm9v");
        ASSERT(base64_of("foobar") == "Zm9vYmFy");

        ASSERT(looks_like_base64("iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mNk"));
        ASSERT(!looks_like_base64("Zm9v"));
        ASSERT(!looks_like_base64("this is a sentence that is definitely longer than 32"));
    }

    // --- reference resolution ---
    {
        ASSERT(resolve_image_url("https://example.com/cat.png").value_or("") == "https://example.com/cat.png");
        ASSERT(resolve_image_url("http://host/a.jpg").value_or("") == "http://host/a.jpg");
        ASSERT(resolve_image_url("data:image/gif;base64,R0lG").value_or("") == "data:image/gif;base64,R0lG");

        std::string raw = "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mNk";
        ASSERT(resolve_image_url(raw).value_or("") == "data:image/png;base64," + raw);

        ASSERT(!resolve_image_url("").has_value());
        ASSERT(!resolve_image_url("/no/such/picture.png").has_value());
        ASSERT(!resolve_image_url("not an image").has_value());

        std::string path = "/tmp/conductor_test_" + std::to_string(::getpid()) + "_photo.JPG";
        {
            std::ofstream out(path, std::ios::binary);
            out << "foo";
        }
        ASSERT(resolve_image_url(path).value_or("") == "data:image/jpeg;base64,Zm9v");
        std::remove(path.c_str());

        ASSERT(image_mime_type("a.webp") == "image/webp");
        ASSERT(image_mime_type("noext") == "image/png");
    }

    // --- user content parts ---
    {
        json plain = build_user_content("describe this", {});
        ASSERT(plain.is_string() && plain == "describe this");

        json only_bad = build_user_content("describe this", {"not an image"});
        ASSERT(only_bad.is_string());

        json parts = build_user_content("describe this", {"https://example.com/cat.png", "junk", "data:image/png;base64,AAAA"});
        ASSERT(parts.is_array());
        ASSERT(parts.size() == 3);
        if (parts.size() == 3) {
            ASSERT(parts[0]["type"] == "text");
            ASSERT(parts[0]["text"] == "describe this");
            ASSERT(parts[1]["type"] == "image_url");
            ASSERT(parts[1]["image_url"]["url"] == "https://example.com/cat.png");
            ASSERT(parts[2]["image_url"]["url"] == "data:image/png;base64,AAAA");
        }
    }

    // --- chat request body ---
    {
        LLMConfig llm;
        llm.model_id = "vision-model";
        llm.temperature = 0.5;
        llm.max_tokens = 0;

        json body = build_chat_request(llm, "system rules",
                                       build_user_content("what is here", {"https://example.com/cat.png"}));
        ASSERT(body["model"] == "vision-model");
        ASSERT(body["stream"] == false);
        ASSERT(!body.contains("max_tokens"));
        ASSERT(body["messages"].size() == 2);
        ASSERT(body["messages"][0]["role"] == "system");
        const json& user = body["messages"][1];
        ASSERT(user["role"] == "user");
        ASSERT(user["content"].is_array() && user["content"].size() == 2);
        ASSERT(user["content"][1]["image_url"]["url"] == "https://example.com/cat.png");

        llm.max_tokens = 256;
        json no_system = build_chat_request(llm, "", json("hi"));
        ASSERT(no_system["messages"].size() == 1);
        ASSERT(no_system["messages"][0]["content"] == "hi");
        ASSERT(no_system["max_tokens"] == 256);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "All media tests passed.\n";
    return 0;
}
