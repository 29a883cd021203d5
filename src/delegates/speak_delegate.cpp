#include "delegates/speak_delegate.h"

namespace conductor {

DelegateResult SpeakDelegate::invoke(const nlohmann::json& args) {
    std::string text = text_argument(args, {"text", "message", "query"});
    if (text.empty()) {
        return DelegateResult::error_result("speak needs a 'text' argument", "invalid_arguments");
    }

    auto spoken = pipeline_.speak(text);
    if (spoken.is_error()) {
        return DelegateResult::error_result(spoken.error().describe(), "synthesis_failed");
    }
    const auto& result = spoken.value();
    return DelegateResult::success_result(
        "Spoke " + std::to_string(text.size()) + " characters via " + result.backend +
        " (" + tts::synthesis_mode_name(result.mode) + ", " +
        std::to_string(result.audio.bytes.size()) + " bytes)");
}

} // namespace conductor
