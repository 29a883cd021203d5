#pragma once

#include "delegate.h"
#include "speech_pipeline.h"

namespace conductor {

/**
 * @brief Speaks text through the synthesis registry's current provider
 *
 * invoke({"text": "..."}). Backed by the speech pipeline so the loop
 * always uses whichever synthesis backend is selected at call time.
 */
class SpeakDelegate : public Delegate {
public:
    explicit SpeakDelegate(SpeechPipeline& pipeline) : pipeline_(pipeline) {}

    std::string name() const override { return "speak"; }
    std::string description() const override {
        return "Speak a short message aloud (or render it to audio) with the selected speech synthesis backend.";
    }
    std::string usage() const override { return "speak({\"text\": \"message to say\"})"; }
    DelegateResult invoke(const nlohmann::json& args) override;

private:
    SpeechPipeline& pipeline_;
};

} // namespace conductor
