#pragma once

/**
 * @file synthesis_provider.h
 * @brief Text-to-speech backend family
 */

#include "backend/backend_provider.h"
#include "backend/backend_registry.h"
#include "common.h"
#include "errors.h"
#include <string>

namespace conductor {
namespace tts {

enum class SynthesisMode {
    AudioBytes,     ///< `audio` holds the encoded clip for the caller
    LocalPlayback   ///< Played on this machine's output device
};

const char* synthesis_mode_name(SynthesisMode mode);

struct SynthesisResult {
    SynthesisMode mode = SynthesisMode::AudioBytes;
    std::string backend;   ///< Provider id
    AudioClip audio;       ///< WAV bytes (also filled for local playback)
    int64_t synthesis_ms = 0;
};

/**
 * @brief Synthesis provider: readiness contract plus synthesize()
 */
class SynthesisProvider : public BackendProvider {
public:
    virtual Result<SynthesisResult> synthesize(const std::string& text) = 0;
};

} // namespace tts

using SynthesisRegistry = BackendRegistry<tts::SynthesisProvider>;

} // namespace conductor
