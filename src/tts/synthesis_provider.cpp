#include "tts/synthesis_provider.h"

namespace conductor {
namespace tts {

const char* synthesis_mode_name(SynthesisMode mode) {
    switch (mode) {
        case SynthesisMode::AudioBytes: return "audio_bytes";
        case SynthesisMode::LocalPlayback: return "local_playback";
    }
    return "audio_bytes";
}

} // namespace tts
} // namespace conductor
