#pragma once

/**
 * @file wav_codec.h
 * @brief 16-bit PCM WAV encode/decode and the conversions backends need
 */

#include "common.h"
#include "errors.h"

namespace conductor {
namespace audio {

struct PcmAudio {
    AudioBuffer samples;    ///< Interleaved when channels > 1
    int sample_rate = DEFAULT_SAMPLE_RATE;
    int channels = 1;
};

/**
 * @brief Parse a RIFF/WAVE file (chunks in any order, 16-bit PCM only)
 */
Result<PcmAudio> decode_wav(const Bytes& bytes);

/**
 * @brief Encode mono 16-bit PCM as a canonical 44-byte-header WAV
 */
Bytes encode_wav(const AudioBuffer& samples, int sample_rate);

/// Keep the first channel of interleaved audio
AudioBuffer to_mono(const AudioBuffer& interleaved, int channels);

/// Linear-interpolation resampler
AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate);

} // namespace audio
} // namespace conductor
