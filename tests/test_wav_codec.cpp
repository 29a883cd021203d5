/**
 * WAV codec and the sample conversions the transcription backends use.
 *
 * Run from build dir: ./test_wav_codec
 */

#include "test_support.h"
#include "audio/wav_codec.h"

using namespace conductor;
using namespace conductor::audio;

namespace {

void put_u32(Bytes& b, uint32_t v) {
    for (int i = 0; i < 4; ++i) b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
}

void put_u16(Bytes& b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xff));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void put_tag(Bytes& b, const char* tag) {
    b.insert(b.end(), tag, tag + 4);
}

/// Hand-built WAV with an extra LIST chunk before fmt and a configurable format
Bytes build_wav(uint16_t channels, uint16_t bits, const AudioBuffer& samples) {
    Bytes b;
    put_tag(b, "RIFF");
    put_u32(b, 0);  // size is not checked
    put_tag(b, "WAVE");

    put_tag(b, "LIST");
    put_u32(b, 3);  // odd size: padded to 4
    b.push_back('a');
    b.push_back('b');
    b.push_back('c');
    b.push_back(0);

    put_tag(b, "fmt ");
    put_u32(b, 16);
    put_u16(b, 1);
    put_u16(b, channels);
    put_u32(b, 22050);
    put_u32(b, 22050 * channels * bits / 8);
    put_u16(b, static_cast<uint16_t>(channels * bits / 8));
    put_u16(b, bits);

    put_tag(b, "data");
    put_u32(b, static_cast<uint32_t>(samples.size() * 2));
    for (Sample s : samples) put_u16(b, static_cast<uint16_t>(s));
    return b;
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- encode then decode ---
    {
        AudioBuffer samples = {0, 1000, -1000, 32767, -32768};
        Bytes wav = encode_wav(samples, 16000);
        ASSERT(wav.size() == 44 + samples.size() * 2);
        ASSERT(wav[0] == 'R' && wav[8] == 'W');

        auto decoded = decode_wav(wav);
        ASSERT(decoded.is_ok());
        if (decoded.is_ok()) {
            ASSERT(decoded.value().sample_rate == 16000);
            ASSERT(decoded.value().channels == 1);
            ASSERT(decoded.value().samples == samples);
        }
    }

    // --- chunks in any order, stereo ---
    {
        AudioBuffer interleaved = {10, 20, 11, 21, 12, 22};
        auto decoded = decode_wav(build_wav(2, 16, interleaved));
        ASSERT(decoded.is_ok());
        if (decoded.is_ok()) {
            ASSERT(decoded.value().channels == 2);
            ASSERT(decoded.value().sample_rate == 22050);
            AudioBuffer mono = to_mono(decoded.value().samples, decoded.value().channels);
            ASSERT(mono.size() == 3);
            ASSERT(mono[0] == 10 && mono[1] == 11 && mono[2] == 12);
        }
    }

    // --- rejected inputs ---
    {
        auto eight_bit = decode_wav(build_wav(1, 8, {1, 2}));
        ASSERT(eight_bit.is_error() && eight_bit.error().type == ErrorType::ParseError);

        Bytes not_wav = {'O', 'g', 'g', 'S', 0, 0, 0, 0, 'v', 'o', 'r', 'b'};
        ASSERT(decode_wav(not_wav).is_error());
        ASSERT(decode_wav(Bytes()).is_error());

        Bytes header_only = encode_wav({}, 16000);
        header_only.resize(36);  // cut before the data chunk
        ASSERT(decode_wav(header_only).is_error());
    }

    // --- resampling ---
    {
        AudioBuffer second(48000, 100);
        AudioBuffer down = resample(second, 48000, 16000);
        ASSERT(down.size() == 16000);
        ASSERT(down[0] == 100 && down[15999] == 100);

        AudioBuffer ramp = {0, 100, 200, 300};
        AudioBuffer up = resample(ramp, 8000, 16000);
        ASSERT(up.size() == 8);
        ASSERT(up[1] == 50);

        ASSERT(resample(ramp, 16000, 16000) == ramp);
        ASSERT(resample(AudioBuffer(), 8000, 16000).empty());
        ASSERT(to_mono(ramp, 1) == ramp);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed\n";
        return 1;
    }
    std::cout << "All WAV codec tests passed.\n";
    return 0;
}
