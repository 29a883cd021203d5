#include "audio/wav_codec.h"
#include <algorithm>
#include <cstring>

namespace conductor {
namespace audio {

namespace {

uint16_t read_u16(const Bytes& b, size_t offset) {
    return static_cast<uint16_t>(b[offset] | (b[offset + 1] << 8));
}

uint32_t read_u32(const Bytes& b, size_t offset) {
    return static_cast<uint32_t>(b[offset]) |
           (static_cast<uint32_t>(b[offset + 1]) << 8) |
           (static_cast<uint32_t>(b[offset + 2]) << 16) |
           (static_cast<uint32_t>(b[offset + 3]) << 24);
}

void put_u16(Bytes& b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xff));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void put_u32(Bytes& b, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        b.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xff));
    }
}

void put_tag(Bytes& b, const char* tag) {
    b.insert(b.end(), tag, tag + 4);
}

bool tag_is(const Bytes& b, size_t offset, const char* tag) {
    return std::memcmp(b.data() + offset, tag, 4) == 0;
}

} // anonymous namespace

Result<PcmAudio> decode_wav(const Bytes& bytes) {
    if (bytes.size() < 12 || !tag_is(bytes, 0, "RIFF") || !tag_is(bytes, 8, "WAVE")) {
        return make_parse_error("not a RIFF/WAVE file");
    }

    PcmAudio pcm;
    bool have_fmt = false;
    size_t offset = 12;
    while (offset + 8 <= bytes.size()) {
        uint32_t chunk_size = read_u32(bytes, offset + 4);
        size_t body = offset + 8;
        size_t available = std::min<size_t>(chunk_size, bytes.size() - body);

        if (tag_is(bytes, offset, "fmt ")) {
            if (available < 16) {
                return make_parse_error("fmt chunk too short");
            }
            uint16_t format = read_u16(bytes, body);
            pcm.channels = read_u16(bytes, body + 2);
            pcm.sample_rate = static_cast<int>(read_u32(bytes, body + 4));
            uint16_t bits = read_u16(bytes, body + 14);
            if (format != 1 || bits != 16) {
                return make_parse_error("only 16-bit PCM WAV is supported (format " +
                                        std::to_string(format) + ", " + std::to_string(bits) + " bits)");
            }
            if (pcm.channels == 0 || pcm.sample_rate <= 0) {
                return make_parse_error("invalid channel count or sample rate");
            }
            have_fmt = true;
        } else if (tag_is(bytes, offset, "data")) {
            if (!have_fmt) {
                return make_parse_error("data chunk before fmt chunk");
            }
            size_t count = available / sizeof(Sample);
            pcm.samples.resize(count);
            for (size_t i = 0; i < count; ++i) {
                pcm.samples[i] = static_cast<Sample>(read_u16(bytes, body + i * 2));
            }
            return pcm;
        }
        // Chunks are word-aligned
        offset = body + chunk_size + (chunk_size & 1);
    }
    return make_parse_error("no data chunk");
}

Bytes encode_wav(const AudioBuffer& samples, int sample_rate) {
    const uint16_t channels = 1;
    const uint16_t bits_per_sample = 16;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(Sample));

    Bytes out;
    out.reserve(44 + data_size);

    // RIFF header
    put_tag(out, "RIFF");
    put_u32(out, 36 + data_size);
    put_tag(out, "WAVE");

    // fmt chunk
    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, 1);  // PCM
    put_u16(out, channels);
    put_u32(out, static_cast<uint32_t>(sample_rate));
    put_u32(out, static_cast<uint32_t>(sample_rate) * channels * bits_per_sample / 8);
    put_u16(out, channels * bits_per_sample / 8);
    put_u16(out, bits_per_sample);

    // data chunk
    put_tag(out, "data");
    put_u32(out, data_size);
    for (Sample s : samples) {
        put_u16(out, static_cast<uint16_t>(s));
    }
    return out;
}

AudioBuffer to_mono(const AudioBuffer& interleaved, int channels) {
    if (channels <= 1) return interleaved;
    AudioBuffer mono;
    mono.reserve(interleaved.size() / channels);
    for (size_t i = 0; i + channels - 1 < interleaved.size(); i += channels) {
        mono.push_back(interleaved[i]);
    }
    return mono;
}

AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) return input;

    float ratio = static_cast<float>(from_rate) / static_cast<float>(to_rate);
    size_t output_samples = static_cast<size_t>(input.size() / ratio);

    AudioBuffer output;
    output.reserve(output_samples);

    for (size_t i = 0; i < output_samples; i++) {
        float input_pos = static_cast<float>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);

        // Linear interpolation
        float t = input_pos - idx0;
        float sample0 = static_cast<float>(input[idx0]);
        float sample1 = static_cast<float>(input[idx1]);
        output.push_back(static_cast<Sample>(sample0 * (1.0f - t) + sample1 * t));
    }
    return output;
}

} // namespace audio
} // namespace conductor
