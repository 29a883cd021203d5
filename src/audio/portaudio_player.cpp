#include "audio/portaudio_player.h"
#include "logger.h"
#include <portaudio.h>
#include <algorithm>
#include <cctype>
#include <mutex>

namespace conductor {
namespace audio {

namespace {

constexpr unsigned long FRAMES_PER_BUFFER = 512;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // anonymous namespace

class PortAudioPlayer::Impl {
public:
    explicit Impl(const std::string& output_device) : output_device_(output_device), initialized_(false) {
        PaError err = Pa_Initialize();
        if (err != paNoError) {
            Logger::error("PortAudio init error: " + std::string(Pa_GetErrorText(err)));
            return;
        }
        initialized_ = true;
    }

    ~Impl() {
        if (initialized_) {
            Pa_Terminate();
        }
    }

    bool is_available() const {
        return initialized_ && find_device() >= 0;
    }

    VoidResult play(const AudioBuffer& samples, int sample_rate) {
        if (!initialized_) {
            return make_error(ErrorType::InvalidState, "PortAudio is not initialized");
        }
        if (samples.empty()) {
            return VoidResult();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        int device = find_device();
        if (device < 0) {
            return make_io_error("Output device not found: " +
                                 (output_device_.empty() ? std::string("default") : output_device_));
        }

        PaStreamParameters output_params;
        output_params.device = device;
        output_params.channelCount = 1;
        output_params.sampleFormat = paInt16;
        output_params.suggestedLatency = Pa_GetDeviceInfo(device)->defaultLowOutputLatency;
        output_params.hostApiSpecificStreamInfo = nullptr;

        PaStream* stream = nullptr;
        PaError err = Pa_OpenStream(&stream, nullptr, &output_params, sample_rate,
                                    FRAMES_PER_BUFFER, paClipOff, nullptr, nullptr);
        if (err != paNoError) {
            return make_io_error("Failed to open output stream: " + std::string(Pa_GetErrorText(err)));
        }
        err = Pa_StartStream(stream);
        if (err != paNoError) {
            Pa_CloseStream(stream);
            return make_io_error("Failed to start output stream: " + std::string(Pa_GetErrorText(err)));
        }

        size_t offset = 0;
        while (offset < samples.size()) {
            unsigned long frames = static_cast<unsigned long>(
                std::min<size_t>(FRAMES_PER_BUFFER, samples.size() - offset));
            err = Pa_WriteStream(stream, samples.data() + offset, frames);
            // Underflow is audible but not fatal
            if (err != paNoError && err != paOutputUnderflowed) {
                break;
            }
            offset += frames;
        }

        Pa_StopStream(stream);
        Pa_CloseStream(stream);
        if (err != paNoError && err != paOutputUnderflowed) {
            return make_io_error("Playback failed: " + std::string(Pa_GetErrorText(err)));
        }
        return VoidResult();
    }

private:
    int find_device() const {
        if (output_device_.empty() || output_device_ == "default") {
            PaDeviceIndex idx = Pa_GetDefaultOutputDevice();
            return idx == paNoDevice ? -1 : idx;
        }
        const std::string wanted = to_lower(output_device_);
        int num_devices = Pa_GetDeviceCount();
        for (int i = 0; i < num_devices; i++) {
            const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
            if (info && info->maxOutputChannels > 0 &&
                to_lower(info->name).find(wanted) != std::string::npos) {
                return i;
            }
        }
        return -1;
    }

    std::string output_device_;
    bool initialized_;
    std::mutex mutex_;
};

PortAudioPlayer::PortAudioPlayer(const std::string& output_device)
    : pimpl_(std::make_unique<Impl>(output_device)) {}

PortAudioPlayer::~PortAudioPlayer() = default;

VoidResult PortAudioPlayer::play(const AudioBuffer& samples, int sample_rate) {
    return pimpl_->play(samples, sample_rate);
}

bool PortAudioPlayer::is_available() const {
    return pimpl_->is_available();
}

} // namespace audio
} // namespace conductor
