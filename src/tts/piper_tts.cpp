/**
 * @file piper_tts.cpp
 * @brief Piper TTS implementation
 */

#include "tts/piper_tts.h"
#include "audio/wav_codec.h"
#include "logger.h"
#include "path_utils.h"
#include "process.h"
#include <cstdio>
#include <list>
#include <mutex>
#include <optional>
#include <sstream>
#include <unordered_map>
#include <unistd.h>

namespace conductor {
namespace tts {

namespace {

constexpr size_t MAX_CACHE_ENTRIES = 32;
constexpr size_t MAX_CACHE_TEXT_LENGTH = 80;
constexpr const char* WARMUP_TEXT = "Warmup health check.";

} // anonymous namespace

/**
 * @brief LRU Cache for synthesized phrases
 */
template<typename K, typename V>
class LRUCache {
public:
    explicit LRUCache(size_t capacity) : capacity_(capacity) {}

    std::optional<V> get(const K& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = map_.find(key);
        if (it == map_.end()) {
            return std::nullopt;
        }

        // Move to front (most recently used)
        list_.splice(list_.begin(), list_, it->second);
        return it->second->second;
    }

    void put(const K& key, const V& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = map_.find(key);
        if (it != map_.end()) {
            it->second->second = value;
            list_.splice(list_.begin(), list_, it->second);
            return;
        }

        if (list_.size() >= capacity_) {
            map_.erase(list_.back().first);
            list_.pop_back();
        }

        list_.emplace_front(key, value);
        map_[key] = list_.begin();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return list_.size();
    }

private:
    size_t capacity_;
    std::list<std::pair<K, V>> list_;
    std::unordered_map<K, typename std::list<std::pair<K, V>>::iterator> map_;
    mutable std::mutex mutex_;
};

/**
 * @brief Implementation details for PiperTTS
 */
class PiperTTS::Impl {
public:
    Impl(const TTSConfig& config, std::shared_ptr<AssetFetcher> fetcher,
         std::shared_ptr<audio::PlaybackSink> player)
        : config_(config)
        , fetcher_(std::move(fetcher))
        , player_(std::move(player))
        , cache_(MAX_CACHE_ENTRIES)
        , ready_(false)
        , cache_hits_(0)
        , cache_misses_(0)
        , total_synthesis_ms_(0)
        , synthesis_count_(0)
    {}

    VoidResult prepare() {
        LOG_TTS("Preparing piper voice " + file_name(config_.voice_path));

        auto found = find_piper();
        if (found.is_error()) {
            return found;
        }

        if (fetcher_) {
            auto model = fetcher_->fetch(config_.voice_url, config_.voice_path);
            if (model.is_error()) return model;
            if (!config_.voice_url.empty()) {
                auto meta = fetcher_->fetch(config_.voice_url + ".json", config_.voice_path + ".json");
                if (meta.is_error()) return meta;
            }
        } else if (!file_exists(config_.voice_path)) {
            return make_io_error("Voice model not found: " + config_.voice_path);
        }

        // Warmup doubles as the readiness check
        auto warm = synthesize_uncached(WARMUP_TEXT);
        if (warm.is_error()) {
            return make_error(warm.error().type, "warmup failed: " + warm.error().message);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = true;
        LOG_TTS("TTS warmup complete");
        return VoidResult();
    }

    HealthProbe health_check() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (piper_path_.empty()) {
                return HealthProbe::unhealthy("Piper binary not found",
                                              "Install piper or set tts.piper_path in config");
            }
        }
        if (!file_exists(config_.voice_path)) {
            return HealthProbe::unhealthy("Voice model not found: " + config_.voice_path,
                                          "Set tts.voice_url or place the voice at tts.voice_path");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ready_) {
            return HealthProbe::unhealthy("Warmup has not succeeded", "Re-initialize the piper backend");
        }
        return HealthProbe::healthy();
    }

    Result<SynthesisResult> synthesize(const std::string& text) {
        const TimePoint start = Clock::now();
        SynthesisResult result;
        result.backend = "piper";

        auto cached = cache_.get(text);
        if (cached) {
            cache_hits_++;
            result.audio.bytes = *cached;
        } else {
            cache_misses_++;
            auto rendered = synthesize_uncached(text);
            if (rendered.is_error()) {
                return rendered.error();
            }
            result.audio.bytes = std::move(rendered.value());
            if (text.length() <= MAX_CACHE_TEXT_LENGTH) {
                cache_.put(text, result.audio.bytes);
            }
        }
        result.audio.filename = "speech.wav";
        result.mode = SynthesisMode::AudioBytes;

        if (config_.local_playback && player_ && player_->is_available()) {
            auto decoded = audio::decode_wav(result.audio.bytes);
            if (decoded.is_error()) {
                return decoded.error();
            }
            const auto& pcm = decoded.value();
            auto played = player_->play(audio::to_mono(pcm.samples, pcm.channels), pcm.sample_rate);
            if (played.is_error()) {
                return played.error();
            }
            result.mode = SynthesisMode::LocalPlayback;
        }

        result.synthesis_ms = ms_since(start);
        return result;
    }

    Stats get_stats() const {
        Stats stats;
        stats.cache_size = cache_.size();
        stats.cache_hits = cache_hits_;
        stats.cache_misses = cache_misses_;
        stats.avg_synthesis_ms = synthesis_count_ > 0
            ? static_cast<int64_t>(total_synthesis_ms_ / static_cast<int64_t>(synthesis_count_))
            : 0;
        return stats;
    }

    const TTSConfig& config() const { return config_; }

private:
    // =========================================================================
    // Piper Interaction
    // =========================================================================

    VoidResult find_piper() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!piper_path_.empty()) {
            return VoidResult();
        }

        // If custom path specified, use it
        if (!config_.piper_path.empty()) {
            if (access(config_.piper_path.c_str(), X_OK) == 0) {
                piper_path_ = config_.piper_path;
                LOG_TTS("Using custom piper path: " + piper_path_);
                return VoidResult();
            }
            return make_io_error("Custom piper path not found: " + config_.piper_path);
        }

        std::string found = find_executable("piper");
        if (found.empty()) {
            return make_io_error("Piper binary not found. Install piper or set piper_path in config.");
        }
        piper_path_ = found;
        LOG_TTS("Found piper at: " + piper_path_);
        return VoidResult();
    }

    std::string piper_path() {
        std::lock_guard<std::mutex> lock(mutex_);
        return piper_path_;
    }

    Result<Bytes> synthesize_uncached(const std::string& text) {
        auto found = find_piper();
        if (found.is_error()) {
            return found.error();
        }

        const TimePoint start_time = Clock::now();
        std::ostringstream temp_name;
        temp_name << "/tmp/conductor_tts_" << getpid() << "_"
                  << Clock::now().time_since_epoch().count() << ".wav";
        const std::string temp_wav = temp_name.str();

        std::vector<std::string> argv = {piper_path(), "--model", config_.voice_path,
                                         "--output_file", temp_wav};
        if (!config_.espeak_data_path.empty()) {
            argv.push_back("--espeak_data");
            argv.push_back(config_.espeak_data_path);
        }

        ProcessOptions options;
        options.stdin_data = text + "\n";
        options.timeout_ms = config_.stage_timeout_ms;

        LOG_TTS("Synthesizing: \"" + text + "\"");
        auto ran = run_process(argv, options);
        if (ran.is_error()) {
            return ran.error();
        }
        const ProcessOutput& output = ran.value();
        if (!output.succeeded()) {
            std::remove(temp_wav.c_str());
            if (output.timed_out) {
                return make_timeout_error("piper did not finish within " +
                                          std::to_string(config_.stage_timeout_ms) + "ms");
            }
            std::string detail = output.stderr_text.size() > 300 ? output.stderr_text.substr(0, 300)
                                                                 : output.stderr_text;
            return make_error(ErrorType::Unknown, "Piper command failed with code: " +
                              std::to_string(output.exit_code) + (detail.empty() ? "" : " (" + detail + ")"));
        }

        auto wav = read_file_bytes(temp_wav);
        std::remove(temp_wav.c_str());
        if (wav.is_error()) {
            return wav.error();
        }
        if (wav.value().size() <= 44) {
            return make_io_error("Failed to read synthesized audio");
        }

        int64_t elapsed = ms_since(start_time);
        total_synthesis_ms_ += elapsed;
        synthesis_count_++;

        std::ostringstream timing_oss;
        timing_oss << "Synthesized " << wav.value().size() << " bytes in " << elapsed << "ms";
        LOG_TTS(timing_oss.str());
        return wav;
    }

    // =========================================================================
    // Member Variables
    // =========================================================================

    TTSConfig config_;
    std::shared_ptr<AssetFetcher> fetcher_;
    std::shared_ptr<audio::PlaybackSink> player_;
    LRUCache<std::string, Bytes> cache_;

    std::mutex mutex_;
    std::string piper_path_;
    bool ready_;

    // Statistics
    std::atomic<size_t> cache_hits_;
    std::atomic<size_t> cache_misses_;
    std::atomic<int64_t> total_synthesis_ms_;
    std::atomic<size_t> synthesis_count_;
};

// =============================================================================
// Public Interface Implementation
// =============================================================================

PiperTTS::PiperTTS(const TTSConfig& config,
                   std::shared_ptr<AssetFetcher> fetcher,
                   std::shared_ptr<audio::PlaybackSink> player)
    : impl_(std::make_unique<Impl>(config, std::move(fetcher), std::move(player))) {}

PiperTTS::~PiperTTS() = default;

std::string PiperTTS::description() const {
    return "piper with " + file_name(impl_->config().voice_path);
}

VoidResult PiperTTS::prepare() {
    return impl_->prepare();
}

HealthProbe PiperTTS::health_check() {
    return impl_->health_check();
}

Result<SynthesisResult> PiperTTS::synthesize(const std::string& text) {
    return impl_->synthesize(text);
}

PiperTTS::Stats PiperTTS::get_stats() const {
    return impl_->get_stats();
}

} // namespace tts
} // namespace conductor
