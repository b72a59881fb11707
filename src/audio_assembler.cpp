#include "audio_assembler.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace voicegate {

class AudioAssembler::Impl {
public:
    Impl(const VADConfig& vad_config, const AudioConfig& audio_config)
        : config_(vad_config),
          sample_rate_(audio_config.sample_rate),
          noise_floor_(vad_config.threshold * 0.3f),
          noise_floor_initialized_(false) {
        frame_samples_ = std::max<size_t>(1, ms_to_samples(config_.frame_ms, sample_rate_));
        end_silence_samples_ = ms_to_samples(config_.end_of_utterance_silence_ms, sample_rate_);
        max_samples_ = ms_to_samples(audio_config.max_utterance_ms, sample_rate_);
        start_frames_required_ = std::max(1, config_.start_frames_required);
    }

    std::vector<Utterance> push(const AudioBuffer& chunk) {
        std::vector<Utterance> ready;
        pending_.insert(pending_.end(), chunk.begin(), chunk.end());

        size_t offset = 0;
        while (pending_.size() - offset >= frame_samples_) {
            auto first = pending_.begin() + static_cast<std::ptrdiff_t>(offset);
            current_.insert(current_.end(), first, first + static_cast<std::ptrdiff_t>(frame_samples_));
            offset += frame_samples_;

            float rms = compute_energy(current_.end() - static_cast<std::ptrdiff_t>(frame_samples_), current_.end());
            process_frame(rms, ready);

            if (!current_.empty() && current_.size() >= max_samples_) {
                if (speech_frames_ > 0) {
                    std::ostringstream oss;
                    oss << "Utterance reached max duration ("
                        << samples_to_ms(current_.size(), sample_rate_) << "ms), truncating";
                    Logger::warn("[Audio] " + oss.str());
                    stats_truncations_++;
                    ready.push_back(flush(FlushReason::MaxDuration));
                } else {
                    discard("max duration without speech");
                }
            }
        }
        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
        return ready;
    }

    std::optional<Utterance> end_of_turn() {
        current_.insert(current_.end(), pending_.begin(), pending_.end());
        pending_.clear();

        // A tail shorter than a frame is never analyzed; one speech frame anywhere is enough here
        if (speech_frames_ == 0) {
            if (!current_.empty()) {
                discard("end-of-turn without speech");
            }
            return std::nullopt;
        }
        return flush(FlushReason::EndOfTurn);
    }

    bool is_assembling() const {
        return !current_.empty() || !pending_.empty();
    }

    void reset() {
        current_.clear();
        pending_.clear();
        reset_segment_state();
    }

    AssemblerStats get_stats() const {
        AssemblerStats stats;
        stats.buffered_samples = current_.size();
        stats.pending_samples = pending_.size();
        stats.speech_detected = speech_confirmed_;
        stats.noise_floor = noise_floor_;
        stats.utterances_emitted = stats_emitted_;
        stats.spans_discarded = stats_discarded_;
        stats.truncations = stats_truncations_;
        return stats;
    }

private:
    void process_frame(float rms, std::vector<Utterance>& ready) {
        update_noise_floor(rms);
        float effective_start = std::max(config_.threshold, noise_floor_ * 2.0f + 0.02f);
        bool speech = rms > effective_start && rms > config_.silence_threshold;

        if (speech) {
            speech_frames_++;
            silence_samples_ = 0;
            if (!speech_confirmed_) {
                consecutive_speech_frames_++;
                if (consecutive_speech_frames_ >= start_frames_required_) {
                    speech_confirmed_ = true;
                    std::ostringstream oss;
                    oss << "Speech start rms=" << rms << " threshold=" << effective_start;
                    LOG_AUDIO(oss.str());
                }
            }
            return;
        }

        consecutive_speech_frames_ = 0;
        silence_samples_ += frame_samples_;
        if (silence_samples_ < end_silence_samples_) {
            return;
        }

        if (speech_confirmed_) {
            std::ostringstream oss;
            oss << "Speech end rms=" << rms << " silence_ms=" << samples_to_ms(silence_samples_, sample_rate_);
            LOG_AUDIO(oss.str());
            ready.push_back(flush(FlushReason::Silence));
        } else {
            discard("silence");
        }
    }

    Utterance flush(FlushReason reason) {
        Utterance utterance;
        utterance.samples.swap(current_);
        utterance.duration_ms = samples_to_ms(utterance.samples.size(), sample_rate_);
        utterance.reason = reason;
        reset_segment_state();
        stats_emitted_++;

        std::ostringstream oss;
        oss << "Utterance ready: " << utterance.duration_ms << "ms reason=" << flush_reason_to_string(reason);
        LOG_AUDIO(oss.str());
        return utterance;
    }

    void discard(const char* why) {
        std::ostringstream oss;
        oss << "Discarding " << samples_to_ms(current_.size(), sample_rate_) << "ms without speech (" << why << ")";
        LOG_AUDIO(oss.str());
        current_.clear();
        reset_segment_state();
        stats_discarded_++;
    }

    void reset_segment_state() {
        speech_confirmed_ = false;
        consecutive_speech_frames_ = 0;
        speech_frames_ = 0;
        silence_samples_ = 0;
    }

    void update_noise_floor(float rms) {
        const float alpha_silence = 0.92f;   // slow adaptation when in silence
        const float alpha_speech = 0.995f;   // very slow during speech
        const float min_noise = 0.005f;
        const float max_noise = 0.25f;
        if (!speech_confirmed_) {
            if (!noise_floor_initialized_) {
                // Seed only from a quiet frame; speech at stream start must not raise the floor
                if (rms <= config_.threshold) {
                    noise_floor_ = std::max(min_noise, std::min(max_noise, rms));
                    noise_floor_initialized_ = true;
                }
            } else if (rms <= std::max(config_.threshold, noise_floor_ * 2.0f + 0.02f)) {
                noise_floor_ = alpha_silence * noise_floor_ + (1.0f - alpha_silence) * rms;
                noise_floor_ = std::max(min_noise, std::min(max_noise, noise_floor_));
            }
        } else if (rms <= noise_floor_ * 1.5f + 0.02f) {
            noise_floor_ = alpha_speech * noise_floor_ + (1.0f - alpha_speech) * std::max(rms, min_noise);
            noise_floor_ = std::max(min_noise, std::min(max_noise, noise_floor_));
        }
    }

    template <typename It>
    float compute_energy(It begin, It end) const {
        if (begin == end) return 0.0f;

        float sum_sq = 0.0f;
        size_t n = 0;
        for (It it = begin; it != end; ++it, ++n) {
            float normalized = static_cast<float>(*it) / 32768.0f;
            sum_sq += normalized * normalized;
        }
        return std::sqrt(sum_sq / static_cast<float>(n));
    }

    VADConfig config_;
    int sample_rate_;
    size_t frame_samples_;
    size_t end_silence_samples_;
    size_t max_samples_;
    int start_frames_required_;

    AudioBuffer current_;    ///< Analyzed audio of the utterance being assembled
    AudioBuffer pending_;    ///< Arrived samples not yet forming a whole frame

    bool speech_confirmed_ = false;
    int consecutive_speech_frames_ = 0;
    size_t speech_frames_ = 0;
    size_t silence_samples_ = 0;

    float noise_floor_;
    bool noise_floor_initialized_;

    size_t stats_emitted_ = 0;
    size_t stats_discarded_ = 0;
    size_t stats_truncations_ = 0;
};

AudioAssembler::AudioAssembler(const VADConfig& vad_config, const AudioConfig& audio_config)
    : pimpl_(std::make_unique<Impl>(vad_config, audio_config)) {}

AudioAssembler::~AudioAssembler() = default;

std::vector<Utterance> AudioAssembler::push(const AudioBuffer& chunk) {
    return pimpl_->push(chunk);
}

std::optional<Utterance> AudioAssembler::end_of_turn() {
    return pimpl_->end_of_turn();
}

bool AudioAssembler::is_assembling() const {
    return pimpl_->is_assembling();
}

void AudioAssembler::reset() {
    pimpl_->reset();
}

AssemblerStats AudioAssembler::get_stats() const {
    return pimpl_->get_stats();
}

const char* flush_reason_to_string(FlushReason reason) {
    switch (reason) {
        case FlushReason::Silence: return "silence";
        case FlushReason::EndOfTurn: return "end-of-turn";
        case FlushReason::MaxDuration: return "max-duration";
    }
    return "unknown";
}

} // namespace voicegate
