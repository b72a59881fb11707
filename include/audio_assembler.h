#pragma once

#include "common.h"
#include "config.h"
#include <memory>
#include <optional>
#include <vector>

namespace voicegate {

/// Why an utterance was finalized
enum class FlushReason {
    Silence,      ///< Voice activity ended (silence after speech)
    EndOfTurn,    ///< Explicit client "end-of-turn"
    MaxDuration   ///< Forced flush at audio.max_utterance_ms (truncation)
};

/**
 * @brief One contiguous span of captured audio, the unit handed to STT
 */
struct Utterance {
    AudioBuffer samples;
    int64_t duration_ms = 0;
    FlushReason reason = FlushReason::Silence;

    bool empty() const { return samples.empty(); }
};

/**
 * @brief Assembler statistics for logging
 */
struct AssemblerStats {
    size_t buffered_samples = 0;
    size_t pending_samples = 0;        ///< Tail shorter than one analysis frame
    bool speech_detected = false;
    float noise_floor = 0.0f;
    size_t utterances_emitted = 0;
    size_t spans_discarded = 0;        ///< Silence-only spans dropped
    size_t truncations = 0;
};

/**
 * @brief Converts a stream of PCM chunks into discrete utterances
 *
 * Energy VAD over fixed frames with an adaptive noise floor. Audio is kept
 * in arrival order and split only at frame boundaries where silence after
 * speech reaches the end-of-utterance threshold, at an explicit end-of-turn,
 * or at the maximum duration. Spans that never contained speech are
 * discarded whole. Not thread-safe: one instance per session stream.
 */
class AudioAssembler {
public:
    AudioAssembler(const VADConfig& vad_config, const AudioConfig& audio_config);
    ~AudioAssembler();

    AudioAssembler(const AudioAssembler&) = delete;
    AudioAssembler& operator=(const AudioAssembler&) = delete;

    /**
     * @brief Append a chunk
     * @return Utterances completed by this chunk (usually none, at most a few)
     */
    std::vector<Utterance> push(const AudioBuffer& chunk);

    /**
     * @brief Client signalled end-of-turn: flush everything buffered
     * @return The utterance, or nullopt when the buffer held no speech
     */
    std::optional<Utterance> end_of_turn();

    /// True once any audio is buffered toward the next utterance
    bool is_assembling() const;

    /// Drop buffered audio (noise floor is kept)
    void reset();

    AssemblerStats get_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

const char* flush_reason_to_string(FlushReason reason);

} // namespace voicegate
