#pragma once

#include "common.h"
#include "errors.h"
#include <memory>

namespace voicegate {

/**
 * @brief Per-session turn state
 */
enum class TurnState {
    Idle,           ///< Awaiting input
    Listening,      ///< Voice mode, assembler accumulating audio
    Transcribing,   ///< Utterance handed to STT
    Thinking,       ///< Text handed to LLM with transcript context
    Synthesizing,   ///< Voice mode: LLM reply handed to TTS
    Responding,     ///< Result being sent over the transport
    Failed          ///< Unrecoverable adapter error in this turn
};

/**
 * @brief Turn lifecycle state machine for one session
 *
 * - Idle -> Listening (on_audio)
 * - Listening -> Transcribing (on_utterance_ready)
 * - Listening -> Idle (on_audio_discarded, nothing but silence)
 * - Idle -> Thinking (on_text)
 * - Transcribing -> Thinking (on_transcript)
 * - Transcribing -> Idle (on_empty_transcript)
 * - Thinking -> Synthesizing (on_reply, voice mode)
 * - Thinking -> Responding (on_reply, text mode)
 * - Synthesizing -> Responding (on_speech_ready)
 * - Responding -> Idle (on_sent)
 * - any in-turn state -> Failed (on_failure); Failed -> Idle (on_failure_reported)
 *
 * Illegal events return InvalidState and leave the state unchanged.
 * Not thread-safe; owned by one session's orchestrator.
 */
class StateMachine {
public:
    StateMachine();
    ~StateMachine();

    TurnState get_state() const;

    /// True while a turn occupies the session (Transcribing .. Failed)
    bool turn_in_flight() const;

    Result<void> on_audio();
    Result<void> on_audio_discarded();
    Result<void> on_utterance_ready();
    Result<void> on_text();
    Result<void> on_transcript();
    Result<void> on_empty_transcript();
    Result<void> on_reply(bool voice_mode);
    Result<void> on_speech_ready();
    Result<void> on_sent();
    Result<void> on_failure();
    Result<void> on_failure_reported();

    /// Number of transitions taken (for tests and logs)
    size_t transition_count() const;

    /// Reset state machine to Idle
    void reset();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

const char* turn_state_to_string(TurnState state);

} // namespace voicegate
