/**
 * Turn state machine.
 * Asserts:
 * - Voice and text turns walk the documented transitions back to Idle.
 * - Empty transcripts and discarded audio return to Idle without a reply.
 * - Failure from any in-turn state lands in Failed, then Idle once reported.
 * - Illegal events return InvalidState and leave the state unchanged.
 *
 * Run from build dir: ./test_state_machine
 */

#include "logger.h"
#include "state_machine.h"
#include <iostream>
#include <string>

using namespace voicegate;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::WARN);

    // --- Voice turn ---
    StateMachine sm;
    ASSERT(sm.get_state() == TurnState::Idle);
    ASSERT(!sm.turn_in_flight());
    ASSERT(sm.on_audio().is_ok());
    ASSERT(sm.get_state() == TurnState::Listening);
    ASSERT(sm.on_audio().is_ok());              // more audio while listening
    ASSERT(!sm.turn_in_flight());
    ASSERT(sm.on_utterance_ready().is_ok());
    ASSERT(sm.get_state() == TurnState::Transcribing);
    ASSERT(sm.turn_in_flight());
    ASSERT(sm.on_transcript().is_ok());
    ASSERT(sm.get_state() == TurnState::Thinking);
    ASSERT(sm.on_reply(true).is_ok());
    ASSERT(sm.get_state() == TurnState::Synthesizing);
    ASSERT(sm.on_speech_ready().is_ok());
    ASSERT(sm.get_state() == TurnState::Responding);
    ASSERT(sm.on_sent().is_ok());
    ASSERT(sm.get_state() == TurnState::Idle);

    // --- Text turn skips transcription and synthesis ---
    ASSERT(sm.on_text().is_ok());
    ASSERT(sm.get_state() == TurnState::Thinking);
    ASSERT(sm.on_reply(false).is_ok());
    ASSERT(sm.get_state() == TurnState::Responding);
    ASSERT(sm.on_sent().is_ok());
    ASSERT(sm.get_state() == TurnState::Idle);

    // --- Empty transcript ---
    ASSERT(sm.on_audio().is_ok());
    ASSERT(sm.on_utterance_ready().is_ok());
    ASSERT(sm.on_empty_transcript().is_ok());
    ASSERT(sm.get_state() == TurnState::Idle);

    // --- Discarded audio ---
    ASSERT(sm.on_audio().is_ok());
    ASSERT(sm.on_audio_discarded().is_ok());
    ASSERT(sm.get_state() == TurnState::Idle);
    ASSERT(sm.on_audio_discarded().is_ok());    // no-op when already idle

    // --- Utterance completed within a single message (Idle -> Transcribing) ---
    ASSERT(sm.on_utterance_ready().is_ok());
    ASSERT(sm.get_state() == TurnState::Transcribing);

    // --- Failure path ---
    ASSERT(sm.on_failure().is_ok());
    ASSERT(sm.get_state() == TurnState::Failed);
    ASSERT(sm.turn_in_flight());
    ASSERT(sm.on_failure().is_ok());            // repeated failure stays Failed
    ASSERT(sm.on_failure_reported().is_ok());
    ASSERT(sm.get_state() == TurnState::Idle);

    // --- Illegal events ---
    auto bad = sm.on_sent();
    ASSERT(bad.is_error());
    ASSERT(bad.error().type == ErrorType::InvalidState);
    ASSERT(sm.get_state() == TurnState::Idle);
    ASSERT(sm.on_failure().is_error());
    ASSERT(sm.on_transcript().is_error());
    ASSERT(sm.on_text().is_ok());
    ASSERT(sm.on_text().is_error());            // second text while Thinking
    ASSERT(sm.on_audio().is_error());
    ASSERT(sm.get_state() == TurnState::Thinking);

    size_t before = sm.transition_count();
    ASSERT(sm.on_speech_ready().is_error());
    ASSERT(sm.transition_count() == before);

    sm.reset();
    ASSERT(sm.get_state() == TurnState::Idle);

    ASSERT(std::string(turn_state_to_string(TurnState::Synthesizing)) == "Synthesizing");

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All state machine tests passed.\n";
    return 0;
}
