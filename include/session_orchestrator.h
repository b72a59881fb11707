#pragma once

#include "audio_assembler.h"
#include "cancel_token.h"
#include "config.h"
#include "memory/transcript.h"
#include "providers/pipeline.h"
#include "state_machine.h"
#include "task_tracker.h"
#include "transport_session.h"
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace voicegate {

/// Input modality of the session's most recent turn
enum class SessionMode {
    Text,
    Voice
};

struct OrchestratorStats {
    uint64_t turns_completed = 0;
    uint64_t turns_failed = 0;
    uint64_t empty_transcripts = 0;
    uint64_t turn_conflicts = 0;
    uint64_t protocol_errors = 0;
    uint64_t delegations = 0;
};

/**
 * @brief Drives one session's turns through STT -> LLM -> TTS
 *
 * Threading:
 * - handle() runs on the session's reader thread; it updates the assembler
 *   and state and hands at most one turn to the worker.
 * - One worker thread executes turns sequentially, holding the session's
 *   turn lock for the whole turn.
 *
 * Backpressure: voice input while a turn is in flight, and text beyond
 * session.pending_text_limit buffered messages, is answered with a
 * control "busy" message (TurnConflict).
 */
class SessionOrchestrator {
public:
    SessionOrchestrator(const SessionId& session_id,
                        const Config& config,
                        Pipeline& pipeline,
                        TransportSession& transport,
                        std::mutex& turn_mutex,
                        TaskTracker* tasks = nullptr);
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    /// Called on the worker, turn lock held, after every turn completes or fails
    void set_turn_end_callback(std::function<void()> callback);

    /// Start the worker thread
    void start();

    /**
     * @brief Cancel the in-flight provider call, fail the turn and join the worker
     *
     * Idempotent. Must not be called from the worker thread.
     */
    void stop();

    /**
     * @brief Process one validated client message (reader thread)
     * @return false when the client asked to disconnect
     */
    bool handle(const ClientMessage& message);

    /**
     * @brief Refuse further input if nothing is queued or in flight
     *
     * Called with the turn lock held. On success handle() rejects every later
     * message and the worker exits; stop() still has to be called.
     * @return false when a turn is queued, buffered or running
     */
    bool seal_if_quiet();

    /// Report a malformed envelope to the client; the session stays open
    void report_protocol_error(const Error& error);

    /**
     * @brief Block until no turn is in flight or queued
     * @return false on timeout
     */
    bool wait_until_idle(int timeout_ms);

    TurnState state() const;
    SessionMode mode() const;
    std::vector<memory::ChatMessage> transcript() const;
    OrchestratorStats stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

const char* session_mode_to_string(SessionMode mode);

} // namespace voicegate
