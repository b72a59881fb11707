#pragma once

#include "cancel_token.h"
#include "config.h"
#include "messages.h"
#include "providers/pipeline.h"
#include "task_tracker.h"
#include <atomic>
#include <string>

namespace voicegate {

/**
 * @brief One request/response turn over plain HTTP, with no session state
 *
 * POST /api/text runs LLM -> (delegation); POST /api/voice runs
 * STT -> LLM -> (delegation) -> TTS. Bodies use the WebSocket client
 * envelope and replies the server envelope. No transcript is kept, so the
 * LLM sees only the current input.
 *
 * Runs on the calling connection thread. cancel_all() aborts every call in
 * flight and makes later calls fail with Cancelled.
 */
class HttpTurn {
public:
    HttpTurn(const Config& config, Pipeline& pipeline, TaskTracker* tasks);

    HttpTurn(const HttpTurn&) = delete;
    HttpTurn& operator=(const HttpTurn&) = delete;

    /**
     * @brief Parse body and run the turn
     * @param voice true for /api/voice (audio in, audio out)
     * @return Reply envelope; ProtocolError for a bad body or no speech,
     *         a provider error prefixed with the failing stage, or Cancelled
     */
    Result<ServerMessage> run(const std::string& body, bool voice);

    void cancel_all() { cancel_.cancel(); }

private:
    Result<ServerMessage> run_text(const std::string& user_text, const std::string& correlation_id);

    Config config_;
    Pipeline& pipeline_;
    TaskTracker* tasks_;
    CancelToken cancel_;
    std::atomic<uint64_t> seq_{0};
};

} // namespace voicegate
