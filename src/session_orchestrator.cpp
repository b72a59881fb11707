#include "session_orchestrator.h"
#include "delegation.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <optional>
#include <sstream>
#include <thread>

namespace voicegate {

namespace {

/// Unit of work handed to the worker
struct TurnJob {
    SessionMode kind = SessionMode::Text;
    std::string text;
    AudioBuffer audio;
    TimePoint accepted_at = Clock::now();

    static TurnJob from_text(const std::string& text) {
        TurnJob job;
        job.kind = SessionMode::Text;
        job.text = text;
        return job;
    }

    static TurnJob from_utterance(Utterance utterance) {
        TurnJob job;
        job.kind = SessionMode::Voice;
        job.audio = std::move(utterance.samples);
        return job;
    }
};

const char* kBusy = "busy";

} // anonymous namespace

class SessionOrchestrator::Impl {
public:
    Impl(const SessionId& session_id,
         const Config& config,
         Pipeline& pipeline,
         TransportSession& transport,
         std::mutex& turn_mutex,
         TaskTracker* tasks)
        : session_id_(session_id),
          config_(config),
          pipeline_(pipeline),
          transport_(transport),
          turn_mutex_(turn_mutex),
          tasks_(tasks),
          assembler_(config.vad, config.audio) {
        pending_text_limit_ = static_cast<size_t>(std::max(0, config.session.pending_text_limit));
    }

    ~Impl() {
        stop();
    }

    void set_turn_end_callback(std::function<void()> callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_turn_end_ = std::move(callback);
    }

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (worker_.joinable() || stopping_) {
            return;
        }
        worker_ = std::thread(&Impl::worker_loop, this);
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopped_) {
                return;
            }
            stopping_ = true;
            stopped_ = true;
            pending_texts_.clear();
        }
        cancel_.cancel();
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }
        assembler_.reset();
        idle_cv_.notify_all();
    }

    bool handle(const ClientMessage& message) {
        std::vector<ServerMessage> outgoing;
        bool keep_open = true;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return false;
            }
            switch (message.type) {
                case ClientMessageType::Voice:
                    handle_voice(message.audio, outgoing);
                    break;
                case ClientMessageType::Text:
                    handle_text(message.text, outgoing);
                    break;
                case ClientMessageType::Control:
                    keep_open = handle_control(message.command, outgoing);
                    break;
            }
        }
        for (const auto& out : outgoing) {
            auto sent = transport_.send(out);
            if (!sent) {
                break;
            }
        }
        return keep_open;
    }

    bool seal_if_quiet() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return true;
        }
        if (active_ || !pending_texts_.empty() || state_.turn_in_flight()) {
            return false;
        }
        stopping_ = true;
        cv_.notify_all();
        return true;
    }

    void report_protocol_error(const Error& error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.protocol_errors++;
        }
        LOG_SESSION("Protocol error on " + session_id_ + ": " + error.message);
        auto sent = transport_.send(ServerMessage::error(error.message));
        if (!sent) {
            LOG_SESSION("Could not report protocol error: " + sent.error().message);
        }
    }

    bool wait_until_idle(int timeout_ms) {
        std::unique_lock<std::mutex> lock(mutex_);
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
            return stopped_ || (!active_ && pending_texts_.empty() && !state_.turn_in_flight());
        });
    }

    TurnState state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_.get_state();
    }

    SessionMode mode() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return mode_;
    }

    std::vector<memory::ChatMessage> transcript() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return transcript_.messages();
    }

    OrchestratorStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    // ---- reader thread, mutex_ held ----

    void handle_voice(const AudioBuffer& audio, std::vector<ServerMessage>& outgoing) {
        mode_ = SessionMode::Voice;
        if (state_.turn_in_flight() || active_) {
            conflict("voice input while " + std::string(turn_state_to_string(state_.get_state())), outgoing);
            return;
        }

        advance(state_.on_audio(), "on_audio");
        std::vector<Utterance> ready = assembler_.push(audio);
        for (auto& utterance : ready) {
            if (active_) {
                // Several utterances completed by one chunk; only the first can run now
                conflict("additional utterance completed while a turn is queued", outgoing);
                continue;
            }
            submit_utterance(std::move(utterance));
        }

        if (!active_ && state_.get_state() == TurnState::Listening && !assembler_.is_assembling()) {
            advance(state_.on_audio_discarded(), "on_audio_discarded");
        }
    }

    void handle_text(const std::string& text, std::vector<ServerMessage>& outgoing) {
        mode_ = SessionMode::Text;
        if (utils::is_empty_or_whitespace(text)) {
            stats_.protocol_errors++;
            outgoing.push_back(ServerMessage::error("Text content is empty"));
            return;
        }

        if (state_.get_state() == TurnState::Listening) {
            LOG_SESSION("Text input on " + session_id_ + " discards partially assembled audio");
            assembler_.reset();
            advance(state_.on_audio_discarded(), "on_audio_discarded");
        }

        if (!state_.turn_in_flight() && !active_) {
            advance(state_.on_text(), "on_text");
            active_ = TurnJob::from_text(text);
            cv_.notify_one();
            return;
        }
        if (pending_texts_.size() < pending_text_limit_) {
            pending_texts_.push_back(text);
            LOG_SESSION("Buffered text on " + session_id_ + " (" + std::to_string(pending_texts_.size()) +
                        "/" + std::to_string(pending_text_limit_) + " pending)");
            return;
        }
        conflict("text input with no free pending slot", outgoing);
    }

    bool handle_control(ControlCommand command, std::vector<ServerMessage>& outgoing) {
        switch (command) {
            case ControlCommand::Ping:
                outgoing.push_back(ServerMessage::pong());
                return true;
            case ControlCommand::Disconnect:
                LOG_SESSION("Client requested disconnect: " + session_id_);
                return false;
            case ControlCommand::EndOfTurn:
                handle_end_of_turn(outgoing);
                return true;
            case ControlCommand::None:
                break;
        }
        return true;
    }

    void handle_end_of_turn(std::vector<ServerMessage>& outgoing) {
        if (state_.turn_in_flight() || active_) {
            if (assembler_.get_stats().speech_detected) {
                conflict("end-of-turn while a turn is in flight", outgoing);
            }
            return;
        }

        std::optional<Utterance> utterance = assembler_.end_of_turn();
        if (utterance) {
            submit_utterance(std::move(*utterance));
        } else if (state_.get_state() == TurnState::Listening) {
            advance(state_.on_audio_discarded(), "on_audio_discarded");
        }
    }

    void submit_utterance(Utterance utterance) {
        std::ostringstream oss;
        oss << "utterance " << utterance.duration_ms << "ms reason=" << flush_reason_to_string(utterance.reason);
        LOG_TRACE(session_id_, "assembler", oss.str());

        advance(state_.on_utterance_ready(), "on_utterance_ready");
        active_ = TurnJob::from_utterance(std::move(utterance));
        cv_.notify_one();
    }

    void conflict(const std::string& what, std::vector<ServerMessage>& outgoing) {
        stats_.turn_conflicts++;
        LOG_SESSION("Turn conflict on " + session_id_ + ": " + what);
        outgoing.push_back(ServerMessage::control(kBusy));
    }

    void advance(const Result<void>& result, const char* event) {
        if (!result) {
            Logger::error("[Session] " + session_id_ + " illegal transition " + event + ": " +
                          result.error().message);
        }
    }

    // ---- worker thread ----

    void worker_loop() {
        while (true) {
            TurnJob job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || active_.has_value(); });
                if (!active_) {
                    break;
                }
                job = *active_;
            }

            {
                std::lock_guard<std::mutex> turn_lock(turn_mutex_);
                run_turn(job);
                if (on_turn_end_) {
                    on_turn_end_();
                }
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                active_.reset();
                if (!stopping_ && !pending_texts_.empty()) {
                    std::string next = pending_texts_.front();
                    pending_texts_.pop_front();
                    advance(state_.on_text(), "on_text");
                    active_ = TurnJob::from_text(next);
                }
            }
            idle_cv_.notify_all();
        }
    }

    void run_turn(const TurnJob& job) {
        const bool voice_mode = job.kind == SessionMode::Voice;
        LOG_TRACE(session_id_, "turn", std::string("start mode=") + session_mode_to_string(job.kind));

        std::string user_text;
        if (voice_mode) {
            auto transcript = pipeline_.stt().transcribe(job.audio, session_id_, &cancel_);
            if (!transcript) {
                fail("Speech recognition failed", transcript.error(), "");
                return;
            }
            if (transcript.value().empty()) {
                LOG_SESSION("Empty transcript on " + session_id_ + ", nothing to answer");
                std::lock_guard<std::mutex> lock(mutex_);
                advance(state_.on_empty_transcript(), "on_empty_transcript");
                stats_.empty_transcripts++;
                return;
            }
            user_text = transcript.value();
            LOG_TRACE(session_id_, "stt", "\"" + utils::truncate_for_log(user_text) + "\"");
            std::lock_guard<std::mutex> lock(mutex_);
            advance(state_.on_transcript(), "on_transcript");
        } else {
            user_text = job.text;
        }

        std::vector<memory::ChatMessage> context;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            context = transcript_.recent_turns(static_cast<size_t>(std::max(0, config_.llm.context_max_turns)));
        }

        auto completion = pipeline_.llm().complete(user_text, context, session_id_, &cancel_);
        if (!completion) {
            fail("Language model failed", completion.error(), user_text);
            return;
        }
        std::string reply = completion.value();
        LOG_TRACE(session_id_, "llm", "\"" + utils::truncate_for_log(reply) + "\"");

        bool delegated = false;
        AutomationAdapter* automation = pipeline_.automation();
        if (automation) {
            std::optional<std::string> task = automation->extract_task(reply);
            if (task) {
                auto outcome = delegate(*automation, *task);
                if (!outcome) {
                    fail("Delegation failed", outcome.error(), user_text);
                    return;
                }
                reply = outcome.value();
                delegated = true;
            }
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            advance(state_.on_reply(voice_mode), "on_reply");
        }

        ServerMessage out = ServerMessage::text(reply);
        if (voice_mode) {
            auto speech = pipeline_.tts().synthesize(reply, session_id_, &cancel_);
            if (!speech) {
                fail("Speech synthesis failed", speech.error(), user_text);
                return;
            }
            out = ServerMessage::voice(reply, std::move(speech.value()));
            std::lock_guard<std::mutex> lock(mutex_);
            advance(state_.on_speech_ready(), "on_speech_ready");
        }
        out.needs_delegation = delegated;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            transcript_.add_turn(user_text, reply);
        }

        auto sent = transport_.send(out);
        std::lock_guard<std::mutex> lock(mutex_);
        if (!sent) {
            advance(state_.on_failure(), "on_failure");
            advance(state_.on_failure_reported(), "on_failure_reported");
            stats_.turns_failed++;
            LOG_TRACE(session_id_, "turn", "undelivered: " + sent.error().message);
            return;
        }
        advance(state_.on_sent(), "on_sent");
        stats_.turns_completed++;
        LOG_TRACE(session_id_, "turn", "done latency_ms=" + std::to_string(ms_since(job.accepted_at)));
    }

    Result<std::string> delegate(AutomationAdapter& automation, const std::string& task) {
        auto outcome = delegate_task(automation, tasks_, task, session_id_, &cancel_);
        if (!outcome) {
            return outcome.error();
        }
        if (outcome.value().task_id) {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.delegations++;
        }
        return outcome.value().reply;
    }

    void fail(const std::string& stage, const Error& error, const std::string& established_user_text) {
        bool cancelled = error.type == ErrorType::Cancelled;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            advance(state_.on_failure(), "on_failure");
            if (!established_user_text.empty()) {
                transcript_.add_user_message(established_user_text);
            }
            stats_.turns_failed++;
        }
        LOG_TRACE(session_id_, "turn", "failed: " + describe(error));

        if (cancelled) {
            LOG_SESSION("Turn cancelled on " + session_id_);
        } else {
            Logger::warn("[Session] " + stage + " on " + session_id_ + ": " + describe(error));
            auto sent = transport_.send(ServerMessage::error(stage + ": " + error.message));
            if (!sent) {
                LOG_SESSION("Could not report failure to " + session_id_ + ": " + sent.error().message);
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        advance(state_.on_failure_reported(), "on_failure_reported");
    }

    SessionId session_id_;
    Config config_;
    Pipeline& pipeline_;
    TransportSession& transport_;
    std::mutex& turn_mutex_;
    TaskTracker* tasks_;
    size_t pending_text_limit_ = 1;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    StateMachine state_;
    AudioAssembler assembler_;
    memory::Transcript transcript_;
    SessionMode mode_ = SessionMode::Text;
    std::optional<TurnJob> active_;
    std::deque<std::string> pending_texts_;
    OrchestratorStats stats_;
    bool stopping_ = false;
    bool stopped_ = false;

    std::function<void()> on_turn_end_;

    CancelToken cancel_;
    std::thread worker_;
};

SessionOrchestrator::SessionOrchestrator(const SessionId& session_id,
                                         const Config& config,
                                         Pipeline& pipeline,
                                         TransportSession& transport,
                                         std::mutex& turn_mutex,
                                         TaskTracker* tasks)
    : pimpl_(std::make_unique<Impl>(session_id, config, pipeline, transport, turn_mutex, tasks)) {}

SessionOrchestrator::~SessionOrchestrator() = default;

void SessionOrchestrator::set_turn_end_callback(std::function<void()> callback) {
    pimpl_->set_turn_end_callback(std::move(callback));
}

void SessionOrchestrator::start() {
    pimpl_->start();
}

void SessionOrchestrator::stop() {
    pimpl_->stop();
}

bool SessionOrchestrator::handle(const ClientMessage& message) {
    return pimpl_->handle(message);
}

bool SessionOrchestrator::seal_if_quiet() {
    return pimpl_->seal_if_quiet();
}

void SessionOrchestrator::report_protocol_error(const Error& error) {
    pimpl_->report_protocol_error(error);
}

bool SessionOrchestrator::wait_until_idle(int timeout_ms) {
    return pimpl_->wait_until_idle(timeout_ms);
}

TurnState SessionOrchestrator::state() const {
    return pimpl_->state();
}

SessionMode SessionOrchestrator::mode() const {
    return pimpl_->mode();
}

std::vector<memory::ChatMessage> SessionOrchestrator::transcript() const {
    return pimpl_->transcript();
}

OrchestratorStats SessionOrchestrator::stats() const {
    return pimpl_->stats();
}

const char* session_mode_to_string(SessionMode mode) {
    switch (mode) {
        case SessionMode::Text: return "text";
        case SessionMode::Voice: return "voice";
    }
    return "unknown";
}

} // namespace voicegate
