#include "state_machine.h"
#include "logger.h"

namespace voicegate {

class StateMachine::Impl {
public:
    Impl() : state_(TurnState::Idle) {}

    TurnState get_state() const {
        return state_;
    }

    bool turn_in_flight() const {
        return state_ != TurnState::Idle && state_ != TurnState::Listening;
    }

    Result<void> on_audio() {
        if (state_ == TurnState::Listening) {
            return Result<void>();
        }
        return transition(TurnState::Idle, TurnState::Listening, "on_audio");
    }

    Result<void> on_audio_discarded() {
        if (state_ == TurnState::Idle) {
            return Result<void>();
        }
        return transition(TurnState::Listening, TurnState::Idle, "on_audio_discarded");
    }

    Result<void> on_utterance_ready() {
        // end-of-turn may arrive while still Idle when the utterance is completed in one message
        if (state_ == TurnState::Idle) {
            return move_to(TurnState::Transcribing);
        }
        return transition(TurnState::Listening, TurnState::Transcribing, "on_utterance_ready");
    }

    Result<void> on_text() {
        return transition(TurnState::Idle, TurnState::Thinking, "on_text");
    }

    Result<void> on_transcript() {
        return transition(TurnState::Transcribing, TurnState::Thinking, "on_transcript");
    }

    Result<void> on_empty_transcript() {
        return transition(TurnState::Transcribing, TurnState::Idle, "on_empty_transcript");
    }

    Result<void> on_reply(bool voice_mode) {
        return transition(TurnState::Thinking,
                          voice_mode ? TurnState::Synthesizing : TurnState::Responding,
                          "on_reply");
    }

    Result<void> on_speech_ready() {
        return transition(TurnState::Synthesizing, TurnState::Responding, "on_speech_ready");
    }

    Result<void> on_sent() {
        return transition(TurnState::Responding, TurnState::Idle, "on_sent");
    }

    Result<void> on_failure() {
        switch (state_) {
            case TurnState::Transcribing:
            case TurnState::Thinking:
            case TurnState::Synthesizing:
            case TurnState::Responding:
            case TurnState::Listening:
                return move_to(TurnState::Failed);
            case TurnState::Failed:
                return Result<void>();
            case TurnState::Idle:
                break;
        }
        return invalid("on_failure");
    }

    Result<void> on_failure_reported() {
        return transition(TurnState::Failed, TurnState::Idle, "on_failure_reported");
    }

    size_t transition_count() const {
        return transitions_;
    }

    void reset() {
        state_ = TurnState::Idle;
    }

private:
    Result<void> transition(TurnState from, TurnState to, const char* event) {
        if (state_ != from) {
            return invalid(event);
        }
        return move_to(to);
    }

    Result<void> move_to(TurnState to) {
        state_ = to;
        transitions_++;
        return Result<void>();
    }

    Result<void> invalid(const char* event) {
        std::string msg = std::string("Event ") + event + " not allowed in state " + turn_state_to_string(state_);
        Logger::debug("[StateMachine] " + msg);
        return make_error(ErrorType::InvalidState, msg);
    }

    TurnState state_;
    size_t transitions_ = 0;
};

StateMachine::StateMachine() : pimpl_(std::make_unique<Impl>()) {}
StateMachine::~StateMachine() = default;

TurnState StateMachine::get_state() const {
    return pimpl_->get_state();
}

bool StateMachine::turn_in_flight() const {
    return pimpl_->turn_in_flight();
}

Result<void> StateMachine::on_audio() {
    return pimpl_->on_audio();
}

Result<void> StateMachine::on_audio_discarded() {
    return pimpl_->on_audio_discarded();
}

Result<void> StateMachine::on_utterance_ready() {
    return pimpl_->on_utterance_ready();
}

Result<void> StateMachine::on_text() {
    return pimpl_->on_text();
}

Result<void> StateMachine::on_transcript() {
    return pimpl_->on_transcript();
}

Result<void> StateMachine::on_empty_transcript() {
    return pimpl_->on_empty_transcript();
}

Result<void> StateMachine::on_reply(bool voice_mode) {
    return pimpl_->on_reply(voice_mode);
}

Result<void> StateMachine::on_speech_ready() {
    return pimpl_->on_speech_ready();
}

Result<void> StateMachine::on_sent() {
    return pimpl_->on_sent();
}

Result<void> StateMachine::on_failure() {
    return pimpl_->on_failure();
}

Result<void> StateMachine::on_failure_reported() {
    return pimpl_->on_failure_reported();
}

size_t StateMachine::transition_count() const {
    return pimpl_->transition_count();
}

void StateMachine::reset() {
    pimpl_->reset();
}

const char* turn_state_to_string(TurnState state) {
    switch (state) {
        case TurnState::Idle: return "Idle";
        case TurnState::Listening: return "Listening";
        case TurnState::Transcribing: return "Transcribing";
        case TurnState::Thinking: return "Thinking";
        case TurnState::Synthesizing: return "Synthesizing";
        case TurnState::Responding: return "Responding";
        case TurnState::Failed: return "Failed";
    }
    return "Unknown";
}

} // namespace voicegate
