#include "session.h"
#include "logger.h"

namespace voicegate {

namespace {

int64_t steady_ms() {
    return std::chrono::duration_cast<Duration>(Clock::now().time_since_epoch()).count();
}

} // anonymous namespace

Session::Session(const SessionId& id,
                 std::shared_ptr<Connection> connection,
                 const Config& config,
                 Pipeline& pipeline,
                 TaskTracker* tasks)
    : id_(id),
      created_at_(Clock::now()),
      last_activity_ms_(steady_ms()),
      transport_(std::move(connection), config.audio.sample_rate) {
    orchestrator_ = std::make_unique<SessionOrchestrator>(id_, config, pipeline, transport_, turn_mutex_, tasks);
    orchestrator_->set_turn_end_callback([this] { touch(); });
    orchestrator_->start();
}

Session::~Session() {
    close("destroyed");
}

void Session::run() {
    LOG_SESSION("Session " + id_ + " started (" + transport_.remote_endpoint() + ")");

    while (!closed_) {
        auto message = transport_.receive();
        if (!message) {
            const Error& error = message.error();
            if (error.type == ErrorType::ProtocolError) {
                touch();
                orchestrator_->report_protocol_error(error);
                continue;
            }
            if (!closed_) {
                LOG_SESSION("Session " + id_ + " transport ended: " + error.message);
            }
            break;
        }

        touch();
        if (!orchestrator_->handle(message.value())) {
            break;
        }
    }
}

bool Session::close(const std::string& reason) {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return false;
    }

    orchestrator_->stop();
    transport_.close();

    OrchestratorStats stats = orchestrator_->stats();
    LOG_SESSION("Session " + id_ + " closed (" + reason + ") after " + std::to_string(ms_since(created_at_)) +
                "ms, turns=" + std::to_string(stats.turns_completed) +
                " failed=" + std::to_string(stats.turns_failed) +
                " conflicts=" + std::to_string(stats.turn_conflicts));
    return true;
}

bool Session::close_if_idle(int64_t timeout_ms) {
    {
        std::unique_lock<std::mutex> turn(turn_mutex_, std::try_to_lock);
        if (!turn.owns_lock()) {
            return false;  // turn in flight
        }
        if (closed_ || idle_ms() <= timeout_ms) {
            return false;
        }
        if (!orchestrator_->seal_if_quiet()) {
            return false;  // turn queued behind the lock
        }
    }
    return close("idle timeout");
}

int64_t Session::idle_ms() const {
    return steady_ms() - last_activity_ms_.load();
}

void Session::touch() {
    last_activity_ms_.store(steady_ms());
}

} // namespace voicegate
