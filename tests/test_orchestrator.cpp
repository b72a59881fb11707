/**
 * Session turn orchestration over a fake connection and scripted providers.
 * Asserts:
 * - Text "Hello" produces one text reply and a two-message transcript.
 * - Voice input is assembled, transcribed, answered and spoken back with audio.
 * - STT timing out on every attempt yields one error message, leaves the
 *   transcript unchanged and returns the session to Idle.
 * - N successful turns leave 2N alternating user/assistant entries.
 * - Overlapping input is answered with control "busy" (pending_text_limit 0 and 1).
 * - ping -> pong, disconnect ends the session, empty text is rejected.
 * - DELEGATE: replies are forwarded to automation and recorded as tasks.
 * - stop() cancels an in-flight provider call without reporting an error.
 *
 * Run from build dir: ./test_orchestrator
 */

#include "fakes.h"
#include "logger.h"
#include "session_orchestrator.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace voicegate;
using namespace voicegate::testing;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

/// One orchestrator wired to fakes; members are torn down in reverse order
struct Harness {
    Config cfg;
    std::shared_ptr<FakeHttpTransport> http;
    std::unique_ptr<Pipeline> pipeline;
    std::shared_ptr<FakeConnection> conn;
    std::unique_ptr<TransportSession> transport;
    std::mutex turn_mutex;
    TaskTracker tasks;
    std::unique_ptr<SessionOrchestrator> orch;

    explicit Harness(const Config& config) : cfg(config) {
        http = std::make_shared<FakeHttpTransport>();
        http->set_default(STT_URL, transcript_response("Hello"));
        http->set_default(LLM_URL, chat_response("Hi there"));
        http->set_default(TTS_URL, audio_response("SPOKEN"));
        http->set_default(AUTOMATION_URL, json_response("{\"ok\":true}"));
        pipeline = std::make_unique<Pipeline>(cfg, http);
        conn = std::make_shared<FakeConnection>();
        transport = std::make_unique<TransportSession>(conn, cfg.audio.sample_rate);
        orch = std::make_unique<SessionOrchestrator>("test-session", cfg, *pipeline, *transport, turn_mutex, &tasks);
        orch->start();
    }

    Harness() : Harness(make_test_config()) {}

    bool text(const std::string& content) {
        return orch->handle(ClientMessage::text_message(content));
    }

    std::vector<json> sent() const {
        std::vector<json> out;
        for (const auto& raw : conn->writes()) {
            out.push_back(json::parse(raw));
        }
        return out;
    }

    size_t count(const std::string& type) const {
        size_t n = 0;
        for (const auto& m : sent()) {
            if (m["type"] == type) n++;
        }
        return n;
    }
};

AudioBuffer spoken_utterance() {
    AudioBuffer audio = tone(500);
    append(audio, silence(800));
    return audio;
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    // --- Text turn ---
    {
        Harness h;
        ASSERT(h.text("Hello"));
        ASSERT(h.orch->wait_until_idle(3000));
        auto sent = h.sent();
        ASSERT(sent.size() == 1);
        if (sent.size() == 1) {
            ASSERT(sent[0]["type"] == "text");
            ASSERT(sent[0]["content"] == "Hi there");
            ASSERT(sent[0]["audio"].is_null());
        }
        auto transcript = h.orch->transcript();
        ASSERT(transcript.size() == 2);
        ASSERT(transcript.size() == 2 && transcript[0].role == memory::ChatRole::User);
        ASSERT(transcript.size() == 2 && transcript[0].content == "Hello");
        ASSERT(transcript.size() == 2 && transcript[1].content == "Hi there");
        ASSERT(h.orch->state() == TurnState::Idle);
        ASSERT(h.orch->mode() == SessionMode::Text);
        ASSERT(h.orch->stats().turns_completed == 1);
        ASSERT(h.http->calls(STT_URL) == 0);
        ASSERT(h.http->calls(TTS_URL) == 0);
    }

    // --- Voice turn ---
    {
        Harness h;
        ASSERT(h.orch->handle(ClientMessage::voice_message(spoken_utterance())));
        ASSERT(h.orch->wait_until_idle(3000));
        auto sent = h.sent();
        ASSERT(sent.size() == 1);
        if (sent.size() == 1) {
            ASSERT(sent[0]["type"] == "voice");
            ASSERT(sent[0]["content"] == "Hi there");
            ASSERT(sent[0]["audio"] == codec::base64_encode(Bytes{'S', 'P', 'O', 'K', 'E', 'N'}));
        }
        ASSERT(h.orch->mode() == SessionMode::Voice);
        ASSERT(h.orch->transcript().size() == 2);
        ASSERT(h.http->calls(STT_URL) == 1);
        ASSERT(h.http->calls(TTS_URL) == 1);
        ASSERT(h.orch->state() == TurnState::Idle);
    }

    // --- Voice without trailing silence, flushed by end-of-turn ---
    {
        Harness h;
        ASSERT(h.orch->handle(ClientMessage::voice_message(tone(300))));
        ASSERT(h.orch->state() == TurnState::Listening);
        ASSERT(h.orch->handle(ClientMessage::control_message(ControlCommand::EndOfTurn)));
        ASSERT(h.orch->wait_until_idle(3000));
        ASSERT(h.count("voice") == 1);
        ASSERT(h.http->calls(STT_URL) == 1);
    }

    // --- Silence only never reaches STT ---
    {
        Harness h;
        ASSERT(h.orch->handle(ClientMessage::voice_message(silence(1000))));
        ASSERT(h.orch->handle(ClientMessage::control_message(ControlCommand::EndOfTurn)));
        ASSERT(h.orch->wait_until_idle(3000));
        ASSERT(h.http->calls(STT_URL) == 0);
        ASSERT(h.sent().empty());
        ASSERT(h.orch->state() == TurnState::Idle);
    }

    // --- STT times out on every attempt ---
    {
        Harness h;
        ASSERT(h.text("Hello"));
        ASSERT(h.orch->wait_until_idle(3000));
        ASSERT(h.orch->transcript().size() == 2);

        h.http->set_default(STT_URL, timeout_response());
        ASSERT(h.orch->handle(ClientMessage::voice_message(spoken_utterance())));
        ASSERT(h.orch->wait_until_idle(3000));
        ASSERT(h.http->calls(STT_URL) == 3);
        ASSERT(h.count("error") == 1);
        auto sent = h.sent();
        ASSERT(!sent.empty() && sent.back()["type"] == "error");
        ASSERT(!sent.empty() && sent.back()["content"].get<std::string>().find("Speech recognition failed") == 0);
        ASSERT(h.orch->transcript().size() == 2);
        ASSERT(h.orch->state() == TurnState::Idle);
        ASSERT(h.orch->stats().turns_failed == 1);
        ASSERT(h.pipeline->health().get(provider::STT)->snapshot().consecutive_failures == 3);
    }

    // --- Empty transcript: no reply, back to Idle ---
    {
        Harness h;
        h.http->set_default(STT_URL, transcript_response(""));
        ASSERT(h.orch->handle(ClientMessage::voice_message(spoken_utterance())));
        ASSERT(h.orch->wait_until_idle(3000));
        ASSERT(h.sent().empty());
        ASSERT(h.http->calls(LLM_URL) == 0);
        ASSERT(h.orch->stats().empty_transcripts == 1);
        ASSERT(h.orch->transcript().empty());
        ASSERT(h.orch->state() == TurnState::Idle);
    }

    // --- TTS failure keeps the user message only ---
    {
        Harness h;
        h.http->set_default(TTS_URL, status_response(400));
        ASSERT(h.orch->handle(ClientMessage::voice_message(spoken_utterance())));
        ASSERT(h.orch->wait_until_idle(3000));
        ASSERT(h.count("error") == 1);
        auto transcript = h.orch->transcript();
        ASSERT(transcript.size() == 1);
        ASSERT(transcript.size() == 1 && transcript[0].content == "Hello");
        ASSERT(h.orch->state() == TurnState::Idle);
    }

    // --- N turns -> 2N alternating entries ---
    {
        Harness h;
        const int turns = 4;
        for (int i = 0; i < turns; ++i) {
            ASSERT(h.text("message " + std::to_string(i)));
            ASSERT(h.orch->wait_until_idle(3000));
        }
        auto transcript = h.orch->transcript();
        ASSERT(transcript.size() == 2 * turns);
        for (size_t i = 0; i < transcript.size(); ++i) {
            ASSERT(transcript[i].role == (i % 2 == 0 ? memory::ChatRole::User : memory::ChatRole::Assistant));
        }
        ASSERT(h.orch->stats().turns_completed == static_cast<uint64_t>(turns));
        // Context of the last request holds the three earlier turns
        json last = json::parse(h.http->bodies(LLM_URL).back());
        ASSERT(last["messages"].size() == 1 + 6 + 1);
    }

    // --- Overlap with no pending slot: second text is refused ---
    {
        Config cfg = make_test_config();
        cfg.session.pending_text_limit = 0;
        Harness h(cfg);
        h.http->block(LLM_URL);
        ASSERT(h.text("one"));
        ASSERT(h.http->wait_for_blocked(1));
        ASSERT(h.orch->state() == TurnState::Thinking);
        ASSERT(h.text("two"));
        ASSERT(h.count("control") == 1);
        ASSERT(h.orch->stats().turn_conflicts == 1);

        // Voice while busy is refused too
        ASSERT(h.orch->handle(ClientMessage::voice_message(tone(100))));
        ASSERT(h.orch->stats().turn_conflicts == 2);

        h.http->release();
        ASSERT(h.orch->wait_until_idle(3000));
        ASSERT(h.count("text") == 1);
        ASSERT(h.http->calls(LLM_URL) == 1);
        auto sent = h.sent();
        ASSERT(!sent.empty() && sent[0]["content"] == "busy");
        ASSERT(h.orch->transcript().size() == 2);
    }

    // --- Overlap with one pending slot: second text queued, third refused ---
    {
        Harness h;
        h.http->block(LLM_URL);
        ASSERT(h.text("one"));
        ASSERT(h.http->wait_for_blocked(1));
        ASSERT(h.text("two"));
        ASSERT(h.sent().empty());
        ASSERT(h.text("three"));
        ASSERT(h.count("control") == 1);
        h.http->release();
        ASSERT(h.orch->wait_until_idle(3000));
        ASSERT(h.count("text") == 2);
        ASSERT(h.http->calls(LLM_URL) == 2);
        auto transcript = h.orch->transcript();
        ASSERT(transcript.size() == 4);
        ASSERT(transcript.size() == 4 && transcript[2].content == "two");
        ASSERT(h.orch->stats().turn_conflicts == 1);
    }

    // --- Control messages ---
    {
        Harness h;
        ASSERT(h.orch->handle(ClientMessage::control_message(ControlCommand::Ping)));
        ASSERT(h.count("pong") == 1);
        ASSERT(h.text("   "));
        ASSERT(h.count("error") == 1);
        ASSERT(h.http->calls(LLM_URL) == 0);
        h.orch->report_protocol_error(make_protocol_error("Message is not valid JSON"));
        ASSERT(h.count("error") == 2);
        ASSERT(h.orch->stats().protocol_errors == 2);
        ASSERT(!h.orch->handle(ClientMessage::control_message(ControlCommand::Disconnect)));
    }

    // --- Delegation ---
    {
        Config cfg = make_test_config();
        cfg.automation.enabled = true;
        Harness h(cfg);
        h.http->set_default(LLM_URL, chat_response("DELEGATE: build a sales dashboard"));
        ASSERT(h.text("Can you build me a sales dashboard?"));
        ASSERT(h.orch->wait_until_idle(3000));
        auto sent = h.sent();
        ASSERT(sent.size() == 1);
        ASSERT(h.tasks.size() == 1);
        if (sent.size() == 1 && h.tasks.size() == 1) {
            std::string content = sent[0]["content"];
            ASSERT(content.find("I've assigned that to your automation team. Task ID: task_") == 0);
            ASSERT(sent[0]["needs_delegation"] == true);
            auto task = h.tasks.list()[0];
            ASSERT(task.description == "build a sales dashboard");
            ASSERT(task.session_id == "test-session");
            ASSERT(content.find(task.id) != std::string::npos);
        }
        json forwarded = json::parse(h.http->bodies(AUTOMATION_URL).at(0));
        ASSERT(forwarded["message"] == "build a sales dashboard");
        ASSERT(h.orch->stats().delegations == 1);

        // Automation down: polite reply, no task recorded
        h.http->set_default(AUTOMATION_URL, status_response(503));
        ASSERT(h.text("And a forecast too"));
        ASSERT(h.orch->wait_until_idle(3000));
        sent = h.sent();
        ASSERT(sent.size() == 2);
        ASSERT(sent.size() == 2 && sent[1]["type"] == "text");
        ASSERT(sent.size() == 2 && sent[1]["content"].get<std::string>().find("couldn't reach") != std::string::npos);
        ASSERT(h.tasks.size() == 1);
    }

    // --- Delegation replies pass through untouched when automation is off ---
    {
        Harness h;
        h.http->set_default(LLM_URL, chat_response("DELEGATE: something"));
        ASSERT(h.text("do it"));
        ASSERT(h.orch->wait_until_idle(3000));
        auto sent = h.sent();
        ASSERT(sent.size() == 1 && sent[0]["content"] == "DELEGATE: something");
        ASSERT(h.tasks.size() == 0);
    }

    // --- Undeliverable reply ---
    {
        Harness h;
        h.conn->set_fail_writes(true);
        ASSERT(h.text("Hello"));
        ASSERT(h.orch->wait_until_idle(3000));
        ASSERT(h.orch->stats().turns_failed == 1);
        ASSERT(h.orch->state() == TurnState::Idle);
    }

    // --- stop() cancels an in-flight call ---
    {
        Harness h;
        h.http->block(LLM_URL);
        ASSERT(h.text("long question"));
        ASSERT(h.http->wait_for_blocked(1));
        h.orch->stop();
        ASSERT(h.count("error") == 0);
        ASSERT(h.orch->stats().turns_failed == 1);
        ASSERT(h.orch->state() == TurnState::Idle);
        ASSERT(!h.text("after stop"));
        h.orch->stop();
        h.http->release();
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All orchestrator tests passed.\n";
    return 0;
}
