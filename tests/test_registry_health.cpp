/**
 * Session registry, health aggregation and HTTP routing.
 * Asserts:
 * - open() refuses with CapacityExceeded at max_sessions; closing frees a slot.
 * - A session's reader loop answers messages, reports protocol errors and ends on disconnect.
 * - The idle sweeper closes idle sessions but skips one whose turn lock is held.
 * - A finished turn counts as activity; a queued turn blocks the idle close.
 * - /health is idempotent and never mutates registry or provider state.
 * - One degraded provider degrades the overall status without touching the others;
 *   any core provider down means down; automation never affects the overall status.
 * - Task endpoints list recorded tasks with their keyword type and 404 unknown ids.
 * - The task table keeps only the newest entries.
 * - POST /api/text and /api/voice run one stateless turn; bad bodies are 400,
 *   provider failures 502.
 *
 * Run from build dir: ./test_registry_health
 */

#include "fakes.h"
#include "gateway_server.h"
#include "health_reporter.h"
#include "logger.h"
#include "session_registry.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace voicegate;
using namespace voicegate::testing;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    Logger::initialize(LogLevel::ERROR);

    Config cfg = make_test_config();
    cfg.server.max_sessions = 2;
    cfg.server.idle_timeout_ms = 50;
    cfg.automation.enabled = true;

    auto http = std::make_shared<FakeHttpTransport>();
    http->set_default(LLM_URL, chat_response("Hi there"));
    Pipeline pipeline(cfg, http);
    TaskTracker tasks;
    SessionRegistry registry(cfg, pipeline, &tasks);
    HealthReporter health(cfg, registry, pipeline.health());
    GatewayServer server(cfg, registry, health, tasks, pipeline);

    // --- Capacity ---
    {
        auto c1 = std::make_shared<FakeConnection>();
        auto c2 = std::make_shared<FakeConnection>();
        auto c3 = std::make_shared<FakeConnection>();
        auto s1 = registry.open(c1);
        auto s2 = registry.open(c2);
        ASSERT(s1.is_ok());
        ASSERT(s2.is_ok());
        ASSERT(registry.active_count() == 2);
        ASSERT(registry.capacity() == 2);

        auto s3 = registry.open(c3);
        ASSERT(s3.is_error());
        ASSERT(s3.is_error() && s3.error().type == ErrorType::CapacityExceeded);
        ASSERT(registry.active_count() == 2);

        if (s1.is_ok() && s2.is_ok()) {
            ASSERT(s1.value()->id() != s2.value()->id());
            ASSERT(registry.find(s1.value()->id()) == s1.value());

            // Near capacity: 2 of 2 is above the 0.9 ratio
            ASSERT(health.report().status == HealthStatus::Degraded);

            std::string id = s1.value()->id();
            ASSERT(registry.close(id, "test"));
            ASSERT(!registry.close(id, "test"));
            ASSERT(s1.value()->is_closed());
            ASSERT(!c1->is_open());
            ASSERT(registry.find(id) == nullptr);
            ASSERT(registry.open(c3).is_ok());
        }
        registry.close_all("test");
        ASSERT(registry.active_count() == 0);
    }

    // --- Reader loop ---
    {
        auto conn = std::make_shared<FakeConnection>();
        auto opened = registry.open(conn);
        ASSERT(opened.is_ok());
        if (opened.is_ok()) {
            std::shared_ptr<Session> session = opened.value();
            std::thread reader([session] { session->run(); });

            conn->push_inbound("this is not json");
            ASSERT(conn->wait_for_writes(1));
            conn->push_inbound(text_frame("Hello"));
            ASSERT(conn->wait_for_writes(2));
            conn->push_inbound(control_frame("ping"));
            ASSERT(conn->wait_for_writes(3));
            conn->push_inbound(control_frame("disconnect"));
            reader.join();

            auto writes = conn->writes();
            ASSERT(writes.size() == 3);
            if (writes.size() == 3) {
                ASSERT(json::parse(writes[0])["type"] == "error");
                ASSERT(json::parse(writes[1])["content"] == "Hi there");
                ASSERT(json::parse(writes[2])["type"] == "pong");
            }
            ASSERT(session->transport().messages_received() == 4);
            ASSERT(session->orchestrator().stats().protocol_errors == 1);
            ASSERT(registry.close(session->id(), "disconnected"));
            ASSERT(session->is_closed());
        }
    }

    // --- Idle sweep ---
    {
        auto idle_conn = std::make_shared<FakeConnection>();
        auto busy_conn = std::make_shared<FakeConnection>();
        auto idle = registry.open(idle_conn);
        auto busy = registry.open(busy_conn);
        ASSERT(idle.is_ok() && busy.is_ok());
        if (idle.is_ok() && busy.is_ok()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(120));
            ASSERT(idle.value()->idle_ms() >= 100);

            size_t swept = 0;
            {
                // Held turn lock marks a turn in flight; sweep from another thread
                std::lock_guard<std::mutex> turn(busy.value()->turn_mutex());
                std::thread sweeper([&] { swept = registry.sweep_idle(); });
                sweeper.join();
            }
            ASSERT(swept == 1);
            ASSERT(idle.value()->is_closed());
            ASSERT(!busy.value()->is_closed());
            ASSERT(registry.active_count() == 1);

            busy.value()->touch();
            ASSERT(registry.sweep_idle() == 0);
            std::this_thread::sleep_for(std::chrono::milliseconds(120));
            ASSERT(registry.sweep_idle() == 1);
            ASSERT(registry.active_count() == 0);
        }
    }

    // --- Finished turns reset the idle clock ---
    {
        Config slow_cfg = cfg;
        slow_cfg.server.idle_timeout_ms = 200;
        SessionRegistry slow(slow_cfg, pipeline, &tasks);
        auto conn = std::make_shared<FakeConnection>();
        auto opened = slow.open(conn);
        ASSERT(opened.is_ok());
        if (opened.is_ok()) {
            std::shared_ptr<Session> session = opened.value();
            std::thread reader([session] { session->run(); });

            http->block(LLM_URL);
            conn->push_inbound(text_frame("Hello"));
            ASSERT(http->wait_for_blocked(1));
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            ASSERT(slow.sweep_idle() == 0);

            http->release();
            ASSERT(conn->wait_for_writes(1));
            ASSERT(session->orchestrator().wait_until_idle(2000));
            ASSERT(session->idle_ms() < 200);
            ASSERT(slow.sweep_idle() == 0);
            ASSERT(!session->is_closed());

            // A turn queued behind the lock keeps the session open
            {
                std::lock_guard<std::mutex> turn(session->turn_mutex());
                conn->push_inbound(text_frame("Again"));
                for (int i = 0; i < 200 && session->orchestrator().state() == TurnState::Idle; ++i) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                ASSERT(session->orchestrator().state() != TurnState::Idle);
                ASSERT(!session->orchestrator().seal_if_quiet());
            }
            ASSERT(conn->wait_for_writes(2));
            ASSERT(session->orchestrator().wait_until_idle(2000));
            ASSERT(!session->is_closed());

            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            ASSERT(session->close_if_idle(0));
            ASSERT(!session->close_if_idle(0));
            reader.join();
            ASSERT(!conn->is_open());
            ASSERT(slow.close(session->id(), "test"));

            auto writes = conn->writes();
            ASSERT(writes.size() == 2);
            for (const auto& w : writes) {
                ASSERT(json::parse(w)["content"] == "Hi there");
            }
        }
    }

    // --- Background sweeper ---
    {
        Config sweep_cfg = cfg;
        sweep_cfg.server.sweep_interval_ms = 20;
        SessionRegistry sweeping(sweep_cfg, pipeline, &tasks);
        auto opened = sweeping.open(std::make_shared<FakeConnection>());
        ASSERT(opened.is_ok());
        sweeping.start_sweeper();
        for (int i = 0; i < 100 && sweeping.active_count() > 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT(sweeping.active_count() == 0);
        sweeping.stop_sweeper();
    }

    // --- /health is idempotent ---
    {
        auto before = pipeline.health().snapshots();
        HttpReply first = server.route("GET", "/health");
        HttpReply second = server.route("GET", "/health");
        ASSERT(first.status == 200);
        ASSERT(first.body == second.body);
        ASSERT(json::parse(first.body)["status"] == "up");
        ASSERT(registry.active_count() == 0);
        auto after = pipeline.health().snapshots();
        ASSERT(before.size() == after.size());
        for (size_t i = 0; i < before.size() && i < after.size(); ++i) {
            ASSERT(before[i].total_calls == after[i].total_calls);
            ASSERT(before[i].status == after[i].status);
        }
    }

    // --- Provider health aggregation ---
    {
        ProviderHealth* automation = pipeline.health().get(provider::AUTOMATION);
        ASSERT(automation != nullptr);
        for (int i = 0; automation && i < cfg.health.down_after_failures; ++i) {
            automation->record_failure();
        }
        ASSERT(automation && automation->status() == HealthStatus::Down);
        ASSERT(health.report().status == HealthStatus::Up);

        ProviderHealth* tts = pipeline.health().get(provider::TTS);
        for (int i = 0; i < cfg.health.degraded_after_failures; ++i) {
            tts->record_failure();
        }
        json status = json::parse(server.route("GET", "/status").body);
        ASSERT(status["status"] == "degraded");
        ASSERT(status["providers"]["tts"]["status"] == "degraded");
        ASSERT(status["providers"]["tts"]["consecutive_failures"] == 3);
        ASSERT(status["providers"]["tts"]["last_check"].is_string());
        ASSERT(status["providers"]["stt"]["status"] == "up");
        ASSERT(status["providers"]["llm"]["status"] == "up");
        ASSERT(status["providers"]["stt"]["last_check"].is_null());
        ASSERT(status["providers"]["automation"]["status"] == "down");
        ASSERT(status["max_sessions"] == 2);
        ASSERT(status["active_sessions"] == 0);

        for (int i = 0; i < cfg.health.down_after_failures; ++i) {
            tts->record_failure();
        }
        ASSERT(json::parse(server.route("GET", "/health").body)["status"] == "down");
        tts->record_success();
        ASSERT(json::parse(server.route("GET", "/health").body)["status"] == "up");
    }

    // --- Aggregation rule ---
    {
        std::vector<ProviderHealthSnapshot> providers(3);
        providers[0].name = "llm";
        providers[1].name = "stt";
        providers[2].name = "tts";
        ASSERT(HealthReporter::aggregate(providers, 0, 10, 0.9f) == HealthStatus::Up);
        ASSERT(HealthReporter::aggregate(providers, 8, 10, 0.9f) == HealthStatus::Up);
        ASSERT(HealthReporter::aggregate(providers, 9, 10, 0.9f) == HealthStatus::Degraded);
        providers[1].status = HealthStatus::Degraded;
        ASSERT(HealthReporter::aggregate(providers, 0, 10, 0.9f) == HealthStatus::Degraded);
        providers[2].status = HealthStatus::Down;
        ASSERT(HealthReporter::aggregate(providers, 0, 10, 0.9f) == HealthStatus::Down);
    }

    // --- Routes ---
    {
        json info = json::parse(server.route("GET", "/").body);
        ASSERT(info["status"] == "running");
        ASSERT(info["service"] == "voicegate");
        ASSERT(info["models"]["llm"] == "llm-test");

        json empty = json::parse(server.route("GET", "/api/tasks").body);
        ASSERT(empty["tasks"].is_object());
        ASSERT(empty["tasks"].empty());

        std::string id = tasks.record("write a report", "s1", "conv-1");
        json listed = json::parse(server.route("GET", "/api/tasks/").body);
        ASSERT(listed["tasks"].contains(id));
        HttpReply one = server.route("GET", "/api/tasks/" + id);
        ASSERT(one.status == 200);
        ASSERT(json::parse(one.body)["description"] == "write a report");
        ASSERT(json::parse(one.body)["status"] == "delegated");
        ASSERT(json::parse(one.body)["type"] == "writing");

        HttpReply unknown = server.route("GET", "/api/tasks/task_0_0");
        ASSERT(unknown.status == 404);
        ASSERT(json::parse(unknown.body)["error"] == "Task not found");

        ASSERT(server.route("GET", "/health?verbose=1").status == 200);
        ASSERT(server.route("POST", "/health").status == 405);
        ASSERT(server.route("GET", "/ws").status == 426);
        ASSERT(server.route("GET", "/nowhere").status == 404);
    }

    // --- Task types and the bounded task table ---
    {
        ASSERT(classify_task("Build me a dashboard") == "creation");
        ASSERT(classify_task("research competitor pricing") == "analysis");
        ASSERT(classify_task("draft an email") == "writing");
        ASSERT(classify_task("plan the offsite") == "design");
        ASSERT(classify_task("automate the weekly export") == "automation");
        ASSERT(classify_task("remind me tomorrow") == "general");

        TaskTracker small(2);
        std::string a = small.record("one", "s", "c");
        std::string b = small.record("two", "s", "c");
        std::string c = small.record("three", "s", "c");
        ASSERT(small.size() == 2);
        ASSERT(!small.find(a).has_value());
        ASSERT(small.find(b).has_value());
        ASSERT(small.find(c).has_value());
        auto listed = small.list();
        ASSERT(listed.size() == 2);
        ASSERT(listed.size() == 2 && listed[0].id == b && listed[1].id == c);
    }

    // --- Stateless turns over HTTP ---
    {
        HttpReply text = server.route("POST", "/api/text", text_frame("Hello"));
        ASSERT(text.status == 200);
        json reply = json::parse(text.body);
        ASSERT(reply["type"] == "text");
        ASSERT(reply["content"] == "Hi there");
        ASSERT(reply["audio"].is_null());

        http->push(STT_URL, transcript_response("What time is it"));
        http->push(TTS_URL, audio_response());
        HttpReply voice = server.route("POST", "/api/voice", voice_frame(tone(500)));
        ASSERT(voice.status == 200);
        json spoken = json::parse(voice.body);
        ASSERT(spoken["type"] == "voice");
        ASSERT(spoken["content"] == "Hi there");
        ASSERT(spoken["audio"].is_string() && !spoken["audio"].get<std::string>().empty());

        size_t before = tasks.size();
        http->push(LLM_URL, chat_response("DELEGATE: analyze last quarter's churn"));
        http->push(AUTOMATION_URL, json_response("{\"status\":\"accepted\"}"));
        json delegated = json::parse(server.route("POST", "/api/text", text_frame("Look into churn")).body);
        ASSERT(delegated["needs_delegation"] == true);
        ASSERT(delegated["content"].get<std::string>().find("Task ID: task_") != std::string::npos);
        ASSERT(tasks.size() == before + 1);
        ASSERT(tasks.list().back().type == "analysis");

        ASSERT(server.route("POST", "/api/text", "not json").status == 400);
        ASSERT(server.route("POST", "/api/text", voice_frame(tone(100))).status == 400);
        ASSERT(server.route("POST", "/api/voice", text_frame("Hello")).status == 400);
        ASSERT(server.route("GET", "/api/text").status == 405);

        http->push(STT_URL, transcript_response(""));
        HttpReply quiet = server.route("POST", "/api/voice", voice_frame(tone(200)));
        ASSERT(quiet.status == 400);

        http->push(LLM_URL, status_response(400));
        HttpReply broken = server.route("POST", "/api/text", text_frame("Hello"));
        ASSERT(broken.status == 502);
        ASSERT(json::parse(broken.body)["error"].get<std::string>().find("Language model failed") == 0);
        ASSERT(registry.active_count() == 0);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All registry and health tests passed.\n";
    return 0;
}
