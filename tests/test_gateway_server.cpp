/**
 * Gateway server over loopback sockets (Beast client, scripted providers).
 * Asserts:
 * - A WebSocket client on /ws gets a text reply to "Hello".
 * - Malformed frames are answered with an error and the session stays open.
 * - At capacity a new WebSocket client receives an error message and is closed.
 * - GET /health and GET /status answer JSON over plain HTTP.
 * - POST /api/text answers one turn without opening a session.
 * - stop() closes every session.
 *
 * Run from build dir: ./test_gateway_server
 */

#include "fakes.h"
#include "gateway_server.h"
#include "logger.h"
#include <boost/asio/connect.hpp>
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

namespace {

using ClientSocket = websocket::stream<tcp::socket>;

std::unique_ptr<ClientSocket> connect_ws(net::io_context& ioc, unsigned short port) {
    tcp::resolver resolver(ioc);
    auto client = std::make_unique<ClientSocket>(ioc);
    net::connect(client->next_layer(), resolver.resolve("127.0.0.1", std::to_string(port)));
    client->handshake("127.0.0.1", "/ws");
    client->text(true);
    return client;
}

json read_json(ClientSocket& client) {
    beast::flat_buffer buffer;
    client.read(buffer);
    return json::parse(beast::buffers_to_string(buffer.data()));
}

http::response<http::string_body> http_get(net::io_context& ioc, unsigned short port, const std::string& target) {
    tcp::resolver resolver(ioc);
    tcp::socket socket(ioc);
    net::connect(socket, resolver.resolve("127.0.0.1", std::to_string(port)));

    http::request<http::empty_body> request{http::verb::get, target, 11};
    request.set(http::field::host, "127.0.0.1");
    http::write(socket, request);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);

    beast::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    return response;
}

http::response<http::string_body> http_post(net::io_context& ioc, unsigned short port,
                                            const std::string& target, const std::string& body) {
    tcp::resolver resolver(ioc);
    tcp::socket socket(ioc);
    net::connect(socket, resolver.resolve("127.0.0.1", std::to_string(port)));

    http::request<http::string_body> request{http::verb::post, target, 11};
    request.set(http::field::host, "127.0.0.1");
    request.set(http::field::content_type, "application/json");
    request.body() = body;
    request.prepare_payload();
    http::write(socket, request);

    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    http::read(socket, buffer, response);

    beast::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);
    return response;
}

} // anonymous namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    Config cfg = make_test_config();
    cfg.server.host = "127.0.0.1";
    cfg.server.port = 0;
    cfg.server.max_sessions = 1;

    auto fake = std::make_shared<FakeHttpTransport>();
    fake->set_default(LLM_URL, chat_response("Hi there"));
    Pipeline pipeline(cfg, fake);
    TaskTracker tasks;
    SessionRegistry registry(cfg, pipeline, &tasks);
    HealthReporter health(cfg, registry, pipeline.health());
    GatewayServer server(cfg, registry, health, tasks, pipeline);

    auto started = server.start();
    ASSERT(started.is_ok());
    if (!started) {
        std::cerr << started.error().message << "\n";
        return 1;
    }
    unsigned short port = server.port();
    ASSERT(port != 0);

    net::io_context client_ioc;
    try {
        // --- Text turn over WebSocket ---
        auto first = connect_ws(client_ioc, port);
        first->write(net::buffer(text_frame("Hello")));
        json reply = read_json(*first);
        ASSERT(reply["type"] == "text");
        ASSERT(reply["content"] == "Hi there");
        ASSERT(reply["timestamp"].is_string());
        ASSERT(registry.active_count() == 1);

        // --- Malformed frame keeps the session ---
        first->write(net::buffer(std::string("{\"type\":\"text\"}")));
        json error = read_json(*first);
        ASSERT(error["type"] == "error");
        first->write(net::buffer(control_frame("ping")));
        ASSERT(read_json(*first)["type"] == "pong");

        // --- Capacity: second client is refused with an error ---
        auto second = connect_ws(client_ioc, port);
        json refused = read_json(*second);
        ASSERT(refused["type"] == "error");
        ASSERT(refused["content"].get<std::string>().find("capacity") != std::string::npos);
        beast::flat_buffer drain;
        beast::error_code ec;
        second->read(drain, ec);
        ASSERT(ec);
        ASSERT(registry.active_count() == 1);

        // --- Plain HTTP endpoints ---
        auto health_res = http_get(client_ioc, port, "/health");
        ASSERT(health_res.result_int() == 200);
        ASSERT(json::parse(health_res.body())["status"].is_string());
        auto status_res = http_get(client_ioc, port, "/status");
        ASSERT(status_res.result_int() == 200);
        ASSERT(json::parse(status_res.body())["active_sessions"] == 1);
        auto missing = http_get(client_ioc, port, "/missing");
        ASSERT(missing.result_int() == 404);
        auto turn = http_post(client_ioc, port, "/api/text", text_frame("Hello"));
        ASSERT(turn.result_int() == 200);
        ASSERT(json::parse(turn.body())["content"] == "Hi there");
        ASSERT(registry.active_count() == 1);

        // --- Client disconnect frees the slot ---
        first->write(net::buffer(control_frame("disconnect")));
        beast::flat_buffer closing;
        first->read(closing, ec);
        ASSERT(ec);
        for (int i = 0; i < 200 && registry.active_count() > 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT(registry.active_count() == 0);
    } catch (const std::exception& e) {
        std::cerr << "FAIL: client exception: " << e.what() << "\n";
        failed++;
    }

    server.stop();
    ASSERT(registry.active_count() == 0);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All gateway server tests passed.\n";
    return 0;
}
