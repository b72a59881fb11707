#pragma once

#include "config.h"
#include "health_reporter.h"
#include "http_turn.h"
#include "session_registry.h"
#include "task_tracker.h"
#include "websocket_connection.h"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace voicegate {

/// Status and JSON body of a plain HTTP reply
struct HttpReply {
    int status = 200;
    std::string body;
};

/**
 * @brief Listening socket: WebSocket sessions on /ws, JSON endpoints on everything else
 *
 * Routes:
 * - GET /ws (upgrade)        new session, refused with an error message at capacity
 * - GET /health              {"status"}
 * - GET /status              registry load and per-provider health
 * - GET /                    service info
 * - GET /api/tasks[/{id}]    delegated tasks
 * - POST /api/text           one stateless text turn
 * - POST /api/voice          one stateless voice turn
 *
 * Each accepted connection is served on its own thread. Socket I/O runs on a
 * small io_context pool.
 */
class GatewayServer {
public:
    GatewayServer(const Config& config,
                  SessionRegistry& registry,
                  const HealthReporter& health,
                  TaskTracker& tasks,
                  Pipeline& pipeline);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    /**
     * @brief Bind, listen and start accepting
     * @return TransportError when the address cannot be bound
     */
    Result<void> start();

    /// Stop accepting, close every session and wait for connection threads
    void stop();

    /// Bound port (useful when server.port is 0)
    unsigned short port() const { return bound_port_.load(); }

    /// Answer a plain HTTP request
    HttpReply route(const std::string& method, const std::string& target, const std::string& body = "");

private:
    void do_accept();
    void serve_connection(tcp::socket socket);
    void serve_websocket(beast::tcp_stream stream, const http::request<http::string_body>& request);

    Config config_;
    SessionRegistry& registry_;
    const HealthReporter& health_;
    const TaskTracker& tasks_;
    HttpTurn http_turn_;

    net::io_context ioc_;
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> work_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> io_threads_;
    std::atomic<unsigned short> bound_port_{0};
    std::atomic<bool> running_{false};

    std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    size_t active_connections_ = 0;
};

} // namespace voicegate
