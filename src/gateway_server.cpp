#include "gateway_server.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <future>

using json = nlohmann::json;

namespace voicegate {

namespace {

constexpr auto kHttpReadTimeout = std::chrono::seconds(10);
constexpr auto kShutdownGrace = std::chrono::seconds(15);
const char* kTasksPrefix = "/api/tasks/";

std::string to_string(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

json task_to_json(const DelegatedTask& task) {
    json j;
    j["id"] = task.id;
    j["description"] = task.description;
    j["type"] = task.type;
    j["status"] = task.status;
    j["created_at"] = task.created_at;
    return j;
}

HttpReply error_reply(int status, const std::string& message) {
    json j;
    j["error"] = message;
    return HttpReply{status, j.dump()};
}

/// 400 for a bad request, 502 for a provider failure, 503 once shutting down
HttpReply turn_reply(const Result<ServerMessage>& result) {
    if (result) {
        return HttpReply{200, serialize_server_message(result.value())};
    }
    const Error& error = result.error();
    switch (error.type) {
        case ErrorType::ProtocolError:
            return error_reply(400, error.message);
        case ErrorType::Cancelled:
            return error_reply(503, "Server is shutting down");
        default:
            return error_reply(502, error.message);
    }
}

/// Post op onto the stream's strand and block until its handler reports
template <typename Op>
beast::error_code run_and_wait(beast::tcp_stream& stream, Op op) {
    auto promise = std::make_shared<std::promise<beast::error_code>>();
    auto future = promise->get_future();
    net::post(stream.get_executor(), [op, promise]() mutable {
        op([promise](beast::error_code ec, std::size_t) { promise->set_value(ec); });
    });
    try {
        return future.get();
    } catch (const std::future_error&) {
        return net::error::operation_aborted;
    }
}

} // anonymous namespace

GatewayServer::GatewayServer(const Config& config,
                             SessionRegistry& registry,
                             const HealthReporter& health,
                             TaskTracker& tasks,
                             Pipeline& pipeline)
    : config_(config),
      registry_(registry),
      health_(health),
      tasks_(tasks),
      http_turn_(config, pipeline, &tasks),
      acceptor_(ioc_) {}

GatewayServer::~GatewayServer() {
    stop();
}

Result<void> GatewayServer::start() {
    beast::error_code ec;
    auto address = net::ip::make_address(config_.server.host, ec);
    if (ec) {
        return make_transport_error("Invalid listen address '" + config_.server.host + "': " + ec.message());
    }
    tcp::endpoint endpoint(address, static_cast<unsigned short>(config_.server.port));

    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor_.bind(endpoint, ec);
    if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        return make_transport_error("Cannot listen on " + config_.server.host + ":" +
                                    std::to_string(config_.server.port) + ": " + ec.message());
    }
    bound_port_ = acceptor_.local_endpoint().port();

    work_ = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(ioc_));
    running_ = true;
    do_accept();

    unsigned int threads = std::max(2u, std::thread::hardware_concurrency());
    for (unsigned int i = 0; i < threads; ++i) {
        io_threads_.emplace_back([this] { ioc_.run(); });
    }

    LOG_INFO("Gateway listening on " + config_.server.host + ":" + std::to_string(bound_port_.load()) +
             " (max " + std::to_string(config_.server.max_sessions) + " sessions, " +
             std::to_string(threads) + " io threads)");
    return Result<void>();
}

void GatewayServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    LOG_INFO("Gateway stopping");

    net::post(acceptor_.get_executor(), [this] {
        beast::error_code ignored;
        acceptor_.close(ignored);
    });

    http_turn_.cancel_all();
    registry_.close_all("server shutdown");

    {
        std::unique_lock<std::mutex> lock(connections_mutex_);
        if (!connections_cv_.wait_for(lock, kShutdownGrace, [this] { return active_connections_ == 0; })) {
            Logger::warn("[WS] " + std::to_string(active_connections_) + " connection(s) still open at shutdown");
        }
    }

    work_.reset();
    ioc_.stop();
    for (auto& t : io_threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    io_threads_.clear();
    LOG_INFO("Gateway stopped");
}

void GatewayServer::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket) {
        if (!running_) {
            return;
        }
        if (ec) {
            Logger::warn("[WS] Accept failed: " + ec.message());
        } else {
            {
                std::lock_guard<std::mutex> lock(connections_mutex_);
                active_connections_++;
            }
            std::thread(&GatewayServer::serve_connection, this, std::move(socket)).detach();
        }
        do_accept();
    });
}

void GatewayServer::serve_connection(tcp::socket socket) {
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    http::request<http::string_body> request;

    stream.expires_after(kHttpReadTimeout);
    beast::error_code ec = run_and_wait(stream, [&stream, &buffer, &request](auto handler) {
        http::async_read(stream, buffer, request, handler);
    });

    if (ec) {
        LOG_HTTP("Dropped connection before a request arrived: " + ec.message());
    } else if (websocket::is_upgrade(request)) {
        std::string target = to_string(request.target());
        if (target.substr(0, target.find('?')) == "/ws") {
            serve_websocket(std::move(stream), request);
        } else {
            LOG_WS("Rejected upgrade on " + target);
            beast::error_code ignored;
            stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
        }
    } else {
        std::string method = to_string(request.method_string());
        std::string target = to_string(request.target());
        HttpReply reply = route(method, target, request.body());
        LOG_HTTP(method + " " + target + " -> " + std::to_string(reply.status));

        http::response<http::string_body> response{static_cast<http::status>(reply.status), request.version()};
        response.set(http::field::server, "voicegate");
        response.set(http::field::content_type, "application/json");
        response.keep_alive(false);
        response.body() = reply.body;
        response.prepare_payload();

        stream.expires_after(kHttpReadTimeout);
        ec = run_and_wait(stream, [&stream, &response](auto handler) {
            http::async_write(stream, response, handler);
        });
        if (ec) {
            LOG_HTTP("Response write failed: " + ec.message());
        }
        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_send, ignored);
    }

    std::lock_guard<std::mutex> lock(connections_mutex_);
    active_connections_--;
    connections_cv_.notify_all();
}

void GatewayServer::serve_websocket(beast::tcp_stream stream, const http::request<http::string_body>& request) {
    auto connection = std::make_shared<WebSocketConnection>(std::move(stream), config_.server);
    auto accepted = connection->accept(request);
    if (!accepted) {
        LOG_WS(accepted.error().message);
        connection->close();
        return;
    }

    auto opened = registry_.open(connection);
    if (!opened) {
        TransportSession refusal(connection, config_.audio.sample_rate);
        auto sent = refusal.send(ServerMessage::error(opened.error().message));
        if (!sent) {
            LOG_WS("Could not notify refused client: " + sent.error().message);
        }
        connection->close();
        return;
    }

    std::shared_ptr<Session> session = opened.value();
    if (!running_) {
        // Raced with stop(): close_all() has already run
        registry_.close(session->id(), "server shutdown");
        return;
    }
    session->run();
    registry_.close(session->id(), "disconnected");
}

HttpReply GatewayServer::route(const std::string& method, const std::string& target, const std::string& body) {
    std::string path = target.substr(0, target.find('?'));
    if (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }

    if (path == "/api/text" || path == "/api/voice") {
        if (method != "POST") {
            return error_reply(405, "Method not allowed");
        }
        return turn_reply(http_turn_.run(body, path == "/api/voice"));
    }

    if (method != "GET") {
        return error_reply(405, "Method not allowed");
    }

    if (path == "/health") {
        return HttpReply{200, health_.health_json()};
    }
    if (path == "/status") {
        return HttpReply{200, health_.status_json()};
    }
    if (path == "/") {
        json j;
        j["status"] = "running";
        j["service"] = config_.server.service_name;
        j["models"]["stt"] = config_.stt.model;
        j["models"]["llm"] = config_.llm.model;
        j["models"]["tts"] = config_.tts.model;
        return HttpReply{200, j.dump()};
    }
    if (path == "/api/tasks") {
        json tasks = json::object();
        for (const auto& task : tasks_.list()) {
            tasks[task.id] = task_to_json(task);
        }
        json j;
        j["tasks"] = tasks;
        return HttpReply{200, j.dump()};
    }
    if (path.compare(0, std::string(kTasksPrefix).size(), kTasksPrefix) == 0) {
        std::string id = path.substr(std::string(kTasksPrefix).size());
        auto task = tasks_.find(id);
        if (!task) {
            return error_reply(404, "Task not found");
        }
        return HttpReply{200, task_to_json(*task).dump()};
    }
    if (path == "/ws") {
        return error_reply(426, "WebSocket upgrade required");
    }
    return error_reply(404, "Not found");
}

} // namespace voicegate
