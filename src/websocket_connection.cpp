#include "websocket_connection.h"
#include "logger.h"
#include <future>

namespace voicegate {

namespace {

/// Completion of one posted operation
struct IoResult {
    beast::error_code ec;
    std::string text;
};

Result<IoResult> wait_for(std::future<IoResult>& future) {
    try {
        return future.get();
    } catch (const std::future_error& e) {
        // io_context destroyed with the operation still queued
        return make_transport_error(std::string("I/O abandoned: ") + e.what());
    }
}

std::string endpoint_string(const beast::tcp_stream& stream) {
    beast::error_code ec;
    auto ep = stream.socket().remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // anonymous namespace

WebSocketConnection::WebSocketConnection(beast::tcp_stream stream, const ServerConfig& config)
    : ws_(std::move(stream)),
      read_timeout_ms_(config.ws_read_timeout_ms) {
    remote_ = endpoint_string(ws_.next_layer());
}

WebSocketConnection::~WebSocketConnection() {
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().close(ec);
}

Result<void> WebSocketConnection::accept(const http::request<http::string_body>& request) {
    // The websocket stream has its own timeout system
    beast::get_lowest_layer(ws_).expires_never();

    websocket::stream_base::timeout timeouts = websocket::stream_base::timeout::suggested(beast::role_type::server);
    timeouts.handshake_timeout = std::chrono::seconds(5);
    if (read_timeout_ms_ > 0) {
        timeouts.idle_timeout = std::chrono::milliseconds(read_timeout_ms_);
        timeouts.keep_alive_pings = true;
    } else {
        timeouts.idle_timeout = websocket::stream_base::none();
    }
    ws_.set_option(timeouts);
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& res) {
        res.set(http::field::server, "voicegate");
    }));

    auto promise = std::make_shared<std::promise<IoResult>>();
    auto future = promise->get_future();
    auto self = shared_from_this();
    net::post(ws_.get_executor(), [self, promise, &request] {
        self->ws_.async_accept(request, [self, promise](beast::error_code ec) {
            IoResult r;
            r.ec = ec;
            promise->set_value(std::move(r));
        });
    });

    auto done = wait_for(future);
    if (!done) {
        return done.error();
    }
    if (done.value().ec) {
        return make_transport_error("WebSocket handshake failed: " + done.value().ec.message());
    }
    open_ = true;
    LOG_WS("Upgraded connection from " + remote_);
    return Result<void>();
}

Result<std::string> WebSocketConnection::read() {
    if (!open_) {
        return make_transport_error("Connection is closed");
    }

    auto promise = std::make_shared<std::promise<IoResult>>();
    auto future = promise->get_future();
    auto self = shared_from_this();
    net::post(ws_.get_executor(), [self, promise] {
        self->ws_.async_read(self->buffer_, [self, promise](beast::error_code ec, std::size_t) {
            IoResult r;
            r.ec = ec;
            if (!ec) {
                r.text = beast::buffers_to_string(self->buffer_.data());
            }
            self->buffer_.consume(self->buffer_.size());
            promise->set_value(std::move(r));
        });
    });

    auto done = wait_for(future);
    if (!done) {
        open_ = false;
        return done.error();
    }
    const beast::error_code& ec = done.value().ec;
    if (ec) {
        open_ = false;
        if (ec == websocket::error::closed) {
            return make_transport_error("Closed by peer");
        }
        if (ec == beast::error::timeout) {
            return make_transport_error("Peer stopped responding (idle timeout)");
        }
        return make_transport_error("Read failed: " + ec.message());
    }
    return done.value().text;
}

Result<void> WebSocketConnection::write(const std::string& text) {
    if (!open_) {
        return make_transport_error("Connection is closed");
    }

    auto payload = std::make_shared<std::string>(text);
    auto promise = std::make_shared<std::promise<IoResult>>();
    auto future = promise->get_future();
    auto self = shared_from_this();
    net::post(ws_.get_executor(), [self, promise, payload] {
        self->ws_.text(true);
        self->ws_.async_write(net::buffer(*payload), [self, promise, payload](beast::error_code ec, std::size_t) {
            IoResult r;
            r.ec = ec;
            promise->set_value(std::move(r));
        });
    });

    auto done = wait_for(future);
    if (!done) {
        open_ = false;
        return done.error();
    }
    if (done.value().ec) {
        open_ = false;
        return make_transport_error("Write failed: " + done.value().ec.message());
    }
    return Result<void>();
}

void WebSocketConnection::close() {
    bool expected = false;
    if (!closing_.compare_exchange_strong(expected, true)) {
        return;
    }
    bool was_open = open_.exchange(false);

    auto self = shared_from_this();
    net::post(ws_.get_executor(), [self, was_open] {
        if (was_open && self->ws_.is_open()) {
            self->ws_.async_close(websocket::close_code::normal, [self](beast::error_code ec) {
                if (ec) {
                    Logger::debug("[WS] Close handshake with " + self->remote_ + ": " + ec.message());
                }
                beast::error_code ignored;
                beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_both, ignored);
                beast::get_lowest_layer(self->ws_).close();
            });
        } else {
            beast::get_lowest_layer(self->ws_).close();
        }
    });
}

bool WebSocketConnection::is_open() const {
    return open_.load();
}

} // namespace voicegate
