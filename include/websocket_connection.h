#pragma once

#include "config.h"
#include "transport_session.h"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace voicegate {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

/**
 * @brief Connection over a Beast WebSocket stream
 *
 * Every socket operation runs asynchronously on the stream's strand; the
 * blocking read/write entry points post the operation and wait for its
 * completion. This lets the reader thread, the turn worker and the sweeper
 * use one stream safely, and lets Beast's keep-alive ping and idle timeout
 * apply (server.ws_read_timeout_ms).
 *
 * The io_context that owns the strand must keep running until close()
 * has completed.
 */
class WebSocketConnection : public Connection,
                            public std::enable_shared_from_this<WebSocketConnection> {
public:
    WebSocketConnection(beast::tcp_stream stream, const ServerConfig& config);
    ~WebSocketConnection() override;

    /// Complete the upgrade for a request already read from the stream
    Result<void> accept(const http::request<http::string_body>& request);

    Result<std::string> read() override;
    Result<void> write(const std::string& text) override;
    void close() override;
    bool is_open() const override;
    std::string remote_endpoint() const override { return remote_; }

private:
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::string remote_;
    int read_timeout_ms_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};
};

} // namespace voicegate
