#pragma once

#include "errors.h"
#include "messages.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace voicegate {

/**
 * @brief One client's bidirectional message channel
 *
 * read() blocks until a whole message arrives. write() may be called from
 * any thread, concurrently with a pending read().
 */
class Connection {
public:
    virtual ~Connection() = default;

    /// Next text message, or TransportError once the peer is gone
    virtual Result<std::string> read() = 0;

    virtual Result<void> write(const std::string& text) = 0;

    /// Close the channel; a blocked read() returns TransportError. Idempotent.
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    virtual std::string remote_endpoint() const { return "unknown"; }
};

/**
 * @brief Typed view of a Connection: validated ClientMessages in, ServerMessages out
 */
class TransportSession {
public:
    TransportSession(std::shared_ptr<Connection> connection, int sample_rate);

    TransportSession(const TransportSession&) = delete;
    TransportSession& operator=(const TransportSession&) = delete;

    /**
     * @brief Block for the next client message
     * @return Message, ProtocolError (session stays usable) or TransportError (session over)
     */
    Result<ClientMessage> receive();

    /// TransportError when the connection is already closed
    Result<void> send(const ServerMessage& message);

    void close();
    bool is_open() const;

    std::string remote_endpoint() const { return connection_->remote_endpoint(); }

    uint64_t messages_received() const { return received_.load(); }
    uint64_t messages_sent() const { return sent_.load(); }

private:
    std::shared_ptr<Connection> connection_;
    int sample_rate_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> received_{0};
    std::atomic<uint64_t> sent_{0};
};

} // namespace voicegate
