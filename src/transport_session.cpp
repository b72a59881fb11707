#include "transport_session.h"
#include "logger.h"

namespace voicegate {

TransportSession::TransportSession(std::shared_ptr<Connection> connection, int sample_rate)
    : connection_(std::move(connection)), sample_rate_(sample_rate) {}

Result<ClientMessage> TransportSession::receive() {
    auto raw = connection_->read();
    if (!raw) {
        return raw.error();
    }
    received_++;
    return parse_client_message(raw.value(), sample_rate_);
}

Result<void> TransportSession::send(const ServerMessage& message) {
    if (!connection_->is_open()) {
        return make_transport_error("Connection is closed");
    }

    std::string payload = serialize_server_message(message);
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto result = connection_->write(payload);
    if (result) {
        sent_++;
    } else {
        LOG_WS("Send failed (" + std::string(server_message_type_to_string(message.type)) + "): " +
               result.error().message);
    }
    return result;
}

void TransportSession::close() {
    connection_->close();
}

bool TransportSession::is_open() const {
    return connection_->is_open();
}

} // namespace voicegate
