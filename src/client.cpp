#include "client.hpp"

#include "ber_dump.hpp"

#include <limits>

namespace ldap {

int32_t next_message_id(int32_t current) {
    // 0 is reserved for unsolicited notifications
    if (current <= 0 || current == std::numeric_limits<int32_t>::max()) return 1;
    return current + 1;
}

Client::Client(const Config& cfg, Logger& logger)
    : cfg_(cfg),
      logger_(logger),
      conn_(logger, cfg.max_message_size) {}

void Client::connect() {
    conn_.connect(cfg_.host, cfg_.port, Connection::Duration(cfg_.connect_timeout_ms));
}

void Client::close() {
    conn_.close();
}

int32_t Client::send(const ber::Tag& op) {
    msgid_ = next_message_id(msgid_);
    const int32_t id = msgid_;
    ber::Bytes bytes = ber::encode(op, id);
    if (logger_.enabled(LogLevel::DEBUG)) {
        logger_.debug("sending message " + std::to_string(id) + ":\n" + ber::dump(op, 2));
    }
    conn_.write(bytes, Connection::Duration(cfg_.io_timeout_ms));
    return id;
}

ber::Message Client::recv() {
    ber::Bytes frame = conn_.read_frame(Connection::Duration(cfg_.io_timeout_ms));
    ber::Message msg = ber::decode_message(frame);
    if (logger_.enabled(LogLevel::DEBUG)) {
        logger_.debug("received message " + std::to_string(msg.message_id) + ":\n" + ber::dump(msg.op, 2));
    }
    return msg;
}

} // namespace ldap
