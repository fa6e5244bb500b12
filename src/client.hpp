#pragma once

#include <cstdint>

#include "ber_codec.hpp"
#include "config.hpp"
#include "connection.hpp"
#include "logger.hpp"

namespace ldap {

// Id following current: wraps from 2^31-1 back to 1, never yields 0.
int32_t next_message_id(int32_t current);

// One LDAP session: a connection plus its message id sequence.
class Client {
public:
    Client(const Config& cfg, Logger& logger);

    void connect();
    void close();
    bool is_open() const { return conn_.is_open(); }

    // Wraps op in the message envelope under a fresh message id and sends
    // it. Returns the id used.
    int32_t send(const ber::Tag& op);

    // Next message from the server.
    ber::Message recv();

    // Id of the most recently sent message, 0 before the first send.
    int32_t last_message_id() const { return msgid_; }

private:
    Config cfg_;
    Logger& logger_;
    Connection conn_;
    int32_t msgid_ = 0;
};

} // namespace ldap
