#pragma once

#include <boost/asio.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

#include "ber_types.hpp"
#include "frame_buffer.hpp"
#include "logger.hpp"

namespace ldap {

class IoError : public std::runtime_error {
public:
    IoError(const std::string& what, const boost::system::error_code& ec);

    const boost::system::error_code& code() const { return ec_; }

private:
    boost::system::error_code ec_;
};

// Blocking TCP connection with per-call timeouts. Owns its io_context and
// drives it with run_for() so every call either completes or fails within
// the given time. Not thread-safe; one owner at a time.
class Connection {
public:
    using tcp = boost::asio::ip::tcp;
    using Duration = std::chrono::milliseconds;

    explicit Connection(Logger& logger, size_t max_frame = ber::FrameBuffer::kDefaultMaxFrame);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void connect(const std::string& host, uint16_t port, Duration timeout);
    void close();
    bool is_open() const;

    // Either the whole buffer goes out or IoError is thrown (and the
    // connection is closed).
    void write(const ber::Bytes& bytes, Duration timeout);

    // Next complete top-level TLV. Bytes beyond it stay buffered for the
    // following call. Throws IoError on socket failure or timeout and
    // ber::Asn1Error when the peer sends a malformed or oversized header.
    ber::Bytes read_frame(Duration timeout);

    tcp::endpoint remote_endpoint() const;

private:
    void run(Duration timeout, const std::function<void()>& cancel);

    boost::asio::io_context io_;
    Logger& logger_;
    tcp::socket sock_;
    ber::FrameBuffer rx_;
    std::array<uint8_t, 4096> rxbuf_{};
};

} // namespace ldap
