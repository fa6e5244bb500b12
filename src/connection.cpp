#include "connection.hpp"

#include "util.hpp"

#include <utility>

namespace ldap {

IoError::IoError(const std::string& what, const boost::system::error_code& ec)
    : std::runtime_error(what + ": " + ec.message()), ec_(ec) {}

Connection::Connection(Logger& logger, size_t max_frame)
    : logger_(logger),
      sock_(io_),
      rx_(max_frame) {}

Connection::~Connection() {
    close();
}

void Connection::run(Duration timeout, const std::function<void()>& cancel) {
    io_.restart();
    io_.run_for(timeout);
    if (!io_.stopped()) {
        // timed out: abort the pending operation and let its handler finish
        cancel();
        io_.run();
    }
}

void Connection::connect(const std::string& host, uint16_t port, Duration timeout) {
    close();
    rx_.clear();

    tcp::resolver resolver(io_);
    tcp::resolver::results_type endpoints;
    boost::system::error_code ec = boost::asio::error::would_block;
    bool timed_out = false;
    resolver.async_resolve(host, std::to_string(port),
                           [&](const boost::system::error_code& e, tcp::resolver::results_type r) {
        ec = e;
        endpoints = std::move(r);
    });
    run(timeout, [&]() { timed_out = true; resolver.cancel(); });
    if (timed_out) throw IoError("resolving " + host + " timed out", boost::asio::error::timed_out);
    if (ec) throw IoError("failed to resolve " + host, ec);

    ec = boost::asio::error::would_block;
    boost::asio::async_connect(sock_, endpoints,
                               [&](const boost::system::error_code& e, const tcp::endpoint&) {
        ec = e;
    });
    run(timeout, [&]() {
        timed_out = true;
        boost::system::error_code ignored;
        sock_.close(ignored);
    });
    if (timed_out) {
        throw IoError("connecting to " + host + ":" + std::to_string(port) + " timed out",
                      boost::asio::error::timed_out);
    }
    if (ec) {
        boost::system::error_code ignored;
        sock_.close(ignored);
        throw IoError("failed to connect to " + host + ":" + std::to_string(port), ec);
    }

    boost::system::error_code opt_ec;
    sock_.set_option(tcp::no_delay(true), opt_ec);
    if (opt_ec) logger_.warn("failed to set TCP_NODELAY: " + opt_ec.message());
    logger_.info("connected to " + host + ":" + std::to_string(port));
}

void Connection::close() {
    if (!sock_.is_open()) return;
    boost::system::error_code ec;
    sock_.shutdown(tcp::socket::shutdown_both, ec);
    sock_.close(ec);
    if (ec) logger_.warn("error closing socket: " + ec.message());
}

bool Connection::is_open() const {
    return sock_.is_open();
}

Connection::tcp::endpoint Connection::remote_endpoint() const {
    boost::system::error_code ec;
    auto ep = sock_.remote_endpoint(ec);
    return ec ? tcp::endpoint{} : ep;
}

void Connection::write(const ber::Bytes& bytes, Duration timeout) {
    if (!sock_.is_open()) throw IoError("write on closed connection", boost::asio::error::not_connected);

    boost::system::error_code ec = boost::asio::error::would_block;
    bool timed_out = false;
    boost::asio::async_write(sock_, boost::asio::buffer(bytes),
                             [&](const boost::system::error_code& e, std::size_t) {
        ec = e;
    });
    run(timeout, [&]() {
        timed_out = true;
        boost::system::error_code ignored;
        sock_.close(ignored);
    });
    if (timed_out) throw IoError("write timed out", boost::asio::error::timed_out);
    if (ec) {
        close();
        throw IoError("write failed", ec);
    }
    logger_.debug("sent " + std::to_string(bytes.size()) + " bytes: " + to_hex(bytes, ' '));
}

ber::Bytes Connection::read_frame(Duration timeout) {
    while (true) {
        std::optional<ber::Bytes> frame;
        try {
            frame = rx_.next_frame();
        } catch (const ber::Asn1Error& e) {
            // stream position is lost, nothing after this can be trusted
            logger_.error(std::string("unframeable data from peer: ") + e.what());
            close();
            throw;
        }
        if (frame) {
            logger_.debug("received " + std::to_string(frame->size()) + " bytes: " + to_hex(*frame, ' '));
            return std::move(*frame);
        }

        if (!sock_.is_open()) throw IoError("read on closed connection", boost::asio::error::not_connected);
        boost::system::error_code ec = boost::asio::error::would_block;
        std::size_t n = 0;
        bool timed_out = false;
        sock_.async_read_some(boost::asio::buffer(rxbuf_),
                              [&](const boost::system::error_code& e, std::size_t got) {
            ec = e;
            n = got;
        });
        run(timeout, [&]() {
            timed_out = true;
            boost::system::error_code ignored;
            sock_.close(ignored);
        });
        if (timed_out) throw IoError("read timed out", boost::asio::error::timed_out);
        if (ec) {
            close();
            if (ec == boost::asio::error::eof) {
                throw IoError("connection closed by peer with " + std::to_string(rx_.buffered()) +
                              " bytes pending", ec);
            }
            throw IoError("read failed", ec);
        }
        rx_.append(rxbuf_.data(), n);
    }
}

} // namespace ldap
