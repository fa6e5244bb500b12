#include <iostream>
#include <string>

#include "ber_codec.hpp"
#include "ber_dump.hpp"
#include "client.hpp"
#include "config.hpp"
#include "ldap_ops.hpp"
#include "logger.hpp"
#include "util.hpp"

namespace {

void usage(const char* argv0) {
    std::cout << "Usage:\n";
    std::cout << "  " << argv0 << " <config_path>      simple bind against the configured server\n";
    std::cout << "  " << argv0 << " --dump <hex>       decode one BER element and print its tree\n";
}

int run_dump(const std::string& hex) {
    auto bytes = from_hex(hex);
    if (!bytes) {
        std::cerr << "invalid hex input\n";
        return 2;
    }
    try {
        ber::Decoded d = ber::decode(*bytes);
        std::cout << ber::dump(d.tag);
        if (d.consumed < bytes->size()) {
            std::cout << "(" << (bytes->size() - d.consumed) << " trailing bytes not decoded)\n";
        }
    } catch (const ber::Asn1Error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    return 0;
}

int run_bind(const Config& cfg, Logger& logger) {
    ldap::Client client(cfg, logger);
    try {
        client.connect();
        int32_t id = client.send(ldap::make_simple_bind_request(cfg.bind_dn, cfg.bind_password));
        ber::Message resp = client.recv();
        if (resp.message_id != id) {
            logger.warn("response id " + std::to_string(resp.message_id) +
                        " does not match request id " + std::to_string(id));
        }
        std::cout << ber::dump(resp.op);
        if (!ldap::is_op(resp.op, ldap::Op::BIND_RESPONSE)) {
            std::cerr << "unexpected response " << ber::to_string(resp.op.cls()) << "\n";
            return 1;
        }
        ldap::LdapResult r = ldap::read_result(resp.op);
        std::cout << "bind result: " << r.result_code << " (" << ldap::result_code_name(r.result_code) << ")";
        if (!r.diagnostic_message.empty()) std::cout << " " << r.diagnostic_message;
        std::cout << "\n";

        client.send(ldap::make_unbind_request());
        client.close();
        return r.ok() ? 0 : 1;
    } catch (const ldap::IoError& e) {
        logger.error(e.what());
        std::cerr << e.what() << "\n";
    } catch (const ber::Asn1Error& e) {
        logger.error(e.what());
        std::cerr << e.what() << "\n";
    }
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    if (argc == 3 && std::string(argv[1]) == "--dump") {
        return run_dump(argv[2]);
    }
    if (argc != 2) {
        usage(argv[0]);
        return 2;
    }

    Config cfg;
    std::string err;
    if (!load_config(argv[1], cfg, err)) {
        std::cerr << err << "\n";
        return 2;
    }

    LogLevel lvl = LogLevel::INFO;
    if (!parse_log_level(cfg.log_level, lvl)) {
        std::cerr << "invalid log_level: " << cfg.log_level << "\n";
        return 2;
    }
    Logger logger(cfg.log_file, lvl);
    logger.set_stderr(cfg.log_to_stderr);

    return run_bind(cfg, logger);
}
