#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    // Server
    std::string host = "127.0.0.1";
    uint16_t port = 389;

    // Timeouts
    uint32_t connect_timeout_ms = 5000;
    uint32_t io_timeout_ms = 10000;

    // Largest message accepted from the server
    size_t max_message_size = 1024 * 1024;

    // Simple bind (empty dn and password: anonymous)
    std::string bind_dn;
    std::string bind_password;

    // Logging
    std::string log_file = "ldapber.log";
    std::string log_level = "info";
    bool log_to_stderr = false;
};

bool load_config(const std::string& path, Config& out, std::string& err);
