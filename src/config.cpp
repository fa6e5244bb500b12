#include "config.hpp"

#include "logger.hpp"
#include "util.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

namespace {

bool parse_bool(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

// std::stoul happily wraps "-1" and ignores trailing garbage
unsigned long parse_unsigned(const std::string& s, unsigned long max) {
    if (s.empty() || s[0] == '-' || s[0] == '+') throw std::invalid_argument("not an unsigned number");
    size_t used = 0;
    unsigned long v = std::stoul(s, &used, 0);
    if (used != s.size()) throw std::invalid_argument("trailing characters");
    if (v > max) throw std::out_of_range("value too large");
    return v;
}

} // namespace

bool load_config(const std::string& path, Config& out, std::string& err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        err = "failed to open config: " + path;
        return false;
    }

    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty()) continue;
        if (line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            err = "bad config line " + std::to_string(lineno) + ": missing '='";
            return false;
        }
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (key.empty()) continue;

        try {
            if (key == "host") out.host = val;
            else if (key == "port") out.port = static_cast<uint16_t>(parse_unsigned(val, 0xFFFF));
            else if (key == "connect_timeout_ms") {
                out.connect_timeout_ms = static_cast<uint32_t>(parse_unsigned(val, 0xFFFFFFFFul));
            }
            else if (key == "io_timeout_ms") {
                out.io_timeout_ms = static_cast<uint32_t>(parse_unsigned(val, 0xFFFFFFFFul));
            }
            else if (key == "max_message_size") {
                out.max_message_size = static_cast<size_t>(
                    parse_unsigned(val, std::numeric_limits<unsigned long>::max()));
            }
            else if (key == "bind_dn") out.bind_dn = val;
            else if (key == "bind_password") out.bind_password = val;
            else if (key == "log_file") out.log_file = val;
            else if (key == "log_level") {
                LogLevel lvl;
                if (!parse_log_level(val, lvl)) {
                    err = "bad config value at line " + std::to_string(lineno) + ": invalid log level";
                    return false;
                }
                out.log_level = val;
            }
            else if (key == "log_to_stderr") {
                bool b = false;
                if (!parse_bool(val, b)) {
                    err = "bad config value at line " + std::to_string(lineno) + ": invalid bool";
                    return false;
                }
                out.log_to_stderr = b;
            }
            else {
                err = "unknown config key at line " + std::to_string(lineno) + ": " + key;
                return false;
            }
        } catch (const std::exception& e) {
            err = "bad config value at line " + std::to_string(lineno) + ": " + e.what();
            return false;
        }
    }

    if (out.host.empty()) {
        err = "host must not be empty";
        return false;
    }
    if (out.port == 0) {
        err = "port must be non-zero";
        return false;
    }
    if (out.connect_timeout_ms == 0 || out.io_timeout_ms == 0) {
        err = "timeouts must be non-zero";
        return false;
    }
    if (out.max_message_size == 0) {
        err = "max_message_size must be non-zero";
        return false;
    }
    return true;
}
