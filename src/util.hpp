#pragma once
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

inline std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
    return s.substr(a, b-a);
}

// Lower case hex, optional separator between octets.
inline std::string to_hex(const uint8_t* data, size_t n, char sep = 0) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(n * (sep ? 3 : 2));
    for (size_t i = 0; i < n; ++i) {
        if (sep && i > 0) out.push_back(sep);
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

inline std::string to_hex(const std::vector<uint8_t>& b, char sep = 0) {
    return to_hex(b.data(), b.size(), sep);
}

// Accepts upper/lower case digits; whitespace and ':' between octets are ignored.
inline std::optional<std::vector<uint8_t>> from_hex(const std::string& s) {
    std::vector<uint8_t> out;
    int hi = -1;
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c) || c == ':') {
            if (hi >= 0) return std::nullopt;
            continue;
        }
        if (!std::isxdigit(c)) return std::nullopt;
        int v = std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10;
        if (hi < 0) {
            hi = v;
        } else {
            out.push_back(static_cast<uint8_t>((hi << 4) | v));
            hi = -1;
        }
    }
    if (hi >= 0) return std::nullopt;
    return out;
}
