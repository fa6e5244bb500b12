#include "ber_dump.hpp"

#include "util.hpp"

#include <sstream>

namespace ber {

namespace {

static constexpr size_t kMaxDumpBytes = 32;

void dump_into(std::ostringstream& oss, const Tag& tag, int indent) {
    oss << std::string(static_cast<size_t>(indent), ' ')
        << to_string(tag.cls())
        << (tag.is_constructed() ? " [C]" : " [P]")
        << " len=" << tag.declared_length();
    if (tag.is_constructed()) {
        oss << "\n";
        for (const auto& child : tag.children()) dump_into(oss, child, indent + 2);
        return;
    }
    const Bytes& b = tag.bytes();
    if (!b.empty()) {
        size_t n = b.size() > kMaxDumpBytes ? kMaxDumpBytes : b.size();
        oss << " : " << to_hex(b.data(), n, ' ');
        if (n < b.size()) oss << " ...";
    }
    oss << "\n";
}

} // namespace

std::string dump(const Tag& tag, int indent) {
    std::ostringstream oss;
    dump_into(oss, tag, indent);
    return oss.str();
}

} // namespace ber
