#include "ber_values.hpp"

#include <utility>

namespace ber {

Bytes integer_content(int64_t v) {
    const uint64_t u = static_cast<uint64_t>(v);
    Bytes out;
    bool started = false;
    int shift = 56;
    while (shift > 0) {
        uint8_t byte = static_cast<uint8_t>((u >> shift) & 0xFF);
        uint8_t next = static_cast<uint8_t>((u >> (shift - 8)) & 0xFF);
        // skip octets that only repeat the sign of the following one
        if (!started &&
            ((byte == 0x00 && (next & 0x80) == 0) || (byte == 0xFF && (next & 0x80) != 0))) {
            shift -= 8;
            continue;
        }
        started = true;
        out.push_back(byte);
        shift -= 8;
    }
    out.push_back(static_cast<uint8_t>(u & 0xFF));
    return out;
}

int64_t integer_from_content(const Bytes& content) {
    if (content.empty()) throw Asn1Error(Asn1Errc::InvalidValue, "empty integer");
    if (content.size() > 8) {
        throw Asn1Error(Asn1Errc::InvalidValue,
                        "integer of " + std::to_string(content.size()) + " octets");
    }
    uint64_t u = (content[0] & 0x80) ? ~0ull : 0ull;
    for (uint8_t b : content) u = (u << 8) | b;
    return static_cast<int64_t>(u);
}

Tag make_integer(int64_t v) {
    return build_tag(Class::universal(UniversalType::Integer), Payload::primitive(integer_content(v)));
}

Tag make_enumerated(int64_t v) {
    return build_tag(Class::universal(UniversalType::Enumerated), Payload::primitive(integer_content(v)));
}

Tag make_boolean(bool v) {
    return build_tag(Class::universal(UniversalType::Boolean),
                     Payload::primitive(Bytes{static_cast<uint8_t>(v ? 0xFF : 0x00)}));
}

Tag make_octet_string(const std::string& s) {
    return make_octet_string(Bytes(s.begin(), s.end()));
}

Tag make_octet_string(const Bytes& b) {
    return build_tag(Class::universal(UniversalType::OctetString), Payload::primitive(b));
}

Tag make_null() {
    return build_tag(Class::universal(UniversalType::Null), Payload::primitive(Bytes{}));
}

Tag make_sequence(std::vector<Tag> items) {
    return build_tag(Class::universal(UniversalType::Sequence), Payload::constructed(std::move(items)));
}

Tag make_set(std::vector<Tag> items) {
    return build_tag(Class::universal(UniversalType::Set), Payload::constructed(std::move(items)));
}

Tag make_context(uint64_t number, Bytes content) {
    return build_tag(Class::context_specific(number), Payload::primitive(std::move(content)));
}

Tag make_context(uint64_t number, std::vector<Tag> items) {
    return build_tag(Class::context_specific(number), Payload::constructed(std::move(items)));
}

Tag make_application(uint64_t number, Bytes content) {
    return build_tag(Class::application(number), Payload::primitive(std::move(content)));
}

Tag make_application(uint64_t number, std::vector<Tag> items) {
    return build_tag(Class::application(number), Payload::constructed(std::move(items)));
}

namespace {

const Bytes& primitive_content(const Tag& t, const char* what) {
    if (t.is_constructed()) {
        throw Asn1Error(Asn1Errc::InvalidValue, std::string(what) + " is constructed");
    }
    return t.bytes();
}

} // namespace

int64_t read_integer(const Tag& t) {
    if (!t.cls().is(UniversalType::Integer)) {
        throw Asn1Error(Asn1Errc::InvalidValue, "expected INTEGER, got " + to_string(t.cls()));
    }
    return integer_from_content(primitive_content(t, "INTEGER"));
}

int64_t read_enumerated(const Tag& t) {
    if (!t.cls().is(UniversalType::Enumerated)) {
        throw Asn1Error(Asn1Errc::InvalidValue, "expected ENUMERATED, got " + to_string(t.cls()));
    }
    return integer_from_content(primitive_content(t, "ENUMERATED"));
}

bool read_boolean(const Tag& t) {
    const Bytes& b = primitive_content(t, "BOOLEAN");
    if (b.size() != 1) {
        throw Asn1Error(Asn1Errc::InvalidValue, "BOOLEAN of " + std::to_string(b.size()) + " octets");
    }
    return b[0] != 0;
}

std::string read_octet_string(const Tag& t) {
    const Bytes& b = primitive_content(t, "OCTET STRING");
    return std::string(b.begin(), b.end());
}

} // namespace ber
