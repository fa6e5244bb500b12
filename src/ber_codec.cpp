#include "ber_codec.hpp"

#include "ber_values.hpp"

#include <limits>
#include <string>
#include <utility>

namespace ber {

namespace {

// MARK: - encoding

void put_identifier(const Type& type, Bytes& out) {
    uint8_t first = static_cast<uint8_t>(class_bits(type.cls) << 6);
    if (type.structure == Structure::Constructed) first |= 0x20;
    uint64_t n = type.cls.number();
    if (type.cls.is_universal() || n <= 30) {
        out.push_back(static_cast<uint8_t>(first | n));
        return;
    }
    out.push_back(static_cast<uint8_t>(first | 0x1F));
    // base-128, most significant group first
    uint8_t groups[10];
    int count = 0;
    do {
        groups[count++] = static_cast<uint8_t>(n & 0x7F);
        n >>= 7;
    } while (n > 0);
    while (count > 0) {
        --count;
        out.push_back(static_cast<uint8_t>(groups[count] | (count > 0 ? 0x80 : 0x00)));
    }
}

void put_length(uint64_t len, Bytes& out) {
    if (len < 128) {
        out.push_back(static_cast<uint8_t>(len));
        return;
    }
    uint8_t be[8];
    int count = 0;
    while (len > 0) {
        be[count++] = static_cast<uint8_t>(len & 0xFF);
        len >>= 8;
    }
    out.push_back(static_cast<uint8_t>(0x80 | count));
    while (count > 0) out.push_back(be[--count]);
}

// MARK: - decoding

struct Header {
    Type type;
    uint64_t length;
    size_t header_size;
};

// Running out of room is a framing error inside a constructed tag and a
// truncated buffer at the top level.
[[noreturn]] void overrun(bool nested, const std::string& what) {
    throw Asn1Error(nested ? Asn1Errc::Framing : Asn1Errc::Truncated, what);
}

// Parse identifier and length octets at data[off..end). With partial_ok an
// incomplete header yields an empty optional instead of throwing.
std::optional<Header> parse_header(const uint8_t* data, size_t off, size_t end,
                                   bool nested, bool partial_ok) {
    const size_t start = off;

    if (off >= end) {
        if (partial_ok) return std::nullopt;
        overrun(nested, "missing identifier octet");
    }
    uint8_t b = data[off++];
    uint8_t cls_bits = static_cast<uint8_t>(b >> 6);
    Structure structure = structure_from_bit(static_cast<uint8_t>((b >> 5) & 0x01));
    uint64_t number = b & 0x1F;

    if (number == 0x1F) {
        number = 0;
        bool first = true;
        while (true) {
            if (off >= end) {
                if (partial_ok) return std::nullopt;
                overrun(nested, "truncated tag number");
            }
            uint8_t c = data[off++];
            if (first && (c & 0x7F) == 0) {
                throw Asn1Error(Asn1Errc::InvalidTagNumber, "tag number has a leading zero group");
            }
            first = false;
            if (number > (kMaxTagNumber >> 7)) {
                throw Asn1Error(Asn1Errc::InvalidTagNumber, "tag number exceeds 2^63-1");
            }
            number = (number << 7) | (c & 0x7F);
            if ((c & 0x80) == 0) break;
        }
        if (number <= 30) {
            throw Asn1Error(Asn1Errc::InvalidTagNumber,
                            "high tag number form used for " + std::to_string(number));
        }
    }
    Class cls = class_construct(cls_bits, number);

    if (off >= end) {
        if (partial_ok) return std::nullopt;
        overrun(nested, "missing length octet");
    }
    uint8_t l = data[off++];
    uint64_t length = 0;
    if ((l & 0x80) == 0) {
        length = l;
    } else {
        uint8_t count = l & 0x7F;
        if (count == 0) {
            throw Asn1Error(Asn1Errc::IndefiniteLength, "length octet 0x80");
        }
        if (count == 0x7F) {
            throw Asn1Error(Asn1Errc::LengthOverflow, "reserved length octet 0xFF");
        }
        if (count > 8) {
            throw Asn1Error(Asn1Errc::LengthOverflow,
                            std::to_string(count) + " length octets do not fit 64 bits");
        }
        if (end - off < count) {
            if (partial_ok) return std::nullopt;
            overrun(nested, "truncated length");
        }
        for (uint8_t i = 0; i < count; ++i) length = (length << 8) | data[off++];
    }

    return Header{Type{cls, structure}, length, off - start};
}

Decoded decode_at(const uint8_t* data, size_t off, size_t end, bool nested, int depth) {
    Header h = *parse_header(data, off, end, nested, false);
    size_t pos = off + h.header_size;
    if (h.length > end - pos) {
        overrun(nested, "payload of " + std::to_string(h.length) + " bytes exceeds " +
                        (nested ? "enclosing tag" : "buffer"));
    }
    size_t payload_end = pos + static_cast<size_t>(h.length);

    std::optional<Payload> payload;
    if (h.type.structure == Structure::Primitive) {
        payload = Payload::primitive(Bytes(data + pos, data + payload_end));
    } else {
        if (depth >= kMaxDepth) {
            throw Asn1Error(Asn1Errc::TooDeep, "more than " + std::to_string(kMaxDepth) + " levels");
        }
        std::vector<Tag> children;
        while (pos < payload_end) {
            Decoded child = decode_at(data, pos, payload_end, true, depth + 1);
            pos += child.consumed;
            children.push_back(std::move(child.tag));
        }
        payload = Payload::constructed(std::move(children));
    }

    // Sizes are rebuilt in minimal form; the wire footprint only survives
    // in consumed.
    return Decoded{build_tag(h.type.cls, std::move(*payload)), payload_end - off};
}

} // namespace

void encode_tag(const Tag& tag, Bytes& out) {
    put_identifier(tag.type(), out);
    put_length(tag.declared_length(), out);
    const size_t payload_start = out.size();
    if (tag.is_constructed()) {
        for (const auto& child : tag.children()) encode_tag(child, out);
    } else {
        const Bytes& b = tag.bytes();
        out.insert(out.end(), b.begin(), b.end());
    }
    if (out.size() - payload_start != tag.declared_length()) {
        throw std::logic_error("BER: payload size disagrees with declared length");
    }
}

Bytes encode_tag(const Tag& tag) {
    Bytes out;
    out.reserve(static_cast<size_t>(tag.total_size()));
    encode_tag(tag, out);
    return out;
}

Bytes encode(const Tag& op, int64_t message_id) {
    std::vector<Tag> items;
    items.push_back(make_integer(message_id));
    items.push_back(op);
    return encode_tag(make_sequence(std::move(items)));
}

Decoded decode(const uint8_t* data, size_t len) {
    return decode_at(data, 0, len, false, 0);
}

Decoded decode(const Bytes& in) {
    return decode(in.data(), in.size());
}

Message decode_message(const Bytes& in) {
    Decoded d = decode(in);
    if (d.consumed != in.size()) {
        throw Asn1Error(Asn1Errc::TrailingBytes,
                        std::to_string(in.size() - d.consumed) + " bytes after message");
    }
    const Tag& env = d.tag;
    if (!env.cls().is(UniversalType::Sequence) || !env.is_constructed()) {
        throw Asn1Error(Asn1Errc::InvalidEnvelope, "message is not a SEQUENCE");
    }
    const auto& items = env.children();
    if (items.size() < 2 || items.size() > 3) {
        throw Asn1Error(Asn1Errc::InvalidEnvelope,
                        "message has " + std::to_string(items.size()) + " elements");
    }
    const Tag& id = items[0];
    if (!id.cls().is(UniversalType::Integer) || id.is_constructed()) {
        throw Asn1Error(Asn1Errc::InvalidEnvelope, "message id is not an INTEGER");
    }
    std::optional<Tag> controls;
    if (items.size() == 3) {
        if (items[2].cls() != Class::context_specific(0) || !items[2].is_constructed()) {
            throw Asn1Error(Asn1Errc::InvalidEnvelope, "third element is not [0] Controls");
        }
        controls = items[2];
    }
    return Message{read_integer(id), items[1], std::move(controls)};
}

std::optional<size_t> frame_size(const uint8_t* data, size_t len) {
    std::optional<Header> h = parse_header(data, 0, len, false, true);
    if (!h) return std::nullopt;
    if (h->length > std::numeric_limits<size_t>::max() - h->header_size) {
        throw Asn1Error(Asn1Errc::LengthOverflow, "frame size exceeds address space");
    }
    return h->header_size + static_cast<size_t>(h->length);
}

} // namespace ber
