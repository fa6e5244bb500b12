#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "ber_tag.hpp"

namespace ber {

// Deepest constructed nesting accepted from the wire.
static constexpr int kMaxDepth = 64;

// Serialize one tag (identifier, length, payload; children depth-first).
Bytes encode_tag(const Tag& tag);
void encode_tag(const Tag& tag, Bytes& out);

// LDAP envelope: SEQUENCE { INTEGER message_id, op }
Bytes encode(const Tag& op, int64_t message_id);

struct Decoded {
    Tag tag;
    size_t consumed = 0; // bytes taken from the front of the buffer
};

// Decode the first TLV of the buffer. Bytes after it are not touched.
// Throws Asn1Error on anything malformed or incomplete.
Decoded decode(const uint8_t* data, size_t len);
Decoded decode(const Bytes& in);

struct Message {
    int64_t message_id = 0;
    Tag op;
    std::optional<Tag> controls; // [0] Controls, when the peer sent any
};

// Decode a complete envelope. The buffer must hold exactly one message.
Message decode_message(const Bytes& in);

// Size of the first TLV judging by its identifier and length octets only.
// Empty optional when the header itself is not complete yet.
std::optional<size_t> frame_size(const uint8_t* data, size_t len);

} // namespace ber
