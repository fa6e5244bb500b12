#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "ber_types.hpp"

namespace ber {

class Tag;

// Content of a tag: raw bytes (primitive) or child tags (constructed).
// The structure is fixed by the factory used and cannot diverge from the
// stored variant.
class Payload {
public:
    static Payload primitive(Bytes bytes);
    static Payload constructed(std::vector<Tag> children);

    Structure structure() const { return structure_; }
    bool is_constructed() const { return structure_ == Structure::Constructed; }

    // Throw std::logic_error when asked for the other variant.
    const Bytes& bytes() const;
    const std::vector<Tag>& children() const;

    // Primitive: byte count. Constructed: sum of the children's total sizes.
    uint64_t length() const;

    bool operator==(const Payload& o) const;
    bool operator!=(const Payload& o) const { return !(*this == o); }

private:
    explicit Payload(Structure s) : structure_(s) {}

    Structure structure_;
    Bytes bytes_;
    std::vector<Tag> children_;
};

class Tag {
public:
    const Type& type() const { return type_; }
    const Class& cls() const { return type_.cls; }
    bool is_constructed() const { return type_.structure == Structure::Constructed; }

    // Payload length as written in the length field.
    uint64_t declared_length() const { return declared_length_; }
    const Payload& payload() const { return payload_; }
    // Full footprint: identifier + length field + payload.
    uint64_t total_size() const { return total_size_; }

    const Bytes& bytes() const { return payload_.bytes(); }
    const std::vector<Tag>& children() const { return payload_.children(); }

    bool operator==(const Tag& o) const;
    bool operator!=(const Tag& o) const { return !(*this == o); }

private:
    friend Tag build_tag(const Class& cls, Payload payload);

    Tag(Type type, uint64_t declared_length, Payload payload, uint64_t total_size);

    Type type_;
    uint64_t declared_length_;
    Payload payload_;
    uint64_t total_size_;
};

// Octets taken by the identifier of a tag of class c.
uint64_t identifier_size(const Class& c);
// Octets taken by the length field for a payload of the given length.
uint64_t length_field_size(uint64_t payload_length);
// Total encoded size of a tag with the given type and payload length.
uint64_t compute_tag_size(const Type& type, uint64_t payload_length);

// The only way to make a Tag; the decoder uses it as well.
Tag build_tag(const Class& cls, Payload payload);

} // namespace ber
