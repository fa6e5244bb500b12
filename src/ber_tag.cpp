#include "ber_tag.hpp"

#include <utility>

namespace ber {

Payload Payload::primitive(Bytes bytes) {
    Payload p(Structure::Primitive);
    p.bytes_ = std::move(bytes);
    return p;
}

Payload Payload::constructed(std::vector<Tag> children) {
    Payload p(Structure::Constructed);
    p.children_ = std::move(children);
    return p;
}

const Bytes& Payload::bytes() const {
    if (structure_ != Structure::Primitive) throw std::logic_error("bytes() on constructed payload");
    return bytes_;
}

const std::vector<Tag>& Payload::children() const {
    if (structure_ != Structure::Constructed) throw std::logic_error("children() on primitive payload");
    return children_;
}

uint64_t Payload::length() const {
    if (structure_ == Structure::Primitive) return bytes_.size();
    uint64_t len = 0;
    for (const auto& child : children_) len += child.total_size();
    return len;
}

bool Payload::operator==(const Payload& o) const {
    if (structure_ != o.structure_) return false;
    if (structure_ == Structure::Primitive) return bytes_ == o.bytes_;
    return children_ == o.children_;
}

Tag::Tag(Type type, uint64_t declared_length, Payload payload, uint64_t total_size)
    : type_(type),
      declared_length_(declared_length),
      payload_(std::move(payload)),
      total_size_(total_size) {}

bool Tag::operator==(const Tag& o) const {
    return type_ == o.type_ &&
           declared_length_ == o.declared_length_ &&
           total_size_ == o.total_size_ &&
           payload_ == o.payload_;
}

uint64_t identifier_size(const Class& c) {
    if (c.is_universal()) return 1;
    uint64_t n = c.number();
    if (n <= 30) return 1;
    uint64_t len = 1;
    while (n > 0) {
        ++len;
        n >>= 7;
    }
    return len;
}

uint64_t length_field_size(uint64_t payload_length) {
    if (payload_length < 128) return 1;
    uint64_t len = 1;
    while (payload_length > 0) {
        ++len;
        payload_length >>= 8;
    }
    return len;
}

uint64_t compute_tag_size(const Type& type, uint64_t payload_length) {
    return identifier_size(type.cls) + length_field_size(payload_length) + payload_length;
}

Tag build_tag(const Class& cls, Payload payload) {
    if (cls.number() > kMaxTagNumber) {
        throw std::invalid_argument("tag number exceeds 2^63-1");
    }
    Type type{cls, payload.structure()};
    uint64_t len = payload.length();
    uint64_t size = compute_tag_size(type, len);
    return Tag(type, len, std::move(payload), size);
}

} // namespace ber
