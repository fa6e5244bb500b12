#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ber_tag.hpp"

namespace ber {

// Builders for the universal primitives LDAP uses.
Tag make_integer(int64_t v);
Tag make_enumerated(int64_t v);
Tag make_boolean(bool v);
Tag make_octet_string(const std::string& s);
Tag make_octet_string(const Bytes& b);
Tag make_null();

Tag make_sequence(std::vector<Tag> items);
Tag make_set(std::vector<Tag> items);

// Implicitly tagged values: primitive with raw content, or constructed.
Tag make_context(uint64_t number, Bytes content);
Tag make_context(uint64_t number, std::vector<Tag> items);
Tag make_application(uint64_t number, Bytes content);
Tag make_application(uint64_t number, std::vector<Tag> items);

// Readers. All throw Asn1Error(InvalidValue) when the tag is constructed or
// its content is not a valid encoding. read_integer/read_enumerated also
// check the universal type; the others only look at the content so they
// work on implicitly tagged values as well.
int64_t read_integer(const Tag& t);
int64_t read_enumerated(const Tag& t);
bool read_boolean(const Tag& t);
std::string read_octet_string(const Tag& t);

// Minimal two's complement content octets of v.
Bytes integer_content(int64_t v);
int64_t integer_from_content(const Bytes& content);

} // namespace ber
