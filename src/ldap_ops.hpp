#pragma once

#include <cstdint>
#include <string>

#include "ber_tag.hpp"

namespace ldap {

static constexpr int64_t kProtocolVersion = 3;

// [APPLICATION n] numbers of the LDAPv3 protocol operations (RFC 4511).
enum class Op : uint8_t {
    BIND_REQUEST = 0,
    BIND_RESPONSE = 1,
    UNBIND_REQUEST = 2,
    SEARCH_REQUEST = 3,
    SEARCH_RESULT_ENTRY = 4,
    SEARCH_RESULT_DONE = 5,
    MODIFY_REQUEST = 6,
    MODIFY_RESPONSE = 7,
    ADD_REQUEST = 8,
    ADD_RESPONSE = 9,
    DEL_REQUEST = 10,
    DEL_RESPONSE = 11,
    MODIFY_DN_REQUEST = 12,
    MODIFY_DN_RESPONSE = 13,
    COMPARE_REQUEST = 14,
    COMPARE_RESPONSE = 15,
    ABANDON_REQUEST = 16,
    SEARCH_RESULT_REFERENCE = 19,
    EXTENDED_REQUEST = 23,
    EXTENDED_RESPONSE = 24,
    INTERMEDIATE_RESPONSE = 25
};

bool is_op(const ber::Tag& tag, Op op);

// BindRequest ::= [APPLICATION 0] SEQUENCE {
//      version INTEGER, name LDAPDN, authentication [0] simple OCTET STRING }
ber::Tag make_simple_bind_request(const std::string& dn, const std::string& password,
                                  int64_t version = kProtocolVersion);

// UnbindRequest ::= [APPLICATION 2] NULL
ber::Tag make_unbind_request();

struct LdapResult {
    int64_t result_code = 0;
    std::string matched_dn;
    std::string diagnostic_message;

    bool ok() const { return result_code == 0; }
};

// Reads the LDAPResult fields that lead every response operation.
// Throws ber::Asn1Error(InvalidValue) if the tag does not have that shape.
LdapResult read_result(const ber::Tag& op);

const char* result_code_name(int64_t code);

} // namespace ldap
