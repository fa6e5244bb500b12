#include "ldap_ops.hpp"

#include "ber_values.hpp"

#include <string>
#include <utility>
#include <vector>

namespace ldap {

bool is_op(const ber::Tag& tag, Op op) {
    return tag.cls() == ber::Class::application(static_cast<uint64_t>(op));
}

ber::Tag make_simple_bind_request(const std::string& dn, const std::string& password, int64_t version) {
    std::vector<ber::Tag> items;
    items.push_back(ber::make_integer(version));
    items.push_back(ber::make_octet_string(dn));
    items.push_back(ber::make_context(0, ber::Bytes(password.begin(), password.end())));
    return ber::make_application(static_cast<uint64_t>(Op::BIND_REQUEST), std::move(items));
}

ber::Tag make_unbind_request() {
    return ber::make_application(static_cast<uint64_t>(Op::UNBIND_REQUEST), ber::Bytes{});
}

LdapResult read_result(const ber::Tag& op) {
    if (op.cls().kind() != ber::ClassNumber::Application || !op.is_constructed()) {
        throw ber::Asn1Error(ber::Asn1Errc::InvalidValue,
                             "response is not a constructed application tag: " + ber::to_string(op.cls()));
    }
    const auto& items = op.children();
    if (items.size() < 3) {
        throw ber::Asn1Error(ber::Asn1Errc::InvalidValue,
                             "LDAPResult needs 3 elements, got " + std::to_string(items.size()));
    }
    LdapResult r;
    r.result_code = ber::read_enumerated(items[0]);
    r.matched_dn = ber::read_octet_string(items[1]);
    r.diagnostic_message = ber::read_octet_string(items[2]);
    return r;
}

const char* result_code_name(int64_t code) {
    switch (code) {
        case 0:  return "success";
        case 1:  return "operationsError";
        case 2:  return "protocolError";
        case 3:  return "timeLimitExceeded";
        case 4:  return "sizeLimitExceeded";
        case 5:  return "compareFalse";
        case 6:  return "compareTrue";
        case 7:  return "authMethodNotSupported";
        case 8:  return "strongerAuthRequired";
        case 10: return "referral";
        case 11: return "adminLimitExceeded";
        case 12: return "unavailableCriticalExtension";
        case 13: return "confidentialityRequired";
        case 14: return "saslBindInProgress";
        case 16: return "noSuchAttribute";
        case 17: return "undefinedAttributeType";
        case 18: return "inappropriateMatching";
        case 19: return "constraintViolation";
        case 20: return "attributeOrValueExists";
        case 21: return "invalidAttributeSyntax";
        case 32: return "noSuchObject";
        case 33: return "aliasProblem";
        case 34: return "invalidDNSyntax";
        case 36: return "aliasDereferencingProblem";
        case 48: return "inappropriateAuthentication";
        case 49: return "invalidCredentials";
        case 50: return "insufficientAccessRights";
        case 51: return "busy";
        case 52: return "unavailable";
        case 53: return "unwillingToPerform";
        case 54: return "loopDetect";
        case 64: return "namingViolation";
        case 65: return "objectClassViolation";
        case 66: return "notAllowedOnNonLeaf";
        case 67: return "notAllowedOnRDN";
        case 68: return "entryAlreadyExists";
        case 69: return "objectClassModsProhibited";
        case 71: return "affectsMultipleDSAs";
        case 80: return "other";
        default: return "unknown";
    }
}

} // namespace ldap
