#include "ber_types.hpp"

namespace ber {

const char* to_string(Asn1Errc reason) {
    switch (reason) {
        case Asn1Errc::InvalidClass:         return "invalid class";
        case Asn1Errc::InvalidUniversalType: return "invalid universal type";
        case Asn1Errc::InvalidTagNumber:     return "invalid tag number";
        case Asn1Errc::Truncated:            return "truncated";
        case Asn1Errc::IndefiniteLength:     return "indefinite length not supported";
        case Asn1Errc::LengthOverflow:       return "length overflow";
        case Asn1Errc::Framing:              return "framing error";
        case Asn1Errc::TooDeep:              return "nesting too deep";
        case Asn1Errc::InvalidEnvelope:      return "invalid message envelope";
        case Asn1Errc::InvalidValue:         return "invalid value";
        case Asn1Errc::TrailingBytes:        return "trailing bytes";
        case Asn1Errc::MessageTooLarge:      return "message too large";
    }
    return "?";
}

Asn1Error::Asn1Error(Asn1Errc reason, const std::string& what)
    : std::runtime_error(std::string("BER: ") + to_string(reason) + ": " + what),
      reason_(reason) {}

UniversalType universal_type_from_code(uint8_t code) {
    if (code <= 13 || (code >= 16 && code <= 30)) {
        return static_cast<UniversalType>(code);
    }
    throw Asn1Error(Asn1Errc::InvalidUniversalType,
                    "code " + std::to_string(code) + " is not a universal type");
}

const char* to_string(UniversalType t) {
    switch (t) {
        case UniversalType::Eoc:              return "EOC";
        case UniversalType::Boolean:          return "BOOLEAN";
        case UniversalType::Integer:          return "INTEGER";
        case UniversalType::BitString:        return "BIT STRING";
        case UniversalType::OctetString:      return "OCTET STRING";
        case UniversalType::Null:             return "NULL";
        case UniversalType::ObjectIdentifier: return "OBJECT IDENTIFIER";
        case UniversalType::ObjectDescriptor: return "ObjectDescriptor";
        case UniversalType::External:         return "EXTERNAL";
        case UniversalType::Real:             return "REAL";
        case UniversalType::Enumerated:       return "ENUMERATED";
        case UniversalType::EmbeddedPdv:      return "EMBEDDED PDV";
        case UniversalType::Utf8String:       return "UTF8String";
        case UniversalType::RelativeOid:      return "RELATIVE-OID";
        case UniversalType::Sequence:         return "SEQUENCE";
        case UniversalType::Set:              return "SET";
        case UniversalType::NumericString:    return "NumericString";
        case UniversalType::PrintableString:  return "PrintableString";
        case UniversalType::T61String:        return "T61String";
        case UniversalType::VideotexString:   return "VideotexString";
        case UniversalType::Ia5String:        return "IA5String";
        case UniversalType::UtcTime:          return "UTCTime";
        case UniversalType::GeneralizedTime:  return "GeneralizedTime";
        case UniversalType::GraphicString:    return "GraphicString";
        case UniversalType::VisibleString:    return "VisibleString";
        case UniversalType::GeneralString:    return "GeneralString";
        case UniversalType::UniversalString:  return "UniversalString";
        case UniversalType::CharacterString:  return "CHARACTER STRING";
        case UniversalType::BmpString:        return "BMPString";
    }
    return "?";
}

Class Class::universal(UniversalType t) {
    return Class(ClassNumber::Universal, to_code(t));
}

Class Class::application(uint64_t number) {
    return Class(ClassNumber::Application, number);
}

Class Class::context_specific(uint64_t number) {
    return Class(ClassNumber::ContextSpecific, number);
}

Class Class::priv(uint64_t number) {
    return Class(ClassNumber::Private, number);
}

UniversalType Class::universal_type() const {
    if (!is_universal()) throw std::logic_error("universal_type() on non-universal class");
    return static_cast<UniversalType>(number_);
}

Class class_construct(uint8_t class_bits, uint64_t number) {
    switch (class_bits) {
        case 0:
            if (number > 0xFF) {
                throw Asn1Error(Asn1Errc::InvalidUniversalType,
                                "code " + std::to_string(number) + " is not a universal type");
            }
            return Class::universal(universal_type_from_code(static_cast<uint8_t>(number)));
        case 1: return Class::application(number);
        case 2: return Class::context_specific(number);
        case 3: return Class::priv(number);
        default: break;
    }
    throw Asn1Error(Asn1Errc::InvalidClass, "class selector " + std::to_string(class_bits));
}

std::string to_string(const Class& c) {
    switch (c.kind()) {
        case ClassNumber::Universal:       return to_string(c.universal_type());
        case ClassNumber::Application:     return "[APPLICATION " + std::to_string(c.number()) + "]";
        case ClassNumber::ContextSpecific: return "[" + std::to_string(c.number()) + "]";
        case ClassNumber::Private:         return "[PRIVATE " + std::to_string(c.number()) + "]";
    }
    return "?";
}

Structure structure_from_bit(uint8_t bit) {
    if (bit == 0) return Structure::Primitive;
    if (bit == 1) return Structure::Constructed;
    throw std::invalid_argument("structure bit must be 0 or 1");
}

} // namespace ber
