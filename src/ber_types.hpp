#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace ber {

using Bytes = std::vector<uint8_t>;

// Reasons an input is not acceptable BER (or not an acceptable LDAP envelope).
enum class Asn1Errc {
    InvalidClass,
    InvalidUniversalType,
    InvalidTagNumber,
    Truncated,
    IndefiniteLength,
    LengthOverflow,
    Framing,
    TooDeep,
    InvalidEnvelope,
    InvalidValue,
    TrailingBytes,
    MessageTooLarge
};

const char* to_string(Asn1Errc reason);

class Asn1Error : public std::runtime_error {
public:
    Asn1Error(Asn1Errc reason, const std::string& what);

    Asn1Errc reason() const { return reason_; }

private:
    Asn1Errc reason_;
};

// X.690 universal tag numbers. 14, 15 are unassigned and 31 is the
// high-tag-number escape, so none of them has an enumerator.
enum class UniversalType : uint8_t {
    Eoc = 0,
    Boolean = 1,
    Integer = 2,
    BitString = 3,
    OctetString = 4,
    Null = 5,
    ObjectIdentifier = 6,
    ObjectDescriptor = 7,
    External = 8,
    Real = 9,
    Enumerated = 10,
    EmbeddedPdv = 11,
    Utf8String = 12,
    RelativeOid = 13,
    Sequence = 16,
    Set = 17,
    NumericString = 18,
    PrintableString = 19,
    T61String = 20,
    VideotexString = 21,
    Ia5String = 22,
    UtcTime = 23,
    GeneralizedTime = 24,
    GraphicString = 25,
    VisibleString = 26,
    GeneralString = 27,
    UniversalString = 28,
    CharacterString = 29,
    BmpString = 30
};

UniversalType universal_type_from_code(uint8_t code);
inline uint8_t to_code(UniversalType t) { return static_cast<uint8_t>(t); }
const char* to_string(UniversalType t);

// Two-bit class selector, as found in bits 7-6 of the identifier octet.
enum class ClassNumber : uint8_t {
    Universal = 0,
    Application = 1,
    ContextSpecific = 2,
    Private = 3
};

static constexpr uint64_t kMaxTagNumber = 0x7FFFFFFFFFFFFFFFull;

// Tag class with its number. Universal tags carry a UniversalType, the
// other three carry a free tag number. Build through the named factories.
class Class {
public:
    static Class universal(UniversalType t);
    static Class application(uint64_t number);
    static Class context_specific(uint64_t number);
    static Class priv(uint64_t number);

    ClassNumber kind() const { return kind_; }
    bool is_universal() const { return kind_ == ClassNumber::Universal; }
    bool is(UniversalType t) const { return is_universal() && number_ == to_code(t); }

    // Only meaningful for universal tags; throws std::logic_error otherwise.
    UniversalType universal_type() const;

    uint64_t number() const { return number_; }

    bool operator==(const Class& o) const { return kind_ == o.kind_ && number_ == o.number_; }
    bool operator!=(const Class& o) const { return !(*this == o); }

private:
    Class(ClassNumber kind, uint64_t number) : kind_(kind), number_(number) {}

    ClassNumber kind_;
    uint64_t number_;
};

Class class_construct(uint8_t class_bits, uint64_t number);
inline uint8_t class_bits(const Class& c) { return static_cast<uint8_t>(c.kind()); }
std::string to_string(const Class& c);

enum class Structure : uint8_t {
    Primitive = 0,
    Constructed = 1
};

Structure structure_from_bit(uint8_t bit);

struct Type {
    Class cls;
    Structure structure;

    bool operator==(const Type& o) const { return cls == o.cls && structure == o.structure; }
    bool operator!=(const Type& o) const { return !(*this == o); }
};

} // namespace ber
