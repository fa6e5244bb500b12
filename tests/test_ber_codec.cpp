#include <catch2/catch.hpp>

#include "ber_codec.hpp"
#include "ber_values.hpp"

using namespace ber;

namespace {

Asn1Errc decode_failure(const Bytes& in) {
    try {
        decode(in);
    } catch (const Asn1Error& e) {
        return e.reason();
    }
    FAIL("decode accepted malformed input");
    return Asn1Errc::InvalidValue;
}

} // namespace

TEST_CASE("low tag numbers sit in the identifier octet", "[ber][encode]") {
    Bytes b = encode_tag(make_application(30, Bytes{}));
    REQUIRE(b == Bytes{0x5E, 0x00});

    b = encode_tag(make_context(3, std::vector<Tag>{}));
    REQUIRE(b == Bytes{0xA3, 0x00});

    b = encode_tag(build_tag(Class::priv(1), Payload::primitive(Bytes{0x01})));
    REQUIRE(b == Bytes{0xC1, 0x01, 0x01});
}

TEST_CASE("tag number 31 and above uses the escape", "[ber][encode]") {
    Tag t31 = make_application(31, Bytes{});
    Bytes b = encode_tag(t31);
    REQUIRE(b == Bytes{0x5F, 0x1F, 0x00});
    REQUIRE(b.size() == t31.total_size());

    Tag t200 = make_context(200, Bytes{0xAA});
    b = encode_tag(t200);
    // 200 = 0b1_1001000 -> 0x81 0x48
    REQUIRE(b == Bytes{0x9F, 0x81, 0x48, 0x01, 0xAA});
    REQUIRE(b.size() == t200.total_size());

    REQUIRE(decode(b).tag == t200);
}

TEST_CASE("long form length", "[ber][encode]") {
    Tag t127 = make_octet_string(Bytes(127, 0x00));
    Bytes b = encode_tag(t127);
    REQUIRE(b[1] == 0x7F);
    REQUIRE(b.size() == 129);

    Tag t128 = make_octet_string(Bytes(128, 0x00));
    b = encode_tag(t128);
    REQUIRE(b[1] == 0x81);
    REQUIRE(b[2] == 0x80);
    REQUIRE(b.size() == 131);

    Tag t300 = make_octet_string(Bytes(300, 0x00));
    b = encode_tag(t300);
    REQUIRE(b[1] == 0x82);
    REQUIRE(b[2] == 0x01);
    REQUIRE(b[3] == 0x2C);
    REQUIRE(b.size() == t300.total_size());
}

TEST_CASE("decode reproduces built tags", "[ber][decode]") {
    Tag bind = make_application(0, std::vector<Tag>{
        make_integer(3),
        make_octet_string("cn=admin,dc=example,dc=org"),
        make_context(0, Bytes{'s', 'e', 'c', 'r', 'e', 't'}),
    });
    Tag nested = make_sequence({
        make_null(),
        make_set({make_boolean(false), make_enumerated(-2)}),
        make_octet_string(Bytes(1000, 0x5A)),
        build_tag(Class::priv(kMaxTagNumber), Payload::primitive(Bytes{0x01, 0x02})),
        bind,
    });

    for (const Tag* t : {&bind, &nested}) {
        Bytes b = encode_tag(*t);
        REQUIRE(b.size() == t->total_size());
        Decoded d = decode(b);
        REQUIRE(d.consumed == b.size());
        REQUIRE(d.tag == *t);
    }
}

TEST_CASE("envelope wraps message id and operation", "[ber][envelope]") {
    Tag op = build_tag(Class::universal(UniversalType::Boolean), Payload::primitive(Bytes{0xFF}));
    Bytes b = encode(op, 1);
    REQUIRE(b == Bytes{0x30, 0x06, 0x02, 0x01, 0x01, 0x01, 0x01, 0xFF});

    Decoded d = decode(b);
    REQUIRE(d.tag.cls().is(UniversalType::Sequence));
    REQUIRE(d.tag.children().size() == 2);
    REQUIRE(read_integer(d.tag.children()[0]) == 1);
    REQUIRE(read_boolean(d.tag.children()[1]) == true);

    Message m = decode_message(b);
    REQUIRE(m.message_id == 1);
    REQUIRE(m.op == op);
    REQUIRE_FALSE(m.controls.has_value());
}

TEST_CASE("envelope with controls", "[ber][envelope]") {
    Tag op = make_application(2, Bytes{});
    Tag controls = make_context(0, std::vector<Tag>{make_sequence({make_octet_string("1.2.840.113556.1.4.319")})});
    Bytes b = encode_tag(make_sequence({make_integer(7), op, controls}));

    Message m = decode_message(b);
    REQUIRE(m.message_id == 7);
    REQUIRE(m.op == op);
    REQUIRE(m.controls.has_value());
    REQUIRE(*m.controls == controls);
}

TEST_CASE("malformed envelopes", "[ber][envelope]") {
    auto reason = [](const Bytes& b) {
        try {
            decode_message(b);
        } catch (const Asn1Error& e) {
            return e.reason();
        }
        FAIL("envelope accepted");
        return Asn1Errc::InvalidValue;
    };

    SECTION("not a sequence") {
        REQUIRE(reason(encode_tag(make_set({make_integer(1), make_null()}))) == Asn1Errc::InvalidEnvelope);
    }
    SECTION("missing operation") {
        REQUIRE(reason(encode_tag(make_sequence({make_integer(1)}))) == Asn1Errc::InvalidEnvelope);
    }
    SECTION("id is not an integer") {
        REQUIRE(reason(encode_tag(make_sequence({make_octet_string("1"), make_null()}))) ==
                Asn1Errc::InvalidEnvelope);
    }
    SECTION("third element is not controls") {
        REQUIRE(reason(encode_tag(make_sequence({make_integer(1), make_null(), make_null()}))) ==
                Asn1Errc::InvalidEnvelope);
    }
    SECTION("bytes after the message") {
        Bytes b = encode(make_null(), 1);
        b.push_back(0x00);
        REQUIRE(reason(b) == Asn1Errc::TrailingBytes);
    }
}

TEST_CASE("decode stops after the first element", "[ber][decode]") {
    Bytes b = encode_tag(make_integer(5));
    Bytes second = encode_tag(make_octet_string("next"));
    b.insert(b.end(), second.begin(), second.end());

    Decoded d = decode(b);
    REQUIRE(d.consumed == 3);
    REQUIRE(read_integer(d.tag) == 5);

    Decoded d2 = decode(b.data() + d.consumed, b.size() - d.consumed);
    REQUIRE(read_octet_string(d2.tag) == "next");
    REQUIRE(d.consumed + d2.consumed == b.size());
}

TEST_CASE("non-minimal long form length is accepted", "[ber][decode]") {
    Bytes b{0x04, 0x84, 0x00, 0x00, 0x00, 0x03, 'a', 'b', 'c'};
    Decoded d = decode(b);
    REQUIRE(d.consumed == b.size());
    REQUIRE(d.tag.declared_length() == 3);
    REQUIRE(d.tag.total_size() == 5);
    REQUIRE(read_octet_string(d.tag) == "abc");
    // re-encoding produces the minimal form
    REQUIRE(encode_tag(d.tag) == Bytes{0x04, 0x03, 'a', 'b', 'c'});
}

TEST_CASE("non-minimal length inside a constructed tag is normalized", "[ber][decode]") {
    Bytes b{0x30, 0x09, 0x04, 0x84, 0x00, 0x00, 0x00, 0x03, 'a', 'b', 'c'};
    Decoded d = decode(b);
    REQUIRE(d.consumed == b.size());

    const Tag& child = d.tag.children().at(0);
    REQUIRE(child.declared_length() == 3);
    REQUIRE(child.total_size() == compute_tag_size(child.type(), 3));
    REQUIRE(d.tag.declared_length() == child.total_size());
    REQUIRE(d.tag.total_size() == compute_tag_size(d.tag.type(), d.tag.declared_length()));
    REQUIRE(d.tag == make_sequence({make_octet_string("abc")}));

    REQUIRE(encode_tag(d.tag) == Bytes{0x30, 0x05, 0x04, 0x03, 'a', 'b', 'c'});

    Bytes msg = encode(d.tag, 5);
    Message m = decode_message(msg);
    REQUIRE(m.message_id == 5);
    REQUIRE(m.op == d.tag);
}

TEST_CASE("truncated input fails with a typed error", "[ber][decode]") {
    REQUIRE(decode_failure(Bytes{}) == Asn1Errc::Truncated);
    REQUIRE(decode_failure(Bytes{0x30}) == Asn1Errc::Truncated);
    REQUIRE(decode_failure(Bytes{0x5F}) == Asn1Errc::Truncated);
    REQUIRE(decode_failure(Bytes{0x5F, 0x81}) == Asn1Errc::Truncated);
    REQUIRE(decode_failure(Bytes{0x04, 0x82, 0x01}) == Asn1Errc::Truncated);
    REQUIRE(decode_failure(Bytes{0x04, 0x05, 'a', 'b'}) == Asn1Errc::Truncated);

    Bytes full = encode(make_octet_string(Bytes(500, 0x11)), 9);
    for (size_t cut : {size_t(1), size_t(2), size_t(4), size_t(10), full.size() - 1}) {
        REQUIRE(decode_failure(Bytes(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(cut))) ==
                Asn1Errc::Truncated);
    }
}

TEST_CASE("indefinite and oversized lengths", "[ber][decode]") {
    REQUIRE(decode_failure(Bytes{0x30, 0x80, 0x00, 0x00}) == Asn1Errc::IndefiniteLength);
    REQUIRE(decode_failure(Bytes{0x04, 0xFF}) == Asn1Errc::LengthOverflow);
    REQUIRE(decode_failure(Bytes{0x04, 0x89, 1, 0, 0, 0, 0, 0, 0, 0, 0}) == Asn1Errc::LengthOverflow);
    REQUIRE(decode_failure(Bytes{0x04, 0x88, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF}) ==
            Asn1Errc::Truncated);
}

TEST_CASE("invalid identifiers", "[ber][decode]") {
    // universal 14 and 15 do not exist
    REQUIRE(decode_failure(Bytes{0x0E, 0x00}) == Asn1Errc::InvalidUniversalType);
    REQUIRE(decode_failure(Bytes{0x0F, 0x00}) == Asn1Errc::InvalidUniversalType);
    // universal with the escape
    REQUIRE(decode_failure(Bytes{0x1F, 0x20, 0x00}) == Asn1Errc::InvalidUniversalType);
    // escape for a number that fits the short form
    REQUIRE(decode_failure(Bytes{0x5F, 0x05, 0x00}) == Asn1Errc::InvalidTagNumber);
    // leading zero group
    REQUIRE(decode_failure(Bytes{0x5F, 0x80, 0x20, 0x00}) == Asn1Errc::InvalidTagNumber);
    // more than 63 bits
    Bytes huge{0x5F};
    for (int i = 0; i < 9; ++i) huge.push_back(0xFF);
    huge.push_back(0x7F);
    huge.push_back(0x00);
    REQUIRE(decode_failure(huge) == Asn1Errc::InvalidTagNumber);
}

TEST_CASE("children must fit their parent", "[ber][decode]") {
    // SEQUENCE of 3 holding an OCTET STRING that claims 5
    REQUIRE(decode_failure(Bytes{0x30, 0x03, 0x04, 0x05, 'a', 'b', 'c', 'd', 'e'}) == Asn1Errc::Framing);
    // child length field cut off by the parent boundary
    REQUIRE(decode_failure(Bytes{0x30, 0x02, 0x04, 0x81, 0x01}) == Asn1Errc::Framing);
    // child identifier only
    REQUIRE(decode_failure(Bytes{0x30, 0x01, 0x04, 0x00}) == Asn1Errc::Framing);
}

TEST_CASE("nesting depth is bounded", "[ber][decode]") {
    Tag t = make_null();
    for (int i = 0; i < kMaxDepth; ++i) t = make_sequence({t});
    REQUIRE(decode(encode_tag(t)).tag == t);

    Tag deeper = make_sequence({t});
    REQUIRE(decode_failure(encode_tag(deeper)) == Asn1Errc::TooDeep);
}

TEST_CASE("frame size from the header alone", "[ber][frame]") {
    Bytes b = encode(make_octet_string(Bytes(300, 0x01)), 2);

    REQUIRE_FALSE(frame_size(b.data(), 0).has_value());
    REQUIRE_FALSE(frame_size(b.data(), 1).has_value());
    REQUIRE_FALSE(frame_size(b.data(), 3).has_value());
    REQUIRE(frame_size(b.data(), 4) == b.size());
    REQUIRE(frame_size(b.data(), b.size()) == b.size());

    Bytes indefinite{0x30, 0x80};
    REQUIRE_THROWS_AS(frame_size(indefinite.data(), indefinite.size()), Asn1Error);
    Bytes bad{0x0E};
    REQUIRE_THROWS_AS(frame_size(bad.data(), bad.size()), Asn1Error);
}
