#include <catch2/catch.hpp>

#include "ber_codec.hpp"
#include "ber_values.hpp"
#include "frame_buffer.hpp"

using namespace ber;

TEST_CASE("frames arriving in pieces", "[frame]") {
    Bytes msg = encode(make_octet_string(Bytes(200, 0x33)), 4);
    FrameBuffer fb;

    fb.append(msg.data(), 1);
    REQUIRE_FALSE(fb.next_frame().has_value());
    fb.append(msg.data() + 1, 2);
    REQUIRE_FALSE(fb.next_frame().has_value());
    fb.append(msg.data() + 3, msg.size() - 4);
    REQUIRE_FALSE(fb.next_frame().has_value());
    REQUIRE(fb.buffered() == msg.size() - 1);
    fb.append(msg.data() + msg.size() - 1, 1);

    auto frame = fb.next_frame();
    REQUIRE(frame.has_value());
    REQUIRE(*frame == msg);
    REQUIRE(fb.buffered() == 0);
    REQUIRE(decode_message(*frame).message_id == 4);
}

TEST_CASE("several frames in one read", "[frame]") {
    Bytes a = encode(make_null(), 1);
    Bytes b = encode(make_octet_string("second"), 2);
    Bytes c = encode(make_boolean(true), 3);
    Bytes stream = a;
    stream.insert(stream.end(), b.begin(), b.end());
    stream.insert(stream.end(), c.begin(), c.begin() + 2);

    FrameBuffer fb;
    fb.append(stream);
    REQUIRE(fb.next_frame() == a);
    REQUIRE(fb.next_frame() == b);
    REQUIRE_FALSE(fb.next_frame().has_value());
    REQUIRE(fb.buffered() == 2);

    fb.append(c.data() + 2, c.size() - 2);
    REQUIRE(fb.next_frame() == c);
    REQUIRE_FALSE(fb.next_frame().has_value());
}

TEST_CASE("oversized and malformed frames", "[frame]") {
    FrameBuffer fb(64);
    Bytes big = encode(make_octet_string(Bytes(100, 0x00)), 1);
    fb.append(big.data(), 4);
    try {
        fb.next_frame();
        FAIL("oversized frame accepted");
    } catch (const Asn1Error& e) {
        REQUIRE(e.reason() == Asn1Errc::MessageTooLarge);
    }

    FrameBuffer fb2;
    fb2.append(Bytes{0x30, 0x80});
    REQUIRE_THROWS_AS(fb2.next_frame(), Asn1Error);
}

TEST_CASE("buffer compacts after many frames", "[frame]") {
    Bytes msg = encode(make_octet_string(Bytes(1000, 0x07)), 1);
    FrameBuffer fb;
    for (int i = 0; i < 20; ++i) {
        fb.append(msg);
        fb.append(msg.data(), 10);
        REQUIRE(fb.next_frame() == msg);
        fb.append(msg.data() + 10, msg.size() - 10);
        REQUIRE(fb.next_frame() == msg);
    }
    REQUIRE(fb.buffered() == 0);
}
