#include <doctest/doctest.h>
#include "lorabroker/uplink_packet.hpp"

using namespace lorabroker;

static UplinkPacket sample() {
    UplinkPacket p;
    p.mhdr    = MHDR_CONFIRMED_DATA_UP;
    p.devaddr = DevAddr{0x26, 0x01, 0x1B, 0xDA};
    p.fcnt    = 0x01020304;
    const std::string body = "hello";
    p.payload.assign(body.begin(), body.end());
    p.metadata.set_freq_hz(868100000);
    p.metadata.set_rssi_dbm(-57);
    p.mic = Mic{0xDE, 0xAD, 0xBE, 0xEF};
    return p;
}

TEST_CASE("Uplink encode lays fields out little-endian in wire order") {
    std::vector<uint8_t> out;
    encode_uplink(sample(), out);

    REQUIRE(out.size() == UPLINK_MIN_SIZE + 5 + (2 + 4) + (2 + 2));
    CHECK(out[0] == 0x80);
    CHECK(out[1] == 0x26);
    CHECK(out[4] == 0xDA);
    CHECK(out[5] == 0x04);          // FCnt LSB first
    CHECK(out[8] == 0x01);
    CHECK(out[9] == 5);             // payload length
    CHECK(out[10] == 'h');
    CHECK(out[15] == 10);           // metadata length, low byte
    CHECK(out[16] == 0);
    CHECK(out[17] == META_FREQ_HZ);
    CHECK(out[out.size() - 4] == 0xDE);
    CHECK(out.back() == 0xEF);
}

TEST_CASE("Uplink decode restores every field") {
    std::vector<uint8_t> wire;
    encode_uplink(sample(), wire);

    UplinkPacket back;
    REQUIRE_FALSE(decode_uplink(wire, back));
    CHECK(back == sample());
    CHECK(back.confirmed());
}

TEST_CASE("Uplink decode keeps an empty payload and empty metadata") {
    UplinkPacket p;
    p.devaddr = DevAddr{1, 2, 3, 4};
    std::vector<uint8_t> wire;
    encode_uplink(p, wire);
    REQUIRE(wire.size() == UPLINK_MIN_SIZE);

    UplinkPacket back;
    CHECK_FALSE(decode_uplink(wire, back));
    CHECK(back.payload.empty());
    CHECK(back.metadata.empty());
    CHECK_FALSE(back.confirmed());
}

TEST_CASE("Uplink decode rejects malformed frames as structural") {
    std::vector<uint8_t> wire;
    encode_uplink(sample(), wire);
    UplinkPacket out;

    SUBCASE("too short") {
        std::vector<uint8_t> tiny{1, 2, 3};
        CHECK(decode_uplink(tiny, out).is(ErrorKind::Structural));
        CHECK(decode_uplink(nullptr, 0, out).is(ErrorKind::Structural));
    }
    SUBCASE("unknown MHDR") {
        wire[0] = 0x20;   // join-accept, not an uplink
        CHECK(decode_uplink(wire, out).is(ErrorKind::Structural));
    }
    SUBCASE("payload length runs past the frame") {
        wire[9] = 200;
        CHECK(decode_uplink(wire, out).is(ErrorKind::Structural));
    }
    SUBCASE("metadata length too large") {
        wire[15] = 0xFF;
        CHECK(decode_uplink(wire, out).is(ErrorKind::Structural));
    }
    SUBCASE("trailing bytes after the MIC") {
        wire.push_back(0x00);
        CHECK(decode_uplink(wire, out).is(ErrorKind::Structural));
    }
    SUBCASE("missing MIC byte") {
        wire.pop_back();
        CHECK(decode_uplink(wire, out).is(ErrorKind::Structural));
    }
    SUBCASE("broken metadata record") {
        wire[18] = 40;   // freq record claims 40 value bytes
        CHECK(decode_uplink(wire, out).is(ErrorKind::Structural));
    }
}

TEST_CASE("Uplink decode leaves the output untouched on failure") {
    UplinkPacket out = sample();
    std::vector<uint8_t> junk(UPLINK_MIN_SIZE, 0xFF);
    CHECK(decode_uplink(junk, out));
    CHECK(out == sample());
}

TEST_CASE("Uplink pretty print is one key=value line") {
    const std::string s = to_pretty(sample());
    CHECK(s.find("type=confirmed") != std::string::npos);
    CHECK(s.find("devaddr=26011BDA") != std::string::npos);
    CHECK(s.find("fcnt=16909060") != std::string::npos);
    CHECK(s.find("mic=DEADBEEF") != std::string::npos);
    CHECK(s.find("rssi_dbm=-57") != std::string::npos);
    CHECK(s.find('\n') == std::string::npos);
}
