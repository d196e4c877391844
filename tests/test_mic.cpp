#include <doctest/doctest.h>
#include "lorabroker/mic.hpp"

using namespace lorabroker;

namespace {

AES128Key rfc4493_key() {
    AES128Key k{};
    REQUIRE(from_hex("2b7e151628aed2a6abf7158809cf4f3c", k));
    return k;
}

UplinkPacket packet() {
    UplinkPacket p;
    p.devaddr = DevAddr{2, 3, 2, 3};
    p.fcnt    = 5;
    const std::string body = "Payload";
    p.payload.assign(body.begin(), body.end());
    return p;
}

} // namespace

// RFC 4493 section 4 test vectors
TEST_CASE("AES-CMAC matches RFC 4493, empty message") {
    std::array<uint8_t, 16> tag{};
    REQUIRE(aes_cmac(rfc4493_key(), nullptr, 0, tag));
    CHECK(to_hex(tag) == "BB1D6929E95937287FA37D129B756746");
}

TEST_CASE("AES-CMAC matches RFC 4493, one block") {
    std::vector<uint8_t> msg;
    REQUIRE(hex_to_bytes("6bc1bee22e409f96e93d7e117393172a", msg));
    std::array<uint8_t, 16> tag{};
    REQUIRE(aes_cmac(rfc4493_key(), msg.data(), msg.size(), tag));
    CHECK(to_hex(tag) == "070A16B46B4D4144F79BDD9DD04A287C");
}

TEST_CASE("MIC is the CMAC prefix and depends on every covered field") {
    const AES128Key key{1, 1, 2, 2, 3, 3, 4, 4, 5, 5, 6, 6, 7, 7, 8, 8};
    UplinkPacket p = packet();
    Mic base{};
    REQUIRE(compute_mic(key, p, base));

    SUBCASE("same input, same MIC") {
        Mic again{};
        REQUIRE(compute_mic(key, p, again));
        CHECK(again == base);
    }
    SUBCASE("devaddr") {
        p.devaddr[0] ^= 1;
        Mic m{}; REQUIRE(compute_mic(key, p, m));
        CHECK(m != base);
    }
    SUBCASE("fcnt") {
        p.fcnt = 6;
        Mic m{}; REQUIRE(compute_mic(key, p, m));
        CHECK(m != base);
    }
    SUBCASE("payload") {
        p.payload[0] = 'p';
        Mic m{}; REQUIRE(compute_mic(key, p, m));
        CHECK(m != base);
    }
    SUBCASE("key") {
        AES128Key other = key;
        other[15] = 0;
        Mic m{}; REQUIRE(compute_mic(other, p, m));
        CHECK(m != base);
    }
    SUBCASE("metadata is not covered") {
        p.metadata.set_rssi_dbm(-40);
        Mic m{}; REQUIRE(compute_mic(key, p, m));
        CHECK(m == base);
    }
}

TEST_CASE("sign_uplink stores the computed MIC") {
    const AES128Key key{1, 1, 2, 2, 3, 3, 4, 4, 5, 5, 6, 6, 7, 7, 8, 8};
    UplinkPacket p = packet();
    REQUIRE(sign_uplink(key, p));
    Mic m{};
    REQUIRE(compute_mic(key, p, m));
    CHECK(p.mic == m);
}
