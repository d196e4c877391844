#include <doctest/doctest.h>
#include "lorabroker/disambiguator.hpp"
#include "lorabroker/mic.hpp"

using namespace lorabroker;

namespace {

DeviceEntry device(uint8_t tag, const AES128Key& key) {
    DeviceEntry e;
    e.recipient = RawRecipient{tag};
    e.app_eui.fill(tag);
    e.dev_eui.fill(tag);
    e.nwk_skey = key;
    return e;
}

AES128Key key_of(uint8_t seed) {
    AES128Key k{};
    for (size_t i = 0; i < k.size(); ++i) k[i] = static_cast<uint8_t>(seed + i);
    return k;
}

bool broken_backend(const AES128Key&, const UplinkPacket&, Mic&) { return false; }

UplinkPacket signed_by(const AES128Key& key) {
    UplinkPacket p;
    p.devaddr = DevAddr{0xAA, 0xBB, 0xCC, 0xDD};
    p.fcnt    = 42;
    p.payload.push_back(0x01);
    REQUIRE(sign_uplink(key, p));
    return p;
}

} // namespace

TEST_CASE("The only matching candidate is chosen wherever it sits") {
    const UplinkPacket p = signed_by(key_of(100));
    size_t index = 99;

    SUBCASE("first") {
        std::vector<DeviceEntry> c{device(1, key_of(100)), device(2, key_of(1)), device(3, key_of(2))};
        CHECK_FALSE(find_device(p, c, index));
        CHECK(index == 0);
    }
    SUBCASE("middle") {
        std::vector<DeviceEntry> c{device(1, key_of(1)), device(2, key_of(100)), device(3, key_of(2))};
        CHECK_FALSE(find_device(p, c, index));
        CHECK(index == 1);
    }
    SUBCASE("last") {
        std::vector<DeviceEntry> c{device(1, key_of(1)), device(2, key_of(2)), device(3, key_of(100))};
        CHECK_FALSE(find_device(p, c, index));
        CHECK(index == 2);
    }
}

TEST_CASE("No matching candidate is behavioural") {
    const UplinkPacket p = signed_by(key_of(100));
    std::vector<DeviceEntry> c{device(1, key_of(1)), device(2, key_of(2))};
    size_t index = 7;

    Error err = find_device(p, c, index);
    CHECK(err.is(ErrorKind::Behavioural));
    CHECK(index == 7);
}

TEST_CASE("An empty candidate list is behavioural") {
    size_t index = 0;
    CHECK(find_device(signed_by(key_of(1)), {}, index).is(ErrorKind::Behavioural));
}

TEST_CASE("A crypto backend failure is behavioural and names the backend") {
    const UplinkPacket p = signed_by(key_of(100));
    std::vector<DeviceEntry> c{device(1, key_of(100))};
    size_t index = 5;

    Error err = find_device(p, c, index, &broken_backend);

    CHECK(err.is(ErrorKind::Behavioural));
    CHECK(err.reason == "mic computation failed");
    CHECK(index == 5);
}

TEST_CASE("A tampered MIC authenticates nobody") {
    UplinkPacket p = signed_by(key_of(100));
    p.mic[3] ^= 0x01;
    std::vector<DeviceEntry> c{device(1, key_of(100))};
    size_t index = 0;
    CHECK(find_device(p, c, index).is(ErrorKind::Behavioural));
}

TEST_CASE("Two candidates with the same key is an invariant violation") {
    const UplinkPacket p = signed_by(key_of(100));
    std::vector<DeviceEntry> c{device(1, key_of(100)), device(2, key_of(3)), device(3, key_of(100))};
    size_t index = 0;
    CHECK_THROWS_AS(find_device(p, c, index), InvariantViolation);
}
