#include <doctest/doctest.h>
#include "lorabroker/errors.hpp"
#include "lorabroker/types.hpp"

using namespace lorabroker;

TEST_CASE("Hex helpers") {
    std::vector<uint8_t> b;
    CHECK(hex_to_bytes("0xdeADbe", b));
    CHECK(b == std::vector<uint8_t>{0xDE, 0xAD, 0xBE});
    CHECK(bytes_to_hex(b.data(), b.size()) == "DEADBE");

    CHECK_FALSE(hex_to_bytes("abc", b));     // odd length
    CHECK_FALSE(hex_to_bytes("zz", b));
    CHECK(b.size() == 3);                    // untouched on failure

    DevAddr a{};
    CHECK(from_hex("02030203", a));
    CHECK(a == DevAddr{2, 3, 2, 3});
    CHECK_FALSE(from_hex("020302", a));      // wrong width
    CHECK(to_hex(a) == "02030203");
}

TEST_CASE("Error value semantics") {
    Error ok;
    CHECK_FALSE(ok);
    CHECK(ok.is(ErrorKind::None));
    CHECK(to_pretty(ok) == "kind=none");

    Error bad(ErrorKind::Operational, "link down");
    CHECK(static_cast<bool>(bad));
    CHECK(to_pretty(bad) == "kind=operational reason=link down");
    CHECK(std::string(to_string(ErrorKind::Behavioural)) == "behavioural");
}
