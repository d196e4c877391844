#include <doctest/doctest.h>
#include "lorabroker/ack_reporter.hpp"

#include <sstream>

using namespace lorabroker;

TEST_CASE("Ack prints status=ack and records success") {
    std::ostringstream out;
    StreamAckNacker an(out);

    CHECK_FALSE(an.ack(std::nullopt));
    CHECK(out.str() == "status=ack\n");
    CHECK(an.answered());
    CHECK(an.acked());
    CHECK(exit_code(an.outcome()) == 0);
}

TEST_CASE("Ack with a response payload prints it as hex") {
    std::ostringstream out;
    StreamAckNacker an(out);
    CHECK_FALSE(an.ack(std::vector<uint8_t>{0xCA, 0xFE}));
    CHECK(out.str() == "status=ack response=CAFE\n");
}

TEST_CASE("Nack prints kind and reason") {
    std::ostringstream out;
    StreamAckNacker an(out);

    CHECK_FALSE(an.nack(Error(ErrorKind::Behavioural, "unknown device")));
    CHECK(out.str() == "status=nack kind=behavioural reason=unknown device\n");
    CHECK(an.answered());
    CHECK_FALSE(an.acked());
    CHECK(exit_code(an.outcome()) == 3);
}

TEST_CASE("A second outcome is refused and the first one stands") {
    std::ostringstream out;
    StreamAckNacker an(out);
    REQUIRE_FALSE(an.nack(Error(ErrorKind::Structural, "bad bytes")));

    CHECK(an.ack(std::nullopt).is(ErrorKind::Operational));
    CHECK(an.nack(Error(ErrorKind::Operational, "x")).is(ErrorKind::Operational));
    CHECK(an.outcome().is(ErrorKind::Structural));
    CHECK(out.str() == "status=nack kind=structural reason=bad bytes\n");
}

TEST_CASE("Exit codes per kind") {
    CHECK(exit_code(Error()) == 0);
    CHECK(exit_code(Error(ErrorKind::Structural, "")) == 2);
    CHECK(exit_code(Error(ErrorKind::Behavioural, "")) == 3);
    CHECK(exit_code(Error(ErrorKind::Operational, "")) == 4);
}
