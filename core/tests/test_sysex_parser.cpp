/**
 * SysExParser tests: framing, identity match, checksum verification, truncation.
 */

#include <catch2/catch_test_macros.hpp>

#include "../protocol/sysex_builder.h"
#include "../protocol/sysex_parser.h"

#include <vector>

using namespace jdxi;

namespace
{
    std::vector<uint8_t> octaveShiftMessage()
    {
        // Digital 1 common, OCTAVE_SHIFT = +2
        return {0xF0, 0x41, 0x10, 0x00, 0x00, 0x00, 0x0E, 0x12,
                0x19, 0x01, 0x00, 0x15, 0x42,
                0x0F, 0xF7};
    }
}

TEST_CASE("Parse a single value DT1", "[parser]")
{
    SysExParser parser;
    auto parsed = parser.parse(octaveShiftMessage());

    REQUIRE(parsed.ok());
    REQUIRE(parsed.value.isDataSet());
    REQUIRE_FALSE(parsed.value.isRequest());
    REQUIRE(parsed.value.deviceId == 0x10);
    REQUIRE(parsed.value.address == AddressTriple{0x19, 0x01, 0x00});
    REQUIRE(parsed.value.offset == 0x15);
    REQUIRE(parsed.value.data == std::vector<uint8_t>{0x42});
}

TEST_CASE("Built messages parse back to the same fields", "[parser][builder]")
{
    SysExMessageBuilder builder;
    SysExParser parser;

    SECTION("DT1")
    {
        const std::vector<uint8_t> data = {0x02, 0x0E, 0x0E, 0x00};
        auto msg = builder.buildDt1(AddressTriple{0x18, 0x00, 0x00}, 0x11, data);
        REQUIRE(msg.ok());

        auto parsed = parser.parse(msg.value);
        REQUIRE(parsed.ok());
        REQUIRE(parsed.value.address == AddressTriple{0x18, 0x00, 0x00});
        REQUIRE(parsed.value.offset == 0x11);
        REQUIRE(parsed.value.data == data);
    }

    SECTION("RQ1")
    {
        auto msg = builder.buildRq1(AddressTriple{0x19, 0x70, 0x2E}, 0x00, 195);
        REQUIRE(msg.ok());

        auto parsed = parser.parse(msg.value);
        REQUIRE(parsed.ok());
        REQUIRE(parsed.value.isRequest());
        REQUIRE(parsed.value.requestedLength() == 195);
    }
}

TEST_CASE("Short input is truncated", "[parser][errors]")
{
    SysExParser parser;
    const auto full = octaveShiftMessage();

    REQUIRE(parser.parse(nullptr, 0).error == ErrorCode::TruncatedMessage);
    REQUIRE(parser.parse(std::vector<uint8_t>{}).error == ErrorCode::TruncatedMessage);
    REQUIRE(parser.parse(full.data(), 13).error == ErrorCode::TruncatedMessage);
    REQUIRE(parser.parse(full.data(), 4).error == ErrorCode::TruncatedMessage);
}

TEST_CASE("Bad checksum", "[parser][errors]")
{
    SysExParser parser;
    auto msg = octaveShiftMessage();
    msg[13] = 0x10;
    REQUIRE(parser.parse(msg).error == ErrorCode::ChecksumMismatch);

    // Payload changed, checksum not
    msg = octaveShiftMessage();
    msg[12] = 0x41;
    REQUIRE(parser.parse(msg).error == ErrorCode::ChecksumMismatch);
}

TEST_CASE("Malformed framing and foreign headers", "[parser][errors]")
{
    SysExParser parser;

    SECTION("Missing F0")
    {
        auto msg = octaveShiftMessage();
        msg[0] = 0x90;
        REQUIRE(parser.parse(msg).error == ErrorCode::ParseError);
    }

    SECTION("Missing F7")
    {
        auto msg = octaveShiftMessage();
        msg.back() = 0x00;
        REQUIRE(parser.parse(msg).error == ErrorCode::ParseError);
    }

    SECTION("Other manufacturer")
    {
        auto msg = octaveShiftMessage();
        msg[1] = 0x43;
        REQUIRE(parser.parse(msg).error == ErrorCode::ParseError);
    }

    SECTION("Other device id")
    {
        auto msg = octaveShiftMessage();
        msg[2] = 0x11;
        REQUIRE(parser.parse(msg).error == ErrorCode::ParseError);
    }

    SECTION("Other model")
    {
        auto msg = octaveShiftMessage();
        msg[6] = 0x0F;
        REQUIRE(parser.parse(msg).error == ErrorCode::ParseError);
    }

    SECTION("Unknown command")
    {
        auto msg = octaveShiftMessage();
        msg[7] = 0x13;
        REQUIRE(parser.parse(msg).error == ErrorCode::ParseError);
    }

    SECTION("High bit inside the body")
    {
        auto msg = octaveShiftMessage();
        msg[12] = 0xC2;
        REQUIRE(parser.parse(msg).error == ErrorCode::ParseError);
    }

    SECTION("DT1 with no data")
    {
        const std::vector<uint8_t> msg = {0xF0, 0x41, 0x10, 0x00, 0x00, 0x00, 0x0E, 0x12,
                                          0x19, 0x01, 0x00, 0x15, 0x51, 0xF7};
        REQUIRE(parser.parse(msg).error == ErrorCode::ParseError);
    }
}

TEST_CASE("Parser follows the configured identity", "[parser]")
{
    DeviceIdentity identity;
    identity.deviceId = 0x11;
    SysExMessageBuilder builder(identity);
    SysExParser parser(identity);

    auto msg = builder.buildDt1(AddressTriple{0x19, 0x42, 0x00}, 0x16, 0x01);
    REQUIRE(msg.ok());
    REQUIRE(parser.parse(msg.value).ok());
    REQUIRE(SysExParser().parse(msg.value).error == ErrorCode::ParseError);
}
