/**
 * SysExMessageBuilder tests: DT1 / RQ1 framing, checksum placement, byte range checks.
 */

#include <catch2/catch_test_macros.hpp>

#include "../protocol/checksum.h"
#include "../protocol/sysex_builder.h"

#include <vector>

using namespace jdxi;

namespace
{
    const AddressTriple kDigital1Partial1{0x19, 0x01, 0x20};
}

TEST_CASE("Single value DT1", "[builder][dt1]")
{
    SysExMessageBuilder builder;

    auto msg = builder.buildDt1(kDigital1Partial1, 0x00, 0x50);
    REQUIRE(msg.ok());

    const std::vector<uint8_t> expected = {
        0xF0, 0x41, 0x10, 0x00, 0x00, 0x00, 0x0E, 0x12,
        0x19, 0x01, 0x20, 0x00, 0x50,
        0x76, 0xF7};
    REQUIRE(msg.value == expected);
    REQUIRE(msg.value.size() == Protocol::DT1_SINGLE_LENGTH);
}

TEST_CASE("Multi byte DT1 checksums the whole payload", "[builder][dt1]")
{
    SysExMessageBuilder builder;
    const std::vector<uint8_t> data = {0x00, 0x01, 0x02, 0x0C};

    auto msg = builder.buildDt1(kDigital1Partial1, 0x35, data);
    REQUIRE(msg.ok());
    REQUIRE(msg.value.size() == Protocol::MIN_MESSAGE_LENGTH + data.size());

    // address + data + checksum sums to 0 mod 128
    unsigned sum = 0;
    for (size_t i = 8; i < msg.value.size() - 1; ++i)
        sum += msg.value[i];
    REQUIRE(sum % 128 == 0);
    REQUIRE(msg.value.back() == 0xF7);
}

TEST_CASE("Device id comes from the identity", "[builder]")
{
    DeviceIdentity identity;
    identity.deviceId = 0x11;
    SysExMessageBuilder builder(identity);

    auto msg = builder.buildDt1(kDigital1Partial1, 0x00, 0x50);
    REQUIRE(msg.ok());
    REQUIRE(msg.value[2] == 0x11);
    REQUIRE(builder.identity().deviceId == 0x11);
}

TEST_CASE("RQ1 for a drum partial", "[builder][rq1]")
{
    SysExMessageBuilder builder;

    auto msg = builder.buildRq1(AddressTriple{0x19, 0x70, 0x2E}, 0x00, 195);
    REQUIRE(msg.ok());

    const std::vector<uint8_t> expected = {
        0xF0, 0x41, 0x10, 0x00, 0x00, 0x00, 0x0E, 0x11,
        0x19, 0x70, 0x2E, 0x00,
        0x00, 0x00, 0x01, 0x43,
        0x05, 0xF7};
    REQUIRE(msg.value == expected);
}

TEST_CASE("Request size encoding", "[builder][rq1]")
{
    REQUIRE(encodeRequestSize(0x40).value == std::vector<uint8_t>{0x00, 0x00, 0x00, 0x40});
    REQUIRE(encodeRequestSize(195).value == std::vector<uint8_t>{0x00, 0x00, 0x01, 0x43});
    REQUIRE(encodeRequestSize(0x0FFFFFFF).value == std::vector<uint8_t>{0x7F, 0x7F, 0x7F, 0x7F});
    REQUIRE(encodeRequestSize(0x10000000).error == ErrorCode::ByteRange);

    const uint8_t bytes[] = {0x00, 0x00, 0x01, 0x43};
    REQUIRE(decodeRequestSize(bytes) == 195);
}

TEST_CASE("Bytes above 0x7F are rejected, never masked", "[builder][errors]")
{
    SysExMessageBuilder builder;

    REQUIRE(builder.buildDt1(kDigital1Partial1, 0x00, 0x80).error == ErrorCode::ByteRange);
    REQUIRE(builder.buildDt1(kDigital1Partial1, 0x80, 0x00).error == ErrorCode::ByteRange);
    REQUIRE(builder.buildDt1(AddressTriple{0x80, 0x01, 0x20}, 0x00, 0x00).error == ErrorCode::ByteRange);
    REQUIRE(builder.buildDt1(AddressTriple{0x19, 0xFF, 0x20}, 0x00, 0x00).error == ErrorCode::ByteRange);
    REQUIRE(builder.buildDt1(kDigital1Partial1, 0x00, std::vector<uint8_t>{0x01, 0x90}).error ==
            ErrorCode::ByteRange);

    DeviceIdentity identity;
    identity.deviceId = 0x80;
    SysExMessageBuilder badDevice(identity);
    REQUIRE(badDevice.buildDt1(kDigital1Partial1, 0x00, 0x00).error == ErrorCode::ByteRange);
    REQUIRE(badDevice.buildRq1(kDigital1Partial1, 0x00, 0x40).error == ErrorCode::ByteRange);
}

TEST_CASE("Empty payloads are rejected", "[builder][errors]")
{
    SysExMessageBuilder builder;
    REQUIRE(builder.buildDt1(kDigital1Partial1, 0x00, std::vector<uint8_t>{}).error == ErrorCode::EmptyPayload);
    REQUIRE(builder.buildRq1(kDigital1Partial1, 0x00, 0).error == ErrorCode::EmptyPayload);
}

TEST_CASE("Every built message is well formed", "[builder][property]")
{
    SysExMessageBuilder builder;
    for (int group = 0; group < 0x80; group += 7)
    {
        for (int value = 0; value < 0x80; value += 11)
        {
            auto msg = builder.buildDt1(AddressTriple{0x19, 0x70, static_cast<uint8_t>(group)}, 0x15,
                                        static_cast<uint8_t>(value));
            REQUIRE(msg.ok());
            REQUIRE(msg.value.front() == 0xF0);
            REQUIRE(msg.value.back() == 0xF7);
            for (size_t i = 1; i < msg.value.size() - 1; ++i)
                REQUIRE(msg.value[i] <= 0x7F);

            const uint8_t cs = rolandChecksum(msg.value.data() + 8, msg.value.size() - 10);
            REQUIRE(msg.value[msg.value.size() - 2] == cs);
        }
    }
}
