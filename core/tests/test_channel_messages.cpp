/**
 * Channel voice messages and the universal identity exchange.
 */

#include <catch2/catch_test_macros.hpp>

#include "../program/program_bank.h"
#include "../protocol/channel_messages.h"
#include "../protocol/identity.h"

#include <vector>

using namespace jdxi;
using jdxi::ChannelMessages::Message;

TEST_CASE("Program select sends CC0, CC32 then PC", "[channel]")
{
    auto values = ProgramBank::resolve('B', 1);
    REQUIRE(values.ok());

    auto msgs = ChannelMessages::programSelect(ChannelMessages::Channel::PROGRAM, values.value);
    REQUIRE(msgs.ok());
    REQUIRE(msgs.value.size() == 3);
    REQUIRE(msgs.value[0] == Message{0xBF, 0x00, 85});
    REQUIRE(msgs.value[1] == Message{0xBF, 0x20, 64});
    REQUIRE(msgs.value[2] == Message{0xCF, 64});
}

TEST_CASE("Note and controller messages", "[channel]")
{
    REQUIRE(ChannelMessages::noteOn(ChannelMessages::Channel::DRUMS, 36, 100).value == Message{0x99, 36, 100});
    REQUIRE(ChannelMessages::noteOff(ChannelMessages::Channel::ANALOG, 60).value == Message{0x82, 60, 0});
    REQUIRE(ChannelMessages::controlChange(ChannelMessages::Channel::DIGITAL_2, 74, 127).value ==
            Message{0xB1, 74, 127});
    REQUIRE(ChannelMessages::programChange(0, 5).value == Message{0xC0, 5});
}

TEST_CASE("Channel message range checks", "[channel][errors]")
{
    REQUIRE(ChannelMessages::noteOn(16, 60, 100).error == ErrorCode::ByteRange);
    REQUIRE(ChannelMessages::noteOn(0, 128, 100).error == ErrorCode::ByteRange);
    REQUIRE(ChannelMessages::controlChange(0, 7, 200).error == ErrorCode::ByteRange);
    REQUIRE(ChannelMessages::programChange(0, 128).error == ErrorCode::ByteRange);

    ProgramMidiValues bad;
    bad.msb = 85;
    bad.lsb = 64;
    bad.pc = 128;
    REQUIRE(ChannelMessages::programSelect(15, bad).error == ErrorCode::ByteRange);
}

//==============================================================================
// Identity
//==============================================================================

TEST_CASE("Identity request", "[identity]")
{
    auto req = IdentityProtocol::buildRequest();
    REQUIRE(req.ok());
    REQUIRE(req.value == std::vector<uint8_t>{0xF0, 0x7E, 0x7F, 0x06, 0x01, 0xF7});

    REQUIRE(IdentityProtocol::buildRequest(0x10).value[2] == 0x10);
    REQUIRE(IdentityProtocol::buildRequest(0x80).error == ErrorCode::ByteRange);
}

TEST_CASE("JD-Xi identity reply", "[identity]")
{
    const std::vector<uint8_t> reply = {0xF0, 0x7E, 0x10, 0x06, 0x02, 0x41, 0x0E, 0x03,
                                        0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0xF7};

    auto info = IdentityProtocol::parseReply(reply);
    REQUIRE(info.ok());
    REQUIRE(info.value.deviceId == 0x10);
    REQUIRE(info.value.manufacturerId == 0x41);
    REQUIRE(info.value.family == 0x030E);
    REQUIRE(info.value.model == 0x0000);
    REQUIRE(info.value.version[1] == 0x03);
    REQUIRE(info.value.isJdxi());
}

TEST_CASE("Identity reply errors", "[identity][errors]")
{
    std::vector<uint8_t> reply = {0xF0, 0x7E, 0x10, 0x06, 0x02, 0x41, 0x0E, 0x03,
                                  0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0xF7};

    REQUIRE(IdentityProtocol::parseReply(reply.data(), 10).error == ErrorCode::TruncatedMessage);

    SECTION("Identity request is not a reply")
    {
        reply[4] = 0x01;
        REQUIRE(IdentityProtocol::parseReply(reply).error == ErrorCode::ParseError);
    }

    SECTION("Extra bytes")
    {
        reply.insert(reply.end() - 1, 0x00);
        REQUIRE(IdentityProtocol::parseReply(reply).error == ErrorCode::ParseError);
    }

    SECTION("Other manufacturer parses but is not a JD-Xi")
    {
        reply[5] = 0x43;
        auto info = IdentityProtocol::parseReply(reply);
        REQUIRE(info.ok());
        REQUIRE_FALSE(info.value.isJdxi());
    }
}
