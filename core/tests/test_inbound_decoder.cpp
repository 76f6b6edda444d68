/**
 * InboundDecoder tests: single parameter writes and section dumps from the device.
 */

#include <catch2/catch_test_macros.hpp>

#include "../protocol/sysex_builder.h"
#include "../state/inbound_decoder.h"

#include <string>
#include <vector>

using namespace jdxi;

namespace
{
    SysExMessage dt1(const AddressTriple &address, uint8_t offset, const std::vector<uint8_t> &data)
    {
        auto msg = SysExMessageBuilder().buildDt1(address, offset, data);
        REQUIRE(msg.ok());
        return msg.value;
    }

    std::vector<uint8_t> text(const std::string &s)
    {
        return std::vector<uint8_t>(s.begin(), s.end());
    }

    const AddressTriple kDigital1Common{0x19, 0x01, 0x00};
    const AddressTriple kDigital1Partial1{0x19, 0x01, 0x20};
}

TEST_CASE("Single parameter write", "[inbound]")
{
    InboundDecoder decoder;

    auto result = decoder.decode(dt1(kDigital1Common, 0x15, {0x42}));
    REQUIRE(result.ok());
    REQUIRE(result.value.synth == SynthType::Digital1);
    REQUIRE(result.value.partialIndex == 0);
    REQUIRE(result.value.kind == SectionKind::Common);
    REQUIRE_FALSE(result.value.hasName);
    REQUIRE(result.value.updates.size() == 1);

    const ParameterUpdate &u = result.value.updates[0];
    REQUIRE(u.parameterId == "OCTAVE_SHIFT");
    REQUIRE(u.displayValue == 2);
    REQUIRE(u.rawValue == 0x42);
}

TEST_CASE("Common section dump carries the tone name", "[inbound][dump]")
{
    InboundDecoder decoder;

    std::vector<uint8_t> data = text("Init Tone   ");
    data.push_back(100); // TONE_LEVEL at 0x0C

    auto result = decoder.decode(dt1(kDigital1Common, 0x00, data));
    REQUIRE(result.ok());
    REQUIRE(result.value.hasName);
    REQUIRE(result.value.name == "Init Tone");
    REQUIRE(result.value.updates.size() == 1);
    REQUIRE(result.value.updates[0].parameterId == "TONE_LEVEL");
    REQUIRE(result.value.updates[0].displayValue == 100);
}

TEST_CASE("Drum partial dump with group carry", "[inbound][dump][drums]")
{
    InboundDecoder decoder;

    SECTION("Bytes past 0x7F")
    {
        // BD1, ONE_SHOT_MODE (0x141) and RELATIVE_LEVEL (0x142)
        auto result = decoder.decode(dt1(AddressTriple{0x19, 0x70, 0x2F}, 0x41, {0x01, 0x40}));
        REQUIRE(result.ok());
        REQUIRE(result.value.synth == SynthType::Drums);
        REQUIRE(result.value.partialIndex == 1);
        REQUIRE(result.value.updates.size() == 2);
        REQUIRE(result.value.updates[0].parameterId == "ONE_SHOT_MODE");
        REQUIRE(result.value.updates[0].displayValue == 1);
        REQUIRE(result.value.updates[1].parameterId == "RELATIVE_LEVEL");
        REQUIRE(result.value.updates[1].displayValue == 0);
    }

    SECTION("Partial name")
    {
        std::vector<uint8_t> data = text("Rim Shot    ");
        data.push_back(0x01); // ASSIGN_TYPE = SINGLE

        auto result = decoder.decode(dt1(AddressTriple{0x19, 0x70, 0x30}, 0x00, data));
        REQUIRE(result.ok());
        REQUIRE(result.value.partialIndex == 2);
        REQUIRE(result.value.hasName);
        REQUIRE(result.value.name == "Rim Shot");
        REQUIRE(result.value.updates.size() == 1);
        REQUIRE(result.value.updates[0].parameterId == "ASSIGN_TYPE");
    }
}

TEST_CASE("Four byte values inside a dump", "[inbound][dump]")
{
    InboundDecoder decoder;

    // WAVE_GAIN (0x34) then PCM_WAVE_NUMBER (0x35..0x38)
    auto result = decoder.decode(dt1(kDigital1Partial1, 0x34, {0x01, 0x00, 0x01, 0x02, 0x0C}));
    REQUIRE(result.ok());
    REQUIRE(result.value.kind == SectionKind::Partial);
    REQUIRE(result.value.partialIndex == 1);
    REQUIRE(result.value.updates.size() == 2);
    REQUIRE(result.value.updates[0].parameterId == "WAVE_GAIN");
    REQUIRE(result.value.updates[0].displayValue == 1);
    REQUIRE(result.value.updates[1].parameterId == "PCM_WAVE_NUMBER");
    REQUIRE(result.value.updates[1].displayValue == 300);
}

TEST_CASE("Program delay dump", "[inbound][dump][program]")
{
    InboundDecoder decoder;

    // 0x00 unmapped, DELAY_LEVEL, 0x02-0x05 unmapped, reverb send, 0x07, then DELAY_PARAM_1
    const std::vector<uint8_t> data = {0x00, 0x64, 0x00, 0x00, 0x00, 0x00, 0x28, 0x00,
                                       0x08, 0x00, 0x00, 0x00};
    auto result = decoder.decode(dt1(AddressTriple{0x18, 0x00, 0x06}, 0x00, data));
    REQUIRE(result.ok());
    REQUIRE(result.value.synth == SynthType::Program);
    REQUIRE(result.value.kind == SectionKind::Delay);
    REQUIRE_FALSE(result.value.hasName);
    REQUIRE(result.value.updates.size() == 3);
    REQUIRE(result.value.updates[0].parameterId == "DELAY_LEVEL");
    REQUIRE(result.value.updates[0].displayValue == 100);
    REQUIRE(result.value.updates[1].parameterId == "DELAY_REVERB_SEND_LEVEL");
    REQUIRE(result.value.updates[1].displayValue == 40);
    REQUIRE(result.value.updates[2].parameterId == "DELAY_PARAM_1");
    REQUIRE(result.value.updates[2].rawValue == 32768);
    REQUIRE(result.value.updates[2].displayValue == 0);
}

TEST_CASE("Program effect and part writes", "[inbound][program]")
{
    InboundDecoder decoder;

    SECTION("Effect 1 parameter in the carry group")
    {
        auto result = decoder.decode(dt1(AddressTriple{0x18, 0x00, 0x03}, 0x0D, {0x0C, 0x0E, 0x02, 0x00}));
        REQUIRE(result.ok());
        REQUIRE(result.value.kind == SectionKind::Effect1);
        REQUIRE(result.value.updates.size() == 1);
        REQUIRE(result.value.updates[0].parameterId == "EFX1_PARAM_32");
        REQUIRE(result.value.updates[0].displayValue == 20000);
    }

    SECTION("Effect value outside its range")
    {
        // 0x0000 is below 12768
        auto result = decoder.decode(dt1(AddressTriple{0x18, 0x00, 0x02}, 0x11, {0x00, 0x00, 0x00, 0x00}));
        REQUIRE(result.error == ErrorCode::InvalidRaw);
    }

    SECTION("Part level")
    {
        auto result = decoder.decode(dt1(AddressTriple{0x18, 0x00, 0x21}, 0x09, {0x7F}));
        REQUIRE(result.ok());
        REQUIRE(result.value.kind == SectionKind::Part);
        REQUIRE(result.value.partialIndex == 2);
        REQUIRE(result.value.updates.size() == 1);
        REQUIRE(result.value.updates[0].parameterId == "PART_LEVEL");
        REQUIRE(result.value.updates[0].displayValue == 127);
    }
}

TEST_CASE("Partially covered parameters are skipped", "[inbound]")
{
    InboundDecoder decoder;

    // Starts in the middle of PCM_WAVE_NUMBER
    REQUIRE(decoder.decode(dt1(kDigital1Partial1, 0x36, {0x01})).error == ErrorCode::UnknownParameter);

    // Reserved offset in the common section
    REQUIRE(decoder.decode(dt1(kDigital1Common, 0x18, {0x00})).error == ErrorCode::UnknownParameter);
}

TEST_CASE("Invalid values reject the whole message", "[inbound][errors]")
{
    InboundDecoder decoder;

    // OSC_PITCH raw 10 is below 40
    REQUIRE(decoder.decode(dt1(kDigital1Partial1, 0x03, {10})).error == ErrorCode::InvalidRaw);

    // Nibble above 0x0F
    REQUIRE(decoder.decode(dt1(kDigital1Partial1, 0x35, {0x00, 0x10, 0x00, 0x00})).error == ErrorCode::InvalidRaw);

    // Control character in the name
    std::vector<uint8_t> name = text("Init Tone   ");
    name[3] = 0x05;
    REQUIRE(decoder.decode(dt1(kDigital1Common, 0x00, name)).error == ErrorCode::InvalidRaw);
}

TEST_CASE("Non-DT1 and foreign messages", "[inbound][errors]")
{
    InboundDecoder decoder;

    auto rq1 = SysExMessageBuilder().buildRq1(kDigital1Common, 0x00, 0x40);
    REQUIRE(rq1.ok());
    REQUIRE(decoder.decode(rq1.value).error == ErrorCode::ParseError);

    REQUIRE(decoder.decode(dt1(AddressTriple{0x01, 0x00, 0x00}, 0x00, {0x00})).error ==
            ErrorCode::UnknownParameter);

    auto corrupt = dt1(kDigital1Common, 0x15, {0x42});
    corrupt[13] ^= 0x01;
    REQUIRE(decoder.decode(corrupt).error == ErrorCode::ChecksumMismatch);

    REQUIRE(decoder.decode(std::vector<uint8_t>{0xF0, 0xF7}).error == ErrorCode::TruncatedMessage);
}
