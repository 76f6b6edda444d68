/**
 * AddressResolver tests: forward resolution, drum group carry, reverse lookup.
 */

#include <catch2/catch_test_macros.hpp>

#include "../address/address_resolver.h"
#include "../protocol/roland_protocol.h"

#include <string>
#include <vector>

using namespace jdxi;

TEST_CASE("Digital common parameter", "[address]")
{
    auto r = AddressResolver::resolve(SynthType::Digital1, 0, "OCTAVE_SHIFT");
    REQUIRE(r.ok());
    REQUIRE(r.value.address == AddressTriple{0x19, 0x01, 0x00});
    REQUIRE(r.value.offset == 0x15);
    REQUIRE(std::string(r.value.spec->name) == "OCTAVE_SHIFT");

    auto d2 = AddressResolver::resolve(SynthType::Digital2, 0, "OCTAVE_SHIFT");
    REQUIRE(d2.ok());
    REQUIRE(d2.value.address == AddressTriple{0x19, 0x21, 0x00});
}

TEST_CASE("Digital partials map to groups 0x20-0x22", "[address]")
{
    for (int i = 1; i <= 3; ++i)
    {
        auto r = AddressResolver::resolve(SynthType::Digital1, i, "AMP_LEVEL");
        INFO("partial " << i);
        REQUIRE(r.ok());
        REQUIRE(r.value.address == AddressTriple{0x19, 0x01, static_cast<uint8_t>(0x1F + i)});
    }

    auto wave = AddressResolver::resolve(SynthType::Digital2, 1, "PCM_WAVE_NUMBER");
    REQUIRE(wave.ok());
    REQUIRE(wave.value.address == AddressTriple{0x19, 0x21, 0x20});
    REQUIRE(wave.value.offset == 0x35);
    REQUIRE(wave.value.spec->size == 4);
}

TEST_CASE("Digital index 0 falls through to the modify section", "[address]")
{
    auto r = AddressResolver::resolve(SynthType::Digital1, 0, "ENVELOPE_LOOP_MODE");
    REQUIRE(r.ok());
    REQUIRE(r.value.address == AddressTriple{0x19, 0x01, 0x50});

    // Partial parameters are not reachable from index 0
    REQUIRE(AddressResolver::resolve(SynthType::Digital1, 0, "OSC_WAVE").error == ErrorCode::UnknownParameter);
}

TEST_CASE("Analog and program sections", "[address]")
{
    auto analog = AddressResolver::resolve(SynthType::Analog, 0, "OSC_WAVEFORM");
    REQUIRE(analog.ok());
    REQUIRE(analog.value.address == AddressTriple{0x19, 0x42, 0x00});

    auto program = AddressResolver::resolve(SynthType::Program, 0, "PROGRAM_LEVEL");
    REQUIRE(program.ok());
    REQUIRE(program.value.address == AddressTriple{0x18, 0x00, 0x00});
    REQUIRE(program.value.offset == 0x10);
}

TEST_CASE("Program effect, part and zone sections", "[address][program]")
{
    SECTION("Effect blocks")
    {
        auto level = AddressResolver::resolve(SynthType::Program, 0, "EFX1_LEVEL");
        REQUIRE(level.ok());
        REQUIRE(level.value.address == AddressTriple{0x18, 0x00, 0x02});
        REQUIRE(level.value.offset == 0x01);

        auto type = AddressResolver::resolve(SynthType::Program, 0, "EFX2_TYPE");
        REQUIRE(type.ok());
        REQUIRE(type.value.address == AddressTriple{0x18, 0x00, 0x04});

        auto delay = AddressResolver::resolve(SynthType::Program, 0, "DELAY_LEVEL");
        REQUIRE(delay.ok());
        REQUIRE(delay.value.address == AddressTriple{0x18, 0x00, 0x06});

        auto reverb = AddressResolver::resolve(SynthType::Program, 0, "REVERB_PARAM_1");
        REQUIRE(reverb.ok());
        REQUIRE(reverb.value.address == AddressTriple{0x18, 0x00, 0x08});
        REQUIRE(reverb.value.offset == 0x07);

        auto vocal = AddressResolver::resolve(SynthType::Program, 0, "VOCODER_MIC_HPF");
        REQUIRE(vocal.ok());
        REQUIRE(vocal.value.address == AddressTriple{0x18, 0x00, 0x01});
        REQUIRE(vocal.value.offset == 0x13);

        auto arp = AddressResolver::resolve(SynthType::Program, 0, "ARPEGGIO_STYLE");
        REQUIRE(arp.ok());
        REQUIRE(arp.value.address == AddressTriple{0x18, 0x00, 0x40});
    }

    SECTION("Effect parameters past 0x7F carry into the next group")
    {
        auto r = AddressResolver::resolve(SynthType::Program, 0, "EFX1_PARAM_32");
        REQUIRE(r.ok());
        REQUIRE(r.value.address == AddressTriple{0x18, 0x00, 0x03});
        REQUIRE(r.value.offset == 0x0D);

        auto e2 = AddressResolver::resolve(SynthType::Program, 0, "EFX2_PARAM_29");
        REQUIRE(e2.ok());
        REQUIRE(e2.value.address == AddressTriple{0x18, 0x00, 0x05});
        REQUIRE(e2.value.offset == 0x01);
    }

    SECTION("Parts and zones follow the partial index")
    {
        auto part = AddressResolver::resolve(SynthType::Program, 3, "PART_LEVEL");
        REQUIRE(part.ok());
        REQUIRE(part.value.address == AddressTriple{0x18, 0x00, 0x22});
        REQUIRE(part.value.offset == 0x09);

        auto zone = AddressResolver::resolve(SynthType::Program, 4, "ZONAL_OCTAVE_SHIFT");
        REQUIRE(zone.ok());
        REQUIRE(zone.value.address == AddressTriple{0x18, 0x00, 0x33});
        REQUIRE(zone.value.offset == 0x19);
    }

    SECTION("Section kinds per index")
    {
        REQUIRE(AddressResolver::maxPartialIndex(SynthType::Program) == 4);
        REQUIRE(AddressResolver::sectionKinds(SynthType::Program, 0).size() == 7);
        REQUIRE(AddressResolver::sectionKinds(SynthType::Program, 2) ==
                std::vector<SectionKind>{SectionKind::Part, SectionKind::Zone});
        REQUIRE(AddressResolver::sectionKinds(SynthType::Program, 5).empty());
        REQUIRE(AddressResolver::sectionKinds(SynthType::Analog, 1).empty());

        auto def = AddressResolver::section(SynthType::Program, 1);
        REQUIRE(def.ok());
        REQUIRE(def.value.kind == SectionKind::Part);
        REQUIRE(def.value.base.group == 0x20);
    }
}

TEST_CASE("Drum partial offsets above 0x7F carry into the group", "[address][drums]")
{
    SECTION("BD1 pitch envelope depth")
    {
        auto r = AddressResolver::resolve(SynthType::Drums, 1, "PITCH_ENV_DEPTH");
        REQUIRE(r.ok());
        REQUIRE(r.value.address == AddressTriple{0x19, 0x70, 0x2F});
        REQUIRE(r.value.offset == 0x15);
    }

    SECTION("Low offsets stay in the base group")
    {
        auto r = AddressResolver::resolve(SynthType::Drums, 2, "PARTIAL_LEVEL");
        REQUIRE(r.ok());
        REQUIRE(r.value.address == AddressTriple{0x19, 0x70, 0x30});
        REQUIRE(r.value.offset == 0x0E);
    }

    SECTION("Last partial")
    {
        auto r = AddressResolver::resolve(SynthType::Drums, 37, "ONE_SHOT_MODE");
        REQUIRE(r.ok());
        REQUIRE(r.value.address == AddressTriple{0x19, 0x70, 0x77});
        REQUIRE(r.value.offset == 0x41);
    }

    SECTION("Every resolved address byte is 7-bit")
    {
        for (int i = 1; i <= 37; ++i)
        {
            auto r = AddressResolver::resolve(SynthType::Drums, i, "RELATIVE_LEVEL");
            INFO("partial " << i);
            REQUIRE(r.ok());
            REQUIRE(r.value.address.group <= 0x7F);
            REQUIRE(r.value.offset <= 0x7F);
        }
    }
}

TEST_CASE("Partial index errors", "[address]")
{
    REQUIRE(AddressResolver::resolve(SynthType::Digital1, 4, "AMP_LEVEL").error == ErrorCode::InvalidPartial);
    REQUIRE(AddressResolver::resolve(SynthType::Digital1, -1, "AMP_LEVEL").error == ErrorCode::InvalidPartial);
    REQUIRE(AddressResolver::resolve(SynthType::Drums, 38, "PARTIAL_LEVEL").error == ErrorCode::InvalidPartial);
    REQUIRE(AddressResolver::resolve(SynthType::Analog, 1, "OSC_WAVEFORM").error == ErrorCode::InvalidPartial);
    REQUIRE(AddressResolver::resolve(SynthType::Program, 5, "PART_LEVEL").error == ErrorCode::InvalidPartial);
    REQUIRE(AddressResolver::resolve(SynthType::Program, -1, "PROGRAM_LEVEL").error == ErrorCode::InvalidPartial);
}

TEST_CASE("Unknown parameter names", "[address]")
{
    REQUIRE(AddressResolver::resolve(SynthType::Digital1, 1, "NOT_A_PARAM").error == ErrorCode::UnknownParameter);
    REQUIRE(AddressResolver::resolve(SynthType::Drums, 0, "PITCH_ENV_DEPTH").error == ErrorCode::UnknownParameter);
    REQUIRE(AddressResolver::resolve(SynthType::Analog, 0, "octave_shift").error == ErrorCode::UnknownParameter);

    // Program-wide blocks sit at index 0, parts and zones at 1..4
    REQUIRE(AddressResolver::resolve(SynthType::Program, 1, "PROGRAM_LEVEL").error == ErrorCode::UnknownParameter);
    REQUIRE(AddressResolver::resolve(SynthType::Program, 0, "PART_LEVEL").error == ErrorCode::UnknownParameter);
}

TEST_CASE("Sections", "[address]")
{
    auto modify = AddressResolver::section(SynthType::Digital2, 0, SectionKind::Modify);
    REQUIRE(modify.ok());
    REQUIRE(modify.value.base == AddressTriple{0x19, 0x21, 0x50});

    auto drum = AddressResolver::section(SynthType::Drums, 5);
    REQUIRE(drum.ok());
    REQUIRE(drum.value.kind == SectionKind::Partial);
    REQUIRE(drum.value.base.group == 0x36);
    REQUIRE(drum.value.table->sectionSize == 195);

    REQUIRE(AddressResolver::section(SynthType::Analog, 0, SectionKind::Modify).error == ErrorCode::InvalidPartial);
    REQUIRE(AddressResolver::section(SynthType::Digital1, 1, SectionKind::Modify).error == ErrorCode::InvalidPartial);
}

TEST_CASE("locate reverses section addresses", "[address]")
{
    int carry = -1;

    auto common = AddressResolver::locate(AddressTriple{0x19, 0x01, 0x00}, &carry);
    REQUIRE(common.ok());
    REQUIRE(common.value.synth == SynthType::Digital1);
    REQUIRE(common.value.kind == SectionKind::Common);
    REQUIRE(carry == 0);

    auto partial = AddressResolver::locate(AddressTriple{0x19, 0x21, 0x22}, &carry);
    REQUIRE(partial.ok());
    REQUIRE(partial.value.synth == SynthType::Digital2);
    REQUIRE(partial.value.partialIndex == 3);

    auto drumCarry = AddressResolver::locate(AddressTriple{0x19, 0x70, 0x2F}, &carry);
    REQUIRE(drumCarry.ok());
    REQUIRE(drumCarry.value.partialIndex == 1);
    REQUIRE(drumCarry.value.base.group == 0x2E);
    REQUIRE(carry == 1);

    auto lastDrum = AddressResolver::locate(AddressTriple{0x19, 0x70, 0x76}, &carry);
    REQUIRE(lastDrum.ok());
    REQUIRE(lastDrum.value.partialIndex == 37);
    REQUIRE(carry == 0);

    auto program = AddressResolver::locate(AddressTriple{0x18, 0x00, 0x00});
    REQUIRE(program.ok());
    REQUIRE(program.value.synth == SynthType::Program);

    auto delay = AddressResolver::locate(AddressTriple{0x18, 0x00, 0x06}, &carry);
    REQUIRE(delay.ok());
    REQUIRE(delay.value.kind == SectionKind::Delay);
    REQUIRE(carry == 0);

    auto effect1Tail = AddressResolver::locate(AddressTriple{0x18, 0x00, 0x03}, &carry);
    REQUIRE(effect1Tail.ok());
    REQUIRE(effect1Tail.value.kind == SectionKind::Effect1);
    REQUIRE(effect1Tail.value.base.group == 0x02);
    REQUIRE(carry == 1);

    auto zone = AddressResolver::locate(AddressTriple{0x18, 0x00, 0x31}, &carry);
    REQUIRE(zone.ok());
    REQUIRE(zone.value.kind == SectionKind::Zone);
    REQUIRE(zone.value.partialIndex == 2);
    REQUIRE(carry == 0);

    // Gaps in the program map
    REQUIRE(AddressResolver::locate(AddressTriple{0x18, 0x00, 0x07}).error == ErrorCode::UnknownParameter);
    REQUIRE(AddressResolver::locate(AddressTriple{0x18, 0x00, 0x24}).error == ErrorCode::UnknownParameter);
    REQUIRE(AddressResolver::locate(AddressTriple{0x18, 0x01, 0x00}).error == ErrorCode::UnknownParameter);

    REQUIRE(AddressResolver::locate(AddressTriple{0x19, 0x70, 0x78}).error == ErrorCode::UnknownParameter);
    REQUIRE(AddressResolver::locate(AddressTriple{0x19, 0x01, 0x23}).error == ErrorCode::UnknownParameter);
    REQUIRE(AddressResolver::locate(AddressTriple{0x01, 0x00, 0x00}).error == ErrorCode::UnknownParameter);
}

TEST_CASE("Every resolvable parameter locates back to its section", "[address][property]")
{
    const SynthType synths[] = {SynthType::Digital1, SynthType::Digital2, SynthType::Analog,
                                SynthType::Drums, SynthType::Program};
    for (SynthType synth : synths)
    {
        for (int index = 0; index <= AddressResolver::maxPartialIndex(synth); ++index)
        {
            for (SectionKind kind : AddressResolver::sectionKinds(synth, index))
            {
                auto sec = AddressResolver::section(synth, index, kind);
                REQUIRE(sec.ok());
                const ParameterTable &table = *sec.value.table;
                for (size_t i = 0; i < table.numParams; ++i)
                {
                    auto r = AddressResolver::resolve(synth, index, table.params[i].name);
                    INFO(synthTypeName(synth) << " " << index << " " << table.params[i].name);
                    REQUIRE(r.ok());

                    int carry = 0;
                    auto back = AddressResolver::locate(r.value.address, &carry);
                    REQUIRE(back.ok());
                    REQUIRE(back.value.synth == synth);
                    REQUIRE(back.value.partialIndex == index);
                    REQUIRE(back.value.kind == kind);
                    REQUIRE(static_cast<uint32_t>(carry * 128 + r.value.offset) ==
                            linearOffset(table.params[i].offset));
                }
            }
        }
    }
}

TEST_CASE("Drum partial names and synth type names", "[address]")
{
    REQUIRE(std::string(AddressResolver::drumPartialName(1)) == "BD1");
    REQUIRE(std::string(AddressResolver::drumPartialName(37)) == "C5");
    REQUIRE(AddressResolver::drumPartialName(0) == nullptr);
    REQUIRE(AddressResolver::drumPartialName(38) == nullptr);
    REQUIRE(AddressResolver::drumPartialIndex("SD1") == 6);
    REQUIRE(AddressResolver::drumPartialIndex("XX") == 0);

    SynthType type = SynthType::Digital1;
    REQUIRE(parseSynthType("Drums", type));
    REQUIRE(type == SynthType::Drums);
    REQUIRE(parseSynthType("analog", type));
    REQUIRE(type == SynthType::Analog);
    REQUIRE_FALSE(parseSynthType("vocoder", type));
    REQUIRE(std::string(synthTypeName(SynthType::Digital2)) == "digital2");
}
