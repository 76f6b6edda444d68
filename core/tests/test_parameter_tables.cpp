/**
 * Static parameter table sanity checks.
 *
 * Every table must be internally consistent before any codec or resolver
 * test can mean anything.
 */

#include <catch2/catch_test_macros.hpp>

#include "../params/parameter_tables.h"

#include <set>
#include <string>

using namespace jdxi;

namespace
{
    const ParameterTable *const kAllTables[] = {
        &Params::DigitalCommon::kTable,
        &Params::DigitalPartial::kTable,
        &Params::DigitalModify::kTable,
        &Params::Analog::kTable,
        &Params::DrumCommon::kTable,
        &Params::DrumPartial::kTable,
        &Params::ProgramCommon::kTable,
        &Params::ProgramVocalEffect::kTable,
        &Params::ProgramEffect1::kTable,
        &Params::ProgramEffect2::kTable,
        &Params::ProgramDelay::kTable,
        &Params::ProgramReverb::kTable,
        &Params::ProgramPart::kTable,
        &Params::ProgramZone::kTable,
        &Params::ProgramController::kTable,
    };
}

TEST_CASE("Ranges are ordered and raw values fit their wire size", "[tables]")
{
    for (const ParameterTable *table : kAllTables)
    {
        REQUIRE(table->numParams > 0);
        for (size_t i = 0; i < table->numParams; ++i)
        {
            const ParameterSpec &spec = table->params[i];
            INFO(table->name << " " << spec.name);

            REQUIRE(spec.rawMin >= 0);
            REQUIRE(spec.rawMin <= spec.rawMax);
            REQUIRE(spec.displayMin <= spec.displayMax);
            REQUIRE((spec.size == 1 || spec.size == 2 || spec.size == 4));
            if (spec.size == 1)
                REQUIRE(spec.rawMax <= 0x7F);
            else if (spec.size == 2)
                REQUIRE(spec.rawMax <= 0xFF);
            else
                REQUIRE(spec.rawMax <= 0xFFFF);
        }
    }
}

TEST_CASE("Signed offset parameters are centered", "[tables]")
{
    for (const ParameterTable *table : kAllTables)
    {
        for (size_t i = 0; i < table->numParams; ++i)
        {
            const ParameterSpec &spec = table->params[i];
            if (spec.encoding != ValueEncoding::SignedOffset)
                continue;

            INFO(table->name << " " << spec.name);
            REQUIRE(spec.displayMin == spec.rawMin - spec.center);
            REQUIRE(spec.displayMax == spec.rawMax - spec.center);
        }
    }
}

TEST_CASE("Enum parameters have one option per display value", "[tables]")
{
    for (const ParameterTable *table : kAllTables)
    {
        for (size_t i = 0; i < table->numParams; ++i)
        {
            const ParameterSpec &spec = table->params[i];
            if (spec.encoding != ValueEncoding::Enum)
                continue;

            INFO(table->name << " " << spec.name);
            REQUIRE(spec.options != nullptr);
            REQUIRE(spec.displayMin == 0);
            REQUIRE(spec.displayMax == spec.options->numOptions - 1);

            std::set<int> raws;
            for (uint8_t o = 0; o < spec.options->numOptions; ++o)
            {
                const int raw = spec.options->options[o].raw;
                REQUIRE(raw >= spec.rawMin);
                REQUIRE(raw <= spec.rawMax);
                REQUIRE(raws.insert(raw).second);
            }
        }
    }
}

TEST_CASE("Offsets ascend without overlap and fit the section", "[tables]")
{
    for (const ParameterTable *table : kAllTables)
    {
        uint32_t nextFree = 0;
        std::set<std::string> names;
        for (size_t i = 0; i < table->numParams; ++i)
        {
            const ParameterSpec &spec = table->params[i];
            INFO(table->name << " " << spec.name);

            // Low byte of the packed form is 7-bit
            REQUIRE((spec.offset & 0x80) == 0);

            const uint32_t pos = linearOffset(spec.offset);
            REQUIRE(pos >= nextFree);
            nextFree = pos + spec.size;
            REQUIRE(nextFree <= table->sectionSize);

            REQUIRE(names.insert(spec.name).second);
        }
    }
}

TEST_CASE("Digital common and modify share no names", "[tables]")
{
    const ParameterTable &common = Params::DigitalCommon::kTable;
    const ParameterTable &modify = Params::DigitalModify::kTable;
    for (size_t i = 0; i < modify.numParams; ++i)
    {
        INFO(modify.params[i].name);
        REQUIRE(Params::findParameter(common, modify.params[i].name) == nullptr);
    }
}

TEST_CASE("Program sections sharing a partial index share no names", "[tables][program]")
{
    const ParameterTable *const programBlocks[] = {
        &Params::ProgramCommon::kTable,
        &Params::ProgramVocalEffect::kTable,
        &Params::ProgramEffect1::kTable,
        &Params::ProgramEffect2::kTable,
        &Params::ProgramDelay::kTable,
        &Params::ProgramReverb::kTable,
        &Params::ProgramController::kTable,
    };
    const ParameterTable *const partBlocks[] = {
        &Params::ProgramPart::kTable,
        &Params::ProgramZone::kTable,
    };

    std::set<std::string> names;
    for (const ParameterTable *table : programBlocks)
    {
        for (size_t i = 0; i < table->numParams; ++i)
        {
            INFO(table->name << " " << table->params[i].name);
            REQUIRE(names.insert(table->params[i].name).second);
        }
    }

    names.clear();
    for (const ParameterTable *table : partBlocks)
    {
        for (size_t i = 0; i < table->numParams; ++i)
        {
            INFO(table->name << " " << table->params[i].name);
            REQUIRE(names.insert(table->params[i].name).second);
        }
    }
}

TEST_CASE("Packed offsets carry into the high byte", "[tables]")
{
    REQUIRE(linearOffset(0x0015) == 0x15);
    REQUIRE(linearOffset(0x0100) == 128);
    REQUIRE(linearOffset(0x0142) == 194);
    REQUIRE(packedOffset(194) == 0x0142);
    REQUIRE(packedOffset(127) == 0x007F);

    const ParameterSpec *level = Params::findParameter(Params::DrumPartial::kTable, "RELATIVE_LEVEL");
    REQUIRE(level != nullptr);
    REQUIRE(level->offset == 0x142);

    // Effect 1 parameter 29 is the first past the 0x7F boundary
    const ParameterSpec *efx = Params::findParameter(Params::ProgramEffect1::kTable, "EFX1_PARAM_29");
    REQUIRE(efx != nullptr);
    REQUIRE(efx->offset == 0x101);
    REQUIRE(linearOffset(efx->offset) == 0x81);
}

TEST_CASE("Drum kit has 37 named partials", "[tables]")
{
    REQUIRE(Params::DrumPartial::kNumPartials == 37);
    REQUIRE(std::string(Params::DrumPartial::kPartialNames[0]) == "BD1");
    REQUIRE(std::string(Params::DrumPartial::kPartialNames[36]) == "C5");
}
