#include "address_resolver.h"
#include "../params/parameter_tables.h"
#include "../protocol/roland_protocol.h"
#include <cctype>

namespace jdxi
{

    namespace
    {
        Result<SectionAddress> makeSection(SynthType synth, int partialIndex, SectionKind kind,
                                           uint8_t area, uint8_t part, uint8_t group,
                                           const ParameterTable &table)
        {
            SectionAddress s;
            s.synth = synth;
            s.partialIndex = partialIndex;
            s.kind = kind;
            s.base = AddressTriple{area, part, group};
            s.table = &table;
            return Result<SectionAddress>::success(s);
        }

        Result<SectionAddress> digitalSection(SynthType synth, uint8_t part, int partialIndex, SectionKind kind)
        {
            using namespace Protocol;

            if (kind == SectionKind::Common && partialIndex == 0)
                return makeSection(synth, 0, kind, Area::TEMPORARY_TONE, part, Group::COMMON,
                                   Params::DigitalCommon::kTable);

            if (kind == SectionKind::Modify && partialIndex == 0)
                return makeSection(synth, 0, kind, Area::TEMPORARY_TONE, part, Group::DIGITAL_MODIFY,
                                   Params::DigitalModify::kTable);

            if (kind == SectionKind::Partial && partialIndex >= 1 && partialIndex <= AddressResolver::kDigitalPartials)
                return makeSection(synth, partialIndex, kind, Area::TEMPORARY_TONE, part,
                                   static_cast<uint8_t>(Group::DIGITAL_PARTIAL_1 + partialIndex - 1),
                                   Params::DigitalPartial::kTable);

            return Result<SectionAddress>::failure(ErrorCode::InvalidPartial);
        }

        Result<SectionAddress> programSection(int partialIndex, SectionKind kind)
        {
            using namespace Protocol;

            const SynthType synth = SynthType::Program;
            if (partialIndex == 0)
            {
                switch (kind)
                {
                case SectionKind::Common:
                    return makeSection(synth, 0, kind, Area::TEMPORARY_PROGRAM, Part::PROGRAM, Group::COMMON,
                                       Params::ProgramCommon::kTable);
                case SectionKind::VocalEffect:
                    return makeSection(synth, 0, kind, Area::TEMPORARY_PROGRAM, Part::PROGRAM,
                                       Group::PROGRAM_VOCAL_EFFECT, Params::ProgramVocalEffect::kTable);
                case SectionKind::Effect1:
                    return makeSection(synth, 0, kind, Area::TEMPORARY_PROGRAM, Part::PROGRAM,
                                       Group::PROGRAM_EFFECT_1, Params::ProgramEffect1::kTable);
                case SectionKind::Effect2:
                    return makeSection(synth, 0, kind, Area::TEMPORARY_PROGRAM, Part::PROGRAM,
                                       Group::PROGRAM_EFFECT_2, Params::ProgramEffect2::kTable);
                case SectionKind::Delay:
                    return makeSection(synth, 0, kind, Area::TEMPORARY_PROGRAM, Part::PROGRAM,
                                       Group::PROGRAM_DELAY, Params::ProgramDelay::kTable);
                case SectionKind::Reverb:
                    return makeSection(synth, 0, kind, Area::TEMPORARY_PROGRAM, Part::PROGRAM,
                                       Group::PROGRAM_REVERB, Params::ProgramReverb::kTable);
                case SectionKind::Controller:
                    return makeSection(synth, 0, kind, Area::TEMPORARY_PROGRAM, Part::PROGRAM,
                                       Group::PROGRAM_CONTROLLER, Params::ProgramController::kTable);
                default:
                    break;
                }
                return Result<SectionAddress>::failure(ErrorCode::InvalidPartial);
            }

            if (kind == SectionKind::Part)
                return makeSection(synth, partialIndex, kind, Area::TEMPORARY_PROGRAM, Part::PROGRAM,
                                   static_cast<uint8_t>(Group::PROGRAM_PART_FIRST + partialIndex - 1),
                                   Params::ProgramPart::kTable);
            if (kind == SectionKind::Zone)
                return makeSection(synth, partialIndex, kind, Area::TEMPORARY_PROGRAM, Part::PROGRAM,
                                   static_cast<uint8_t>(Group::PROGRAM_ZONE_FIRST + partialIndex - 1),
                                   Params::ProgramZone::kTable);

            return Result<SectionAddress>::failure(ErrorCode::InvalidPartial);
        }

        // Groups a section occupies: one per 128 bytes
        int groupSpan(const SectionAddress &section)
        {
            return static_cast<int>((section.table->sectionSize + 127) / 128);
        }

        Result<ResolvedParameter> bind(const SectionAddress &section, const ParameterSpec &spec)
        {
            ResolvedParameter r;
            r.address = section.base;
            r.address.group = static_cast<uint8_t>(section.base.group + ((spec.offset >> 8) & 0x7F));
            r.offset = static_cast<uint8_t>(spec.offset & 0x7F);
            r.spec = &spec;
            return Result<ResolvedParameter>::success(r);
        }
    }

    //==============================================================================
    // Forward lookup
    //==============================================================================

    int AddressResolver::maxPartialIndex(SynthType synth)
    {
        switch (synth)
        {
        case SynthType::Digital1:
        case SynthType::Digital2:
            return kDigitalPartials;
        case SynthType::Drums:
            return Params::DrumPartial::kNumPartials;
        case SynthType::Program:
            return Params::ProgramPart::kNumParts;
        case SynthType::Analog:
            return 0;
        }
        return 0;
    }

    Result<SectionAddress> AddressResolver::section(SynthType synth, int partialIndex, SectionKind kind)
    {
        using namespace Protocol;

        if (partialIndex < 0 || partialIndex > maxPartialIndex(synth))
            return Result<SectionAddress>::failure(ErrorCode::InvalidPartial);

        switch (synth)
        {
        case SynthType::Digital1:
            return digitalSection(synth, Part::DIGITAL_1, partialIndex, kind);

        case SynthType::Digital2:
            return digitalSection(synth, Part::DIGITAL_2, partialIndex, kind);

        case SynthType::Analog:
            if (kind != SectionKind::Common)
                break;
            return makeSection(synth, 0, kind, Area::TEMPORARY_TONE, Part::ANALOG, Group::COMMON,
                               Params::Analog::kTable);

        case SynthType::Drums:
            if (kind == SectionKind::Common && partialIndex == 0)
                return makeSection(synth, 0, kind, Area::TEMPORARY_TONE, Part::DRUMS, Group::COMMON,
                                   Params::DrumCommon::kTable);
            if (kind == SectionKind::Partial && partialIndex >= 1)
                return makeSection(synth, partialIndex, kind, Area::TEMPORARY_TONE, Part::DRUMS,
                                   static_cast<uint8_t>(Group::DRUM_PARTIAL_FIRST +
                                                        Group::DRUM_PARTIAL_STRIDE * (partialIndex - 1)),
                                   Params::DrumPartial::kTable);
            break;

        case SynthType::Program:
            return programSection(partialIndex, kind);
        }
        return Result<SectionAddress>::failure(ErrorCode::InvalidPartial);
    }

    Result<SectionAddress> AddressResolver::section(SynthType synth, int partialIndex)
    {
        const std::vector<SectionKind> kinds = sectionKinds(synth, partialIndex);
        if (kinds.empty())
            return Result<SectionAddress>::failure(ErrorCode::InvalidPartial);
        return section(synth, partialIndex, kinds.front());
    }

    std::vector<SectionKind> AddressResolver::sectionKinds(SynthType synth, int partialIndex)
    {
        if (partialIndex < 0 || partialIndex > maxPartialIndex(synth))
            return {};

        switch (synth)
        {
        case SynthType::Digital1:
        case SynthType::Digital2:
            if (partialIndex == 0)
                return {SectionKind::Common, SectionKind::Modify};
            return {SectionKind::Partial};

        case SynthType::Analog:
            return {SectionKind::Common};

        case SynthType::Drums:
            if (partialIndex == 0)
                return {SectionKind::Common};
            return {SectionKind::Partial};

        case SynthType::Program:
            if (partialIndex == 0)
                return {SectionKind::Common, SectionKind::VocalEffect, SectionKind::Effect1,
                        SectionKind::Effect2, SectionKind::Delay, SectionKind::Reverb,
                        SectionKind::Controller};
            return {SectionKind::Part, SectionKind::Zone};
        }
        return {};
    }

    Result<ResolvedParameter> AddressResolver::resolve(SynthType synth, int partialIndex, const std::string &parameterId)
    {
        const std::vector<SectionKind> kinds = sectionKinds(synth, partialIndex);
        if (kinds.empty())
            return Result<ResolvedParameter>::failure(ErrorCode::InvalidPartial);

        for (SectionKind kind : kinds)
        {
            auto sec = section(synth, partialIndex, kind);
            if (!sec.ok())
                return Result<ResolvedParameter>::failure(sec.error);

            if (const ParameterSpec *spec = Params::findParameter(*sec.value.table, parameterId))
                return bind(sec.value, *spec);
        }

        return Result<ResolvedParameter>::failure(ErrorCode::UnknownParameter);
    }

    //==============================================================================
    // Reverse lookup
    //==============================================================================

    Result<SectionAddress> AddressResolver::locate(const AddressTriple &address, int *groupCarry)
    {
        using namespace Protocol;

        if (groupCarry)
            *groupCarry = 0;

        if (address.area == Area::TEMPORARY_PROGRAM)
        {
            if (address.part != Part::PROGRAM)
                return Result<SectionAddress>::failure(ErrorCode::UnknownParameter);

            for (int index = 0; index <= maxPartialIndex(SynthType::Program); ++index)
            {
                for (SectionKind kind : sectionKinds(SynthType::Program, index))
                {
                    auto sec = section(SynthType::Program, index, kind);
                    if (!sec.ok())
                        continue;

                    const int rel = address.group - sec.value.base.group;
                    if (rel >= 0 && rel < groupSpan(sec.value))
                    {
                        if (groupCarry)
                            *groupCarry = rel;
                        return sec;
                    }
                }
            }
            return Result<SectionAddress>::failure(ErrorCode::UnknownParameter);
        }

        if (address.area != Area::TEMPORARY_TONE)
            return Result<SectionAddress>::failure(ErrorCode::UnknownParameter);

        switch (address.part)
        {
        case Part::DIGITAL_1:
        case Part::DIGITAL_2:
        {
            const SynthType synth = address.part == Part::DIGITAL_1 ? SynthType::Digital1 : SynthType::Digital2;
            if (address.group == Group::COMMON)
                return section(synth, 0, SectionKind::Common);
            if (address.group == Group::DIGITAL_MODIFY)
                return section(synth, 0, SectionKind::Modify);
            if (address.group >= Group::DIGITAL_PARTIAL_1 &&
                address.group < Group::DIGITAL_PARTIAL_1 + kDigitalPartials)
                return section(synth, address.group - Group::DIGITAL_PARTIAL_1 + 1, SectionKind::Partial);
            break;
        }

        case Part::ANALOG:
            if (address.group == Group::COMMON)
                return section(SynthType::Analog, 0, SectionKind::Common);
            break;

        case Part::DRUMS:
        {
            if (address.group == Group::COMMON)
                return section(SynthType::Drums, 0, SectionKind::Common);
            if (address.group < Group::DRUM_PARTIAL_FIRST)
                break;

            const int rel = address.group - Group::DRUM_PARTIAL_FIRST;
            const int index = rel / Group::DRUM_PARTIAL_STRIDE + 1;
            if (index > Params::DrumPartial::kNumPartials)
                break;
            if (groupCarry)
                *groupCarry = rel % Group::DRUM_PARTIAL_STRIDE;
            return section(SynthType::Drums, index, SectionKind::Partial);
        }

        default:
            break;
        }
        return Result<SectionAddress>::failure(ErrorCode::UnknownParameter);
    }

    //==============================================================================
    // Names
    //==============================================================================

    const char *AddressResolver::drumPartialName(int partialIndex)
    {
        if (partialIndex < 1 || partialIndex > Params::DrumPartial::kNumPartials)
            return nullptr;
        return Params::DrumPartial::kPartialNames[partialIndex - 1];
    }

    int AddressResolver::drumPartialIndex(const std::string &name)
    {
        for (int i = 0; i < Params::DrumPartial::kNumPartials; ++i)
        {
            if (name == Params::DrumPartial::kPartialNames[i])
                return i + 1;
        }
        return 0;
    }

    const char *synthTypeName(SynthType type)
    {
        switch (type)
        {
        case SynthType::Digital1:
            return "digital1";
        case SynthType::Digital2:
            return "digital2";
        case SynthType::Analog:
            return "analog";
        case SynthType::Drums:
            return "drums";
        case SynthType::Program:
            return "program";
        }
        return "unknown";
    }

    bool parseSynthType(const std::string &text, SynthType &out)
    {
        std::string lower;
        for (char c : text)
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

        const SynthType all[] = {SynthType::Digital1, SynthType::Digital2, SynthType::Analog,
                                 SynthType::Drums, SynthType::Program};
        for (SynthType t : all)
        {
            if (lower == synthTypeName(t))
            {
                out = t;
                return true;
            }
        }
        return false;
    }

} // namespace jdxi
