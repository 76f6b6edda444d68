#pragma once

#include "address.h"
#include "../params/parameter_spec.h"
#include "../protocol/protocol_error.h"
#include <cstdint>
#include <string>
#include <vector>

namespace jdxi
{

    /** Which block of a synth's address space a table covers. */
    enum class SectionKind : uint8_t
    {
        Common = 0,
        Partial = 1,
        Modify = 2,

        // Temporary program area
        VocalEffect,
        Effect1,
        Effect2,
        Delay,
        Reverb,
        Part,
        Zone,
        Controller
    };

    /** A section's base address and its parameter table. */
    struct SectionAddress
    {
        SynthType synth = SynthType::Digital1;
        int partialIndex = 0;
        SectionKind kind = SectionKind::Common;
        AddressTriple base;
        const ParameterTable *table = nullptr;
    };

    /**
     * Fully resolved parameter. address.group already includes the carry of
     * the parameter's high offset byte; offset is the low 7-bit byte.
     */
    struct ResolvedParameter
    {
        AddressTriple address;
        uint8_t offset = 0;
        const ParameterSpec *spec = nullptr;
    };

    /**
     * AddressResolver - maps (synth type, partial index, parameter id) onto the
     * JD-Xi address map, and back.
     *
     * Partial index ranges:
     *   Digital1/2  0 = common + modify, 1..3 = partials
     *   Analog      0
     *   Drums       0 = common, 1..37 = BD1..C5
     *   Program     0 = common, vocal effect, effects, delay, reverb, controller
     *               1..4 = part and zone (digital 1, digital 2, analog, drums)
     *
     * Stateless; every method reads only the static tables.
     */
    class AddressResolver
    {
    public:
        static constexpr int kDigitalPartials = 3;

        static Result<ResolvedParameter> resolve(SynthType synth, int partialIndex, const std::string &parameterId);

        /** Base address and table of one section. */
        static Result<SectionAddress> section(SynthType synth, int partialIndex, SectionKind kind);

        /** Default section for an index: the first of sectionKinds(). */
        static Result<SectionAddress> section(SynthType synth, int partialIndex);

        /**
         * Sections reachable from one partial index, in resolve order. Empty
         * when the index is out of range.
         */
        static std::vector<SectionKind> sectionKinds(SynthType synth, int partialIndex);

        /**
         * Reverse lookup of an address triple. Sections longer than 128 bytes
         * (drum partials, program effects 1 and 2) also answer for the groups
         * they run into; the section base is returned and groupCarry receives
         * the number of groups past it.
         */
        static Result<SectionAddress> locate(const AddressTriple &address, int *groupCarry = nullptr);

        static int maxPartialIndex(SynthType synth);

        //=========================================================================
        // Drum partial names
        //=========================================================================

        /** "BD1".."C5" for 1..37, nullptr otherwise. */
        static const char *drumPartialName(int partialIndex);

        /** 1..37, or 0 when the name is unknown. */
        static int drumPartialIndex(const std::string &name);
    };

    /** "digital1", "digital2", "analog", "drums" or "program". */
    bool parseSynthType(const std::string &text, SynthType &out);

} // namespace jdxi
