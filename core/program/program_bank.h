#pragma once

#include "../protocol/channel_messages.h"
#include "../protocol/protocol_error.h"
#include <cstdint>
#include <string>

namespace jdxi
{

    /** A program slot as printed on the device: bank 'A'..'H', slot 1..64. */
    struct ProgramIdentity
    {
        char bank = 'A';
        int slot = 1;

        bool operator==(const ProgramIdentity &other) const
        {
            return bank == other.bank && slot == other.slot;
        }
        bool operator!=(const ProgramIdentity &other) const { return !(*this == other); }
    };

    /** Externally supplied preset metadata. */
    struct ProgramRecord
    {
        std::string id; // "A01"
        std::string name;
        std::string genre;
    };

    /**
     * Read-only lookup of preset metadata by linear program index (0..511).
     * The tables themselves live outside this library.
     */
    class ProgramDirectory
    {
    public:
        virtual ~ProgramDirectory() = default;
        virtual const ProgramRecord *findByIndex(int index) const = 0;
    };

    /**
     * ProgramBank - bank letter/slot <-> bank select MSB/LSB + program change.
     *
     *   Banks  MSB  LSB   PC
     *   A/B    85   64    slot-1 (+64 for B)
     *   C/D    85   65    slot-1 (+64 for D)
     *   E/F    85   0     slot-1 (+64 for F)   user
     *   G/H    85   1     slot-1 (+64 for H)   user
     */
    namespace ProgramBank
    {
        constexpr uint8_t kBankMsb = 85;
        constexpr int kSlotsPerBank = 64;
        constexpr int kNumBanks = 8;
        constexpr int kNumPrograms = kSlotsPerBank * kNumBanks;

        Result<ProgramMidiValues> resolve(char bank, int slot);
        Result<ProgramMidiValues> resolve(const ProgramIdentity &program);

        Result<ProgramIdentity> unresolve(uint8_t msb, uint8_t lsb, uint8_t pc);
        Result<ProgramIdentity> unresolve(const ProgramMidiValues &values);

        //=========================================================================
        // Linear index and navigation
        //=========================================================================

        /** (bank-'A')*64 + slot-1, or -1 for an invalid identity. */
        int programIndex(const ProgramIdentity &program);
        Result<ProgramIdentity> fromIndex(int index);

        /** Wraps H64 -> A01. */
        ProgramIdentity next(const ProgramIdentity &program);
        /** Wraps A01 -> H64. */
        ProgramIdentity previous(const ProgramIdentity &program);

        //=========================================================================
        // Text form "A01".."H64"
        //=========================================================================

        Result<ProgramIdentity> parseProgramId(const std::string &text);
        std::string formatProgramId(const ProgramIdentity &program);

        /** nullptr when the identity is invalid or the directory has no entry. */
        const ProgramRecord *findProgram(const ProgramDirectory &directory, const ProgramIdentity &program);
    }

} // namespace jdxi
