#include "program_bank.h"
#include <cctype>
#include <cstdio>

namespace jdxi
{
    namespace ProgramBank
    {

        namespace
        {
            // LSB per bank pair: A/B, C/D, E/F, G/H
            const uint8_t kPairLsb[kNumBanks / 2] = {64, 65, 0, 1};

            bool validBank(char bank) { return bank >= 'A' && bank <= 'H'; }
            bool validSlot(int slot) { return slot >= 1 && slot <= kSlotsPerBank; }
        }

        Result<ProgramMidiValues> resolve(char bank, int slot)
        {
            if (!validBank(bank))
                return Result<ProgramMidiValues>::failure(ErrorCode::UnknownBank);
            if (!validSlot(slot))
                return Result<ProgramMidiValues>::failure(ErrorCode::SlotOutOfRange);

            const int bankIndex = bank - 'A';
            const bool secondOfPair = (bankIndex % 2) == 1;

            ProgramMidiValues v;
            v.msb = kBankMsb;
            v.lsb = kPairLsb[bankIndex / 2];
            v.pc = static_cast<uint8_t>(slot - 1 + (secondOfPair ? kSlotsPerBank : 0));
            return Result<ProgramMidiValues>::success(v);
        }

        Result<ProgramMidiValues> resolve(const ProgramIdentity &program)
        {
            return resolve(program.bank, program.slot);
        }

        Result<ProgramIdentity> unresolve(uint8_t msb, uint8_t lsb, uint8_t pc)
        {
            if (pc > 0x7F)
                return Result<ProgramIdentity>::failure(ErrorCode::ByteRange);
            if (msb != kBankMsb)
                return Result<ProgramIdentity>::failure(ErrorCode::UnknownBank);

            for (int pair = 0; pair < kNumBanks / 2; ++pair)
            {
                if (kPairLsb[pair] != lsb)
                    continue;

                ProgramIdentity p;
                p.bank = static_cast<char>('A' + pair * 2 + (pc >= kSlotsPerBank ? 1 : 0));
                p.slot = (pc % kSlotsPerBank) + 1;
                return Result<ProgramIdentity>::success(p);
            }
            return Result<ProgramIdentity>::failure(ErrorCode::UnknownBank);
        }

        Result<ProgramIdentity> unresolve(const ProgramMidiValues &values)
        {
            return unresolve(values.msb, values.lsb, values.pc);
        }

        int programIndex(const ProgramIdentity &program)
        {
            if (!validBank(program.bank) || !validSlot(program.slot))
                return -1;
            return (program.bank - 'A') * kSlotsPerBank + program.slot - 1;
        }

        Result<ProgramIdentity> fromIndex(int index)
        {
            if (index < 0 || index >= kNumPrograms)
                return Result<ProgramIdentity>::failure(ErrorCode::SlotOutOfRange);

            ProgramIdentity p;
            p.bank = static_cast<char>('A' + index / kSlotsPerBank);
            p.slot = index % kSlotsPerBank + 1;
            return Result<ProgramIdentity>::success(p);
        }

        ProgramIdentity next(const ProgramIdentity &program)
        {
            const int index = programIndex(program);
            return fromIndex(index < 0 ? 0 : (index + 1) % kNumPrograms).value;
        }

        ProgramIdentity previous(const ProgramIdentity &program)
        {
            const int index = programIndex(program);
            return fromIndex(index <= 0 ? kNumPrograms - 1 : index - 1).value;
        }

        Result<ProgramIdentity> parseProgramId(const std::string &text)
        {
            if (text.size() < 2 || text.size() > 3)
                return Result<ProgramIdentity>::failure(ErrorCode::UnknownBank);

            const char bank = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
            if (!validBank(bank))
                return Result<ProgramIdentity>::failure(ErrorCode::UnknownBank);

            int slot = 0;
            for (size_t i = 1; i < text.size(); ++i)
            {
                if (!std::isdigit(static_cast<unsigned char>(text[i])))
                    return Result<ProgramIdentity>::failure(ErrorCode::SlotOutOfRange);
                slot = slot * 10 + (text[i] - '0');
            }
            if (!validSlot(slot))
                return Result<ProgramIdentity>::failure(ErrorCode::SlotOutOfRange);

            ProgramIdentity p;
            p.bank = bank;
            p.slot = slot;
            return Result<ProgramIdentity>::success(p);
        }

        std::string formatProgramId(const ProgramIdentity &program)
        {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "%c%02d", program.bank, program.slot);
            return buf;
        }

        const ProgramRecord *findProgram(const ProgramDirectory &directory, const ProgramIdentity &program)
        {
            const int index = programIndex(program);
            if (index < 0)
                return nullptr;
            return directory.findByIndex(index);
        }

    } // namespace ProgramBank
} // namespace jdxi
