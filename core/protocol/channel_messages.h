#pragma once

#include "protocol_error.h"
#include <cstdint>
#include <vector>

namespace jdxi
{

    /** Bank select + program change values for one JD-Xi program. */
    struct ProgramMidiValues
    {
        uint8_t msb = 0;
        uint8_t lsb = 0;
        uint8_t pc = 0;

        bool operator==(const ProgramMidiValues &other) const
        {
            return msb == other.msb && lsb == other.lsb && pc == other.pc;
        }
    };

    /**
     * Channel voice messages sent alongside SysEx.
     *
     * This is a pure data transformation layer - no state, no side effects.
     * Channels are 0-based (0..15); all other bytes must be 0..127.
     */
    namespace ChannelMessages
    {

        using Message = std::vector<uint8_t>;

        namespace Status
        {
            constexpr uint8_t NOTE_OFF = 0x80;
            constexpr uint8_t NOTE_ON = 0x90;
            constexpr uint8_t CONTROL_CHANGE = 0xB0;
            constexpr uint8_t PROGRAM_CHANGE = 0xC0;
        }

        namespace Controller
        {
            constexpr uint8_t BANK_SELECT_MSB = 0;
            constexpr uint8_t BANK_SELECT_LSB = 32;
        }

        // JD-Xi factory receive channels (0-based)
        namespace Channel
        {
            constexpr uint8_t DIGITAL_1 = 0;
            constexpr uint8_t DIGITAL_2 = 1;
            constexpr uint8_t ANALOG = 2;
            constexpr uint8_t DRUMS = 9;
            constexpr uint8_t PROGRAM = 15;
        }

        //=========================================================================
        // Encoders
        //=========================================================================

        inline Result<Message> channelMessage(uint8_t status, uint8_t channel, uint8_t data1)
        {
            if (channel > 0x0F || data1 > 0x7F)
                return Result<Message>::failure(ErrorCode::ByteRange);
            return Result<Message>::success({static_cast<uint8_t>(status | channel), data1});
        }

        inline Result<Message> channelMessage(uint8_t status, uint8_t channel, uint8_t data1, uint8_t data2)
        {
            if (channel > 0x0F || data1 > 0x7F || data2 > 0x7F)
                return Result<Message>::failure(ErrorCode::ByteRange);
            return Result<Message>::success({static_cast<uint8_t>(status | channel), data1, data2});
        }

        inline Result<Message> noteOn(uint8_t channel, uint8_t note, uint8_t velocity)
        {
            return channelMessage(Status::NOTE_ON, channel, note, velocity);
        }

        inline Result<Message> noteOff(uint8_t channel, uint8_t note, uint8_t velocity = 0)
        {
            return channelMessage(Status::NOTE_OFF, channel, note, velocity);
        }

        inline Result<Message> controlChange(uint8_t channel, uint8_t controller, uint8_t value)
        {
            return channelMessage(Status::CONTROL_CHANGE, channel, controller, value);
        }

        inline Result<Message> programChange(uint8_t channel, uint8_t program)
        {
            return channelMessage(Status::PROGRAM_CHANGE, channel, program);
        }

        /**
         * Bank select and program change, in the order the device requires:
         * CC#0 (msb), CC#32 (lsb), Program Change (pc).
         */
        inline Result<std::vector<Message>> programSelect(uint8_t channel, const ProgramMidiValues &values)
        {
            auto msb = controlChange(channel, Controller::BANK_SELECT_MSB, values.msb);
            auto lsb = controlChange(channel, Controller::BANK_SELECT_LSB, values.lsb);
            auto pc = programChange(channel, values.pc);

            if (!msb.ok() || !lsb.ok() || !pc.ok())
                return Result<std::vector<Message>>::failure(ErrorCode::ByteRange);

            return Result<std::vector<Message>>::success({msb.value, lsb.value, pc.value});
        }

    } // namespace ChannelMessages

} // namespace jdxi
