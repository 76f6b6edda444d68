/**
 * @file roland_protocol.h
 * @brief Roland JD-Xi SysEx protocol constants
 *
 * Messages use the Roland exclusive format:
 *   F0 41 <device> <model x4> <command> <area> <part> <group> <param> <data...> <checksum> F7
 *
 * The JD-Xi model id is 00 00 00 0E. Device id 0x10 is the factory default.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace jdxi
{
    namespace Protocol
    {

        // =============================================================================
        // Framing
        // =============================================================================

        static constexpr uint8_t SYSEX_START = 0xF0;
        static constexpr uint8_t SYSEX_END = 0xF7;
        static constexpr uint8_t ROLAND_ID = 0x41;
        static constexpr uint8_t DEFAULT_DEVICE_ID = 0x10;
        static constexpr uint8_t BROADCAST_DEVICE_ID = 0x7F;
        static constexpr uint8_t MODEL_ID_LENGTH = 4;

        // F0 + manufacturer + device + model
        static constexpr size_t HEADER_LENGTH = 3 + MODEL_ID_LENGTH;
        static constexpr size_t ADDRESS_LENGTH = 4;
        static constexpr size_t RQ1_SIZE_LENGTH = 4;

        // Header + command + address + checksum + F7
        static constexpr size_t MIN_MESSAGE_LENGTH = HEADER_LENGTH + 1 + ADDRESS_LENGTH + 2;

        // Single-byte DT1 write
        static constexpr size_t DT1_SINGLE_LENGTH = MIN_MESSAGE_LENGTH + 1;

        // =============================================================================
        // Commands
        // =============================================================================
        namespace Command
        {
            static constexpr uint8_t RQ1 = 0x11; // Request data 1
            static constexpr uint8_t DT1 = 0x12; // Data set 1
        }

        // =============================================================================
        // Address map - area byte
        // =============================================================================
        namespace Area
        {
            static constexpr uint8_t TEMPORARY_PROGRAM = 0x18;
            static constexpr uint8_t TEMPORARY_TONE = 0x19;
        }

        // =============================================================================
        // Address map - part byte (TEMPORARY_PROGRAM uses PROGRAM only)
        // =============================================================================
        namespace Part
        {
            static constexpr uint8_t PROGRAM = 0x00;
            static constexpr uint8_t DIGITAL_1 = 0x01;
            static constexpr uint8_t DIGITAL_2 = 0x21;
            static constexpr uint8_t ANALOG = 0x42;
            static constexpr uint8_t DRUMS = 0x70;
        }

        // =============================================================================
        // Address map - group byte
        // =============================================================================
        namespace Group
        {
            static constexpr uint8_t COMMON = 0x00;
            static constexpr uint8_t DIGITAL_PARTIAL_1 = 0x20;
            static constexpr uint8_t DIGITAL_MODIFY = 0x50;
            static constexpr uint8_t DRUM_PARTIAL_FIRST = 0x2E;
            static constexpr uint8_t DRUM_PARTIAL_STRIDE = 2;

            // TEMPORARY_PROGRAM
            static constexpr uint8_t PROGRAM_VOCAL_EFFECT = 0x01;
            static constexpr uint8_t PROGRAM_EFFECT_1 = 0x02;
            static constexpr uint8_t PROGRAM_EFFECT_2 = 0x04;
            static constexpr uint8_t PROGRAM_DELAY = 0x06;
            static constexpr uint8_t PROGRAM_REVERB = 0x08;
            static constexpr uint8_t PROGRAM_PART_FIRST = 0x20; // digital 1, digital 2, analog, drums
            static constexpr uint8_t PROGRAM_ZONE_FIRST = 0x30;
            static constexpr uint8_t PROGRAM_CONTROLLER = 0x40;
        }

        // =============================================================================
        // Universal non-realtime identity
        // =============================================================================
        namespace Identity
        {
            static constexpr uint8_t UNIVERSAL_NON_REALTIME = 0x7E;
            static constexpr uint8_t GENERAL_INFORMATION = 0x06;
            static constexpr uint8_t IDENTITY_REQUEST = 0x01;
            static constexpr uint8_t IDENTITY_REPLY = 0x02;
            static constexpr uint8_t JDXI_FAMILY_LSB = 0x0E;
            static constexpr uint8_t JDXI_FAMILY_MSB = 0x03;
            static constexpr size_t REPLY_LENGTH = 15;
        }

    } // namespace Protocol

    /**
     * Who we are talking to. Set once at startup and passed by value
     * into the builder, the parser and the edit encoder.
     */
    struct DeviceIdentity
    {
        uint8_t manufacturerId = Protocol::ROLAND_ID;
        uint8_t deviceId = Protocol::DEFAULT_DEVICE_ID;
        uint8_t modelId[Protocol::MODEL_ID_LENGTH] = {0x00, 0x00, 0x00, 0x0E};
    };

    /** A complete SysEx byte sequence including F0 and F7. */
    using SysExMessage = std::vector<uint8_t>;

} // namespace jdxi
