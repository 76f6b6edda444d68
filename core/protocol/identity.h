#pragma once

#include "roland_protocol.h"
#include "protocol_error.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace jdxi
{

    /** Fields of a Universal Non-Realtime Identity Reply. */
    struct DeviceInfo
    {
        uint8_t deviceId = 0;
        uint8_t manufacturerId = 0;
        uint16_t family = 0; // LSB first on the wire
        uint16_t model = 0;
        uint8_t version[4] = {0, 0, 0, 0};

        bool isJdxi() const
        {
            return manufacturerId == Protocol::ROLAND_ID &&
                   family == ((Protocol::Identity::JDXI_FAMILY_MSB << 8) | Protocol::Identity::JDXI_FAMILY_LSB);
        }
    };

    namespace IdentityProtocol
    {
        /** F0 7E <dev> 06 01 F7. Device 0x7F addresses every device. */
        Result<SysExMessage> buildRequest(uint8_t deviceId = Protocol::BROADCAST_DEVICE_ID);

        /** F0 7E <dev> 06 02 <man> <fam lo> <fam hi> <mod lo> <mod hi> <ver x4> F7 */
        Result<DeviceInfo> parseReply(const uint8_t *data, size_t size);
        Result<DeviceInfo> parseReply(const std::vector<uint8_t> &bytes);
    }

} // namespace jdxi
