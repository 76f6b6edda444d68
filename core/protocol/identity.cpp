#include "identity.h"

namespace jdxi
{
    namespace IdentityProtocol
    {

        Result<SysExMessage> buildRequest(uint8_t deviceId)
        {
            if (deviceId > 0x7F)
                return Result<SysExMessage>::failure(ErrorCode::ByteRange);

            return Result<SysExMessage>::success({Protocol::SYSEX_START,
                                                  Protocol::Identity::UNIVERSAL_NON_REALTIME,
                                                  deviceId,
                                                  Protocol::Identity::GENERAL_INFORMATION,
                                                  Protocol::Identity::IDENTITY_REQUEST,
                                                  Protocol::SYSEX_END});
        }

        Result<DeviceInfo> parseReply(const std::vector<uint8_t> &bytes)
        {
            return parseReply(bytes.data(), bytes.size());
        }

        Result<DeviceInfo> parseReply(const uint8_t *data, size_t size)
        {
            using namespace Protocol;

            if (data == nullptr || size < Identity::REPLY_LENGTH)
                return Result<DeviceInfo>::failure(ErrorCode::TruncatedMessage);

            if (size != Identity::REPLY_LENGTH ||
                data[0] != SYSEX_START || data[size - 1] != SYSEX_END ||
                data[1] != Identity::UNIVERSAL_NON_REALTIME ||
                data[3] != Identity::GENERAL_INFORMATION ||
                data[4] != Identity::IDENTITY_REPLY)
                return Result<DeviceInfo>::failure(ErrorCode::ParseError);

            for (size_t i = 1; i < size - 1; ++i)
            {
                if (data[i] > 0x7F)
                    return Result<DeviceInfo>::failure(ErrorCode::ParseError);
            }

            DeviceInfo info;
            info.deviceId = data[2];
            info.manufacturerId = data[5];
            info.family = static_cast<uint16_t>(data[6] | (data[7] << 8));
            info.model = static_cast<uint16_t>(data[8] | (data[9] << 8));
            for (size_t i = 0; i < 4; ++i)
                info.version[i] = data[10 + i];
            return Result<DeviceInfo>::success(info);
        }

    } // namespace IdentityProtocol
} // namespace jdxi
