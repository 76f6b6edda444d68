#include "sysex_builder.h"
#include "checksum.h"

namespace jdxi
{

    namespace
    {
        bool isDataByte(uint8_t b) { return b <= 0x7F; }
    }

    SysExMessageBuilder::SysExMessageBuilder(const DeviceIdentity &identity)
        : identity_(identity)
    {
    }

    Result<SysExMessage> SysExMessageBuilder::buildDt1(const AddressTriple &address, uint8_t offset, uint8_t value) const
    {
        return buildDt1(address, offset, std::vector<uint8_t>{value});
    }

    Result<SysExMessage> SysExMessageBuilder::buildDt1(const AddressTriple &address, uint8_t offset,
                                                       const std::vector<uint8_t> &data) const
    {
        if (data.empty())
            return Result<SysExMessage>::failure(ErrorCode::EmptyPayload);
        return build(Protocol::Command::DT1, address, offset, data);
    }

    Result<SysExMessage> SysExMessageBuilder::buildRq1(const AddressTriple &address, uint8_t offset, uint32_t length) const
    {
        if (length == 0)
            return Result<SysExMessage>::failure(ErrorCode::EmptyPayload);

        auto size = encodeRequestSize(length);
        if (!size.ok())
            return Result<SysExMessage>::failure(size.error);
        return build(Protocol::Command::RQ1, address, offset, size.value);
    }

    Result<SysExMessage> SysExMessageBuilder::build(uint8_t command, const AddressTriple &address, uint8_t offset,
                                                    const std::vector<uint8_t> &payload) const
    {
        // Validate everything first so nothing is produced on failure
        if (!isDataByte(identity_.manufacturerId) || !isDataByte(identity_.deviceId))
            return Result<SysExMessage>::failure(ErrorCode::ByteRange);
        for (uint8_t b : identity_.modelId)
        {
            if (!isDataByte(b))
                return Result<SysExMessage>::failure(ErrorCode::ByteRange);
        }
        if (!isDataByte(address.area) || !isDataByte(address.part) ||
            !isDataByte(address.group) || !isDataByte(offset))
            return Result<SysExMessage>::failure(ErrorCode::ByteRange);
        for (uint8_t b : payload)
        {
            if (!isDataByte(b))
                return Result<SysExMessage>::failure(ErrorCode::ByteRange);
        }

        SysExMessage msg;
        msg.reserve(Protocol::MIN_MESSAGE_LENGTH + payload.size());

        msg.push_back(Protocol::SYSEX_START);
        msg.push_back(identity_.manufacturerId);
        msg.push_back(identity_.deviceId);
        for (uint8_t b : identity_.modelId)
            msg.push_back(b);
        msg.push_back(command);

        // Checksum covers address + data
        const size_t checksumStart = msg.size();
        msg.push_back(address.area);
        msg.push_back(address.part);
        msg.push_back(address.group);
        msg.push_back(offset);
        msg.insert(msg.end(), payload.begin(), payload.end());

        msg.push_back(rolandChecksum(msg.data() + checksumStart, msg.size() - checksumStart));
        msg.push_back(Protocol::SYSEX_END);

        return Result<SysExMessage>::success(msg);
    }

    Result<std::vector<uint8_t>> encodeRequestSize(uint32_t length)
    {
        if (length > 0x0FFFFFFFu)
            return Result<std::vector<uint8_t>>::failure(ErrorCode::ByteRange);

        return Result<std::vector<uint8_t>>::success({static_cast<uint8_t>((length >> 21) & 0x7F),
                                                      static_cast<uint8_t>((length >> 14) & 0x7F),
                                                      static_cast<uint8_t>((length >> 7) & 0x7F),
                                                      static_cast<uint8_t>(length & 0x7F)});
    }

    uint32_t decodeRequestSize(const uint8_t *bytes)
    {
        return (static_cast<uint32_t>(bytes[0] & 0x7F) << 21) |
               (static_cast<uint32_t>(bytes[1] & 0x7F) << 14) |
               (static_cast<uint32_t>(bytes[2] & 0x7F) << 7) |
               static_cast<uint32_t>(bytes[3] & 0x7F);
    }

} // namespace jdxi
