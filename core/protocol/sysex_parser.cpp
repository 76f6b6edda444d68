#include "sysex_parser.h"
#include "sysex_builder.h"
#include "checksum.h"

namespace jdxi
{

    uint32_t ParsedMessage::requestedLength() const
    {
        if (!isRequest() || data.size() != Protocol::RQ1_SIZE_LENGTH)
            return 0;
        return decodeRequestSize(data.data());
    }

    SysExParser::SysExParser(const DeviceIdentity &identity)
        : identity_(identity)
    {
    }

    Result<ParsedMessage> SysExParser::parse(const std::vector<uint8_t> &bytes) const
    {
        return parse(bytes.data(), bytes.size());
    }

    Result<ParsedMessage> SysExParser::parse(const uint8_t *data, size_t size) const
    {
        using namespace Protocol;

        if (data == nullptr || size < MIN_MESSAGE_LENGTH)
            return Result<ParsedMessage>::failure(ErrorCode::TruncatedMessage);

        if (data[0] != SYSEX_START || data[size - 1] != SYSEX_END)
            return Result<ParsedMessage>::failure(ErrorCode::ParseError);

        // Header
        if (data[1] != identity_.manufacturerId || data[2] != identity_.deviceId)
            return Result<ParsedMessage>::failure(ErrorCode::ParseError);
        for (size_t i = 0; i < MODEL_ID_LENGTH; ++i)
        {
            if (data[3 + i] != identity_.modelId[i])
                return Result<ParsedMessage>::failure(ErrorCode::ParseError);
        }

        const uint8_t command = data[HEADER_LENGTH];
        if (command != Command::DT1 && command != Command::RQ1)
            return Result<ParsedMessage>::failure(ErrorCode::ParseError);

        // Address + data + checksum, all 7-bit
        const size_t bodyStart = HEADER_LENGTH + 1;
        const size_t checksumIndex = size - 2;
        for (size_t i = bodyStart; i <= checksumIndex; ++i)
        {
            if (data[i] > 0x7F)
                return Result<ParsedMessage>::failure(ErrorCode::ParseError);
        }

        const size_t dataStart = bodyStart + ADDRESS_LENGTH;
        const size_t dataLength = checksumIndex - dataStart;
        if (command == Command::DT1 && dataLength == 0)
            return Result<ParsedMessage>::failure(ErrorCode::ParseError);
        if (command == Command::RQ1 && dataLength != RQ1_SIZE_LENGTH)
            return Result<ParsedMessage>::failure(ErrorCode::ParseError);

        if (rolandChecksum(data + bodyStart, checksumIndex - bodyStart) != data[checksumIndex])
            return Result<ParsedMessage>::failure(ErrorCode::ChecksumMismatch);

        ParsedMessage msg;
        msg.deviceId = data[2];
        msg.command = command;
        msg.address = AddressTriple{data[bodyStart], data[bodyStart + 1], data[bodyStart + 2]};
        msg.offset = data[bodyStart + 3];
        msg.data.assign(data + dataStart, data + checksumIndex);
        return Result<ParsedMessage>::success(msg);
    }

} // namespace jdxi
