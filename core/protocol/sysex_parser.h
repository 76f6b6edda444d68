#pragma once

#include "roland_protocol.h"
#include "protocol_error.h"
#include "../address/address.h"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace jdxi
{

    /** A validated Roland DT1 or RQ1 message. */
    struct ParsedMessage
    {
        uint8_t deviceId = 0;
        uint8_t command = 0;
        AddressTriple address;
        uint8_t offset = 0;
        std::vector<uint8_t> data; // DT1 values, or the 4 RQ1 size bytes

        bool isDataSet() const { return command == Protocol::Command::DT1; }
        bool isRequest() const { return command == Protocol::Command::RQ1; }

        /** RQ1 only: requested byte count. */
        uint32_t requestedLength() const;
    };

    /**
     * SysExParser - validates inbound Roland exclusive messages against the
     * configured device identity.
     *
     * Never reads past the end of the input. Inputs shorter than the minimum
     * message length fail with TruncatedMessage; everything else that is
     * malformed fails with ParseError, or ChecksumMismatch for a bad sum.
     */
    class SysExParser
    {
    public:
        explicit SysExParser(const DeviceIdentity &identity = DeviceIdentity());

        Result<ParsedMessage> parse(const uint8_t *data, size_t size) const;
        Result<ParsedMessage> parse(const std::vector<uint8_t> &bytes) const;

    private:
        DeviceIdentity identity_;
    };

} // namespace jdxi
