#pragma once

#include "roland_protocol.h"
#include "protocol_error.h"
#include "../address/address.h"
#include <cstdint>
#include <vector>

namespace jdxi
{

    /**
     * SysExMessageBuilder - assembles Roland DT1 / RQ1 messages.
     *
     * DT1: F0 41 dev model[4] 12 area part group param data... sum F7
     * RQ1: F0 41 dev model[4] 11 area part group param size[4] sum F7
     *
     * Every byte is range-checked before anything is produced. A byte above
     * 0x7F fails with ByteRange, it is never masked.
     */
    class SysExMessageBuilder
    {
    public:
        explicit SysExMessageBuilder(const DeviceIdentity &identity = DeviceIdentity());

        Result<SysExMessage> buildDt1(const AddressTriple &address, uint8_t offset, uint8_t value) const;
        Result<SysExMessage> buildDt1(const AddressTriple &address, uint8_t offset, const std::vector<uint8_t> &data) const;

        /** length is a byte count, sent as four 7-bit bytes (195 -> 00 00 01 43). */
        Result<SysExMessage> buildRq1(const AddressTriple &address, uint8_t offset, uint32_t length) const;

        const DeviceIdentity &identity() const { return identity_; }

    private:
        Result<SysExMessage> build(uint8_t command, const AddressTriple &address, uint8_t offset,
                                   const std::vector<uint8_t> &payload) const;

        DeviceIdentity identity_;
    };

    /** Four 7-bit bytes, most significant first. Fails above 2^28 - 1. */
    Result<std::vector<uint8_t>> encodeRequestSize(uint32_t length);

    uint32_t decodeRequestSize(const uint8_t *bytes);

} // namespace jdxi
