#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace jdxi
{

    /**
     * Roland checksum over an address+data run.
     * The low 7 bits of (sum + checksum) are always zero.
     */
    inline uint8_t rolandChecksum(const uint8_t *bytes, size_t count)
    {
        unsigned int sum = 0;
        for (size_t i = 0; i < count; ++i)
            sum += bytes[i];
        return static_cast<uint8_t>((128 - (sum % 128)) % 128);
    }

    inline uint8_t rolandChecksum(const std::vector<uint8_t> &bytes)
    {
        return rolandChecksum(bytes.data(), bytes.size());
    }

} // namespace jdxi
