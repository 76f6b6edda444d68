#pragma once

#include <cstdint>

namespace jdxi
{

    /** Roland area / part / group, identifying one section of the address map. */
    struct AddressTriple
    {
        uint8_t area = 0;
        uint8_t part = 0;
        uint8_t group = 0;

        bool operator==(const AddressTriple &other) const
        {
            return area == other.area && part == other.part && group == other.group;
        }
        bool operator!=(const AddressTriple &other) const { return !(*this == other); }
    };

} // namespace jdxi
