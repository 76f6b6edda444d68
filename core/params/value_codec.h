#pragma once

#include "parameter_spec.h"
#include "../protocol/protocol_error.h"
#include <cstdint>
#include <string>
#include <vector>

namespace jdxi
{

    /**
     * Conversion between a parameter's display domain and its raw MIDI domain.
     *
     * Pure functions, no state. All conversions are idempotent once quantized:
     * toDisplay(toRaw(toDisplay(r))) == toDisplay(r) for every valid raw r.
     */
    namespace ValueCodec
    {

        //=========================================================================
        // Display <-> raw
        //=========================================================================

        /** Fails with OutOfRange when display lies outside the display range. */
        Result<int> toRaw(const ParameterSpec &spec, int display);

        /**
         * Fails with InvalidRaw when raw lies outside the raw range, or for
         * enums when raw is not one of the listed options.
         */
        Result<int> toDisplay(const ParameterSpec &spec, int raw);

        //=========================================================================
        // Enum labels
        //=========================================================================

        /** Option index for a label (case-insensitive). OutOfRange if absent. */
        Result<int> optionIndex(const ParameterSpec &spec, const std::string &label);

        Result<int> toRawFromLabel(const ParameterSpec &spec, const std::string &label);

        /** Label of an option index, or nullptr for non-enum specs / bad index. */
        const char *optionLabel(const ParameterSpec &spec, int display);

        //=========================================================================
        // Raw <-> wire bytes
        //=========================================================================

        /**
         * Wire bytes for a raw value: one 7-bit byte, or one nibble per byte
         * (most significant first) for 2- and 4-byte parameters.
         */
        Result<std::vector<uint8_t>> encodeRaw(const ParameterSpec &spec, int raw);

        Result<int> decodeRaw(const ParameterSpec &spec, const uint8_t *data, size_t count);

    } // namespace ValueCodec

} // namespace jdxi
