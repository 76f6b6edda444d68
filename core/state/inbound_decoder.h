#pragma once

#include "synth_observer.h"
#include "../address/address_resolver.h"
#include "../protocol/protocol_error.h"
#include "../protocol/sysex_parser.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace jdxi
{

    /** Everything one inbound DT1 carried, converted to the display domain. */
    struct InboundResult
    {
        SynthType synth = SynthType::Digital1;
        int partialIndex = 0;
        SectionKind kind = SectionKind::Common;
        std::vector<ParameterUpdate> updates;
        bool hasName = false;
        std::string name; // trailing spaces removed
    };

    /**
     * InboundDecoder - DT1 bytes -> ParameterUpdates.
     *
     * Handles single-parameter writes as well as section dumps sent in reply
     * to an RQ1: every parameter whose bytes lie entirely inside the payload
     * is decoded. A message is decoded independently of any other.
     *
     * Errors:
     *   parser errors        passed through
     *   RQ1 / foreign area   ParseError / UnknownParameter
     *   no known parameter   UnknownParameter
     *   bad value            InvalidRaw (whole message rejected)
     */
    class InboundDecoder
    {
    public:
        explicit InboundDecoder(const DeviceIdentity &identity = DeviceIdentity());

        Result<InboundResult> decode(const uint8_t *data, size_t size) const;
        Result<InboundResult> decode(const std::vector<uint8_t> &bytes) const;
        Result<InboundResult> decode(const ParsedMessage &message) const;

    private:
        SysExParser parser_;
    };

} // namespace jdxi
