#include "inbound_decoder.h"
#include "../params/value_codec.h"

namespace jdxi
{

    namespace
    {
        constexpr uint32_t kNameLength = 12;
        constexpr uint32_t kGroupSpan = 128;
    }

    InboundDecoder::InboundDecoder(const DeviceIdentity &identity)
        : parser_(identity)
    {
    }

    Result<InboundResult> InboundDecoder::decode(const std::vector<uint8_t> &bytes) const
    {
        return decode(bytes.data(), bytes.size());
    }

    Result<InboundResult> InboundDecoder::decode(const uint8_t *data, size_t size) const
    {
        auto parsed = parser_.parse(data, size);
        if (!parsed.ok())
            return Result<InboundResult>::failure(parsed.error);
        return decode(parsed.value);
    }

    Result<InboundResult> InboundDecoder::decode(const ParsedMessage &message) const
    {
        if (!message.isDataSet())
            return Result<InboundResult>::failure(ErrorCode::ParseError);

        int carry = 0;
        auto section = AddressResolver::locate(message.address, &carry);
        if (!section.ok())
            return Result<InboundResult>::failure(section.error);

        const SectionAddress &sec = section.value;

        InboundResult result;
        result.synth = sec.synth;
        result.partialIndex = sec.partialIndex;
        result.kind = sec.kind;

        // Payload window, as byte positions from the start of the section
        const uint32_t start = static_cast<uint32_t>(carry) * kGroupSpan + message.offset;
        const uint32_t end = start + static_cast<uint32_t>(message.data.size());

        // Name run at 0x00-0x0B of common and drum partial sections
        const bool hasNameRun = sec.kind == SectionKind::Common || sec.synth == SynthType::Drums;
        if (hasNameRun && start == 0 && end >= kNameLength)
        {
            std::string name;
            for (uint32_t i = 0; i < kNameLength; ++i)
            {
                const uint8_t c = message.data[i];
                if (c < 32)
                    return Result<InboundResult>::failure(ErrorCode::InvalidRaw);
                name += static_cast<char>(c);
            }
            const size_t last = name.find_last_not_of(' ');
            name.erase(last == std::string::npos ? 0 : last + 1);

            result.hasName = true;
            result.name = name;
        }

        const ParameterTable &table = *sec.table;
        for (size_t i = 0; i < table.numParams; ++i)
        {
            const ParameterSpec &spec = table.params[i];
            const uint32_t pos = linearOffset(spec.offset);
            if (pos < start || pos + spec.size > end)
                continue;

            auto raw = ValueCodec::decodeRaw(spec, message.data.data() + (pos - start), spec.size);
            if (!raw.ok())
                return Result<InboundResult>::failure(raw.error);

            auto display = ValueCodec::toDisplay(spec, raw.value);
            if (!display.ok())
                return Result<InboundResult>::failure(display.error);

            ParameterUpdate update;
            update.synth = sec.synth;
            update.partialIndex = sec.partialIndex;
            update.parameterId = spec.name;
            update.displayValue = display.value;
            update.rawValue = raw.value;
            result.updates.push_back(update);
        }

        if (result.updates.empty() && !result.hasName)
            return Result<InboundResult>::failure(ErrorCode::UnknownParameter);

        return Result<InboundResult>::success(result);
    }

} // namespace jdxi
