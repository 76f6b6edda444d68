#include "edit_encoder.h"
#include "../params/value_codec.h"

namespace jdxi
{

    EditEncoder::EditEncoder(const DeviceIdentity &identity)
        : builder_(identity)
    {
    }

    Result<SysExMessage> EditEncoder::applyEdit(const ParameterEdit &edit) const
    {
        auto resolved = AddressResolver::resolve(edit.synth, edit.partialIndex, edit.parameterId);
        if (!resolved.ok())
            return Result<SysExMessage>::failure(resolved.error);

        const ParameterSpec &spec = *resolved.value.spec;

        auto raw = ValueCodec::toRaw(spec, edit.displayValue);
        if (!raw.ok())
            return Result<SysExMessage>::failure(raw.error);

        auto bytes = ValueCodec::encodeRaw(spec, raw.value);
        if (!bytes.ok())
            return Result<SysExMessage>::failure(bytes.error);

        return builder_.buildDt1(resolved.value.address, resolved.value.offset, bytes.value);
    }

    Result<SysExMessage> EditEncoder::applyEnumEdit(SynthType synth, int partialIndex,
                                                    const std::string &parameterId, const std::string &label) const
    {
        auto resolved = AddressResolver::resolve(synth, partialIndex, parameterId);
        if (!resolved.ok())
            return Result<SysExMessage>::failure(resolved.error);

        auto index = ValueCodec::optionIndex(*resolved.value.spec, label);
        if (!index.ok())
            return Result<SysExMessage>::failure(index.error);

        ParameterEdit edit;
        edit.synth = synth;
        edit.partialIndex = partialIndex;
        edit.parameterId = parameterId;
        edit.displayValue = index.value;
        return applyEdit(edit);
    }

    Result<SysExMessage> EditEncoder::requestSection(SynthType synth, int partialIndex, SectionKind kind) const
    {
        auto section = AddressResolver::section(synth, partialIndex, kind);
        if (!section.ok())
            return Result<SysExMessage>::failure(section.error);

        return builder_.buildRq1(section.value.base, 0x00, section.value.table->sectionSize);
    }

    Result<SysExMessage> EditEncoder::requestSection(SynthType synth, int partialIndex) const
    {
        auto section = AddressResolver::section(synth, partialIndex);
        if (!section.ok())
            return Result<SysExMessage>::failure(section.error);

        return builder_.buildRq1(section.value.base, 0x00, section.value.table->sectionSize);
    }

    Result<std::vector<SysExMessage>> EditEncoder::requestTone(SynthType synth) const
    {
        std::vector<SysExMessage> requests;

        for (int i = 0; i <= AddressResolver::maxPartialIndex(synth); ++i)
        {
            for (SectionKind kind : AddressResolver::sectionKinds(synth, i))
            {
                auto request = requestSection(synth, i, kind);
                if (!request.ok())
                    return Result<std::vector<SysExMessage>>::failure(request.error);
                requests.push_back(request.value);
            }
        }

        return Result<std::vector<SysExMessage>>::success(requests);
    }

    Result<SysExMessage> EditEncoder::setToneName(SynthType synth, const std::string &name) const
    {
        if (name.size() > kNameLength)
            return Result<SysExMessage>::failure(ErrorCode::OutOfRange);

        std::vector<uint8_t> chars(kNameLength, ' ');
        for (size_t i = 0; i < name.size(); ++i)
        {
            const unsigned char c = static_cast<unsigned char>(name[i]);
            if (c < 32 || c > 127)
                return Result<SysExMessage>::failure(ErrorCode::OutOfRange);
            chars[i] = c;
        }

        auto section = AddressResolver::section(synth, 0, SectionKind::Common);
        if (!section.ok())
            return Result<SysExMessage>::failure(section.error);

        return builder_.buildDt1(section.value.base, 0x00, chars);
    }

} // namespace jdxi
