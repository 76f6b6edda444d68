#pragma once

#include "../address/address_resolver.h"
#include "../params/parameter_spec.h"
#include "../protocol/protocol_error.h"
#include "../protocol/sysex_builder.h"
#include <string>
#include <vector>

namespace jdxi
{

    /** One user edit, in the display domain. */
    struct ParameterEdit
    {
        SynthType synth = SynthType::Digital1;
        int partialIndex = 0;
        std::string parameterId;
        int displayValue = 0;
    };

    /**
     * EditEncoder - single entry point from edits to outbound SysEx.
     *
     * Every method validates fully before producing bytes. A failed Result
     * means the edit was rejected and nothing should be sent.
     */
    class EditEncoder
    {
    public:
        static constexpr size_t kNameLength = 12;

        explicit EditEncoder(const DeviceIdentity &identity = DeviceIdentity());

        /** resolve -> toRaw -> encodeRaw -> DT1 */
        Result<SysExMessage> applyEdit(const ParameterEdit &edit) const;

        /** Same as applyEdit for enum parameters, value given by label. */
        Result<SysExMessage> applyEnumEdit(SynthType synth, int partialIndex,
                                           const std::string &parameterId, const std::string &label) const;

        /** RQ1 for a whole section. Without a kind, the index's first section. */
        Result<SysExMessage> requestSection(SynthType synth, int partialIndex, SectionKind kind) const;
        Result<SysExMessage> requestSection(SynthType synth, int partialIndex) const;

        /**
         * Every section request needed to resynchronise one synth. For Program
         * that is the common, effect and controller blocks plus parts and zones 1-4.
         */
        Result<std::vector<SysExMessage>> requestTone(SynthType synth) const;

        /** 12 ASCII characters (32..127), space padded, at offset 0 of the common section. */
        Result<SysExMessage> setToneName(SynthType synth, const std::string &name) const;

        const SysExMessageBuilder &builder() const { return builder_; }

    private:
        SysExMessageBuilder builder_;
    };

} // namespace jdxi
