#pragma once

#include "../params/parameter_spec.h"
#include "../program/program_bank.h"
#include <string>

namespace jdxi
{

    /** A parameter value received from the device, in both domains. */
    struct ParameterUpdate
    {
        SynthType synth = SynthType::Digital1;
        int partialIndex = 0;
        std::string parameterId;
        int displayValue = 0;
        int rawValue = 0;
    };

    /**
     * Observer interface for SynthState changes.
     * Implement this to be notified when the device's state changes.
     * All methods have default empty implementations so you only override what you need.
     */
    class SynthObserver
    {
    public:
        virtual ~SynthObserver() = default;

        // Parameter changes (only called when the value actually changed)
        virtual void onParameterChanged(const ParameterUpdate &update) {}

        // Tone / program names
        virtual void onToneNameChanged(SynthType synth, int partialIndex, const std::string &name) {}

        // Program selection
        virtual void onProgramChanged(const ProgramIdentity &program) {}

        // Cache dropped, e.g. before a full re-request
        virtual void onStateCleared() {}
    };

} // namespace jdxi
