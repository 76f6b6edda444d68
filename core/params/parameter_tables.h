#pragma once

#include "parameter_spec.h"
#include <cstdint>
#include <string>

/**
 * Parameter Tables - static address map of the JD-Xi temporary tone and
 * temporary program areas.
 *
 * One namespace per addressable section. Each section declares its option
 * lists, its kParams array and a kTable entry that the address resolver
 * binds to a (synth type, partial index) pair.
 *
 * Tone and partial names (offsets 0x00-0x0B) are not listed here. They are
 * written as a 12-byte ASCII run, see EditEncoder::setToneName.
 *
 * To add a parameter:
 * 1. Append it to the section's kParams, keeping offsets ascending
 * 2. Declare an option list if it is an enumeration
 */

namespace jdxi
{
    namespace Params
    {

        //=========================================================================
        // Shared option lists
        //=========================================================================

        inline const EnumOption kOffOnOptions[] = {{0, "OFF"}, {1, "ON"}};
        inline const EnumOptionList kOffOn = {kOffOnOptions, 2};

        inline const EnumOption kLfoShapeOptions[] = {
            {0, "TRI"}, {1, "SIN"}, {2, "SAW"}, {3, "SQR"}, {4, "S&H"}, {5, "RND"}};
        inline const EnumOptionList kLfoShape = {kLfoShapeOptions, 6};

        inline const EnumOption kSyncNoteOptions[] = {
            {0, "16"}, {1, "12"}, {2, "8"}, {3, "4"}, {4, "2"}, {5, "1"}, {6, "3/4"},
            {7, "2/3"}, {8, "1/2"}, {9, "3/8"}, {10, "1/3"}, {11, "1/4"}, {12, "3/16"},
            {13, "1/6"}, {14, "1/8"}, {15, "3/32"}, {16, "1/12"}, {17, "1/16"},
            {18, "1/24"}, {19, "1/32"}};
        inline const EnumOptionList kSyncNote = {kSyncNoteOptions, 20};

        inline const EnumOption kWaveGainOptions[] = {
            {0, "-6dB"}, {1, "0dB"}, {2, "+6dB"}, {3, "+12dB"}};
        inline const EnumOptionList kWaveGain = {kWaveGainOptions, 4};

        inline const EnumOption kOutputAssignOptions[] = {
            {0, "EFX1"}, {1, "EFX2"}, {2, "DLY"}, {3, "REV"}, {4, "DIR"}};
        inline const EnumOptionList kOutputAssign = {kOutputAssignOptions, 5};

        inline const EnumOption kNoteNameOptions[] = {
            {0, "C"}, {1, "C#"}, {2, "D"}, {3, "D#"}, {4, "E"}, {5, "F"},
            {6, "F#"}, {7, "G"}, {8, "G#"}, {9, "A"}, {10, "A#"}, {11, "B"}};
        inline const EnumOptionList kNoteName = {kNoteNameOptions, 12};

        //=========================================================================
        // Digital synth - common (group 0x00)
        //=========================================================================
        namespace DigitalCommon
        {
            inline const EnumOption kRingOptions[] = {{0, "OFF"}, {2, "ON"}};
            inline const EnumOptionList kRing = {kRingOptions, 2};

            inline const EnumOption kPortamentoModeOptions[] = {{0, "NORMAL"}, {1, "LEGATO"}};
            inline const EnumOptionList kPortamentoMode = {kPortamentoModeOptions, 2};

            inline const EnumOption kUnisonSizeOptions[] = {{0, "2"}, {1, "4"}, {2, "6"}, {3, "8"}};
            inline const EnumOptionList kUnisonSize = {kUnisonSizeOptions, 4};

            inline const ParameterSpec kParams[] = {
                {"TONE_LEVEL", 0x0C, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PORTAMENTO_SWITCH", 0x12, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"PORTAMENTO_TIME", 0x13, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"MONO_SWITCH", 0x14, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"OCTAVE_SHIFT", 0x15, 61, 67, -3, 3, ValueEncoding::SignedOffset},
                {"PITCH_BEND_UP", 0x16, 0, 24, 0, 24, ValueEncoding::Unsigned},
                {"PITCH_BEND_DOWN", 0x17, 0, 24, 0, 24, ValueEncoding::Unsigned},
                {"PARTIAL1_SWITCH", 0x19, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"PARTIAL1_SELECT", 0x1A, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"PARTIAL2_SWITCH", 0x1B, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"PARTIAL2_SELECT", 0x1C, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"PARTIAL3_SWITCH", 0x1D, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"PARTIAL3_SELECT", 0x1E, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"RING_SWITCH", 0x1F, 0, 2, 0, 1, ValueEncoding::Enum, &kRing},
                {"UNISON_SWITCH", 0x2E, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"PORTAMENTO_MODE", 0x31, 0, 1, 0, 1, ValueEncoding::Enum, &kPortamentoMode},
                {"LEGATO_SWITCH", 0x32, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"ANALOG_FEEL", 0x34, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"WAVE_SHAPE", 0x35, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TONE_CATEGORY", 0x36, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"UNISON_SIZE", 0x3C, 0, 3, 0, 3, ValueEncoding::Enum, &kUnisonSize},
            };
            inline const ParameterTable kTable = {"Digital Common", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x40};
        }

        //=========================================================================
        // Digital synth - partial 1..3 (groups 0x20-0x22)
        //=========================================================================
        namespace DigitalPartial
        {
            inline const EnumOption kOscWaveOptions[] = {
                {0, "SAW"}, {1, "SQR"}, {2, "PW-SQR"}, {3, "TRI"},
                {4, "SINE"}, {5, "NOISE"}, {6, "SUPER-SAW"}, {7, "PCM"}};
            inline const EnumOptionList kOscWave = {kOscWaveOptions, 8};

            inline const EnumOption kVariationOptions[] = {{0, "A"}, {1, "B"}, {2, "C"}};
            inline const EnumOptionList kVariation = {kVariationOptions, 3};

            inline const EnumOption kFilterModeOptions[] = {
                {0, "BYPASS"}, {1, "LPF"}, {2, "HPF"}, {3, "BPF"},
                {4, "PKG"}, {5, "LPF2"}, {6, "LPF3"}, {7, "LPF4"}};
            inline const EnumOptionList kFilterMode = {kFilterModeOptions, 8};

            inline const EnumOption kFilterSlopeOptions[] = {{0, "-12dB"}, {1, "-24dB"}};
            inline const EnumOptionList kFilterSlope = {kFilterSlopeOptions, 2};

            inline const ParameterSpec kParams[] = {
                // Oscillator
                {"OSC_WAVE", 0x00, 0, 7, 0, 7, ValueEncoding::Enum, &kOscWave},
                {"OSC_WAVE_VARIATION", 0x01, 0, 2, 0, 2, ValueEncoding::Enum, &kVariation},
                {"OSC_PITCH", 0x03, 40, 88, -24, 24, ValueEncoding::SignedOffset},
                {"OSC_DETUNE", 0x04, 14, 114, -50, 50, ValueEncoding::SignedOffset},
                {"OSC_PULSE_WIDTH_MOD_DEPTH", 0x05, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"OSC_PULSE_WIDTH", 0x06, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"OSC_PITCH_ENV_ATTACK_TIME", 0x07, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"OSC_PITCH_ENV_DECAY_TIME", 0x08, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"OSC_PITCH_ENV_DEPTH", 0x09, 1, 127, -63, 63, ValueEncoding::SignedOffset},

                // Filter
                {"FILTER_MODE", 0x0A, 0, 7, 0, 7, ValueEncoding::Enum, &kFilterMode},
                {"FILTER_SLOPE", 0x0B, 0, 1, 0, 1, ValueEncoding::Enum, &kFilterSlope},
                {"FILTER_CUTOFF", 0x0C, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_CUTOFF_KEYFOLLOW", 0x0D, 54, 74, -100, 100, ValueEncoding::Unsigned},
                {"FILTER_ENV_VELOCITY_SENS", 0x0E, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"FILTER_RESONANCE", 0x0F, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_ENV_ATTACK_TIME", 0x10, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_ENV_DECAY_TIME", 0x11, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_ENV_SUSTAIN_LEVEL", 0x12, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_ENV_RELEASE_TIME", 0x13, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_ENV_DEPTH", 0x14, 1, 127, -63, 63, ValueEncoding::SignedOffset},

                // Amp
                {"AMP_LEVEL", 0x15, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"AMP_VELOCITY_SENS", 0x16, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"AMP_ENV_ATTACK_TIME", 0x17, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"AMP_ENV_DECAY_TIME", 0x18, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"AMP_ENV_SUSTAIN_LEVEL", 0x19, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"AMP_ENV_RELEASE_TIME", 0x1A, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"AMP_PAN", 0x1B, 0, 127, -64, 63, ValueEncoding::SignedOffset},

                // LFO
                {"LFO_SHAPE", 0x1C, 0, 5, 0, 5, ValueEncoding::Enum, &kLfoShape},
                {"LFO_RATE", 0x1D, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"LFO_TEMPO_SYNC_SWITCH", 0x1E, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"LFO_TEMPO_SYNC_NOTE", 0x1F, 0, 19, 0, 19, ValueEncoding::Enum, &kSyncNote},
                {"LFO_FADE_TIME", 0x20, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"LFO_KEY_TRIGGER", 0x21, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"LFO_PITCH_DEPTH", 0x22, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"LFO_FILTER_DEPTH", 0x23, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"LFO_AMP_DEPTH", 0x24, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"LFO_PAN_DEPTH", 0x25, 1, 127, -63, 63, ValueEncoding::SignedOffset},

                // Modulation LFO
                {"MOD_LFO_SHAPE", 0x26, 0, 5, 0, 5, ValueEncoding::Enum, &kLfoShape},
                {"MOD_LFO_RATE", 0x27, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"MOD_LFO_TEMPO_SYNC_SWITCH", 0x28, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"MOD_LFO_TEMPO_SYNC_NOTE", 0x29, 0, 19, 0, 19, ValueEncoding::Enum, &kSyncNote},
                {"OSC_PULSE_WIDTH_SHIFT", 0x2A, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"MOD_LFO_PITCH_DEPTH", 0x2C, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"MOD_LFO_FILTER_DEPTH", 0x2D, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"MOD_LFO_AMP_DEPTH", 0x2E, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"MOD_LFO_PAN_DEPTH", 0x2F, 1, 127, -63, 63, ValueEncoding::SignedOffset},

                // Aftertouch, wave
                {"CUTOFF_AFTERTOUCH_SENS", 0x30, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"LEVEL_AFTERTOUCH_SENS", 0x31, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"WAVE_GAIN", 0x34, 0, 3, 0, 3, ValueEncoding::Enum, &kWaveGain},
                {"PCM_WAVE_NUMBER", 0x35, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"HPF_CUTOFF", 0x39, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"SUPER_SAW_DETUNE", 0x3A, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"MOD_LFO_RATE_CTRL", 0x3B, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"AMP_LEVEL_KEYFOLLOW", 0x3C, 54, 74, -100, 100, ValueEncoding::Unsigned},
            };
            inline const ParameterTable kTable = {"Digital Partial", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x40};
        }

        //=========================================================================
        // Digital synth - modify (group 0x50)
        //=========================================================================
        namespace DigitalModify
        {
            inline const EnumOption kLoopModeOptions[] = {{0, "OFF"}, {1, "FREE-RUN"}, {2, "TEMPO-SYNC"}};
            inline const EnumOptionList kLoopMode = {kLoopModeOptions, 3};

            inline const ParameterSpec kParams[] = {
                {"ATTACK_TIME_INTERVAL_SENS", 0x01, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"RELEASE_TIME_INTERVAL_SENS", 0x02, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PORTAMENTO_TIME_INTERVAL_SENS", 0x03, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"ENVELOPE_LOOP_MODE", 0x04, 0, 2, 0, 2, ValueEncoding::Enum, &kLoopMode},
                {"ENVELOPE_LOOP_SYNC_NOTE", 0x05, 0, 19, 0, 19, ValueEncoding::Enum, &kSyncNote},
                {"CHROMATIC_PORTAMENTO", 0x06, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
            };
            inline const ParameterTable kTable = {"Digital Modify", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x40};
        }

        //=========================================================================
        // Analog synth (group 0x00)
        //=========================================================================
        namespace Analog
        {
            inline const EnumOption kOscWaveOptions[] = {{0, "SAW"}, {1, "TRI"}, {2, "PW-SQR"}};
            inline const EnumOptionList kOscWave = {kOscWaveOptions, 3};

            inline const EnumOption kSubOscOptions[] = {{0, "OFF"}, {1, "OCT-1"}, {2, "OCT-2"}};
            inline const EnumOptionList kSubOsc = {kSubOscOptions, 3};

            inline const EnumOption kFilterSwitchOptions[] = {{0, "BYPASS"}, {1, "LPF"}};
            inline const EnumOptionList kFilterSwitch = {kFilterSwitchOptions, 2};

            inline const ParameterSpec kParams[] = {
                // LFO
                {"LFO_SHAPE", 0x0D, 0, 5, 0, 5, ValueEncoding::Enum, &kLfoShape},
                {"LFO_RATE", 0x0E, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"LFO_FADE_TIME", 0x0F, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"LFO_TEMPO_SYNC_SWITCH", 0x10, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"LFO_TEMPO_SYNC_NOTE", 0x11, 0, 19, 0, 19, ValueEncoding::Enum, &kSyncNote},
                {"LFO_PITCH_DEPTH", 0x12, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"LFO_FILTER_DEPTH", 0x13, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"LFO_AMP_DEPTH", 0x14, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"LFO_KEY_TRIGGER", 0x15, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},

                // Oscillator
                {"OSC_WAVEFORM", 0x16, 0, 2, 0, 2, ValueEncoding::Enum, &kOscWave},
                {"OSC_PITCH_COARSE", 0x17, 40, 88, -24, 24, ValueEncoding::SignedOffset},
                {"OSC_PITCH_FINE", 0x18, 14, 114, -50, 50, ValueEncoding::SignedOffset},
                {"OSC_PULSE_WIDTH", 0x19, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"OSC_PULSE_WIDTH_MOD_DEPTH", 0x1A, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"OSC_PITCH_ENV_VELOCITY_SENS", 0x1B, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"OSC_PITCH_ENV_ATTACK_TIME", 0x1C, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"OSC_PITCH_ENV_DECAY", 0x1D, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"OSC_PITCH_ENV_DEPTH", 0x1E, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"SUB_OSCILLATOR_TYPE", 0x1F, 0, 2, 0, 2, ValueEncoding::Enum, &kSubOsc},

                // Filter
                {"FILTER_SWITCH", 0x20, 0, 1, 0, 1, ValueEncoding::Enum, &kFilterSwitch},
                {"FILTER_CUTOFF", 0x21, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_CUTOFF_KEYFOLLOW", 0x22, 54, 74, -100, 100, ValueEncoding::Unsigned},
                {"FILTER_RESONANCE", 0x23, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_ENV_VELOCITY_SENS", 0x24, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"FILTER_ENV_ATTACK_TIME", 0x25, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_ENV_DECAY_TIME", 0x26, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_ENV_SUSTAIN_LEVEL", 0x27, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_ENV_RELEASE_TIME", 0x28, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"FILTER_ENV_DEPTH", 0x29, 1, 127, -63, 63, ValueEncoding::SignedOffset},

                // Amp
                {"AMP_LEVEL", 0x2A, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"AMP_LEVEL_KEYFOLLOW", 0x2B, 54, 74, -100, 100, ValueEncoding::Unsigned},
                {"AMP_LEVEL_VELOCITY_SENS", 0x2C, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"AMP_ENV_ATTACK_TIME", 0x2D, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"AMP_ENV_DECAY_TIME", 0x2E, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"AMP_ENV_SUSTAIN_LEVEL", 0x2F, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"AMP_ENV_RELEASE_TIME", 0x30, 0, 127, 0, 127, ValueEncoding::Unsigned},

                // Performance
                {"PORTAMENTO_SWITCH", 0x31, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"PORTAMENTO_TIME", 0x32, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"LEGATO_SWITCH", 0x33, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"OCTAVE_SHIFT", 0x34, 61, 67, -3, 3, ValueEncoding::SignedOffset},
                {"PITCH_BEND_RANGE_UP", 0x35, 0, 24, 0, 24, ValueEncoding::Unsigned},
                {"PITCH_BEND_RANGE_DOWN", 0x36, 0, 24, 0, 24, ValueEncoding::Unsigned},
                {"LFO_PITCH_MODULATION_CONTROL", 0x38, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"LFO_FILTER_MODULATION_CONTROL", 0x39, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"LFO_AMP_MODULATION_CONTROL", 0x3A, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"LFO_RATE_MODULATION_CONTROL", 0x3B, 1, 127, -63, 63, ValueEncoding::SignedOffset},
            };
            inline const ParameterTable kTable = {"Analog", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x40};
        }

        //=========================================================================
        // Drum kit - common (group 0x00)
        //=========================================================================
        namespace DrumCommon
        {
            inline const ParameterSpec kParams[] = {
                {"KIT_LEVEL", 0x0C, 0, 127, 0, 127, ValueEncoding::Unsigned},
            };
            inline const ParameterTable kTable = {"Drum Common", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x12};
        }

        //=========================================================================
        // Drum kit - partial 1..37 (groups 0x2E, 0x30 ... 0x76)
        //
        // Offsets past 0x7F continue in the next group (0x0115 = group+1, 0x15).
        //=========================================================================
        namespace DrumPartial
        {
            inline const EnumOption kAssignTypeOptions[] = {{0, "MULTI"}, {1, "SINGLE"}};
            inline const EnumOptionList kAssignType = {kAssignTypeOptions, 2};

            inline const EnumOption kEnvModeOptions[] = {{0, "NO-SUS"}, {1, "SUSTAIN"}};
            inline const EnumOptionList kEnvMode = {kEnvModeOptions, 2};

            inline const EnumOption kVelocityControlOptions[] = {{0, "OFF"}, {1, "ON"}, {2, "RANDOM"}};
            inline const EnumOptionList kVelocityControl = {kVelocityControlOptions, 3};

            inline const EnumOption kAlternatePanOptions[] = {{0, "OFF"}, {1, "ON"}, {2, "REVS"}};
            inline const EnumOptionList kAlternatePan = {kAlternatePanOptions, 3};

            inline const EnumOption kTvfFilterTypeOptions[] = {
                {0, "OFF"}, {1, "LPF"}, {2, "BPF"}, {3, "HPF"}, {4, "PKG"}, {5, "LPF2"}, {6, "LPF3"}};
            inline const EnumOptionList kTvfFilterType = {kTvfFilterTypeOptions, 7};

            inline const ParameterSpec kParams[] = {
                {"ASSIGN_TYPE", 0x0C, 0, 1, 0, 1, ValueEncoding::Enum, &kAssignType},
                {"MUTE_GROUP", 0x0D, 0, 31, 0, 31, ValueEncoding::Unsigned},
                {"PARTIAL_LEVEL", 0x0E, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PARTIAL_COARSE_TUNE", 0x0F, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PARTIAL_FINE_TUNE", 0x10, 14, 114, -50, 50, ValueEncoding::SignedOffset},
                {"PARTIAL_RANDOM_PITCH_DEPTH", 0x11, 0, 30, 0, 30, ValueEncoding::Unsigned},
                {"PARTIAL_PAN", 0x12, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PARTIAL_RANDOM_PAN_DEPTH", 0x13, 0, 63, 0, 63, ValueEncoding::Unsigned},
                {"PARTIAL_ALTERNATE_PAN_DEPTH", 0x14, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"PARTIAL_ENV_MODE", 0x15, 0, 1, 0, 1, ValueEncoding::Enum, &kEnvMode},
                {"PARTIAL_OUTPUT_LEVEL", 0x16, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PARTIAL_CHORUS_SEND_LEVEL", 0x19, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PARTIAL_REVERB_SEND_LEVEL", 0x1A, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PARTIAL_OUTPUT_ASSIGN", 0x1B, 0, 4, 0, 4, ValueEncoding::Enum, &kOutputAssign},
                {"PARTIAL_PITCH_BEND_RANGE", 0x1C, 0, 48, 0, 48, ValueEncoding::Unsigned},
                {"PARTIAL_RECEIVE_EXPRESSION", 0x1D, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"PARTIAL_RECEIVE_HOLD_1", 0x1E, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT_VELOCITY_CONTROL", 0x20, 0, 2, 0, 2, ValueEncoding::Enum, &kVelocityControl},

                // WMT1
                {"WMT1_WAVE_SWITCH", 0x21, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT1_WAVE_GROUP_TYPE", 0x22, 0, 0, 0, 0, ValueEncoding::Unsigned},
                {"WMT1_WAVE_GROUP_ID", 0x23, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT1_WAVE_NUMBER_L", 0x27, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT1_WAVE_NUMBER_R", 0x2B, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT1_WAVE_GAIN", 0x2F, 0, 3, 0, 3, ValueEncoding::Enum, &kWaveGain},
                {"WMT1_WAVE_FXM_SWITCH", 0x30, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT1_WAVE_FXM_COLOR", 0x31, 0, 3, 1, 4, ValueEncoding::Unsigned},
                {"WMT1_WAVE_FXM_DEPTH", 0x32, 0, 16, 0, 16, ValueEncoding::Unsigned},
                {"WMT1_WAVE_TEMPO_SYNC", 0x33, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT1_WAVE_COARSE_TUNE", 0x34, 16, 112, -48, 48, ValueEncoding::SignedOffset},
                {"WMT1_WAVE_FINE_TUNE", 0x35, 14, 114, -50, 50, ValueEncoding::SignedOffset},
                {"WMT1_WAVE_PAN", 0x36, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"WMT1_WAVE_RANDOM_PAN_SWITCH", 0x37, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT1_WAVE_ALTERNATE_PAN_SWITCH", 0x38, 0, 2, 0, 2, ValueEncoding::Enum, &kAlternatePan},
                {"WMT1_WAVE_LEVEL", 0x39, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"WMT1_VELOCITY_RANGE_LOWER", 0x3A, 1, 127, 1, 127, ValueEncoding::Unsigned},
                {"WMT1_VELOCITY_RANGE_UPPER", 0x3B, 1, 127, 1, 127, ValueEncoding::Unsigned},
                {"WMT1_VELOCITY_FADE_WIDTH_LOWER", 0x3C, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"WMT1_VELOCITY_FADE_WIDTH_UPPER", 0x3D, 0, 127, 0, 127, ValueEncoding::Unsigned},

                // WMT2
                {"WMT2_WAVE_SWITCH", 0x3E, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT2_WAVE_GROUP_TYPE", 0x3F, 0, 0, 0, 0, ValueEncoding::Unsigned},
                {"WMT2_WAVE_GROUP_ID", 0x40, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT2_WAVE_NUMBER_L", 0x44, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT2_WAVE_NUMBER_R", 0x48, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT2_WAVE_GAIN", 0x4C, 0, 3, 0, 3, ValueEncoding::Enum, &kWaveGain},
                {"WMT2_WAVE_FXM_SWITCH", 0x4D, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT2_WAVE_FXM_COLOR", 0x4E, 0, 3, 1, 4, ValueEncoding::Unsigned},
                {"WMT2_WAVE_FXM_DEPTH", 0x4F, 0, 16, 0, 16, ValueEncoding::Unsigned},
                {"WMT2_WAVE_TEMPO_SYNC", 0x50, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT2_WAVE_COARSE_TUNE", 0x51, 16, 112, -48, 48, ValueEncoding::SignedOffset},
                {"WMT2_WAVE_FINE_TUNE", 0x52, 14, 114, -50, 50, ValueEncoding::SignedOffset},
                {"WMT2_WAVE_PAN", 0x53, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"WMT2_WAVE_RANDOM_PAN_SWITCH", 0x54, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT2_WAVE_ALTERNATE_PAN_SWITCH", 0x55, 0, 2, 0, 2, ValueEncoding::Enum, &kAlternatePan},
                {"WMT2_WAVE_LEVEL", 0x56, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"WMT2_VELOCITY_RANGE_LOWER", 0x57, 1, 127, 1, 127, ValueEncoding::Unsigned},
                {"WMT2_VELOCITY_RANGE_UPPER", 0x58, 1, 127, 1, 127, ValueEncoding::Unsigned},
                {"WMT2_VELOCITY_FADE_WIDTH_LOWER", 0x59, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"WMT2_VELOCITY_FADE_WIDTH_UPPER", 0x5A, 0, 127, 0, 127, ValueEncoding::Unsigned},

                // WMT3
                {"WMT3_WAVE_SWITCH", 0x5B, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT3_WAVE_GROUP_TYPE", 0x5C, 0, 0, 0, 0, ValueEncoding::Unsigned},
                {"WMT3_WAVE_GROUP_ID", 0x5D, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT3_WAVE_NUMBER_L", 0x61, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT3_WAVE_NUMBER_R", 0x65, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT3_WAVE_GAIN", 0x69, 0, 3, 0, 3, ValueEncoding::Enum, &kWaveGain},
                {"WMT3_WAVE_FXM_SWITCH", 0x6A, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT3_WAVE_FXM_COLOR", 0x6B, 0, 3, 1, 4, ValueEncoding::Unsigned},
                {"WMT3_WAVE_FXM_DEPTH", 0x6C, 0, 16, 0, 16, ValueEncoding::Unsigned},
                {"WMT3_WAVE_TEMPO_SYNC", 0x6D, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT3_WAVE_COARSE_TUNE", 0x6E, 16, 112, -48, 48, ValueEncoding::SignedOffset},
                {"WMT3_WAVE_FINE_TUNE", 0x6F, 14, 114, -50, 50, ValueEncoding::SignedOffset},
                {"WMT3_WAVE_PAN", 0x70, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"WMT3_WAVE_RANDOM_PAN_SWITCH", 0x71, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT3_WAVE_ALTERNATE_PAN_SWITCH", 0x72, 0, 2, 0, 2, ValueEncoding::Enum, &kAlternatePan},
                {"WMT3_WAVE_LEVEL", 0x73, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"WMT3_VELOCITY_RANGE_LOWER", 0x74, 1, 127, 1, 127, ValueEncoding::Unsigned},
                {"WMT3_VELOCITY_RANGE_UPPER", 0x75, 1, 127, 1, 127, ValueEncoding::Unsigned},
                {"WMT3_VELOCITY_FADE_WIDTH_LOWER", 0x76, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"WMT3_VELOCITY_FADE_WIDTH_UPPER", 0x77, 0, 127, 0, 127, ValueEncoding::Unsigned},

                // WMT4
                {"WMT4_WAVE_SWITCH", 0x78, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT4_WAVE_GROUP_TYPE", 0x79, 0, 0, 0, 0, ValueEncoding::Unsigned},
                {"WMT4_WAVE_GROUP_ID", 0x7A, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT4_WAVE_NUMBER_L", 0x7E, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT4_WAVE_NUMBER_R", 0x102, 0, 16384, 0, 16384, ValueEncoding::Unsigned, nullptr, 4},
                {"WMT4_WAVE_GAIN", 0x106, 0, 3, 0, 3, ValueEncoding::Enum, &kWaveGain},
                {"WMT4_WAVE_FXM_SWITCH", 0x107, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT4_WAVE_FXM_COLOR", 0x108, 0, 3, 1, 4, ValueEncoding::Unsigned},
                {"WMT4_WAVE_FXM_DEPTH", 0x109, 0, 16, 0, 16, ValueEncoding::Unsigned},
                {"WMT4_WAVE_TEMPO_SYNC", 0x10A, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT4_WAVE_COARSE_TUNE", 0x10B, 16, 112, -48, 48, ValueEncoding::SignedOffset},
                {"WMT4_WAVE_FINE_TUNE", 0x10C, 14, 114, -50, 50, ValueEncoding::SignedOffset},
                {"WMT4_WAVE_PAN", 0x10D, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"WMT4_WAVE_RANDOM_PAN_SWITCH", 0x10E, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"WMT4_WAVE_ALTERNATE_PAN_SWITCH", 0x10F, 0, 2, 0, 2, ValueEncoding::Enum, &kAlternatePan},
                {"WMT4_WAVE_LEVEL", 0x110, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"WMT4_VELOCITY_RANGE_LOWER", 0x111, 1, 127, 1, 127, ValueEncoding::Unsigned},
                {"WMT4_VELOCITY_RANGE_UPPER", 0x112, 1, 127, 1, 127, ValueEncoding::Unsigned},
                {"WMT4_VELOCITY_FADE_WIDTH_LOWER", 0x113, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"WMT4_VELOCITY_FADE_WIDTH_UPPER", 0x114, 0, 127, 0, 127, ValueEncoding::Unsigned},

                // Pitch envelope
                {"PITCH_ENV_DEPTH", 0x115, 52, 76, -12, 12, ValueEncoding::SignedOffset},
                {"PITCH_ENV_VELOCITY_SENS", 0x116, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"PITCH_ENV_TIME_1_VELOCITY_SENS", 0x117, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"PITCH_ENV_TIME_4_VELOCITY_SENS", 0x118, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"PITCH_ENV_TIME_1", 0x119, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PITCH_ENV_TIME_2", 0x11A, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PITCH_ENV_TIME_3", 0x11B, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PITCH_ENV_TIME_4", 0x11C, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PITCH_ENV_LEVEL_0", 0x11D, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"PITCH_ENV_LEVEL_1", 0x11E, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"PITCH_ENV_LEVEL_2", 0x11F, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"PITCH_ENV_LEVEL_3", 0x120, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"PITCH_ENV_LEVEL_4", 0x121, 1, 127, -63, 63, ValueEncoding::SignedOffset},

                // TVF
                {"TVF_FILTER_TYPE", 0x122, 0, 6, 0, 6, ValueEncoding::Enum, &kTvfFilterType},
                {"TVF_CUTOFF_FREQUENCY", 0x123, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVF_CUTOFF_VELOCITY_CURVE", 0x124, 0, 7, 0, 7, ValueEncoding::Unsigned},
                {"TVF_CUTOFF_VELOCITY_SENS", 0x125, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"TVF_RESONANCE", 0x126, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVF_RESONANCE_VELOCITY_SENS", 0x127, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"TVF_ENV_DEPTH", 0x128, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"TVF_ENV_VELOCITY_CURVE_TYPE", 0x129, 0, 7, 0, 7, ValueEncoding::Unsigned},
                {"TVF_ENV_VELOCITY_SENS", 0x12A, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"TVF_ENV_TIME_1_VELOCITY_SENS", 0x12B, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"TVF_ENV_TIME_4_VELOCITY_SENS", 0x12C, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"TVF_ENV_TIME_1", 0x12D, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVF_ENV_TIME_2", 0x12E, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVF_ENV_TIME_3", 0x12F, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVF_ENV_TIME_4", 0x130, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVF_ENV_LEVEL_0", 0x131, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVF_ENV_LEVEL_1", 0x132, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVF_ENV_LEVEL_2", 0x133, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVF_ENV_LEVEL_3", 0x134, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVF_ENV_LEVEL_4", 0x135, 0, 127, 0, 127, ValueEncoding::Unsigned},

                // TVA
                {"TVA_LEVEL_VELOCITY_CURVE", 0x136, 0, 7, 0, 7, ValueEncoding::Unsigned},
                {"TVA_LEVEL_VELOCITY_SENS", 0x137, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"TVA_ENV_TIME_1_VELOCITY_SENS", 0x138, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"TVA_ENV_TIME_4_VELOCITY_SENS", 0x139, 1, 127, -63, 63, ValueEncoding::SignedOffset},
                {"TVA_ENV_TIME_1", 0x13A, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVA_ENV_TIME_2", 0x13B, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVA_ENV_TIME_3", 0x13C, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVA_ENV_TIME_4", 0x13D, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVA_ENV_LEVEL_1", 0x13E, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVA_ENV_LEVEL_2", 0x13F, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TVA_ENV_LEVEL_3", 0x140, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"ONE_SHOT_MODE", 0x141, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"RELATIVE_LEVEL", 0x142, 0, 127, -64, 63, ValueEncoding::SignedOffset},
            };

            // 0x00 through 0x0142
            inline const ParameterTable kTable = {"Drum Partial", kParams, sizeof(kParams) / sizeof(kParams[0]), 195};

            inline const char *const kPartialNames[] = {
                "BD1", "RIM", "BD2", "CLAP", "BD3", "SD1", "CHH", "SD2", "PHH", "SD3",
                "OHH", "SD4", "TOM1", "PRC1", "TOM2", "PRC2", "TOM3", "PRC3", "CYM1", "PRC4",
                "CYM2", "PRC5", "CYM3", "HIT", "OTH1", "OTH2", "D4", "Eb4", "E4", "F4",
                "F#4", "G4", "G#4", "A4", "Bb4", "B4", "C5"};
            constexpr int kNumPartials = sizeof(kPartialNames) / sizeof(kPartialNames[0]);
        }

        //=========================================================================
        // Program - common (area 0x18, group 0x00)
        //=========================================================================
        namespace ProgramCommon
        {
            inline const EnumOption kVocalEffectOptions[] = {{0, "OFF"}, {1, "VOCODER"}, {2, "AUTO-PITCH"}};
            inline const EnumOptionList kVocalEffect = {kVocalEffectOptions, 3};

            inline const EnumOption kVocalPartOptions[] = {{0, "PART1"}, {1, "PART2"}};
            inline const EnumOptionList kVocalPart = {kVocalPartOptions, 2};

            inline const ParameterSpec kParams[] = {
                {"PROGRAM_LEVEL", 0x10, 0, 127, 0, 127, ValueEncoding::Unsigned},
                // Tempo in 1/100 BPM (5.00 - 300.00)
                {"PROGRAM_TEMPO", 0x11, 500, 30000, 500, 30000, ValueEncoding::Unsigned, nullptr, 4},
                {"VOCAL_EFFECT", 0x16, 0, 2, 0, 2, ValueEncoding::Enum, &kVocalEffect},
                {"VOCAL_EFFECT_NUMBER", 0x1C, 0, 20, 0, 20, ValueEncoding::Unsigned},
                {"VOCAL_EFFECT_PART", 0x1D, 0, 1, 0, 1, ValueEncoding::Enum, &kVocalPart},
                {"AUTO_NOTE_SWITCH", 0x1E, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
            };
            inline const ParameterTable kTable = {"Program Common", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x1F};
        }

        //=========================================================================
        // Program - vocal effect (area 0x18, group 0x01)
        //=========================================================================
        namespace ProgramVocalEffect
        {
            inline const EnumOption kAutoPitchTypeOptions[] = {
                {0, "SOFT"}, {1, "HARD"}, {2, "ELECTRIC1"}, {3, "ELECTRIC2"}};
            inline const EnumOptionList kAutoPitchType = {kAutoPitchTypeOptions, 4};

            inline const EnumOption kAutoPitchScaleOptions[] = {{0, "CHROMATIC"}, {1, "Maj(Min)"}};
            inline const EnumOptionList kAutoPitchScale = {kAutoPitchScaleOptions, 2};

            inline const EnumOption kAutoPitchKeyOptions[] = {
                {0, "C"}, {1, "Db"}, {2, "D"}, {3, "Eb"}, {4, "E"}, {5, "F"},
                {6, "F#"}, {7, "G"}, {8, "Ab"}, {9, "A"}, {10, "Bb"}, {11, "B"},
                {12, "Cm"}, {13, "C#m"}, {14, "Dm"}, {15, "D#m"}, {16, "Em"}, {17, "Fm"},
                {18, "F#m"}, {19, "Gm"}, {20, "G#m"}, {21, "Am"}, {22, "Bbm"}, {23, "Bm"}};
            inline const EnumOptionList kAutoPitchKey = {kAutoPitchKeyOptions, 24};

            inline const EnumOption kVocoderEnvelopeOptions[] = {{0, "SHARP"}, {1, "SOFT"}, {2, "LONG"}};
            inline const EnumOptionList kVocoderEnvelope = {kVocoderEnvelopeOptions, 3};

            inline const EnumOption kMicHpfOptions[] = {
                {0, "BYPASS"}, {1, "1000"}, {2, "1250"}, {3, "1600"}, {4, "2000"},
                {5, "2500"}, {6, "3150"}, {7, "4000"}, {8, "5000"}, {9, "6300"},
                {10, "8000"}, {11, "10000"}, {12, "12500"}, {13, "16000"}};
            inline const EnumOptionList kMicHpf = {kMicHpfOptions, 14};

            inline const ParameterSpec kParams[] = {
                {"VOCAL_FX_LEVEL", 0x00, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"VOCAL_FX_PAN", 0x01, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"VOCAL_FX_DELAY_SEND_LEVEL", 0x02, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"VOCAL_FX_REVERB_SEND_LEVEL", 0x03, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"VOCAL_FX_OUTPUT_ASSIGN", 0x04, 0, 4, 0, 4, ValueEncoding::Enum, &kOutputAssign},

                // Auto pitch
                {"AUTO_PITCH_SWITCH", 0x05, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"AUTO_PITCH_TYPE", 0x06, 0, 3, 0, 3, ValueEncoding::Enum, &kAutoPitchType},
                {"AUTO_PITCH_SCALE", 0x07, 0, 1, 0, 1, ValueEncoding::Enum, &kAutoPitchScale},
                {"AUTO_PITCH_KEY", 0x08, 0, 23, 0, 23, ValueEncoding::Enum, &kAutoPitchKey},
                {"AUTO_PITCH_NOTE", 0x09, 0, 11, 0, 11, ValueEncoding::Enum, &kNoteName},
                {"AUTO_PITCH_GENDER", 0x0A, 0, 20, -10, 10, ValueEncoding::SignedOffset, nullptr, 1, 10},
                {"AUTO_PITCH_OCTAVE", 0x0B, 0, 2, -1, 1, ValueEncoding::SignedOffset, nullptr, 1, 1},
                {"AUTO_PITCH_BALANCE", 0x0C, 0, 100, 0, 100, ValueEncoding::Unsigned},

                // Vocoder
                {"VOCODER_SWITCH", 0x0D, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"VOCODER_ENVELOPE", 0x0E, 0, 2, 0, 2, ValueEncoding::Enum, &kVocoderEnvelope},
                {"VOCODER_LEVEL", 0x0F, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"VOCODER_MIC_SENS", 0x10, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"VOCODER_SYNTH_LEVEL", 0x11, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"VOCODER_MIC_MIX", 0x12, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"VOCODER_MIC_HPF", 0x13, 0, 13, 0, 13, ValueEncoding::Enum, &kMicHpf},
            };
            inline const ParameterTable kTable = {"Program Vocal Effect", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x18};
        }

        //=========================================================================
        // Program - effects (groups 0x02, 0x04, 0x06, 0x08)
        //
        // Effect parameters are 4-byte values, raw 12768-52768 around 32768.
        // Effect 1 and 2 run past 0x7F into the next group (0x010D = group+1, 0x0D).
        //=========================================================================
        constexpr int kEffectParamCenter = 32768;

        namespace ProgramEffect1
        {
            inline const EnumOption kTypeOptions[] = {
                {0, "OFF"}, {1, "DISTORTION"}, {2, "FUZZ"}, {3, "COMPRESSOR"}, {4, "BITCRUSHER"}};
            inline const EnumOptionList kType = {kTypeOptions, 5};

            inline const EnumOption kOutputOptions[] = {{0, "DIR"}, {1, "EFX2"}};
            inline const EnumOptionList kOutput = {kOutputOptions, 2};

            inline const ParameterSpec kParams[] = {
                {"EFX1_TYPE", 0x00, 0, 4, 0, 4, ValueEncoding::Enum, &kType},
                {"EFX1_LEVEL", 0x01, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"EFX1_DELAY_SEND_LEVEL", 0x02, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"EFX1_REVERB_SEND_LEVEL", 0x03, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"EFX1_OUTPUT_ASSIGN", 0x04, 0, 1, 0, 1, ValueEncoding::Enum, &kOutput},
                {"EFX1_PARAM_1", 0x11, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_2", 0x15, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_3", 0x19, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_4", 0x1D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_5", 0x21, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_6", 0x25, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_7", 0x29, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_8", 0x2D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_9", 0x31, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_10", 0x35, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_11", 0x39, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_12", 0x3D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_13", 0x41, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_14", 0x45, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_15", 0x49, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_16", 0x4D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_17", 0x51, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_18", 0x55, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_19", 0x59, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_20", 0x5D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_21", 0x61, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_22", 0x65, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_23", 0x69, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_24", 0x6D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_25", 0x71, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_26", 0x75, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_27", 0x79, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_28", 0x7D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_29", 0x101, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_30", 0x105, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_31", 0x109, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX1_PARAM_32", 0x10D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
            };
            // 0x00 through 0x0110
            inline const ParameterTable kTable = {"Program Effect 1", kParams, sizeof(kParams) / sizeof(kParams[0]), 145};
        }

        namespace ProgramEffect2
        {
            inline const EnumOption kTypeOptions[] = {
                {0, "OFF"}, {5, "PHASER"}, {6, "FLANGER"}, {7, "DELAY"}, {8, "CHORUS"}};
            inline const EnumOptionList kType = {kTypeOptions, 5};

            inline const ParameterSpec kParams[] = {
                {"EFX2_TYPE", 0x00, 0, 8, 0, 4, ValueEncoding::Enum, &kType},
                {"EFX2_LEVEL", 0x01, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"EFX2_DELAY_SEND_LEVEL", 0x02, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"EFX2_REVERB_SEND_LEVEL", 0x03, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"EFX2_PARAM_1", 0x11, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_2", 0x15, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_3", 0x19, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_4", 0x1D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_5", 0x21, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_6", 0x25, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_7", 0x29, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_8", 0x2D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_9", 0x31, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_10", 0x35, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_11", 0x39, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_12", 0x3D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_13", 0x41, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_14", 0x45, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_15", 0x49, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_16", 0x4D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_17", 0x51, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_18", 0x55, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_19", 0x59, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_20", 0x5D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_21", 0x61, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_22", 0x65, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_23", 0x69, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_24", 0x6D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_25", 0x71, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_26", 0x75, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_27", 0x79, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_28", 0x7D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_29", 0x101, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_30", 0x105, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_31", 0x109, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"EFX2_PARAM_32", 0x10D, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
            };
            inline const ParameterTable kTable = {"Program Effect 2", kParams, sizeof(kParams) / sizeof(kParams[0]), 145};
        }

        namespace ProgramDelay
        {
            inline const ParameterSpec kParams[] = {
                {"DELAY_LEVEL", 0x01, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"DELAY_REVERB_SEND_LEVEL", 0x06, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"DELAY_PARAM_1", 0x08, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_2", 0x0C, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_3", 0x10, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_4", 0x14, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_5", 0x18, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_6", 0x1C, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_7", 0x20, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_8", 0x24, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_9", 0x28, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_10", 0x2C, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_11", 0x30, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_12", 0x34, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_13", 0x38, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_14", 0x3C, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_15", 0x40, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_16", 0x44, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_17", 0x48, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_18", 0x4C, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_19", 0x50, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_20", 0x54, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_21", 0x58, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_22", 0x5C, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_23", 0x60, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"DELAY_PARAM_24", 0x64, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
            };
            inline const ParameterTable kTable = {"Program Delay", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x68};
        }

        namespace ProgramReverb
        {
            inline const ParameterSpec kParams[] = {
                {"REVERB_LEVEL", 0x03, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"REVERB_PARAM_1", 0x07, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_2", 0x0B, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_3", 0x0F, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_4", 0x13, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_5", 0x17, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_6", 0x1B, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_7", 0x1F, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_8", 0x23, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_9", 0x27, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_10", 0x2B, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_11", 0x2F, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_12", 0x33, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_13", 0x37, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_14", 0x3B, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_15", 0x3F, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_16", 0x43, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_17", 0x47, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_18", 0x4B, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_19", 0x4F, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_20", 0x53, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_21", 0x57, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_22", 0x5B, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_23", 0x5F, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
                {"REVERB_PARAM_24", 0x63, 12768, 52768, -20000, 20000, ValueEncoding::SignedOffset, nullptr, 4, kEffectParamCenter},
            };
            inline const ParameterTable kTable = {"Program Reverb", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x67};
        }

        //=========================================================================
        // Program - part 1..4 (groups 0x20-0x23: digital 1, digital 2, analog, drums)
        //=========================================================================
        namespace ProgramPart
        {
            inline const EnumOption kOffOnToneOptions[] = {{0, "OFF"}, {1, "ON"}, {2, "TONE"}};
            inline const EnumOptionList kOffOnTone = {kOffOnToneOptions, 3};

            inline const EnumOption kMonoPolyOptions[] = {{0, "MONO"}, {1, "POLY"}, {2, "TONE"}};
            inline const EnumOptionList kMonoPoly = {kMonoPolyOptions, 3};

            inline const EnumOption kMuteOptions[] = {{0, "OFF"}, {1, "MUTE"}};
            inline const EnumOptionList kMute = {kMuteOptions, 2};

            inline const ParameterSpec kParams[] = {
                {"RECEIVE_CHANNEL", 0x00, 0, 15, 1, 16, ValueEncoding::Unsigned},
                {"PART_SWITCH", 0x01, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"TONE_BANK_SELECT_MSB", 0x06, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TONE_BANK_SELECT_LSB", 0x07, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"TONE_PROGRAM_NUMBER", 0x08, 0, 127, 0, 127, ValueEncoding::Unsigned},

                // Mixer and tone offsets
                {"PART_LEVEL", 0x09, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PART_PAN", 0x0A, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_COARSE_TUNE", 0x0B, 16, 112, -48, 48, ValueEncoding::SignedOffset},
                {"PART_FINE_TUNE", 0x0C, 14, 114, -50, 50, ValueEncoding::SignedOffset},
                {"PART_MONO_POLY", 0x0D, 0, 2, 0, 2, ValueEncoding::Enum, &kMonoPoly},
                {"PART_LEGATO_SWITCH", 0x0E, 0, 2, 0, 2, ValueEncoding::Enum, &kOffOnTone},
                {"PART_PITCH_BEND_RANGE", 0x0F, 0, 25, 0, 25, ValueEncoding::Unsigned}, // 25 = TONE
                {"PART_PORTAMENTO_SWITCH", 0x10, 0, 2, 0, 2, ValueEncoding::Enum, &kOffOnTone},
                {"PART_PORTAMENTO_TIME", 0x11, 0, 128, 0, 128, ValueEncoding::Unsigned, nullptr, 2}, // 128 = TONE
                {"PART_CUTOFF_OFFSET", 0x13, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_RESONANCE_OFFSET", 0x14, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_ATTACK_TIME_OFFSET", 0x15, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_DECAY_TIME_OFFSET", 0x16, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_RELEASE_TIME_OFFSET", 0x17, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_VIBRATO_RATE", 0x18, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_VIBRATO_DEPTH", 0x19, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_VIBRATO_DELAY", 0x1A, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_OCTAVE_SHIFT", 0x1B, 61, 67, -3, 3, ValueEncoding::SignedOffset},
                {"PART_VELOCITY_SENS_OFFSET", 0x1C, 1, 127, -63, 63, ValueEncoding::SignedOffset},

                // Keyboard range and sends
                {"VELOCITY_RANGE_LOWER", 0x21, 1, 127, 1, 127, ValueEncoding::Unsigned},
                {"VELOCITY_RANGE_UPPER", 0x22, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"VELOCITY_FADE_WIDTH_LOWER", 0x23, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"VELOCITY_FADE_WIDTH_UPPER", 0x24, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"MUTE_SWITCH", 0x25, 0, 1, 0, 1, ValueEncoding::Enum, &kMute},
                {"PART_DELAY_SEND_LEVEL", 0x2B, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PART_REVERB_SEND_LEVEL", 0x2C, 0, 127, 0, 127, ValueEncoding::Unsigned},
                {"PART_OUTPUT_ASSIGN", 0x2D, 0, 4, 0, 4, ValueEncoding::Enum, &kOutputAssign},

                // Scale tune
                {"PART_SCALE_TUNE_TYPE", 0x2F, 0, 8, 0, 8, ValueEncoding::Unsigned},
                {"PART_SCALE_TUNE_KEY", 0x30, 0, 11, 0, 11, ValueEncoding::Enum, &kNoteName},
                {"PART_SCALE_TUNE_C", 0x31, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_SCALE_TUNE_CS", 0x32, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_SCALE_TUNE_D", 0x33, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_SCALE_TUNE_DS", 0x34, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_SCALE_TUNE_E", 0x35, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_SCALE_TUNE_F", 0x36, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_SCALE_TUNE_FS", 0x37, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_SCALE_TUNE_G", 0x38, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_SCALE_TUNE_GS", 0x39, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_SCALE_TUNE_A", 0x3A, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_SCALE_TUNE_AS", 0x3B, 0, 127, -64, 63, ValueEncoding::SignedOffset},
                {"PART_SCALE_TUNE_B", 0x3C, 0, 127, -64, 63, ValueEncoding::SignedOffset},

                // Receive switches
                {"RECEIVE_PROGRAM_CHANGE", 0x3D, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"RECEIVE_BANK_SELECT", 0x3E, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"RECEIVE_PITCH_BEND", 0x3F, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"RECEIVE_POLYPHONIC_KEY_PRESSURE", 0x40, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"RECEIVE_CHANNEL_PRESSURE", 0x41, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"RECEIVE_MODULATION", 0x42, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"RECEIVE_VOLUME", 0x43, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"RECEIVE_PAN", 0x44, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"RECEIVE_EXPRESSION", 0x45, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"RECEIVE_HOLD_1", 0x46, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
            };
            inline const ParameterTable kTable = {"Program Part", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x4C};

            constexpr int kNumParts = 4;
        }

        //=========================================================================
        // Program - zone 1..4 (groups 0x30-0x33)
        //=========================================================================
        namespace ProgramZone
        {
            inline const ParameterSpec kParams[] = {
                {"ARPEGGIO_SWITCH", 0x03, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"ZONAL_OCTAVE_SHIFT", 0x19, 61, 67, -3, 3, ValueEncoding::SignedOffset},
            };
            inline const ParameterTable kTable = {"Program Zone", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x23};
        }

        //=========================================================================
        // Program - controller / arpeggio (group 0x40)
        //=========================================================================
        namespace ProgramController
        {
            inline const EnumOption kGridOptions[] = {
                {0, "04_"}, {1, "08_"}, {2, "08L"}, {3, "08H"}, {4, "08t"},
                {5, "16_"}, {6, "16L"}, {7, "16H"}, {8, "16t"}};
            inline const EnumOptionList kGrid = {kGridOptions, 9};

            inline const EnumOption kDurationOptions[] = {
                {0, "30"}, {1, "40"}, {2, "50"}, {3, "60"}, {4, "70"},
                {5, "80"}, {6, "90"}, {7, "100"}, {8, "120"}, {9, "FUL"}};
            inline const EnumOptionList kDuration = {kDurationOptions, 10};

            inline const EnumOption kMotifOptions[] = {
                {0, "UP/L"}, {1, "UP/H"}, {2, "UP/_"}, {3, "dn/L"}, {4, "dn/H"}, {5, "dn/_"},
                {6, "Ud/L"}, {7, "Ud/H"}, {8, "Ud/_"}, {9, "rn/L"}, {10, "rn/_"}, {11, "PHRASE"}};
            inline const EnumOptionList kMotif = {kMotifOptions, 12};

            inline const ParameterSpec kParams[] = {
                {"ARPEGGIO_GRID", 0x01, 0, 8, 0, 8, ValueEncoding::Enum, &kGrid},
                {"ARPEGGIO_DURATION", 0x02, 0, 9, 0, 9, ValueEncoding::Enum, &kDuration},
                {"ARPEGGIO_SWITCH", 0x03, 0, 1, 0, 1, ValueEncoding::Enum, &kOffOn},
                {"ARPEGGIO_STYLE", 0x05, 0, 127, 1, 128, ValueEncoding::Unsigned},
                {"ARPEGGIO_MOTIF", 0x06, 0, 11, 0, 11, ValueEncoding::Enum, &kMotif},
                {"ARPEGGIO_OCTAVE_RANGE", 0x07, 61, 67, -3, 3, ValueEncoding::SignedOffset},
                {"ARPEGGIO_ACCENT_RATE", 0x09, 0, 100, 0, 100, ValueEncoding::Unsigned},
                {"ARPEGGIO_VELOCITY", 0x0A, 0, 127, 0, 127, ValueEncoding::Unsigned}, // 0 = REAL
            };
            inline const ParameterTable kTable = {"Program Controller", kParams, sizeof(kParams) / sizeof(kParams[0]), 0x0C};
        }

        //=========================================================================
        // Lookup helpers
        //=========================================================================

        inline const ParameterSpec *findParameter(const ParameterTable &table, const std::string &name)
        {
            for (size_t i = 0; i < table.numParams; ++i)
            {
                if (name == table.params[i].name)
                    return &table.params[i];
            }
            return nullptr;
        }

    } // namespace Params
} // namespace jdxi
