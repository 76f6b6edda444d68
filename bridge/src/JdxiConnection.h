#pragma once

#include <juce_audio_devices/juce_audio_devices.h>
#include "core/protocol/channel_messages.h"
#include "core/protocol/identity.h"
#include "core/state/inbound_decoder.h"
#include "core/state/synth_state.h"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

/**
 * JdxiConnection - one MIDI input/output pair talking to a JD-Xi
 *
 * Outbound: raw SysEx and channel messages produced by the core encoders.
 * Inbound: DT1 messages are decoded into the SynthState, identity replies
 * are kept for identify(), bank select + program change on the program
 * channel update the selected program. Anything that fails to decode is
 * logged and dropped.
 */
class JdxiConnection : public juce::MidiInputCallback
{
public:
    JdxiConnection(jdxi::SynthState &state, const jdxi::DeviceIdentity &identity, uint8_t programChannel);
    ~JdxiConnection() override;

    // Device management
    static juce::StringArray getAvailableInputs();
    static juce::StringArray getAvailableOutputs();

    // Connect to devices by name (partial match supported)
    bool connectInput(const juce::String &deviceNamePattern);
    bool connectOutput(const juce::String &deviceNamePattern);
    void disconnectAll();

    bool isInputConnected() const { return midiInput_ != nullptr; }
    bool isOutputConnected() const { return midiOutput_ != nullptr; }
    juce::String getInputName() const { return inputName_; }
    juce::String getOutputName() const { return outputName_; }

    //==========================================================================
    // Sending
    //==========================================================================

    /** Complete F0..F7 message. Returns false when no output is open. */
    bool sendSysEx(const jdxi::SysExMessage &message);
    bool sendChannelMessage(const jdxi::ChannelMessages::Message &message);

    //==========================================================================
    // Identity
    //==========================================================================

    /** Sends an identity request and waits up to timeoutMs for the reply. */
    bool identify(int timeoutMs, jdxi::DeviceInfo &info);

    // Statistics
    int getDecodedCount() const { return decodedCount_.load(); }
    int getRejectedCount() const { return rejectedCount_.load(); }

    // Optional callback for monitoring
    std::function<void(const juce::MidiMessage &, bool isIncoming)> onMidiMessage;

private:
    void handleIncomingMidiMessage(juce::MidiInput *source,
                                   const juce::MidiMessage &message) override;

    void handleSysEx(const juce::MidiMessage &message);
    void handleChannelMessage(const juce::MidiMessage &message);

    jdxi::SynthState &state_;
    jdxi::InboundDecoder decoder_;
    uint8_t programChannel_;

    std::unique_ptr<juce::MidiInput> midiInput_;
    std::unique_ptr<juce::MidiOutput> midiOutput_;
    juce::String inputName_;
    juce::String outputName_;

    std::atomic<int> decodedCount_{0};
    std::atomic<int> rejectedCount_{0};

    // Bank select seen on the program channel, waiting for a program change
    int pendingBankMsb_ = -1;
    int pendingBankLsb_ = -1;

    std::mutex identityMutex_;
    jdxi::DeviceInfo lastIdentity_;
    bool hasIdentity_ = false;
    juce::WaitableEvent identityReceived_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(JdxiConnection)
};
