#include "JdxiConnection.h"
#include "core/program/program_bank.h"

//==============================================================================
// JdxiConnection Implementation
//==============================================================================

JdxiConnection::JdxiConnection(jdxi::SynthState &state, const jdxi::DeviceIdentity &identity,
                               uint8_t programChannel)
    : state_(state), decoder_(identity), programChannel_(programChannel)
{
}

JdxiConnection::~JdxiConnection()
{
    disconnectAll();
}

namespace
{
    juce::StringArray deviceNames(const juce::Array<juce::MidiDeviceInfo> &devices)
    {
        juce::StringArray names;
        for (const auto &device : devices)
            names.add(device.name);
        return names;
    }

    /** Tries every device whose name contains the pattern until open() succeeds. */
    bool openFirstMatching(const juce::Array<juce::MidiDeviceInfo> &devices, const juce::String &pattern,
                           const char *direction,
                           const std::function<bool(const juce::MidiDeviceInfo &)> &open)
    {
        for (const auto &device : devices)
        {
            if (device.name.containsIgnoreCase(pattern) && open(device))
            {
                DBG("JdxiConnection: Connected " << direction << ": " << device.name);
                return true;
            }
        }

        juce::Logger::writeToLog(juce::String("No MIDI ") + direction + " found matching: " + pattern);
        return false;
    }
}

juce::StringArray JdxiConnection::getAvailableInputs()
{
    return deviceNames(juce::MidiInput::getAvailableDevices());
}

juce::StringArray JdxiConnection::getAvailableOutputs()
{
    return deviceNames(juce::MidiOutput::getAvailableDevices());
}

bool JdxiConnection::connectInput(const juce::String &deviceNamePattern)
{
    return openFirstMatching(juce::MidiInput::getAvailableDevices(), deviceNamePattern, "input",
                             [this](const juce::MidiDeviceInfo &device)
                             {
                                 midiInput_ = juce::MidiInput::openDevice(device.identifier, this);
                                 if (!midiInput_)
                                     return false;
                                 inputName_ = device.name;
                                 midiInput_->start();
                                 return true;
                             });
}

bool JdxiConnection::connectOutput(const juce::String &deviceNamePattern)
{
    return openFirstMatching(juce::MidiOutput::getAvailableDevices(), deviceNamePattern, "output",
                             [this](const juce::MidiDeviceInfo &device)
                             {
                                 midiOutput_ = juce::MidiOutput::openDevice(device.identifier);
                                 if (!midiOutput_)
                                     return false;
                                 outputName_ = device.name;
                                 return true;
                             });
}

void JdxiConnection::disconnectAll()
{
    if (midiInput_)
    {
        midiInput_->stop();
        midiInput_.reset();
        inputName_.clear();
    }

    midiOutput_.reset();
    outputName_.clear();
}

//==============================================================================
// Sending
//==============================================================================

bool JdxiConnection::sendSysEx(const jdxi::SysExMessage &message)
{
    if (!midiOutput_ || message.size() < 2)
        return false;

    // JUCE adds F0 / F7 itself
    auto midi = juce::MidiMessage::createSysExMessage(message.data() + 1, static_cast<int>(message.size() - 2));
    midiOutput_->sendMessageNow(midi);

    if (onMidiMessage)
        onMidiMessage(midi, false);

    DBG("Sent SysEx: " << (int)message.size() << " bytes");
    return true;
}

bool JdxiConnection::sendChannelMessage(const jdxi::ChannelMessages::Message &message)
{
    if (!midiOutput_ || message.empty())
        return false;

    juce::MidiMessage midi(message.data(), static_cast<int>(message.size()));
    midiOutput_->sendMessageNow(midi);

    if (onMidiMessage)
        onMidiMessage(midi, false);
    return true;
}

//==============================================================================
// Identity
//==============================================================================

bool JdxiConnection::identify(int timeoutMs, jdxi::DeviceInfo &info)
{
    auto request = jdxi::IdentityProtocol::buildRequest();
    if (!request.ok())
        return false;

    {
        std::lock_guard<std::mutex> lock(identityMutex_);
        hasIdentity_ = false;
    }
    identityReceived_.reset();

    if (!sendSysEx(request.value))
        return false;

    if (!identityReceived_.wait(timeoutMs))
        return false;

    std::lock_guard<std::mutex> lock(identityMutex_);
    if (!hasIdentity_)
        return false;
    info = lastIdentity_;
    return true;
}

//==============================================================================
// Inbound
//==============================================================================

void JdxiConnection::handleIncomingMidiMessage(juce::MidiInput * /*source*/,
                                               const juce::MidiMessage &message)
{
    if (message.isSysEx())
        handleSysEx(message);
    else
        handleChannelMessage(message);

    // Notify callback if set
    if (onMidiMessage)
    {
        onMidiMessage(message, true);
    }
}

void JdxiConnection::handleSysEx(const juce::MidiMessage &message)
{
    const uint8_t *data = message.getRawData();
    const size_t size = static_cast<size_t>(message.getRawDataSize());

    // Universal non-realtime: identity reply
    if (size > 1 && data[1] == jdxi::Protocol::Identity::UNIVERSAL_NON_REALTIME)
    {
        auto reply = jdxi::IdentityProtocol::parseReply(data, size);
        if (!reply.ok())
        {
            DBG("Ignoring universal SysEx: " << jdxi::errorName(reply.error));
            return;
        }

        {
            std::lock_guard<std::mutex> lock(identityMutex_);
            lastIdentity_ = reply.value;
            hasIdentity_ = true;
        }
        identityReceived_.signal();
        return;
    }

    auto result = decoder_.decode(data, size);
    if (!result.ok())
    {
        rejectedCount_++;
        DBG("SysEx rejected: " << jdxi::errorName(result.error) << " size=" << (int)size);
        juce::Logger::writeToLog("Dropped SysEx from device (" + juce::String(jdxi::errorName(result.error)) + ")");
        return;
    }

    decodedCount_++;
    state_.apply(result.value);
}

void JdxiConnection::handleChannelMessage(const juce::MidiMessage &message)
{
    // JUCE channels are 1-based
    if (message.getChannel() != programChannel_ + 1)
        return;

    if (message.isController())
    {
        const int controller = message.getControllerNumber();
        if (controller == jdxi::ChannelMessages::Controller::BANK_SELECT_MSB)
            pendingBankMsb_ = message.getControllerValue();
        else if (controller == jdxi::ChannelMessages::Controller::BANK_SELECT_LSB)
            pendingBankLsb_ = message.getControllerValue();
        return;
    }

    if (!message.isProgramChange() || pendingBankMsb_ < 0 || pendingBankLsb_ < 0)
        return;

    auto program = jdxi::ProgramBank::unresolve(static_cast<uint8_t>(pendingBankMsb_),
                                                static_cast<uint8_t>(pendingBankLsb_),
                                                static_cast<uint8_t>(message.getProgramChangeNumber()));
    if (!program.ok())
    {
        DBG("Program change outside the JD-Xi banks: " << jdxi::errorName(program.error));
        return;
    }

    DBG("Program selected on device: " << juce::String(jdxi::ProgramBank::formatProgramId(program.value)));
    state_.setProgram(program.value);
}
