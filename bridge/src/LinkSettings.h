#pragma once

#include <juce_data_structures/juce_data_structures.h>
#include "core/protocol/roland_protocol.h"
#include <memory>

/**
 * LinkSettings - persisted connection settings
 *
 * Stored in a juce::PropertiesFile ("jdxi_link" / "settings"). Values that
 * are missing or out of range fall back to the defaults below, with a
 * warning in the log.
 */
class LinkSettings
{
public:
    static constexpr const char *kDefaultPort = "JD-Xi";
    static constexpr int kDefaultProgramChannel = 15; // 0-based, MIDI channel 16
    static constexpr int kDefaultResponseTimeoutMs = 1000;

    LinkSettings();

    juce::String getInputPort() const { return inputPort_; }
    juce::String getOutputPort() const { return outputPort_; }
    uint8_t getDeviceId() const { return deviceId_; }
    uint8_t getProgramChannel() const { return programChannel_; }
    int getResponseTimeoutMs() const { return responseTimeoutMs_; }

    void setInputPort(const juce::String &pattern);
    void setOutputPort(const juce::String &pattern);

    /** Identity used by every encoder and decoder. */
    jdxi::DeviceIdentity makeDeviceIdentity() const;

    /** Writes pending changes. Returns false when the file could not be saved. */
    bool save();

    juce::File getFile() const;

private:
    int readInt(const juce::String &key, int defaultValue, int minValue, int maxValue);

    std::unique_ptr<juce::PropertiesFile> properties_;

    juce::String inputPort_;
    juce::String outputPort_;
    uint8_t deviceId_ = jdxi::Protocol::DEFAULT_DEVICE_ID;
    uint8_t programChannel_ = kDefaultProgramChannel;
    int responseTimeoutMs_ = kDefaultResponseTimeoutMs;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(LinkSettings)
};
