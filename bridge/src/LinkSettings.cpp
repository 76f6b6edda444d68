#include "LinkSettings.h"

namespace
{
    const char *const kInputPortKey = "inputPort";
    const char *const kOutputPortKey = "outputPort";
    const char *const kDeviceIdKey = "deviceId";
    const char *const kProgramChannelKey = "programChannel";
    const char *const kResponseTimeoutKey = "responseTimeoutMs";

    juce::PropertiesFile::Options settingsOptions()
    {
        juce::PropertiesFile::Options options;
        options.applicationName = "jdxi_link";
        options.filenameSuffix = "settings";
        options.folderName = "jdxi_link";
        options.osxLibrarySubFolder = "Application Support";
        return options;
    }
}

LinkSettings::LinkSettings()
    : properties_(std::make_unique<juce::PropertiesFile>(settingsOptions()))
{
    inputPort_ = properties_->getValue(kInputPortKey, kDefaultPort);
    outputPort_ = properties_->getValue(kOutputPortKey, kDefaultPort);

    // Roland device ids 17..32 are sent as 0x10..0x1F
    deviceId_ = static_cast<uint8_t>(readInt(kDeviceIdKey, jdxi::Protocol::DEFAULT_DEVICE_ID, 0x10, 0x1F));
    programChannel_ = static_cast<uint8_t>(readInt(kProgramChannelKey, kDefaultProgramChannel, 0, 15));
    responseTimeoutMs_ = readInt(kResponseTimeoutKey, kDefaultResponseTimeoutMs, 50, 30000);

    DBG("LinkSettings loaded from " + getFile().getFullPathName());
}

int LinkSettings::readInt(const juce::String &key, int defaultValue, int minValue, int maxValue)
{
    if (!properties_->containsKey(key))
        return defaultValue;

    const int value = properties_->getIntValue(key, defaultValue);
    if (value < minValue || value > maxValue)
    {
        juce::Logger::writeToLog("Setting " + key + "=" + juce::String(value) + " is out of range, using " +
                                 juce::String(defaultValue));
        return defaultValue;
    }
    return value;
}

void LinkSettings::setInputPort(const juce::String &pattern)
{
    inputPort_ = pattern;
    properties_->setValue(kInputPortKey, pattern);
}

void LinkSettings::setOutputPort(const juce::String &pattern)
{
    outputPort_ = pattern;
    properties_->setValue(kOutputPortKey, pattern);
}

jdxi::DeviceIdentity LinkSettings::makeDeviceIdentity() const
{
    jdxi::DeviceIdentity identity;
    identity.deviceId = deviceId_;
    return identity;
}

bool LinkSettings::save()
{
    if (!properties_->saveIfNeeded())
    {
        juce::Logger::writeToLog("Could not save settings to " + getFile().getFullPathName());
        return false;
    }
    return true;
}

juce::File LinkSettings::getFile() const
{
    return properties_->getFile();
}
