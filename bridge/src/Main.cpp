#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>
#include "JdxiConnection.h"
#include "LinkSettings.h"
#include "core/address/address_resolver.h"
#include "core/edit/edit_encoder.h"
#include "core/params/value_codec.h"
#include "core/program/program_bank.h"
#include <iostream>

namespace
{
    //==========================================================================
    // Prints state changes as they arrive (called on the MIDI thread)
    //==========================================================================
    class ConsoleObserver : public jdxi::SynthObserver
    {
    public:
        void onParameterChanged(const jdxi::ParameterUpdate &update) override
        {
            juce::String line;
            line << jdxi::synthTypeName(update.synth) << " " << update.partialIndex << " "
                 << juce::String(update.parameterId) << " = " << update.displayValue;

            auto resolved = jdxi::AddressResolver::resolve(update.synth, update.partialIndex, update.parameterId);
            if (resolved.ok())
            {
                if (const char *label = jdxi::ValueCodec::optionLabel(*resolved.value.spec, update.displayValue))
                    line << " (" << label << ")";
            }

            std::lock_guard<std::mutex> lock(printMutex_);
            std::cout << line << std::endl;
        }

        void onToneNameChanged(jdxi::SynthType synth, int partialIndex, const std::string &name) override
        {
            std::lock_guard<std::mutex> lock(printMutex_);
            std::cout << jdxi::synthTypeName(synth) << " " << partialIndex << " name = \"" << name << "\"" << std::endl;
        }

        void onProgramChanged(const jdxi::ProgramIdentity &program) override
        {
            std::lock_guard<std::mutex> lock(printMutex_);
            std::cout << "program = " << jdxi::ProgramBank::formatProgramId(program) << std::endl;
        }

    private:
        std::mutex printMutex_;
    };

    //==========================================================================
    // Settings + state + connection for one command
    //==========================================================================
    class LinkSession
    {
    public:
        LinkSession()
            : encoder_(settings_.makeDeviceIdentity()),
              connection_(state_, settings_.makeDeviceIdentity(), settings_.getProgramChannel())
        {
            state_.addObserver(&observer_);
        }

        ~LinkSession()
        {
            connection_.disconnectAll();
            state_.removeObserver(&observer_);
        }

        void open()
        {
            if (!connection_.connectOutput(settings_.getOutputPort()))
                juce::ConsoleApplication::fail("Cannot open MIDI output \"" + settings_.getOutputPort() + "\"");
            if (!connection_.connectInput(settings_.getInputPort()))
                juce::ConsoleApplication::fail("Cannot open MIDI input \"" + settings_.getInputPort() + "\"");
        }

        void send(const jdxi::Result<jdxi::SysExMessage> &message)
        {
            if (!message.ok())
                juce::ConsoleApplication::fail("Rejected: " + juce::String(jdxi::errorName(message.error)));
            if (!connection_.sendSysEx(message.value))
                juce::ConsoleApplication::fail("MIDI output not open");
        }

        void waitForReplies()
        {
            juce::Thread::sleep(settings_.getResponseTimeoutMs());
        }

        LinkSettings &settings() { return settings_; }
        jdxi::EditEncoder &encoder() { return encoder_; }
        jdxi::SynthState &state() { return state_; }
        JdxiConnection &connection() { return connection_; }

    private:
        LinkSettings settings_;
        jdxi::SynthState state_;
        ConsoleObserver observer_;
        jdxi::EditEncoder encoder_;
        JdxiConnection connection_;
    };

    //==========================================================================
    // Argument helpers
    //==========================================================================
    jdxi::SynthType synthArgument(const juce::ArgumentList &args, int index)
    {
        jdxi::SynthType synth = jdxi::SynthType::Digital1;
        if (!jdxi::parseSynthType(args[index].text.toStdString(), synth))
            juce::ConsoleApplication::fail("Unknown synth \"" + args[index].text +
                                           "\", expected digital1, digital2, analog, drums or program");
        return synth;
    }

    bool isInteger(const juce::String &text)
    {
        const juce::String digits = text.startsWithChar('-') ? text.substring(1) : text;
        return digits.isNotEmpty() && digits.containsOnly("0123456789");
    }

    int integerArgument(const juce::ArgumentList &args, int index)
    {
        if (!isInteger(args[index].text))
            juce::ConsoleApplication::fail("Expected a number, got \"" + args[index].text + "\"");
        return args[index].text.getIntValue();
    }

    //==========================================================================
    // Commands
    //==========================================================================
    void listPorts(const juce::ArgumentList &)
    {
        std::cout << "Inputs:" << std::endl;
        for (const auto &name : JdxiConnection::getAvailableInputs())
            std::cout << "  " << name << std::endl;

        std::cout << "Outputs:" << std::endl;
        for (const auto &name : JdxiConnection::getAvailableOutputs())
            std::cout << "  " << name << std::endl;
    }

    void setPorts(const juce::ArgumentList &args)
    {
        args.checkMinNumArguments(3);

        LinkSettings settings;
        settings.setInputPort(args[1].text);
        settings.setOutputPort(args[2].text);
        if (!settings.save())
            juce::ConsoleApplication::fail("Could not write " + settings.getFile().getFullPathName());

        std::cout << "Saved to " << settings.getFile().getFullPathName() << std::endl;
    }

    void setParameter(const juce::ArgumentList &args)
    {
        args.checkMinNumArguments(5);

        const jdxi::SynthType synth = synthArgument(args, 1);
        const int partial = integerArgument(args, 2);
        const std::string parameterId = args[3].text.toUpperCase().toStdString();
        const juce::String value = args[4].text;

        LinkSession session;
        session.open();

        if (isInteger(value))
        {
            jdxi::ParameterEdit edit;
            edit.synth = synth;
            edit.partialIndex = partial;
            edit.parameterId = parameterId;
            edit.displayValue = value.getIntValue();
            session.send(session.encoder().applyEdit(edit));
        }
        else
        {
            session.send(session.encoder().applyEnumEdit(synth, partial, parameterId, value.toStdString()));
        }

        std::cout << "Sent " << parameterId << " = " << value << std::endl;
    }

    void selectProgram(const juce::ArgumentList &args)
    {
        args.checkMinNumArguments(2);

        auto program = jdxi::ProgramBank::parseProgramId(args[1].text.toStdString());
        if (!program.ok())
            juce::ConsoleApplication::fail("Bad program \"" + args[1].text + "\": " +
                                           jdxi::errorName(program.error));

        auto values = jdxi::ProgramBank::resolve(program.value);
        if (!values.ok())
            juce::ConsoleApplication::fail(jdxi::errorName(values.error));

        LinkSession session;
        auto messages = jdxi::ChannelMessages::programSelect(session.settings().getProgramChannel(), values.value);
        if (!messages.ok())
            juce::ConsoleApplication::fail(jdxi::errorName(messages.error));

        session.open();
        for (const auto &message : messages.value)
        {
            if (!session.connection().sendChannelMessage(message))
                juce::ConsoleApplication::fail("MIDI output not open");
        }
        session.state().setProgram(program.value);
    }

    void requestSection(const juce::ArgumentList &args)
    {
        args.checkMinNumArguments(3);

        const jdxi::SynthType synth = synthArgument(args, 1);
        const int partial = integerArgument(args, 2);

        LinkSession session;
        session.open();

        if (partial == 0)
        {
            // Whole tone or program: every section of every index
            auto requests = session.encoder().requestTone(synth);
            if (!requests.ok())
                juce::ConsoleApplication::fail("Rejected: " + juce::String(jdxi::errorName(requests.error)));
            for (const auto &request : requests.value)
                session.send(jdxi::Result<jdxi::SysExMessage>::success(request));
        }
        else
        {
            session.send(session.encoder().requestSection(synth, partial));
        }

        session.waitForReplies();

        const int decoded = session.connection().getDecodedCount();
        const int rejected = session.connection().getRejectedCount();
        std::cout << decoded << " message(s) decoded, " << rejected << " rejected" << std::endl;
        if (decoded == 0)
            juce::ConsoleApplication::fail("No reply from device", 2);
    }

    void identifyDevice(const juce::ArgumentList &)
    {
        LinkSession session;
        session.open();

        jdxi::DeviceInfo info;
        if (!session.connection().identify(session.settings().getResponseTimeoutMs(), info))
            juce::ConsoleApplication::fail("No identity reply", 2);

        std::cout << "Device id: 0x" << juce::String::toHexString((int)info.deviceId) << std::endl;
        std::cout << "Manufacturer: 0x" << juce::String::toHexString((int)info.manufacturerId) << std::endl;
        std::cout << "Family: 0x" << juce::String::toHexString((int)info.family).paddedLeft('0', 4) << std::endl;
        std::cout << "Version: " << (int)info.version[0] << "." << (int)info.version[1] << "."
                  << (int)info.version[2] << "." << (int)info.version[3] << std::endl;
        std::cout << (info.isJdxi() ? "JD-Xi detected" : "Not a JD-Xi") << std::endl;
    }

    void monitor(const juce::ArgumentList &args)
    {
        const int seconds = args.size() > 1 ? integerArgument(args, 1) : 10;
        if (seconds <= 0)
            juce::ConsoleApplication::fail("Seconds must be positive");

        LinkSession session;
        if (!session.connection().connectInput(session.settings().getInputPort()))
            juce::ConsoleApplication::fail("Cannot open MIDI input \"" + session.settings().getInputPort() + "\"");

        std::cout << "Listening on " << session.connection().getInputName() << " for " << seconds << "s" << std::endl;
        juce::Thread::sleep(seconds * 1000);

        std::cout << session.connection().getDecodedCount() << " decoded, "
                  << session.connection().getRejectedCount() << " rejected" << std::endl;
    }

    void setName(const juce::ArgumentList &args)
    {
        args.checkMinNumArguments(3);

        const jdxi::SynthType synth = synthArgument(args, 1);
        const std::string name = args[2].text.toStdString();

        LinkSession session;
        session.open();
        session.send(session.encoder().setToneName(synth, name));
    }
}

//==============================================================================
int main(int argc, char *argv[])
{
    juce::ScopedJuceInitialiser_GUI juceInit;

    juce::ConsoleApplication app;
    app.addHelpCommand("--help|-h", "JD-Xi Link - Roland JD-Xi SysEx editor", true);
    app.addVersionCommand("--version|-v", "jdxi_link 1.0.0");

    app.addCommand({"--list", "--list", "List MIDI ports", "", listPorts});
    app.addCommand({"--ports", "--ports <input> <output>", "Store the MIDI port name patterns", "", setPorts});
    app.addCommand({"--set", "--set <synth> <partial> <param> <value>",
                    "Send one parameter edit",
                    "<value> is a display value, or an option label for list parameters.",
                    setParameter});
    app.addCommand({"--program", "--program <A01..H64>", "Select a program", "", selectProgram});
    app.addCommand({"--request", "--request <synth> <partial>",
                    "Request a section and print the reply",
                    "Partial 0 requests the whole tone.",
                    requestSection});
    app.addCommand({"--identify", "--identify", "Send an identity request", "", identifyDevice});
    app.addCommand({"--monitor", "--monitor <seconds>", "Print decoded inbound traffic", "", monitor});
    app.addCommand({"--name", "--name <synth> <text>", "Write the tone name (12 characters max)", "", setName});

    return app.findAndRunCommand(argc, argv);
}
