#pragma once

#include "synth_observer.h"
#include "inbound_decoder.h"
#include <algorithm>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace jdxi
{

    /**
     * SynthState - last known display values of the device.
     *
     * Fed by InboundDecoder results (and by local edits once sent).
     *
     * Key principles:
     * - Changes are deduplicated (no notification if value unchanged)
     * - Thread-safe: MIDI input arrives on JUCE's MIDI thread
     * - Observers notified synchronously, outside the locks
     */
    class SynthState
    {
    public:
        //=========================================================================
        // Observer Management
        //=========================================================================

        void addObserver(SynthObserver *observer)
        {
            std::lock_guard<std::mutex> lock(observerMutex_);
            if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end())
            {
                observers_.push_back(observer);
            }
        }

        void removeObserver(SynthObserver *observer)
        {
            std::lock_guard<std::mutex> lock(observerMutex_);
            observers_.erase(
                std::remove(observers_.begin(), observers_.end(), observer),
                observers_.end());
        }

        //=========================================================================
        // State Mutators - Apply change and notify
        //=========================================================================

        /** Returns true when the stored value changed. */
        bool applyUpdate(const ParameterUpdate &update)
        {
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                const Key key{update.synth, update.partialIndex, update.parameterId};
                auto it = values_.find(key);
                if (it != values_.end() && it->second == update.displayValue)
                    return false; // No change
                values_[key] = update.displayValue;
            }
            notifyParameterChanged(update);
            return true;
        }

        /** Applies every update and name of a decoded message. Returns the number of changes. */
        int apply(const InboundResult &result)
        {
            int changed = 0;
            for (const auto &update : result.updates)
            {
                if (applyUpdate(update))
                    ++changed;
            }
            if (result.hasName && setToneName(result.synth, result.partialIndex, result.name))
                ++changed;
            return changed;
        }

        bool setToneName(SynthType synth, int partialIndex, const std::string &name)
        {
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                const auto key = std::make_pair(synth, partialIndex);
                auto it = names_.find(key);
                if (it != names_.end() && it->second == name)
                    return false;
                names_[key] = name;
            }
            notifyToneNameChanged(synth, partialIndex, name);
            return true;
        }

        void setProgram(const ProgramIdentity &program)
        {
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                if (hasProgram_ && program_ == program)
                    return;
                program_ = program;
                hasProgram_ = true;
            }
            notifyProgramChanged(program);
        }

        void clear()
        {
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                values_.clear();
                names_.clear();
                hasProgram_ = false;
            }
            notifyStateCleared();
        }

        //=========================================================================
        // Queries
        //=========================================================================

        bool getParameter(SynthType synth, int partialIndex, const std::string &parameterId, int &out) const
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            auto it = values_.find(Key{synth, partialIndex, parameterId});
            if (it == values_.end())
                return false;
            out = it->second;
            return true;
        }

        bool getToneName(SynthType synth, int partialIndex, std::string &out) const
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            auto it = names_.find(std::make_pair(synth, partialIndex));
            if (it == names_.end())
                return false;
            out = it->second;
            return true;
        }

        bool getProgram(ProgramIdentity &out) const
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            if (!hasProgram_)
                return false;
            out = program_;
            return true;
        }

        size_t parameterCount() const
        {
            std::lock_guard<std::mutex> lock(stateMutex_);
            return values_.size();
        }

    private:
        struct Key
        {
            SynthType synth;
            int partialIndex;
            std::string parameterId;

            bool operator<(const Key &other) const
            {
                return std::tie(synth, partialIndex, parameterId) <
                       std::tie(other.synth, other.partialIndex, other.parameterId);
            }
        };

        //=========================================================================
        // Notification helpers
        //=========================================================================
        // NOTE: Copy observers_ under lock, then notify without lock to avoid deadlock

        std::vector<SynthObserver *> observerSnapshot() const
        {
            std::lock_guard<std::mutex> lock(observerMutex_);
            return observers_;
        }

        void notifyParameterChanged(const ParameterUpdate &update)
        {
            for (auto *o : observerSnapshot())
                o->onParameterChanged(update);
        }

        void notifyToneNameChanged(SynthType synth, int partialIndex, const std::string &name)
        {
            for (auto *o : observerSnapshot())
                o->onToneNameChanged(synth, partialIndex, name);
        }

        void notifyProgramChanged(const ProgramIdentity &program)
        {
            for (auto *o : observerSnapshot())
                o->onProgramChanged(program);
        }

        void notifyStateCleared()
        {
            for (auto *o : observerSnapshot())
                o->onStateCleared();
        }

        mutable std::mutex stateMutex_;
        std::map<Key, int> values_;
        std::map<std::pair<SynthType, int>, std::string> names_;
        ProgramIdentity program_;
        bool hasProgram_ = false;

        mutable std::mutex observerMutex_;
        std::vector<SynthObserver *> observers_;
    };

} // namespace jdxi
