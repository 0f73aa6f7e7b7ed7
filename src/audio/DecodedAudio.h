#pragma once

#include <JuceHeader.h>
#include <memory>

/**
 * A fully decoded recording held in memory.
 *
 * Immutable once loaded; shared between the UI, the playback clock and the
 * audio output as std::shared_ptr<const DecodedAudio>.
 */
struct DecodedAudio
{
    juce::AudioBuffer<float> buffer;
    double sampleRate = 0.0;
    juce::File sourceFile;

    int getNumChannels() const { return buffer.getNumChannels(); }
    int getNumSamples() const  { return buffer.getNumSamples(); }

    double getDuration() const
    {
        if (sampleRate <= 0.0)
            return 0.0;
        return static_cast<double> (buffer.getNumSamples()) / sampleRate;
    }

    bool isValid() const
    {
        return getNumChannels() > 0 && getDuration() > 0.0;
    }

    /** Samples of one channel, or nullptr if the channel does not exist. */
    const float* getChannelSamples (int channel = 0) const
    {
        if (channel < 0 || channel >= getNumChannels())
            return nullptr;
        return buffer.getReadPointer (channel);
    }
};

namespace AudioFileLoader
{
    /** Decodes a whole file. Returns an error message, empty on success. */
    juce::String loadFromFile (juce::AudioFormatManager& formatManager,
                               const juce::File& file,
                               std::shared_ptr<const DecodedAudio>& result);
}
