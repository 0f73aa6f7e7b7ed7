#include "DecodedAudio.h"
#include <limits>

namespace AudioFileLoader
{

juce::String loadFromFile (juce::AudioFormatManager& formatManager,
                           const juce::File& file,
                           std::shared_ptr<const DecodedAudio>& result)
{
    if (! file.existsAsFile())
        return "File not found: " + file.getFullPathName();

    std::unique_ptr<juce::AudioFormatReader> reader (formatManager.createReaderFor (file));
    if (reader == nullptr)
        return "Unsupported audio format: " + file.getFileName();

    if (reader->lengthInSamples <= 0 || reader->sampleRate <= 0.0 || reader->numChannels == 0)
        return "File contains no audio: " + file.getFileName();

    if (reader->lengthInSamples > std::numeric_limits<int>::max())
        return "File is too long to load: " + file.getFileName();

    auto audio = std::make_shared<DecodedAudio>();
    audio->sampleRate = reader->sampleRate;
    audio->sourceFile = file;

    const auto numSamples = static_cast<int> (reader->lengthInSamples);
    audio->buffer.setSize (static_cast<int> (reader->numChannels), numSamples);

    if (! reader->read (&audio->buffer, 0, numSamples, 0, true, true))
        return "Failed to decode: " + file.getFileName();

    result = audio;
    return {};
}

} // namespace AudioFileLoader
