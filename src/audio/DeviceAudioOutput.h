#pragma once

#include <JuceHeader.h>
#include <atomic>
#include "AudioOutput.h"

/**
 * AudioOutput on the default JUCE audio device.
 *
 * The clock counts frames handed to the device since it started, so it
 * advances exactly as fast as the hardware consumes audio. At most one voice
 * renders at a time; attaching a new one detaches the previous.
 *
 * Without a device the clock falls back to the high-resolution system timer
 * and voices render nothing.
 */
class DeviceAudioOutput : public AudioOutput,
                          public juce::AudioIODeviceCallback
{
public:
    DeviceAudioOutput();
    ~DeviceAudioOutput() override;

    /** Opens the default output device. Returns an error message, empty on success. */
    juce::String initialise();

    double getCurrentTime() const override;
    std::unique_ptr<PlaybackVoice> createVoice (std::shared_ptr<const DecodedAudio> audio) override;

    // AudioIODeviceCallback
    void audioDeviceIOCallbackWithContext (const float* const* inputChannelData,
                                           int numInputChannels,
                                           float* const* outputChannelData,
                                           int numOutputChannels,
                                           int numSamples,
                                           const juce::AudioIODeviceCallbackContext& context) override;
    void audioDeviceAboutToStart (juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;

private:
    class DeviceVoice;

    void attach (DeviceVoice* voice);
    void detach (DeviceVoice* voice);

    // Caller holds clockLock
    double computeTimeLocked() const;

    juce::AudioDeviceManager deviceManager;

    juce::SpinLock voiceLock;
    DeviceVoice* activeVoice = nullptr;

    // Guards base, rate and frame count changing together on device start/stop
    mutable juce::SpinLock clockLock;
    std::atomic<juce::int64> framesRendered { 0 };
    std::atomic<double> deviceSampleRate { 0.0 };
    std::atomic<double> clockBaseSeconds { 0.0 };
    std::atomic<double> fallbackStartSeconds { 0.0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (DeviceAudioOutput)
};
