#include "DeviceAudioOutput.h"

namespace
{
    double getSystemSeconds()
    {
        return juce::Time::getMillisecondCounterHiRes() * 0.001;
    }
}

//==============================================================================
// DeviceVoice
//==============================================================================

class DeviceAudioOutput::DeviceVoice : public PlaybackVoice,
                                       private juce::AsyncUpdater
{
public:
    DeviceVoice (DeviceAudioOutput& o, std::shared_ptr<const DecodedAudio> a)
        : owner (o), audio (std::move (a))
    {
    }

    ~DeviceVoice() override
    {
        owner.detach (this);
        cancelPendingUpdate();
    }

    void start (double offsetSeconds, double rate) override
    {
        if (started || audio == nullptr || ! audio->isValid())
            return;

        started = true;
        readPosition = juce::jmax (0.0, offsetSeconds) * audio->sampleRate;
        playbackRate = rate > 0.0 ? rate : 1.0;
        running = true;
        owner.attach (this);
    }

    void stop() override
    {
        if (! running.exchange (false))
            return;

        owner.detach (this);
        triggerAsyncUpdate();
    }

    bool isRunning() const override { return running; }

    // Audio thread, voiceLock held. Returns false once the data is exhausted.
    bool render (float* const* out, int numOut, int numSamples, double deviceRate)
    {
        const int numSourceSamples = audio->getNumSamples();
        const int numSourceChannels = audio->getNumChannels();
        const double increment = playbackRate * audio->sampleRate / deviceRate;

        for (int i = 0; i < numSamples; ++i)
        {
            const auto index = static_cast<int> (readPosition);
            if (index >= numSourceSamples)
            {
                if (running.exchange (false))
                    triggerAsyncUpdate();
                return false;
            }

            const int next = juce::jmin (index + 1, numSourceSamples - 1);
            const float frac = static_cast<float> (readPosition - index);

            for (int ch = 0; ch < numOut; ++ch)
            {
                if (out[ch] == nullptr)
                    continue;

                const float* src = audio->buffer.getReadPointer (juce::jmin (ch, numSourceChannels - 1));
                out[ch][i] += src[index] + frac * (src[next] - src[index]);
            }

            readPosition += increment;
        }

        return true;
    }

private:
    void handleAsyncUpdate() override
    {
        notifyEnded();
    }

    DeviceAudioOutput& owner;
    std::shared_ptr<const DecodedAudio> audio;
    double readPosition = 0.0;
    double playbackRate = 1.0;
    bool started = false;
    std::atomic<bool> running { false };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (DeviceVoice)
};

//==============================================================================
// Construction / Destruction
//==============================================================================

DeviceAudioOutput::DeviceAudioOutput()
{
    fallbackStartSeconds = getSystemSeconds();
}

DeviceAudioOutput::~DeviceAudioOutput()
{
    deviceManager.removeAudioCallback (this);
    deviceManager.closeAudioDevice();
}

juce::String DeviceAudioOutput::initialise()
{
    auto error = deviceManager.initialiseWithDefaultDevices (0, 2);
    if (error.isNotEmpty())
    {
        DBG ("Audio device initialisation failed: " + error);
        return error;
    }

    if (deviceManager.getCurrentAudioDevice() == nullptr)
    {
        DBG ("No audio output device available, playback will be silent");
        return "No audio output device available";
    }

    deviceManager.addAudioCallback (this);
    return {};
}

//==============================================================================
// Clock
//==============================================================================

double DeviceAudioOutput::getCurrentTime() const
{
    const juce::SpinLock::ScopedLockType sl (clockLock);
    return computeTimeLocked();
}

double DeviceAudioOutput::computeTimeLocked() const
{
    const double rate = deviceSampleRate.load();
    if (rate > 0.0)
        return clockBaseSeconds.load() + static_cast<double> (framesRendered.load()) / rate;

    return clockBaseSeconds.load() + (getSystemSeconds() - fallbackStartSeconds.load());
}

//==============================================================================
// Voices
//==============================================================================

std::unique_ptr<PlaybackVoice> DeviceAudioOutput::createVoice (std::shared_ptr<const DecodedAudio> audio)
{
    return std::make_unique<DeviceVoice> (*this, std::move (audio));
}

void DeviceAudioOutput::attach (DeviceVoice* voice)
{
    DeviceVoice* previous = nullptr;
    {
        const juce::SpinLock::ScopedLockType sl (voiceLock);
        previous = activeVoice;
        activeVoice = voice;
    }

    if (previous != nullptr && previous != voice)
        previous->stop();
}

void DeviceAudioOutput::detach (DeviceVoice* voice)
{
    const juce::SpinLock::ScopedLockType sl (voiceLock);
    if (activeVoice == voice)
        activeVoice = nullptr;
}

//==============================================================================
// AudioIODeviceCallback
//==============================================================================

void DeviceAudioOutput::audioDeviceIOCallbackWithContext (const float* const* inputChannelData,
                                                          int numInputChannels,
                                                          float* const* outputChannelData,
                                                          int numOutputChannels,
                                                          int numSamples,
                                                          const juce::AudioIODeviceCallbackContext& context)
{
    juce::ignoreUnused (inputChannelData, numInputChannels, context);

    for (int ch = 0; ch < numOutputChannels; ++ch)
        if (outputChannelData[ch] != nullptr)
            juce::FloatVectorOperations::clear (outputChannelData[ch], numSamples);

    const double rate = deviceSampleRate.load();
    if (rate > 0.0)
    {
        const juce::SpinLock::ScopedLockType sl (voiceLock);
        if (activeVoice != nullptr
            && ! activeVoice->render (outputChannelData, numOutputChannels, numSamples, rate))
            activeVoice = nullptr;
    }

    framesRendered += numSamples;
}

void DeviceAudioOutput::audioDeviceAboutToStart (juce::AudioIODevice* device)
{
    const double newRate = device != nullptr ? device->getCurrentSampleRate() : 0.0;

    // Fold the time so far into the base so the clock stays continuous
    const juce::SpinLock::ScopedLockType sl (clockLock);
    clockBaseSeconds = computeTimeLocked();
    fallbackStartSeconds = getSystemSeconds();
    framesRendered = 0;
    deviceSampleRate = newRate;
}

void DeviceAudioOutput::audioDeviceStopped()
{
    const juce::SpinLock::ScopedLockType sl (clockLock);
    clockBaseSeconds = computeTimeLocked();
    fallbackStartSeconds = getSystemSeconds();
    framesRendered = 0;
    deviceSampleRate = 0.0;
}
