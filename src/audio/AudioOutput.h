#pragma once

#include <JuceHeader.h>
#include <functional>
#include <memory>
#include "DecodedAudio.h"

/**
 * One-shot output node bound to a decoded recording.
 *
 * Started once at an offset and rate, then stopped either by its owner or by
 * reaching the end of the data. Either way onEnded fires once on the message
 * thread. A stop requested through stopIntentionally() reports
 * naturalEnd == false so the owner can tell the two apart.
 */
class PlaybackVoice
{
public:
    virtual ~PlaybackVoice() = default;

    virtual void start (double offsetSeconds, double rate) = 0;

    /** Safe to call on a voice that is already stopped or never started. */
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

    void stopIntentionally()
    {
        intentionalStop = true;
        stop();
    }

    std::function<void (bool naturalEnd)> onEnded;

protected:
    /** Subclasses call this on the message thread when output has ended. */
    void notifyEnded()
    {
        const bool naturalEnd = ! intentionalStop;
        intentionalStop = false;

        if (onEnded)
            onEnded (naturalEnd);
    }

private:
    bool intentionalStop = false;
};

/** The hardware side of playback: a monotonic clock and voice factory. */
class AudioOutput
{
public:
    virtual ~AudioOutput() = default;

    /** Monotonic hardware clock in seconds. */
    virtual double getCurrentTime() const = 0;

    virtual std::unique_ptr<PlaybackVoice> createVoice (std::shared_ptr<const DecodedAudio> audio) = 0;
};

/** Requests a one-shot callback on the next display refresh. */
class FrameScheduler
{
public:
    virtual ~FrameScheduler() = default;

    /** Replaces any pending request. */
    virtual void requestFrame (std::function<void()> callback) = 0;
    virtual void cancelFrame() = 0;
};
