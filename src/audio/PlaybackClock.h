#pragma once

#include <JuceHeader.h>
#include <functional>
#include <memory>
#include "AudioOutput.h"
#include "DecodedAudio.h"

/**
 * Owns the authoritative playback position for one loaded recording.
 *
 * The position is never accumulated per frame. While playing it is always
 * derived as storedPosition + (clock now - reference) * rate, where the
 * reference is the hardware clock reading taken when the current voice was
 * started. Pausing, seeking and rate changes fold the elapsed time into
 * storedPosition and start a fresh voice.
 *
 * End of track is detected from two independent sources, the per-frame
 * position check and the voice's ended notification; both feed
 * finishPlayback(), which is a no-op once Idle.
 *
 * Create one instance per recording and destroy it when the recording
 * changes. All methods run on the message thread.
 */
class PlaybackClock
{
public:
    enum class Phase { Idle, Playing, Paused };

    static constexpr double kEndEpsilonSeconds = 0.01;

    PlaybackClock (AudioOutput& output, FrameScheduler& scheduler,
                   std::shared_ptr<const DecodedAudio> audio);
    ~PlaybackClock();

    // Transport
    void play();
    void pause();
    void togglePlayPause();
    void seek (double timeSeconds);
    void skip (double deltaSeconds);
    void setRate (double newRate);

    /** Stops output and returns to Idle at position 0. */
    void reset();

    // State
    Phase getPhase() const { return phase; }
    bool isPlaying() const { return phase == Phase::Playing; }
    double getRate() const { return rate; }
    double getDuration() const { return duration; }
    bool hasSource() const { return duration > 0.0; }

    /** Last published position. */
    double getPosition() const { return position; }

    /** Position derived from the clock right now (equals getPosition() unless playing). */
    double getLivePosition() const;

    // Observers, called on every change
    std::function<void (double positionSeconds)> onPositionChanged;
    std::function<void (Phase phase)> onPhaseChanged;

private:
    AudioOutput& output;
    FrameScheduler& scheduler;
    std::shared_ptr<const DecodedAudio> audio;
    double duration = 0.0;

    Phase phase = Phase::Idle;
    double rate = 1.0;
    double storedPosition = 0.0;
    double referenceTime = 0.0;
    double position = 0.0;

    std::unique_ptr<PlaybackVoice> voice;

    double computeElapsed() const;
    void startVoice();
    void stopVoice();
    void scheduleNextFrame();
    void handleFrame();
    void handleVoiceEnded (bool naturalEnd);
    void finishPlayback();

    void setPhase (Phase newPhase);
    void publishPosition (double newPosition);

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (PlaybackClock)
};
