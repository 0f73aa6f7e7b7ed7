#include "PlaybackClock.h"
#include <cmath>

//==============================================================================
// Construction / Destruction
//==============================================================================

PlaybackClock::PlaybackClock (AudioOutput& o, FrameScheduler& s,
                              std::shared_ptr<const DecodedAudio> a)
    : output (o), scheduler (s), audio (std::move (a))
{
    if (audio != nullptr && audio->isValid())
        duration = audio->getDuration();
}

PlaybackClock::~PlaybackClock()
{
    scheduler.cancelFrame();

    if (voice != nullptr)
    {
        voice->onEnded = nullptr;
        voice->stopIntentionally();
        voice.reset();
    }
}

//==============================================================================
// Transport
//==============================================================================

void PlaybackClock::play()
{
    if (! hasSource() || phase == Phase::Playing)
        return;

    startVoice();
    setPhase (Phase::Playing);
    publishPosition (storedPosition);

    if (phase == Phase::Playing)
        scheduleNextFrame();
}

void PlaybackClock::pause()
{
    if (phase != Phase::Playing)
        return;

    storedPosition = juce::jmin (storedPosition + computeElapsed(), duration);

    scheduler.cancelFrame();
    stopVoice();
    setPhase (Phase::Paused);
    publishPosition (storedPosition);
}

void PlaybackClock::togglePlayPause()
{
    if (phase == Phase::Playing)
        pause();
    else
        play();
}

void PlaybackClock::seek (double timeSeconds)
{
    if (! hasSource() || ! std::isfinite (timeSeconds))
        return;

    storedPosition = juce::jlimit (0.0, duration, timeSeconds);

    // Restart from the new position; the phase stays Playing throughout
    if (phase == Phase::Playing)
        startVoice();

    publishPosition (storedPosition);
}

void PlaybackClock::skip (double deltaSeconds)
{
    if (! hasSource() || ! std::isfinite (deltaSeconds))
        return;

    seek (getLivePosition() + deltaSeconds);
}

void PlaybackClock::setRate (double newRate)
{
    if (! std::isfinite (newRate) || newRate <= 0.0 || newRate == rate)
        return;

    if (phase != Phase::Playing)
    {
        rate = newRate;
        return;
    }

    // Elapsed time so far was played at the old rate
    storedPosition = juce::jmin (storedPosition + computeElapsed(), duration);
    rate = newRate;
    startVoice();
    publishPosition (storedPosition);
}

void PlaybackClock::reset()
{
    if (! hasSource())
        return;

    scheduler.cancelFrame();
    stopVoice();
    storedPosition = 0.0;
    setPhase (Phase::Idle);
    publishPosition (0.0);
}

//==============================================================================
// Position
//==============================================================================

double PlaybackClock::computeElapsed() const
{
    return juce::jmax (0.0, output.getCurrentTime() - referenceTime) * rate;
}

double PlaybackClock::getLivePosition() const
{
    if (phase != Phase::Playing)
        return storedPosition;

    return juce::jmin (storedPosition + computeElapsed(), duration);
}

void PlaybackClock::scheduleNextFrame()
{
    scheduler.requestFrame ([this] { handleFrame(); });
}

void PlaybackClock::handleFrame()
{
    if (phase != Phase::Playing)
        return;

    const double now = getLivePosition();
    publishPosition (now);

    // An observer may have paused or seeked from inside the callback
    if (phase != Phase::Playing)
        return;

    if (now >= duration - kEndEpsilonSeconds)
    {
        finishPlayback();
        return;
    }

    scheduleNextFrame();
}

//==============================================================================
// Voices
//==============================================================================

void PlaybackClock::startVoice()
{
    stopVoice();

    voice = output.createVoice (audio);
    if (voice != nullptr)
    {
        voice->onEnded = [this] (bool naturalEnd) { handleVoiceEnded (naturalEnd); };
        voice->start (storedPosition, rate);
    }

    referenceTime = output.getCurrentTime();
}

void PlaybackClock::stopVoice()
{
    // The stopped voice is kept until the next one replaces it so that its
    // ended notification still arrives, flagged as intentional.
    if (voice != nullptr)
        voice->stopIntentionally();
}

void PlaybackClock::handleVoiceEnded (bool naturalEnd)
{
    if (naturalEnd)
        finishPlayback();
}

void PlaybackClock::finishPlayback()
{
    if (phase != Phase::Playing)
        return;

    scheduler.cancelFrame();
    stopVoice();
    storedPosition = 0.0;
    setPhase (Phase::Idle);
    publishPosition (0.0);
}

//==============================================================================
// Notification
//==============================================================================

void PlaybackClock::setPhase (Phase newPhase)
{
    if (phase == newPhase)
        return;

    phase = newPhase;
    if (onPhaseChanged)
        onPhaseChanged (phase);
}

void PlaybackClock::publishPosition (double newPosition)
{
    position = newPosition;
    if (onPositionChanged)
        onPositionChanged (position);
}
