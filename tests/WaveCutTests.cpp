#include <algorithm>
#include <cmath>
#include <iostream>
#include <memory>
#include <vector>

#include <JuceHeader.h>

#include "AudioOutput.h"
#include "CutPointStore.h"
#include "DecodedAudio.h"
#include "DeviceAudioOutput.h"
#include "PlaybackClock.h"
#include "TimeCodec.h"
#include "ViewState.h"
#include "WaveformDownsampler.h"
#include "WaveformEditorComponent.h"
#include "WaveformGeometry.h"
#include "WaveCutLookAndFeel.h"

namespace
{

bool doublesClose (double a, double b, double eps = 1.0e-6)
{
    return std::abs (a - b) <= eps;
}

//==============================================================================
// Fakes
//==============================================================================

class FakeAudioOutput;

// Stop is acknowledged later, like the asynchronous notification of a real device
class FakeVoice : public PlaybackVoice
{
public:
    explicit FakeVoice (FakeAudioOutput& o);
    ~FakeVoice() override;

    void start (double offsetSeconds, double rateIn) override
    {
        startOffset = offsetSeconds;
        rate = rateIn;
        running = true;
    }

    void stop() override
    {
        if (! running)
            return;

        running = false;
        endedPending = true;
    }

    bool isRunning() const override { return running; }

    void deliverPendingEnded()
    {
        if (! endedPending)
            return;

        endedPending = false;
        notifyEnded();
    }

    void reachEndOfData()
    {
        running = false;
        notifyEnded();
    }

    double startOffset = -1.0;
    double rate = 0.0;

private:
    FakeAudioOutput& owner;
    bool running = false;
    bool endedPending = false;
};

class FakeAudioOutput : public AudioOutput
{
public:
    double getCurrentTime() const override { return now; }

    std::unique_ptr<PlaybackVoice> createVoice (std::shared_ptr<const DecodedAudio>) override
    {
        ++voicesCreated;
        return std::make_unique<FakeVoice> (*this);
    }

    int countRunning() const
    {
        return static_cast<int> (std::count_if (liveVoices.begin(), liveVoices.end(),
                                                [] (const FakeVoice* v) { return v->isRunning(); }));
    }

    FakeVoice* latest() const { return liveVoices.empty() ? nullptr : liveVoices.back(); }

    double now = 0.0;
    int voicesCreated = 0;
    std::vector<FakeVoice*> liveVoices;
};

FakeVoice::FakeVoice (FakeAudioOutput& o) : owner (o)
{
    owner.liveVoices.push_back (this);
}

FakeVoice::~FakeVoice()
{
    auto& voices = owner.liveVoices;
    voices.erase (std::remove (voices.begin(), voices.end(), this), voices.end());
}

class ManualFrameScheduler : public FrameScheduler
{
public:
    void requestFrame (std::function<void()> callback) override { pending = std::move (callback); }
    void cancelFrame() override { pending = nullptr; }

    bool hasPending() const { return pending != nullptr; }

    void fire()
    {
        if (pending == nullptr)
            return;

        auto callback = std::move (pending);
        pending = nullptr;
        callback();
    }

private:
    std::function<void()> pending;
};

// Device with a fixed sample rate that renders only when driven by the test
class FixedRateDevice : public juce::AudioIODevice
{
public:
    explicit FixedRateDevice (double rate)
        : juce::AudioIODevice ("Fixed", "Test"), sampleRate (rate) {}

    juce::StringArray getOutputChannelNames() override { return { "L", "R" }; }
    juce::StringArray getInputChannelNames() override { return {}; }
    juce::Array<double> getAvailableSampleRates() override { return { sampleRate }; }
    juce::Array<int> getAvailableBufferSizes() override { return { 256 }; }
    int getDefaultBufferSize() override { return 256; }

    juce::String open (const juce::BigInteger&, const juce::BigInteger&, double, int) override { return {}; }
    void close() override {}
    bool isOpen() override { return true; }
    void start (juce::AudioIODeviceCallback*) override {}
    void stop() override {}
    bool isPlaying() override { return true; }
    juce::String getLastError() override { return {}; }

    int getCurrentBufferSizeSamples() override { return 256; }
    double getCurrentSampleRate() override { return sampleRate; }
    int getCurrentBitDepth() override { return 32; }
    juce::BigInteger getActiveOutputChannels() const override { return juce::BigInteger (3); }
    juce::BigInteger getActiveInputChannels() const override { return {}; }
    int getOutputLatencyInSamples() override { return 0; }
    int getInputLatencyInSamples() override { return 0; }

private:
    double sampleRate;
};

void renderFrames (juce::AudioIODeviceCallback& callback, int numSamples)
{
    juce::AudioBuffer<float> buffer (2, numSamples);
    callback.audioDeviceIOCallbackWithContext (nullptr, 0, buffer.getArrayOfWritePointers(), 2,
                                               numSamples, juce::AudioIODeviceCallbackContext {});
}

std::shared_ptr<const DecodedAudio> makeAudio (double seconds, double sampleRate = 1000.0)
{
    auto audio = std::make_shared<DecodedAudio>();
    audio->sampleRate = sampleRate;
    audio->buffer.setSize (1, static_cast<int> (seconds * sampleRate));
    audio->buffer.clear();
    return audio;
}

ViewState makeView (int zoom, double viewportWidth, double scroll = 0.0)
{
    ViewState view;
    view.zoomFactor = zoom;
    view.viewportWidth = viewportWidth;
    view.setScrollOffset (scroll);
    return view;
}

//==============================================================================
// Time codec
//==============================================================================

bool testTimeFormat()
{
    const struct { double seconds; const char* expected; } cases[] = {
        { 0.0,    "00:00" },
        { 5.0,    "00:05" },
        { 65.9,   "01:05" },
        { 599.99, "09:59" },
        { 3600.0, "1:00:00" },
        { 3725.0, "1:02:05" },
        { -3.0,   "00:00" },
    };

    for (const auto& c : cases)
    {
        const auto got = TimeCodec::format (c.seconds);
        if (got != c.expected)
        {
            std::cerr << "format(" << c.seconds << ") = " << got << ", expected " << c.expected << "\n";
            return false;
        }
    }

    if (TimeCodec::format (std::nan ("")) != "00:00")
    {
        std::cerr << "NaN should format as 00:00\n";
        return false;
    }

    return true;
}

bool testTimeParseValid()
{
    const struct { const char* text; double expected; } cases[] = {
        { "90",        90.0 },
        { "1:30",      90.0 },
        { "01:30",     90.0 },
        { "1:02:03",   3723.0 },
        { "1:30.5",    90.5 },
        { "1:30,25",   90.25 },
        { "  2:00  ",  120.0 },
        { "0:0",       0.0 },
    };

    for (const auto& c : cases)
    {
        double parsed = -1.0;
        if (! TimeCodec::tryParse (c.text, parsed) || ! doublesClose (parsed, c.expected))
        {
            std::cerr << "parse(\"" << c.text << "\") failed or mismatched: " << parsed << "\n";
            return false;
        }
    }

    return true;
}

bool testTimeParseRejectsMalformed()
{
    const char* invalid[] = { "", "   ", "invalid", "-1:00", "1:-5", "1:2:3:4", "1.5:00",
                              "1:", ":30", "1..2", "1:3a", "1,2,3", ".",
                              "3000000000:0", "9999999999:0:0", "0:4294967296:0" };

    for (auto* text : invalid)
    {
        double parsed = 42.0;
        if (TimeCodec::tryParse (text, parsed))
        {
            std::cerr << "parse(\"" << text << "\") should be invalid, got " << parsed << "\n";
            return false;
        }

        if (parsed != 42.0)
        {
            std::cerr << "failed parse wrote to output for \"" << text << "\"\n";
            return false;
        }
    }

    return true;
}

bool testTimeParseLargeFieldsStayPositive()
{
    double parsed = 0.0;
    if (! TimeCodec::tryParse ("999999999:00", parsed) || parsed != 999999999.0 * 60.0)
    {
        std::cerr << "parse(\"999999999:00\") = " << parsed << "\n";
        return false;
    }

    if (! TimeCodec::tryParse ("9999999999", parsed) || parsed != 9999999999.0)
    {
        std::cerr << "parse(\"9999999999\") = " << parsed << "\n";
        return false;
    }

    // Far past the end still clamps to the duration, never to the start
    const double duration = 30.0;
    if (juce::jlimit (0.0, duration, parsed) != duration)
    {
        std::cerr << "large value did not clamp to the duration\n";
        return false;
    }

    return true;
}

bool testTimeFormatOfParsedTextIsStable()
{
    for (auto* text : { "00:00", "03:07", "59:59", "12:00" })
    {
        double parsed = 0.0;
        if (! TimeCodec::tryParse (text, parsed) || TimeCodec::format (parsed) != text)
        {
            std::cerr << "format(parse(" << text << ")) is not stable\n";
            return false;
        }
    }

    return true;
}

//==============================================================================
// View state and geometry
//==============================================================================

bool testZoomStaysInRange()
{
    ViewState view;
    view.zoomFactor = ViewState::kMaxZoom;
    view.stepZoom (1);
    if (view.zoomFactor != ViewState::kMaxZoom || view.canZoomIn())
    {
        std::cerr << "zoom exceeded maximum\n";
        return false;
    }

    for (int i = 0; i < 20; ++i)
        view.stepZoom (-1);

    if (view.zoomFactor != ViewState::kMinZoom || view.canZoomOut())
    {
        std::cerr << "zoom went below minimum\n";
        return false;
    }

    if (ViewState::clampZoom (0) != 1 || ViewState::clampZoom (99) != 8)
    {
        std::cerr << "clampZoom out of range\n";
        return false;
    }

    return true;
}

bool testCanvasWidthNeverZero()
{
    auto view = makeView (3, 0.0);
    if (view.getCanvasWidth() != 1.0)
    {
        std::cerr << "canvas width for empty viewport should be 1, got " << view.getCanvasWidth() << "\n";
        return false;
    }

    view = makeView (3, 333.5);
    if (view.getCanvasWidth() != 1000.0)
    {
        std::cerr << "canvas width should be floored, got " << view.getCanvasWidth() << "\n";
        return false;
    }

    return true;
}

bool testGeometryTimeToX()
{
    WaveformGeometry geometry (100.0, makeView (2, 500.0));

    if (geometry.getCanvasWidth() != 1000.0)
    {
        std::cerr << "expected canvas 1000, got " << geometry.getCanvasWidth() << "\n";
        return false;
    }

    if (! doublesClose (geometry.timeToX (50.0), 500.0))
    {
        std::cerr << "timeToX(50) = " << geometry.timeToX (50.0) << "\n";
        return false;
    }

    // Round trip within one pixel of time
    for (double t : { 0.0, 0.05, 12.345, 50.0, 99.99, 100.0 })
    {
        if (std::abs (geometry.xToTime (geometry.timeToX (t)) - t) > geometry.getSecondsPerPixel())
        {
            std::cerr << "round trip drifted for t=" << t << "\n";
            return false;
        }
    }

    if (geometry.xToTime (-50.0) != 0.0 || geometry.xToTime (5000.0) != 100.0)
    {
        std::cerr << "xToTime should clamp to [0, duration]\n";
        return false;
    }

    WaveformGeometry empty (0.0, makeView (2, 500.0));
    if (empty.timeToX (10.0) != 0.0 || empty.xToTime (10.0) != 0.0)
    {
        std::cerr << "zero duration should map to 0\n";
        return false;
    }

    return true;
}

bool testGeometryClientToCanvas()
{
    WaveformGeometry geometry (100.0, makeView (4, 500.0, 200.0));

    if (! doublesClose (geometry.clientToCanvasX (150.0, 50.0), 300.0))
    {
        std::cerr << "clientToCanvasX = " << geometry.clientToCanvasX (150.0, 50.0) << "\n";
        return false;
    }

    return true;
}

bool testAutoScrollTarget()
{
    // canvas 2000 px over 100 s: 20 px per second
    WaveformGeometry geometry (100.0, makeView (4, 500.0, 0.0));

    if (geometry.getAutoScrollTarget (10.0) != -1.0)
    {
        std::cerr << "visible playhead should not scroll\n";
        return false;
    }

    // x = 490, inside the viewport but within the right margin
    if (! doublesClose (geometry.getAutoScrollTarget (24.5), 240.0))
    {
        std::cerr << "margin scroll target = " << geometry.getAutoScrollTarget (24.5) << "\n";
        return false;
    }

    if (! doublesClose (geometry.getAutoScrollTarget (50.0), 750.0))
    {
        std::cerr << "centring scroll target = " << geometry.getAutoScrollTarget (50.0) << "\n";
        return false;
    }

    if (! doublesClose (geometry.getAutoScrollTarget (99.9), 1500.0))
    {
        std::cerr << "scroll target should clamp to the canvas end, got "
                  << geometry.getAutoScrollTarget (99.9) << "\n";
        return false;
    }

    // Playhead left of the viewport
    WaveformGeometry scrolled (100.0, makeView (4, 500.0, 1000.0));
    if (! doublesClose (scrolled.getAutoScrollTarget (5.0), 0.0))
    {
        std::cerr << "scroll back target = " << scrolled.getAutoScrollTarget (5.0) << "\n";
        return false;
    }

    return true;
}

//==============================================================================
// Downsampler
//==============================================================================

bool testDownsamplerColumns()
{
    const float samples[] = { 0.5f, -0.5f, 1.0f, -1.0f, 0.25f, 0.0f };
    const auto peaks = WaveformDownsampler::compute (samples, 6, 3);

    if (peaks.size() != 3)
    {
        std::cerr << "expected 3 columns, got " << peaks.size() << "\n";
        return false;
    }

    const WaveformPeak expected[] = { { -0.5f, 0.5f }, { -1.0f, 1.0f }, { 0.0f, 0.25f } };
    for (size_t i = 0; i < 3; ++i)
    {
        if (peaks[i].min != expected[i].min || peaks[i].max != expected[i].max)
        {
            std::cerr << "column " << i << " = (" << peaks[i].min << ", " << peaks[i].max << ")\n";
            return false;
        }
    }

    return true;
}

bool testDownsamplerUnevenAndEmptyColumns()
{
    // 5 samples over 2 columns: step 3, second column has 2 samples
    const float samples[] = { 0.1f, 0.2f, 0.3f, -0.4f, 0.9f };
    auto peaks = WaveformDownsampler::compute (samples, 5, 2);
    if (peaks.size() != 2 || peaks[1].min != -0.4f || peaks[1].max != 0.9f)
    {
        std::cerr << "uneven column mismatch\n";
        return false;
    }

    // Wider than the data: trailing columns cover nothing
    peaks = WaveformDownsampler::compute (samples, 2, 4);
    if (peaks.size() != 4 || peaks[3].min != 0.0f || peaks[3].max != 0.0f)
    {
        std::cerr << "empty column should be flat\n";
        return false;
    }

    if (! WaveformDownsampler::compute (samples, 5, 0).empty())
    {
        std::cerr << "zero width should give no columns\n";
        return false;
    }

    return true;
}

bool testAmplitudeToY()
{
    if (WaveformDownsampler::amplitudeToY (1.0f, 128.0f) != 0.0f
        || WaveformDownsampler::amplitudeToY (-1.0f, 128.0f) != 128.0f
        || WaveformDownsampler::amplitudeToY (0.0f, 128.0f) != 64.0f)
    {
        std::cerr << "amplitude mapping mismatch\n";
        return false;
    }

    return true;
}

//==============================================================================
// Cut point store
//==============================================================================

bool testCutPointsClampToDuration()
{
    CutPointStore store;
    store.setDuration (100.0);

    const auto low = store.add (-5.0);
    const auto high = store.add (110.0);

    if (store.find (low) == nullptr || store.find (low)->time != 0.0)
    {
        std::cerr << "add(-5) should clamp to 0\n";
        return false;
    }

    if (store.find (high) == nullptr || store.find (high)->time != 100.0)
    {
        std::cerr << "add(duration + 10) should clamp to duration\n";
        return false;
    }

    store.update (low, 250.0);
    if (store.find (low)->time != 100.0)
    {
        std::cerr << "update should clamp\n";
        return false;
    }

    store.setDuration (40.0);
    if (store.find (high)->time != 40.0)
    {
        std::cerr << "shrinking the duration should re-clamp points\n";
        return false;
    }

    return true;
}

bool testCutPointsRequireLoadedSource()
{
    CutPointStore store;
    int changes = 0;
    store.onChange = [&changes] { ++changes; };

    if (store.add (3.0).isNotEmpty() || ! store.isEmpty() || changes != 0)
    {
        std::cerr << "add without a duration should be a no-op\n";
        return false;
    }

    return true;
}

bool testCutPointsUnknownIdIsNoOp()
{
    CutPointStore store;
    store.setDuration (10.0);
    store.add (2.0);

    int changes = 0;
    store.onChange = [&changes] { ++changes; };

    store.remove ("missing");
    store.update ("missing", 4.0);

    if (changes != 0 || store.size() != 1 || store.getPoints()[0].time != 2.0)
    {
        std::cerr << "unknown id should not change the store\n";
        return false;
    }

    return true;
}

bool testCutPointIdsAreUnique()
{
    CutPointStore store;
    store.setDuration (10.0);

    juce::StringArray ids;
    for (int i = 0; i < 50; ++i)
        ids.addIfNotAlreadyThere (store.add (1.0));

    if (ids.size() != 50)
    {
        std::cerr << "duplicate cut point ids\n";
        return false;
    }

    return true;
}

bool testSortedSnapshotLeavesStorageAlone()
{
    CutPointStore store;
    store.setDuration (10.0);

    const auto a = store.add (5.0);
    const auto b = store.add (2.0);
    const auto c = store.add (8.0);
    const auto d = store.add (2.0);

    const auto sorted = store.getSortedSnapshot();
    if (sorted.size() != 4 || sorted[0].id != b || sorted[1].id != d
        || sorted[2].id != a || sorted[3].id != c)
    {
        std::cerr << "snapshot should be sorted by time with ties in insertion order\n";
        return false;
    }

    const auto& stored = store.getPoints();
    if (stored[0].id != a || stored[1].id != b || stored[2].id != c || stored[3].id != d)
    {
        std::cerr << "sorting must not reorder the store\n";
        return false;
    }

    return true;
}

bool testClickNearPointRemovesIt()
{
    CutPointStore store;
    store.setDuration (100.0);
    const auto id = store.add (50.0);

    // 10 px per second
    WaveformGeometry geometry (100.0, makeView (1, 1000.0));

    auto action = store.resolveClick (505.0, geometry);
    if (action.type != CutPointStore::ClickAction::Type::Remove || action.id != id)
    {
        std::cerr << "click within threshold should resolve to remove\n";
        return false;
    }

    store.applyClick (action);
    if (! store.isEmpty())
    {
        std::cerr << "applying the remove should empty the store\n";
        return false;
    }

    return true;
}

bool testClickAwayFromPointAddsOne()
{
    CutPointStore store;
    store.setDuration (100.0);
    store.add (50.0);

    WaveformGeometry geometry (100.0, makeView (1, 1000.0));

    auto action = store.resolveClick (550.0, geometry);
    if (action.type != CutPointStore::ClickAction::Type::Add || ! doublesClose (action.time, 55.0))
    {
        std::cerr << "click 50 px away should add at 55 s\n";
        return false;
    }

    // Exactly on the threshold is not a hit
    action = store.resolveClick (510.0, geometry);
    if (action.type != CutPointStore::ClickAction::Type::Add)
    {
        std::cerr << "threshold is exclusive\n";
        return false;
    }

    const auto newId = store.applyClick (action);
    if (store.size() != 2 || store.find (newId) == nullptr)
    {
        std::cerr << "applying the add should store a new point\n";
        return false;
    }

    return true;
}

bool testHitTestFollowsZoom()
{
    CutPointStore store;
    store.setDuration (100.0);
    const auto id = store.add (10.0);

    // Zoom 4: the marker sits at x = 400
    WaveformGeometry geometry (100.0, makeView (4, 1000.0));

    if (store.hitTest (405.0, geometry) != id || store.hitTest (105.0, geometry).isNotEmpty())
    {
        std::cerr << "hit test should use zoomed canvas coordinates\n";
        return false;
    }

    return true;
}

//==============================================================================
// Audio loading
//==============================================================================

bool testLoaderReportsMissingFile()
{
    juce::AudioFormatManager formats;
    formats.registerBasicFormats();

    std::shared_ptr<const DecodedAudio> result;
    auto missing = juce::File::getSpecialLocation (juce::File::tempDirectory)
                       .getNonexistentChildFile ("wavecut_missing", ".wav", false);

    if (AudioFileLoader::loadFromFile (formats, missing, result).isEmpty() || result != nullptr)
    {
        std::cerr << "missing file should report an error\n";
        return false;
    }

    return true;
}

bool testLoaderReportsUndecodableFile()
{
    juce::AudioFormatManager formats;
    formats.registerBasicFormats();

    auto file = juce::File::getSpecialLocation (juce::File::tempDirectory)
                    .getNonexistentChildFile ("wavecut_garbage", ".wav", false);
    file.replaceWithText ("definitely not audio");

    std::shared_ptr<const DecodedAudio> result;
    auto error = AudioFileLoader::loadFromFile (formats, file, result);
    file.deleteFile();

    if (error.isEmpty() || result != nullptr)
    {
        std::cerr << "garbage file should report an error\n";
        return false;
    }

    return true;
}

//==============================================================================
// Playback clock
//==============================================================================

bool testPlayPauseResume()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, makeAudio (10.0));

    clock.play();
    output.now = 2.0;
    scheduler.fire();

    if (! doublesClose (clock.getPosition(), 2.0))
    {
        std::cerr << "expected ~2 after 2 s, got " << clock.getPosition() << "\n";
        return false;
    }

    clock.pause();
    output.now = 5.0;

    if (clock.getPhase() != PlaybackClock::Phase::Paused || ! doublesClose (clock.getLivePosition(), 2.0)
        || scheduler.hasPending())
    {
        std::cerr << "pause should freeze the position at ~2\n";
        return false;
    }

    clock.play();
    output.now = 6.0;
    scheduler.fire();

    if (! doublesClose (clock.getPosition(), 3.0))
    {
        std::cerr << "expected ~3 after resuming for 1 s, got " << clock.getPosition() << "\n";
        return false;
    }

    if (output.latest() == nullptr || ! doublesClose (output.latest()->startOffset, 2.0))
    {
        std::cerr << "resumed voice should start at the paused position\n";
        return false;
    }

    return true;
}

bool testPositionIsDerivedNotAccumulated()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, makeAudio (100.0));

    clock.play();

    // Irregular frame spacing must not matter
    for (double t : { 0.016, 0.05, 0.051, 1.7, 3.25 })
    {
        output.now = t;
        scheduler.fire();
    }

    if (! doublesClose (clock.getPosition(), 3.25))
    {
        std::cerr << "position drifted: " << clock.getPosition() << "\n";
        return false;
    }

    return true;
}

bool testRateChangeWhilePlaying()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, makeAudio (10.0));

    clock.play();
    output.now = 1.0;
    clock.setRate (2.0);

    if (! doublesClose (clock.getPosition(), 1.0))
    {
        std::cerr << "rate change should keep the position, got " << clock.getPosition() << "\n";
        return false;
    }

    output.now = 2.0;
    scheduler.fire();

    if (! doublesClose (clock.getPosition(), 3.0))
    {
        std::cerr << "expected 2 s of advance at 2x, got " << clock.getPosition() << "\n";
        return false;
    }

    if (output.latest() == nullptr || output.latest()->rate != 2.0)
    {
        std::cerr << "new voice should run at the new rate\n";
        return false;
    }

    clock.setRate (0.0);
    clock.setRate (-1.0);
    if (clock.getRate() != 2.0)
    {
        std::cerr << "non-positive rates should be ignored\n";
        return false;
    }

    return true;
}

bool testRateChangeWhilePausedAppliesOnPlay()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, makeAudio (10.0));

    clock.setRate (2.0);
    if (output.voicesCreated != 0)
    {
        std::cerr << "rate change while idle should not start output\n";
        return false;
    }

    clock.play();
    output.now = 1.0;
    scheduler.fire();

    if (! doublesClose (clock.getPosition(), 2.0))
    {
        std::cerr << "expected 2x playback, got " << clock.getPosition() << "\n";
        return false;
    }

    return true;
}

bool testReachingEndResetsToIdle()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, makeAudio (10.0));

    int idleTransitions = 0;
    clock.onPhaseChanged = [&idleTransitions] (PlaybackClock::Phase phase)
    {
        if (phase == PlaybackClock::Phase::Idle)
            ++idleTransitions;
    };

    clock.play();
    output.now = 9.995;
    scheduler.fire();

    if (clock.getPhase() != PlaybackClock::Phase::Idle || clock.getPosition() != 0.0)
    {
        std::cerr << "reaching the end should reset to Idle at 0\n";
        return false;
    }

    if (output.countRunning() != 0 || scheduler.hasPending())
    {
        std::cerr << "end of track should stop output and frames\n";
        return false;
    }

    // The voice's own notification arrives afterwards and must change nothing
    if (auto* voice = output.latest())
        voice->deliverPendingEnded();

    if (idleTransitions != 1 || clock.getPhase() != PlaybackClock::Phase::Idle)
    {
        std::cerr << "late ended notification should be ignored\n";
        return false;
    }

    return true;
}

bool testNaturalEndFromVoiceIsIdempotent()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, makeAudio (10.0));

    int idleTransitions = 0;
    clock.onPhaseChanged = [&idleTransitions] (PlaybackClock::Phase phase)
    {
        if (phase == PlaybackClock::Phase::Idle)
            ++idleTransitions;
    };

    clock.play();
    output.now = 4.0;

    auto* voice = output.latest();
    voice->reachEndOfData();
    voice->reachEndOfData();

    if (clock.getPhase() != PlaybackClock::Phase::Idle || clock.getPosition() != 0.0 || idleTransitions != 1)
    {
        std::cerr << "natural end should reset to Idle exactly once\n";
        return false;
    }

    return true;
}

bool testIntentionalStopIsNotTreatedAsEnd()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, makeAudio (10.0));

    clock.play();
    output.now = 3.0;
    auto* first = output.latest();

    clock.pause();
    first->deliverPendingEnded();

    if (clock.getPhase() != PlaybackClock::Phase::Paused || ! doublesClose (clock.getPosition(), 3.0))
    {
        std::cerr << "pause must not be mistaken for the end of the track\n";
        return false;
    }

    // Seeking while playing replaces the voice; the old one reports an intentional stop
    clock.play();
    const int createdBeforeSeek = output.voicesCreated;
    output.now = 4.0;
    clock.seek (7.0);

    if (clock.getPhase() != PlaybackClock::Phase::Playing || ! doublesClose (clock.getPosition(), 7.0))
    {
        std::cerr << "seek while playing should keep playing from the target\n";
        return false;
    }

    if (output.voicesCreated != createdBeforeSeek + 1 || output.latest()->startOffset != 7.0)
    {
        std::cerr << "seek should restart output at exactly the target\n";
        return false;
    }

    return true;
}

bool testSeekWhilePlayingContinuesFromTarget()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, makeAudio (10.0));

    clock.play();
    output.now = 2.0;
    clock.seek (5.0);
    output.now = 3.0;
    scheduler.fire();

    if (! doublesClose (clock.getPosition(), 6.0))
    {
        std::cerr << "expected 6 one second after seeking to 5, got " << clock.getPosition() << "\n";
        return false;
    }

    clock.seek (std::nan (""));
    if (! doublesClose (clock.getLivePosition(), 6.0))
    {
        std::cerr << "non-finite seek should be ignored\n";
        return false;
    }

    return true;
}

bool testSeekWhilePausedStaysPaused()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, makeAudio (10.0));

    clock.play();
    output.now = 1.0;
    clock.pause();
    clock.seek (4.0);

    if (clock.getPhase() != PlaybackClock::Phase::Paused || clock.getPosition() != 4.0
        || output.countRunning() != 0)
    {
        std::cerr << "seek while paused should only move the position\n";
        return false;
    }

    clock.seek (50.0);
    if (clock.getPosition() != 10.0)
    {
        std::cerr << "seek should clamp to the duration\n";
        return false;
    }

    return true;
}

bool testSkipClampsToRange()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, makeAudio (10.0));

    clock.skip (-5.0);
    if (clock.getPosition() != 0.0)
    {
        std::cerr << "skip back at 0 should stay at 0\n";
        return false;
    }

    clock.skip (5.0);
    clock.skip (5.0);
    clock.skip (5.0);
    if (clock.getPosition() != 10.0)
    {
        std::cerr << "skip forward should clamp to the duration\n";
        return false;
    }

    // Skip uses the live position while playing
    clock.seek (2.0);
    clock.play();
    output.now = 1.5;
    clock.skip (5.0);

    if (! doublesClose (clock.getPosition(), 8.5))
    {
        std::cerr << "expected 8.5 after skipping from 3.5, got " << clock.getPosition() << "\n";
        return false;
    }

    return true;
}

bool testOnlyOneVoiceRuns()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, makeAudio (10.0));

    clock.play();
    clock.seek (1.0);
    clock.seek (2.0);
    clock.setRate (2.0);
    clock.play();

    if (output.countRunning() != 1 || output.liveVoices.size() != 1)
    {
        std::cerr << "expected exactly one running voice, got " << output.countRunning() << "\n";
        return false;
    }

    return true;
}

bool testMissingSourceIsNoOp()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;
    PlaybackClock clock (output, scheduler, nullptr);

    clock.play();
    clock.seek (3.0);
    clock.skip (1.0);

    if (clock.hasSource() || clock.getPhase() != PlaybackClock::Phase::Idle
        || clock.getPosition() != 0.0 || output.voicesCreated != 0 || scheduler.hasPending())
    {
        std::cerr << "clock without a source should do nothing\n";
        return false;
    }

    PlaybackClock empty (output, scheduler, makeAudio (0.0));
    empty.play();
    if (empty.isPlaying())
    {
        std::cerr << "zero-length source should not play\n";
        return false;
    }

    return true;
}

bool testDestroyingClockStopsOutput()
{
    FakeAudioOutput output;
    ManualFrameScheduler scheduler;

    {
        PlaybackClock clock (output, scheduler, makeAudio (10.0));
        clock.play();
    }

    if (! output.liveVoices.empty() || scheduler.hasPending())
    {
        std::cerr << "destroyed clock left output or frames behind\n";
        return false;
    }

    return true;
}

//==============================================================================
// Device clock
//==============================================================================

bool testDeviceClockContinuousAcrossStartAndStop()
{
    DeviceAudioOutput output;
    FixedRateDevice device (1000.0);
    juce::AudioIODeviceCallback& callback = output;

    const double beforeStart = output.getCurrentTime();
    callback.audioDeviceAboutToStart (&device);
    const double atStart = output.getCurrentTime();

    if (atStart < beforeStart || atStart - beforeStart > 0.5)
    {
        std::cerr << "clock jumped on device start: " << beforeStart << " -> " << atStart << "\n";
        return false;
    }

    // Frame counting is exact while the device runs
    renderFrames (callback, 500);
    const double afterFrames = output.getCurrentTime();
    if (! doublesClose (afterFrames, atStart + 0.5))
    {
        std::cerr << "expected " << atStart + 0.5 << " after 500 frames, got " << afterFrames << "\n";
        return false;
    }

    callback.audioDeviceStopped();
    const double afterStop = output.getCurrentTime();
    if (afterStop < afterFrames || afterStop - afterFrames > 0.5)
    {
        std::cerr << "clock jumped on device stop: " << afterFrames << " -> " << afterStop << "\n";
        return false;
    }

    callback.audioDeviceAboutToStart (&device);
    const double afterRestart = output.getCurrentTime();
    if (afterRestart < afterStop || afterRestart - afterStop > 0.5)
    {
        std::cerr << "clock jumped on device restart: " << afterStop << " -> " << afterRestart << "\n";
        return false;
    }

    return true;
}

//==============================================================================
// Waveform editor
//==============================================================================

bool testNewSourceCancelsPendingAutoScroll()
{
    WaveCutLookAndFeel lookAndFeel;
    CutPointStore store;
    WaveformEditorComponent editor (lookAndFeel, store);
    editor.setSize (400, editor.getPreferredHeight());

    editor.setAudio (makeAudio (10.0));
    editor.setCurrentTime (5.0);

    if (! editor.isAutoScrollPending())
    {
        std::cerr << "playhead update did not schedule an auto-scroll\n";
        return false;
    }

    editor.setAudio (makeAudio (3.0));

    if (editor.isAutoScrollPending())
    {
        std::cerr << "auto-scroll for the previous source is still pending\n";
        return false;
    }

    if (editor.getViewState().scrollOffset != 0.0)
    {
        std::cerr << "new source did not start at the left edge\n";
        return false;
    }

    return true;
}

} // namespace

int main()
{
    juce::ScopedJuceInitialiser_GUI juceInit;

    struct TestCase
    {
        const char* name;
        bool (*fn)();
    };

    const std::vector<TestCase> tests = {
        { "TimeFormat", &testTimeFormat },
        { "TimeParseValid", &testTimeParseValid },
        { "TimeParseRejectsMalformed", &testTimeParseRejectsMalformed },
        { "TimeParseLargeFieldsStayPositive", &testTimeParseLargeFieldsStayPositive },
        { "TimeFormatOfParsedTextIsStable", &testTimeFormatOfParsedTextIsStable },
        { "ZoomStaysInRange", &testZoomStaysInRange },
        { "CanvasWidthNeverZero", &testCanvasWidthNeverZero },
        { "GeometryTimeToX", &testGeometryTimeToX },
        { "GeometryClientToCanvas", &testGeometryClientToCanvas },
        { "AutoScrollTarget", &testAutoScrollTarget },
        { "DownsamplerColumns", &testDownsamplerColumns },
        { "DownsamplerUnevenAndEmptyColumns", &testDownsamplerUnevenAndEmptyColumns },
        { "AmplitudeToY", &testAmplitudeToY },
        { "CutPointsClampToDuration", &testCutPointsClampToDuration },
        { "CutPointsRequireLoadedSource", &testCutPointsRequireLoadedSource },
        { "CutPointsUnknownIdIsNoOp", &testCutPointsUnknownIdIsNoOp },
        { "CutPointIdsAreUnique", &testCutPointIdsAreUnique },
        { "SortedSnapshotLeavesStorageAlone", &testSortedSnapshotLeavesStorageAlone },
        { "ClickNearPointRemovesIt", &testClickNearPointRemovesIt },
        { "ClickAwayFromPointAddsOne", &testClickAwayFromPointAddsOne },
        { "HitTestFollowsZoom", &testHitTestFollowsZoom },
        { "LoaderReportsMissingFile", &testLoaderReportsMissingFile },
        { "LoaderReportsUndecodableFile", &testLoaderReportsUndecodableFile },
        { "PlayPauseResume", &testPlayPauseResume },
        { "PositionIsDerivedNotAccumulated", &testPositionIsDerivedNotAccumulated },
        { "RateChangeWhilePlaying", &testRateChangeWhilePlaying },
        { "RateChangeWhilePausedAppliesOnPlay", &testRateChangeWhilePausedAppliesOnPlay },
        { "ReachingEndResetsToIdle", &testReachingEndResetsToIdle },
        { "NaturalEndFromVoiceIsIdempotent", &testNaturalEndFromVoiceIsIdempotent },
        { "IntentionalStopIsNotTreatedAsEnd", &testIntentionalStopIsNotTreatedAsEnd },
        { "SeekWhilePlayingContinuesFromTarget", &testSeekWhilePlayingContinuesFromTarget },
        { "SeekWhilePausedStaysPaused", &testSeekWhilePausedStaysPaused },
        { "SkipClampsToRange", &testSkipClampsToRange },
        { "OnlyOneVoiceRuns", &testOnlyOneVoiceRuns },
        { "MissingSourceIsNoOp", &testMissingSourceIsNoOp },
        { "DestroyingClockStopsOutput", &testDestroyingClockStopsOutput },
        { "DeviceClockContinuousAcrossStartAndStop", &testDeviceClockContinuousAcrossStartAndStop },
        { "NewSourceCancelsPendingAutoScroll", &testNewSourceCancelsPendingAutoScroll },
    };

    int failures = 0;
    for (const auto& test : tests)
    {
        const bool ok = test.fn();
        std::cout << (ok ? "[PASS] " : "[FAIL] ") << test.name << "\n";
        if (! ok)
            ++failures;
    }

    if (failures != 0)
        std::cout << failures << " test(s) failed\n";

    return failures == 0 ? 0 : 1;
}
