#pragma once

#include <JuceHeader.h>
#include <memory>
#include "CutPointStore.h"
#include "DecodedAudio.h"
#include "ViewState.h"
#include "WaveformGeometry.h"
#include "WaveformView.h"
#include "WaveCutLookAndFeel.h"

/**
 * Zoomable, scrollable waveform with click-to-toggle cut points.
 *
 * Reads cut points from the store but never mutates it: clicks are resolved
 * against the store and reported through onAddCutPoint / onRemoveCutPoint.
 */
class WaveformEditorComponent : public juce::Component,
                                private juce::ScrollBar::Listener,
                                private juce::Timer
{
public:
    static constexpr int kHeaderHeight = 28;
    static constexpr int kScrollBarHeight = 10;
    static constexpr int kAutoScrollDelayMs = 100;

    WaveformEditorComponent (WaveCutLookAndFeel& lnf, const CutPointStore& store);
    ~WaveformEditorComponent() override;

    void setAudio (std::shared_ptr<const DecodedAudio> newAudio);

    /** Moves the playhead. Auto-scroll follows once the time settles. */
    void setCurrentTime (double timeSeconds);
    bool isAutoScrollPending() const { return isTimerRunning(); }

    /** Re-reads the store after it changed. */
    void cutPointsChanged();

    // Zoom
    void setZoom (int zoomFactor);
    int getZoom() const { return viewState.zoomFactor; }
    void zoomIn()  { setZoom (viewState.zoomFactor + 1); }
    void zoomOut() { setZoom (viewState.zoomFactor - 1); }

    const ViewState& getViewState() const { return viewState; }
    WaveformGeometry getGeometry() const;

    /** Preferred height for the parent's layout. */
    int getPreferredHeight() const;

    // Callbacks
    std::function<void (double timeSeconds)> onAddCutPoint;
    std::function<void (const juce::String& id)> onRemoveCutPoint;
    std::function<void (int zoomFactor)> onZoomChanged;

    void paint (juce::Graphics& g) override;
    void resized() override;
    void mouseUp (const juce::MouseEvent& event) override;
    void mouseMove (const juce::MouseEvent& event) override;
    void mouseExit (const juce::MouseEvent& event) override;
    void mouseWheelMove (const juce::MouseEvent& event, const juce::MouseWheelDetails& wheel) override;

private:
    WaveCutLookAndFeel& lookAndFeel;
    const CutPointStore& cutPoints;

    std::shared_ptr<const DecodedAudio> audio;
    ViewState viewState;
    double currentTime = 0.0;
    int peaksWidth = 0;
    juce::String hoveredId;

    WaveformView waveformView;
    juce::TextButton zoomOutButton { "-" };
    juce::TextButton zoomInButton { "+" };
    juce::Label zoomLabel;
    juce::Label hintLabel;
    juce::ScrollBar scrollBar { false };

    juce::Rectangle<int> waveArea;

    double getDuration() const;
    bool isInWaveArea (juce::Point<int> pos) const;
    double toCanvasX (const juce::MouseEvent& event) const;
    void setHovered (const juce::String& id);

    void setScrollOffset (double offset);
    void recomputePeaksIfNeeded (bool force);
    void pushViewState();
    void pushCutPoints();
    void updateZoomControls();

    void scrollBarMoved (juce::ScrollBar* bar, double newRangeStart) override;
    void timerCallback() override;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (WaveformEditorComponent)
};
