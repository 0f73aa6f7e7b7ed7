#pragma once

#include <JuceHeader.h>
#include <vector>
#include "ViewState.h"
#include "WaveformDownsampler.h"
#include "WaveCutLookAndFeel.h"

/**
 * Viewport-sized waveform display.
 *
 * Renders the visible window of the zoomed canvas: waveform, playhead and
 * cut point markers. It does NOT capture mouse events; the parent owns all
 * interaction and pushes state into this component.
 *
 * Drawing goes through an offscreen raster whose physical size is the
 * logical size times getRasterScale(), so line widths and dash patterns are
 * specified once in logical pixels.
 */
class WaveformView : public juce::Component
{
public:
    static constexpr int kWaveformHeight = 128;
    static constexpr float kMaxRasterScale = 2.0f;

    explicit WaveformView (WaveCutLookAndFeel& lnf);
    ~WaveformView() override = default;

    // ── State pushed by the parent ──
    void setPeaks (std::vector<WaveformPeak> newPeaks);
    void setViewState (const ViewState& newView);
    void setPlayheadX (double canvasX);
    void setCutPointXs (std::vector<double> xs, int hoveredIndex);
    void setHasAudio (bool hasAudio);

    /** Logical-to-physical pixel factor used for the offscreen raster. */
    float getRasterScale() const;

    void paint (juce::Graphics& g) override;

private:
    WaveCutLookAndFeel& lookAndFeel;

    std::vector<WaveformPeak> peaks;
    ViewState view;
    double playheadX = 0.0;
    std::vector<double> cutPointXs;
    int hoveredCutPoint = -1;
    bool audioLoaded = false;

    juce::Image raster;

    // ── Drawing helpers (canvas coordinates) ──
    void renderCanvas (juce::Graphics& g, juce::Rectangle<float> visible);
    void drawWaveform (juce::Graphics& g, juce::Rectangle<float> visible);
    void drawPlayhead (juce::Graphics& g, juce::Rectangle<float> visible);
    void drawCutPoints (juce::Graphics& g, juce::Rectangle<float> visible);

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (WaveformView)
};
