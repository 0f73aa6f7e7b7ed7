#include "WaveformView.h"
#include <cmath>

//==============================================================================
// Construction
//==============================================================================

WaveformView::WaveformView (WaveCutLookAndFeel& lnf)
    : lookAndFeel (lnf)
{
    setInterceptsMouseClicks (false, false);
    setOpaque (true);
}

//==============================================================================
// State setters
//==============================================================================

void WaveformView::setPeaks (std::vector<WaveformPeak> newPeaks)
{
    peaks = std::move (newPeaks);
    repaint();
}

void WaveformView::setViewState (const ViewState& newView)
{
    view = newView;
    repaint();
}

void WaveformView::setPlayheadX (double canvasX)
{
    if (playheadX != canvasX)
    {
        playheadX = canvasX;
        repaint();
    }
}

void WaveformView::setCutPointXs (std::vector<double> xs, int hoveredIndex)
{
    cutPointXs = std::move (xs);
    hoveredCutPoint = hoveredIndex;
    repaint();
}

void WaveformView::setHasAudio (bool hasAudio)
{
    audioLoaded = hasAudio;
    repaint();
}

float WaveformView::getRasterScale() const
{
    float scale = 1.0f;

    if (auto* display = juce::Desktop::getInstance().getDisplays().getDisplayForRect (getScreenBounds()))
        scale = static_cast<float> (display->scale);

    return juce::jlimit (1.0f, kMaxRasterScale, scale);
}

//==============================================================================
// Paint
//==============================================================================

void WaveformView::paint (juce::Graphics& g)
{
    const int w = getWidth();
    const int h = getHeight();
    if (w <= 0 || h <= 0)
        return;

    const float scale = getRasterScale();
    const int physW = juce::roundToInt (w * scale);
    const int physH = juce::roundToInt (h * scale);

    if (raster.getWidth() != physW || raster.getHeight() != physH)
        raster = juce::Image (juce::Image::ARGB, physW, physH, true);

    {
        // Canvas coordinates -> viewport -> physical pixels
        juce::Graphics rg (raster);
        rg.addTransform (juce::AffineTransform::scale (scale));
        rg.addTransform (juce::AffineTransform::translation (static_cast<float> (-view.scrollOffset), 0.0f));

        juce::Rectangle<float> visible (static_cast<float> (view.scrollOffset), 0.0f,
                                        static_cast<float> (w), static_cast<float> (h));
        renderCanvas (rg, visible);
    }

    g.drawImage (raster, getLocalBounds().toFloat());
}

void WaveformView::renderCanvas (juce::Graphics& g, juce::Rectangle<float> visible)
{
    g.setColour (lookAndFeel.findColour (WaveCutLookAndFeel::waveformBackgroundColourId));
    g.fillRect (visible);

    if (! audioLoaded)
        return;

    drawWaveform (g, visible);
    drawCutPoints (g, visible);
    drawPlayhead (g, visible);
}

//==============================================================================
// Drawing: Waveform
//==============================================================================

void WaveformView::drawWaveform (juce::Graphics& g, juce::Rectangle<float> visible)
{
    if (peaks.empty())
        return;

    const int numColumns = static_cast<int> (peaks.size());
    const int first = juce::jlimit (0, numColumns, static_cast<int> (std::floor (visible.getX())) - 1);
    const int last  = juce::jlimit (0, numColumns, static_cast<int> (std::ceil (visible.getRight())) + 1);
    if (first >= last)
        return;

    const float height = visible.getHeight();

    // One vertical stroke per column, joined into a single polyline
    juce::Path path;
    path.preallocateSpace ((last - first) * 6);

    for (int i = first; i < last; ++i)
    {
        const auto& peak = peaks[static_cast<size_t> (i)];
        const float x = static_cast<float> (i);
        const float yMin = WaveformDownsampler::amplitudeToY (peak.min, height);
        const float yMax = WaveformDownsampler::amplitudeToY (peak.max, height);

        if (i == first)
            path.startNewSubPath (x, yMin);
        else
            path.lineTo (x, yMin);

        path.lineTo (x, yMax);
    }

    g.setColour (lookAndFeel.findColour (WaveCutLookAndFeel::waveformColourId));
    g.strokePath (path, juce::PathStrokeType (1.0f));
}

//==============================================================================
// Drawing: Playhead and cut points
//==============================================================================

void WaveformView::drawPlayhead (juce::Graphics& g, juce::Rectangle<float> visible)
{
    const float x = static_cast<float> (playheadX);
    if (x < visible.getX() - 2.0f || x > visible.getRight() + 2.0f)
        return;

    g.setColour (lookAndFeel.findColour (WaveCutLookAndFeel::playheadColourId));
    g.fillRect (x - 1.0f, visible.getY(), 2.0f, visible.getHeight());
}

void WaveformView::drawCutPoints (juce::Graphics& g, juce::Rectangle<float> visible)
{
    static const float dashes[] = { 5.0f, 5.0f };
    const auto colour = lookAndFeel.findColour (WaveCutLookAndFeel::cutPointColourId);

    for (int i = 0; i < static_cast<int> (cutPointXs.size()); ++i)
    {
        const float x = static_cast<float> (cutPointXs[static_cast<size_t> (i)]);
        if (x < visible.getX() - 2.0f || x > visible.getRight() + 2.0f)
            continue;

        const bool hovered = (i == hoveredCutPoint);
        g.setColour (hovered ? colour.brighter (0.4f) : colour);
        g.drawDashedLine (juce::Line<float> (x, visible.getY(), x, visible.getBottom()),
                          dashes, juce::numElementsInArray (dashes),
                          hovered ? 3.0f : 2.0f);
    }
}
