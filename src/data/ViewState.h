#pragma once

#include <JuceHeader.h>
#include <cmath>

/** Zoom and scroll state of the waveform editor, owned by the UI shell. */
struct ViewState
{
    static constexpr int kMinZoom = 1;
    static constexpr int kMaxZoom = 8;

    int zoomFactor = kMinZoom;
    double viewportWidth = 0.0;
    double scrollOffset = 0.0;

    static int clampZoom (int zoom)
    {
        return juce::jlimit (kMinZoom, kMaxZoom, zoom);
    }

    void stepZoom (int delta)
    {
        zoomFactor = clampZoom (zoomFactor + delta);
    }

    bool canZoomIn() const  { return zoomFactor < kMaxZoom; }
    bool canZoomOut() const { return zoomFactor > kMinZoom; }

    /** Width of the zoomed canvas in logical pixels (never below 1). */
    double getCanvasWidth() const
    {
        return juce::jmax (1.0, std::floor (juce::jmax (0.0, viewportWidth) * zoomFactor));
    }

    double getMaxScrollOffset() const
    {
        return juce::jmax (0.0, getCanvasWidth() - viewportWidth);
    }

    void setScrollOffset (double offset)
    {
        scrollOffset = juce::jlimit (0.0, getMaxScrollOffset(), offset);
    }
};
