#pragma once

#include <JuceHeader.h>
#include "ViewState.h"

/**
 * Maps between audio time, zoomed canvas x and viewport pointer x.
 *
 * Stateless apart from the snapshot of duration and ViewState it was built
 * from; build a new one whenever either changes.
 */
class WaveformGeometry
{
public:
    static constexpr double kAutoScrollMarginPx = 20.0;

    WaveformGeometry (double durationSeconds, const ViewState& viewState)
        : duration (durationSeconds),
          view (viewState),
          canvasWidth (viewState.getCanvasWidth())
    {
    }

    double getDuration() const    { return duration; }
    double getCanvasWidth() const { return canvasWidth; }
    const ViewState& getViewState() const { return view; }

    double timeToX (double timeSeconds) const
    {
        if (duration <= 0.0)
            return 0.0;
        return (timeSeconds / duration) * canvasWidth;
    }

    double xToTime (double canvasX) const
    {
        if (duration <= 0.0)
            return 0.0;
        return juce::jlimit (0.0, duration, (canvasX / canvasWidth) * duration);
    }

    /** Pointer x relative to the window -> x on the scrolled canvas. */
    double clientToCanvasX (double clientX, double viewportOriginX) const
    {
        return clientX - viewportOriginX + view.scrollOffset;
    }

    /** Seconds covered by one canvas pixel. */
    double getSecondsPerPixel() const
    {
        return duration > 0.0 ? duration / canvasWidth : 0.0;
    }

    /**
     * Scroll offset that brings the playhead back into view, or -1 when the
     * playhead is already inside [scroll, scroll + viewport - margin].
     * The returned offset centres the playhead and is clamped to the
     * scrollable range.
     */
    double getAutoScrollTarget (double playheadTime, double marginPx = kAutoScrollMarginPx) const
    {
        if (duration <= 0.0)
            return -1.0;

        const double x = timeToX (playheadTime);
        const double left = view.scrollOffset;
        const double right = left + view.viewportWidth;

        if (x >= left && x <= right - marginPx)
            return -1.0;

        const double maxOffset = juce::jmax (0.0, canvasWidth - view.viewportWidth);
        return juce::jlimit (0.0, maxOffset, x - view.viewportWidth / 2.0);
    }

private:
    double duration = 0.0;
    ViewState view;
    double canvasWidth = 1.0;
};
