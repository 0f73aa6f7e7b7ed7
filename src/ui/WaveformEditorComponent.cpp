#include "WaveformEditorComponent.h"
#include "WaveformDownsampler.h"
#include <cmath>

//==============================================================================
// Construction / Destruction
//==============================================================================

WaveformEditorComponent::WaveformEditorComponent (WaveCutLookAndFeel& lnf, const CutPointStore& store)
    : lookAndFeel (lnf), cutPoints (store), waveformView (lnf)
{
    addAndMakeVisible (waveformView);

    zoomOutButton.onClick = [this] { zoomOut(); };
    zoomInButton.onClick  = [this] { zoomIn(); };
    addAndMakeVisible (zoomOutButton);
    addAndMakeVisible (zoomInButton);

    zoomLabel.setJustificationType (juce::Justification::centred);
    zoomLabel.setFont (lookAndFeel.getMonoFont (13.0f));
    addAndMakeVisible (zoomLabel);

    hintLabel.setText ("Click the waveform to add a cut point, click a marker to remove it",
                       juce::dontSendNotification);
    hintLabel.setColour (juce::Label::textColourId,
                         lookAndFeel.findColour (WaveCutLookAndFeel::dimTextColourId));
    hintLabel.setFont (juce::Font (juce::FontOptions (12.0f)));
    addAndMakeVisible (hintLabel);

    scrollBar.setAutoHide (true);
    scrollBar.addListener (this);
    addAndMakeVisible (scrollBar);

    updateZoomControls();
}

WaveformEditorComponent::~WaveformEditorComponent()
{
    stopTimer();
    scrollBar.removeListener (this);
}

//==============================================================================
// Audio
//==============================================================================

void WaveformEditorComponent::setAudio (std::shared_ptr<const DecodedAudio> newAudio)
{
    // A scroll scheduled for the previous source must not land on this one
    stopTimer();

    audio = std::move (newAudio);
    currentTime = 0.0;
    hoveredId = {};
    viewState.setScrollOffset (0.0);

    waveformView.setHasAudio (audio != nullptr && audio->isValid());
    recomputePeaksIfNeeded (true);
    pushViewState();
}

double WaveformEditorComponent::getDuration() const
{
    return (audio != nullptr && audio->isValid()) ? audio->getDuration() : 0.0;
}

WaveformGeometry WaveformEditorComponent::getGeometry() const
{
    return WaveformGeometry (getDuration(), viewState);
}

//==============================================================================
// Playhead and auto-scroll
//==============================================================================

void WaveformEditorComponent::setCurrentTime (double timeSeconds)
{
    currentTime = timeSeconds;
    waveformView.setPlayheadX (getGeometry().timeToX (currentTime));

    // Restarting the timer collapses bursts of updates into one scroll
    startTimer (kAutoScrollDelayMs);
}

void WaveformEditorComponent::timerCallback()
{
    stopTimer();

    const double target = getGeometry().getAutoScrollTarget (currentTime);
    if (target >= 0.0)
        setScrollOffset (target);
}

void WaveformEditorComponent::setScrollOffset (double offset)
{
    const double before = viewState.scrollOffset;
    viewState.setScrollOffset (offset);

    if (viewState.scrollOffset != before)
        pushViewState();
}

void WaveformEditorComponent::scrollBarMoved (juce::ScrollBar*, double newRangeStart)
{
    setScrollOffset (newRangeStart);
}

//==============================================================================
// Zoom
//==============================================================================

void WaveformEditorComponent::setZoom (int zoomFactor)
{
    const int clamped = ViewState::clampZoom (zoomFactor);
    if (clamped == viewState.zoomFactor)
        return;

    // Keep the time at the viewport centre in place
    const double centreTime = getGeometry().xToTime (viewState.scrollOffset + viewState.viewportWidth * 0.5);

    viewState.zoomFactor = clamped;
    viewState.setScrollOffset (getGeometry().timeToX (centreTime) - viewState.viewportWidth * 0.5);

    recomputePeaksIfNeeded (false);
    pushViewState();
    updateZoomControls();

    if (onZoomChanged)
        onZoomChanged (viewState.zoomFactor);
}

void WaveformEditorComponent::updateZoomControls()
{
    zoomOutButton.setEnabled (viewState.canZoomOut());
    zoomInButton.setEnabled (viewState.canZoomIn());
    zoomLabel.setText (juce::String (viewState.zoomFactor) + "x", juce::dontSendNotification);
}

//==============================================================================
// View state propagation
//==============================================================================

void WaveformEditorComponent::recomputePeaksIfNeeded (bool force)
{
    if (audio == nullptr || ! audio->isValid())
    {
        peaksWidth = 0;
        waveformView.setPeaks ({});
        return;
    }

    const int width = static_cast<int> (viewState.getCanvasWidth());
    if (! force && width == peaksWidth)
        return;

    peaksWidth = width;

    // Only the first channel is drawn
    waveformView.setPeaks (WaveformDownsampler::compute (audio->getChannelSamples (0),
                                                         audio->getNumSamples(), width));
}

void WaveformEditorComponent::pushViewState()
{
    const auto geometry = getGeometry();

    waveformView.setViewState (viewState);
    waveformView.setPlayheadX (geometry.timeToX (currentTime));

    scrollBar.setRangeLimits (0.0, geometry.getCanvasWidth(), juce::dontSendNotification);
    scrollBar.setCurrentRange (viewState.scrollOffset, viewState.viewportWidth, juce::dontSendNotification);

    pushCutPoints();
}

void WaveformEditorComponent::pushCutPoints()
{
    const auto geometry = getGeometry();
    const auto sorted = cutPoints.getSortedSnapshot();

    std::vector<double> xs;
    xs.reserve (sorted.size());
    int hoveredIndex = -1;

    for (const auto& point : sorted)
    {
        if (point.id == hoveredId)
            hoveredIndex = static_cast<int> (xs.size());
        xs.push_back (geometry.timeToX (point.time));
    }

    waveformView.setCutPointXs (std::move (xs), hoveredIndex);
}

void WaveformEditorComponent::cutPointsChanged()
{
    if (hoveredId.isNotEmpty() && cutPoints.find (hoveredId) == nullptr)
        setHovered ({});

    pushCutPoints();
}

//==============================================================================
// Paint / Layout
//==============================================================================

int WaveformEditorComponent::getPreferredHeight() const
{
    return kHeaderHeight + WaveformView::kWaveformHeight + 2 + kScrollBarHeight + 4;
}

void WaveformEditorComponent::paint (juce::Graphics& g)
{
    g.fillAll (lookAndFeel.findColour (WaveCutLookAndFeel::panelColourId));

    g.setColour (lookAndFeel.findColour (WaveCutLookAndFeel::borderColourId));
    g.drawRect (waveArea.expanded (1), 1);
}

void WaveformEditorComponent::resized()
{
    auto area = getLocalBounds();

    auto header = area.removeFromTop (kHeaderHeight).reduced (0, 2);
    zoomInButton.setBounds (header.removeFromRight (28));
    zoomLabel.setBounds (header.removeFromRight (40));
    zoomOutButton.setBounds (header.removeFromRight (28));
    header.removeFromRight (8);
    hintLabel.setBounds (header);

    area.removeFromTop (1);
    waveArea = area.removeFromTop (WaveformView::kWaveformHeight).reduced (1, 0);
    waveformView.setBounds (waveArea);

    area.removeFromTop (3);
    scrollBar.setBounds (area.removeFromTop (kScrollBarHeight).withX (waveArea.getX()).withWidth (waveArea.getWidth()));

    viewState.viewportWidth = static_cast<double> (waveArea.getWidth());
    viewState.setScrollOffset (viewState.scrollOffset);

    recomputePeaksIfNeeded (false);
    pushViewState();
}

//==============================================================================
// Mouse interaction
//==============================================================================

bool WaveformEditorComponent::isInWaveArea (juce::Point<int> pos) const
{
    return waveArea.contains (pos);
}

double WaveformEditorComponent::toCanvasX (const juce::MouseEvent& event) const
{
    return getGeometry().clientToCanvasX (event.position.x, static_cast<double> (waveArea.getX()));
}

void WaveformEditorComponent::mouseUp (const juce::MouseEvent& event)
{
    if (! event.mouseWasClicked() || ! isInWaveArea (event.getPosition()) || getDuration() <= 0.0)
        return;

    const auto action = cutPoints.resolveClick (toCanvasX (event), getGeometry());

    switch (action.type)
    {
        case CutPointStore::ClickAction::Type::Add:
            if (onAddCutPoint)
                onAddCutPoint (action.time);
            break;

        case CutPointStore::ClickAction::Type::Remove:
            if (onRemoveCutPoint)
                onRemoveCutPoint (action.id);
            break;

        case CutPointStore::ClickAction::Type::None:
            break;
    }
}

void WaveformEditorComponent::mouseMove (const juce::MouseEvent& event)
{
    if (! isInWaveArea (event.getPosition()) || getDuration() <= 0.0)
    {
        setHovered ({});
        setMouseCursor (juce::MouseCursor::NormalCursor);
        return;
    }

    const auto id = cutPoints.hitTest (toCanvasX (event), getGeometry());
    setHovered (id);
    setMouseCursor (id.isNotEmpty() ? juce::MouseCursor::PointingHandCursor
                                    : juce::MouseCursor::CrosshairCursor);
}

void WaveformEditorComponent::mouseExit (const juce::MouseEvent&)
{
    setHovered ({});
    setMouseCursor (juce::MouseCursor::NormalCursor);
}

void WaveformEditorComponent::mouseWheelMove (const juce::MouseEvent& event, const juce::MouseWheelDetails& wheel)
{
    if (viewState.getMaxScrollOffset() <= 0.0)
    {
        juce::Component::mouseWheelMove (event, wheel);
        return;
    }

    const float delta = (std::abs (wheel.deltaX) > std::abs (wheel.deltaY)) ? wheel.deltaX : wheel.deltaY;
    setScrollOffset (viewState.scrollOffset - delta * 200.0);
}

void WaveformEditorComponent::setHovered (const juce::String& id)
{
    if (hoveredId == id)
        return;

    hoveredId = id;
    pushCutPoints();
}
