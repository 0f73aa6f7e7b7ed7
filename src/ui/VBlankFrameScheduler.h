#pragma once

#include <JuceHeader.h>
#include "AudioOutput.h"

/**
 * FrameScheduler driven by the display refresh of the monitor a component
 * is showing on. Each request fires at most once, on the next vblank.
 */
class VBlankFrameScheduler : public FrameScheduler
{
public:
    explicit VBlankFrameScheduler (juce::Component& hostComponent);
    ~VBlankFrameScheduler() override;

    void requestFrame (std::function<void()> callback) override;
    void cancelFrame() override;

private:
    juce::Component& host;
    std::unique_ptr<juce::VBlankAttachment> attachment;
    std::function<void()> pending;

    void handleVBlank();

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (VBlankFrameScheduler)
};
