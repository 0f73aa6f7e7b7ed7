#include "VBlankFrameScheduler.h"

VBlankFrameScheduler::VBlankFrameScheduler (juce::Component& hostComponent)
    : host (hostComponent)
{
}

VBlankFrameScheduler::~VBlankFrameScheduler()
{
    pending = nullptr;
    attachment.reset();
}

void VBlankFrameScheduler::requestFrame (std::function<void()> callback)
{
    pending = std::move (callback);

    if (attachment == nullptr)
        attachment = std::make_unique<juce::VBlankAttachment> (&host, [this] { handleVBlank(); });
}

void VBlankFrameScheduler::cancelFrame()
{
    pending = nullptr;
}

void VBlankFrameScheduler::handleVBlank()
{
    if (pending == nullptr)
        return;

    // Move out first: the callback usually requests the next frame
    auto callback = std::move (pending);
    pending = nullptr;
    callback();
}
