#pragma once

#include <JuceHeader.h>

class WaveCutLookAndFeel : public juce::LookAndFeel_V4
{
public:
    WaveCutLookAndFeel();

    // Colour IDs specific to the editor
    enum ColourIds
    {
        backgroundColourId      = 0x2100001,
        panelColourId           = 0x2100002,
        rowColourId             = 0x2100003,
        borderColourId          = 0x2100004,
        textColourId            = 0x2100005,
        dimTextColourId         = 0x2100006,
        waveformColourId        = 0x2100007,
        waveformBackgroundColourId = 0x2100008,
        playheadColourId        = 0x2100009,
        cutPointColourId        = 0x210000A
    };

    juce::Font getMonoFont (float height) const;

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (WaveCutLookAndFeel)
};
