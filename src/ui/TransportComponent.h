#pragma once

#include <JuceHeader.h>
#include "WaveCutLookAndFeel.h"

class TransportComponent : public juce::Component
{
public:
    static constexpr int kTransportHeight = 72;
    static constexpr double kSkipSeconds = 5.0;

    explicit TransportComponent (WaveCutLookAndFeel& lnf);

    void paint (juce::Graphics& g) override;
    void resized() override;

    // Display state
    void setDuration (double durationSeconds);
    void setPosition (double positionSeconds);
    void setPlayState (bool playing);
    void setRate (double rate);

    // Callbacks
    std::function<void()> onTogglePlay;
    std::function<void (double deltaSeconds)> onSkip;
    std::function<void (double timeSeconds)> onSeek;
    std::function<void()> onToggleRate;

private:
    WaveCutLookAndFeel& lookAndFeel;
    double duration = 0.0;

    juce::Label positionLabel;
    juce::Label durationLabel;
    juce::Slider seekSlider { juce::Slider::LinearHorizontal, juce::Slider::NoTextBox };

    juce::TextButton skipBackButton { "-5s" };
    juce::TextButton playButton { "Play" };
    juce::TextButton skipForwardButton { "+5s" };
    juce::TextButton rateButton { "1x" };

    juce::Label goToLabel;
    juce::TextEditor goToEditor;
    juce::TextButton goButton { "Go" };

    void submitGoTo();
    void updateEnablement();

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (TransportComponent)
};
