#include "TransportComponent.h"
#include "TimeCodec.h"
#include <cmath>

TransportComponent::TransportComponent (WaveCutLookAndFeel& lnf)
    : lookAndFeel (lnf)
{
    for (auto* label : { &positionLabel, &durationLabel })
    {
        label->setFont (lookAndFeel.getMonoFont (14.0f));
        label->setColour (juce::Label::textColourId, lookAndFeel.findColour (WaveCutLookAndFeel::textColourId));
        label->setText (TimeCodec::format (0.0), juce::dontSendNotification);
        addAndMakeVisible (label);
    }
    positionLabel.setJustificationType (juce::Justification::centredRight);
    durationLabel.setJustificationType (juce::Justification::centredLeft);

    seekSlider.setRange (0.0, 1.0, 0.01);
    seekSlider.onValueChange = [this]
    {
        // Only user drags reach here; setPosition() updates silently
        if (onSeek)
            onSeek (seekSlider.getValue());
    };
    seekSlider.setWantsKeyboardFocus (false);
    addAndMakeVisible (seekSlider);

    skipBackButton.onClick    = [this] { if (onSkip) onSkip (-kSkipSeconds); };
    skipForwardButton.onClick = [this] { if (onSkip) onSkip (kSkipSeconds); };
    playButton.onClick        = [this] { if (onTogglePlay) onTogglePlay(); };
    rateButton.onClick        = [this] { if (onToggleRate) onToggleRate(); };

    for (auto* button : { &skipBackButton, &playButton, &skipForwardButton, &rateButton })
    {
        button->setWantsKeyboardFocus (false);
        addAndMakeVisible (button);
    }

    goToLabel.setText ("Go to", juce::dontSendNotification);
    goToLabel.setJustificationType (juce::Justification::centredRight);
    addAndMakeVisible (goToLabel);

    goToEditor.setFont (lookAndFeel.getMonoFont (13.0f));
    goToEditor.setTextToShowWhenEmpty ("mm:ss", lookAndFeel.findColour (WaveCutLookAndFeel::dimTextColourId));
    goToEditor.setInputRestrictions (12, "0123456789:.,");
    goToEditor.onReturnKey = [this] { submitGoTo(); };
    addAndMakeVisible (goToEditor);

    goButton.onClick = [this] { submitGoTo(); };
    addAndMakeVisible (goButton);

    updateEnablement();
}

//==============================================================================
// Display state
//==============================================================================

void TransportComponent::setDuration (double durationSeconds)
{
    duration = juce::jmax (0.0, durationSeconds);
    durationLabel.setText (TimeCodec::format (duration), juce::dontSendNotification);
    seekSlider.setRange (0.0, juce::jmax (0.01, duration), 0.01);
    seekSlider.setValue (0.0, juce::dontSendNotification);
    updateEnablement();
}

void TransportComponent::setPosition (double positionSeconds)
{
    positionLabel.setText (TimeCodec::format (positionSeconds), juce::dontSendNotification);

    // Don't fight the user's drag
    if (! seekSlider.isMouseButtonDown())
        seekSlider.setValue (positionSeconds, juce::dontSendNotification);
}

void TransportComponent::setPlayState (bool playing)
{
    playButton.setButtonText (playing ? "Pause" : "Play");
    playButton.setToggleState (playing, juce::dontSendNotification);
}

void TransportComponent::setRate (double rate)
{
    rateButton.setButtonText (juce::String (rate, rate == std::floor (rate) ? 0 : 2) + "x");
}

void TransportComponent::updateEnablement()
{
    const bool enabled = duration > 0.0;
    for (auto* c : std::initializer_list<juce::Component*> { &seekSlider, &skipBackButton, &playButton,
                                                             &skipForwardButton, &rateButton,
                                                             &goToEditor, &goButton })
        c->setEnabled (enabled);
}

//==============================================================================
// Go to
//==============================================================================

void TransportComponent::submitGoTo()
{
    double target = 0.0;
    if (duration <= 0.0 || ! TimeCodec::tryParse (goToEditor.getText(), target))
        return;

    if (onSeek)
        onSeek (juce::jlimit (0.0, duration, target));

    goToEditor.clear();
}

//==============================================================================
// Paint / Layout
//==============================================================================

void TransportComponent::paint (juce::Graphics& g)
{
    g.fillAll (lookAndFeel.findColour (WaveCutLookAndFeel::panelColourId));

    g.setColour (lookAndFeel.findColour (WaveCutLookAndFeel::borderColourId));
    g.drawHorizontalLine (getHeight() - 1, 0.0f, static_cast<float> (getWidth()));
}

void TransportComponent::resized()
{
    auto area = getLocalBounds().reduced (8, 4);

    auto sliderRow = area.removeFromTop (28);
    positionLabel.setBounds (sliderRow.removeFromLeft (72));
    durationLabel.setBounds (sliderRow.removeFromRight (72));
    seekSlider.setBounds (sliderRow.reduced (4, 0));

    area.removeFromTop (4);
    auto buttonRow = area.removeFromTop (28);

    skipBackButton.setBounds (buttonRow.removeFromLeft (48));
    buttonRow.removeFromLeft (4);
    playButton.setBounds (buttonRow.removeFromLeft (64));
    buttonRow.removeFromLeft (4);
    skipForwardButton.setBounds (buttonRow.removeFromLeft (48));
    buttonRow.removeFromLeft (12);
    rateButton.setBounds (buttonRow.removeFromLeft (48));

    goButton.setBounds (buttonRow.removeFromRight (40));
    buttonRow.removeFromRight (4);
    goToEditor.setBounds (buttonRow.removeFromRight (90));
    goToLabel.setBounds (buttonRow.removeFromRight (50));
}
