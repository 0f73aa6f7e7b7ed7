#include "WaveCutLookAndFeel.h"

WaveCutLookAndFeel::WaveCutLookAndFeel()
{
    // Dark colour scheme
    setColour (juce::ResizableWindow::backgroundColourId, juce::Colour (0xff111827));
    setColour (juce::Label::textColourId,                 juce::Colour (0xff9ca3af));
    setColour (juce::TextButton::buttonColourId,          juce::Colour (0xff374151));
    setColour (juce::TextButton::buttonOnColourId,        juce::Colour (0xff2563eb));
    setColour (juce::TextButton::textColourOffId,         juce::Colour (0xffd1d5db));
    setColour (juce::TextButton::textColourOnId,          juce::Colours::white);
    setColour (juce::TextEditor::backgroundColourId,      juce::Colour (0xff4b5563));
    setColour (juce::TextEditor::outlineColourId,         juce::Colour (0xff6b7280));
    setColour (juce::TextEditor::focusedOutlineColourId,  juce::Colour (0xff3b82f6));
    setColour (juce::TextEditor::textColourId,            juce::Colour (0xfff3f4f6));
    setColour (juce::Slider::trackColourId,               juce::Colour (0xff3b82f6));
    setColour (juce::Slider::backgroundColourId,          juce::Colour (0xff374151));
    setColour (juce::Slider::thumbColourId,               juce::Colour (0xff3b82f6));

    // Editor colours
    setColour (backgroundColourId,         juce::Colour (0xff111827));
    setColour (panelColourId,              juce::Colour (0xff1f2937));
    setColour (rowColourId,                juce::Colour (0xff374151));
    setColour (borderColourId,             juce::Colour (0xff4b5563));
    setColour (textColourId,               juce::Colours::white);
    setColour (dimTextColourId,            juce::Colour (0xff9ca3af));
    setColour (waveformColourId,           juce::Colour (0xff3b82f6));  // blue
    setColour (waveformBackgroundColourId, juce::Colour (0xff1f2937));
    setColour (playheadColourId,           juce::Colour (0xff10b981));  // green
    setColour (cutPointColourId,           juce::Colour (0xffef4444));  // red
}

juce::Font WaveCutLookAndFeel::getMonoFont (float height) const
{
    return juce::Font (juce::FontOptions (juce::Font::getDefaultMonospacedFontName(), height, juce::Font::plain));
}
