#pragma once

#include <JuceHeader.h>
#include <memory>
#include "CutPointStore.h"
#include "CutPointListComponent.h"
#include "DecodedAudio.h"
#include "DeviceAudioOutput.h"
#include "PlaybackClock.h"
#include "TransportComponent.h"
#include "VBlankFrameScheduler.h"
#include "WaveCutLookAndFeel.h"
#include "WaveformEditorComponent.h"

class MainComponent : public juce::Component,
                      public juce::ApplicationCommandTarget,
                      public juce::FileDragAndDropTarget
{
public:
    MainComponent();
    ~MainComponent() override;

    void paint (juce::Graphics& g) override;
    void resized() override;

    /** Decodes and shows a file. Returns an error message, empty on success. */
    juce::String loadFile (const juce::File& file);

    // ApplicationCommandTarget
    ApplicationCommandTarget* getNextCommandTarget() override { return nullptr; }
    void getAllCommands (juce::Array<juce::CommandID>& commands) override;
    void getCommandInfo (juce::CommandID commandID, juce::ApplicationCommandInfo& result) override;
    bool perform (const InvocationInfo& info) override;

    // FileDragAndDropTarget
    bool isInterestedInFileDrag (const juce::StringArray& files) override;
    void filesDropped (const juce::StringArray& files, int x, int y) override;

    juce::ApplicationCommandManager commandManager;

    enum CommandIDs
    {
        cmdOpen          = 0x1001,
        cmdTogglePlay    = 0x1010,
        cmdSkipBack      = 0x1011,
        cmdSkipForward   = 0x1012,
        cmdZoomIn        = 0x1020,
        cmdZoomOut       = 0x1021
    };

private:
    static constexpr int kHeaderHeight = 36;

    WaveCutLookAndFeel waveCutLookAndFeel;
    juce::AudioFormatManager formatManager;

    // Declared before the clock: the clock's voices detach from the output
    DeviceAudioOutput audioOutput;
    VBlankFrameScheduler frameScheduler { *this };

    CutPointStore cutPoints;
    std::shared_ptr<const DecodedAudio> audio;
    std::unique_ptr<PlaybackClock> clock;
    double playbackRate = 1.0;

    // Header
    juce::TextButton openButton { "Open..." };
    juce::Label fileLabel;
    juce::Label statusLabel;

    std::unique_ptr<TransportComponent> transport;
    std::unique_ptr<WaveformEditorComponent> waveformEditor;
    std::unique_ptr<CutPointListComponent> cutPointList;

    void openFileChooser();
    void showStatus (const juce::String& message);

    void togglePlay();
    void skip (double deltaSeconds);
    void seek (double timeSeconds);
    void toggleRate();
    void playFrom (double timeSeconds);

    void positionChanged (double positionSeconds);
    void cutPointsChanged();

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (MainComponent)
};
