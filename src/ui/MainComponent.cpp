#include "MainComponent.h"
#include "GlobalPreferences.h"

//==============================================================================
// Construction / Destruction
//==============================================================================

MainComponent::MainComponent()
{
    setLookAndFeel (&waveCutLookAndFeel);
    formatManager.registerBasicFormats();

    // Header
    openButton.onClick = [this] { openFileChooser(); };
    openButton.setWantsKeyboardFocus (false);
    addAndMakeVisible (openButton);

    fileLabel.setText ("No file loaded", juce::dontSendNotification);
    fileLabel.setFont (juce::Font (juce::FontOptions (15.0f, juce::Font::bold)));
    fileLabel.setColour (juce::Label::textColourId, waveCutLookAndFeel.findColour (WaveCutLookAndFeel::textColourId));
    addAndMakeVisible (fileLabel);

    statusLabel.setJustificationType (juce::Justification::centredRight);
    statusLabel.setColour (juce::Label::textColourId, waveCutLookAndFeel.findColour (WaveCutLookAndFeel::cutPointColourId));
    addAndMakeVisible (statusLabel);

    // Transport
    transport = std::make_unique<TransportComponent> (waveCutLookAndFeel);
    transport->onTogglePlay = [this] { togglePlay(); };
    transport->onSkip       = [this] (double delta) { skip (delta); };
    transport->onSeek       = [this] (double t) { seek (t); };
    transport->onToggleRate = [this] { toggleRate(); };
    transport->setRate (playbackRate);
    addAndMakeVisible (*transport);

    // Waveform editor
    waveformEditor = std::make_unique<WaveformEditorComponent> (waveCutLookAndFeel, cutPoints);
    waveformEditor->setZoom (GlobalPreferences::loadZoomLevel (ViewState::kMinZoom));
    waveformEditor->onAddCutPoint    = [this] (double t) { cutPoints.add (t); };
    waveformEditor->onRemoveCutPoint = [this] (const juce::String& id) { cutPoints.remove (id); };
    waveformEditor->onZoomChanged    = [] (int zoom) { GlobalPreferences::saveZoomLevel (zoom); };
    addAndMakeVisible (*waveformEditor);

    // Cut point list
    cutPointList = std::make_unique<CutPointListComponent> (waveCutLookAndFeel);
    cutPointList->onUpdateCutPoint = [this] (const juce::String& id, double t) { cutPoints.update (id, t); };
    cutPointList->onRemoveCutPoint = [this] (const juce::String& id) { cutPoints.remove (id); };
    cutPointList->onPlayFromTime   = [this] (double t) { playFrom (t); };
    addChildComponent (*cutPointList);

    cutPoints.onChange = [this] { cutPointsChanged(); };

    // Audio output; without a device the app still runs silently
    auto deviceError = audioOutput.initialise();
    if (deviceError.isNotEmpty())
        showStatus ("No audio output: " + deviceError);

    // Keyboard shortcuts
    commandManager.registerAllCommandsForTarget (this);
    commandManager.setFirstCommandTarget (this);
    addKeyListener (commandManager.getKeyMappings());

    setSize (960, 540);
    setWantsKeyboardFocus (true);
}

MainComponent::~MainComponent()
{
    cutPoints.onChange = nullptr;
    clock.reset();
    removeKeyListener (commandManager.getKeyMappings());
    setLookAndFeel (nullptr);
}

//==============================================================================
// Loading
//==============================================================================

void MainComponent::openFileChooser()
{
    auto startDir = juce::File (GlobalPreferences::loadLastOpenDir());
    if (! startDir.isDirectory())
        startDir = juce::File::getSpecialLocation (juce::File::userHomeDirectory);

    auto chooser = std::make_shared<juce::FileChooser> ("Open Audio File", startDir,
                                                        formatManager.getWildcardForAllFormats());

    chooser->launchAsync (juce::FileBrowserComponent::openMode | juce::FileBrowserComponent::canSelectFiles,
                          [this, chooser] (const juce::FileChooser& fc)
                          {
                              auto file = fc.getResult();
                              if (! file.existsAsFile())
                                  return;

                              GlobalPreferences::saveLastOpenDir (file.getParentDirectory().getFullPathName());
                              loadFile (file);
                          });
}

juce::String MainComponent::loadFile (const juce::File& file)
{
    std::shared_ptr<const DecodedAudio> decoded;
    auto error = AudioFileLoader::loadFromFile (formatManager, file, decoded);
    if (error.isNotEmpty())
    {
        // Keep whatever was loaded before
        DBG ("MainComponent: " + error);
        showStatus (error);
        return error;
    }

    // Tear down the old controller first so its voice stops
    clock.reset();
    audio = std::move (decoded);

    cutPoints.clear();
    cutPoints.setDuration (audio->getDuration());

    clock = std::make_unique<PlaybackClock> (audioOutput, frameScheduler, audio);
    clock->setRate (playbackRate);
    clock->onPositionChanged = [this] (double t) { positionChanged (t); };
    clock->onPhaseChanged = [this] (PlaybackClock::Phase phase)
    {
        transport->setPlayState (phase == PlaybackClock::Phase::Playing);
    };

    fileLabel.setText (file.getFileName(), juce::dontSendNotification);
    showStatus ({});

    transport->setDuration (audio->getDuration());
    transport->setPlayState (false);
    transport->setPosition (0.0);
    waveformEditor->setAudio (audio);

    cutPointsChanged();
    grabKeyboardFocus();
    return {};
}

void MainComponent::showStatus (const juce::String& message)
{
    statusLabel.setText (message, juce::dontSendNotification);
}

bool MainComponent::isInterestedInFileDrag (const juce::StringArray& files)
{
    for (auto& path : files)
        if (formatManager.findFormatForFileExtension (juce::File (path).getFileExtension()) != nullptr)
            return true;

    return false;
}

void MainComponent::filesDropped (const juce::StringArray& files, int, int)
{
    for (auto& path : files)
    {
        juce::File file (path);
        if (formatManager.findFormatForFileExtension (file.getFileExtension()) != nullptr)
        {
            loadFile (file);
            return;
        }
    }
}

//==============================================================================
// Transport
//==============================================================================

void MainComponent::togglePlay()
{
    if (clock != nullptr)
        clock->togglePlayPause();
}

void MainComponent::skip (double deltaSeconds)
{
    if (clock != nullptr)
        clock->skip (deltaSeconds);
}

void MainComponent::seek (double timeSeconds)
{
    if (clock != nullptr)
        clock->seek (timeSeconds);
}

void MainComponent::toggleRate()
{
    playbackRate = (playbackRate == 1.0) ? 2.0 : 1.0;

    if (clock != nullptr)
        clock->setRate (playbackRate);

    transport->setRate (playbackRate);
}

void MainComponent::playFrom (double timeSeconds)
{
    if (clock == nullptr)
        return;

    clock->seek (timeSeconds);
    clock->play();
}

void MainComponent::positionChanged (double positionSeconds)
{
    transport->setPosition (positionSeconds);
    waveformEditor->setCurrentTime (positionSeconds);
}

//==============================================================================
// Cut points
//==============================================================================

void MainComponent::cutPointsChanged()
{
    cutPointList->setCutPoints (cutPoints.getSortedSnapshot(), cutPoints.getDuration());
    waveformEditor->cutPointsChanged();
    resized();
}

//==============================================================================
// Paint / Layout
//==============================================================================

void MainComponent::paint (juce::Graphics& g)
{
    g.fillAll (waveCutLookAndFeel.findColour (WaveCutLookAndFeel::backgroundColourId));

    auto header = getLocalBounds().removeFromTop (kHeaderHeight);
    g.setColour (waveCutLookAndFeel.findColour (WaveCutLookAndFeel::panelColourId));
    g.fillRect (header);
}

void MainComponent::resized()
{
    auto area = getLocalBounds();

    auto header = area.removeFromTop (kHeaderHeight).reduced (8, 4);
    openButton.setBounds (header.removeFromLeft (90));
    header.removeFromLeft (8);
    statusLabel.setBounds (header.removeFromRight (header.getWidth() / 2));
    fileLabel.setBounds (header);

    transport->setBounds (area.removeFromTop (TransportComponent::kTransportHeight));

    area.reduce (8, 8);
    waveformEditor->setBounds (area.removeFromTop (waveformEditor->getPreferredHeight()));

    area.removeFromTop (8);
    cutPointList->setBounds (area.removeFromTop (juce::jmin (area.getHeight(), cutPointList->getPreferredHeight())));
}

//==============================================================================
// ApplicationCommandTarget
//==============================================================================

void MainComponent::getAllCommands (juce::Array<juce::CommandID>& commands)
{
    commands.add (cmdOpen);
    commands.add (cmdTogglePlay);
    commands.add (cmdSkipBack);
    commands.add (cmdSkipForward);
    commands.add (cmdZoomIn);
    commands.add (cmdZoomOut);
}

void MainComponent::getCommandInfo (juce::CommandID commandID, juce::ApplicationCommandInfo& result)
{
    const bool loaded = clock != nullptr;

    switch (commandID)
    {
        case cmdOpen:
            result.setInfo ("Open...", "Open an audio file", "File", 0);
            result.addDefaultKeypress ('O', juce::ModifierKeys::commandModifier);
            break;
        case cmdTogglePlay:
            result.setInfo ("Play/Pause", "Toggle playback", "Transport", 0);
            result.addDefaultKeypress (juce::KeyPress::spaceKey, 0);
            result.setActive (loaded);
            break;
        case cmdSkipBack:
            result.setInfo ("Skip Back", "Jump back 5 seconds", "Transport", 0);
            result.addDefaultKeypress (juce::KeyPress::leftKey, 0);
            result.setActive (loaded);
            break;
        case cmdSkipForward:
            result.setInfo ("Skip Forward", "Jump forward 5 seconds", "Transport", 0);
            result.addDefaultKeypress (juce::KeyPress::rightKey, 0);
            result.setActive (loaded);
            break;
        case cmdZoomIn:
            result.setInfo ("Zoom In", "Zoom the waveform in", "View", 0);
            result.addDefaultKeypress ('+', 0);
            result.addDefaultKeypress ('=', 0);
            break;
        case cmdZoomOut:
            result.setInfo ("Zoom Out", "Zoom the waveform out", "View", 0);
            result.addDefaultKeypress ('-', 0);
            break;
        default: break;
    }
}

bool MainComponent::perform (const InvocationInfo& info)
{
    switch (info.commandID)
    {
        case cmdOpen:        openFileChooser(); return true;
        case cmdTogglePlay:  togglePlay(); return true;
        case cmdSkipBack:    skip (-TransportComponent::kSkipSeconds); return true;
        case cmdSkipForward: skip (TransportComponent::kSkipSeconds); return true;
        case cmdZoomIn:      waveformEditor->zoomIn(); return true;
        case cmdZoomOut:     waveformEditor->zoomOut(); return true;
        default: break;
    }

    return false;
}
