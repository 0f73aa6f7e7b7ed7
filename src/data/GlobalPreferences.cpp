#include "GlobalPreferences.h"
#include "ViewState.h"

namespace GlobalPreferences
{

namespace
{
    const juce::Identifier rootType ("WaveCutPrefs");
    const juce::Identifier lastOpenDirProp ("lastOpenDir");
    const juce::Identifier zoomLevelProp ("zoomLevel");

    juce::ValueTree loadRoot()
    {
        auto prefsFile = getPrefsFile();
        if (! prefsFile.existsAsFile())
            return {};

        auto xml = juce::XmlDocument::parse (prefsFile);
        if (xml == nullptr)
            return {};

        auto root = juce::ValueTree::fromXml (*xml);
        if (! root.hasType (rootType))
            return {};
        return root;
    }

    void setAndSave (const juce::Identifier& property, const juce::var& value)
    {
        auto prefsFile = getPrefsFile();
        if (! prefsFile.getParentDirectory().createDirectory())
        {
            DBG ("GlobalPreferences: cannot create " + prefsFile.getParentDirectory().getFullPathName());
            return;
        }

        // Keep whatever else is already stored
        auto root = loadRoot();
        if (! root.isValid())
            root = juce::ValueTree (rootType);

        root.setProperty (property, value, nullptr);

        auto xml = root.createXml();
        if (xml == nullptr || ! xml->writeTo (prefsFile))
            DBG ("GlobalPreferences: failed to write " + prefsFile.getFullPathName());
    }
}

//==============================================================================
// Prefs file location
//==============================================================================

juce::File getPrefsFile()
{
    return juce::File::getSpecialLocation (juce::File::userApplicationDataDirectory)
               .getChildFile ("WaveCut")
               .getChildFile ("prefs.xml");
}

//==============================================================================
// Open dialog directory
//==============================================================================

void saveLastOpenDir (const juce::String& dir)
{
    setAndSave (lastOpenDirProp, dir);
}

juce::String loadLastOpenDir()
{
    auto root = loadRoot();
    if (! root.isValid())
        return {};
    return root.getProperty (lastOpenDirProp, "").toString();
}

//==============================================================================
// Waveform zoom
//==============================================================================

void saveZoomLevel (int zoomFactor)
{
    setAndSave (zoomLevelProp, ViewState::clampZoom (zoomFactor));
}

int loadZoomLevel (int fallback)
{
    auto root = loadRoot();
    if (! root.isValid() || ! root.hasProperty (zoomLevelProp))
        return ViewState::clampZoom (fallback);

    return ViewState::clampZoom (static_cast<int> (root.getProperty (zoomLevelProp)));
}

} // namespace GlobalPreferences
