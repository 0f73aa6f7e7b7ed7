#pragma once

#include <JuceHeader.h>

/** Per-user settings stored in <app data>/WaveCut/prefs.xml. */
namespace GlobalPreferences
{
    juce::File getPrefsFile();

    void saveLastOpenDir (const juce::String& dir);
    juce::String loadLastOpenDir();

    void saveZoomLevel (int zoomFactor);

    /** Stored zoom clamped to the editor's range, or fallback when unset. */
    int loadZoomLevel (int fallback);
}
