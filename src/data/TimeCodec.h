#pragma once

#include <JuceHeader.h>

/**
 * Conversion between a time in seconds and the text form the user types
 * into time fields ("ss", "mm:ss", "h:mm:ss").
 *
 * format() truncates to whole seconds, so format/parse is a lossy round trip.
 */
namespace TimeCodec
{
    /** "mm:ss", or "h:mm:ss" from one hour upwards. */
    juce::String format (double seconds);

    /** Parses "s", "m:s" or "h:m:s". The seconds field may use '.' or ','
     *  as decimal separator. Returns false for empty, malformed or negative
     *  input and leaves secondsOut untouched. No clamping is applied. */
    bool tryParse (const juce::String& text, double& secondsOut);
}
