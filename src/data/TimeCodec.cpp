#include "TimeCodec.h"
#include <cmath>

namespace TimeCodec
{

namespace
{
    constexpr const char* kDigits = "0123456789";
    constexpr int kMaxWholeFieldDigits = 9;

    bool parseWholeField (const juce::String& field, int& out)
    {
        auto s = field.trim();
        if (s.isEmpty() || ! s.containsOnly (kDigits))
            return false;

        // Longer fields overflow int
        if (s.length() > kMaxWholeFieldDigits)
            return false;

        out = s.getIntValue();
        return true;
    }

    bool parseSecondsField (const juce::String& field, double& out)
    {
        auto s = field.trim().replaceCharacter (',', '.');
        if (s.isEmpty() || ! s.containsOnly ("0123456789."))
            return false;

        // one separator at most, and at least one digit
        if (s.indexOfChar ('.') != s.lastIndexOfChar ('.'))
            return false;
        if (! s.containsAnyOf (kDigits))
            return false;

        out = s.getDoubleValue();
        return std::isfinite (out);
    }
}

//==============================================================================
// Formatting
//==============================================================================

juce::String format (double seconds)
{
    if (! std::isfinite (seconds) || seconds < 0.0)
        seconds = 0.0;

    const auto total = static_cast<juce::int64> (std::floor (seconds));
    const auto hours = total / 3600;
    const auto mins  = (total % 3600) / 60;
    const auto secs  = total % 60;

    if (hours > 0)
        return juce::String (hours) + ":"
               + juce::String (mins).paddedLeft ('0', 2) + ":"
               + juce::String (secs).paddedLeft ('0', 2);

    return juce::String (mins).paddedLeft ('0', 2) + ":"
           + juce::String (secs).paddedLeft ('0', 2);
}

//==============================================================================
// Parsing
//==============================================================================

bool tryParse (const juce::String& text, double& secondsOut)
{
    auto s = text.trim();
    if (s.isEmpty())
        return false;

    juce::StringArray parts;
    parts.addTokens (s, ":", {});

    double secs = 0.0;
    int mins = 0;
    int hours = 0;

    switch (parts.size())
    {
        case 1:
            if (! parseSecondsField (parts[0], secs))
                return false;
            break;

        case 2:
            if (! parseWholeField (parts[0], mins) || ! parseSecondsField (parts[1], secs))
                return false;
            break;

        case 3:
            if (! parseWholeField (parts[0], hours)
                || ! parseWholeField (parts[1], mins)
                || ! parseSecondsField (parts[2], secs))
                return false;
            break;

        default:
            return false;
    }

    const double total = hours * 3600.0 + mins * 60.0 + secs;
    if (! std::isfinite (total) || total < 0.0)
        return false;

    secondsOut = total;
    return true;
}

} // namespace TimeCodec
