#pragma once

#include <JuceHeader.h>
#include <vector>

struct WaveformPeak
{
    float min = 0.0f;
    float max = 0.0f;
};

/**
 * Reduces a sample sequence to one (min, max) pair per pixel column.
 *
 * Single O(N) pass; callers recompute whenever the target width or the
 * source changes.
 */
namespace WaveformDownsampler
{
    /** step = ceil(numSamples / width); column i covers
     *  [i * step, min((i + 1) * step, numSamples)). A column that covers no
     *  samples is returned as (0, 0). */
    std::vector<WaveformPeak> compute (const float* samples, int numSamples, int width);

    /** Row for an amplitude in a top-down raster of the given height:
     *  +1 -> 0 (top), -1 -> height (bottom), 0 -> centre. */
    inline float amplitudeToY (float amplitude, float height)
    {
        return (1.0f - amplitude) * height * 0.5f;
    }
}
