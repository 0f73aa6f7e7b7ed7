#include "WaveformDownsampler.h"

namespace WaveformDownsampler
{

std::vector<WaveformPeak> compute (const float* samples, int numSamples, int width)
{
    std::vector<WaveformPeak> peaks;
    if (width <= 0)
        return peaks;

    peaks.resize (static_cast<size_t> (width));

    if (samples == nullptr || numSamples <= 0)
        return peaks;

    const juce::int64 total = numSamples;
    const juce::int64 step = (total + width - 1) / width;

    for (int i = 0; i < width; ++i)
    {
        const juce::int64 begin = static_cast<juce::int64> (i) * step;
        const juce::int64 end = juce::jmin (begin + step, total);

        float lo = 1.0f;
        float hi = -1.0f;

        for (juce::int64 j = begin; j < end; ++j)
        {
            const float v = samples[j];
            if (v < lo) lo = v;
            if (v > hi) hi = v;
        }

        // Past the end of the data: flat line at the centre
        if (begin >= end)
            lo = hi = 0.0f;

        peaks[static_cast<size_t> (i)] = { lo, hi };
    }

    return peaks;
}

} // namespace WaveformDownsampler
