#pragma once

#include <JuceHeader.h>
#include <functional>
#include <vector>

class WaveformGeometry;

struct CutPoint
{
    juce::String id;
    double time = 0.0;
};

/**
 * Canonical set of cut points for the loaded recording.
 *
 * Storage order is insertion order and carries no meaning. Anything shown to
 * the user goes through getSortedSnapshot(), which sorts a copy by time.
 */
class CutPointStore
{
public:
    static constexpr double kDefaultHitThresholdPx = 10.0;

    CutPointStore() = default;

    /** Sets the clamp range. Existing points are pulled into the new range. */
    void setDuration (double durationSeconds);
    double getDuration() const { return duration; }

    /** Adds a point at the clamped time. Returns its id, or an empty string
     *  when no recording is loaded. */
    juce::String add (double timeSeconds);
    void remove (const juce::String& id);
    void update (const juce::String& id, double newTimeSeconds);
    void clear();

    int size() const { return static_cast<int> (points.size()); }
    bool isEmpty() const { return points.empty(); }
    const CutPoint* find (const juce::String& id) const;

    /** Storage-order view. Use getSortedSnapshot() for presentation. */
    const std::vector<CutPoint>& getPoints() const { return points; }

    /** Copy sorted ascending by time; equal times keep insertion order. */
    std::vector<CutPoint> getSortedSnapshot() const;

    /** Id of the first point (presentation order) whose marker lies closer
     *  than thresholdPx to canvasX, or an empty string. */
    juce::String hitTest (double canvasX, const WaveformGeometry& geometry,
                          double thresholdPx = kDefaultHitThresholdPx) const;

    // A click toggles: near a marker removes it, elsewhere adds one.
    struct ClickAction
    {
        enum class Type { None, Add, Remove };
        Type type = Type::None;
        juce::String id;
        double time = 0.0;
    };

    ClickAction resolveClick (double canvasX, const WaveformGeometry& geometry,
                              double thresholdPx = kDefaultHitThresholdPx) const;

    /** Applies a resolved click to this store. Returns the id touched. */
    juce::String applyClick (const ClickAction& action);

    std::function<void()> onChange;

private:
    std::vector<CutPoint> points;
    double duration = 0.0;
    juce::int64 nextSerial = 1;

    double clampTime (double t) const;
    juce::String createId();
    void notifyChanged();
};
