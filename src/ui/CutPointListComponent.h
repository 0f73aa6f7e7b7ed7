#pragma once

#include <JuceHeader.h>
#include <vector>
#include "CutPointStore.h"
#include "WaveCutLookAndFeel.h"

/**
 * Presentation-ordered list of cut points with an editable time per row.
 * Rows are reused across refreshes so an edit in progress survives
 * unrelated changes.
 */
class CutPointListComponent : public juce::Component
{
public:
    static constexpr int kTitleHeight = 24;
    static constexpr int kRowHeight = 28;

    explicit CutPointListComponent (WaveCutLookAndFeel& lnf);
    ~CutPointListComponent() override;

    /** Replaces the shown points. Expects presentation order. */
    void setCutPoints (const std::vector<CutPoint>& sortedPoints, double durationSeconds);

    int getPreferredHeight() const;

    // Callbacks
    std::function<void (const juce::String& id, double timeSeconds)> onUpdateCutPoint;
    std::function<void (const juce::String& id)> onRemoveCutPoint;
    std::function<void (double timeSeconds)> onPlayFromTime;

    void paint (juce::Graphics& g) override;
    void resized() override;

private:
    class Row;

    WaveCutLookAndFeel& lookAndFeel;
    std::vector<std::unique_ptr<Row>> rows;
    double duration = 0.0;

    void commitEdit (const juce::String& id, const juce::String& text, double previousTime);

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (CutPointListComponent)
};
