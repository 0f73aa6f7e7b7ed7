#include "CutPointListComponent.h"
#include "TimeCodec.h"

//==============================================================================
// Row
//==============================================================================

class CutPointListComponent::Row : public juce::Component
{
public:
    Row (CutPointListComponent& ownerList, WaveCutLookAndFeel& lnf)
        : owner (ownerList)
    {
        indexLabel.setFont (lnf.getMonoFont (13.0f));
        indexLabel.setColour (juce::Label::textColourId,
                              lnf.findColour (WaveCutLookAndFeel::dimTextColourId));
        addAndMakeVisible (indexLabel);

        timeEditor.setFont (lnf.getMonoFont (13.0f));
        timeEditor.setSelectAllWhenFocused (true);
        timeEditor.setInputRestrictions (12, "0123456789:.,");
        timeEditor.onReturnKey = [this] { commit(); };
        timeEditor.onFocusLost = [this] { commit(); };
        timeEditor.onEscapeKey = [this] { showTime(); };
        addAndMakeVisible (timeEditor);

        playButton.setTooltip ("Play from here");
        playButton.onClick = [this] { postAction (false); };
        addAndMakeVisible (playButton);

        removeButton.setTooltip ("Remove cut point");
        removeButton.onClick = [this] { postAction (true); };
        addAndMakeVisible (removeButton);
    }

    ~Row() override
    {
        timeEditor.onFocusLost = nullptr;
    }

    void setPoint (int index, const CutPoint& point)
    {
        indexLabel.setText ("Cut " + juce::String (index + 1) + ":", juce::dontSendNotification);

        const bool changed = (point.id != id || point.time != time);
        id = point.id;
        time = point.time;

        // Leave an edit in progress alone
        if (changed && ! timeEditor.hasKeyboardFocus (true))
            showTime();
    }

    void resized() override
    {
        auto area = getLocalBounds().reduced (4, 2);
        indexLabel.setBounds (area.removeFromLeft (64));
        removeButton.setBounds (area.removeFromRight (28));
        area.removeFromRight (4);
        playButton.setBounds (area.removeFromRight (28));
        area.removeFromRight (8);
        timeEditor.setBounds (area.removeFromLeft (juce::jmin (area.getWidth(), 110)));
    }

private:
    CutPointListComponent& owner;
    juce::String id;
    double time = 0.0;

    juce::Label indexLabel;
    juce::TextEditor timeEditor;
    juce::TextButton playButton { ">" };
    juce::TextButton removeButton { "x" };

    void showTime()
    {
        timeEditor.setText (TimeCodec::format (time), juce::dontSendNotification);
    }

    void commit()
    {
        const auto text = timeEditor.getText().trim();

        // Unchanged text must not truncate the stored sub-second time
        if (text == TimeCodec::format (time))
            return;

        owner.commitEdit (id, text, time);
        showTime();
    }

    void postAction (bool remove)
    {
        // The row may be destroyed by the resulting refresh
        juce::Component::SafePointer<CutPointListComponent> safeOwner (&owner);
        const auto pointId = id;
        const double pointTime = time;

        juce::MessageManager::callAsync ([safeOwner, pointId, pointTime, remove]
        {
            if (safeOwner == nullptr)
                return;

            if (remove)
            {
                if (safeOwner->onRemoveCutPoint)
                    safeOwner->onRemoveCutPoint (pointId);
            }
            else if (safeOwner->onPlayFromTime)
            {
                safeOwner->onPlayFromTime (pointTime);
            }
        });
    }

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (Row)
};

//==============================================================================
// Construction
//==============================================================================

CutPointListComponent::CutPointListComponent (WaveCutLookAndFeel& lnf)
    : lookAndFeel (lnf)
{
}

CutPointListComponent::~CutPointListComponent() = default;

//==============================================================================
// Content
//==============================================================================

void CutPointListComponent::setCutPoints (const std::vector<CutPoint>& sortedPoints, double durationSeconds)
{
    duration = durationSeconds;

    while (rows.size() > sortedPoints.size())
        rows.pop_back();

    while (rows.size() < sortedPoints.size())
    {
        rows.push_back (std::make_unique<Row> (*this, lookAndFeel));
        addAndMakeVisible (*rows.back());
    }

    for (size_t i = 0; i < sortedPoints.size(); ++i)
        rows[i]->setPoint (static_cast<int> (i), sortedPoints[i]);

    setVisible (! sortedPoints.empty());
    resized();
    repaint();
}

void CutPointListComponent::commitEdit (const juce::String& id, const juce::String& text, double previousTime)
{
    double parsed = previousTime;
    if (! TimeCodec::tryParse (text, parsed) || duration <= 0.0)
        return;

    if (onUpdateCutPoint)
        onUpdateCutPoint (id, juce::jlimit (0.0, duration, parsed));
}

//==============================================================================
// Paint / Layout
//==============================================================================

int CutPointListComponent::getPreferredHeight() const
{
    if (rows.empty())
        return 0;

    return kTitleHeight + static_cast<int> (rows.size()) * kRowHeight + 4;
}

void CutPointListComponent::paint (juce::Graphics& g)
{
    g.fillAll (lookAndFeel.findColour (WaveCutLookAndFeel::panelColourId));

    g.setColour (lookAndFeel.findColour (WaveCutLookAndFeel::textColourId));
    g.setFont (juce::Font (juce::FontOptions (14.0f, juce::Font::bold)));
    g.drawText ("Cut points (" + juce::String (static_cast<int> (rows.size())) + ")",
                getLocalBounds().removeFromTop (kTitleHeight).reduced (4, 0),
                juce::Justification::centredLeft);

    g.setColour (lookAndFeel.findColour (WaveCutLookAndFeel::rowColourId));
    for (auto& row : rows)
        g.fillRect (row->getBounds().reduced (0, 1));
}

void CutPointListComponent::resized()
{
    auto area = getLocalBounds();
    area.removeFromTop (kTitleHeight);

    for (auto& row : rows)
        row->setBounds (area.removeFromTop (kRowHeight));
}
