#include "CutPointStore.h"
#include "WaveformGeometry.h"
#include <algorithm>
#include <cmath>

//==============================================================================
// Range
//==============================================================================

void CutPointStore::setDuration (double durationSeconds)
{
    duration = std::isfinite (durationSeconds) ? juce::jmax (0.0, durationSeconds) : 0.0;

    bool changed = false;
    for (auto& p : points)
    {
        auto clamped = clampTime (p.time);
        if (clamped != p.time)
        {
            p.time = clamped;
            changed = true;
        }
    }

    if (changed)
        notifyChanged();
}

double CutPointStore::clampTime (double t) const
{
    if (! std::isfinite (t))
        t = 0.0;
    return juce::jlimit (0.0, duration, t);
}

juce::String CutPointStore::createId()
{
    return juce::Uuid().toDashedString() + "-" + juce::String (nextSerial++);
}

void CutPointStore::notifyChanged()
{
    if (onChange)
        onChange();
}

//==============================================================================
// Mutation
//==============================================================================

juce::String CutPointStore::add (double timeSeconds)
{
    if (duration <= 0.0)
        return {};

    CutPoint point;
    point.id = createId();
    point.time = clampTime (timeSeconds);
    points.push_back (point);

    notifyChanged();
    return point.id;
}

void CutPointStore::remove (const juce::String& id)
{
    auto it = std::find_if (points.begin(), points.end(),
                            [&id] (const CutPoint& p) { return p.id == id; });
    if (it == points.end())
        return;

    points.erase (it);
    notifyChanged();
}

void CutPointStore::update (const juce::String& id, double newTimeSeconds)
{
    auto it = std::find_if (points.begin(), points.end(),
                            [&id] (const CutPoint& p) { return p.id == id; });
    if (it == points.end())
        return;

    it->time = clampTime (newTimeSeconds);
    notifyChanged();
}

void CutPointStore::clear()
{
    if (points.empty())
        return;

    points.clear();
    notifyChanged();
}

//==============================================================================
// Queries
//==============================================================================

const CutPoint* CutPointStore::find (const juce::String& id) const
{
    for (auto& p : points)
        if (p.id == id)
            return &p;
    return nullptr;
}

std::vector<CutPoint> CutPointStore::getSortedSnapshot() const
{
    auto snapshot = points;
    std::stable_sort (snapshot.begin(), snapshot.end(),
                      [] (const CutPoint& a, const CutPoint& b) { return a.time < b.time; });
    return snapshot;
}

juce::String CutPointStore::hitTest (double canvasX, const WaveformGeometry& geometry,
                                     double thresholdPx) const
{
    if (geometry.getDuration() <= 0.0)
        return {};

    for (auto& p : getSortedSnapshot())
    {
        if (std::abs (geometry.timeToX (p.time) - canvasX) < thresholdPx)
            return p.id;
    }

    return {};
}

//==============================================================================
// Click dispatch
//==============================================================================

CutPointStore::ClickAction CutPointStore::resolveClick (double canvasX, const WaveformGeometry& geometry,
                                                        double thresholdPx) const
{
    ClickAction action;
    if (duration <= 0.0 || geometry.getDuration() <= 0.0)
        return action;

    auto hitId = hitTest (canvasX, geometry, thresholdPx);
    if (hitId.isNotEmpty())
    {
        action.type = ClickAction::Type::Remove;
        action.id = hitId;
        return action;
    }

    action.type = ClickAction::Type::Add;
    action.time = geometry.xToTime (canvasX);
    return action;
}

juce::String CutPointStore::applyClick (const ClickAction& action)
{
    switch (action.type)
    {
        case ClickAction::Type::Add:
            return add (action.time);

        case ClickAction::Type::Remove:
            remove (action.id);
            return action.id;

        case ClickAction::Type::None:
            break;
    }
    return {};
}
