#pragma once

#include <QMap>
#include <QString>

// Named instants shown as markers on the gas plot. Write-only from the
// control side: nothing in the engine reads these back to make decisions.
class EventTimeline {
public:
    enum class Milestone {
        ReferenceActualized,
        StabilityStarted,
        StabilityAchieved,
        GasIncreaseDetected,
        PeakReached,
        RestabilizationStarted,
        Restabilized,
        HeatingStarted,
        HeatingStopped
    };

    void mark(Milestone milestone, double time) { m_times[milestone] = time; }
    void unmark(Milestone milestone) { m_times.remove(milestone); }
    bool has(Milestone milestone) const { return m_times.contains(milestone); }
    double time(Milestone milestone) const { return m_times.value(milestone, -1.0); }
    void clear() { m_times.clear(); }

    QMap<Milestone, double> snapshot() const { return m_times; }

    static QString milestoneToString(Milestone milestone);

private:
    QMap<Milestone, double> m_times;
};
