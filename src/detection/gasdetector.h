#pragma once

#include <QVector>
#include <QPointF>

#include "../core/engineparameters.h"

// Reference-and-timer stability check. Each sample within tolerance of the
// reference extends the stable run; any sample outside it becomes the new
// reference and restarts the timer.
class GasStabilityTracker {
public:
    GasStabilityTracker(double tolerance = Regen::CO2_STABILITY_THRESHOLD,
                        double duration = Regen::CO2_STABILITY_DURATION);

    void configure(double tolerance, double duration);

    // Feeds the latest sample of the series (at clock time now).
    // Needs a few samples before judging; returns true once stable.
    bool check(const QVector<QPointF>& series, double now);
    bool update(double value, double now);

    // Starts the run from a known value, e.g. right after a peak
    void seed(double value, double now);
    void reset();

    bool hasReference() const { return m_referenceTime >= 0; }
    double referenceValue() const { return m_referenceValue; }
    double referenceTime() const { return m_referenceTime; }
    double stableDuration(double now) const;
    bool isStable() const { return m_stable; }
    int resetCount() const { return m_resetCount; }

private:
    double m_tolerance;
    double m_duration;
    double m_referenceValue = 0;
    double m_referenceTime = -1;
    bool m_stable = false;
    int m_resetCount = 0;
};

struct GasPeakState {
    double baseValue = 0;
    bool hasBase = false;
    bool increaseDetected = false;
    bool peakDetected = false;
    double peakValue = 0;
    double peakTime = -1;    // channel time of the maximum sample
};

// Rise above the heating base, then the turn-over of the release peak.
class GasPeakDetector {
public:
    explicit GasPeakDetector(const EngineParameters& params = EngineParameters());

    void setParameters(const EngineParameters& params) { m_params = params; }

    void setBase(double value);
    bool detectIncrease(const QVector<QPointF>& gas);
    // Requires a detected increase. Peak = running max of the last samples,
    // confirmed once the signal is clearly past it and falling.
    bool detectPeak(const QVector<QPointF>& gas);

    void reset() { m_state = GasPeakState(); }
    const GasPeakState& state() const { return m_state; }

private:
    EngineParameters m_params;
    GasPeakState m_state;
};
