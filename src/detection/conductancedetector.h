#pragma once

#include <QVector>
#include <QPointF>

#include "../core/engineparameters.h"

struct DetectionState {
    bool increaseDetected = false;
    bool stabilized = false;
    double increaseTime = -1;       // percolation time, -1 until the first onset
    double stabilizationTime = -1;
    double maxSlope = 0;
    double maxSlopeTime = -1;

    bool hasIncreaseTime() const { return increaseTime >= 0; }
};

struct PostTreatmentState {
    bool decreaseDetected = false;
    double decreaseTime = -1;
    bool restabilized = false;
    double restabilizationTime = -1;
};

// Watches the conductance series for one episode at a time:
// onset (slope enters the increase band), plateau (flat long enough after
// the steepest point), drop below the post-treatment threshold, and the
// flat tail after the drop.
//
// Invariants: stabilized implies increaseDetected, and increaseTime never
// moves backward. Only a fresh onset after a drop moves it forward.
class ConductanceDetector {
public:
    explicit ConductanceDetector(const EngineParameters& params = EngineParameters());

    void setParameters(const EngineParameters& params) { m_params = params; }

    // Runs every detector once in order. Returns true if any state changed.
    bool update(const QVector<QPointF>& conductance);

    bool detectIncrease(const QVector<QPointF>& conductance);
    bool detectStabilization(const QVector<QPointF>& conductance);
    bool detectDecrease(const QVector<QPointF>& conductance);
    bool detectRestabilization(const QVector<QPointF>& conductance);

    // Ends the current episode but keeps the percolation time
    void clearEpisode();
    // Forgets everything, percolation time included
    void reset();

    const DetectionState& state() const { return m_state; }
    const PostTreatmentState& postTreatment() const { return m_post; }
    double lastLocalSlope() const { return m_lastLocalSlope; }

private:
    EngineParameters m_params;
    DetectionState m_state;
    PostTreatmentState m_post;
    double m_flatSince = -1;
    double m_lastLocalSlope = 0;
};
