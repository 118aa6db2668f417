#include "conductancedetector.h"
#include "slope.h"
#include <QDebug>
#include <QtMath>

ConductanceDetector::ConductanceDetector(const EngineParameters& params)
    : m_params(params)
{
}

bool ConductanceDetector::update(const QVector<QPointF>& conductance)
{
    bool changed = false;
    changed |= detectIncrease(conductance);
    changed |= detectStabilization(conductance);
    changed |= detectDecrease(conductance);
    changed |= detectRestabilization(conductance);
    return changed;
}

bool ConductanceDetector::detectIncrease(const QVector<QPointF>& conductance)
{
    if (m_state.increaseDetected) return false;

    double slope = 0;
    if (!Slope::lastSamples(conductance, m_params.increaseWindowSamples, slope)) return false;
    if (slope < m_params.increaseSlopeMin || slope > m_params.increaseSlopeMax) return false;

    double now = conductance.last().x();
    m_state.increaseDetected = true;
    m_state.stabilized = false;
    m_state.stabilizationTime = -1;
    m_state.maxSlope = slope;
    m_state.maxSlopeTime = now;

    if (m_post.decreaseDetected) {
        // New episode after a drop: percolation moves forward with it
        m_state.increaseTime = now;
        m_post = PostTreatmentState();
        m_flatSince = -1;
        qInfo() << "[Detect] New increase episode at" << now << "s, slope" << slope << "µS/s";
    } else if (!m_state.hasIncreaseTime()) {
        m_state.increaseTime = now;
        qInfo() << "[Detect] Increase detected at" << now << "s, slope" << slope << "µS/s";
    } else {
        qInfo() << "[Detect] Increase re-detected at" << now << "s, percolation time kept at"
                << m_state.increaseTime << "s";
    }
    return true;
}

bool ConductanceDetector::detectStabilization(const QVector<QPointF>& conductance)
{
    if (!m_state.increaseDetected || m_state.stabilized) return false;
    if (conductance.size() < m_params.increaseWindowSamples) return false;

    double now = conductance.last().x();
    double halfWindow = m_params.slidingWindow / 2;
    double slope = 0;
    if (!Slope::timeWindow(conductance, now - halfWindow, now + halfWindow, slope)) return false;
    m_lastLocalSlope = slope;

    if (slope > m_state.maxSlope) {
        m_state.maxSlope = slope;
        m_state.maxSlopeTime = now;
    }

    if (now - m_state.maxSlopeTime >= m_params.stabilityDuration
        && qAbs(slope) < m_params.increaseSlopeMin / 2) {
        m_state.stabilized = true;
        m_state.stabilizationTime = now;
        qInfo() << "[Detect] Stabilization at" << now << "s, local slope" << slope << "µS/s";
        return true;
    }
    return false;
}

bool ConductanceDetector::detectDecrease(const QVector<QPointF>& conductance)
{
    if (!m_state.stabilized || m_post.decreaseDetected || conductance.isEmpty()) return false;

    const QPointF& latest = conductance.last();
    if (latest.y() >= m_params.postTreatmentThreshold) return false;

    m_post.decreaseDetected = true;
    m_post.decreaseTime = latest.x();
    m_post.restabilized = false;
    m_post.restabilizationTime = -1;
    m_flatSince = -1;

    m_state.increaseDetected = false;
    m_state.stabilized = false;
    qInfo() << "[Detect] Conductance dropped to" << latest.y() << "µS at" << latest.x()
            << "s, episode closed";
    return true;
}

bool ConductanceDetector::detectRestabilization(const QVector<QPointF>& conductance)
{
    if (!m_post.decreaseDetected || m_post.restabilized || conductance.isEmpty()) return false;

    double now = conductance.last().x();
    double from = qMax(m_post.decreaseTime, now - m_params.slidingWindow / 2);
    double slope = 0;
    if (!Slope::timeWindow(conductance, from, now, slope)) return false;
    m_lastLocalSlope = slope;

    bool flat = slope > m_params.decreaseSlopeThreshold && slope < m_params.increaseSlopeMin / 2;
    if (!flat) {
        m_flatSince = -1;
        return false;
    }
    if (m_flatSince < 0) {
        m_flatSince = now;
    }

    if (now - qMax(m_post.decreaseTime, m_flatSince) >= m_params.stabilityDuration) {
        m_post.restabilized = true;
        m_post.restabilizationTime = now;
        qInfo() << "[Detect] Restabilized after treatment at" << now << "s";
        return true;
    }
    return false;
}

void ConductanceDetector::clearEpisode()
{
    m_state.increaseDetected = false;
    m_state.stabilized = false;
    m_state.stabilizationTime = -1;
}

void ConductanceDetector::reset()
{
    m_state = DetectionState();
    m_post = PostTreatmentState();
    m_flatSince = -1;
    m_lastLocalSlope = 0;
}
