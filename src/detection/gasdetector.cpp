#include "gasdetector.h"
#include "slope.h"
#include <QDebug>
#include <QtMath>

GasStabilityTracker::GasStabilityTracker(double tolerance, double duration)
    : m_tolerance(tolerance)
    , m_duration(duration)
{
}

void GasStabilityTracker::configure(double tolerance, double duration)
{
    m_tolerance = tolerance;
    m_duration = duration;
}

bool GasStabilityTracker::check(const QVector<QPointF>& series, double now)
{
    if (series.size() < Regen::CO2_MIN_SAMPLES) return false;
    return update(series.last().y(), now);
}

bool GasStabilityTracker::update(double value, double now)
{
    if (!hasReference()) {
        seed(value, now);
        return false;
    }

    if (qAbs(value - m_referenceValue) <= m_tolerance) {
        m_stable = (now - m_referenceTime) >= m_duration;
        return m_stable;
    }

    qDebug() << "[Gas] Reference reset to" << value << "ppm (variation"
             << qAbs(value - m_referenceValue) << "ppm)";
    m_referenceValue = value;
    m_referenceTime = now;
    m_stable = false;
    ++m_resetCount;
    return false;
}

void GasStabilityTracker::seed(double value, double now)
{
    m_referenceValue = value;
    m_referenceTime = now;
    m_stable = false;
}

void GasStabilityTracker::reset()
{
    m_referenceValue = 0;
    m_referenceTime = -1;
    m_stable = false;
    m_resetCount = 0;
}

double GasStabilityTracker::stableDuration(double now) const
{
    return hasReference() ? now - m_referenceTime : 0.0;
}

GasPeakDetector::GasPeakDetector(const EngineParameters& params)
    : m_params(params)
{
}

void GasPeakDetector::setBase(double value)
{
    m_state = GasPeakState();
    m_state.baseValue = value;
    m_state.hasBase = true;
}

bool GasPeakDetector::detectIncrease(const QVector<QPointF>& gas)
{
    if (!m_state.hasBase || m_state.increaseDetected || gas.isEmpty()) return false;

    double rise = gas.last().y() - m_state.baseValue;
    if (rise < m_params.gasIncreaseThreshold) return false;

    m_state.increaseDetected = true;
    qInfo() << "[Gas] Increase of" << rise << "ppm over base" << m_state.baseValue;
    return true;
}

bool GasPeakDetector::detectPeak(const QVector<QPointF>& gas)
{
    if (!m_state.increaseDetected || m_state.peakDetected) return false;
    if (gas.size() < 5) return false;

    int first = qMax(0, gas.size() - Regen::CO2_PEAK_WINDOW);
    int maxIndex = first;
    for (int i = first + 1; i < gas.size(); ++i) {
        if (gas[i].y() > gas[maxIndex].y()) {
            maxIndex = i;
        }
    }
    double maxValue = gas[maxIndex].y();
    double current = gas.last().y();

    if (maxValue - m_state.baseValue < m_params.gasIncreaseThreshold) return false;
    if (maxValue - current < m_params.gasPeakDrop) return false;

    double slope = 0;
    if (!Slope::lastSamples(gas, 3, slope) || slope >= m_params.gasPeakSlope) return false;

    m_state.peakDetected = true;
    m_state.peakValue = maxValue;
    m_state.peakTime = gas[maxIndex].x();
    qInfo() << "[Gas] Peak" << maxValue << "ppm at" << m_state.peakTime << "s (+"
            << maxValue - m_state.baseValue << "ppm)";
    return true;
}
