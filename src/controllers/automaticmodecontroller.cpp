#include "automaticmodecontroller.h"
#include "../protocol/regenerationprotocol.h"
#include "../detection/conductancedetector.h"
#include "../models/measurementstore.h"
#include "../machine/heatercontrol.h"
#include "../devices/mechanicalactuator.h"
#include <QDebug>

AutomaticModeController::AutomaticModeController(ConductanceDetector* detector,
                                                 const EngineParameters& params,
                                                 QObject* parent)
    : QObject(parent)
    , m_detector(detector)
{
    setParameters(params);
}

void AutomaticModeController::setParameters(const EngineParameters& params)
{
    m_params = params;
    m_gasTracker.configure(params.gasStabilityThreshold, params.gasStabilityDuration);
}

QString AutomaticModeController::phaseToString(Phase phase)
{
    switch (phase) {
        case Phase::Disabled:            return "Disabled";
        case Phase::Monitoring:          return "Monitoring";
        case Phase::ClosingValve:        return "ClosingValve";
        case Phase::WaitingGasStability: return "WaitingGasStability";
        case Phase::Regenerating:        return "Regenerating";
        case Phase::Recovering:          return "Recovering";
        case Phase::Reopening:           return "Reopening";
    }
    return "Unknown";
}

void AutomaticModeController::enable()
{
    if (isEnabled()) return;

    // A plateau already reached before enabling does not start a cycle
    const DetectionState& state = m_detector->state();
    m_handledStabilization = state.stabilized ? state.stabilizationTime : -1;

    m_phase = Phase::Monitoring;
    m_since = -1;
    m_failures = 0;
    m_skipped = false;
    qInfo() << "[Auto] Enabled";
    emit enabledChanged();
    emit phaseChanged(m_phase);
}

void AutomaticModeController::disable(const ProtocolContext& ctx)
{
    if (!isEnabled()) return;

    if (isBusy()) {
        if (!ctx.heater->forceSetpoint(m_params.lowSetpoint)) {
            qCritical() << "[Auto] Heater could not be forced low while disabling";
        }
        qInfo() << "[Auto] Disabled during" << phaseToString(m_phase);
    } else {
        qInfo() << "[Auto] Disabled";
    }

    m_phase = Phase::Disabled;
    m_since = -1;
    emit enabledChanged();
    emit phaseChanged(m_phase);
}

void AutomaticModeController::setPhase(Phase phase, double now)
{
    m_phase = phase;
    m_since = now;
    m_failures = 0;
    qDebug() << "[Auto] ->" << phaseToString(phase);
    emit phaseChanged(phase);
}

bool AutomaticModeController::elapsed(const ProtocolContext& ctx, double duration) const
{
    return ctx.now - m_since >= duration;
}

bool AutomaticModeController::retryable(bool ok, const QString& action)
{
    if (ok) {
        m_failures = 0;
        return true;
    }
    ++m_failures;
    qWarning() << "[Auto]" << action << "failed (" << m_failures << "/ 2)";
    return m_failures < 2;
}

void AutomaticModeController::abortCycle(const ProtocolContext& ctx, const QString& reason)
{
    qCritical() << "[Auto] Cycle aborted:" << reason;
    m_skipped = false;
    if (!ctx.heater->forceSetpoint(m_params.lowSetpoint)) {
        qCritical() << "[Auto] Heater could not be forced low";
    }
    m_detector->clearEpisode();
    setPhase(Phase::Monitoring, ctx.now);
    emit cycleAborted(reason);
}

void AutomaticModeController::tick(const ProtocolContext& ctx)
{
    switch (m_phase) {
        case Phase::Disabled:            break;
        case Phase::Monitoring:          monitor(ctx); break;
        case Phase::ClosingValve:        afterValveClosed(ctx); break;
        case Phase::WaitingGasStability: waitGasStability(ctx); break;
        case Phase::Regenerating:        regenerate(ctx); break;
        case Phase::Recovering:          recover(ctx); break;
        case Phase::Reopening:           reopen(ctx); break;
    }
}

void AutomaticModeController::monitor(const ProtocolContext& ctx)
{
    const DetectionState& state = m_detector->state();
    if (!state.stabilized || state.stabilizationTime == m_handledStabilization) return;

    bool closed = ctx.valve && ctx.valve->close();
    if (!retryable(closed, "Closing the valve")) {
        m_handledStabilization = state.stabilizationTime;
        abortCycle(ctx, "Valve did not close");
        return;
    }
    if (!closed) return;

    m_handledStabilization = state.stabilizationTime;
    qInfo() << "[Auto] Conductance stable, valve closed";
    setPhase(Phase::ClosingValve, ctx.now);
}

void AutomaticModeController::afterValveClosed(const ProtocolContext& ctx)
{
    if (!elapsed(ctx, m_params.valveDelay)) return;

    double r0 = 0;
    bool read = ctx.heater->readReferenceResistance(r0);
    if (!retryable(read, "Reading R0")) {
        abortCycle(ctx, "R0 could not be read");
        return;
    }
    if (!read) return;

    if (r0 == Regen::R0_NOT_DETECTED || r0 >= m_params.r0Threshold) {
        if (r0 == Regen::R0_NOT_DETECTED) {
            qWarning() << "[Auto] R0 not detected, skipping regeneration";
        } else {
            qWarning() << "[Auto] R0 too high (" << r0 << ">=" << m_params.r0Threshold
                       << "), skipping regeneration";
        }
        // Nothing was heated; go straight to reopening
        if (!ctx.valve || !ctx.valve->open()) {
            qWarning() << "[Auto] Valve did not reopen after R0 rejection";
        }
        m_skipped = true;
        setPhase(Phase::Reopening, ctx.now);
        emit cycleAborted(r0 == Regen::R0_NOT_DETECTED ? "R0 not detected" : "R0 above threshold");
        return;
    }

    if (!ctx.heater->writeReferenceResistance(r0)) {
        qWarning() << "[Auto] R0 could not be re-latched, continuing with board value" << r0;
    }
    qInfo() << "[Auto] R0 =" << r0 << ", waiting for CO2 baseline";
    m_gasTracker.reset();
    setPhase(Phase::WaitingGasStability, ctx.now);
}

void AutomaticModeController::waitGasStability(const ProtocolContext& ctx)
{
    bool stable = m_gasTracker.check(ctx.store->series(Series::GasConcentration), ctx.now);
    bool timedOut = elapsed(ctx, m_params.autoGasStabilityTimeout);
    if (!stable && !timedOut) return;

    if (timedOut && !stable) {
        qWarning() << "[Auto] CO2 not stable after" << m_params.autoGasStabilityTimeout << "s, heating anyway";
    }

    bool heating = ctx.heater->setSetpoint(m_params.highSetpoint);
    if (!retryable(heating, "Starting the heater")) {
        abortCycle(ctx, "Heater did not accept the regeneration setpoint");
        return;
    }
    if (!heating) return;

    m_firstConductanceSample = ctx.store->size(Series::Conductance);
    qInfo() << "[Auto] Regenerating at" << m_params.highSetpoint << "°C";
    setPhase(Phase::Regenerating, ctx.now);
}

void AutomaticModeController::regenerate(const ProtocolContext& ctx)
{
    const QVector<QPointF>& conductance = ctx.store->series(Series::Conductance);
    bool regenerated = conductance.size() > m_firstConductanceSample
                       && conductance.last().y() < m_params.regenerationCompleteConductance;
    bool timedOut = elapsed(ctx, m_params.autoRegenerationTimeout);

    if (!regenerated && !timedOut) {
        if (!ctx.heater->setSetpoint(m_params.highSetpoint)) {
            qWarning() << "[Auto] Re-asserting the regeneration setpoint failed";
        }
        return;
    }

    if (regenerated) {
        qInfo() << "[Auto] Conductance down to" << conductance.last().y() << "µS";
    } else {
        qWarning() << "[Auto] Regeneration window of" << m_params.autoRegenerationTimeout << "s elapsed";
    }

    // Heater goes low whatever happened above
    if (!ctx.heater->forceSetpoint(m_params.lowSetpoint)) {
        qCritical() << "[Auto] Heater could not be set low after regeneration";
    }
    setPhase(Phase::Recovering, ctx.now);
}

void AutomaticModeController::recover(const ProtocolContext& ctx)
{
    if (!elapsed(ctx, m_params.stabilityDuration)) return;

    bool opened = ctx.valve && ctx.valve->open();
    if (!retryable(opened, "Opening the valve")) {
        abortCycle(ctx, "Valve did not reopen");
        return;
    }
    if (!opened) return;

    qInfo() << "[Auto] Valve opened for the next run";
    setPhase(Phase::Reopening, ctx.now);
}

void AutomaticModeController::reopen(const ProtocolContext& ctx)
{
    if (!elapsed(ctx, m_params.valveDelay)) return;

    m_detector->clearEpisode();
    if (m_skipped) {
        m_skipped = false;
        qInfo() << "[Auto] Valve reopened, back to monitoring";
        setPhase(Phase::Monitoring, ctx.now);
        return;
    }

    ++m_completedCycles;
    qInfo() << "[Auto] Cycle" << m_completedCycles << "finished, ready for the next one";
    setPhase(Phase::Monitoring, ctx.now);
    emit cycleCompleted(m_completedCycles);
}
