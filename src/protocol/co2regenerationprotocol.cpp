#include "co2regenerationprotocol.h"
#include "../models/measurementstore.h"
#include "../models/eventtimeline.h"
#include "../machine/heatercontrol.h"
#include "../detection/conductancedetector.h"
#include <QDebug>

using Milestone = EventTimeline::Milestone;

Co2RegenerationProtocol::Co2RegenerationProtocol(const EngineParameters& params)
    : RegenerationProtocol(params)
    , m_peak(params)
{
}

QString Co2RegenerationProtocol::stepToString(Step step)
{
    switch (step) {
        case Step::Idle:                            return "Idle";
        case Step::CheckingInitialStability:        return "CheckingInitialStability";
        case Step::Heating:                         return "Heating";
        case Step::AwaitingPostHeatRestabilization: return "AwaitingPostHeatRestabilization";
        case Step::Complete:                        return "Complete";
    }
    return "Unknown";
}

bool Co2RegenerationProtocol::start(const ProtocolContext& ctx)
{
    if (isActive()) {
        qWarning() << "[CO2-Regen] Already running";
        return false;
    }
    if (ctx.store->isEmpty(Series::GasConcentration)) {
        qWarning() << "[CO2-Regen] No CO2 reading yet, cannot start";
        return false;
    }

    resetRun();
    m_status = ProtocolStatus();
    m_results = ProtocolResults();
    m_error.clear();

    m_stability.configure(m_params.gasStabilityThreshold, m_params.gasStabilityDuration);
    m_restabilization.configure(m_params.gasStabilityThreshold, m_params.gasStabilityDuration);
    m_peak.setParameters(m_params);

    ctx.timeline->clear();
    double r0 = 0;
    if (ctx.heater->actualizeReferenceResistance(&r0)) {
        ctx.timeline->mark(Milestone::ReferenceActualized, ctx.gasTime);
    }
    ctx.timeline->mark(Milestone::StabilityStarted, ctx.gasTime);

    m_step = Step::CheckingInitialStability;
    qInfo() << "[CO2-Regen] Started, checking CO2 stability";
    report(1, "Checking initial CO2 stability...", 0);
    return true;
}

RegenerationProtocol::Outcome Co2RegenerationProtocol::tick(const ProtocolContext& ctx)
{
    switch (m_step) {
        case Step::Idle:
            return Outcome::Idle;
        case Step::CheckingInitialStability:
            return checkInitialStability(ctx);
        case Step::Heating:
            return heat(ctx);
        case Step::AwaitingPostHeatRestabilization:
            return awaitRestabilization(ctx);
        case Step::Complete:
            return complete(ctx);
    }
    return Outcome::Idle;
}

RegenerationProtocol::Outcome Co2RegenerationProtocol::checkInitialStability(const ProtocolContext& ctx)
{
    const QVector<QPointF>& gas = ctx.store->series(Series::GasConcentration);
    bool stable = m_stability.check(gas, ctx.now);

    if (m_stability.resetCount() != m_stabilityResets) {
        m_stabilityResets = m_stability.resetCount();
        ctx.timeline->mark(Milestone::StabilityStarted, ctx.gasTime);
    }

    if (!stable) {
        double held = qMin(m_stability.stableDuration(ctx.now), m_params.gasStabilityDuration);
        report(1, QString("Checking initial CO2 stability (%1/%2 s)")
                      .arg(held, 0, 'f', 1).arg(m_params.gasStabilityDuration),
               held / m_params.gasStabilityDuration * 33.3);
        return Outcome::Running;
    }

    m_heating = HeatingData();
    m_heating.initialReference = m_stability.referenceValue();
    m_heating.startTime = ctx.now;
    m_peak.setBase(gas.last().y());
    ctx.timeline->mark(Milestone::StabilityAchieved, ctx.gasTime);

    if (!ctx.heater->setSetpoint(m_params.highSetpoint)) {
        return fail(ctx, "Heater did not accept the regeneration setpoint");
    }
    ctx.timeline->mark(Milestone::HeatingStarted, ctx.gasTime);

    m_step = Step::Heating;
    qInfo() << "[CO2-Regen] CO2 stable at" << m_heating.initialReference << "ppm, heating to"
            << m_params.highSetpoint << "°C";
    report(2, QString("Regeneration at %1 °C started").arg(m_params.highSetpoint), 33.3);
    return Outcome::Running;
}

void Co2RegenerationProtocol::trackRelease(const ProtocolContext& ctx)
{
    const QVector<QPointF>& gas = ctx.store->series(Series::GasConcentration);

    if (m_peak.detectIncrease(gas)) {
        ctx.timeline->mark(Milestone::GasIncreaseDetected, ctx.gasTime);
    }

    if (m_peak.detectPeak(gas)) {
        ctx.timeline->mark(Milestone::PeakReached, m_peak.state().peakTime);
        m_restabilization.seed(gas.last().y(), ctx.now);
        ctx.timeline->mark(Milestone::RestabilizationStarted, ctx.gasTime);
        qInfo() << "[CO2-Regen] Watching restabilization from" << gas.last().y() << "ppm";
    }

    if (m_peak.state().peakDetected && !m_heating.restabilized) {
        int resetsBefore = m_restabilization.resetCount();
        if (m_restabilization.check(gas, ctx.now)) {
            m_heating.restabilized = true;
            ctx.timeline->mark(Milestone::Restabilized, ctx.gasTime);
            qInfo() << "[CO2-Regen] CO2 restabilized at" << m_restabilization.referenceValue() << "ppm";
        } else if (m_restabilization.resetCount() != resetsBefore) {
            ctx.timeline->mark(Milestone::RestabilizationStarted, ctx.gasTime);
        }
    }
}

RegenerationProtocol::Outcome Co2RegenerationProtocol::heat(const ProtocolContext& ctx)
{
    trackRelease(ctx);

    double elapsed = ctx.now - m_heating.startTime;
    if (elapsed < m_params.regenerationDuration) {
        if (!ctx.heater->setSetpoint(m_params.highSetpoint)) {
            return fail(ctx, "Heater did not hold the regeneration setpoint");
        }
        QString message = QString("Regeneration running (%1/%2 s)")
                              .arg(elapsed, 0, 'f', 1).arg(m_params.regenerationDuration);
        if (m_peak.state().peakDetected) {
            message += " (restabilizing)";
        }
        report(2, message, qMin(66.6, 33.3 + elapsed / m_params.regenerationDuration * 33.3));
        return Outcome::Running;
    }

    if (!m_heating.heaterLowered) {
        if (!ctx.heater->setSetpoint(m_params.lowSetpoint)) {
            return fail(ctx, "Heater did not accept the low setpoint after regeneration");
        }
        m_heating.heaterLowered = true;
        ctx.timeline->mark(Milestone::HeatingStopped, ctx.gasTime);
        qInfo() << "[CO2-Regen] Regeneration time elapsed, heater back to" << m_params.lowSetpoint << "°C";
    }

    if (m_heating.restabilized) {
        m_step = Step::Complete;
        return complete(ctx);
    }

    m_step = Step::AwaitingPostHeatRestabilization;
    report(3, "Waiting for CO2 restabilization", 75.0);
    return Outcome::Running;
}

RegenerationProtocol::Outcome Co2RegenerationProtocol::awaitRestabilization(const ProtocolContext& ctx)
{
    const QVector<QPointF>& gas = ctx.store->series(Series::GasConcentration);

    // Peak may still arrive after heating; without one, watch from here
    trackRelease(ctx);
    if (!m_peak.state().peakDetected && !m_heating.restabilized) {
        int resetsBefore = m_restabilization.resetCount();
        bool hadReference = m_restabilization.hasReference();
        if (m_restabilization.check(gas, ctx.now)) {
            m_heating.restabilized = true;
            ctx.timeline->mark(Milestone::Restabilized, ctx.gasTime);
        } else if (!hadReference || m_restabilization.resetCount() != resetsBefore) {
            ctx.timeline->mark(Milestone::RestabilizationStarted, ctx.gasTime);
        }
    }

    if (m_heating.restabilized) {
        m_step = Step::Complete;
        return complete(ctx);
    }

    double held = qMin(m_restabilization.stableDuration(ctx.now), m_params.gasStabilityDuration);
    report(3, QString("Waiting for CO2 restabilization (%1/%2 s)")
                  .arg(held, 0, 'f', 1).arg(m_params.gasStabilityDuration),
           75.0 + held / m_params.gasStabilityDuration * 25.0);
    return Outcome::Running;
}

RegenerationProtocol::Outcome Co2RegenerationProtocol::complete(const ProtocolContext& ctx)
{
    double percolation = ctx.conductance ? ctx.conductance->state().increaseTime : -1;
    m_results = computeResults(m_heating.initialReference, m_restabilization.referenceValue(),
                               m_params.cellVolume, percolation);

    qInfo() << "[CO2-Regen] Complete: delta C =" << m_results.deltaConcentration << "ppm,"
            << "carbon mass =" << m_results.estimatedMass << "µg";

    resetRun();
    m_status.active = false;
    m_status.step = 4;
    m_status.message = "Regeneration completed successfully";
    m_status.progress = 100;
    m_status.hasResults = true;
    m_status.results = m_results;
    return Outcome::Finished;
}

bool Co2RegenerationProtocol::cancel(const ProtocolContext& ctx)
{
    if (!isActive()) return false;

    bool lowered = ctx.heater->forceSetpoint(m_params.lowSetpoint);
    if (!lowered) {
        qCritical() << "[CO2-Regen] Could not force the heater low on cancel";
    }
    qInfo() << "[CO2-Regen] Cancelled in" << stepToString(m_step);

    resetRun();
    m_status.active = false;
    m_status.message = "Regeneration cancelled";
    return lowered;
}

RegenerationProtocol::Outcome Co2RegenerationProtocol::fail(const ProtocolContext& ctx, const QString& error)
{
    qCritical() << "[CO2-Regen] Aborting:" << error;
    if (!ctx.heater->forceSetpoint(m_params.lowSetpoint)) {
        qCritical() << "[CO2-Regen] Heater could not be forced low";
    }
    m_error = error;
    resetRun();
    m_status.active = false;
    m_status.message = error;
    return Outcome::Failed;
}

void Co2RegenerationProtocol::resetRun()
{
    m_step = Step::Idle;
    m_stability.reset();
    m_restabilization.reset();
    m_peak.reset();
    m_heating = HeatingData();
    m_stabilityResets = 0;
}
