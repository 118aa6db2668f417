#include "fullprotocol.h"
#include "../models/measurementstore.h"
#include "../models/eventtimeline.h"
#include "../machine/heatercontrol.h"
#include "../devices/mechanicalactuator.h"
#include "../detection/conductancedetector.h"
#include <QDebug>

using Milestone = EventTimeline::Milestone;

FullProtocol::FullProtocol(const EngineParameters& params)
    : RegenerationProtocol(params)
    , m_peak(params)
{
}

QString FullProtocol::stepToString(Step step)
{
    switch (step) {
        case Step::Idle:            return "Idle";
        case Step::ClosingValve:    return "ClosingValve";
        case Step::GasStability:    return "GasStability";
        case Step::Heating:         return "Heating";
        case Step::Cooling:         return "Cooling";
        case Step::Restabilization: return "Restabilization";
        case Step::Results:         return "Results";
    }
    return "Unknown";
}

bool FullProtocol::start(const ProtocolContext& ctx)
{
    if (isActive()) {
        qWarning() << "[Full] Already running";
        return false;
    }

    m_status = ProtocolStatus();
    m_results = ProtocolResults();
    m_error.clear();
    m_initialReference = 0;
    m_finalReference = 0;
    m_peakAdjacent = 0;
    m_stabilityTimedOut = false;
    m_heatingTimedOut = false;
    m_restabilizationTimedOut = false;
    m_tracker.configure(m_params.gasStabilityThreshold, m_params.gasStabilityDuration);
    m_peak.setParameters(m_params);
    m_peak.reset();
    ctx.timeline->clear();

    qInfo() << "[Full] Protocol started";
    Outcome outcome = enter(Step::ClosingValve, ctx);
    return outcome != Outcome::Failed;
}

RegenerationProtocol::Outcome FullProtocol::tick(const ProtocolContext& ctx)
{
    switch (m_step) {
        case Step::Idle:            return Outcome::Idle;
        case Step::ClosingValve:    return closeValve(ctx);
        case Step::GasStability:    return waitGasStability(ctx);
        case Step::Heating:         return heat(ctx);
        case Step::Cooling:         return cool(ctx);
        case Step::Restabilization: return waitRestabilization(ctx);
        case Step::Results:         return finish(ctx);
    }
    return Outcome::Idle;
}

RegenerationProtocol::Outcome FullProtocol::enter(Step step, const ProtocolContext& ctx)
{
    m_step = step;
    m_data = StepData();
    m_data.firstSample = ctx.store->size(Series::Conductance);
    qDebug() << "[Full] Step" << static_cast<int>(step) << stepToString(step);

    switch (step) {
        case Step::GasStability:
            m_tracker.reset();
            ctx.timeline->mark(Milestone::StabilityStarted, ctx.gasTime);
            break;
        case Step::Heating:
            m_peak.setBase(m_initialReference);
            break;
        case Step::Restabilization:
            m_tracker.reset();
            if (m_peak.state().peakDetected) {
                m_tracker.seed(m_peakAdjacent, ctx.now);
                qInfo() << "[Full] Watching restabilization from" << m_peakAdjacent << "ppm";
            }
            ctx.timeline->mark(Milestone::RestabilizationStarted, ctx.gasTime);
            break;
        case Step::Results:
            return finish(ctx);
        default:
            break;
    }

    if (!runEntryAction(ctx)) {
        return fail(ctx, m_error);
    }
    return Outcome::Running;
}

bool FullProtocol::runEntryAction(const ProtocolContext& ctx)
{
    if (m_data.actionDone) return true;

    bool ok = true;
    QString action;
    switch (m_step) {
        case Step::ClosingValve:
            action = "Closing the valve";
            ok = ctx.valve && ctx.valve->close();
            break;
        case Step::Heating:
            action = QString("Setting the heater to %1 °C").arg(m_params.highSetpoint);
            ok = ctx.heater->setSetpoint(m_params.highSetpoint);
            if (ok) ctx.timeline->mark(Milestone::HeatingStarted, ctx.gasTime);
            break;
        case Step::Cooling:
            action = QString("Setting the heater to %1 °C").arg(m_params.lowSetpoint);
            ok = ctx.heater->forceSetpoint(m_params.lowSetpoint);
            if (ok) ctx.timeline->mark(Milestone::HeatingStopped, ctx.gasTime);
            break;
        default:
            break;
    }

    if (!ok) {
        ++m_data.failures;
        if (m_data.failures >= 2) {
            m_error = action + " failed twice";
            return false;
        }
        qWarning() << "[Full]" << action << "failed, retrying next tick";
        return true;
    }

    m_data.actionDone = true;
    m_data.startTime = ctx.now;
    return true;
}

RegenerationProtocol::Outcome FullProtocol::closeValve(const ProtocolContext& ctx)
{
    if (!runEntryAction(ctx)) return fail(ctx, m_error);
    if (!m_data.actionDone) return Outcome::Running;

    double elapsed = ctx.now - m_data.startTime;
    if (elapsed < m_params.valveDelay) {
        report(1, "Closing the valve", stepProgress(elapsed, m_params.valveDelay, 0, 10));
        return Outcome::Running;
    }
    return enter(Step::GasStability, ctx);
}

RegenerationProtocol::Outcome FullProtocol::waitGasStability(const ProtocolContext& ctx)
{
    const QVector<QPointF>& gas = ctx.store->series(Series::GasConcentration);
    double elapsed = ctx.now - m_data.startTime;

    int resetsBefore = m_tracker.resetCount();
    if (m_tracker.check(gas, ctx.now)) {
        m_initialReference = m_tracker.referenceValue();
        ctx.timeline->mark(Milestone::StabilityAchieved, ctx.gasTime);
        qInfo() << "[Full] CO2 stable at" << m_initialReference << "ppm";
        return enter(Step::Heating, ctx);
    }
    if (m_tracker.resetCount() != resetsBefore) {
        ctx.timeline->mark(Milestone::StabilityStarted, ctx.gasTime);
    }

    if (elapsed >= m_params.fullStabilityTimeout) {
        double latest = 0;
        if (m_tracker.hasReference()) {
            m_initialReference = m_tracker.referenceValue();
        } else if (latestGas(ctx, latest)) {
            m_initialReference = latest;
        } else {
            return fail(ctx, "No CO2 reading within the stability window");
        }
        m_stabilityTimedOut = true;
        ctx.timeline->mark(Milestone::StabilityAchieved, ctx.gasTime);
        qWarning() << "[Full] CO2 not stable after" << m_params.fullStabilityTimeout
                   << "s, continuing with baseline" << m_initialReference << "ppm";
        return enter(Step::Heating, ctx);
    }

    report(2, QString("Waiting for CO2 stability (%1/%2 s)")
                  .arg(m_tracker.stableDuration(ctx.now), 0, 'f', 0)
                  .arg(m_params.gasStabilityDuration),
           stepProgress(elapsed, m_params.fullStabilityTimeout, 10, 35));
    return Outcome::Running;
}

RegenerationProtocol::Outcome FullProtocol::heat(const ProtocolContext& ctx)
{
    if (!runEntryAction(ctx)) return fail(ctx, m_error);
    if (!m_data.actionDone) return Outcome::Running;

    trackPeak(ctx);

    const QVector<QPointF>& conductance = ctx.store->series(Series::Conductance);
    double elapsed = ctx.now - m_data.startTime;

    if (conductance.size() > m_data.firstSample
        && conductance.last().y() < m_params.regenerationCompleteConductance) {
        qInfo() << "[Full] Element regenerated after" << elapsed << "s (G ="
                << conductance.last().y() << "µS)";
        return enter(Step::Cooling, ctx);
    }

    if (elapsed >= m_params.fullHeatingTimeout) {
        m_heatingTimedOut = true;
        qWarning() << "[Full] Heating window of" << m_params.fullHeatingTimeout
                   << "s elapsed without full regeneration";
        return enter(Step::Cooling, ctx);
    }

    if (!ctx.heater->setSetpoint(m_params.highSetpoint)) {
        qWarning() << "[Full] Re-asserting the regeneration setpoint failed";
    }
    report(3, QString("Heating at %1 °C (%2/%3 s)")
                  .arg(m_params.highSetpoint)
                  .arg(elapsed, 0, 'f', 0)
                  .arg(m_params.fullHeatingTimeout),
           stepProgress(elapsed, m_params.fullHeatingTimeout, 35, 65));
    return Outcome::Running;
}

RegenerationProtocol::Outcome FullProtocol::cool(const ProtocolContext& ctx)
{
    if (!runEntryAction(ctx)) return fail(ctx, m_error);
    if (!m_data.actionDone) return Outcome::Running;

    double elapsed = ctx.now - m_data.startTime;
    if (elapsed < m_params.fullCooldownDelay) {
        report(4, "Heater off, settling", stepProgress(elapsed, m_params.fullCooldownDelay, 65, 70));
        return Outcome::Running;
    }
    return enter(Step::Restabilization, ctx);
}

RegenerationProtocol::Outcome FullProtocol::waitRestabilization(const ProtocolContext& ctx)
{
    const QVector<QPointF>& gas = ctx.store->series(Series::GasConcentration);
    double elapsed = ctx.now - m_data.startTime;

    if (!m_peak.state().peakDetected) {
        trackPeak(ctx);
        if (m_peak.state().peakDetected) {
            m_tracker.seed(m_peakAdjacent, ctx.now);
        }
    }

    int resetsBefore = m_tracker.resetCount();
    if (m_tracker.check(gas, ctx.now)) {
        m_finalReference = m_tracker.referenceValue();
        ctx.timeline->mark(Milestone::Restabilized, ctx.gasTime);
        qInfo() << "[Full] CO2 restabilized at" << m_finalReference << "ppm";
        return enter(Step::Results, ctx);
    }
    if (m_tracker.resetCount() != resetsBefore) {
        ctx.timeline->mark(Milestone::RestabilizationStarted, ctx.gasTime);
    }

    if (elapsed >= m_params.fullRestabilizationTimeout) {
        double latest = 0;
        if (m_tracker.hasReference()) {
            m_finalReference = m_tracker.referenceValue();
        } else if (latestGas(ctx, latest)) {
            m_finalReference = latest;
        } else {
            m_finalReference = m_initialReference;
        }
        m_restabilizationTimedOut = true;
        ctx.timeline->mark(Milestone::Restabilized, ctx.gasTime);
        qWarning() << "[Full] No restabilization after" << m_params.fullRestabilizationTimeout
                   << "s, using" << m_finalReference << "ppm as final value";
        return enter(Step::Results, ctx);
    }

    report(5, QString("Waiting for CO2 restabilization (%1/%2 s)")
                  .arg(m_tracker.stableDuration(ctx.now), 0, 'f', 0)
                  .arg(m_params.gasStabilityDuration),
           stepProgress(elapsed, m_params.fullRestabilizationTimeout, 70, 95));
    return Outcome::Running;
}

RegenerationProtocol::Outcome FullProtocol::finish(const ProtocolContext& ctx)
{
    double percolation = ctx.conductance ? ctx.conductance->state().increaseTime : -1;
    m_results = computeResults(m_initialReference, m_finalReference, m_params.cellVolume, percolation);

    qInfo() << "[Full] Complete: delta C =" << m_results.deltaConcentration << "ppm,"
            << "carbon mass =" << m_results.estimatedMass << "µg";

    m_step = Step::Idle;
    m_data = StepData();
    m_status.active = false;
    m_status.step = 6;
    m_status.message = "Full protocol completed";
    m_status.progress = 100;
    m_status.hasResults = true;
    m_status.results = m_results;
    return Outcome::Finished;
}

bool FullProtocol::cancel(const ProtocolContext& ctx)
{
    if (!isActive()) return false;

    bool lowered = ctx.heater->forceSetpoint(m_params.lowSetpoint);
    if (!lowered) {
        qCritical() << "[Full] Could not force the heater low on cancel";
    }
    qInfo() << "[Full] Cancelled in" << stepToString(m_step);

    m_step = Step::Idle;
    m_data = StepData();
    m_tracker.reset();
    m_peak.reset();
    m_status.active = false;
    m_status.message = "Full protocol cancelled";
    return lowered;
}

RegenerationProtocol::Outcome FullProtocol::fail(const ProtocolContext& ctx, const QString& error)
{
    qCritical() << "[Full] Aborting in" << stepToString(m_step) << ":" << error;
    if (!ctx.heater->forceSetpoint(m_params.lowSetpoint)) {
        qCritical() << "[Full] Heater could not be forced low";
    }

    m_error = error;
    m_step = Step::Idle;
    m_data = StepData();
    m_tracker.reset();
    m_peak.reset();
    m_status.active = false;
    m_status.message = error;
    return Outcome::Failed;
}

void FullProtocol::trackPeak(const ProtocolContext& ctx)
{
    const QVector<QPointF>& gas = ctx.store->series(Series::GasConcentration);
    if (m_peak.detectIncrease(gas)) {
        ctx.timeline->mark(Milestone::GasIncreaseDetected, ctx.gasTime);
    }
    if (m_peak.detectPeak(gas)) {
        m_peakAdjacent = gas.last().y();
        ctx.timeline->mark(Milestone::PeakReached, m_peak.state().peakTime);
    }
}

bool FullProtocol::latestGas(const ProtocolContext& ctx, double& value) const
{
    if (ctx.store->isEmpty(Series::GasConcentration)) return false;
    value = ctx.store->last(Series::GasConcentration).y();
    return true;
}

double FullProtocol::stepProgress(double elapsed, double window, double from, double to) const
{
    if (window <= 0) return to;
    return from + qMin(1.0, elapsed / window) * (to - from);
}
