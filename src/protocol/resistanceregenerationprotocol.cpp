#include "resistanceregenerationprotocol.h"
#include "../models/measurementstore.h"
#include "../machine/heatercontrol.h"
#include <QDebug>

ResistanceRegenerationProtocol::ResistanceRegenerationProtocol(const EngineParameters& params)
    : RegenerationProtocol(params)
{
}

bool ResistanceRegenerationProtocol::start(const ProtocolContext& ctx)
{
    if (isActive()) {
        qWarning() << "[R-Regen] Already running";
        return false;
    }
    if (!ctx.heater->isAvailable() || !ctx.resistanceAvailable) {
        qWarning() << "[R-Regen] Needs both the regeneration board and the multimeter";
        return false;
    }
    if (!ctx.heater->setSetpoint(m_params.highSetpoint)) {
        qWarning() << "[R-Regen] Heater refused the regeneration setpoint, not starting";
        return false;
    }

    m_status = ProtocolStatus();
    m_results = ProtocolResults();
    m_error.clear();
    m_step = Step::Heating;
    m_firstSample = ctx.store->size(Series::Resistance);
    m_startTime = ctx.now;

    qInfo() << "[R-Regen] Started, heating to" << m_params.highSetpoint << "°C until R >"
            << m_params.highResistanceThreshold << "Ω";
    report(1, QString("Heating at %1 °C").arg(m_params.highSetpoint), 0);
    return true;
}

RegenerationProtocol::Outcome ResistanceRegenerationProtocol::tick(const ProtocolContext& ctx)
{
    if (m_step != Step::Heating) return Outcome::Idle;

    const QVector<QPointF>& resistance = ctx.store->series(Series::Resistance);
    bool fresh = resistance.size() > m_firstSample;
    double latest = fresh ? resistance.last().y() : 0;

    if (fresh && latest > m_params.highResistanceThreshold) {
        if (!ctx.heater->setSetpoint(m_params.lowSetpoint)) {
            m_error = "Heater did not accept the low setpoint";
            qCritical() << "[R-Regen] Aborting:" << m_error;
            if (!ctx.heater->forceSetpoint(m_params.lowSetpoint)) {
                qCritical() << "[R-Regen] Heater could not be forced low";
            }
            m_step = Step::Idle;
            m_status.active = false;
            m_status.message = m_error;
            return Outcome::Failed;
        }

        m_step = Step::TargetReached;
        qInfo() << "[R-Regen] Resistance" << latest << "Ω above threshold after"
                << ctx.now - m_startTime << "s, heater lowered";
        report(2, "Target resistance reached", 100);
        return Outcome::Finished;
    }

    if (!ctx.heater->setSetpoint(m_params.highSetpoint)) {
        qWarning() << "[R-Regen] Re-asserting the regeneration setpoint failed";
    }
    report(1, QString("Heating (%1 s, R = %2 Ω)")
                  .arg(ctx.now - m_startTime, 0, 'f', 0)
                  .arg(latest, 0, 'g', 4),
           qMin(99.0, latest / m_params.highResistanceThreshold * 100));
    return Outcome::Running;
}

bool ResistanceRegenerationProtocol::cancel(const ProtocolContext& ctx)
{
    if (!isActive()) return false;

    bool lowered = ctx.heater->forceSetpoint(m_params.lowSetpoint);
    if (!lowered) {
        qCritical() << "[R-Regen] Could not force the heater low on cancel";
    }
    qInfo() << "[R-Regen] Cancelled";

    m_step = Step::Idle;
    m_status.active = false;
    m_status.message = "Regeneration cancelled";
    return lowered;
}
