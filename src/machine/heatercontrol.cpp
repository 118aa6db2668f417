#include "heatercontrol.h"
#include "../devices/thermalactuator.h"
#include "../core/regenconstants.h"
#include <QDebug>
#include <QtMath>

HeaterControl::HeaterControl(ThermalActuator* actuator)
    : m_actuator(actuator)
{
}

bool HeaterControl::isAvailable() const
{
    return m_actuator && m_actuator->isAvailable();
}

bool HeaterControl::setSetpoint(double celsius)
{
    if (m_hasCommanded && m_lastWriteOk && m_lastCommanded == celsius) {
        return true;
    }
    return write(celsius);
}

bool HeaterControl::forceSetpoint(double celsius)
{
    return write(celsius);
}

bool HeaterControl::write(double celsius)
{
    m_hasCommanded = true;
    m_lastCommanded = celsius;
    ++m_writeCount;

    if (!m_actuator) {
        m_lastWriteOk = false;
        return false;
    }

    bool ok = m_actuator->setSetpoint(celsius);
    if (!ok) {
        qWarning() << "[Heater] Setpoint write" << celsius << "failed, retrying via direct write";
        ok = m_actuator->writeSetpointDirect(celsius);
        if (!ok) {
            qWarning() << "[Heater] Direct setpoint write" << celsius << "FAILED";
        }
    }

    m_lastWriteOk = ok;
    if (ok) {
        qDebug() << "[Heater] Setpoint ->" << celsius << "°C";
    }
    return ok;
}

bool HeaterControl::readTemperature(double& setpoint, double& measured)
{
    if (!m_actuator) return false;

    double readSetpoint = 0;
    double readMeasured = 0;
    if (!m_actuator->readTemperature(readSetpoint, readMeasured)) {
        return false;
    }

    if (m_hasCommanded && qAbs(readSetpoint - m_lastCommanded) > Regen::SETPOINT_READBACK_TOLERANCE) {
        readSetpoint = m_lastCommanded;
    }

    setpoint = readSetpoint;
    measured = readMeasured;
    return true;
}

bool HeaterControl::readReferenceResistance(double& r0)
{
    if (!m_actuator) return false;
    return m_actuator->readReferenceResistance(r0);
}

bool HeaterControl::writeReferenceResistance(double r0)
{
    if (!m_actuator) return false;
    if (!m_actuator->writeReferenceResistance(r0)) {
        qWarning() << "[Heater] Writing R0" << r0 << "failed";
        return false;
    }
    qDebug() << "[Heater] R0 set to" << r0;
    return true;
}

bool HeaterControl::actualizeReferenceResistance(double* r0)
{
    double value = 0;
    if (!readReferenceResistance(value)) {
        qWarning() << "[Heater] Could not read R0";
        return false;
    }
    if (!writeReferenceResistance(value)) {
        return false;
    }
    qInfo() << "[Heater] R0 actualised:" << value;
    if (r0) *r0 = value;
    return true;
}
