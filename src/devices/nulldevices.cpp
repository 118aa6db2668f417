#include "nulldevices.h"
#include <QDebug>

bool NullResistanceSensor::readResistance(double& ohms)
{
    Q_UNUSED(ohms);
    return false;
}

bool NullGasSensor::readGas(GasReading& reading)
{
    Q_UNUSED(reading);
    return false;
}

bool NullThermalActuator::setSetpoint(double celsius)
{
    qWarning() << "[Heater] No regeneration board, setpoint" << celsius << "not sent";
    return false;
}

bool NullThermalActuator::writeSetpointDirect(double celsius)
{
    Q_UNUSED(celsius);
    return false;
}

bool NullThermalActuator::readTemperature(double& setpoint, double& measured)
{
    Q_UNUSED(setpoint);
    Q_UNUSED(measured);
    return false;
}

bool NullThermalActuator::readReferenceResistance(double& r0)
{
    Q_UNUSED(r0);
    qWarning() << "[Heater] No regeneration board, cannot read R0";
    return false;
}

bool NullThermalActuator::writeReferenceResistance(double r0)
{
    qWarning() << "[Heater] No regeneration board, R0" << r0 << "not written";
    return false;
}

bool NullMechanicalActuator::open()
{
    qWarning() << "[Bench] No bench controller, cannot open the valve";
    return false;
}

bool NullMechanicalActuator::close()
{
    qWarning() << "[Bench] No bench controller, cannot close the valve";
    return false;
}

bool NullMechanicalActuator::initialize()
{
    qWarning() << "[Bench] No bench controller, cannot initialise";
    return false;
}

bool NullPositionSensor::readPins(PinStates& pins)
{
    Q_UNUSED(pins);
    return false;
}
