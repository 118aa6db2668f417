#pragma once

#include <QString>

// Regeneration heater board. Besides the setpoint it holds the reference
// resistance (R0) of the element it is driving.
class ThermalActuator {
public:
    virtual ~ThermalActuator() = default;

    // Normal parameter write. Safe to repeat with the same value.
    virtual bool setSetpoint(double celsius) = 0;
    // Raw fallback write that bypasses the parameter layer
    virtual bool writeSetpointDirect(double celsius) = 0;

    virtual bool readTemperature(double& setpoint, double& measured) = 0;

    virtual bool readReferenceResistance(double& r0) = 0;
    virtual bool writeReferenceResistance(double r0) = 0;

    virtual bool isAvailable() const = 0;
    virtual QString name() const = 0;
};
