#pragma once

#include "resistancesensor.h"
#include "gassensor.h"
#include "thermalactuator.h"
#include "mechanicalactuator.h"
#include "positionsensor.h"

// Stand-ins selected at construction when a physical device is absent.
// Every read reports "unavailable" and every write fails, so the engine
// takes its normal degraded paths instead of special-casing missing hardware.

class NullResistanceSensor : public ResistanceSensor {
public:
    bool readResistance(double& ohms) override;
    bool isAvailable() const override { return false; }
    QString name() const override { return "none"; }
};

class NullGasSensor : public GasSensor {
public:
    bool readGas(GasReading& reading) override;
    bool isAvailable() const override { return false; }
    QString name() const override { return "none"; }
};

class NullThermalActuator : public ThermalActuator {
public:
    bool setSetpoint(double celsius) override;
    bool writeSetpointDirect(double celsius) override;
    bool readTemperature(double& setpoint, double& measured) override;
    bool readReferenceResistance(double& r0) override;
    bool writeReferenceResistance(double r0) override;
    bool isAvailable() const override { return false; }
    QString name() const override { return "none"; }
};

class NullMechanicalActuator : public MechanicalActuator {
public:
    bool open() override;
    bool close() override;
    bool initialize() override;
    bool isAvailable() const override { return false; }
    QString name() const override { return "none"; }
};

class NullPositionSensor : public PositionSensor {
public:
    bool readPins(PinStates& pins) override;
    bool isAvailable() const override { return false; }
};
