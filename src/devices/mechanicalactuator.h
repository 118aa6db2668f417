#pragma once

#include <QString>

// Valve/jack that exposes the sensor to the gas line or isolates it.
class MechanicalActuator {
public:
    virtual ~MechanicalActuator() = default;

    virtual bool open() = 0;
    virtual bool close() = 0;
    virtual bool initialize() = 0;

    virtual bool isAvailable() const = 0;
    virtual QString name() const = 0;
};
