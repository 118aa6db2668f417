#pragma once

#include <QString>

// Source of element resistance (multimeter on the sensing element).
class ResistanceSensor {
public:
    virtual ~ResistanceSensor() = default;

    // False when no value could be obtained this tick; ohms is untouched then.
    virtual bool readResistance(double& ohms) = 0;
    virtual bool isAvailable() const = 0;
    virtual QString name() const = 0;
};
