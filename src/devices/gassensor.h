#pragma once

#include <QString>

struct GasReading {
    double concentration = 0.0;  // ppm CO2
    double temperature = 0.0;    // °C ambient
    double humidity = 0.0;       // %RH
};

// Gas analyser. Pushes lines at its own pace, so "no reading" is normal
// and is not a failure; only isAvailable() going false is.
class GasSensor {
public:
    virtual ~GasSensor() = default;

    virtual bool readGas(GasReading& reading) = 0;
    virtual bool isAvailable() const = 0;
    virtual QString name() const = 0;
};
