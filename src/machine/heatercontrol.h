#pragma once

#include <QString>

class ThermalActuator;

// Single owner of every heater command.
//
// Setpoints are cached: asking for the value that was last written
// successfully costs nothing, so callers may re-assert their setpoint
// every tick. A failed parameter write is retried once through the
// actuator's direct path before the failure is reported.
class HeaterControl {
public:
    explicit HeaterControl(ThermalActuator* actuator);

    bool setSetpoint(double celsius);
    // Bypasses the cache. Used for the safe low setpoint on cancel/exit.
    bool forceSetpoint(double celsius);

    bool hasCommanded() const { return m_hasCommanded; }
    double lastCommanded() const { return m_lastCommanded; }
    int writeCount() const { return m_writeCount; }

    // Setpoint read back from the board. A read-back more than 50 °C away
    // from the last command is a stale register; the command wins.
    bool readTemperature(double& setpoint, double& measured);

    bool readReferenceResistance(double& r0);
    bool writeReferenceResistance(double r0);
    // Reads R0 and writes it straight back so the board re-latches it
    bool actualizeReferenceResistance(double* r0 = nullptr);

    bool isAvailable() const;

private:
    bool write(double celsius);

    ThermalActuator* m_actuator;
    bool m_hasCommanded = false;
    bool m_lastWriteOk = false;
    double m_lastCommanded = 0;
    int m_writeCount = 0;
};
