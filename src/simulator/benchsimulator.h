#pragma once

#include <QObject>

class Clock;

/**
 * BenchSimulator - Simulates the sensor test bench
 *
 * Lumped model, integrated lazily up to Clock::now() whenever a device
 * reads or writes:
 * - Heater: first-order lag toward the setpoint
 * - Element: soot deposits at a constant rate while the valve is open and
 *   the source is emitting (conductance ramp), then plateaus
 * - Burn-off: above the ignition temperature the deposit oxidises, the
 *   conductance falls toward the clean value and the burnt carbon shows
 *   up as CO2 in the closed cell
 * - Cell: closed cell leaks toward ambient slowly, open cell flushes fast
 */
class BenchSimulator : public QObject {
    Q_OBJECT

public:
    explicit BenchSimulator(const Clock* clock, QObject* parent = nullptr);

    // Integrates the model up to the current clock time
    void advance();

    double conductance() const { return m_conductance; }
    double heaterTemperature() const { return m_heaterTemp; }
    double setpoint() const { return m_setpoint; }
    double cellConcentration() const { return m_cellCo2; }
    double ambientTemperature() const { return m_ambientTemp; }
    double humidity() const { return m_humidity; }
    bool isValveOpen() const { return m_valveOpen; }
    double referenceResistance() const { return m_r0; }

    void setSetpoint(double celsius);
    void setValveOpen(bool open);
    void setReferenceResistance(double r0) { m_r0 = r0; }

    // Starts a new soot exposure: deposition while the valve is open
    void startExposure(double duration);
    bool isExposing() const { return m_exposureRemaining > 0; }

    // Measurement noise amplitude, 0 for deterministic output
    void setNoise(double amplitude) { m_noise = amplitude; }
    double noise(double scale) const;

signals:
    void setpointChanged(double celsius);
    void valveChanged(bool open);

private:
    void step(double dt);

    const Clock* m_clock;
    double m_lastTime = -1.0;

    double m_setpoint = 0.0;
    double m_heaterTemp = 25.0;
    double m_conductance = CLEAN_CONDUCTANCE;
    double m_cellCo2 = AMBIENT_CO2;
    double m_ambientTemp = 22.0;
    double m_humidity = 45.0;
    double m_r0 = 10.0;
    bool m_valveOpen = true;
    double m_exposureRemaining = 0.0;
    double m_noise = 0.002;

    static constexpr double ROOM_TEMP = 25.0;
    static constexpr double HEATER_TAU = 8.0;              // s
    static constexpr double IGNITION_TEMP = 500.0;         // °C
    static constexpr double CLEAN_CONDUCTANCE = 0.4;       // µS, burnt-clean element
    static constexpr double DEPOSITION_RATE = 0.3;         // µS/s
    static constexpr double BURN_TAU = 6.0;                // s
    static constexpr double PPM_PER_MICROSIEMENS = 2.0;    // CO2 released per µS burnt
    static constexpr double AMBIENT_CO2 = 420.0;           // ppm
    static constexpr double CLOSED_LEAK_TAU = 400.0;       // s
    static constexpr double OPEN_FLUSH_TAU = 20.0;         // s
    static constexpr double MAX_STEP = 0.05;               // s, integration step
};
