#pragma once

#include "../devices/resistancesensor.h"
#include "../devices/gassensor.h"
#include "../devices/thermalactuator.h"
#include "../devices/mechanicalactuator.h"
#include "../devices/positionsensor.h"

class BenchSimulator;
class Clock;

/**
 * Virtual bench instruments backed by one BenchSimulator. They plug into
 * the engine exactly like the serial/instrument drivers do.
 */

class SimulatedMultimeter : public ResistanceSensor {
public:
    explicit SimulatedMultimeter(BenchSimulator* bench) : m_bench(bench) {}

    bool readResistance(double& ohms) override;
    bool isAvailable() const override { return true; }
    QString name() const override { return "Simulated multimeter"; }

private:
    BenchSimulator* m_bench;
};

// Emits at most one line per GAS_PERIOD, like the real analyser
class SimulatedGasAnalyser : public GasSensor {
public:
    SimulatedGasAnalyser(BenchSimulator* bench, const Clock* clock)
        : m_bench(bench), m_clock(clock) {}

    bool readGas(GasReading& reading) override;
    bool isAvailable() const override { return true; }
    QString name() const override { return "Simulated gas analyser"; }

private:
    BenchSimulator* m_bench;
    const Clock* m_clock;
    double m_lastEmit = -1.0;

    static constexpr double GAS_PERIOD = 1.0;  // s
};

class SimulatedHeaterBoard : public ThermalActuator {
public:
    explicit SimulatedHeaterBoard(BenchSimulator* bench) : m_bench(bench) {}

    bool setSetpoint(double celsius) override;
    bool writeSetpointDirect(double celsius) override;
    bool readTemperature(double& setpoint, double& measured) override;
    bool readReferenceResistance(double& r0) override;
    bool writeReferenceResistance(double r0) override;
    bool isAvailable() const override { return true; }
    QString name() const override { return "Simulated regeneration board"; }

    // Makes the parameter-layer write fail so the direct path gets used
    void setParameterWriteFault(bool fault) { m_parameterFault = fault; }

private:
    BenchSimulator* m_bench;
    bool m_parameterFault = false;
};

class SimulatedValve : public MechanicalActuator, public PositionSensor {
public:
    explicit SimulatedValve(BenchSimulator* bench) : m_bench(bench) {}

    bool open() override;
    bool close() override;
    bool initialize() override;
    bool isAvailable() const override { return true; }
    QString name() const override { return "Simulated valve"; }

    bool readPins(PinStates& pins) override;

private:
    PinStates currentPins() const;

    BenchSimulator* m_bench;
    bool m_pinsReported = false;
    PinStates m_lastPins;
};
