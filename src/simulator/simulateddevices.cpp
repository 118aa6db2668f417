#include "simulateddevices.h"
#include "benchsimulator.h"
#include "../core/clock.h"

#include <QDebug>

// --- Multimeter ---

bool SimulatedMultimeter::readResistance(double& ohms)
{
    m_bench->advance();
    double conductance = m_bench->conductance() + m_bench->noise(1.0);
    if (conductance <= 0) {
        return false;
    }
    ohms = 1.0e6 / conductance;
    return true;
}

// --- Gas analyser ---

bool SimulatedGasAnalyser::readGas(GasReading& reading)
{
    double now = m_clock->now();
    if (m_lastEmit >= 0 && now - m_lastEmit < GAS_PERIOD) {
        return false;
    }
    m_lastEmit = now;

    m_bench->advance();
    reading.concentration = m_bench->cellConcentration() + m_bench->noise(100.0);
    reading.temperature = m_bench->ambientTemperature() + m_bench->noise(10.0);
    reading.humidity = m_bench->humidity() + m_bench->noise(20.0);
    return true;
}

// --- Regeneration board ---

bool SimulatedHeaterBoard::setSetpoint(double celsius)
{
    if (m_parameterFault) {
        qDebug() << "[Simulator] Parameter write rejected";
        return false;
    }
    m_bench->setSetpoint(celsius);
    return true;
}

bool SimulatedHeaterBoard::writeSetpointDirect(double celsius)
{
    m_bench->setSetpoint(celsius);
    return true;
}

bool SimulatedHeaterBoard::readTemperature(double& setpoint, double& measured)
{
    m_bench->advance();
    setpoint = m_bench->setpoint();
    measured = m_bench->heaterTemperature() + m_bench->noise(500.0);
    return true;
}

bool SimulatedHeaterBoard::readReferenceResistance(double& r0)
{
    r0 = m_bench->referenceResistance();
    return true;
}

bool SimulatedHeaterBoard::writeReferenceResistance(double r0)
{
    m_bench->setReferenceResistance(r0);
    return true;
}

// --- Valve ---

bool SimulatedValve::open()
{
    m_bench->setValveOpen(true);
    return true;
}

bool SimulatedValve::close()
{
    m_bench->setValveOpen(false);
    return true;
}

bool SimulatedValve::initialize()
{
    m_bench->setValveOpen(true);
    m_pinsReported = false;
    return true;
}

PinStates SimulatedValve::currentPins() const
{
    PinStates pins;
    bool open = m_bench->isValveOpen();
    pins.extended = open;
    pins.open = open;
    pins.retracted = !open;
    pins.closed = !open;
    return pins;
}

bool SimulatedValve::readPins(PinStates& pins)
{
    PinStates current = currentPins();
    if (m_pinsReported && current == m_lastPins) {
        return false;
    }
    m_pinsReported = true;
    m_lastPins = current;
    pins = current;
    return true;
}
