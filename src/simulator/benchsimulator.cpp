#include "benchsimulator.h"
#include "../core/clock.h"

#include <QRandomGenerator>
#include <QDebug>
#include <algorithm>

BenchSimulator::BenchSimulator(const Clock* clock, QObject* parent)
    : QObject(parent)
    , m_clock(clock)
{
}

double BenchSimulator::noise(double scale) const
{
    if (m_noise <= 0) return 0.0;
    return (QRandomGenerator::global()->generateDouble() * 2.0 - 1.0) * m_noise * scale;
}

void BenchSimulator::advance()
{
    double now = m_clock->now();
    if (m_lastTime < 0) {
        m_lastTime = now;
        return;
    }

    double remaining = now - m_lastTime;
    while (remaining > 0) {
        double dt = std::min(remaining, MAX_STEP);
        step(dt);
        remaining -= dt;
    }
    m_lastTime = now;
}

void BenchSimulator::step(double dt)
{
    // Heater lag
    m_heaterTemp += (std::max(m_setpoint, ROOM_TEMP) - m_heaterTemp) * (dt / HEATER_TAU);

    // Deposition only reaches the element through the open valve
    if (m_exposureRemaining > 0) {
        m_exposureRemaining -= dt;
        if (m_valveOpen && m_heaterTemp < IGNITION_TEMP) {
            m_conductance += DEPOSITION_RATE * dt;
        }
    }

    // Burn-off
    if (m_heaterTemp >= IGNITION_TEMP && m_conductance > CLEAN_CONDUCTANCE) {
        double burnt = (m_conductance - CLEAN_CONDUCTANCE) * (dt / BURN_TAU);
        m_conductance -= burnt;
        m_cellCo2 += burnt * PPM_PER_MICROSIEMENS;
    }

    double tau = m_valveOpen ? OPEN_FLUSH_TAU : CLOSED_LEAK_TAU;
    m_cellCo2 += (AMBIENT_CO2 - m_cellCo2) * (dt / tau);
}

void BenchSimulator::setSetpoint(double celsius)
{
    advance();
    if (m_setpoint == celsius) return;

    m_setpoint = celsius;
    qDebug() << "[Simulator] Heater setpoint" << celsius << "°C";
    emit setpointChanged(celsius);
}

void BenchSimulator::setValveOpen(bool open)
{
    advance();
    if (m_valveOpen == open) return;

    m_valveOpen = open;
    qDebug() << "[Simulator] Valve" << (open ? "open" : "closed");
    emit valveChanged(open);
}

void BenchSimulator::startExposure(double duration)
{
    advance();
    m_exposureRemaining = duration;
    qDebug() << "[Simulator] Soot exposure for" << duration << "s";
}
