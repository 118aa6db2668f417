#pragma once

#include <QString>

#include "protocolstatus.h"
#include "../core/engineparameters.h"

class MeasurementStore;
class EventTimeline;
class HeaterControl;
class MechanicalActuator;
class ConductanceDetector;

// Everything a protocol may look at or drive during one tick.
// Built by the engine; pointers outlive the tick.
struct ProtocolContext {
    double now = 0;                 // clock seconds, drives every timer
    double gasTime = -1;            // gas channel time, for timeline markers
    const MeasurementStore* store = nullptr;
    EventTimeline* timeline = nullptr;
    HeaterControl* heater = nullptr;
    MechanicalActuator* valve = nullptr;
    const ConductanceDetector* conductance = nullptr;
    bool resistanceAvailable = false;
};

// Common shape of the regeneration state machines. Each one is driven by
// the engine's poll tick and never blocks.
class RegenerationProtocol {
public:
    enum class Outcome {
        Idle,       // not running
        Running,
        Finished,   // results() holds the run's results
        Failed      // errorString() says why; heater already forced low
    };

    explicit RegenerationProtocol(const EngineParameters& params) : m_params(params) {}
    virtual ~RegenerationProtocol() = default;

    virtual Regen::ProtocolKind kind() const = 0;

    // Rejects (false, nothing changed) when already running or preconditions fail
    virtual bool start(const ProtocolContext& ctx) = 0;
    virtual Outcome tick(const ProtocolContext& ctx) = 0;
    // Forces the heater low and returns to Idle within the call
    virtual bool cancel(const ProtocolContext& ctx) = 0;
    virtual bool isActive() const = 0;

    void setParameters(const EngineParameters& params) { m_params = params; }

    const ProtocolStatus& status() const { return m_status; }
    const ProtocolResults& results() const { return m_results; }
    QString errorString() const { return m_error; }

protected:
    // Progress only moves forward within a run
    void report(int step, const QString& message, double progress) {
        m_status.active = isActive();
        m_status.step = step;
        m_status.message = message;
        m_status.progress = qBound(m_status.progress, progress, 100.0);
    }

    EngineParameters m_params;
    ProtocolStatus m_status;
    ProtocolResults m_results;
    QString m_error;
};
