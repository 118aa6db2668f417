#pragma once

#include <QObject>
#include <QString>

#include "../core/engineparameters.h"
#include "../detection/gasdetector.h"

class ConductanceDetector;
struct ProtocolContext;

/**
 * AutomaticModeController runs unattended regeneration cycles.
 *
 * Each cycle is triggered by a conductance stabilization:
 *   close valve -> settle -> check and re-latch R0 -> wait for CO2 baseline
 *   (bounded) -> heat until conductance collapses (bounded) -> heater low ->
 *   recovery wait -> open valve -> settle -> re-arm detection.
 *
 * Nothing here blocks. Every wait is a "since" timestamp compared against
 * the clock on each engine tick.
 */
class AutomaticModeController : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool enabled READ isEnabled NOTIFY enabledChanged)
    Q_PROPERTY(Phase phase READ phase NOTIFY phaseChanged)

public:
    enum class Phase {
        Disabled,
        Monitoring,
        ClosingValve,
        WaitingGasStability,
        Regenerating,
        Recovering,
        Reopening
    };
    Q_ENUM(Phase)

    explicit AutomaticModeController(ConductanceDetector* detector,
                                     const EngineParameters& params = EngineParameters(),
                                     QObject* parent = nullptr);

    void setParameters(const EngineParameters& params);

    bool isEnabled() const { return m_phase != Phase::Disabled; }
    // True while a cycle owns the actuators
    bool isBusy() const { return m_phase != Phase::Disabled && m_phase != Phase::Monitoring; }
    Phase phase() const { return m_phase; }
    double phaseSince() const { return m_since; }
    int completedCycles() const { return m_completedCycles; }

    void enable();
    // Leaves the heater low if a cycle was running
    void disable(const ProtocolContext& ctx);

    void tick(const ProtocolContext& ctx);

    static QString phaseToString(Phase phase);

signals:
    void enabledChanged();
    void phaseChanged(AutomaticModeController::Phase phase);
    void cycleCompleted(int cycle);
    void cycleAborted(const QString& reason);

private:
    void setPhase(Phase phase, double now);
    bool elapsed(const ProtocolContext& ctx, double duration) const;
    // Once-retry for actuator commands; false when the cycle must be aborted
    bool retryable(bool ok, const QString& action);
    void abortCycle(const ProtocolContext& ctx, const QString& reason);

    void monitor(const ProtocolContext& ctx);
    void afterValveClosed(const ProtocolContext& ctx);
    void waitGasStability(const ProtocolContext& ctx);
    void regenerate(const ProtocolContext& ctx);
    void recover(const ProtocolContext& ctx);
    void reopen(const ProtocolContext& ctx);

    ConductanceDetector* m_detector;
    EngineParameters m_params;
    GasStabilityTracker m_gasTracker;

    Phase m_phase = Phase::Disabled;
    double m_since = -1;
    int m_failures = 0;
    int m_firstConductanceSample = 0;
    double m_handledStabilization = -1;
    bool m_skipped = false;          // R0 rejected, current cycle does not count
    int m_completedCycles = 0;
};
