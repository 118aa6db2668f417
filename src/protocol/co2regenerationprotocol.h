#pragma once

#include "regenerationprotocol.h"
#include "../detection/gasdetector.h"

// Regeneration driven by the CO2 released from the element:
//   wait for a stable baseline, hold the high setpoint for a fixed time,
//   then wait for CO2 to settle again and report the rise.
//
// Peak and restabilization may be seen while still heating; the heater
// holds the high setpoint for the full duration regardless, and a
// restabilization seen early completes the run as soon as heating ends.
class Co2RegenerationProtocol : public RegenerationProtocol {
public:
    enum class Step {
        Idle,
        CheckingInitialStability,
        Heating,
        AwaitingPostHeatRestabilization,
        Complete
    };

    explicit Co2RegenerationProtocol(const EngineParameters& params = EngineParameters());

    Regen::ProtocolKind kind() const override { return Regen::ProtocolKind::Co2Regeneration; }

    bool start(const ProtocolContext& ctx) override;
    Outcome tick(const ProtocolContext& ctx) override;
    bool cancel(const ProtocolContext& ctx) override;
    bool isActive() const override { return m_step != Step::Idle; }

    Step step() const { return m_step; }
    static QString stepToString(Step step);

    const GasStabilityTracker& stabilityTracker() const { return m_stability; }
    const GasStabilityTracker& restabilizationTracker() const { return m_restabilization; }
    const GasPeakState& peakState() const { return m_peak.state(); }

private:
    // Valid from Heating onwards
    struct HeatingData {
        double initialReference = 0;
        double startTime = -1;
        bool heaterLowered = false;
        bool restabilized = false;
    };

    Outcome checkInitialStability(const ProtocolContext& ctx);
    Outcome heat(const ProtocolContext& ctx);
    Outcome awaitRestabilization(const ProtocolContext& ctx);
    void trackRelease(const ProtocolContext& ctx);
    Outcome complete(const ProtocolContext& ctx);
    Outcome fail(const ProtocolContext& ctx, const QString& error);
    void resetRun();

    Step m_step = Step::Idle;
    GasStabilityTracker m_stability;
    GasStabilityTracker m_restabilization;
    GasPeakDetector m_peak;
    HeatingData m_heating;
    int m_stabilityResets = 0;
};
