#pragma once

#include "regenerationprotocol.h"
#include "../detection/gasdetector.h"

// Complete bench cycle on one element:
//   1 close the valve and let it settle
//   2 wait for a stable CO2 baseline (force-advance after the safety window)
//   3 heat until conductance collapses or the heating window ends
//   4 heater low, short settle
//   5 wait for CO2 to restabilize against the post-peak value when a peak
//     was seen (force-advance counts as restabilized)
//   6 report delta C and carbon mass
//
// An actuator command that fails is retried on the next tick; a second
// failure in the same step aborts the run with the heater forced low.
class FullProtocol : public RegenerationProtocol {
public:
    enum class Step {
        Idle,
        ClosingValve,
        GasStability,
        Heating,
        Cooling,
        Restabilization,
        Results
    };

    explicit FullProtocol(const EngineParameters& params = EngineParameters());

    Regen::ProtocolKind kind() const override { return Regen::ProtocolKind::Full; }

    bool start(const ProtocolContext& ctx) override;
    Outcome tick(const ProtocolContext& ctx) override;
    bool cancel(const ProtocolContext& ctx) override;
    bool isActive() const override { return m_step != Step::Idle; }

    Step step() const { return m_step; }
    static QString stepToString(Step step);

    // Whether the last finished run had to force-advance a wait
    bool stabilityTimedOut() const { return m_stabilityTimedOut; }
    bool heatingTimedOut() const { return m_heatingTimedOut; }
    bool restabilizationTimedOut() const { return m_restabilizationTimedOut; }

private:
    struct StepData {
        double startTime = -1;     // set once the entry action succeeded
        bool actionDone = false;
        int failures = 0;
        int firstSample = 0;       // conductance samples before the step are ignored
    };

    Outcome enter(Step step, const ProtocolContext& ctx);
    // Runs the step's entry action; false only when the run must abort
    bool runEntryAction(const ProtocolContext& ctx);
    Outcome fail(const ProtocolContext& ctx, const QString& error);

    Outcome closeValve(const ProtocolContext& ctx);
    Outcome waitGasStability(const ProtocolContext& ctx);
    Outcome heat(const ProtocolContext& ctx);
    Outcome cool(const ProtocolContext& ctx);
    Outcome waitRestabilization(const ProtocolContext& ctx);
    Outcome finish(const ProtocolContext& ctx);

    void trackPeak(const ProtocolContext& ctx);
    bool latestGas(const ProtocolContext& ctx, double& value) const;
    double stepProgress(double elapsed, double window, double from, double to) const;

    Step m_step = Step::Idle;
    StepData m_data;
    GasStabilityTracker m_tracker;
    GasPeakDetector m_peak;
    double m_initialReference = 0;
    double m_finalReference = 0;
    double m_peakAdjacent = 0;    // gas value when the peak was confirmed
    bool m_stabilityTimedOut = false;
    bool m_heatingTimedOut = false;
    bool m_restabilizationTimedOut = false;
};
