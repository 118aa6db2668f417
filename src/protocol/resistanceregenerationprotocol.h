#pragma once

#include "regenerationprotocol.h"

// Heats until the element resistance crosses the high-resistance threshold,
// then drops the heater once. TargetReached stays visible until the next
// start but no longer counts as running.
class ResistanceRegenerationProtocol : public RegenerationProtocol {
public:
    enum class Step {
        Idle,
        Heating,
        TargetReached
    };

    explicit ResistanceRegenerationProtocol(const EngineParameters& params = EngineParameters());

    Regen::ProtocolKind kind() const override { return Regen::ProtocolKind::ResistanceRegeneration; }

    bool start(const ProtocolContext& ctx) override;
    Outcome tick(const ProtocolContext& ctx) override;
    bool cancel(const ProtocolContext& ctx) override;
    bool isActive() const override { return m_step == Step::Heating; }

    Step step() const { return m_step; }

private:
    Step m_step = Step::Idle;
    int m_firstSample = 0;       // resistance samples older than the start are ignored
    double m_startTime = -1;
};
