#pragma once

#include "regenconstants.h"

// Snapshot of every tunable the engine reads. Built by Settings::parameters(),
// or default-constructed in tests.
struct EngineParameters {
    // Conductance detection
    double stabilityDuration = Regen::STABILITY_DURATION;
    double increaseSlopeMin = Regen::INCREASE_SLOPE_MIN;
    double increaseSlopeMax = Regen::INCREASE_SLOPE_MAX;
    double decreaseSlopeThreshold = Regen::DECREASE_SLOPE_THRESHOLD;
    double slidingWindow = Regen::SLIDING_WINDOW;
    int increaseWindowSamples = Regen::INCREASE_WINDOW_SAMPLES;
    double postTreatmentThreshold = Regen::POST_TREATMENT_THRESHOLD;

    // Reference resistance
    double r0Threshold = Regen::R0_THRESHOLD;

    // Heater
    double highSetpoint = Regen::REGENERATION_TEMP;
    double lowSetpoint = Regen::TCONS_LOW;

    double valveDelay = Regen::VALVE_DELAY;

    // Gas tracking
    double gasStabilityThreshold = Regen::CO2_STABILITY_THRESHOLD;
    double gasStabilityDuration = Regen::CO2_STABILITY_DURATION;
    double gasIncreaseThreshold = Regen::CO2_INCREASE_THRESHOLD;
    double gasPeakDrop = Regen::CO2_PEAK_DROP;
    double gasPeakSlope = Regen::CO2_PEAK_SLOPE;

    // CO2 protocol
    double regenerationDuration = Regen::REGENERATION_DURATION;
    double cellVolume = Regen::CELL_VOLUME;

    // Resistance / full protocol
    double highResistanceThreshold = Regen::HIGH_RESISTANCE_THRESHOLD;
    double regenerationCompleteConductance = Regen::REGENERATION_COMPLETE_CONDUCTANCE;
    double fullStabilityTimeout = Regen::FULL_STABILITY_TIMEOUT;
    double fullHeatingTimeout = Regen::FULL_HEATING_TIMEOUT;
    double fullCooldownDelay = Regen::FULL_COOLDOWN_DELAY;
    double fullRestabilizationTimeout = Regen::FULL_RESTABILIZATION_TIMEOUT;

    // Automatic mode
    double autoGasStabilityTimeout = Regen::AUTO_GAS_STABILITY_TIMEOUT;
    double autoRegenerationTimeout = Regen::AUTO_REGENERATION_TIMEOUT;
};
