#pragma once

#include <QString>
#include <QMetaType>

// Compiled defaults for the bench. Settings overrides any of these at runtime.
namespace Regen {

// Conductance detection
constexpr double STABILITY_DURATION = 2 * 60;        // s, flat time required after the max slope
constexpr double INCREASE_SLOPE_MIN = 0.1;           // µS/s
constexpr double INCREASE_SLOPE_MAX = 0.7;           // µS/s
constexpr double DECREASE_SLOPE_THRESHOLD = -0.05;   // µS/s, lower edge of the "flat" band
constexpr double SLIDING_WINDOW = 2.5 * 60;          // s, centred window for the local slope
constexpr int INCREASE_WINDOW_SAMPLES = 10;
constexpr double POST_TREATMENT_THRESHOLD = 5.0;     // µS, drop below this ends an episode

// Reference resistance (R0)
constexpr double R0_THRESHOLD = 12.0;
constexpr double R0_NOT_DETECTED = 1000.0;           // value the board reports with no element

// Heater
constexpr double REGENERATION_TEMP = 700.0;          // °C, high setpoint
constexpr double TCONS_LOW = 0.0;                    // °C, safe setpoint
constexpr double SETPOINT_READBACK_TOLERANCE = 50.0; // °C

// Valve / cylinder
constexpr double VALVE_DELAY = 4.0;                  // s

// Gas (CO2) tracking
constexpr double CO2_STABILITY_THRESHOLD = 15.0;     // ppm
constexpr double CO2_STABILITY_DURATION = 2 * 60;    // s
constexpr int CO2_MIN_SAMPLES = 3;
constexpr double CO2_INCREASE_THRESHOLD = 5.0;       // ppm above base
constexpr double CO2_PEAK_DROP = 1.0;                // ppm below running max
constexpr double CO2_PEAK_SLOPE = -0.05;             // ppm/s over the last 3 samples
constexpr int CO2_PEAK_WINDOW = 10;

// CO2 regeneration protocol
constexpr double REGENERATION_DURATION = 2 * 60;     // s at high setpoint
constexpr double CELL_VOLUME = 0.965;                // L
constexpr double MOLAR_VOLUME = 24.5;                // L/mol
constexpr double CARBON_MOLAR_MASS = 12.0;           // g/mol

// Resistance / full protocol
constexpr double HIGH_RESISTANCE_THRESHOLD = 1.0e6;  // Ω
constexpr double REGENERATION_COMPLETE_CONDUCTANCE = 1.0;  // µS
constexpr double FULL_STABILITY_TIMEOUT = 3 * 60;    // s
constexpr double FULL_HEATING_TIMEOUT = 3 * 60;      // s
constexpr double FULL_COOLDOWN_DELAY = 5.0;          // s
constexpr double FULL_RESTABILIZATION_TIMEOUT = 5 * 60;  // s

// Automatic mode
constexpr double AUTO_GAS_STABILITY_TIMEOUT = 3 * 60;     // s
constexpr double AUTO_REGENERATION_TIMEOUT = 3 * 60;      // s

// Engine
constexpr int TICK_INTERVAL_MS = 200;
constexpr int DEVICE_FAILURE_THRESHOLD = 3;

enum class Channel {
    Conductance,
    Gas,
    Heater
};

inline QString channelToString(Channel channel) {
    switch (channel) {
        case Channel::Conductance: return "conductance";
        case Channel::Gas:         return "gas";
        case Channel::Heater:      return "heater";
    }
    return "unknown";
}

enum class ProtocolKind {
    Co2Regeneration,
    ResistanceRegeneration,
    Full
};

inline QString protocolKindToString(ProtocolKind kind) {
    switch (kind) {
        case ProtocolKind::Co2Regeneration:        return "co2";
        case ProtocolKind::ResistanceRegeneration: return "resistance";
        case ProtocolKind::Full:                   return "full";
    }
    return "unknown";
}

} // namespace Regen

Q_DECLARE_METATYPE(Regen::Channel)
Q_DECLARE_METATYPE(Regen::ProtocolKind)
