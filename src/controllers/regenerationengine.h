#pragma once

#include <QObject>
#include <QMap>
#include <QVector>
#include <QPointF>

#include "../core/engineparameters.h"
#include "../models/measurementstore.h"
#include "../models/eventtimeline.h"
#include "../machine/timebase.h"
#include "../machine/heatercontrol.h"
#include "../detection/conductancedetector.h"
#include "../devices/devicehealth.h"
#include "../devices/positionsensor.h"
#include "../protocol/co2regenerationprotocol.h"
#include "../protocol/resistanceregenerationprotocol.h"
#include "../protocol/fullprotocol.h"
#include "automaticmodecontroller.h"

class Clock;
class ResistanceSensor;
class GasSensor;
class ThermalActuator;
class MechanicalActuator;

// Capabilities the engine drives. None may be null: pass the Null*
// devices for hardware that is absent.
struct EngineDevices {
    ResistanceSensor* resistance = nullptr;
    GasSensor* gas = nullptr;
    ThermalActuator* heater = nullptr;
    MechanicalActuator* valve = nullptr;
    PositionSensor* pins = nullptr;
};

/**
 * RegenerationEngine owns every piece of experiment state and is driven
 * by one external poll tick. Per tick, in order:
 *   1. read the active channels and append their samples
 *   2. run the conductance episode detectors
 *   3. run the automatic-mode cycle (only when no protocol runs)
 *   4. run the active protocol
 *   5. publish status
 *
 * At most one protocol runs at a time, and none may start while an
 * automatic cycle holds the actuators.
 */
class RegenerationEngine : public QObject {
    Q_OBJECT
    Q_PROPERTY(bool autoMode READ isAutoModeEnabled WRITE setAutoMode NOTIFY autoModeChanged)
    Q_PROPERTY(bool protocolActive READ isAnyProtocolActive NOTIFY protocolActiveChanged)

public:
    explicit RegenerationEngine(const Clock* clock, const EngineDevices& devices,
                                const EngineParameters& params = EngineParameters(),
                                QObject* parent = nullptr);

    void setParameters(const EngineParameters& params);
    const EngineParameters& parameters() const { return m_params; }

    // Acquisition channels
    void startChannel(Regen::Channel channel);
    void stopChannel(Regen::Channel channel);
    void startAllChannels();
    void stopAllChannels();
    bool isChannelActive(Regen::Channel channel) const { return m_channelActive[static_cast<int>(channel)]; }
    // Refused while a protocol or automatic cycle is reading the series
    bool resetChannel(Regen::Channel channel);

    // Protocols
    bool startProtocol(Regen::ProtocolKind kind);
    bool cancelProtocol(Regen::ProtocolKind kind);
    bool isProtocolActive(Regen::ProtocolKind kind) const;
    bool isAnyProtocolActive() const;
    ProtocolStatus protocolStatus(Regen::ProtocolKind kind) const;

    // Automatic mode
    bool isAutoModeEnabled() const { return m_auto.isEnabled(); }
    void setAutoMode(bool enabled);
    AutomaticModeController* automaticMode() { return &m_auto; }

    // Manual bench commands. Refused while a protocol or an automatic
    // cycle holds the actuators.
    bool openValve();
    bool closeValve();
    bool initializeBench();
    bool setHeaterSetpoint(double celsius);

    // Reference resistance on the regeneration board
    bool setReferenceResistance(double value);
    bool readReferenceResistance(double& value);

    // Read-only views for plotting and reporting
    const MeasurementStore& store() const { return m_store; }
    QVector<QPointF> seriesSnapshot(Series series) const { return m_store.snapshot(series); }
    QMap<EventTimeline::Milestone, double> timelineSnapshot() const { return m_timeline.snapshot(); }
    const DetectionState& detectionState() const { return m_detector.state(); }
    const PostTreatmentState& postTreatmentState() const { return m_detector.postTreatment(); }
    PinStates pinStates() const { return m_pins; }
    const DeviceHealth& resistanceHealth() const { return m_resistanceHealth; }
    const DeviceHealth& gasHealth() const { return m_gasHealth; }
    const DeviceHealth& heaterHealth() const { return m_heaterHealth; }
    const HeaterControl& heater() const { return m_heater; }
    double channelTime(Regen::Channel channel) const { return m_timeBase.timestamp(channel); }

public slots:
    void tick();
    // Safe state for exit: protocols stopped, heater low
    void shutdown();

signals:
    void sampleAppended(Regen::Channel channel);
    void detectionChanged();
    void protocolStatusChanged(Regen::ProtocolKind kind, const ProtocolStatus& status);
    void protocolFinished(Regen::ProtocolKind kind, const ProtocolResults& results);
    void protocolFailed(Regen::ProtocolKind kind, const QString& error);
    void protocolActiveChanged();
    void deviceHealthChanged();
    void pinStatesChanged();
    void autoModeChanged();

private:
    ProtocolContext context(double now);
    RegenerationProtocol* protocol(Regen::ProtocolKind kind);
    const RegenerationProtocol* protocol(Regen::ProtocolKind kind) const;
    RegenerationProtocol* activeProtocol();
    bool actuatorsBusy(const char* command) const;

    bool readConductance();
    void readGas();
    void readHeater();
    void readPins();
    void recordHealth(DeviceHealth& health, bool ok, const char* device);

    const Clock* m_clock;
    EngineDevices m_devices;
    EngineParameters m_params;

    TimeBase m_timeBase;
    MeasurementStore m_store;
    EventTimeline m_timeline;
    HeaterControl m_heater;
    ConductanceDetector m_detector;

    Co2RegenerationProtocol m_co2Protocol;
    ResistanceRegenerationProtocol m_resistanceProtocol;
    FullProtocol m_fullProtocol;
    AutomaticModeController m_auto;

    bool m_channelActive[3] = {false, false, false};
    DeviceHealth m_resistanceHealth;
    DeviceHealth m_gasHealth;
    DeviceHealth m_heaterHealth;
    PinStates m_pins;
};
