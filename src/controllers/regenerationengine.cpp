#include "regenerationengine.h"
#include "../core/clock.h"
#include "../devices/resistancesensor.h"
#include "../devices/gassensor.h"
#include "../devices/thermalactuator.h"
#include "../devices/mechanicalactuator.h"
#include <QDebug>
#include <QtMath>

RegenerationEngine::RegenerationEngine(const Clock* clock, const EngineDevices& devices,
                                       const EngineParameters& params, QObject* parent)
    : QObject(parent)
    , m_clock(clock)
    , m_devices(devices)
    , m_params(params)
    , m_timeBase(clock)
    , m_heater(devices.heater)
    , m_detector(params)
    , m_co2Protocol(params)
    , m_resistanceProtocol(params)
    , m_fullProtocol(params)
    , m_auto(&m_detector, params)
{
    connect(&m_auto, &AutomaticModeController::enabledChanged, this, &RegenerationEngine::autoModeChanged);
}

void RegenerationEngine::setParameters(const EngineParameters& params)
{
    m_params = params;
    m_detector.setParameters(params);
    m_co2Protocol.setParameters(params);
    m_resistanceProtocol.setParameters(params);
    m_fullProtocol.setParameters(params);
    m_auto.setParameters(params);
}

ProtocolContext RegenerationEngine::context(double now)
{
    ProtocolContext ctx;
    ctx.now = now;
    ctx.gasTime = m_timeBase.timestamp(Regen::Channel::Gas);
    ctx.store = &m_store;
    // Single HeaterControl: the setpoint cache is shared by every caller
    ctx.timeline = &m_timeline;
    ctx.heater = &m_heater;
    ctx.valve = m_devices.valve;
    ctx.conductance = &m_detector;
    ctx.resistanceAvailable = m_devices.resistance->isAvailable();
    return ctx;
}

RegenerationProtocol* RegenerationEngine::protocol(Regen::ProtocolKind kind)
{
    switch (kind) {
        case Regen::ProtocolKind::Co2Regeneration:        return &m_co2Protocol;
        case Regen::ProtocolKind::ResistanceRegeneration: return &m_resistanceProtocol;
        case Regen::ProtocolKind::Full:                   return &m_fullProtocol;
    }
    return nullptr;
}

const RegenerationProtocol* RegenerationEngine::protocol(Regen::ProtocolKind kind) const
{
    switch (kind) {
        case Regen::ProtocolKind::Co2Regeneration:        return &m_co2Protocol;
        case Regen::ProtocolKind::ResistanceRegeneration: return &m_resistanceProtocol;
        case Regen::ProtocolKind::Full:                   return &m_fullProtocol;
    }
    return nullptr;
}

RegenerationProtocol* RegenerationEngine::activeProtocol()
{
    if (m_co2Protocol.isActive()) return &m_co2Protocol;
    if (m_resistanceProtocol.isActive()) return &m_resistanceProtocol;
    if (m_fullProtocol.isActive()) return &m_fullProtocol;
    return nullptr;
}

bool RegenerationEngine::isProtocolActive(Regen::ProtocolKind kind) const
{
    const RegenerationProtocol* p = protocol(kind);
    return p && p->isActive();
}

bool RegenerationEngine::isAnyProtocolActive() const
{
    return m_co2Protocol.isActive() || m_resistanceProtocol.isActive() || m_fullProtocol.isActive();
}

ProtocolStatus RegenerationEngine::protocolStatus(Regen::ProtocolKind kind) const
{
    const RegenerationProtocol* p = protocol(kind);
    return p ? p->status() : ProtocolStatus();
}

// --- Channels ---

void RegenerationEngine::startChannel(Regen::Channel channel)
{
    if (isChannelActive(channel)) return;

    if (m_timeBase.isStarted(channel)) {
        m_timeBase.resume(channel);
    } else {
        m_timeBase.start(channel);
    }
    m_channelActive[static_cast<int>(channel)] = true;
    qInfo() << "[Engine]" << Regen::channelToString(channel) << "acquisition started";
}

void RegenerationEngine::stopChannel(Regen::Channel channel)
{
    if (!isChannelActive(channel)) return;

    m_timeBase.pause(channel);
    m_channelActive[static_cast<int>(channel)] = false;
    qInfo() << "[Engine]" << Regen::channelToString(channel) << "acquisition stopped";
}

void RegenerationEngine::startAllChannels()
{
    startChannel(Regen::Channel::Conductance);
    startChannel(Regen::Channel::Gas);
    startChannel(Regen::Channel::Heater);
}

void RegenerationEngine::stopAllChannels()
{
    stopChannel(Regen::Channel::Conductance);
    stopChannel(Regen::Channel::Gas);
    stopChannel(Regen::Channel::Heater);
}

bool RegenerationEngine::resetChannel(Regen::Channel channel)
{
    if (actuatorsBusy("channel reset")) {
        return false;
    }

    bool wasActive = isChannelActive(channel);

    m_store.clearChannel(channel);
    m_timeBase.reset(channel);
    if (wasActive) {
        m_timeBase.start(channel);
    }

    switch (channel) {
        case Regen::Channel::Conductance:
            m_detector.reset();
            emit detectionChanged();
            break;
        case Regen::Channel::Gas:
            m_timeline.clear();
            break;
        case Regen::Channel::Heater:
            break;
    }
    qInfo() << "[Engine]" << Regen::channelToString(channel) << "data reset";
    return true;
}

// --- Protocols ---

bool RegenerationEngine::startProtocol(Regen::ProtocolKind kind)
{
    RegenerationProtocol* p = protocol(kind);
    if (!p) return false;

    if (RegenerationProtocol* running = activeProtocol()) {
        qWarning() << "[Engine] Cannot start" << Regen::protocolKindToString(kind) << "protocol:"
                   << Regen::protocolKindToString(running->kind()) << "protocol is running";
        return false;
    }
    if (m_auto.isBusy()) {
        qWarning() << "[Engine] Cannot start" << Regen::protocolKindToString(kind)
                   << "protocol during an automatic cycle";
        return false;
    }

    if (!p->start(context(m_clock->now()))) {
        return false;
    }
    emit protocolActiveChanged();
    emit protocolStatusChanged(kind, p->status());
    return true;
}

bool RegenerationEngine::cancelProtocol(Regen::ProtocolKind kind)
{
    RegenerationProtocol* p = protocol(kind);
    if (!p || !p->isActive()) return false;

    bool lowered = p->cancel(context(m_clock->now()));
    emit protocolActiveChanged();
    emit protocolStatusChanged(kind, p->status());
    return lowered;
}

void RegenerationEngine::setAutoMode(bool enabled)
{
    if (enabled) {
        if (isAnyProtocolActive()) {
            qWarning() << "[Engine] Automatic mode waits for the running protocol to finish";
        }
        startAllChannels();
        m_auto.enable();
    } else {
        m_auto.disable(context(m_clock->now()));
    }
}

// --- Manual commands ---

bool RegenerationEngine::actuatorsBusy(const char* command) const
{
    const Regen::ProtocolKind kinds[] = {Regen::ProtocolKind::Co2Regeneration,
                                         Regen::ProtocolKind::ResistanceRegeneration,
                                         Regen::ProtocolKind::Full};
    for (Regen::ProtocolKind kind : kinds) {
        if (isProtocolActive(kind)) {
            qWarning() << "[Engine] Refusing" << command << "while the"
                       << Regen::protocolKindToString(kind) << "protocol runs";
            return true;
        }
    }
    if (m_auto.isBusy()) {
        qWarning() << "[Engine] Refusing" << command << "during an automatic cycle";
        return true;
    }
    return false;
}

bool RegenerationEngine::openValve()
{
    if (actuatorsBusy("valve open")) return false;
    if (!m_devices.valve->open()) {
        qWarning() << "[Engine]" << m_devices.valve->name() << "did not accept the open command";
        return false;
    }
    qInfo() << "[Engine] Valve opened";
    return true;
}

bool RegenerationEngine::closeValve()
{
    if (actuatorsBusy("valve close")) return false;
    if (!m_devices.valve->close()) {
        qWarning() << "[Engine]" << m_devices.valve->name() << "did not accept the close command";
        return false;
    }
    qInfo() << "[Engine] Valve closed";
    return true;
}

bool RegenerationEngine::initializeBench()
{
    if (actuatorsBusy("bench initialisation")) return false;
    if (!m_devices.valve->initialize()) {
        qWarning() << "[Engine]" << m_devices.valve->name() << "did not accept the init command";
        return false;
    }
    qInfo() << "[Engine] Bench initialised";
    return true;
}

bool RegenerationEngine::setHeaterSetpoint(double celsius)
{
    if (!qIsFinite(celsius) || celsius < 0) {
        qWarning() << "[Engine] Rejecting heater setpoint" << celsius;
        return false;
    }
    if (actuatorsBusy("manual heater setpoint")) return false;
    if (!m_heater.setSetpoint(celsius)) {
        qWarning() << "[Engine] Heater did not accept" << celsius << "°C";
        return false;
    }
    qInfo() << "[Engine] Heater setpoint" << celsius << "°C";
    return true;
}

// --- Reference resistance ---

bool RegenerationEngine::setReferenceResistance(double value)
{
    if (value <= 0) {
        qWarning() << "[Engine] Rejecting R0 =" << value;
        return false;
    }
    return m_heater.writeReferenceResistance(value);
}

bool RegenerationEngine::readReferenceResistance(double& value)
{
    double r0 = 0;
    if (!m_heater.readReferenceResistance(r0)) {
        return false;
    }
    if (r0 == Regen::R0_NOT_DETECTED) {
        qWarning() << "[Engine] R0 not detected (board reports" << r0 << ")";
    }
    value = r0;
    return true;
}

// --- Tick ---

void RegenerationEngine::recordHealth(DeviceHealth& health, bool ok, const char* device)
{
    if (health.record(ok)) {
        if (health.connected) {
            qInfo() << "[Engine]" << device << "reconnected";
        } else {
            qWarning() << "[Engine]" << device << "disconnected after"
                       << health.consecutiveFailures << "failed reads";
        }
        emit deviceHealthChanged();
    }
}

bool RegenerationEngine::readConductance()
{
    double ohms = 0;
    bool ok = m_devices.resistance->readResistance(ohms);
    recordHealth(m_resistanceHealth, ok, "Multimeter");
    if (!ok) return false;

    if (ohms <= 0) {
        qWarning() << "[Engine] Dropping resistance sample" << ohms << "Ω";
        return false;
    }

    double t = m_timeBase.timestamp(Regen::Channel::Conductance);
    double conductance = 1.0e6 / ohms;  // µS
    if (!m_store.append(Series::Resistance, t, ohms)) return false;
    m_store.append(Series::Conductance, t, conductance);
    emit sampleAppended(Regen::Channel::Conductance);
    return true;
}

void RegenerationEngine::readGas()
{
    GasReading reading;
    if (!m_devices.gas->readGas(reading)) {
        // No line this tick is normal for the analyser
        if (!m_devices.gas->isAvailable()) {
            recordHealth(m_gasHealth, false, "Gas analyser");
        }
        return;
    }
    recordHealth(m_gasHealth, true, "Gas analyser");

    double t = m_timeBase.timestamp(Regen::Channel::Gas);
    if (!m_store.append(Series::GasConcentration, t, reading.concentration)) return;
    m_store.append(Series::AmbientTemperature, t, reading.temperature);
    m_store.append(Series::Humidity, t, reading.humidity);
    emit sampleAppended(Regen::Channel::Gas);
}

void RegenerationEngine::readHeater()
{
    double setpoint = 0;
    double measured = 0;
    bool ok = m_heater.readTemperature(setpoint, measured);
    recordHealth(m_heaterHealth, ok, "Regeneration board");
    if (!ok) return;

    double t = m_timeBase.timestamp(Regen::Channel::Heater);
    if (!m_store.append(Series::MeasuredTemperature, t, measured)) return;
    m_store.append(Series::HeaterSetpoint, t, setpoint);
    emit sampleAppended(Regen::Channel::Heater);
}

void RegenerationEngine::readPins()
{
    PinStates pins;
    if (m_devices.pins->readPins(pins) && pins != m_pins) {
        m_pins = pins;
        emit pinStatesChanged();
    }
}

void RegenerationEngine::tick()
{
    double now = m_clock->now();

    bool newConductance = false;
    if (isChannelActive(Regen::Channel::Conductance)) {
        newConductance = readConductance();
    }
    if (isChannelActive(Regen::Channel::Gas)) {
        readGas();
    }
    if (isChannelActive(Regen::Channel::Heater)) {
        readHeater();
    }
    readPins();

    if (newConductance && m_detector.update(m_store.series(Series::Conductance))) {
        emit detectionChanged();
    }

    ProtocolContext ctx = context(now);

    if (m_auto.isEnabled() && !isAnyProtocolActive()) {
        bool stabilizedBefore = m_detector.state().stabilized;
        m_auto.tick(ctx);
        if (stabilizedBefore != m_detector.state().stabilized) {
            emit detectionChanged();
        }
    }

    RegenerationProtocol* p = activeProtocol();
    if (!p) return;

    Regen::ProtocolKind kind = p->kind();
    RegenerationProtocol::Outcome outcome = p->tick(ctx);
    emit protocolStatusChanged(kind, p->status());

    switch (outcome) {
        case RegenerationProtocol::Outcome::Finished:
            emit protocolActiveChanged();
            emit protocolFinished(kind, p->results());
            break;
        case RegenerationProtocol::Outcome::Failed:
            emit protocolActiveChanged();
            emit protocolFailed(kind, p->errorString());
            break;
        case RegenerationProtocol::Outcome::Idle:
        case RegenerationProtocol::Outcome::Running:
            break;
    }
}

void RegenerationEngine::shutdown()
{
    double now = m_clock->now();
    ProtocolContext ctx = context(now);

    bool lowered = false;
    if (RegenerationProtocol* p = activeProtocol()) {
        lowered = p->cancel(ctx);
        emit protocolActiveChanged();
        emit protocolStatusChanged(p->kind(), p->status());
    }
    if (m_auto.isEnabled()) {
        bool wasBusy = m_auto.isBusy();
        m_auto.disable(ctx);
        lowered = lowered || wasBusy;
    }
    if (!lowered && !m_heater.forceSetpoint(m_params.lowSetpoint)) {
        qCritical() << "[Engine] Heater could not be set to the safe setpoint on shutdown";
    }
    stopAllChannels();
    qInfo() << "[Engine] Shut down";
}
