#include <QCoreApplication>
#include <QCommandLineParser>
#include <QFile>
#include <QTimer>
#include <QDebug>
#include <csignal>
#include <memory>

#include "core/settings.h"
#include "core/logger.h"
#include "core/clock.h"
#include "devices/benchlink.h"
#include "devices/nulldevices.h"
#include "controllers/regenerationengine.h"
#include "simulator/benchsimulator.h"
#include "simulator/simulateddevices.h"

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void handleStopSignal(int)
{
    g_stopRequested = 1;
}

bool parseProtocolKind(const QString& name, Regen::ProtocolKind& kind)
{
    if (name == "co2") {
        kind = Regen::ProtocolKind::Co2Regeneration;
    } else if (name == "resistance") {
        kind = Regen::ProtocolKind::ResistanceRegeneration;
    } else if (name == "full") {
        kind = Regen::ProtocolKind::Full;
    } else {
        return false;
    }
    return true;
}

// Soot exposure the simulated bench starts with and repeats after each cycle
constexpr double SIMULATED_EXPOSURE = 40.0;  // s

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setOrganizationName("RegenLab");
    app.setApplicationName("RegenLab");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Gas-sensor regeneration bench controller");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption simulateOption("simulate", "Run against the simulated bench (default).");
    QCommandLineOption replayOption("replay", "Replay a recorded bench line stream.", "file");
    QCommandLineOption configOption("config", "Read parameters from an INI file.", "ini");
    QCommandLineOption logOption("log", "Session log file.", "file");
    QCommandLineOption tickOption("tick", "Poll interval in milliseconds.", "ms");
    QCommandLineOption protocolOption("protocol", "Protocol to run: co2, resistance or full.", "kind");
    QCommandLineOption autoOption("auto", "Run automatic regeneration cycles.");
    QCommandLineOption durationOption("duration", "Stop after this many seconds.", "s");
    QCommandLineOption verboseOption("verbose", "Log per-tick debug output.");
    parser.addOptions({simulateOption, replayOption, configOption, logOption, tickOption,
                       protocolOption, autoOption, durationOption, verboseOption});
    parser.process(app);

    std::unique_ptr<Settings> settings;
    if (parser.isSet(configOption)) {
        settings.reset(new Settings(parser.value(configOption)));
    } else {
        settings.reset(new Settings());
    }

    QString logPath = parser.isSet(logOption) ? parser.value(logOption) : settings->logFilePath();
    Logger::setVerbose(parser.isSet(verboseOption));
    if (!Logger::init(logPath)) {
        qWarning() << "Logging to console only";
    }
    qInfo() << "RegenLab" << app.applicationVersion() << "parameters from" << settings->fileName();

    int tickInterval = settings->tickInterval();
    if (parser.isSet(tickOption)) {
        bool ok = false;
        int value = parser.value(tickOption).toInt(&ok);
        if (!ok || value <= 0) {
            qCritical() << "Invalid --tick value" << parser.value(tickOption);
            return 2;
        }
        tickInterval = value;
    }

    bool hasProtocol = parser.isSet(protocolOption);
    Regen::ProtocolKind protocolKind = Regen::ProtocolKind::Co2Regeneration;
    if (hasProtocol && !parseProtocolKind(parser.value(protocolOption), protocolKind)) {
        qCritical() << "Unknown protocol" << parser.value(protocolOption);
        return 2;
    }

    double duration = 0;
    if (parser.isSet(durationOption)) {
        bool ok = false;
        duration = parser.value(durationOption).toDouble(&ok);
        if (!ok || duration <= 0) {
            qCritical() << "Invalid --duration value" << parser.value(durationOption);
            return 2;
        }
    }

    SystemClock clock;

    // Devices: simulated bench, or a recorded stream with no heater/multimeter
    std::unique_ptr<BenchSimulator> bench;
    std::unique_ptr<SimulatedMultimeter> simMultimeter;
    std::unique_ptr<SimulatedGasAnalyser> simGas;
    std::unique_ptr<SimulatedHeaterBoard> simHeater;
    std::unique_ptr<SimulatedValve> simValve;
    std::unique_ptr<QFile> replayFile;
    std::unique_ptr<BenchLink> benchLink;
    NullResistanceSensor nullResistance;
    NullThermalActuator nullHeater;

    EngineDevices devices;
    if (parser.isSet(replayOption)) {
        replayFile.reset(new QFile(parser.value(replayOption)));
        if (!replayFile->open(QIODevice::ReadOnly | QIODevice::Text)) {
            qCritical() << "Cannot open replay file" << replayFile->fileName()
                        << replayFile->errorString();
            return 1;
        }
        benchLink.reset(new BenchLink(replayFile.get()));
        devices.resistance = &nullResistance;
        devices.gas = benchLink.get();
        devices.heater = &nullHeater;
        devices.valve = benchLink.get();
        devices.pins = benchLink.get();
        qInfo() << "Replaying" << replayFile->fileName();
    } else {
        bench.reset(new BenchSimulator(&clock));
        simMultimeter.reset(new SimulatedMultimeter(bench.get()));
        simGas.reset(new SimulatedGasAnalyser(bench.get(), &clock));
        simHeater.reset(new SimulatedHeaterBoard(bench.get()));
        simValve.reset(new SimulatedValve(bench.get()));
        devices.resistance = simMultimeter.get();
        devices.gas = simGas.get();
        devices.heater = simHeater.get();
        devices.valve = simValve.get();
        devices.pins = simValve.get();
        qInfo() << "Running against the simulated bench";
    }

    RegenerationEngine engine(&clock, devices, settings->parameters());

    // A recorded log accepts no commands
    if (bench) {
        if (!engine.initializeBench()) {
            qWarning() << "Bench did not accept the init command";
        }
        bench->startExposure(SIMULATED_EXPOSURE);
    }

    QObject::connect(settings.get(), &Settings::parametersChanged, &engine, [&]() {
        engine.setParameters(settings->parameters());
    });

    int lastStep = -1;
    QObject::connect(&engine, &RegenerationEngine::protocolStatusChanged,
                     [&lastStep](Regen::ProtocolKind kind, const ProtocolStatus& status) {
        if (status.step == lastStep) return;
        lastStep = status.step;
        qInfo().noquote() << QString("[%1] step %2 (%3%): %4")
                                 .arg(Regen::protocolKindToString(kind))
                                 .arg(status.step)
                                 .arg(status.progress, 0, 'f', 0)
                                 .arg(status.message);
    });

    QObject::connect(&engine, &RegenerationEngine::detectionChanged, [&engine]() {
        const DetectionState& s = engine.detectionState();
        qInfo() << "Detection: increase" << s.increaseDetected << "stabilized" << s.stabilized
                << "max slope" << s.maxSlope << "µS/s";
    });

    QObject::connect(&engine, &RegenerationEngine::pinStatesChanged, [&engine]() {
        PinStates p = engine.pinStates();
        qInfo() << "Pins: retracted" << p.retracted << "extended" << p.extended
                << "open" << p.open << "closed" << p.closed;
    });

    bool stopWhenDone = hasProtocol && !parser.isSet(autoOption) && duration <= 0;
    int exitCode = 0;

    QObject::connect(&engine, &RegenerationEngine::protocolFinished,
                     [&](Regen::ProtocolKind kind, const ProtocolResults& results) {
        qInfo().noquote() << QString("%1 protocol finished: delta %2 ppm, mass %3 µg")
                                 .arg(Regen::protocolKindToString(kind))
                                 .arg(results.deltaConcentration, 0, 'f', 1)
                                 .arg(results.estimatedMass, 0, 'f', 2);
        if (results.hasPercolationTime()) {
            qInfo() << "Percolation time" << results.percolationTime << "s";
        }
        if (stopWhenDone) {
            QTimer::singleShot(0, &app, &QCoreApplication::quit);
        }
    });

    QObject::connect(&engine, &RegenerationEngine::protocolFailed,
                     [&](Regen::ProtocolKind kind, const QString& error) {
        qCritical() << Regen::protocolKindToString(kind) << "protocol failed:" << error;
        exitCode = 1;
        if (stopWhenDone) {
            QTimer::singleShot(0, &app, &QCoreApplication::quit);
        }
    });

    AutomaticModeController* automatic = engine.automaticMode();
    QObject::connect(automatic, &AutomaticModeController::phaseChanged,
                     [](AutomaticModeController::Phase phase) {
        qInfo() << "Automatic mode:" << AutomaticModeController::phaseToString(phase);
    });
    QObject::connect(automatic, &AutomaticModeController::cycleAborted, [](const QString& reason) {
        qWarning() << "Automatic cycle aborted:" << reason;
    });
    QObject::connect(automatic, &AutomaticModeController::cycleCompleted, [&bench](int cycle) {
        qInfo() << "Automatic cycle" << cycle << "completed";
        if (bench) {
            bench->startExposure(SIMULATED_EXPOSURE);
        }
    });

    std::signal(SIGINT, handleStopSignal);
    std::signal(SIGTERM, handleStopSignal);

    QTimer tickTimer;
    tickTimer.setInterval(tickInterval);
    QObject::connect(&tickTimer, &QTimer::timeout, [&]() {
        if (g_stopRequested) {
            tickTimer.stop();
            app.quit();
            return;
        }
        engine.tick();
    });

    QObject::connect(settings.get(), &Settings::tickIntervalChanged, [&]() {
        tickTimer.setInterval(settings->tickInterval());
    });

    // Heater low and channels stopped whatever ends the session
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        engine.shutdown();
        Logger::shutdown();
    });

    engine.startAllChannels();
    tickTimer.start();

    if (parser.isSet(autoOption)) {
        engine.setAutoMode(true);
    }

    if (hasProtocol) {
        // A few ticks of data first: the CO2 protocol needs a gas sample
        QTimer::singleShot(2000, &app, [&]() {
            if (!engine.startProtocol(protocolKind)) {
                qCritical() << "Could not start" << Regen::protocolKindToString(protocolKind) << "protocol";
                exitCode = 1;
                if (stopWhenDone) {
                    app.quit();
                }
            }
        });
    }

    if (duration > 0) {
        QTimer::singleShot(static_cast<int>(duration * 1000), &app, &QCoreApplication::quit);
    }

    int rc = app.exec();
    return rc != 0 ? rc : exitCode;
}
