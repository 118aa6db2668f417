#include "settings.h"
#include <QStandardPaths>
#include <QDebug>
#include <QtMath>

Settings::Settings(QObject* parent)
    : QObject(parent)
    , m_settings("RegenLab", "RegenLab")
{
}

Settings::Settings(const QString& iniPath, QObject* parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
}

double Settings::doubleValue(const QString& key, double defaultValue) const {
    bool ok = false;
    double value = m_settings.value(key, defaultValue).toDouble(&ok);
    if (!ok || !qIsFinite(value)) {
        qWarning() << "Settings: invalid value for" << key << "- using default" << defaultValue;
        return defaultValue;
    }
    return value;
}

void Settings::setDoubleValue(const QString& key, double value) {
    if (!m_settings.contains(key) || m_settings.value(key).toDouble() != value) {
        m_settings.setValue(key, value);
        emit parametersChanged();
    }
}

// Conductance detection
double Settings::stabilityDuration() const {
    return doubleValue("detection/stabilityDuration", Regen::STABILITY_DURATION);
}

void Settings::setStabilityDuration(double seconds) {
    setDoubleValue("detection/stabilityDuration", seconds);
}

double Settings::increaseSlopeMin() const {
    return doubleValue("detection/increaseSlopeMin", Regen::INCREASE_SLOPE_MIN);
}

void Settings::setIncreaseSlopeMin(double slope) {
    setDoubleValue("detection/increaseSlopeMin", slope);
}

double Settings::increaseSlopeMax() const {
    return doubleValue("detection/increaseSlopeMax", Regen::INCREASE_SLOPE_MAX);
}

void Settings::setIncreaseSlopeMax(double slope) {
    setDoubleValue("detection/increaseSlopeMax", slope);
}

double Settings::decreaseSlopeThreshold() const {
    return doubleValue("detection/decreaseSlopeThreshold", Regen::DECREASE_SLOPE_THRESHOLD);
}

void Settings::setDecreaseSlopeThreshold(double slope) {
    setDoubleValue("detection/decreaseSlopeThreshold", slope);
}

double Settings::slidingWindow() const {
    return doubleValue("detection/slidingWindow", Regen::SLIDING_WINDOW);
}

void Settings::setSlidingWindow(double seconds) {
    setDoubleValue("detection/slidingWindow", seconds);
}

int Settings::increaseWindowSamples() const {
    // Least-squares needs a real window; anything under 10 samples is noise
    return qMax(Regen::INCREASE_WINDOW_SAMPLES,
                m_settings.value("detection/increaseWindowSamples", Regen::INCREASE_WINDOW_SAMPLES).toInt());
}

void Settings::setIncreaseWindowSamples(int samples) {
    if (increaseWindowSamples() != samples) {
        m_settings.setValue("detection/increaseWindowSamples", samples);
        emit parametersChanged();
    }
}

double Settings::postTreatmentThreshold() const {
    return doubleValue("detection/postTreatmentThreshold", Regen::POST_TREATMENT_THRESHOLD);
}

void Settings::setPostTreatmentThreshold(double microsiemens) {
    setDoubleValue("detection/postTreatmentThreshold", microsiemens);
}

// Heater and reference resistance
double Settings::highSetpoint() const {
    return doubleValue("heater/highSetpoint", Regen::REGENERATION_TEMP);
}

void Settings::setHighSetpoint(double celsius) {
    setDoubleValue("heater/highSetpoint", celsius);
}

double Settings::lowSetpoint() const {
    return doubleValue("heater/lowSetpoint", Regen::TCONS_LOW);
}

void Settings::setLowSetpoint(double celsius) {
    setDoubleValue("heater/lowSetpoint", celsius);
}

double Settings::r0Threshold() const {
    return doubleValue("heater/r0Threshold", Regen::R0_THRESHOLD);
}

void Settings::setR0Threshold(double value) {
    setDoubleValue("heater/r0Threshold", value);
}

double Settings::valveDelay() const {
    return doubleValue("protocol/valveDelay", Regen::VALVE_DELAY);
}

void Settings::setValveDelay(double seconds) {
    setDoubleValue("protocol/valveDelay", seconds);
}

// Gas tracking
double Settings::gasStabilityThreshold() const {
    return doubleValue("gas/stabilityThreshold", Regen::CO2_STABILITY_THRESHOLD);
}

void Settings::setGasStabilityThreshold(double ppm) {
    setDoubleValue("gas/stabilityThreshold", ppm);
}

double Settings::gasStabilityDuration() const {
    return doubleValue("gas/stabilityDuration", Regen::CO2_STABILITY_DURATION);
}

void Settings::setGasStabilityDuration(double seconds) {
    setDoubleValue("gas/stabilityDuration", seconds);
}

double Settings::gasIncreaseThreshold() const {
    return doubleValue("gas/increaseThreshold", Regen::CO2_INCREASE_THRESHOLD);
}

void Settings::setGasIncreaseThreshold(double ppm) {
    setDoubleValue("gas/increaseThreshold", ppm);
}

double Settings::gasPeakDrop() const {
    return doubleValue("gas/peakDrop", Regen::CO2_PEAK_DROP);
}

void Settings::setGasPeakDrop(double ppm) {
    setDoubleValue("gas/peakDrop", ppm);
}

double Settings::gasPeakSlope() const {
    return doubleValue("gas/peakSlope", Regen::CO2_PEAK_SLOPE);
}

void Settings::setGasPeakSlope(double slope) {
    setDoubleValue("gas/peakSlope", slope);
}

// CO2 protocol
double Settings::regenerationDuration() const {
    return doubleValue("protocol/regenerationDuration", Regen::REGENERATION_DURATION);
}

void Settings::setRegenerationDuration(double seconds) {
    setDoubleValue("protocol/regenerationDuration", seconds);
}

double Settings::cellVolume() const {
    return doubleValue("protocol/cellVolume", Regen::CELL_VOLUME);
}

void Settings::setCellVolume(double litres) {
    setDoubleValue("protocol/cellVolume", litres);
}

// Resistance and full protocol
double Settings::highResistanceThreshold() const {
    return doubleValue("protocol/highResistanceThreshold", Regen::HIGH_RESISTANCE_THRESHOLD);
}

void Settings::setHighResistanceThreshold(double ohms) {
    setDoubleValue("protocol/highResistanceThreshold", ohms);
}

double Settings::regenerationCompleteConductance() const {
    return doubleValue("protocol/regenerationCompleteConductance", Regen::REGENERATION_COMPLETE_CONDUCTANCE);
}

void Settings::setRegenerationCompleteConductance(double microsiemens) {
    setDoubleValue("protocol/regenerationCompleteConductance", microsiemens);
}

double Settings::fullStabilityTimeout() const {
    return doubleValue("protocol/fullStabilityTimeout", Regen::FULL_STABILITY_TIMEOUT);
}

void Settings::setFullStabilityTimeout(double seconds) {
    setDoubleValue("protocol/fullStabilityTimeout", seconds);
}

double Settings::fullHeatingTimeout() const {
    return doubleValue("protocol/fullHeatingTimeout", Regen::FULL_HEATING_TIMEOUT);
}

void Settings::setFullHeatingTimeout(double seconds) {
    setDoubleValue("protocol/fullHeatingTimeout", seconds);
}

double Settings::fullCooldownDelay() const {
    return doubleValue("protocol/fullCooldownDelay", Regen::FULL_COOLDOWN_DELAY);
}

void Settings::setFullCooldownDelay(double seconds) {
    setDoubleValue("protocol/fullCooldownDelay", seconds);
}

double Settings::fullRestabilizationTimeout() const {
    return doubleValue("protocol/fullRestabilizationTimeout", Regen::FULL_RESTABILIZATION_TIMEOUT);
}

void Settings::setFullRestabilizationTimeout(double seconds) {
    setDoubleValue("protocol/fullRestabilizationTimeout", seconds);
}

// Automatic mode
double Settings::autoGasStabilityTimeout() const {
    return doubleValue("auto/gasStabilityTimeout", Regen::AUTO_GAS_STABILITY_TIMEOUT);
}

void Settings::setAutoGasStabilityTimeout(double seconds) {
    setDoubleValue("auto/gasStabilityTimeout", seconds);
}

double Settings::autoRegenerationTimeout() const {
    return doubleValue("auto/regenerationTimeout", Regen::AUTO_REGENERATION_TIMEOUT);
}

void Settings::setAutoRegenerationTimeout(double seconds) {
    setDoubleValue("auto/regenerationTimeout", seconds);
}

// Engine
int Settings::tickInterval() const {
    int ms = m_settings.value("engine/tickInterval", Regen::TICK_INTERVAL_MS).toInt();
    return ms > 0 ? ms : Regen::TICK_INTERVAL_MS;
}

void Settings::setTickInterval(int ms) {
    if (tickInterval() != ms) {
        m_settings.setValue("engine/tickInterval", ms);
        emit tickIntervalChanged();
    }
}

QString Settings::logFilePath() const {
    QString defaultPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
                          + "/logs/regenlab.log";
    return m_settings.value("engine/logFile", defaultPath).toString();
}

void Settings::setLogFilePath(const QString& path) {
    if (logFilePath() != path) {
        m_settings.setValue("engine/logFile", path);
        emit logFilePathChanged();
    }
}

EngineParameters Settings::parameters() const {
    EngineParameters p;
    p.stabilityDuration = stabilityDuration();
    p.increaseSlopeMin = increaseSlopeMin();
    p.increaseSlopeMax = increaseSlopeMax();
    p.decreaseSlopeThreshold = decreaseSlopeThreshold();
    p.slidingWindow = slidingWindow();
    p.increaseWindowSamples = increaseWindowSamples();
    p.postTreatmentThreshold = postTreatmentThreshold();
    p.r0Threshold = r0Threshold();
    p.highSetpoint = highSetpoint();
    p.lowSetpoint = lowSetpoint();
    p.valveDelay = valveDelay();
    p.gasStabilityThreshold = gasStabilityThreshold();
    p.gasStabilityDuration = gasStabilityDuration();
    p.gasIncreaseThreshold = gasIncreaseThreshold();
    p.gasPeakDrop = gasPeakDrop();
    p.gasPeakSlope = gasPeakSlope();
    p.regenerationDuration = regenerationDuration();
    p.cellVolume = cellVolume();
    p.highResistanceThreshold = highResistanceThreshold();
    p.regenerationCompleteConductance = regenerationCompleteConductance();
    p.fullStabilityTimeout = fullStabilityTimeout();
    p.fullHeatingTimeout = fullHeatingTimeout();
    p.fullCooldownDelay = fullCooldownDelay();
    p.fullRestabilizationTimeout = fullRestabilizationTimeout();
    p.autoGasStabilityTimeout = autoGasStabilityTimeout();
    p.autoRegenerationTimeout = autoRegenerationTimeout();
    return p;
}
