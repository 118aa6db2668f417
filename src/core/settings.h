#pragma once

#include <QObject>
#include <QSettings>
#include <QString>

#include "engineparameters.h"

class Settings : public QObject {
    Q_OBJECT

    // Conductance detection
    Q_PROPERTY(double stabilityDuration READ stabilityDuration WRITE setStabilityDuration NOTIFY parametersChanged)
    Q_PROPERTY(double increaseSlopeMin READ increaseSlopeMin WRITE setIncreaseSlopeMin NOTIFY parametersChanged)
    Q_PROPERTY(double increaseSlopeMax READ increaseSlopeMax WRITE setIncreaseSlopeMax NOTIFY parametersChanged)
    Q_PROPERTY(double slidingWindow READ slidingWindow WRITE setSlidingWindow NOTIFY parametersChanged)
    Q_PROPERTY(double postTreatmentThreshold READ postTreatmentThreshold WRITE setPostTreatmentThreshold NOTIFY parametersChanged)

    // Heater
    Q_PROPERTY(double highSetpoint READ highSetpoint WRITE setHighSetpoint NOTIFY parametersChanged)
    Q_PROPERTY(double lowSetpoint READ lowSetpoint WRITE setLowSetpoint NOTIFY parametersChanged)
    Q_PROPERTY(double r0Threshold READ r0Threshold WRITE setR0Threshold NOTIFY parametersChanged)
    Q_PROPERTY(double valveDelay READ valveDelay WRITE setValveDelay NOTIFY parametersChanged)

    // Gas
    Q_PROPERTY(double gasStabilityThreshold READ gasStabilityThreshold WRITE setGasStabilityThreshold NOTIFY parametersChanged)
    Q_PROPERTY(double gasStabilityDuration READ gasStabilityDuration WRITE setGasStabilityDuration NOTIFY parametersChanged)
    Q_PROPERTY(double gasIncreaseThreshold READ gasIncreaseThreshold WRITE setGasIncreaseThreshold NOTIFY parametersChanged)

    // Protocols
    Q_PROPERTY(double regenerationDuration READ regenerationDuration WRITE setRegenerationDuration NOTIFY parametersChanged)
    Q_PROPERTY(double cellVolume READ cellVolume WRITE setCellVolume NOTIFY parametersChanged)
    Q_PROPERTY(double highResistanceThreshold READ highResistanceThreshold WRITE setHighResistanceThreshold NOTIFY parametersChanged)
    Q_PROPERTY(double regenerationCompleteConductance READ regenerationCompleteConductance WRITE setRegenerationCompleteConductance NOTIFY parametersChanged)

    // Engine
    Q_PROPERTY(int tickInterval READ tickInterval WRITE setTickInterval NOTIFY tickIntervalChanged)
    Q_PROPERTY(QString logFilePath READ logFilePath WRITE setLogFilePath NOTIFY logFilePathChanged)

public:
    explicit Settings(QObject* parent = nullptr);
    // Explicit INI file instead of the user's native store
    explicit Settings(const QString& iniPath, QObject* parent = nullptr);

    // Conductance detection
    double stabilityDuration() const;
    void setStabilityDuration(double seconds);

    double increaseSlopeMin() const;
    void setIncreaseSlopeMin(double slope);

    double increaseSlopeMax() const;
    void setIncreaseSlopeMax(double slope);

    double decreaseSlopeThreshold() const;
    void setDecreaseSlopeThreshold(double slope);

    double slidingWindow() const;
    void setSlidingWindow(double seconds);

    int increaseWindowSamples() const;
    void setIncreaseWindowSamples(int samples);

    double postTreatmentThreshold() const;
    void setPostTreatmentThreshold(double microsiemens);

    // Heater and reference resistance
    double highSetpoint() const;
    void setHighSetpoint(double celsius);

    double lowSetpoint() const;
    void setLowSetpoint(double celsius);

    double r0Threshold() const;
    void setR0Threshold(double value);

    double valveDelay() const;
    void setValveDelay(double seconds);

    // Gas tracking
    double gasStabilityThreshold() const;
    void setGasStabilityThreshold(double ppm);

    double gasStabilityDuration() const;
    void setGasStabilityDuration(double seconds);

    double gasIncreaseThreshold() const;
    void setGasIncreaseThreshold(double ppm);

    double gasPeakDrop() const;
    void setGasPeakDrop(double ppm);

    double gasPeakSlope() const;
    void setGasPeakSlope(double slope);

    // CO2 protocol
    double regenerationDuration() const;
    void setRegenerationDuration(double seconds);

    double cellVolume() const;
    void setCellVolume(double litres);

    // Resistance and full protocol
    double highResistanceThreshold() const;
    void setHighResistanceThreshold(double ohms);

    double regenerationCompleteConductance() const;
    void setRegenerationCompleteConductance(double microsiemens);

    double fullStabilityTimeout() const;
    void setFullStabilityTimeout(double seconds);

    double fullHeatingTimeout() const;
    void setFullHeatingTimeout(double seconds);

    double fullCooldownDelay() const;
    void setFullCooldownDelay(double seconds);

    double fullRestabilizationTimeout() const;
    void setFullRestabilizationTimeout(double seconds);

    // Automatic mode
    double autoGasStabilityTimeout() const;
    void setAutoGasStabilityTimeout(double seconds);

    double autoRegenerationTimeout() const;
    void setAutoRegenerationTimeout(double seconds);

    // Engine
    int tickInterval() const;
    void setTickInterval(int ms);

    QString logFilePath() const;
    void setLogFilePath(const QString& path);

    // Everything above as one value, for the engine
    EngineParameters parameters() const;

    QString fileName() const { return m_settings.fileName(); }
    void sync() { m_settings.sync(); }

signals:
    void parametersChanged();
    void tickIntervalChanged();
    void logFilePathChanged();

private:
    double doubleValue(const QString& key, double defaultValue) const;
    void setDoubleValue(const QString& key, double value);

    QSettings m_settings;
};
