#pragma once

#include <QObject>
#include <QIODevice>
#include <QPointer>

#include "gassensor.h"
#include "positionsensor.h"
#include "mechanicalactuator.h"

// Adapts the bench controller's line stream (serial port, recorded log)
// into the gas, pin and valve capabilities. Does not own the device.
class BenchLink : public QObject, public GasSensor, public PositionSensor, public MechanicalActuator {
    Q_OBJECT

public:
    explicit BenchLink(QIODevice* device, QObject* parent = nullptr);

    // GasSensor: consumes lines until one gas sample is found or input runs dry
    bool readGas(GasReading& reading) override;

    // PositionSensor: consumes lines up to the next gas sample, which is
    // held for the following readGas()
    bool readPins(PinStates& pins) override;

    // MechanicalActuator
    bool open() override;
    bool close() override;
    bool initialize() override;

    bool isAvailable() const override;
    QString name() const override { return "bench"; }

    int malformedLineCount() const { return m_malformedLines; }

signals:
    void errorOccurred(const QString& error);

private:
    bool sendCommand(const QByteArray& command);
    // True when the line was a valid gas sample
    bool handleLine(const QByteArray& raw, GasReading& reading);
    void handlePinLine(const QString& line);

    QPointer<QIODevice> m_device;
    PinStates m_pins;
    bool m_pinsFresh = false;
    GasReading m_heldGas;
    bool m_hasHeldGas = false;
    int m_malformedLines = 0;
};
