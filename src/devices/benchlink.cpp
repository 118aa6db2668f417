#include "benchlink.h"
#include "protocol/benchlineprotocol.h"
#include <QDebug>

BenchLink::BenchLink(QIODevice* device, QObject* parent)
    : QObject(parent)
    , m_device(device)
{
}

bool BenchLink::isAvailable() const
{
    return m_device && m_device->isOpen();
}

bool BenchLink::readGas(GasReading& reading)
{
    if (!isAvailable()) return false;

    if (m_hasHeldGas) {
        reading = m_heldGas;
        m_hasHeldGas = false;
        return true;
    }
    while (m_device->canReadLine()) {
        if (handleLine(m_device->readLine(), reading)) {
            return true;
        }
    }
    return false;
}

bool BenchLink::handleLine(const QByteArray& raw, GasReading& reading)
{
    QString line = QString::fromUtf8(raw).trimmed();

    switch (Bench::classify(line)) {
        case Bench::LineKind::Empty:
            break;
        case Bench::LineKind::Pins:
            handlePinLine(line);
            break;
        case Bench::LineKind::Gas:
            if (Bench::parseGasLine(line, reading)) {
                return true;
            }
            ++m_malformedLines;
            qWarning() << "[Bench] Malformed gas line dropped:" << line;
            break;
        case Bench::LineKind::Malformed:
            ++m_malformedLines;
            qWarning() << "[Bench] Unrecognised line dropped:" << line;
            break;
    }
    return false;
}

void BenchLink::handlePinLine(const QString& line)
{
    PinStates pins;
    if (!Bench::parsePinLine(line, pins)) {
        ++m_malformedLines;
        qWarning() << "[Bench] Malformed pin line dropped:" << line;
        return;
    }
    m_pins = pins;
    m_pinsFresh = true;
    qDebug() << "[Bench] Pins: VR=" << pins.retracted << "VS=" << pins.extended
             << "TO=" << pins.open << "TF=" << pins.closed;
}

bool BenchLink::readPins(PinStates& pins)
{
    if (isAvailable()) {
        GasReading reading;
        while (m_device->canReadLine()) {
            if (handleLine(m_device->readLine(), reading)) {
                // Only the newest sample is kept while nobody reads gas
                if (m_hasHeldGas) {
                    qDebug() << "[Bench] Unread gas sample" << m_heldGas.concentration << "ppm replaced";
                }
                m_heldGas = reading;
                m_hasHeldGas = true;
                break;
            }
        }
    }

    if (!m_pinsFresh) return false;
    pins = m_pins;
    m_pinsFresh = false;
    return true;
}

bool BenchLink::sendCommand(const QByteArray& command)
{
    if (!isAvailable()) {
        qWarning() << "[Bench] Controller not available, cannot send" << command.trimmed();
        return false;
    }
    qint64 written = m_device->write(command);
    if (written != command.size()) {
        QString error = QString("Write of '%1' failed: %2")
                            .arg(QString::fromLatin1(command.trimmed()), m_device->errorString());
        qWarning() << "[Bench]" << error;
        emit errorOccurred(error);
        return false;
    }
    qDebug() << "[Bench] Sent" << command.trimmed();
    return true;
}

bool BenchLink::open()
{
    return sendCommand(Bench::CMD_OPEN);
}

bool BenchLink::close()
{
    return sendCommand(Bench::CMD_CLOSE);
}

bool BenchLink::initialize()
{
    return sendCommand(Bench::CMD_INIT);
}
