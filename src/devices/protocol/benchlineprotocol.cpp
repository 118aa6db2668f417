#include "benchlineprotocol.h"
#include <QStringList>
#include <QtMath>

namespace Bench {

namespace {

// Value following a "XX:" tag, up to the next whitespace
bool pinValue(const QString& line, const QString& tag, bool& state)
{
    int pos = line.indexOf(tag);
    if (pos < 0) return false;

    QString rest = line.mid(pos + tag.size());
    QString token = rest.section(' ', 0, 0, QString::SectionSkipEmpty).trimmed();
    if (token.isEmpty()) return false;

    state = (token == PIN_HIGH);
    return true;
}

} // namespace

LineKind classify(const QString& line)
{
    QString trimmed = line.trimmed();
    if (trimmed.isEmpty()) return LineKind::Empty;
    if (trimmed.startsWith(GAS_PREFIX)) return LineKind::Gas;
    if (trimmed.contains(PIN_RETRACTED) && trimmed.contains(PIN_EXTENDED)
        && trimmed.contains(PIN_OPEN) && trimmed.contains(PIN_CLOSED)) {
        return LineKind::Pins;
    }
    return LineKind::Malformed;
}

bool parseGasLine(const QString& line, GasReading& reading)
{
    QString trimmed = line.trimmed();
    if (!trimmed.startsWith(GAS_PREFIX)) return false;

    QStringList fields = trimmed.mid(1).split(' ', Qt::SkipEmptyParts);
    if (fields.size() != 3) return false;

    bool okCo2 = false, okTemp = false, okHum = false;
    double co2 = fields[0].toDouble(&okCo2);
    double temperature = fields[1].toDouble(&okTemp);
    double humidity = fields[2].toDouble(&okHum);
    if (!okCo2 || !okTemp || !okHum) return false;
    if (!qIsFinite(co2) || !qIsFinite(temperature) || !qIsFinite(humidity)) return false;

    reading.concentration = co2;
    reading.temperature = temperature;
    reading.humidity = humidity;
    return true;
}

bool parsePinLine(const QString& line, PinStates& pins)
{
    PinStates parsed;
    if (!pinValue(line, PIN_RETRACTED, parsed.retracted)) return false;
    if (!pinValue(line, PIN_EXTENDED, parsed.extended)) return false;
    if (!pinValue(line, PIN_OPEN, parsed.open)) return false;
    if (!pinValue(line, PIN_CLOSED, parsed.closed)) return false;

    pins = parsed;
    return true;
}

QString formatGasLine(const GasReading& reading)
{
    return QString("@%1 %2 %3")
        .arg(reading.concentration, 0, 'f', 1)
        .arg(reading.temperature, 0, 'f', 2)
        .arg(reading.humidity, 0, 'f', 2);
}

QString formatPinLine(const PinStates& pins)
{
    auto level = [](bool high) { return high ? QStringLiteral("HIGH") : QStringLiteral("LOW"); };
    return QString("VR:%1 VS:%2 TO:%3 TF:%4")
        .arg(level(pins.retracted), level(pins.extended), level(pins.open), level(pins.closed));
}

} // namespace Bench
