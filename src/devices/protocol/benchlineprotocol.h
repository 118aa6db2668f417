#pragma once

#include <QByteArray>
#include <QString>

#include "../gassensor.h"
#include "../positionsensor.h"

// Line protocol spoken by the bench controller (gas analyser, jack, trap).
// One ASCII line per message, newline terminated.
namespace Bench {

// Outgoing commands
const QByteArray CMD_OPEN("ouvrir\n");
const QByteArray CMD_CLOSE("fermer\n");
const QByteArray CMD_INIT("init\n");

// Incoming messages
//   "@<co2> <temperature> <humidity>"            gas sample
//   "VR:<HIGH|LOW> VS:<..> TO:<..> TF:<..>"      pin states
const QChar GAS_PREFIX('@');
const QString PIN_RETRACTED("VR:");  // jack retracted
const QString PIN_EXTENDED("VS:");   // jack extended
const QString PIN_OPEN("TO:");       // trap open
const QString PIN_CLOSED("TF:");     // trap closed
const QString PIN_HIGH("HIGH");

enum class LineKind {
    Empty,
    Gas,
    Pins,
    Malformed
};

LineKind classify(const QString& line);

// Both return false and leave the output untouched on malformed input
bool parseGasLine(const QString& line, GasReading& reading);
bool parsePinLine(const QString& line, PinStates& pins);

QString formatGasLine(const GasReading& reading);
QString formatPinLine(const PinStates& pins);

} // namespace Bench
