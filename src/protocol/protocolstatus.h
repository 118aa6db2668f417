#pragma once

#include <QString>
#include <QMetaType>

#include "../core/regenconstants.h"

struct ProtocolResults {
    double deltaConcentration = 0;   // ppm, final reference - initial reference
    double estimatedMass = 0;        // µg carbon
    double percolationTime = -1;     // s, first conductance onset; -1 when none

    bool hasPercolationTime() const { return percolationTime >= 0; }
};

// Progress report published once per tick while a protocol runs
struct ProtocolStatus {
    bool active = false;
    int step = 0;
    QString message;
    double progress = 0;             // 0..100, never decreases within a run
    bool hasResults = false;
    ProtocolResults results;
};

// Carbon released by the element, from the CO2 rise in the closed cell:
//     mass = delta * cellVolume / molarVolume * M(C)
inline ProtocolResults computeResults(double initialReference, double finalReference,
                                      double cellVolume, double percolationTime)
{
    ProtocolResults r;
    r.deltaConcentration = finalReference - initialReference;
    r.estimatedMass = r.deltaConcentration * cellVolume / Regen::MOLAR_VOLUME * Regen::CARBON_MOLAR_MASS;
    r.percolationTime = percolationTime;
    return r;
}

Q_DECLARE_METATYPE(ProtocolResults)
Q_DECLARE_METATYPE(ProtocolStatus)
