#pragma once

#include "models/measurementstore.h"
#include "models/eventtimeline.h"
#include "machine/heatercontrol.h"
#include "detection/conductancedetector.h"
#include "protocol/regenerationprotocol.h"
#include "fakedevices.h"

// The pieces the engine normally wires into a ProtocolContext, with fake
// hardware underneath. Series times are the same as clock time here.
struct ProtocolFixture {
    MeasurementStore store;
    EventTimeline timeline;
    FakeThermalActuator board;
    HeaterControl heater{&board};
    FakeMechanicalActuator valve;
    ConductanceDetector detector;
    bool resistanceAvailable = true;

    ProtocolContext context(double now) {
        ProtocolContext ctx;
        ctx.now = now;
        ctx.gasTime = now;
        ctx.store = &store;
        ctx.timeline = &timeline;
        ctx.heater = &heater;
        ctx.valve = &valve;
        ctx.conductance = &detector;
        ctx.resistanceAvailable = resistanceAvailable;
        return ctx;
    }

    void gas(double t, double ppm) { store.append(Series::GasConcentration, t, ppm); }
    void conductance(double t, double microsiemens) {
        store.append(Series::Conductance, t, microsiemens);
        store.append(Series::Resistance, t, 1.0e6 / microsiemens);
    }
    void resistance(double t, double ohms) {
        store.append(Series::Resistance, t, ohms);
        store.append(Series::Conductance, t, 1.0e6 / ohms);
    }
};
