#include <QtTest>

#include "protocol/fullprotocol.h"
#include "protocolfixture.h"

using Outcome = RegenerationProtocol::Outcome;
using Step = FullProtocol::Step;
using Milestone = EventTimeline::Milestone;

class tst_FullProtocol : public QObject {
    Q_OBJECT

private slots:
    void startClosesValve();
    void heatingTimesOutAtWindow();
    void conductanceCollapseEndsHeating();
    void completesWithResults();
    void stabilityTimesOutAtWindow();
    void restabilizationTimesOutAtWindow();
    void restabilizationReferencedToPeak();
    void valveRetriedOnce();
    void valveFailingTwiceAborts();
    void noGasAborts();
    void cancelForcesLow();

private:
    // Ticks once per second with 400 ppm (420 ppm from 130 s) and a steady
    // 10 µS element, stopping at `to` or when the run ends
    Outcome run(FullProtocol& p, ProtocolFixture& f, int from, int to, int& endTime,
                bool feedGas = true);
    // One tick at t with the given gas and conductance samples
    Outcome step(FullProtocol& p, ProtocolFixture& f, int t, double ppm, double microsiemens);
};

Outcome tst_FullProtocol::step(FullProtocol& p, ProtocolFixture& f, int t, double ppm,
                               double microsiemens)
{
    f.gas(t, ppm);
    f.conductance(t, microsiemens);
    return p.tick(f.context(t));
}

Outcome tst_FullProtocol::run(FullProtocol& p, ProtocolFixture& f, int from, int to, int& endTime,
                              bool feedGas)
{
    Outcome outcome = Outcome::Running;
    for (int t = from; t <= to; ++t) {
        if (feedGas) f.gas(t, t < 130 ? 400 : 420);
        f.conductance(t, 10.0);
        outcome = p.tick(f.context(t));
        endTime = t;
        if (outcome != Outcome::Running) break;
    }
    return outcome;
}

void tst_FullProtocol::startClosesValve()
{
    ProtocolFixture f;
    FullProtocol p;
    QVERIFY(p.start(f.context(0)));
    QVERIFY(p.step() == Step::ClosingValve);
    QCOMPARE(f.valve.actions, QStringList({"close"}));
    QVERIFY(!f.valve.isOpen);

    int end = 0;
    run(p, f, 1, 3, end);
    QVERIFY(p.step() == Step::ClosingValve);
    run(p, f, 4, 4, end);
    QVERIFY(p.step() == Step::GasStability);
    QVERIFY(f.timeline.has(Milestone::StabilityStarted));
}

void tst_FullProtocol::heatingTimesOutAtWindow()
{
    ProtocolFixture f;
    FullProtocol p;
    QVERIFY(p.start(f.context(0)));

    // Valve settles at 4 s, tracker seeds at 5 s, stable at 125 s
    int end = 0;
    run(p, f, 1, 125, end);
    QVERIFY(p.step() == Step::Heating);
    QCOMPARE(f.timeline.time(Milestone::HeatingStarted), 125.0);
    QCOMPARE(f.board.commands, QVector<double>({700}));

    run(p, f, 126, 304, end);
    QVERIFY(p.step() == Step::Heating);
    QVERIFY(!p.heatingTimedOut());

    run(p, f, 305, 305, end);
    QVERIFY(p.step() == Step::Cooling);
    QVERIFY(p.heatingTimedOut());
    QCOMPARE(f.board.commands.last(), 0.0);
    QCOMPARE(f.timeline.time(Milestone::HeatingStopped), 305.0);
}

void tst_FullProtocol::conductanceCollapseEndsHeating()
{
    ProtocolFixture f;
    FullProtocol p;
    QVERIFY(p.start(f.context(0)));

    int end = 0;
    run(p, f, 1, 150, end);
    QVERIFY(p.step() == Step::Heating);

    f.gas(151, 420);
    f.conductance(151, 0.6);
    QVERIFY(p.tick(f.context(151)) == Outcome::Running);
    QVERIFY(p.step() == Step::Cooling);
    QVERIFY(!p.heatingTimedOut());
    QCOMPARE(f.board.commands, QVector<double>({700, 0}));
}

void tst_FullProtocol::completesWithResults()
{
    ProtocolFixture f;
    FullProtocol p;
    QVERIFY(p.start(f.context(0)));

    int end = 0;
    Outcome outcome = run(p, f, 1, 1000, end);

    QVERIFY(outcome == Outcome::Finished);
    // Heating ends 305, cooling 310, tracker seeds 311, stable 431
    QCOMPARE(end, 431);
    QVERIFY(!p.isActive());
    QCOMPARE(p.status().step, 6);
    QCOMPARE(p.status().progress, 100.0);
    QCOMPARE(p.results().deltaConcentration, 20.0);
    QVERIFY(qAbs(p.results().estimatedMass - 9.4531) < 1e-3);
    QVERIFY(!p.stabilityTimedOut());
    QVERIFY(!p.restabilizationTimedOut());

    // The valve stays closed at the end of the run
    QCOMPARE(f.valve.actions, QStringList({"close"}));
    QCOMPARE(f.board.commands, QVector<double>({700, 0}));
}

void tst_FullProtocol::stabilityTimesOutAtWindow()
{
    ProtocolFixture f;
    FullProtocol p;
    QVERIFY(p.start(f.context(0)));

    // Every sample is 30 ppm from the previous one, so the tracker never
    // holds; the window opens when the valve has settled at 4 s
    for (int t = 1; t <= 183; ++t) {
        QVERIFY(step(p, f, t, t % 2 == 0 ? 400 : 370, 10.0) == Outcome::Running);
    }
    QVERIFY(p.step() == Step::GasStability);
    QVERIFY(!p.stabilityTimedOut());

    QVERIFY(step(p, f, 184, 400, 10.0) == Outcome::Running);
    QVERIFY(p.step() == Step::Heating);
    QVERIFY(p.stabilityTimedOut());
    QCOMPARE(f.timeline.time(Milestone::StabilityAchieved), 184.0);
    QCOMPARE(f.timeline.time(Milestone::HeatingStarted), 184.0);
    QCOMPARE(f.board.commands, QVector<double>({700}));

    // Collapse ends heating at 185, cooling 190, tracker seeds 191, stable 311
    Outcome outcome = Outcome::Running;
    int t = 185;
    for (; t <= 1000; ++t) {
        outcome = step(p, f, t, 420, 0.5);
        if (outcome != Outcome::Running) break;
    }
    QVERIFY(outcome == Outcome::Finished);
    QCOMPARE(t, 311);
    // Baseline is the last reference the tracker held
    QCOMPARE(p.results().deltaConcentration, 20.0);
    QVERIFY(!p.restabilizationTimedOut());
}

void tst_FullProtocol::restabilizationTimesOutAtWindow()
{
    ProtocolFixture f;
    FullProtocol p;
    QVERIFY(p.start(f.context(0)));

    for (int t = 1; t <= 149; ++t) {
        step(p, f, t, 400, 10.0);
    }
    QVERIFY(p.step() == Step::Heating);
    step(p, f, 150, 400, 0.5);
    QVERIFY(p.step() == Step::Cooling);

    // Restabilization watch opens at 155; gas keeps swinging by 30 ppm
    for (int t = 151; t <= 454; ++t) {
        QVERIFY(step(p, f, t, t % 2 == 0 ? 420 : 450, 0.5) == Outcome::Running);
    }
    QVERIFY(p.step() == Step::Restabilization);
    QVERIFY(!p.restabilizationTimedOut());

    QVERIFY(step(p, f, 455, 450, 0.5) == Outcome::Finished);
    QVERIFY(p.restabilizationTimedOut());
    QVERIFY(!p.stabilityTimedOut());
    QCOMPARE(f.timeline.time(Milestone::Restabilized), 455.0);
    // Final value is the tracker reference at the deadline
    QCOMPARE(p.results().deltaConcentration, 50.0);
    QVERIFY(p.status().hasResults);
}

void tst_FullProtocol::restabilizationReferencedToPeak()
{
    ProtocolFixture f;
    FullProtocol p;
    QVERIFY(p.start(f.context(0)));

    // Stable at 400 until heating starts at 125, release peaks at 440 (139),
    // confirmed at 141 on 436, then settles at 430
    for (int t = 1; t <= 149; ++t) {
        double ppm = 400;
        if (t >= 130 && t <= 139) ppm = 400 + 4 * (t - 129);
        else if (t == 140) ppm = 438;
        else if (t == 141) ppm = 436;
        else if (t >= 142) ppm = 430;
        QVERIFY(step(p, f, t, ppm, 10.0) == Outcome::Running);
    }
    QCOMPARE(f.timeline.time(Milestone::PeakReached), 139.0);

    // Heating ends 150, watch seeded with 436 at 155, held within tolerance
    Outcome outcome = Outcome::Running;
    int t = 150;
    for (; t <= 1000; ++t) {
        outcome = step(p, f, t, 430, 0.5);
        if (outcome != Outcome::Running) break;
    }
    QVERIFY(outcome == Outcome::Finished);
    QCOMPARE(t, 275);
    QCOMPARE(p.results().deltaConcentration, 36.0);
    QVERIFY(!p.restabilizationTimedOut());
}

void tst_FullProtocol::valveRetriedOnce()
{
    ProtocolFixture f;
    f.valve.failing = true;
    FullProtocol p;
    QVERIFY(p.start(f.context(0)));
    QVERIFY(p.isActive());

    f.valve.failing = false;
    QVERIFY(p.tick(f.context(1)) == Outcome::Running);
    QCOMPARE(f.valve.actions, QStringList({"close", "close"}));

    int end = 0;
    run(p, f, 2, 4, end);
    QVERIFY(p.step() == Step::ClosingValve);
    run(p, f, 5, 5, end);
    QVERIFY(p.step() == Step::GasStability);
}

void tst_FullProtocol::valveFailingTwiceAborts()
{
    ProtocolFixture f;
    f.valve.failing = true;
    FullProtocol p;
    QVERIFY(p.start(f.context(0)));

    QVERIFY(p.tick(f.context(1)) == Outcome::Failed);
    QVERIFY(!p.isActive());
    QVERIFY(p.errorString().contains("twice"));
    QCOMPARE(f.board.commands, QVector<double>({0}));
}

void tst_FullProtocol::noGasAborts()
{
    ProtocolFixture f;
    FullProtocol p;
    QVERIFY(p.start(f.context(0)));

    int end = 0;
    Outcome outcome = run(p, f, 1, 400, end, false);
    QVERIFY(outcome == Outcome::Failed);
    QCOMPARE(end, 184);
    QVERIFY(f.board.commands.contains(0.0));
    QVERIFY(!f.board.commands.contains(700.0));
}

void tst_FullProtocol::cancelForcesLow()
{
    ProtocolFixture f;
    FullProtocol p;
    QVERIFY(p.start(f.context(0)));
    int end = 0;
    run(p, f, 1, 200, end);
    QVERIFY(p.step() == Step::Heating);

    QVERIFY(p.cancel(f.context(201)));
    QVERIFY(p.step() == Step::Idle);
    QCOMPARE(f.board.commands, QVector<double>({700, 0}));
    QVERIFY(p.tick(f.context(202)) == Outcome::Idle);
}

QTEST_GUILESS_MAIN(tst_FullProtocol)
#include "tst_fullprotocol.moc"
