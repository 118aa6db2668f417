#include <QtTest>

#include "protocol/co2regenerationprotocol.h"
#include "protocolfixture.h"

using Outcome = RegenerationProtocol::Outcome;
using Milestone = EventTimeline::Milestone;

namespace {

// Baseline 400 ppm, heating starts at 123 s; rises 15 ppm and stays there
double riseWithoutPeak(int t)
{
    if (t <= 123) return 400;
    if (t <= 130) return 400 + 15.0 * (t - 123) / 7.0;
    return 415;
}

// Release peak at 140 s (440 ppm), then settles at 425
double riseWithPeak(int t)
{
    if (t <= 123) return 400;
    if (t <= 140) return 400 + 40.0 * (t - 123) / 17.0;
    if (t <= 150) return 440 - 1.5 * (t - 140);
    return 425;
}

} // namespace

class tst_Co2Protocol : public QObject {
    Q_OBJECT

private slots:
    void startNeedsGasReading();
    void startTwiceIsRejected();
    void completesWithCarbonMass();
    void earlyRestabilizationCompletesWhenHeatingEnds();
    void cancelDuringHeatingSendsOneLowCommand();
    void heaterFailureAborts();

private:
    void primeGas(ProtocolFixture& f);
    void primeConductance(ProtocolFixture& f);
    Outcome run(Co2RegenerationProtocol& p, ProtocolFixture& f, double (*profile)(int),
                int from, int to, int& endTime, QVector<double>* progress = nullptr);
};

void tst_Co2Protocol::primeGas(ProtocolFixture& f)
{
    for (int t = 0; t <= 2; ++t) {
        f.gas(t, 400);
    }
}

void tst_Co2Protocol::primeConductance(ProtocolFixture& f)
{
    QVector<QPointF> s;
    for (int t = 0; t < 10; ++t) {
        s.append(QPointF(t, 5.0 + 0.3 * t));
        f.detector.update(s);
    }
}

Outcome tst_Co2Protocol::run(Co2RegenerationProtocol& p, ProtocolFixture& f, double (*profile)(int),
                             int from, int to, int& endTime, QVector<double>* progress)
{
    Outcome outcome = Outcome::Running;
    for (int t = from; t <= to; ++t) {
        f.gas(t, profile(t));
        outcome = p.tick(f.context(t));
        if (progress) progress->append(p.status().progress);
        endTime = t;
        if (outcome != Outcome::Running) break;
    }
    return outcome;
}

void tst_Co2Protocol::startNeedsGasReading()
{
    ProtocolFixture f;
    Co2RegenerationProtocol p;
    QVERIFY(!p.start(f.context(0)));
    QVERIFY(!p.isActive());
    QVERIFY(f.board.commands.isEmpty());
}

void tst_Co2Protocol::startTwiceIsRejected()
{
    ProtocolFixture f;
    primeGas(f);
    Co2RegenerationProtocol p;
    QVERIFY(p.start(f.context(2)));
    QVERIFY(!p.start(f.context(3)));
    QVERIFY(p.step() == Co2RegenerationProtocol::Step::CheckingInitialStability);
}

void tst_Co2Protocol::completesWithCarbonMass()
{
    ProtocolFixture f;
    primeGas(f);
    primeConductance(f);

    Co2RegenerationProtocol p;
    QVERIFY(p.start(f.context(2)));
    QCOMPARE(p.status().step, 1);
    QVERIFY(f.timeline.has(Milestone::ReferenceActualized));
    QCOMPARE(f.board.r0Writes.size(), 1);

    QVector<double> progress;
    int end = 0;
    Outcome outcome = run(p, f, riseWithoutPeak, 3, 600, end, &progress);

    QVERIFY(outcome == Outcome::Finished);
    QVERIFY(end > 243);
    QVERIFY(!p.isActive());

    const ProtocolResults& r = p.results();
    QCOMPARE(r.deltaConcentration, 15.0);
    QVERIFY(qAbs(r.estimatedMass - 7.0898) < 1e-3);
    QCOMPARE(r.percolationTime, 9.0);

    QCOMPARE(p.status().step, 4);
    QCOMPARE(p.status().progress, 100.0);
    QVERIFY(p.status().hasResults);

    for (int i = 1; i < progress.size(); ++i) {
        QVERIFY(progress[i] >= progress[i - 1]);
    }

    QCOMPARE(f.board.commands, QVector<double>({700, 0}));
    QCOMPARE(f.timeline.time(Milestone::StabilityAchieved), 123.0);
    QCOMPARE(f.timeline.time(Milestone::HeatingStarted), 123.0);
    QCOMPARE(f.timeline.time(Milestone::HeatingStopped), 243.0);
    QVERIFY(f.timeline.has(Milestone::GasIncreaseDetected));
    QVERIFY(f.timeline.has(Milestone::Restabilized));
    QVERIFY(!f.timeline.has(Milestone::PeakReached));
}

void tst_Co2Protocol::earlyRestabilizationCompletesWhenHeatingEnds()
{
    ProtocolFixture f;
    primeGas(f);

    EngineParameters params;
    params.regenerationDuration = 200;
    Co2RegenerationProtocol p(params);
    QVERIFY(p.start(f.context(2)));

    int end = 0;
    Outcome outcome = run(p, f, riseWithPeak, 3, 600, end);

    QVERIFY(outcome == Outcome::Finished);
    QCOMPARE(end, 323);
    QCOMPARE(f.timeline.time(Milestone::PeakReached), 140.0);
    QVERIFY(f.timeline.time(Milestone::Restabilized) < 323.0);
    QCOMPARE(p.results().deltaConcentration, 37.0);
    QVERIFY(!p.results().hasPercolationTime());
}

void tst_Co2Protocol::cancelDuringHeatingSendsOneLowCommand()
{
    ProtocolFixture f;
    primeGas(f);
    Co2RegenerationProtocol p;
    QVERIFY(p.start(f.context(2)));

    int end = 0;
    run(p, f, riseWithoutPeak, 3, 150, end);
    QVERIFY(p.step() == Co2RegenerationProtocol::Step::Heating);
    QCOMPARE(f.board.commands, QVector<double>({700}));

    QVERIFY(p.cancel(f.context(151)));
    QCOMPARE(f.board.commands, QVector<double>({700, 0}));
    QVERIFY(p.step() == Co2RegenerationProtocol::Step::Idle);
    QVERIFY(!p.isActive());

    QVERIFY(p.tick(f.context(152)) == Outcome::Idle);
    QCOMPARE(f.board.commands.size(), 2);
}

void tst_Co2Protocol::heaterFailureAborts()
{
    ProtocolFixture f;
    primeGas(f);
    f.board.failParameterWrites = true;
    f.board.failDirectWrites = true;

    Co2RegenerationProtocol p;
    QVERIFY(p.start(f.context(2)));

    int end = 0;
    Outcome outcome = run(p, f, riseWithoutPeak, 3, 200, end);

    QVERIFY(outcome == Outcome::Failed);
    QCOMPARE(end, 123);
    QVERIFY(!p.errorString().isEmpty());
    QVERIFY(!p.isActive());
    QCOMPARE(f.board.allCommands().last(), 0.0);
}

QTEST_GUILESS_MAIN(tst_Co2Protocol)
#include "tst_co2protocol.moc"
