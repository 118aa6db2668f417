#include <QtTest>

#include "detection/conductancedetector.h"
#include "detection/slope.h"

class tst_ConductanceDetector : public QObject {
    Q_OBJECT

private slots:
    void slopeOfLine();
    void slopeNeedsTwoDistinctTimes();
    void noIncreaseWithFewSamples();
    void increaseDetectedOnRamp();
    void steepRampIsIgnored();
    void stabilizationAfterPlateau();
    void redetectionKeepsPercolationTime();
    void dropClosesEpisode();
    void restabilizationAfterDrop();
    void newEpisodeMovesPercolationForward();
    void resetForgetsEverything();

private:
    // y = 5 + 0.3 t for t in [0, 10], then flat at 8 up to `until`
    void feedRampAndPlateau(ConductanceDetector& d, QVector<QPointF>& s, int until);
    void feed(ConductanceDetector& d, QVector<QPointF>& s, double t, double y);
};

void tst_ConductanceDetector::feed(ConductanceDetector& d, QVector<QPointF>& s, double t, double y)
{
    s.append(QPointF(t, y));
    d.update(s);
}

void tst_ConductanceDetector::feedRampAndPlateau(ConductanceDetector& d, QVector<QPointF>& s, int until)
{
    for (int t = 0; t <= until; ++t) {
        double y = t <= 10 ? 5.0 + 0.3 * t : 8.0;
        feed(d, s, t, y);
    }
}

void tst_ConductanceDetector::slopeOfLine()
{
    QVector<QPointF> s;
    for (int i = 0; i < 20; ++i) {
        s.append(QPointF(1000.0 + i * 0.5, 2.0 * i));
    }
    double slope = 0;
    QVERIFY(Slope::lastSamples(s, 10, slope));
    QVERIFY(qAbs(slope - 4.0) < 1e-9);
    QVERIFY(Slope::timeWindow(s, 1001.0, 1003.0, slope));
    QVERIFY(qAbs(slope - 4.0) < 1e-9);
}

void tst_ConductanceDetector::slopeNeedsTwoDistinctTimes()
{
    QVector<QPointF> s;
    s.append(QPointF(5, 1));
    double slope = 0;
    QVERIFY(!Slope::lastSamples(s, 2, slope));
    s.append(QPointF(5, 2));
    QVERIFY(!Slope::lastSamples(s, 2, slope));
}

void tst_ConductanceDetector::noIncreaseWithFewSamples()
{
    ConductanceDetector d;
    QVector<QPointF> s;
    for (int t = 0; t < 9; ++t) {
        feed(d, s, t, 5.0 + 0.3 * t);
    }
    QVERIFY(!d.state().increaseDetected);
    QVERIFY(!d.state().hasIncreaseTime());
}

void tst_ConductanceDetector::increaseDetectedOnRamp()
{
    ConductanceDetector d;
    QVector<QPointF> s;
    feedRampAndPlateau(d, s, 9);

    QVERIFY(d.state().increaseDetected);
    QCOMPARE(d.state().increaseTime, 9.0);
    QVERIFY(qAbs(d.state().maxSlope - 0.3) < 1e-6);
    QVERIFY(!d.state().stabilized);
}

void tst_ConductanceDetector::steepRampIsIgnored()
{
    ConductanceDetector d;
    QVector<QPointF> s;
    for (int t = 0; t < 30; ++t) {
        feed(d, s, t, 5.0 + 1.0 * t);
    }
    QVERIFY(!d.state().increaseDetected);
}

void tst_ConductanceDetector::stabilizationAfterPlateau()
{
    ConductanceDetector d;
    QVector<QPointF> s;
    feedRampAndPlateau(d, s, 200);

    const DetectionState& st = d.state();
    QVERIFY(st.stabilized);
    QVERIFY(st.increaseDetected);
    QVERIFY(st.stabilizationTime - st.maxSlopeTime >= 120.0);
    QVERIFY(st.stabilizationTime <= 131.0);
    QCOMPARE(st.increaseTime, 9.0);
}

void tst_ConductanceDetector::redetectionKeepsPercolationTime()
{
    ConductanceDetector d;
    QVector<QPointF> s;
    feedRampAndPlateau(d, s, 200);
    QVERIFY(d.state().stabilized);

    d.clearEpisode();
    QVERIFY(!d.state().increaseDetected);

    for (int t = 201; t <= 220; ++t) {
        feed(d, s, t, 8.0 + 0.3 * (t - 200));
    }
    QVERIFY(d.state().increaseDetected);
    QCOMPARE(d.state().increaseTime, 9.0);
}

void tst_ConductanceDetector::dropClosesEpisode()
{
    ConductanceDetector d;
    QVector<QPointF> s;
    feedRampAndPlateau(d, s, 200);

    feed(d, s, 201, 3.0);

    QVERIFY(d.postTreatment().decreaseDetected);
    QCOMPARE(d.postTreatment().decreaseTime, 201.0);
    QVERIFY(!d.state().increaseDetected);
    QVERIFY(!d.state().stabilized);
    QCOMPARE(d.state().increaseTime, 9.0);
}

void tst_ConductanceDetector::restabilizationAfterDrop()
{
    ConductanceDetector d;
    QVector<QPointF> s;
    feedRampAndPlateau(d, s, 200);

    for (int t = 201; t <= 310; ++t) {
        feed(d, s, t, 3.0);
    }
    QVERIFY(!d.postTreatment().restabilized);

    for (int t = 311; t <= 340; ++t) {
        feed(d, s, t, 3.0);
    }
    QVERIFY(d.postTreatment().restabilized);
    QCOMPARE(d.postTreatment().restabilizationTime, 322.0);
}

void tst_ConductanceDetector::newEpisodeMovesPercolationForward()
{
    ConductanceDetector d;
    QVector<QPointF> s;
    feedRampAndPlateau(d, s, 200);
    for (int t = 201; t <= 400; ++t) {
        feed(d, s, t, 3.0);
    }

    for (int t = 401; t <= 420; ++t) {
        feed(d, s, t, 3.0 + 0.3 * (t - 400));
    }

    QVERIFY(d.state().increaseDetected);
    QVERIFY(d.state().increaseTime > 400.0);
    QVERIFY(!d.postTreatment().decreaseDetected);
}

void tst_ConductanceDetector::resetForgetsEverything()
{
    ConductanceDetector d;
    QVector<QPointF> s;
    feedRampAndPlateau(d, s, 200);
    feed(d, s, 201, 3.0);

    d.reset();
    QVERIFY(!d.state().hasIncreaseTime());
    QVERIFY(!d.postTreatment().decreaseDetected);
    QCOMPARE(d.state().maxSlope, 0.0);
}

QTEST_GUILESS_MAIN(tst_ConductanceDetector)
#include "tst_conductancedetector.moc"
