#include <QtTest>

#include "machine/timebase.h"
#include "manualclock.h"

using Regen::Channel;

class tst_TimeBase : public QObject {
    Q_OBJECT

private slots:
    void notStartedIsUnset();
    void timestampFollowsClock();
    void secondStartKeepsOrigin();
    void pauseFreezesTimestamp();
    void resumeExcludesPausedTime();
    void repeatedPauseAndResumeAreIdempotent();
    void resetAffectsOneChannel();
    void multipleStopStartCyclesStayMonotonic();
};

void tst_TimeBase::notStartedIsUnset()
{
    ManualClock clock;
    TimeBase tb(&clock);
    QCOMPARE(tb.timestamp(Channel::Gas), -1.0);
    QVERIFY(!tb.isStarted(Channel::Gas));
    QVERIFY(!tb.isRunning(Channel::Gas));
}

void tst_TimeBase::timestampFollowsClock()
{
    ManualClock clock;
    clock.set(100);
    TimeBase tb(&clock);
    tb.start(Channel::Conductance);
    clock.advance(12.5);
    QCOMPARE(tb.timestamp(Channel::Conductance), 12.5);
    QVERIFY(tb.isRunning(Channel::Conductance));
}

void tst_TimeBase::secondStartKeepsOrigin()
{
    ManualClock clock;
    TimeBase tb(&clock);
    tb.start(Channel::Heater);
    clock.advance(10);
    tb.start(Channel::Heater);
    clock.advance(5);
    QCOMPARE(tb.timestamp(Channel::Heater), 15.0);
}

void tst_TimeBase::pauseFreezesTimestamp()
{
    ManualClock clock;
    TimeBase tb(&clock);
    tb.start(Channel::Gas);
    clock.advance(20);
    tb.pause(Channel::Gas);
    clock.advance(30);
    QCOMPARE(tb.timestamp(Channel::Gas), 20.0);
    QVERIFY(tb.isPaused(Channel::Gas));
}

void tst_TimeBase::resumeExcludesPausedTime()
{
    ManualClock clock;
    TimeBase tb(&clock);
    tb.start(Channel::Gas);
    clock.advance(20);
    tb.pause(Channel::Gas);
    clock.advance(30);
    tb.resume(Channel::Gas);
    clock.advance(5);
    QCOMPARE(tb.timestamp(Channel::Gas), 25.0);
    QCOMPARE(tb.accumulatedPause(Channel::Gas), 30.0);
}

void tst_TimeBase::repeatedPauseAndResumeAreIdempotent()
{
    ManualClock clock;
    TimeBase tb(&clock);
    tb.start(Channel::Conductance);
    clock.advance(10);

    // Resume without pause is a no-op
    tb.resume(Channel::Conductance);
    QCOMPARE(tb.accumulatedPause(Channel::Conductance), 0.0);

    tb.pause(Channel::Conductance);
    clock.advance(4);
    tb.pause(Channel::Conductance);
    clock.advance(6);
    tb.resume(Channel::Conductance);
    tb.resume(Channel::Conductance);

    QCOMPARE(tb.accumulatedPause(Channel::Conductance), 10.0);
    QCOMPARE(tb.timestamp(Channel::Conductance), 10.0);
}

void tst_TimeBase::resetAffectsOneChannel()
{
    ManualClock clock;
    TimeBase tb(&clock);
    tb.start(Channel::Conductance);
    tb.start(Channel::Gas);
    clock.advance(8);

    tb.reset(Channel::Gas);
    QCOMPARE(tb.timestamp(Channel::Gas), -1.0);
    QCOMPARE(tb.timestamp(Channel::Conductance), 8.0);

    tb.start(Channel::Gas);
    clock.advance(2);
    QCOMPARE(tb.timestamp(Channel::Gas), 2.0);
    QCOMPARE(tb.timestamp(Channel::Conductance), 10.0);
}

void tst_TimeBase::multipleStopStartCyclesStayMonotonic()
{
    ManualClock clock;
    TimeBase tb(&clock);
    tb.start(Channel::Heater);

    double previous = tb.timestamp(Channel::Heater);
    for (int i = 0; i < 5; ++i) {
        clock.advance(3);
        QVERIFY(tb.timestamp(Channel::Heater) >= previous);
        previous = tb.timestamp(Channel::Heater);
        tb.pause(Channel::Heater);
        clock.advance(7);
        QCOMPARE(tb.timestamp(Channel::Heater), previous);
        tb.resume(Channel::Heater);
    }
    QCOMPARE(tb.timestamp(Channel::Heater), 15.0);
}

QTEST_GUILESS_MAIN(tst_TimeBase)
#include "tst_timebase.moc"
