#include <QtTest>

#include "machine/heatercontrol.h"
#include "fakedevices.h"

class tst_HeaterControl : public QObject {
    Q_OBJECT

private slots:
    void repeatedSetpointIsSentOnce();
    void changedSetpointIsSent();
    void forceBypassesCache();
    void failedWriteFallsBackToDirect();
    void failedWriteIsNotCached();
    void staleReadbackIsReplaced();
    void closeReadbackIsKept();
    void actualizeRewritesReferenceResistance();
    void missingActuatorFails();
};

void tst_HeaterControl::repeatedSetpointIsSentOnce()
{
    FakeThermalActuator board;
    HeaterControl heater(&board);

    QVERIFY(heater.setSetpoint(700));
    QVERIFY(heater.setSetpoint(700));
    QVERIFY(heater.setSetpoint(700));

    QCOMPARE(board.commands.size(), 1);
    QCOMPARE(heater.writeCount(), 1);
}

void tst_HeaterControl::changedSetpointIsSent()
{
    FakeThermalActuator board;
    HeaterControl heater(&board);

    heater.setSetpoint(700);
    heater.setSetpoint(0);
    QCOMPARE(board.commands, QVector<double>({700, 0}));
    QCOMPARE(heater.lastCommanded(), 0.0);
}

void tst_HeaterControl::forceBypassesCache()
{
    FakeThermalActuator board;
    HeaterControl heater(&board);

    heater.setSetpoint(0);
    QVERIFY(heater.forceSetpoint(0));
    QCOMPARE(board.commands.size(), 2);
}

void tst_HeaterControl::failedWriteFallsBackToDirect()
{
    FakeThermalActuator board;
    board.failParameterWrites = true;
    HeaterControl heater(&board);

    QVERIFY(heater.setSetpoint(700));
    QCOMPARE(board.commands.size(), 1);
    QCOMPARE(board.directCommands, QVector<double>({700}));
    QCOMPARE(board.setpoint, 700.0);
}

void tst_HeaterControl::failedWriteIsNotCached()
{
    FakeThermalActuator board;
    board.failParameterWrites = true;
    board.failDirectWrites = true;
    HeaterControl heater(&board);

    QVERIFY(!heater.setSetpoint(700));
    QVERIFY(heater.hasCommanded());

    board.failParameterWrites = false;
    QVERIFY(heater.setSetpoint(700));
    QCOMPARE(board.commands.size(), 2);
    QCOMPARE(board.setpoint, 700.0);
}

void tst_HeaterControl::staleReadbackIsReplaced()
{
    FakeThermalActuator board;
    HeaterControl heater(&board);
    heater.setSetpoint(700);
    board.reportedSetpoint = 0;
    board.temperature = 350;

    double setpoint = -1;
    double measured = -1;
    QVERIFY(heater.readTemperature(setpoint, measured));
    QCOMPARE(setpoint, 700.0);
    QCOMPARE(measured, 350.0);
}

void tst_HeaterControl::closeReadbackIsKept()
{
    FakeThermalActuator board;
    HeaterControl heater(&board);
    heater.setSetpoint(700);
    board.reportedSetpoint = 690;

    double setpoint = -1;
    double measured = -1;
    QVERIFY(heater.readTemperature(setpoint, measured));
    QCOMPARE(setpoint, 690.0);
}

void tst_HeaterControl::actualizeRewritesReferenceResistance()
{
    FakeThermalActuator board;
    board.r0 = 8.5;
    HeaterControl heater(&board);

    double r0 = 0;
    QVERIFY(heater.actualizeReferenceResistance(&r0));
    QCOMPARE(r0, 8.5);
    QCOMPARE(board.r0Writes, QVector<double>({8.5}));
}

void tst_HeaterControl::missingActuatorFails()
{
    HeaterControl heater(nullptr);
    QVERIFY(!heater.isAvailable());
    QVERIFY(!heater.setSetpoint(0));
    double a = 0;
    double b = 0;
    QVERIFY(!heater.readTemperature(a, b));
}

QTEST_GUILESS_MAIN(tst_HeaterControl)
#include "tst_heatercontrol.moc"
