#pragma once

#include <QElapsedTimer>

// Time source for the engine, in seconds. Everything that measures elapsed
// time (time base, safety windows, stability trackers) reads it through here
// so tests can drive time by hand.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now() const = 0;
};

// Monotonic wall clock, zero at construction
class SystemClock : public Clock {
public:
    SystemClock();
    double now() const override;

private:
    QElapsedTimer m_timer;
};
