#pragma once

#include "core/clock.h"

// Clock driven by the test
class ManualClock : public Clock {
public:
    double now() const override { return m_now; }
    void set(double t) { m_now = t; }
    void advance(double dt) { m_now += dt; }

private:
    double m_now = 0;
};
